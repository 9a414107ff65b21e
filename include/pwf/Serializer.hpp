#pragma once

#include <string>

#include "nlohmann/json.hpp"
#include "pwf/Models.hpp"

namespace pwf {

struct DecodeResult {
    nlohmann::json value;
    std::string error;  // empty on success

    bool ok() const { return error.empty(); }
};

// Block-style YAML. Strings that would read back as another type are quoted.
std::string encode(const nlohmann::json& value);
std::string encode(const Document& doc);

// Never throws on malformed input; the parser message lands in `error`.
DecodeResult decode(const std::string& text);

// Resolves a plain (unquoted) scalar with the YAML 1.2 core schema:
// null, bool, int, float, otherwise string.
nlohmann::json resolve_plain_scalar(const std::string& s);

}  // namespace pwf
