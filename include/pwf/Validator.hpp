#pragma once

#include <cstddef>
#include <string>
#include <variant>
#include <vector>

#include "nlohmann/json.hpp"
#include "pwf/Models.hpp"

namespace pwf {

// Object key or array index.
using PathSegment = std::variant<std::string, std::size_t>;

struct RawViolation {
    std::vector<PathSegment> location;  // root -> offending element
    std::string keyword;                // required, type, enum, additionalProperties, ...
    nlohmann::json params;              // e.g. {"missingProperty": "cycle"}
    std::string message;
};

// Validates `document` against the registered schema for `kind`.
// Collects every violation; an empty result means the document is valid.
std::vector<RawViolation> validate_raw(const nlohmann::json& document, DocumentKind kind);

// Same, against an arbitrary schema. Local "$ref"s resolve against `schema`.
std::vector<RawViolation> validate_against(const nlohmann::json& document, const nlohmann::json& schema);

// Format checks used by the "format" keyword.
bool is_valid_date(const std::string& s);       // YYYY-MM-DD
bool is_valid_date_time(const std::string& s);  // RFC 3339

}  // namespace pwf
