#pragma once

#include <cstdint>
#include <string>
#include <utility>
#include <vector>

#include "pwf/Models.hpp"
#include "pwf/Parse.hpp"

namespace convert {

struct ConversionResult {
    std::string text;                   // converted document text
    std::vector<std::string> warnings;  // lossy-conversion notes
    std::string error;                  // set on failure, text is then empty

    bool ok() const { return error.empty(); }
};

// One implementation per external format (FIT, TCX, GPX, CSV). The
// conversion engines live outside this library.
class FormatConverter {
public:
    virtual ~FormatConverter() = default;

    virtual std::string format_name() const = 0;

    // external bytes -> PWF history YAML
    virtual ConversionResult to_pwf(const std::vector<std::uint8_t>& bytes, bool summary_only) = 0;

    // PWF history YAML -> external format text
    virtual ConversionResult from_pwf(const std::string& history_yaml) = 0;
};

class NullFormatConverter final : public FormatConverter {
public:
    explicit NullFormatConverter(std::string name = "none") : name_(std::move(name)) {}

    std::string format_name() const override { return name_; }
    ConversionResult to_pwf(const std::vector<std::uint8_t>&, bool) override;
    ConversionResult from_pwf(const std::string&) override;

private:
    std::string name_;
};

struct ImportResult {
    pwf::ParseResult result;
    std::vector<std::string> warnings;
};

// Runs the converter, then parses and validates its output as a history
// export. A converter failure becomes a single root issue.
ImportResult import_history(FormatConverter& converter,
                            const std::vector<std::uint8_t>& bytes,
                            bool summary_only,
                            const pwf::ValidationOptions& opts = {});

// Encodes a history document and hands it to the converter.
// Throws std::invalid_argument for a plan document.
ConversionResult export_history(FormatConverter& converter, const pwf::Document& history);

}  // namespace convert
