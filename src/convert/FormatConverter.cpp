#include "convert/FormatConverter.hpp"

#include "pwf/Serializer.hpp"

#include <stdexcept>
#include <utility>

namespace convert {

ConversionResult NullFormatConverter::to_pwf(const std::vector<std::uint8_t>&, bool) {
    ConversionResult r;
    r.error = "conversion from " + name_ + " is not available";
    return r;
}

ConversionResult NullFormatConverter::from_pwf(const std::string&) {
    ConversionResult r;
    r.error = "conversion to " + name_ + " is not available";
    return r;
}

ImportResult import_history(FormatConverter& converter,
                            const std::vector<std::uint8_t>& bytes,
                            bool summary_only,
                            const pwf::ValidationOptions& opts) {
    ImportResult out;

    ConversionResult conv = converter.to_pwf(bytes, summary_only);
    out.warnings = std::move(conv.warnings);

    if (!conv.ok()) {
        pwf::ValidationIssue issue;
        issue.path = "";
        issue.message = converter.format_name() + ": " + conv.error;
        issue.severity = pwf::Severity::Error;
        issue.code = "conversion";
        out.result = pwf::IssueList{issue};
        return out;
    }

    out.result = pwf::parse_history(conv.text, opts);
    return out;
}

ConversionResult export_history(FormatConverter& converter, const pwf::Document& history) {
    if (history.kind != pwf::DocumentKind::History) {
        throw std::invalid_argument("export_history expects a history document, got " +
                                    std::string(pwf::document_kind_str(history.kind)));
    }
    return converter.from_pwf(pwf::encode(history));
}

}  // namespace convert
