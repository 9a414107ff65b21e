#include "pwf/PathResolver.hpp"

namespace pwf {

static bool is_ident_start(char c) {
    return (c >= 'A' && c <= 'Z') || (c >= 'a' && c <= 'z') || c == '_' || c == '$';
}

static bool is_ident_char(char c) {
    return is_ident_start(c) || (c >= '0' && c <= '9');
}

bool is_identifier(const std::string& s) {
    if (s.empty() || !is_ident_start(s[0])) return false;
    for (char c : s) {
        if (!is_ident_char(c)) return false;
    }
    return true;
}

static std::string escape_key(const std::string& key) {
    std::string out;
    out.reserve(key.size() + 2);
    for (char c : key) {
        if (c == '\\' || c == '\'') out.push_back('\\');
        out.push_back(c);
    }
    return out;
}

std::string append_segment(const std::string& path, const PathSegment& segment) {
    if (const auto* index = std::get_if<std::size_t>(&segment)) {
        return path + "[" + std::to_string(*index) + "]";
    }

    const std::string& key = std::get<std::string>(segment);
    if (is_identifier(key)) {
        return path.empty() ? key : path + "." + key;
    }
    return path + "['" + escape_key(key) + "']";
}

std::string format_path(const std::vector<PathSegment>& location) {
    std::string path;
    for (const auto& seg : location) {
        path = append_segment(path, seg);
    }
    return path;
}

std::string resolve_path(const RawViolation& violation) {
    std::string path = format_path(violation.location);

    const char* extra_key = nullptr;
    if (violation.keyword == "required") extra_key = "missingProperty";
    if (violation.keyword == "additionalProperties") extra_key = "additionalProperty";

    if (extra_key && violation.params.is_object() && violation.params.contains(extra_key) &&
        violation.params[extra_key].is_string()) {
        path = append_segment(path, PathSegment(violation.params[extra_key].get<std::string>()));
    }

    return path;
}

}  // namespace pwf
