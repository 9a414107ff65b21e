#include "pwf/Parse.hpp"

#include "pwf/PathResolver.hpp"
#include "pwf/Serializer.hpp"

namespace pwf {

ValidationIssue classify(const RawViolation& violation) {
    ValidationIssue issue;
    issue.path = resolve_path(violation);
    issue.message = violation.message;
    issue.severity = Severity::Error;
    issue.code = violation.keyword;
    return issue;
}

IssueList validate_document(const nlohmann::json& value, DocumentKind kind, const ValidationOptions& opts) {
    (void)opts;  // no option changes which violations are reported

    IssueList issues;
    for (const auto& v : validate_raw(value, kind)) {
        issues.push_back(classify(v));
    }
    return issues;
}

IssueList validate_plan(const nlohmann::json& value, const ValidationOptions& opts) {
    return validate_document(value, DocumentKind::Plan, opts);
}

IssueList validate_history(const nlohmann::json& value, const ValidationOptions& opts) {
    return validate_document(value, DocumentKind::History, opts);
}

ParseResult parse_document(const std::string& text, DocumentKind kind, const ValidationOptions& opts) {
    DecodeResult decoded = decode(text);
    if (!decoded.ok()) {
        ValidationIssue issue;
        issue.path = "";
        issue.message = decoded.error;
        issue.severity = Severity::Error;
        issue.code = "yaml";
        return IssueList{issue};
    }

    IssueList issues = validate_document(decoded.value, kind, opts);
    if (!issues.empty()) return issues;

    Document doc;
    doc.kind = kind;
    doc.value = std::move(decoded.value);
    return doc;
}

ParseResult parse_plan(const std::string& text, const ValidationOptions& opts) {
    return parse_document(text, DocumentKind::Plan, opts);
}

ParseResult parse_history(const std::string& text, const ValidationOptions& opts) {
    return parse_document(text, DocumentKind::History, opts);
}

bool passes(const IssueList& issues, const ValidationOptions& opts) {
    for (const auto& i : issues) {
        if (i.severity == Severity::Error) return false;
        if (opts.strict) return false;
    }
    return true;
}

nlohmann::json issue_to_json(const ValidationIssue& issue) {
    nlohmann::json j;
    j["path"] = issue.path;
    j["message"] = issue.message;
    j["severity"] = severity_str(issue.severity);
    if (!issue.code.empty()) j["code"] = issue.code;
    return j;
}

nlohmann::json issues_to_json(const IssueList& issues) {
    nlohmann::json arr = nlohmann::json::array();
    for (const auto& i : issues) {
        arr.push_back(issue_to_json(i));
    }
    return arr;
}

bool is_issue_list(const nlohmann::json& value) {
    if (!value.is_array()) return false;
    for (const auto& item : value) {
        if (!item.is_object()) return false;
        if (!item.contains("path") || !item.contains("message") || !item.contains("severity")) return false;
    }
    return true;
}

}  // namespace pwf
