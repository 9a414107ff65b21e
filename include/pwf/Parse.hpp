#pragma once

#include <string>
#include <variant>

#include "nlohmann/json.hpp"
#include "pwf/Models.hpp"
#include "pwf/Validator.hpp"

namespace pwf {

// Either a schema-valid document or the reasons it is not.
using ParseResult = std::variant<Document, IssueList>;

inline bool is_issue_list(const ParseResult& r) { return std::holds_alternative<IssueList>(r); }
inline bool is_document(const ParseResult& r) { return std::holds_alternative<Document>(r); }

// Raw violation -> {path, message, severity = error, code = keyword}.
ValidationIssue classify(const RawViolation& violation);

IssueList validate_document(const nlohmann::json& value, DocumentKind kind, const ValidationOptions& opts = {});
IssueList validate_plan(const nlohmann::json& value, const ValidationOptions& opts = {});
IssueList validate_history(const nlohmann::json& value, const ValidationOptions& opts = {});

// decode + validate. Malformed text yields a single root issue.
ParseResult parse_document(const std::string& text, DocumentKind kind, const ValidationOptions& opts = {});
ParseResult parse_plan(const std::string& text, const ValidationOptions& opts = {});
ParseResult parse_history(const std::string& text, const ValidationOptions& opts = {});

// True when no issue fails under `opts` (errors always fail, warnings only when strict).
bool passes(const IssueList& issues, const ValidationOptions& opts = {});

// JSON form consumed by UIs: [{path, message, severity, code?}, ...]
nlohmann::json issue_to_json(const ValidationIssue& issue);
nlohmann::json issues_to_json(const IssueList& issues);

// Structural check on the JSON form: an array whose every element is an
// object carrying path, message and severity.
bool is_issue_list(const nlohmann::json& value);

}  // namespace pwf
