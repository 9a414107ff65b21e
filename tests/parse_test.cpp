#include "pwf/Parse.hpp"

#include <iostream>
#include <string>
#include <variant>

static int g_failures = 0;

static void check(bool cond, const std::string& name) {
    if (!cond) {
        std::cerr << "FAIL: " << name << "\n";
        ++g_failures;
    }
}

static const char* const kValidPlan =
    "plan_version: 1\n"
    "meta:\n"
    "  title: Beginner Strength\n"
    "  daysPerWeek: 3\n"
    "cycle:\n"
    "  start_date: 2025-01-06\n"
    "  days:\n"
    "    - focus: Lower\n"
    "      exercises:\n"
    "        - name: Squat\n"
    "          modality: strength\n"
    "          target_sets: 3\n"
    "          target_reps: 5\n"
    "        - name: Plank\n"
    "          modality: countdown\n"
    "          target_duration_sec: 60\n";

static const char* const kValidHistory =
    "history_version: 1\n"
    "exported_at: 2025-01-15T10:30:00Z\n"
    "workouts:\n"
    "  - date: 2025-01-15\n"
    "    exercises:\n"
    "      - name: Bench Press\n"
    "        sets:\n"
    "          - reps: 5\n"
    "            weight_kg: 100\n";

static void test_parse_plan() {
    const pwf::ParseResult ok = pwf::parse_plan(kValidPlan);
    check(pwf::is_document(ok), "valid plan parses");
    if (pwf::is_document(ok)) {
        const pwf::Document& doc = std::get<pwf::Document>(ok);
        check(doc.kind == pwf::DocumentKind::Plan, "plan kind");
        check(doc.value["cycle"]["days"][0]["exercises"].size() == 2, "two exercises");
        check(doc.value["cycle"]["start_date"] == "2025-01-06", "date stays a string");
    }

    const pwf::ParseResult bad_yaml = pwf::parse_plan("plan_version: [1");
    check(pwf::is_issue_list(bad_yaml), "malformed yaml is an issue list");
    if (pwf::is_issue_list(bad_yaml)) {
        const pwf::IssueList& issues = std::get<pwf::IssueList>(bad_yaml);
        check(issues.size() == 1, "one decode issue");
        check(!issues.empty() && issues[0].path.empty(), "decode issue at the root");
        check(!issues.empty() && !issues[0].message.empty(), "decode issue has a message");
        check(!issues.empty() && issues[0].severity == pwf::Severity::Error, "decode issue is an error");
    }

    const pwf::ParseResult partial = pwf::parse_plan("plan_version: 1\n");
    check(pwf::is_issue_list(partial), "plan without cycle fails");
    if (pwf::is_issue_list(partial)) {
        const pwf::IssueList& issues = std::get<pwf::IssueList>(partial);
        check(issues.size() == 1 && issues[0].path == "cycle", "missing cycle reported");
        check(!issues.empty() && issues[0].code == "required", "code is the keyword");
    }

    const pwf::ParseResult scalar = pwf::parse_plan("just text\n");
    check(pwf::is_issue_list(scalar), "scalar document fails");

    const pwf::ParseResult quoted = pwf::parse_plan("plan_version: \"1\"\ncycle:\n  days: []\n");
    check(pwf::is_issue_list(quoted), "quoted version is not an integer");
}

static void check_single_yaml_issue(const pwf::ParseResult& r, const std::string& name) {
    check(pwf::is_issue_list(r), name + ": issue list");
    if (!pwf::is_issue_list(r)) return;
    const pwf::IssueList& issues = std::get<pwf::IssueList>(r);
    check(issues.size() == 1, name + ": one issue");
    check(!issues.empty() && issues[0].path.empty() && issues[0].code == "yaml", name + ": root yaml issue");
}

static void test_rejected_text() {
    check_single_yaml_issue(pwf::parse_plan(std::string("plan_version: 2\n") + kValidPlan), "duplicate version");
    check_single_yaml_issue(pwf::parse_plan(std::string(kValidPlan) + "---\ngarbage: [\n"), "broken trailing doc");
    check_single_yaml_issue(pwf::parse_plan(std::string(kValidPlan) + "---\n" + kValidPlan), "two plans");
    check_single_yaml_issue(pwf::parse_history(std::string(kValidHistory) + "history_version: 1\n"),
                            "duplicate history key");
}

static void test_long_values() {
    std::string plan = kValidPlan;
    plan += "          group: " + std::string(100000, 'g') + "\n";
    check(pwf::is_document(pwf::parse_plan(plan)), "long group accepted");

    std::string bad = kValidPlan;
    bad += "          group: " + std::string(100000, 'g') + "!\n";
    const pwf::ParseResult r = pwf::parse_plan(bad);
    check(pwf::is_issue_list(r), "long group with a bad character rejected");
    if (pwf::is_issue_list(r)) {
        const pwf::IssueList& issues = std::get<pwf::IssueList>(r);
        check(issues.size() == 1 && issues[0].path == "cycle.days[0].exercises[1].group" &&
                  issues[0].code == "pattern",
              "pattern issue on group");
    }

    std::string load = kValidPlan;
    load += "          target_load: " + std::string(100000, '7') + "\n";
    check(pwf::is_document(pwf::parse_plan(load)), "long numeric load stays a string");
}

static void test_parse_history() {
    const pwf::ParseResult ok = pwf::parse_history(kValidHistory);
    check(pwf::is_document(ok), "valid history parses");
    if (pwf::is_document(ok)) {
        check(std::get<pwf::Document>(ok).kind == pwf::DocumentKind::History, "history kind");
    }

    check(pwf::is_issue_list(pwf::parse_history(kValidPlan)), "plan is not a history");
    check(pwf::is_issue_list(pwf::parse_plan(kValidHistory)), "history is not a plan");
    check(pwf::is_document(pwf::parse_document(kValidHistory, pwf::DocumentKind::History)), "parse_document");
}

static void test_issue_json() {
    pwf::ValidationIssue issue;
    issue.path = "cycle.days[0]";
    issue.message = "must have required property 'exercises'";
    issue.code = "required";

    const nlohmann::json j = pwf::issue_to_json(issue);
    check(j["path"] == "cycle.days[0]", "path field");
    check(j["severity"] == "error", "severity field");
    check(j["code"] == "required", "code field");

    check(pwf::is_issue_list(pwf::issues_to_json({issue})), "issue json is an issue list");
    check(pwf::is_issue_list(pwf::issues_to_json(pwf::validate_plan(nlohmann::json::object()))),
          "validation of an empty object is an issue list");
    check(pwf::is_issue_list(nlohmann::json::array()), "empty array is an issue list");
    check(!pwf::is_issue_list(nlohmann::json::object()), "object is not an issue list");
    check(!pwf::is_issue_list(nlohmann::json{{"plan_version", 1}}), "document is not an issue list");

    const nlohmann::json missing_severity = nlohmann::json::array({{{"path", ""}, {"message", "x"}}});
    check(!pwf::is_issue_list(missing_severity), "element without severity");

    const nlohmann::json not_objects = nlohmann::json::array({1, 2});
    check(!pwf::is_issue_list(not_objects), "array of numbers");
}

static void test_passes() {
    pwf::ValidationIssue err;
    err.severity = pwf::Severity::Error;
    pwf::ValidationIssue warn;
    warn.severity = pwf::Severity::Warning;

    pwf::ValidationOptions strict;
    strict.strict = true;

    check(pwf::passes({}), "no issues pass");
    check(!pwf::passes({err}), "error fails");
    check(pwf::passes({warn}), "warning passes by default");
    check(!pwf::passes({warn}, strict), "warning fails when strict");

    check(pwf::is_document(pwf::parse_plan(kValidPlan, strict)), "strict parse of a clean plan");
}

int main() {
    test_parse_plan();
    test_parse_history();
    test_rejected_text();
    test_long_values();
    test_issue_json();
    test_passes();

    if (g_failures) {
        std::cerr << g_failures << " failure(s)\n";
        return 1;
    }
    std::cout << "parse_test: ok\n";
    return 0;
}
