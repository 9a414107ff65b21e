#include "pwf/Parse.hpp"
#include "pwf/Schema.hpp"
#include "pwf/Validator.hpp"

#include <iostream>
#include <stdexcept>
#include <string>

static int g_failures = 0;

static void check(bool cond, const std::string& name) {
    if (!cond) {
        std::cerr << "FAIL: " << name << "\n";
        ++g_failures;
    }
}

static nlohmann::json minimal_plan() {
    return {
        {"plan_version", 1},
        {"cycle", {{"days", nlohmann::json::array({
            {{"exercises", nlohmann::json::array({{{"name", "Squat"}, {"modality", "strength"}}})}},
        })}}},
    };
}

static nlohmann::json minimal_history() {
    return {
        {"history_version", 1},
        {"exported_at", "2025-01-15T10:30:00Z"},
        {"workouts", nlohmann::json::array({
            {
                {"date", "2025-01-15"},
                {"exercises", nlohmann::json::array({
                    {{"name", "Bench Press"}, {"sets", nlohmann::json::array({{{"reps", 5}, {"weight_kg", 100}}})}},
                })},
            },
        })},
    };
}

static bool has_issue(const pwf::IssueList& issues, const std::string& path, const std::string& code) {
    for (const auto& i : issues) {
        if (i.path == path && i.code == code) return true;
    }
    return false;
}

static void test_schema_registry() {
    check(pwf::plan_schema().is_object(), "plan schema loads");
    check(pwf::history_schema().is_object(), "history schema loads");
    check(&pwf::schema_for(pwf::DocumentKind::Plan) == &pwf::plan_schema(), "schema_for plan");
    check(&pwf::schema_for(pwf::DocumentKind::History) == &pwf::history_schema(), "schema_for history");
    check(pwf::plan_schema().contains("$defs"), "plan schema has definitions");
}

static void test_valid_documents() {
    check(pwf::validate_raw(minimal_plan(), pwf::DocumentKind::Plan).empty(), "minimal plan is valid");
    check(pwf::validate_raw(minimal_history(), pwf::DocumentKind::History).empty(), "minimal history is valid");

    nlohmann::json h = minimal_history();
    h["workouts"] = nlohmann::json::array();
    check(pwf::validate_history(h).empty(), "history with no workouts is valid");
}

static void test_empty_object() {
    const pwf::IssueList issues = pwf::validate_plan(nlohmann::json::object());
    check(issues.size() == 2, "empty plan has two issues");
    check(has_issue(issues, "plan_version", "required"), "missing plan_version");
    check(has_issue(issues, "cycle", "required"), "missing cycle");
    for (const auto& i : issues) {
        check(i.severity == pwf::Severity::Error, "required is an error");
        check(i.message == "must have required property '" + i.path + "'", "required message");
    }

    const pwf::IssueList h = pwf::validate_history(nlohmann::json::object());
    check(h.size() == 3, "empty history has three issues");
}

static void test_missing_exercises() {
    nlohmann::json p = minimal_plan();
    p["cycle"]["days"][0].erase("exercises");

    const pwf::IssueList issues = pwf::validate_plan(p);
    check(issues.size() == 1, "missing exercises reported once");
    check(has_issue(issues, "cycle.days[0].exercises", "required"), "missing exercises path");
}

static void test_additional_properties() {
    nlohmann::json p = minimal_plan();
    p["foo-bar"] = 1;
    const pwf::IssueList root = pwf::validate_plan(p);
    check(root.size() == 1, "one additional property at root");
    check(has_issue(root, "['foo-bar']", "additionalProperties"), "root additional property path");

    p = minimal_plan();
    p["cycle"]["days"][0]["extra-field"] = "x";
    const pwf::IssueList day = pwf::validate_plan(p);
    check(has_issue(day, "cycle.days[0]['extra-field']", "additionalProperties"), "day additional property path");
    check(!day.empty() && day[0].message == "must NOT have additional properties", "additional property message");
}

static void test_type_and_const() {
    nlohmann::json p = minimal_plan();
    p["plan_version"] = 2;
    const pwf::IssueList c = pwf::validate_plan(p);
    check(c.size() == 1 && c[0].code == "const" && c[0].path == "plan_version", "wrong plan_version");

    p["plan_version"] = "1";
    const pwf::IssueList t = pwf::validate_plan(p);
    check(t.size() == 1 && t[0].code == "type", "string plan_version is a type error only");
    check(!t.empty() && t[0].message == "must be integer", "type message");

    p = minimal_plan();
    p["cycle"]["days"] = "monday";
    check(has_issue(pwf::validate_plan(p), "cycle.days", "type"), "days must be an array");
}

static void test_exercise_rules() {
    nlohmann::json p = minimal_plan();
    nlohmann::json& ex = p["cycle"]["days"][0]["exercises"][0];

    ex["modality"] = "yoga";
    check(has_issue(pwf::validate_plan(p), "cycle.days[0].exercises[0].modality", "enum"), "unknown modality");

    ex["modality"] = "strength";
    ex["target_weight_percent"] = 75;
    const pwf::IssueList dep = pwf::validate_plan(p);
    check(dep.size() == 1 && dep[0].code == "dependentRequired", "percent requires percent_of");

    ex["percent_of"] = "1rm";
    check(pwf::validate_plan(p).empty(), "percent with percent_of is valid");

    ex["zones"] = nlohmann::json::array();
    check(has_issue(pwf::validate_plan(p), "cycle.days[0].exercises[0].zones", "minItems"), "empty zones");

    ex["zones"] = nlohmann::json::array({{{"zone", 9}}});
    check(has_issue(pwf::validate_plan(p), "cycle.days[0].exercises[0].zones[0].zone", "maximum"), "zone range");

    ex.erase("zones");
    ex["link"] = "http://example.com";
    check(has_issue(pwf::validate_plan(p), "cycle.days[0].exercises[0].link", "pattern"), "link must be https");

    ex["link"] = "https://example.com";
    ex["target_sets"] = 0;
    const pwf::IssueList sets = pwf::validate_plan(p);
    check(sets.size() == 1 && sets[0].message == "must be >= 1", "target_sets minimum");
}

static void test_collects_all() {
    nlohmann::json p = minimal_plan();
    p["cycle"]["days"].push_back({{"exercises", nlohmann::json::array()}});
    p["cycle"]["days"][0]["exercises"][0]["modality"] = "unknown";
    p["meta"] = {{"title", ""}};

    const pwf::IssueList issues = pwf::validate_plan(p);
    check(issues.size() == 3, "every violation is collected");
    check(has_issue(issues, "meta.title", "minLength"), "empty title");
    check(has_issue(issues, "cycle.days[1].exercises", "minItems"), "empty exercise list");
}

static void test_history_rules() {
    nlohmann::json h = minimal_history();
    h["workouts"][0]["date"] = "2025-02-30";
    check(has_issue(pwf::validate_history(h), "workouts[0].date", "format"), "impossible date");

    h = minimal_history();
    h["exported_at"] = "2025-01-15";
    check(has_issue(pwf::validate_history(h), "exported_at", "format"), "date is not a date-time");

    h = minimal_history();
    h["workouts"][0]["exercises"][0]["sets"][0]["set_type"] = "bonus";
    check(has_issue(pwf::validate_history(h), "workouts[0].exercises[0].sets[0].set_type", "enum"), "set_type enum");

    h = minimal_history();
    h["workouts"][0]["exercises"][0].erase("name");
    check(has_issue(pwf::validate_history(h), "workouts[0].exercises[0].name", "required"), "exercise name");
}

static void test_formats() {
    check(pwf::is_valid_date("2024-02-29"), "leap day");
    check(!pwf::is_valid_date("2023-02-29"), "not a leap year");
    check(!pwf::is_valid_date("2024-13-01"), "month 13");
    check(!pwf::is_valid_date("2024-1-01"), "short month");

    check(pwf::is_valid_date_time("2025-01-15T10:30:00Z"), "utc");
    check(pwf::is_valid_date_time("2025-01-15T10:30:00.250+02:00"), "fraction and offset");
    check(pwf::is_valid_date_time("2025-01-15 10:30:00z"), "space separator");
    check(!pwf::is_valid_date_time("2025-01-15T10:30:00"), "offset required");
    check(!pwf::is_valid_date_time("2025-01-15T24:00:00Z"), "hour 24");
}

static void test_custom_schema() {
    const nlohmann::json schema = {
        {"type", "object"},
        {"properties", {{"name", {{"$ref", "#/$defs/Name"}}}}},
        {"$defs", {{"Name", {{"type", "string"}, {"maxLength", 3}}}}},
    };
    check(pwf::validate_against({{"name", "abc"}}, schema).empty(), "ref resolves");

    const auto v = pwf::validate_against({{"name", "äöüß"}}, schema);
    check(v.size() == 1 && v[0].keyword == "maxLength", "length counts code points");

    check(pwf::validate_against({{"name", "ab"}}, false).size() == 1, "false schema rejects");
    check(pwf::validate_against(42, true).empty(), "true schema accepts");
}

static void test_long_pattern_input() {
    const nlohmann::json schema = {{"type", "string"}, {"pattern", "^[A-Za-z0-9_-]+$"}};
    const std::string group(100000, 'a');

    check(pwf::validate_against(group, schema).empty(), "long matching string");

    const auto v = pwf::validate_against(group + " ", schema);
    check(v.size() == 1 && v[0].keyword == "pattern", "long string with a space");

    nlohmann::json p = minimal_plan();
    p["cycle"]["days"][0]["exercises"][0]["group"] = std::string(100000, 'b');
    check(pwf::validate_plan(p).empty(), "long group in a plan");

    bool threw = false;
    try {
        pwf::validate_against("x", {{"pattern", "(unclosed"}});
    } catch (const std::logic_error&) {
        threw = true;
    }
    check(threw, "malformed schema pattern is a schema error");
}

int main() {
    test_schema_registry();
    test_valid_documents();
    test_empty_object();
    test_missing_exercises();
    test_additional_properties();
    test_type_and_const();
    test_exercise_rules();
    test_collects_all();
    test_history_rules();
    test_formats();
    test_custom_schema();
    test_long_pattern_input();

    if (g_failures) {
        std::cerr << g_failures << " failure(s)\n";
        return 1;
    }
    std::cout << "validator_test: ok\n";
    return 0;
}
