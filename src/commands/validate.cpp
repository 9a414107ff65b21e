#include "commands/validate.hpp"

#include "io/TextIO.hpp"
#include "nlohmann/json.hpp"
#include "pwf/Parse.hpp"

#include <iostream>
#include <string>
#include <utility>
#include <vector>

enum class OutputFormat { Pretty, Json, Compact };

struct ValidateArgs {
    std::vector<std::string> files;
    OutputFormat format = OutputFormat::Pretty;
    bool strict = false;
    bool quiet = false;
};

struct FileResult {
    std::string file;
    bool read_ok = false;
    bool valid = false;
    pwf::IssueList issues;
    nlohmann::json value;  // decoded document when valid
};

static bool parse_format(const std::string& s, OutputFormat& out) {
    if (s == "pretty") { out = OutputFormat::Pretty; return true; }
    if (s == "json") { out = OutputFormat::Json; return true; }
    if (s == "compact") { out = OutputFormat::Compact; return true; }
    return false;
}

// argv[0] is the subcommand name.
static bool parse_args(int argc, char** argv, ValidateArgs& out) {
    for (int i = 1; i < argc; ++i) {
        const std::string a = argv[i];
        if (a == "--format" || a == "-f") {
            if (i + 1 >= argc || !parse_format(argv[i + 1], out.format)) {
                std::cerr << "[error] --format expects pretty, json or compact\n";
                return false;
            }
            ++i;
        } else if (a == "--strict" || a == "-s") {
            out.strict = true;
        } else if (a == "--quiet" || a == "-q") {
            out.quiet = true;
        } else if (!a.empty() && a[0] == '-') {
            std::cerr << "[error] unknown option: " << a << "\n";
            return false;
        } else {
            out.files.push_back(a);
        }
    }

    if (out.files.empty()) {
        std::cerr << "[error] missing input files\n";
        return false;
    }
    return true;
}

static std::string display_path(const std::string& path) {
    return path.empty() ? "(root)" : path;
}

static std::string plan_stats(const nlohmann::json& plan) {
    size_t days = 0;
    size_t exercises = 0;
    if (plan.contains("cycle") && plan["cycle"].contains("days")) {
        for (const auto& d : plan["cycle"]["days"]) {
            ++days;
            if (d.contains("exercises")) exercises += d["exercises"].size();
        }
    }
    return std::to_string(days) + " days, " + std::to_string(exercises) + " exercises";
}

static std::string history_stats(const nlohmann::json& history) {
    size_t workouts = 0;
    size_t sets = 0;
    if (history.contains("workouts")) {
        for (const auto& w : history["workouts"]) {
            ++workouts;
            if (!w.contains("exercises")) continue;
            for (const auto& e : w["exercises"]) {
                if (e.contains("sets")) sets += e["sets"].size();
            }
        }
    }
    return std::to_string(workouts) + " workouts, " + std::to_string(sets) + " sets";
}

static FileResult check_file(const std::string& file, pwf::DocumentKind kind, const pwf::ValidationOptions& opts) {
    FileResult r;
    r.file = file;

    std::string text;
    try {
        text = io::read_text_file(file);
    } catch (const std::exception& e) {
        std::cerr << "[error] " << e.what() << "\n";
        return r;
    }
    r.read_ok = true;

    const pwf::ParseResult parsed = pwf::parse_document(text, kind, opts);
    if (pwf::is_issue_list(parsed)) {
        r.issues = std::get<pwf::IssueList>(parsed);
    } else {
        r.value = std::get<pwf::Document>(parsed).value;
    }
    r.valid = pwf::passes(r.issues, opts);
    return r;
}

static void print_issue(const char* mark, const pwf::ValidationIssue& issue) {
    std::cout << "  " << mark << " " << display_path(issue.path) << ": " << issue.message << "\n";
}

static void output_results(const std::vector<FileResult>& results, pwf::DocumentKind kind, const ValidateArgs& args) {
    if (args.format == OutputFormat::Json) {
        nlohmann::json arr = nlohmann::json::array();
        for (const auto& r : results) {
            if (!r.read_ok) continue;
            pwf::IssueList errors;
            pwf::IssueList warnings;
            for (const auto& i : r.issues) {
                (i.severity == pwf::Severity::Error ? errors : warnings).push_back(i);
            }
            arr.push_back({
                {"file", r.file},
                {"type", pwf::document_kind_str(kind)},
                {"valid", r.valid},
                {"errors", pwf::issues_to_json(errors)},
                {"warnings", pwf::issues_to_json(warnings)},
            });
        }
        std::cout << arr.dump(2) << "\n";
        return;
    }

    for (const auto& r : results) {
        if (!r.read_ok) continue;

        if (args.format == OutputFormat::Compact) {
            std::cout << (r.valid ? "✓ " : "✗ ") << r.file << "\n";
            continue;
        }

        if (r.valid) {
            std::cout << "✓ " << r.file << "\n";
            if (!r.value.is_null()) {
                std::cout << "  "
                          << (kind == pwf::DocumentKind::Plan ? plan_stats(r.value) : history_stats(r.value))
                          << "\n";
            }
            if (!args.quiet) {
                for (const auto& i : r.issues) print_issue("⚠", i);
            }
        } else {
            std::cout << "✗ " << r.file << "\n";
            for (const auto& i : r.issues) {
                if (i.severity == pwf::Severity::Error) print_issue("✗", i);
                else if (args.strict) print_issue("⚠", i);
            }
        }
        std::cout << "\n";
    }
}

static int run_validation(int argc, char** argv, pwf::DocumentKind kind) {
    ValidateArgs args;
    if (!parse_args(argc, argv, args)) return 1;

    pwf::ValidationOptions opts;
    opts.strict = args.strict;

    std::vector<FileResult> results;
    bool all_valid = true;
    for (const auto& f : args.files) {
        FileResult r = check_file(f, kind, opts);
        if (!r.valid) all_valid = false;
        results.push_back(std::move(r));
    }

    output_results(results, kind, args);
    return all_valid ? 0 : 1;
}

int cmd_validate(int argc, char** argv) {
    return run_validation(argc, argv, pwf::DocumentKind::Plan);
}

int cmd_history(int argc, char** argv) {
    return run_validation(argc, argv, pwf::DocumentKind::History);
}
