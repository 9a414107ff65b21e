#include "commands/init.hpp"
#include "commands/validate.hpp"
#include "io/TextIO.hpp"
#include "nlohmann/json.hpp"

#include <chrono>
#include <filesystem>
#include <iostream>
#include <sstream>
#include <string>
#include <vector>

namespace fs = std::filesystem;

static int g_failures = 0;

static void check(bool cond, const std::string& name) {
    if (!cond) {
        std::cerr << "FAIL: " << name << "\n";
        ++g_failures;
    }
}

static const char* const kValidPlan =
    "plan_version: 1\n"
    "cycle:\n"
    "  days:\n"
    "    - exercises:\n"
    "        - name: Squat\n"
    "          modality: strength\n"
    "        - name: Plank\n"
    "          modality: countdown\n";

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

struct RunResult {
    int code = 0;
    std::string out;
    std::string err;
};

// argv[0] is the subcommand name, as main() passes it.
static RunResult run(int (*cmd)(int, char**), const std::vector<std::string>& args) {
    std::vector<std::string> storage = args;
    std::vector<char*> argv;
    for (auto& a : storage) argv.push_back(&a[0]);
    argv.push_back(nullptr);

    std::ostringstream out;
    std::ostringstream err;
    std::streambuf* old_out = std::cout.rdbuf(out.rdbuf());
    std::streambuf* old_err = std::cerr.rdbuf(err.rdbuf());

    RunResult r;
    r.code = cmd(static_cast<int>(storage.size()), argv.data());

    std::cout.rdbuf(old_out);
    std::cerr.rdbuf(old_err);
    r.out = out.str();
    r.err = err.str();
    return r;
}

static bool contains(const std::string& haystack, const std::string& needle) {
    return haystack.find(needle) != std::string::npos;
}

static void test_validate(const fs::path& dir) {
    const std::string plan = (dir / "plan.yaml").string();
    const std::string text = (dir / "text.yaml").string();
    io::write_text_file(plan, kValidPlan);
    io::write_text_file(text, "just text\n");

    const RunResult ok = run(cmd_validate, {"validate", plan});
    check(ok.code == 0, "valid plan exits 0");
    check(contains(ok.out, "✓ " + plan), "valid plan marked");
    check(contains(ok.out, "1 days, 2 exercises"), "plan stats");

    const RunResult bad = run(cmd_validate, {"validate", text});
    check(bad.code == 1, "scalar document exits 1");
    check(contains(bad.out, "✗ " + text), "invalid file marked");
    check(contains(bad.out, "(root): must be object"), "root issue rendered as (root)");

    check(run(cmd_validate, {"validate", plan, text}).code == 1, "one invalid file fails the run");

    const RunResult compact = run(cmd_validate, {"validate", "--format", "compact", plan, text});
    check(compact.out == "✓ " + plan + "\n✗ " + text + "\n", "compact output");

    check(run(cmd_validate, {"validate", "--strict", plan}).code == 0, "strict valid plan exits 0");
    check(run(cmd_validate, {"validate", "-s", "-q", plan}).code == 0, "short flags");
}

static void test_json_format(const fs::path& dir) {
    const std::string plan = (dir / "plan.yaml").string();
    const std::string text = (dir / "text.yaml").string();

    const RunResult r = run(cmd_validate, {"validate", plan, text, "--format", "json"});
    check(r.code == 1, "json run exit code");

    nlohmann::json arr;
    try {
        arr = nlohmann::json::parse(r.out);
    } catch (const nlohmann::json::parse_error& e) {
        check(false, std::string("json output parses: ") + e.what());
        return;
    }

    check(arr.is_array() && arr.size() == 2, "one entry per file");
    if (!arr.is_array() || arr.size() != 2) return;

    for (const auto& entry : arr) {
        check(entry.size() == 5, "entry has five fields");
        for (const char* key : {"file", "type", "valid", "errors", "warnings"}) {
            check(entry.contains(key), std::string("entry has ") + key);
        }
    }

    check(arr[0]["file"] == plan && arr[0]["type"] == "plan", "first entry names the plan");
    check(arr[0]["valid"] == true && arr[0]["errors"].empty(), "valid entry has no errors");
    check(arr[1]["valid"] == false, "invalid entry");
    check(arr[1]["errors"].size() == 1, "one error for a scalar document");
    if (arr[1]["errors"].size() == 1) {
        const nlohmann::json& e = arr[1]["errors"][0];
        check(e["path"] == "" && e["code"] == "type" && e["severity"] == "error", "error fields");
    }
    check(arr[1]["warnings"].is_array() && arr[1]["warnings"].empty(), "warnings array present");
}

static void test_argument_errors(const fs::path& dir) {
    const std::string plan = (dir / "plan.yaml").string();

    const RunResult unknown = run(cmd_validate, {"validate", "--bogus", plan});
    check(unknown.code == 1, "unknown option exits 1");
    check(contains(unknown.err, "[error] unknown option: --bogus"), "unknown option named");

    const RunResult none = run(cmd_validate, {"validate"});
    check(none.code == 1 && contains(none.err, "[error] missing input files"), "no files");

    check(run(cmd_validate, {"validate", "--format", "xml", plan}).code == 1, "bad format value");

    const RunResult missing = run(cmd_validate, {"validate", (dir / "absent.yaml").string()});
    check(missing.code == 1, "missing file exits 1");
    check(contains(missing.err, "[error]"), "missing file reported");
}

static void test_history(const fs::path& dir) {
    const std::string history = (dir / "history.yaml").string();
    const std::string plan = (dir / "plan.yaml").string();
    io::write_text_file(history, kValidHistory);

    const RunResult ok = run(cmd_history, {"history", history});
    check(ok.code == 0, "valid history exits 0");
    check(contains(ok.out, "1 workouts, 1 sets"), "history stats");

    check(run(cmd_history, {"history", plan}).code == 1, "plan is not a history");
    check(run(cmd_validate, {"validate", history}).code == 1, "history is not a plan");
}

static void test_init(const fs::path& dir) {
    const std::string plan = (dir / "new" / "plan.yaml").string();

    const RunResult created = run(cmd_init, {"init", plan});
    check(created.code == 0, "init exits 0");
    check(fs::exists(plan), "init writes the file");
    check(contains(created.out, "✓ Created " + plan), "init reports the path");

    const std::string before = io::read_text_file(plan);
    check(before.rfind("# PWF Plan v1\n", 0) == 0, "plan template header");
    check(run(cmd_validate, {"validate", "--strict", plan}).code == 0, "plan template validates");

    const RunResult again = run(cmd_init, {"init", plan});
    check(again.code == 1, "init refuses to overwrite");
    check(contains(again.err, "[error] file already exists: " + plan), "overwrite refusal message");
    check(io::read_text_file(plan) == before, "existing file untouched");

    const std::string history = (dir / "new" / "history.yaml").string();
    check(run(cmd_init, {"init", history, "--history"}).code == 0, "init --history exits 0");
    check(io::read_text_file(history).rfind("# PWF History Export v1\n", 0) == 0, "history template header");
    check(run(cmd_history, {"history", history}).code == 0, "history template validates");
}

int main() {
    const fs::path dir = fs::temp_directory_path() /
                         ("pwf_cli_test_" + std::to_string(std::chrono::steady_clock::now().time_since_epoch().count()));
    fs::create_directories(dir);

    try {
        test_validate(dir);
        test_json_format(dir);
        test_argument_errors(dir);
        test_history(dir);
        test_init(dir);
    } catch (const std::exception& e) {
        std::cerr << "FAIL: unexpected exception: " << e.what() << "\n";
        ++g_failures;
    }

    std::error_code ec;
    fs::remove_all(dir, ec);

    if (g_failures) {
        std::cerr << g_failures << " failure(s)\n";
        return 1;
    }
    std::cout << "cli_test: ok\n";
    return 0;
}
