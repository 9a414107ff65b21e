#include "commands/init.hpp"

#include "io/TextIO.hpp"
#include "pwf/Models.hpp"
#include "pwf/PlanBuilder.hpp"
#include "pwf/Serializer.hpp"

#include <filesystem>
#include <iostream>
#include <string>

namespace fs = std::filesystem;

static bool has_flag(int argc, char** argv, const std::string& key) {
    for (int i = 0; i < argc; ++i) {
        if (std::string(argv[i]) == key) return true;
    }
    return false;
}

static std::string first_positional(int argc, char** argv, const std::string& def) {
    for (int i = 1; i < argc; ++i) {
        const std::string a = argv[i];
        if (!a.empty() && a[0] != '-') return a;
    }
    return def;
}

static std::string plan_template() {
    pwf::PlanMeta meta("My Training Plan");
    meta.description = "A brief description of this plan";
    meta.author = "Your Name";
    meta.equipment = {"dumbbells"};
    meta.days_per_week = 3;
    meta.tags = {"strength"};

    pwf::ExerciseSpec first(pwf::Modality::Strength);
    first.target_sets = 3;
    first.target_reps = 10;
    first.target_notes = "Form cues go here";

    pwf::ExerciseSpec second(pwf::Modality::Strength);
    second.target_sets = 3;
    second.target_reps = 8;

    return pwf::PlanBuilder()
        .meta(meta)
        .cycle_notes("Coaching notes for the entire cycle")
        .add_day("Day 1", {{"target_session_length_min", 45}})
        .add_exercise("Exercise Name", first)
        .add_day("Day 2")
        .add_exercise("Another Exercise", second)
        .to_yaml();
}

static std::string history_template() {
    const nlohmann::json history = {
        {"history_version", 1},
        {"exported_at", "2025-01-15T10:30:00Z"},
        {"export_source", {{"app_name", "Your App"}, {"app_version", "1.0.0"}}},
        {"units", {{"weight", "kg"}, {"distance", "meters"}}},
        {"workouts", nlohmann::json::array({
            {
                {"date", "2025-01-15"},
                {"title", "Push Day"},
                {"started_at", "2025-01-15T09:00:00Z"},
                {"ended_at", "2025-01-15T10:00:00Z"},
                {"duration_sec", 3600},
                {"exercises", nlohmann::json::array({
                    {
                        {"name", "Bench Press"},
                        {"modality", "strength"},
                        {"sets", nlohmann::json::array({
                            {{"set_number", 1}, {"set_type", "warmup"}, {"reps", 10}, {"weight_kg", 60}},
                            {{"set_number", 2}, {"set_type", "working"}, {"reps", 5}, {"weight_kg", 100}},
                        })},
                    },
                })},
            },
        })},
    };
    return pwf::encode(history);
}

int cmd_init(int argc, char** argv) {
    const bool history = has_flag(argc, argv, "--history");
    const fs::path out = first_positional(argc, argv, history ? "history.yaml" : "plan.yaml");

    if (fs::exists(out)) {
        std::cerr << "[error] file already exists: " << out.string() << "\n";
        return 1;
    }

    try {
        const std::string header = history ? "# PWF History Export v1\n\n" : "# PWF Plan v1\n\n";
        io::write_text_file(out, header + (history ? history_template() : plan_template()));
    } catch (const std::exception& e) {
        std::cerr << "[error] " << e.what() << "\n";
        return 1;
    }

    std::cout << "✓ Created " << out.string() << "\n\n";
    std::cout << "Next steps:\n";
    std::cout << "  1. Edit " << out.string() << " to add your data\n";
    std::cout << "  2. Run pwf " << (history ? "history " : "validate ") << out.string() << " to validate\n";
    return 0;
}
