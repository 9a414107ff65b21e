#pragma once

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include "nlohmann/json.hpp"

namespace pwf {

enum class DocumentKind {
    Plan,
    History
};

enum class Severity {
    Error,
    Warning  // reserved, no schema rule emits it
};

enum class Modality {
    Strength,
    Countdown,
    Stopwatch,
    Interval,
    Cycling,
    Running,
    Rowing,
    Swimming
};

const char* document_kind_str(DocumentKind k);
const char* severity_str(Severity s);
const char* modality_str(Modality m);
std::optional<Modality> parse_modality(const std::string& s);

struct ValidationIssue {
    std::string path;     // canonical path, "" = document root
    std::string message;
    Severity severity = Severity::Error;
    std::string code;     // violated keyword, may be empty
};

using IssueList = std::vector<ValidationIssue>;

struct ValidationOptions {
    bool strict = false;  // warnings count as failures
};

struct Document {
    DocumentKind kind = DocumentKind::Plan;
    nlohmann::json value;
};

inline bool operator==(const Document& a, const Document& b) {
    return a.kind == b.kind && a.value == b.value;
}

inline bool operator!=(const Document& a, const Document& b) {
    return !(a == b);
}

// ---- typed builder inputs ----

struct TrainingZone {
    int zone = 1;  // 1..7
    std::optional<int> duration_sec;
    std::optional<double> target_power_watts;
    std::optional<int> target_hr_bpm;
    std::optional<double> target_pace_sec_per_km;
};

struct RampConfig {
    double start_power_watts = 0.0;
    double end_power_watts = 0.0;
    int duration_sec = 0;
    std::optional<int> step_duration_sec;
};

struct IntervalPhase {
    std::string name;  // warmup, work, recovery, ...
    int duration_sec = 0;
    std::optional<double> target_power_watts;
    std::optional<int> target_hr_bpm;
    std::optional<double> target_pace_sec_per_km;
    std::optional<double> cadence_rpm;
};

// Exercise fields other than the name.
struct ExerciseSpec {
    explicit ExerciseSpec(Modality m) : modality(m) {}

    Modality modality;

    std::string id;
    std::optional<int> target_sets;
    std::optional<int> target_reps;
    std::optional<int> target_duration_sec;
    std::optional<double> target_distance_meters;
    std::string target_load;
    std::optional<double> target_weight_percent;
    std::string percent_of;          // 1rm | 3rm | 5rm | 10rm
    std::string reference_exercise;
    std::string cues;
    std::string target_notes;
    std::string link;                // https only
    std::string image;               // https only
    std::string group;
    std::string group_type;          // superset | circuit
    std::optional<int> rest_between_sets_sec;
    std::optional<int> rest_after_sec;

    std::vector<TrainingZone> zones;
    std::optional<RampConfig> ramp;
    std::vector<IntervalPhase> interval_phases;
};

struct AthleteProfile {
    std::optional<double> ftp_watts;
    std::optional<int> threshold_hr_bpm;
    std::optional<int> max_hr_bpm;
    std::optional<double> threshold_pace_sec_per_km;
    std::optional<double> weight_kg;
};

struct PlanMeta {
    explicit PlanMeta(std::string t) : title(std::move(t)) {}

    std::string title;
    std::string id;
    std::string description;
    std::string author;
    std::string status;              // draft | active | completed | archived
    std::string activated_at;
    std::string completed_at;
    std::vector<std::string> equipment;
    std::optional<int> days_per_week;
    std::optional<bool> recommended_first;
    std::vector<std::string> tags;
    std::optional<AthleteProfile> athlete_profile;
};

// Found by nlohmann::json through ADL, so both convert implicitly:
//   nlohmann::json j = spec;
void to_json(nlohmann::json& j, const ExerciseSpec& spec);
void to_json(nlohmann::json& j, const PlanMeta& meta);

}  // namespace pwf
