#include "pwf/Models.hpp"

namespace pwf {

const char* document_kind_str(DocumentKind k) {
    switch (k) {
        case DocumentKind::Plan: return "plan";
        case DocumentKind::History: return "history";
        default: return "unknown";
    }
}

const char* severity_str(Severity s) {
    switch (s) {
        case Severity::Error: return "error";
        case Severity::Warning: return "warning";
        default: return "unknown";
    }
}

const char* modality_str(Modality m) {
    switch (m) {
        case Modality::Strength: return "strength";
        case Modality::Countdown: return "countdown";
        case Modality::Stopwatch: return "stopwatch";
        case Modality::Interval: return "interval";
        case Modality::Cycling: return "cycling";
        case Modality::Running: return "running";
        case Modality::Rowing: return "rowing";
        case Modality::Swimming: return "swimming";
        default: return "unknown";
    }
}

std::optional<Modality> parse_modality(const std::string& s) {
    static const Modality all[] = {
        Modality::Strength, Modality::Countdown, Modality::Stopwatch, Modality::Interval,
        Modality::Cycling,  Modality::Running,   Modality::Rowing,    Modality::Swimming,
    };
    for (Modality m : all) {
        if (s == modality_str(m)) return m;
    }
    return std::nullopt;
}

template <typename T>
static void put_opt(nlohmann::json& j, const char* key, const std::optional<T>& v) {
    if (v) j[key] = *v;
}

static void put_str(nlohmann::json& j, const char* key, const std::string& v) {
    if (!v.empty()) j[key] = v;
}

static nlohmann::json zone_to_json(const TrainingZone& z) {
    nlohmann::json j;
    j["zone"] = z.zone;
    put_opt(j, "duration_sec", z.duration_sec);
    put_opt(j, "target_power_watts", z.target_power_watts);
    put_opt(j, "target_hr_bpm", z.target_hr_bpm);
    put_opt(j, "target_pace_sec_per_km", z.target_pace_sec_per_km);
    return j;
}

static nlohmann::json phase_to_json(const IntervalPhase& p) {
    nlohmann::json j;
    j["name"] = p.name;
    j["duration_sec"] = p.duration_sec;
    put_opt(j, "target_power_watts", p.target_power_watts);
    put_opt(j, "target_hr_bpm", p.target_hr_bpm);
    put_opt(j, "target_pace_sec_per_km", p.target_pace_sec_per_km);
    put_opt(j, "cadence_rpm", p.cadence_rpm);
    return j;
}

void to_json(nlohmann::json& j, const ExerciseSpec& spec) {
    j = nlohmann::json::object();
    put_str(j, "id", spec.id);
    j["modality"] = modality_str(spec.modality);
    put_opt(j, "target_sets", spec.target_sets);
    put_opt(j, "target_reps", spec.target_reps);
    put_opt(j, "target_duration_sec", spec.target_duration_sec);
    put_opt(j, "target_distance_meters", spec.target_distance_meters);
    put_str(j, "target_load", spec.target_load);
    put_opt(j, "target_weight_percent", spec.target_weight_percent);
    put_str(j, "percent_of", spec.percent_of);
    put_str(j, "reference_exercise", spec.reference_exercise);
    put_str(j, "cues", spec.cues);
    put_str(j, "target_notes", spec.target_notes);
    put_str(j, "link", spec.link);
    put_str(j, "image", spec.image);
    put_str(j, "group", spec.group);
    put_str(j, "group_type", spec.group_type);
    put_opt(j, "rest_between_sets_sec", spec.rest_between_sets_sec);
    put_opt(j, "rest_after_sec", spec.rest_after_sec);

    if (!spec.zones.empty()) {
        nlohmann::json arr = nlohmann::json::array();
        for (const auto& z : spec.zones) arr.push_back(zone_to_json(z));
        j["zones"] = arr;
    }

    if (spec.ramp) {
        nlohmann::json r;
        r["start_power_watts"] = spec.ramp->start_power_watts;
        r["end_power_watts"] = spec.ramp->end_power_watts;
        r["duration_sec"] = spec.ramp->duration_sec;
        put_opt(r, "step_duration_sec", spec.ramp->step_duration_sec);
        j["ramp"] = r;
    }

    if (!spec.interval_phases.empty()) {
        nlohmann::json arr = nlohmann::json::array();
        for (const auto& p : spec.interval_phases) arr.push_back(phase_to_json(p));
        j["interval_phases"] = arr;
    }
}

void to_json(nlohmann::json& j, const PlanMeta& meta) {
    j = nlohmann::json::object();
    put_str(j, "id", meta.id);
    j["title"] = meta.title;
    put_str(j, "description", meta.description);
    put_str(j, "author", meta.author);
    put_str(j, "status", meta.status);
    put_str(j, "activated_at", meta.activated_at);
    put_str(j, "completed_at", meta.completed_at);
    if (!meta.equipment.empty()) j["equipment"] = meta.equipment;
    put_opt(j, "daysPerWeek", meta.days_per_week);
    put_opt(j, "recommendedFirst", meta.recommended_first);
    if (!meta.tags.empty()) j["tags"] = meta.tags;

    if (meta.athlete_profile) {
        const AthleteProfile& ap = *meta.athlete_profile;
        nlohmann::json pj = nlohmann::json::object();
        put_opt(pj, "ftp_watts", ap.ftp_watts);
        put_opt(pj, "threshold_hr_bpm", ap.threshold_hr_bpm);
        put_opt(pj, "max_hr_bpm", ap.max_hr_bpm);
        put_opt(pj, "threshold_pace_sec_per_km", ap.threshold_pace_sec_per_km);
        put_opt(pj, "weight_kg", ap.weight_kg);
        j["athlete_profile"] = pj;
    }
}

}  // namespace pwf
