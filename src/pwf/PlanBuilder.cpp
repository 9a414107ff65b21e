#include "pwf/PlanBuilder.hpp"

#include "pwf/Serializer.hpp"

namespace pwf {

PlanBuilder& PlanBuilder::version(int v) {
    draft_.plan_version = v;
    return *this;
}

PlanBuilder& PlanBuilder::meta(const nlohmann::json& m) {
    draft_.meta = m;
    return *this;
}

PlanBuilder& PlanBuilder::glossary(const std::map<std::string, std::string>& g) {
    draft_.glossary = g;
    return *this;
}

PlanBuilder& PlanBuilder::start_date(const std::string& date) {
    draft_.cycle_fields["start_date"] = date;
    return *this;
}

PlanBuilder& PlanBuilder::cycle_notes(const std::string& notes) {
    draft_.cycle_fields["notes"] = notes;
    return *this;
}

PlanBuilder& PlanBuilder::add_day(const std::string& focus, const nlohmann::json& overrides) {
    if (!overrides.is_null() && !overrides.is_object()) {
        throw BuilderError("add_day overrides must be an object");
    }

    DayDraft day;
    if (!focus.empty()) day.fields["focus"] = focus;

    if (overrides.is_object()) {
        for (auto it = overrides.begin(); it != overrides.end(); ++it) {
            if (it.key() == "exercises") continue;
            day.fields[it.key()] = it.value();
        }
        if (overrides.contains("exercises") && overrides["exercises"].is_array()) {
            for (const auto& ex : overrides["exercises"]) day.exercises.push_back(ex);
        }
    }

    draft_.days.push_back(std::move(day));
    current_day_ = draft_.days.size() - 1;
    return *this;
}

PlanBuilder& PlanBuilder::add_exercise(const std::string& name, const nlohmann::json& fields) {
    if (!current_day_ || *current_day_ >= draft_.days.size()) {
        throw BuilderError("add_exercise requires an active day. Call add_day first.");
    }
    if (!fields.is_null() && !fields.is_object()) {
        throw BuilderError("add_exercise fields must be an object");
    }

    nlohmann::json exercise;
    exercise["name"] = name;
    if (fields.is_object()) {
        for (auto it = fields.begin(); it != fields.end(); ++it) {
            exercise[it.key()] = it.value();
        }
    }

    draft_.days[*current_day_].exercises.push_back(std::move(exercise));
    return *this;
}

PlanBuilder& PlanBuilder::clear_days() {
    draft_.days.clear();
    current_day_.reset();
    return *this;
}

Document PlanBuilder::build() const {
    if (draft_.days.empty()) {
        throw BuilderError("Plan requires at least one day.");
    }

    for (std::size_t i = 0; i < draft_.days.size(); ++i) {
        if (draft_.days[i].exercises.empty()) {
            throw BuilderError("Day " + std::to_string(i + 1) + " requires at least one exercise.");
        }
    }

    nlohmann::json days = nlohmann::json::array();
    for (const auto& d : draft_.days) {
        nlohmann::json day = d.fields;
        day["exercises"] = d.exercises;
        days.push_back(std::move(day));
    }

    nlohmann::json cycle = draft_.cycle_fields;
    cycle["days"] = std::move(days);

    nlohmann::json plan;
    plan["plan_version"] = draft_.plan_version;
    if (draft_.meta) plan["meta"] = *draft_.meta;
    if (draft_.glossary) plan["glossary"] = *draft_.glossary;
    plan["cycle"] = std::move(cycle);

    Document doc;
    doc.kind = DocumentKind::Plan;
    doc.value = std::move(plan);
    return doc;
}

std::string PlanBuilder::to_yaml() const {
    return encode(build());
}

}  // namespace pwf
