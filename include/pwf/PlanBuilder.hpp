#pragma once

#include <cstddef>
#include <map>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

#include "nlohmann/json.hpp"
#include "pwf/Models.hpp"

namespace pwf {

// Thrown on builder contract violations (calling code bugs, not bad input).
class BuilderError : public std::logic_error {
public:
    using std::logic_error::logic_error;
};

struct DayDraft {
    nlohmann::json fields = nlohmann::json::object();  // everything except exercises
    std::vector<nlohmann::json> exercises;
};

struct PlanDraft {
    nlohmann::json plan_version = 1;
    std::optional<nlohmann::json> meta;
    std::optional<std::map<std::string, std::string>> glossary;
    nlohmann::json cycle_fields = nlohmann::json::object();  // start_date, notes
    std::vector<DayDraft> days;
};

// Fluent single-owner builder. Not safe for concurrent mutation.
//
//   Document plan = PlanBuilder()
//       .meta(PlanMeta("Starter"))
//       .add_day("Lower")
//       .add_exercise("Squat", spec)
//       .build();
class PlanBuilder {
public:
    enum class State {
        Empty,          // no day to add exercises to
        HasCurrentDay
    };

    PlanBuilder() = default;

    PlanBuilder& version(int v);
    // Accepts a raw object or anything with a to_json, e.g. PlanMeta.
    PlanBuilder& meta(const nlohmann::json& m);
    PlanBuilder& glossary(const std::map<std::string, std::string>& g);
    PlanBuilder& start_date(const std::string& date);
    PlanBuilder& cycle_notes(const std::string& notes);

    // Appends a day and makes it current. `overrides` is merged into the day;
    // an "exercises" array in it seeds the exercise list.
    PlanBuilder& add_day(const std::string& focus = "",
                         const nlohmann::json& overrides = nlohmann::json::object());

    // Appends {name, ...fields} to the current day; fields win on conflict.
    // `fields` may be a raw object or an ExerciseSpec.
    PlanBuilder& add_exercise(const std::string& name, const nlohmann::json& fields);

    // Drops every day; the builder returns to State::Empty.
    PlanBuilder& clear_days();

    State state() const { return current_day_ ? State::HasCurrentDay : State::Empty; }
    std::optional<std::size_t> current_day() const { return current_day_; }
    const PlanDraft& draft() const { return draft_; }

    // Checks the day / exercise invariants and freezes the draft.
    Document build() const;

    std::string to_yaml() const;

private:
    PlanDraft draft_;
    std::optional<std::size_t> current_day_;
};

}  // namespace pwf
