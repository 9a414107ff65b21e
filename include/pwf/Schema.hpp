#pragma once

#include "nlohmann/json.hpp"
#include "pwf/Models.hpp"

namespace pwf {

// Embedded JSON Schema documents, parsed once on first use.
const nlohmann::json& plan_schema();
const nlohmann::json& history_schema();

const nlohmann::json& schema_for(DocumentKind kind);

}  // namespace pwf
