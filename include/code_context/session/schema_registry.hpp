#pragma once
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "code_context/session/protocol.hpp"

namespace code_context {

// Self-contained JSON Schema (no $ref) for the payload a stage returns.
nlohmann::json schema_for(Stage stage);

// schema_for(stage), pretty-printed for embedding in model instructions.
std::string instruction_text(Stage stage);

// Checks `value` against the subset of JSON Schema the registry emits:
// type, properties, required, additionalProperties, items and enum.
// Returns one message per violation; empty means valid.
std::vector<std::string> validate(const nlohmann::json& schema, const nlohmann::json& value);

// validate(schema_for(stage), value) plus the cross-field rules of the stage
// payload (a SELECT plan may not list a path in both lists).
std::vector<std::string> validate_stage_payload(Stage stage, const nlohmann::json& value);

} // namespace code_context
