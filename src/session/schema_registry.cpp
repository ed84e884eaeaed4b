#include "code_context/session/schema_registry.hpp"
#include <algorithm>

namespace code_context {

using json = nlohmann::json;

json schema_for(Stage stage) {
    switch (stage) {
        case Stage::Load: return LoadAck::schema();
        case Stage::Select: return FileChangePlan::schema();
        case Stage::Work: return PatchData::schema();
    }
    return json::object();
}

std::string instruction_text(Stage stage) {
    return schema_for(stage).dump(2);
}

namespace {

bool type_matches(const std::string& type, const json& value) {
    if (type == "object") return value.is_object();
    if (type == "array") return value.is_array();
    if (type == "string") return value.is_string();
    if (type == "integer") return value.is_number_integer();
    if (type == "number") return value.is_number();
    if (type == "boolean") return value.is_boolean();
    if (type == "null") return value.is_null();
    return false;
}

void validate_at(const json& schema, const json& value, const std::string& where,
                 std::vector<std::string>& errors) {
    if (schema.contains("type")) {
        const std::string type = schema["type"].get<std::string>();
        if (!type_matches(type, value)) {
            errors.push_back(where + ": expected " + type + ", got " + value.type_name());
            return;
        }
    }

    if (schema.contains("enum")) {
        const auto& allowed = schema["enum"];
        if (std::find(allowed.begin(), allowed.end(), value) == allowed.end()) {
            errors.push_back(where + ": " + value.dump() + " is not one of " + allowed.dump());
        }
    }

    if (value.is_object()) {
        const json properties = schema.value("properties", json::object());

        if (schema.contains("required")) {
            for (const auto& key : schema["required"]) {
                if (!value.contains(key.get<std::string>())) {
                    errors.push_back(where + ": missing required property '" + key.get<std::string>() + "'");
                }
            }
        }

        bool closed = schema.contains("additionalProperties") &&
                      schema["additionalProperties"].is_boolean() &&
                      !schema["additionalProperties"].get<bool>();

        for (const auto& [key, member] : value.items()) {
            if (properties.contains(key)) {
                validate_at(properties[key], member, where + "." + key, errors);
            } else if (closed) {
                errors.push_back(where + ": unexpected property '" + key + "'");
            }
        }
    }

    if (value.is_array() && schema.contains("items")) {
        for (size_t i = 0; i < value.size(); ++i) {
            validate_at(schema["items"], value[i], where + "[" + std::to_string(i) + "]", errors);
        }
    }
}

} // namespace

std::vector<std::string> validate(const json& schema, const json& value) {
    std::vector<std::string> errors;
    validate_at(schema, value, "$", errors);
    return errors;
}

std::vector<std::string> validate_stage_payload(Stage stage, const json& value) {
    auto errors = validate(schema_for(stage), value);
    if (!errors.empty() || stage != Stage::Select) return errors;

    try {
        auto plan = value.get<FileChangePlan>();
        if (auto dup = plan.overlapping_path()) {
            errors.push_back("$: path '" + *dup + "' is listed in both files and additionalContextFiles");
        }
    } catch (const std::exception& e) {
        errors.push_back(std::string("$: ") + e.what());
    }
    return errors;
}

} // namespace code_context
