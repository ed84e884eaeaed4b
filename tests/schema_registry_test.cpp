#include <gtest/gtest.h>
#include "code_context/session/schema_registry.hpp"

using namespace code_context;
using json = nlohmann::json;

namespace {

// Every object schema is closed and lists all of its properties as required.
void expect_closed_objects(const json& schema, const std::string& where) {
    EXPECT_FALSE(schema.contains("$ref")) << where;
    if (schema.value("type", "") == "object") {
        EXPECT_EQ(schema["additionalProperties"], false) << where;
        ASSERT_TRUE(schema.contains("properties")) << where;
        ASSERT_TRUE(schema.contains("required")) << where;
        EXPECT_EQ(schema["required"].size(), schema["properties"].size()) << where;
        for (const auto& [name, prop] : schema["properties"].items()) {
            expect_closed_objects(prop, where + "." + name);
        }
    }
    if (schema.contains("items")) {
        expect_closed_objects(schema["items"], where + "[]");
    }
}

json valid_plan() {
    return {
        {"files", {{{"path", "a.go"}, {"operation", 1}, {"reason", "new handler"}},
                   {{"path", "b.go"}, {"operation", 0}, {"reason", "wire it"}}}},
        {"additionalContextFiles", {{{"path", "c.go"}, {"operation", 0}, {"reason", "types"}}}}
    };
}

} // namespace

TEST(SchemaRegistry, SchemasAreClosedAndSelfContained) {
    for (Stage s : {Stage::Load, Stage::Select, Stage::Work}) {
        expect_closed_objects(schema_for(s), to_string(s));
    }
}

TEST(SchemaRegistry, InstructionTextEmbedsFieldNames) {
    const std::string text = instruction_text(Stage::Select);
    EXPECT_NE(text.find("additionalContextFiles"), std::string::npos);
    EXPECT_NE(text.find("\"operation\""), std::string::npos);
    EXPECT_EQ(text.find("$ref"), std::string::npos);
    EXPECT_EQ(json::parse(text), schema_for(Stage::Select));
}

TEST(SchemaRegistry, AcceptsValidPayloads) {
    EXPECT_TRUE(validate_stage_payload(Stage::Load, {{"stage", "load"}, {"status", "ok"}}).empty());
    EXPECT_TRUE(validate_stage_payload(Stage::Select, valid_plan()).empty());
    EXPECT_TRUE(validate_stage_payload(Stage::Work,
                                       {{"path", "a.go"}, {"patch", "--- a/a.go\n+++ b/a.go\n"}, {"summary", "s"}})
                    .empty());
}

TEST(SchemaRegistry, ReportsMissingRequiredProperty) {
    auto errors = validate(schema_for(Stage::Load), {{"stage", "load"}});
    ASSERT_EQ(errors.size(), 1u);
    EXPECT_NE(errors[0].find("status"), std::string::npos);
}

TEST(SchemaRegistry, RejectsUndeclaredProperty) {
    auto errors = validate(schema_for(Stage::Load), {{"stage", "load"}, {"status", "ok"}, {"extra", 1}});
    ASSERT_EQ(errors.size(), 1u);
    EXPECT_NE(errors[0].find("extra"), std::string::npos);
}

TEST(SchemaRegistry, RejectsWrongTypes) {
    json plan = valid_plan();
    plan["files"][0]["path"] = 12;
    auto errors = validate(schema_for(Stage::Select), plan);
    ASSERT_EQ(errors.size(), 1u);
    EXPECT_NE(errors[0].find("$.files[0].path"), std::string::npos);

    EXPECT_FALSE(validate(schema_for(Stage::Work), json::array()).empty());
    EXPECT_FALSE(validate(schema_for(Stage::Select), {{"files", "a.go"}, {"additionalContextFiles", json::array()}})
                     .empty());
}

TEST(SchemaRegistry, RejectsUnknownOperation) {
    json plan = valid_plan();
    plan["files"][1]["operation"] = 2;
    EXPECT_FALSE(validate(schema_for(Stage::Select), plan).empty());

    plan["files"][1]["operation"] = 0.5;
    EXPECT_FALSE(validate(schema_for(Stage::Select), plan).empty());
}

TEST(SchemaRegistry, RejectsPathListedTwice) {
    json plan = valid_plan();
    plan["additionalContextFiles"].push_back({{"path", "b.go"}, {"operation", 0}, {"reason", "dup"}});
    EXPECT_TRUE(validate(schema_for(Stage::Select), plan).empty());

    auto errors = validate_stage_payload(Stage::Select, plan);
    ASSERT_EQ(errors.size(), 1u);
    EXPECT_NE(errors[0].find("b.go"), std::string::npos);
}

TEST(SchemaRegistry, NegativeOperationIsAccepted) {
    json plan = {
        {"files", {{{"path", "old.go"}, {"operation", -1}, {"reason", "unused"}}}},
        {"additionalContextFiles", json::array()}
    };
    EXPECT_TRUE(validate_stage_payload(Stage::Select, plan).empty());
}
