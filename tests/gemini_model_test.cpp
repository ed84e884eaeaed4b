#include <gtest/gtest.h>
#include "code_context/KeyManager.hpp"
#include "code_context/logging.hpp"
#include "code_context/model/gemini_model.hpp"
#include "temp_dir.hpp"

using namespace code_context;
using code_context::fakes::TempDir;
using json = nlohmann::json;

TEST(GeminiModel, PayloadCarriesPartsInOrder) {
    GenerateOptions options;
    options.temperature = 0.3;

    json payload = GeminiModel::build_payload({"{\"snapshot\":{}}", "Respond with JSON only"}, options);
    ASSERT_EQ(payload["contents"].size(), 1u);
    EXPECT_EQ(payload["contents"][0]["role"], "user");
    EXPECT_EQ(payload["contents"][0]["parts"][0]["text"], "{\"snapshot\":{}}");
    EXPECT_EQ(payload["contents"][0]["parts"][1]["text"], "Respond with JSON only");
    EXPECT_DOUBLE_EQ(payload["generationConfig"]["temperature"].get<double>(), 0.3);
    EXPECT_EQ(payload["generationConfig"]["responseMimeType"], "application/json");
}

TEST(GeminiModel, ParseReplyJoinsCandidateText) {
    const std::string body = R"({"candidates": [{"content": {"role": "model",
        "parts": [{"text": "{\"stage\":"}, {"text": "\"load\"}"}]}}]})";
    EXPECT_EQ(GeminiModel::parse_reply(body), "{\"stage\":\"load\"}\n");
}

TEST(GeminiModel, ParseReplyRejectsEmptyAndMalformedBodies) {
    EXPECT_THROW(GeminiModel::parse_reply("<html>502</html>"), ModelError);
    EXPECT_THROW(GeminiModel::parse_reply(R"({"error":{"code":400}})"), ModelError);
    EXPECT_THROW(GeminiModel::parse_reply(R"({"candidates":[{"finishReason":"SAFETY"}]})"), ModelError);
}

TEST(GeminiModel, NoKeysFailsWithoutRequest) {
    auto keys = std::make_shared<KeyManager>(std::vector<std::string>{}, "gemini-2.0-flash",
                                             make_null_logger("keys"));
    GeminiModel model(keys, make_null_logger("gemini"));
    EXPECT_THROW(model.generate({"context", "instructions"}, {}), ModelError);
}

TEST(GeminiModel, UnreachableEndpointIsModelError) {
    auto keys = std::make_shared<KeyManager>(std::vector<std::string>{"test-key"}, "gemini-2.0-flash",
                                             make_null_logger("keys"));
    GeminiOptions options;
    options.base_url = "http://127.0.0.1:1/v1beta/models/";
    options.timeout = std::chrono::milliseconds(2000);
    GeminiModel model(keys, make_null_logger("gemini"), options);

    EXPECT_EQ(model.name(), "gemini-2.0-flash");
    EXPECT_THROW(model.generate({"context"}, {}), ModelError);
}

TEST(KeyManager, RotatesAndDecommissions) {
    KeyManager keys({"k1", "k2"}, "gemini-2.0-flash", make_null_logger("keys"));
    EXPECT_EQ(keys.get_active_key_count(), 2u);
    EXPECT_EQ(keys.get_current_key(), "k1");

    keys.report_rate_limit();
    EXPECT_EQ(keys.get_current_key(), "k2");

    // Third strike on k1 takes it out of the rotation
    for (int i = 0; i < 4; ++i) keys.report_rate_limit();
    EXPECT_EQ(keys.get_active_key_count(), 1u);
    EXPECT_EQ(keys.get_current_key(), "k2");

    keys.report_rate_limit();
    EXPECT_EQ(keys.get_active_key_count(), 0u);
    EXPECT_EQ(keys.get_current_key(), "");
}

TEST(KeyManager, LoadsPoolFile) {
    TempDir dir("keys");
    auto file = dir.write("keys.json", R"({"keys": ["alpha", "beta"], "primary": "gemini-1.5-pro"})");

    KeyManager keys(make_null_logger("keys"), file.string());
    EXPECT_EQ(keys.get_active_key_count(), 2u);
    EXPECT_EQ(keys.get_current_key(), "alpha");
    EXPECT_EQ(keys.get_current_model(), "gemini-1.5-pro");
}
