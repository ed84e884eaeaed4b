#pragma once
#include <chrono>
#include <memory>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>
#include "code_context/KeyManager.hpp"
#include "code_context/model/model_backend.hpp"

namespace code_context {

struct GeminiOptions {
    std::string base_url = "https://generativelanguage.googleapis.com/v1beta/models/";
    int max_retries = 4;
    std::chrono::milliseconds backoff{2000};
    std::chrono::milliseconds timeout{120000};
};

// Gemini generateContent over HTTPS. Keys rotate through the KeyManager on
// 429 (quota) and 503 (overload).
class GeminiModel : public ModelBackend {
public:
    GeminiModel(std::shared_ptr<KeyManager> keys, std::shared_ptr<spdlog::logger> log, GeminiOptions options = {});

    std::string generate(const std::vector<std::string>& parts, const GenerateOptions& options) override;
    std::string name() const override;

    static nlohmann::json build_payload(const std::vector<std::string>& parts, const GenerateOptions& options);

    // Text of every candidate, one per line. Throws ModelError when the body
    // is not a generateContent reply or carries no text.
    static std::string parse_reply(const std::string& body);

private:
    std::shared_ptr<KeyManager> keys_;
    std::shared_ptr<spdlog::logger> log_;
    GeminiOptions options_;

    std::string endpoint_url(const std::string& action) const;
};

} // namespace code_context
