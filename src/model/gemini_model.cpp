#include "code_context/model/gemini_model.hpp"
#include <cpr/cpr.h>
#include <thread>

namespace code_context {

using json = nlohmann::json;

GeminiModel::GeminiModel(std::shared_ptr<KeyManager> keys, std::shared_ptr<spdlog::logger> log, GeminiOptions options)
    : keys_(std::move(keys)), log_(std::move(log)), options_(std::move(options)) {}

std::string GeminiModel::name() const {
    return keys_->get_current_model();
}

std::string GeminiModel::endpoint_url(const std::string& action) const {
    return options_.base_url + keys_->get_current_model() + ":" + action + "?key=" + keys_->get_current_key();
}

json GeminiModel::build_payload(const std::vector<std::string>& parts, const GenerateOptions& options) {
    json j_parts = json::array();
    for (const auto& p : parts) {
        j_parts.push_back({{"text", p}});
    }

    json generation = {{"temperature", options.temperature}};
    if (!options.response_mime_type.empty()) {
        generation["responseMimeType"] = options.response_mime_type;
    }

    return {
        {"contents", json::array({{{"role", "user"}, {"parts", j_parts}}})},
        {"generationConfig", generation}
    };
}

std::string GeminiModel::parse_reply(const std::string& body) {
    json j = json::parse(body, nullptr, false);
    if (j.is_discarded() || !j.is_object()) {
        throw ModelError("model reply is not JSON");
    }
    if (!j.contains("candidates") || !j["candidates"].is_array()) {
        throw ModelError("model reply has no candidates");
    }

    std::string text;
    for (const auto& candidate : j["candidates"]) {
        if (!candidate.contains("content")) continue;
        const auto& content = candidate["content"];
        if (!content.contains("parts") || !content["parts"].is_array()) continue;
        for (const auto& part : content["parts"]) {
            if (part.contains("text") && part["text"].is_string()) {
                text += part["text"].get<std::string>();
            }
        }
        text += "\n";
    }

    if (text.find_first_not_of(" \t\r\n") == std::string::npos) {
        throw ModelError("model returned an empty response");
    }
    return text;
}

std::string GeminiModel::generate(const std::vector<std::string>& parts, const GenerateOptions& options) {
    if (parts.empty()) {
        throw ModelError("no prompt parts");
    }

    const std::string payload = build_payload(parts, options).dump(-1, ' ', false, json::error_handler_t::replace);
    cpr::Response r;

    for (int i = 0; i < options_.max_retries; ++i) {
        if (keys_->get_current_key().empty()) {
            throw ModelError("no active API key");
        }

        // Rebuilt every attempt so a rotated key is picked up
        r = cpr::Post(cpr::Url{endpoint_url("generateContent")},
                      cpr::Body{payload},
                      cpr::Header{{"Content-Type", "application/json"}},
                      cpr::Timeout{options_.timeout});

        if (r.status_code == 200) break;

        if (r.status_code == 429 || r.status_code == 503) {
            log_->warn("⚠️ API {} ({}). Rotating key and cooling down (Attempt {}/{})...",
                       r.status_code, (r.status_code == 429 ? "Quota" : "Overload"), i + 1, options_.max_retries);
            keys_->report_rate_limit();
            std::this_thread::sleep_for(options_.backoff + std::chrono::milliseconds(i * 1000));
            continue;
        }

        if (r.status_code == 0) {
            throw ModelError("model request failed: " + r.error.message);
        }

        log_->error("❌ Fatal API Error [{}]: {}", r.status_code, r.text);
        throw ModelError("model request failed with HTTP " + std::to_string(r.status_code));
    }

    if (r.status_code != 200) {
        throw ModelError("model throttled after " + std::to_string(options_.max_retries) + " attempts");
    }

    return parse_reply(r.text);
}

} // namespace code_context
