#pragma once
#include <cstddef>
#include <deque>
#include <mutex>
#include <string>
#include <nlohmann/json.hpp>

namespace code_context {

struct InteractionLog {
    long long timestamp;        // ms since epoch
    std::string client_id;
    std::string stage;
    std::string status;
    std::string prompt_preview;
    std::string ai_response;
    size_t prompt_bytes;
    double duration_ms;
};

// Recent model interactions, shared by every connection of a server.
class LogManager {
public:
    explicit LogManager(size_t capacity = 50) : capacity_(capacity) {}

    void add_log(const InteractionLog& log) {
        std::lock_guard<std::mutex> lock(mtx_);
        logs_.push_back(log);
        while (logs_.size() > capacity_) {
            logs_.pop_front();
        }
    }

    size_t size() const {
        std::lock_guard<std::mutex> lock(mtx_);
        return logs_.size();
    }

    nlohmann::json get_logs_json() const {
        std::lock_guard<std::mutex> lock(mtx_);
        nlohmann::json j_list = nlohmann::json::array();
        // Newest first
        for (auto it = logs_.rbegin(); it != logs_.rend(); ++it) {
            j_list.push_back({
                {"timestamp", it->timestamp},
                {"client_id", it->client_id},
                {"stage", it->stage},
                {"status", it->status},
                {"prompt_preview", it->prompt_preview},
                {"ai_response", it->ai_response},
                {"prompt_bytes", it->prompt_bytes},
                {"duration_ms", it->duration_ms}
            });
        }
        return j_list;
    }

private:
    size_t capacity_;
    std::deque<InteractionLog> logs_;
    mutable std::mutex mtx_;
};

} // namespace code_context
