#pragma once
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <memory>
#include <shared_mutex>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

namespace code_context {

class KeyManager {
private:
    struct ApiKey {
        std::string key;
        bool is_active = true;
        int fail_count = 0;
    };

    std::vector<ApiKey> key_pool;
    mutable std::shared_mutex pool_mutex;
    size_t current_index = 0;
    std::string primary_model;
    std::string keys_file;
    std::shared_ptr<spdlog::logger> log_;

    bool load_pool_file(const std::string& path) {
        std::ifstream f(path);
        if (!f.is_open()) return false;

        try {
            auto j = nlohmann::json::parse(f);
            key_pool.clear();
            for (auto& k : j.at("keys")) {
                key_pool.push_back({k.get<std::string>(), true, 0});
            }
            primary_model = j.value("primary", primary_model);
            log_->info("🛰️ Key pool loaded from {}: {} keys, model {}", path, key_pool.size(), primary_model);
            return true;
        } catch (const std::exception& e) {
            log_->error("💥 Failed to parse key pool {}: {}", path, e.what());
            return false;
        }
    }

    bool load_secret_file() {
        const char* home = std::getenv("HOME");
        if (!home) return false;
        std::filesystem::path secret = std::filesystem::path(home) / ".secrets" / "GCP_AI_API_KEY";
        std::ifstream f(secret);
        if (!f.is_open()) return false;

        std::string key;
        std::getline(f, key);
        while (!key.empty() && (key.back() == '\r' || key.back() == ' ')) key.pop_back();
        if (key.empty()) return false;

        key_pool.push_back({key, true, 0});
        log_->info("🛰️ Using API key from {}", secret.string());
        return true;
    }

public:
    // `file` empty: keys.json in the usual build-tree locations.
    KeyManager(std::shared_ptr<spdlog::logger> log, std::string file = "", std::string model = "gemini-2.0-flash")
        : primary_model(std::move(model)), keys_file(std::move(file)), log_(std::move(log)) {
        refresh_key_pool();
    }

    // Fixed pool, nothing read from disk.
    KeyManager(std::vector<std::string> keys, std::string model, std::shared_ptr<spdlog::logger> log)
        : primary_model(std::move(model)), log_(std::move(log)) {
        for (auto& k : keys) key_pool.push_back({std::move(k), true, 0});
    }

    void refresh_key_pool() {
        std::unique_lock lock(pool_mutex);
        key_pool.clear();
        current_index = 0;

        std::vector<std::string> search_paths;
        if (!keys_file.empty()) {
            search_paths.push_back(keys_file);
        } else {
            search_paths = {
                "keys.json",        // 1. Current Working Directory
                "../keys.json",     // 2. Parent Directory
                "build/keys.json",  // 3. Build Directory
            };
        }

        for (const auto& path : search_paths) {
            if (load_pool_file(path)) return;
        }

        if (load_secret_file()) return;

        if (const char* env = std::getenv("GEMINI_API_KEY"); env && *env) {
            key_pool.push_back({env, true, 0});
            log_->info("🛰️ Using API key from GEMINI_API_KEY");
            return;
        }

        log_->error("🚨 No API key found (keys.json, ~/.secrets/GCP_AI_API_KEY, GEMINI_API_KEY)");
    }

    size_t get_active_key_count() const {
        std::shared_lock lock(pool_mutex);
        size_t count = 0;
        for (const auto& k : key_pool) {
            if (k.is_active) count++;
        }
        return count;
    }

    // Next active key from the rotation point; empty when none is left.
    std::string get_current_key() const {
        std::shared_lock lock(pool_mutex);
        for (size_t i = 0; i < key_pool.size(); ++i) {
            const auto& k = key_pool[(current_index + i) % key_pool.size()];
            if (k.is_active) return k.key;
        }
        return "";
    }

    std::string get_current_model() const {
        std::shared_lock lock(pool_mutex);
        return primary_model;
    }

    void report_rate_limit() {
        std::unique_lock lock(pool_mutex);
        if (key_pool.empty()) return;

        auto& current = key_pool[current_index % key_pool.size()];
        current.fail_count++;
        if (current.fail_count > 2) {
            current.is_active = false;
            log_->warn("⚠️ Key #{} Decommissioned", current_index);
        }
        current_index = (current_index + 1) % key_pool.size();
    }
};

} // namespace code_context
