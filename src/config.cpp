#include "code_context/config.hpp"
#include <fstream>
#include <unistd.h>

namespace code_context {

using json = nlohmann::json;

namespace {

json read_json_file(const fs::path& path) {
    std::ifstream f(path);
    if (!f.is_open()) {
        throw ConfigError("Could not open config file: " + path.string());
    }
    try {
        return json::parse(f);
    } catch (const json::parse_error& e) {
        throw ConfigError("JSON Parse Error in " + path.string() + ": " + e.what());
    }
}

} // namespace

ClientConfig ClientConfig::from_json(const json& j) {
    if (!j.is_object()) throw ConfigError("client config must be a JSON object");

    ClientConfig cfg;
    try {
        cfg.server_address = j.value("server_address", cfg.server_address);
        cfg.ignore_file = j.value("ignore_file", cfg.ignore_file);
        cfg.client_id = j.value("client_id", cfg.client_id);
        cfg.include_default_excludes = j.value("include_default_excludes", cfg.include_default_excludes);
        long long max_bytes = j.value("max_file_bytes", static_cast<long long>(cfg.max_file_bytes));
        if (max_bytes < 0) {
            throw ConfigError("client config: max_file_bytes must not be negative");
        }
        cfg.max_file_bytes = static_cast<std::size_t>(max_bytes);
        cfg.log_level = j.value("log_level", cfg.log_level);
        cfg.debug = j.value("debug", cfg.debug);
    } catch (const json::type_error& e) {
        throw ConfigError(std::string("client config: ") + e.what());
    }
    return cfg;
}

ClientConfig ClientConfig::load(const fs::path& workspace_root, std::string* skipped) {
    fs::path own_path = workspace_root / ".code_context" / "config.json";
    if (fs::exists(own_path)) {
        return from_json(read_json_file(own_path));
    }

    // Fallback to root. That file may belong to the project itself, so one
    // that does not read as a client config is passed over.
    fs::path root_path = workspace_root / "config.json";
    if (!fs::exists(root_path)) return ClientConfig{};
    try {
        return from_json(read_json_file(root_path));
    } catch (const ConfigError& e) {
        if (skipped) *skipped = e.what();
        return ClientConfig{};
    }
}

ServerConfig ServerConfig::from_json(const json& j) {
    if (!j.is_object()) throw ConfigError("server config must be a JSON object");

    ServerConfig cfg;
    try {
        cfg.listen_address = j.value("listen_address", cfg.listen_address);
        cfg.health_port = j.value("health_port", cfg.health_port);
        cfg.model = j.value("model", cfg.model);
        cfg.temperature = j.value("temperature", cfg.temperature);
        cfg.keys_file = j.value("keys_file", cfg.keys_file);
        cfg.debug_snapshot_path = j.value("debug_snapshot_path", cfg.debug_snapshot_path);
        cfg.log_level = j.value("log_level", cfg.log_level);
        cfg.debug = j.value("debug", cfg.debug);
    } catch (const json::type_error& e) {
        throw ConfigError(std::string("server config: ") + e.what());
    }
    if (cfg.health_port < 0 || cfg.health_port > 65535) {
        throw ConfigError("server config: health_port out of range");
    }
    return cfg;
}

ServerConfig ServerConfig::load() {
    const std::vector<std::string> search_paths = {
        "server.json",        // 1. Current Working Directory
        "../server.json",     // 2. Parent Directory
        "build/server.json"   // 3. Build Directory
    };
    for (const auto& p : search_paths) {
        if (fs::exists(p)) return from_json(read_json_file(p));
    }
    return ServerConfig{};
}

std::string default_client_id() {
    char host[256] = {0};
    if (gethostname(host, sizeof(host) - 1) != 0) {
        return "client-" + std::to_string(getpid());
    }
    return std::string(host) + "-" + std::to_string(getpid());
}

} // namespace code_context
