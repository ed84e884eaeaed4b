#pragma once
#include <cstddef>
#include <filesystem>
#include <stdexcept>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

namespace code_context {

namespace fs = std::filesystem;

class ConfigError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

struct ClientConfig {
    std::string server_address = "localhost:50051";
    std::string ignore_file = ".ctxignore";
    std::string client_id;                 // empty: derived from host name and pid
    bool include_default_excludes = false;
    std::size_t max_file_bytes = 512 * 1024;
    std::string log_level = "info";
    bool debug = false;

    static ClientConfig from_json(const nlohmann::json& j);

    // Looks in <root>/.code_context/config.json, then <root>/config.json.
    // Missing files give the defaults. A malformed .code_context file throws
    // ConfigError; a root config.json that is not a valid client config is
    // ignored and `skipped` says why.
    static ClientConfig load(const fs::path& workspace_root, std::string* skipped = nullptr);
};

struct ServerConfig {
    std::string listen_address = "0.0.0.0:50051";
    int health_port = 8000;                // 0 disables the HTTP health endpoint
    std::string model = "gemini-2.0-flash";
    double temperature = 0.8;
    std::string keys_file;                 // empty: KeyManager search paths
    std::string debug_snapshot_path = "code.ctx";
    std::string log_level = "info";
    bool debug = false;

    static ServerConfig from_json(const nlohmann::json& j);

    // First server.json found in ".", "..", "build".
    static ServerConfig load();
};

// Default client id: "<hostname>-<pid>".
std::string default_client_id();

} // namespace code_context
