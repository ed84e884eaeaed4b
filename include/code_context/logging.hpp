#pragma once
#include <memory>
#include <string>
#include <spdlog/spdlog.h>

namespace code_context {

struct LogSettings {
    spdlog::level::level_enum level = spdlog::level::info;
    std::string pattern = "[%H:%M:%S] [%^%l%$] [%n] %v";
};

// Builds a named logger on its own stderr sink. The logger is not
// registered with spdlog's global registry; callers hand it to the
// components that need it.
std::shared_ptr<spdlog::logger> make_logger(const std::string& name, const LogSettings& settings);

// Logger that discards everything, for tests and optional collaborators.
std::shared_ptr<spdlog::logger> make_null_logger(const std::string& name);

// Resolves the effective level: CTX_LOG wins over the configured values.
// An unrecognised CTX_LOG value falls back to info and fills `warning`.
spdlog::level::level_enum resolve_log_level(const std::string& configured, bool debug,
                                            std::string* warning = nullptr);

} // namespace code_context
