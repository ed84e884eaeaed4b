#include "code_context/logging.hpp"
#include <cstdlib>
#include <spdlog/sinks/null_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>

namespace code_context {

std::shared_ptr<spdlog::logger> make_logger(const std::string& name, const LogSettings& settings) {
    auto sink = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
    auto logger = std::make_shared<spdlog::logger>(name, std::move(sink));
    logger->set_pattern(settings.pattern);
    logger->set_level(settings.level);
    logger->flush_on(spdlog::level::warn);
    return logger;
}

std::shared_ptr<spdlog::logger> make_null_logger(const std::string& name) {
    return std::make_shared<spdlog::logger>(name, std::make_shared<spdlog::sinks::null_sink_mt>());
}

spdlog::level::level_enum resolve_log_level(const std::string& configured, bool debug, std::string* warning) {
    auto from_name = [](const std::string& name, spdlog::level::level_enum fallback) {
        if (name == "trace") return spdlog::level::trace;
        if (name == "debug") return spdlog::level::debug;
        if (name == "info") return spdlog::level::info;
        if (name == "warn") return spdlog::level::warn;
        if (name == "error") return spdlog::level::err;
        return fallback;
    };

    // CTX_LOG overrides both the config file and the debug switch
    if (const char* env = std::getenv("CTX_LOG")) {
        std::string value(env);
        auto level = from_name(value, spdlog::level::off);
        if (level == spdlog::level::off) {
            if (warning) *warning = "Invalid CTX_LOG level: " + value;
            return spdlog::level::info;
        }
        return level;
    }

    if (debug) return spdlog::level::debug;
    return from_name(configured, spdlog::level::info);
}

} // namespace code_context
