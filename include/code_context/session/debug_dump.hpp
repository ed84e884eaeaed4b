#pragma once
#include <filesystem>
#include <future>
#include <memory>
#include <string>
#include <spdlog/spdlog.h>

namespace code_context {

// Writes `payload` to `path` on a detached thread. The future reports the
// outcome (an exception on failure); nothing on the request path waits on
// it. Failures are also logged.
std::future<void> spawn_debug_dump(std::filesystem::path path, std::string payload,
                                   std::shared_ptr<spdlog::logger> log);

} // namespace code_context
