#include "code_context/session/debug_dump.hpp"
#include <fstream>
#include <stdexcept>
#include <thread>

namespace code_context {

std::future<void> spawn_debug_dump(std::filesystem::path path, std::string payload,
                                   std::shared_ptr<spdlog::logger> log) {
    std::promise<void> done;
    std::future<void> result = done.get_future();

    std::thread([path = std::move(path), payload = std::move(payload), log = std::move(log),
                 done = std::move(done)]() mutable {
        try {
            std::ofstream out(path, std::ios::out | std::ios::trunc | std::ios::binary);
            if (!out.is_open()) {
                throw std::runtime_error("cannot open " + path.string());
            }
            out << payload;
            out.flush();
            if (!out) {
                throw std::runtime_error("short write to " + path.string());
            }
            log->debug("💾 Context dumped to {} ({} bytes)", path.string(), payload.size());
            done.set_value();
        } catch (const std::exception& e) {
            log->warn("⚠️ Debug dump failed: {}", e.what());
            done.set_exception(std::current_exception());
        }
    }).detach();

    return result;
}

} // namespace code_context
