#pragma once
#include <future>
#include <memory>
#include <optional>
#include <string>
#include <vector>
#include <spdlog/spdlog.h>
#include "code_context/LogManager.hpp"
#include "code_context/model/model_backend.hpp"
#include "code_context/session/protocol.hpp"
#include "code_context/session/transport.hpp"

namespace code_context {

struct ServerSessionOptions {
    GenerateOptions generate;
    std::string debug_snapshot_path;  // empty: no dump on LOAD
};

/**
 * Server half of one conversation. Reads request frames until the client
 * closes, forwarding each stage to the model and replying with the
 * validated payload.
 *
 * - Undecodable frames are logged and dropped.
 * - SELECT/WORK before LOAD (or WORK before SELECT) is answered with
 *   stage_out_of_order; nothing reaches the model.
 * - A model failure closes the conversation with INTERNAL_SERVER_ERROR.
 */
class ServerSession {
public:
    ServerSession(Transport& transport, ModelBackend& model, std::shared_ptr<LogManager> journal,
                  ServerSessionOptions options, std::shared_ptr<spdlog::logger> log);

    // Runs until the conversation ends and returns how it ended.
    CloseCode run();

    // Stage instructions, each embedding the stage's response schema.
    static std::vector<std::string> build_instructions(const SessionRequest& request);

    // [serialized context, instructions...]
    static std::vector<std::string> build_parts(const SessionRequest& request);

    // Outcome of the most recent debug dump, if one was started.
    std::optional<std::future<void>> take_debug_dump();

private:
    Transport& transport_;
    ModelBackend& model_;
    std::shared_ptr<LogManager> journal_;
    ServerSessionOptions options_;
    std::shared_ptr<spdlog::logger> log_;

    std::optional<Stage> reached_;
    std::optional<std::future<void>> debug_dump_;

    // false when the conversation has to end (model failure or dead peer).
    bool handle(const SessionRequest& request, CloseCode& ended_with);

    std::optional<std::string> order_violation(Stage stage) const;
    void record(const SessionRequest& request, const std::vector<std::string>& parts, const std::string& status,
                const std::string& reply, double duration_ms);
};

} // namespace code_context
