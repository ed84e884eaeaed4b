#pragma once
#include <atomic>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>
#include <spdlog/spdlog.h>
#include "code_context/session/protocol.hpp"
#include "code_context/session/transport.hpp"
#include "code_context/snapshot/snapshot_types.hpp"
#include "code_context/tools/workspace_reader.hpp"

namespace code_context {

class StageOrderError : public std::logic_error {
public:
    using std::logic_error::logic_error;
};

enum class SessionState {
    Idle,
    AwaitingLoadAck,
    AwaitingSelectResponse,
    AwaitingWorkResponse,
    Done,
    Closed,
};

const char* to_string(SessionState state);

enum class StageOutcome { Ok, Failed, Skipped };

const char* to_string(StageOutcome outcome);

struct WorkResult {
    FileEntry file;
    StageOutcome outcome = StageOutcome::Failed;
    std::optional<PatchData> patch;
    std::string error;
};

struct SessionSummary {
    bool load_ok = false;
    bool select_ok = false;
    FileChangePlan plan;
    std::vector<WorkResult> work;
    std::optional<CloseCode> close_code;
    std::string close_reason;
};

/**
 * Client half of the LOAD -> SELECT -> WORK conversation. Each stage method
 * sends one request (WORK: one per planned file) and blocks on its answer.
 *
 * The state only moves forward. A stage method called out of order throws
 * StageOrderError; once the conversation is closed they return without
 * sending anything.
 */
class ClientSession {
public:
    ClientSession(std::string client_id, CodebaseContext context, Transport& transport, FileSource& files,
                  std::shared_ptr<spdlog::logger> log);

    // Sends the snapshot. false when the acknowledgement did not validate
    // or the conversation ended; the session advances either way.
    bool load();

    // Asks for the change plan, then pulls every non-create path into the
    // context. A plan that fails validation is treated as empty.
    FileChangePlan select(const std::string& task_prompt);

    // One WORK exchange per entry of the plan's `files`, in plan order.
    std::vector<WorkResult> work();

    // Whole conversation, ending with a normal close.
    SessionSummary run(const std::string& task_prompt);

    // Sends NORMAL_CLOSURE unless already closed, and waits for the echo.
    void finish();

    // Safe from a signal handler: takes effect before the next request.
    void request_close() { close_requested_.store(true); }

    SessionState state() const { return state_; }
    const CodebaseContext& context() const { return context_; }
    const FileChangePlan& plan() const { return plan_; }
    std::optional<CloseCode> close_code() const { return close_code_; }
    const std::string& close_reason() const { return close_reason_; }

private:
    std::string client_id_;
    CodebaseContext context_;
    Transport& transport_;
    FileSource& files_;
    std::shared_ptr<spdlog::logger> log_;

    SessionState state_ = SessionState::Idle;
    bool load_done_ = false;
    bool select_done_ = false;
    bool select_ok_ = false;
    FileChangePlan plan_;
    std::string task_prompt_;
    std::atomic<bool> close_requested_{false};
    std::optional<CloseCode> close_code_;
    std::string close_reason_;

    SessionRequest make_request(Stage stage) const;
    std::optional<SessionResponse> exchange(const SessionRequest& request);
    std::vector<std::string> check_response(Stage stage, const SessionResponse& response) const;
    void gather_file_contents();
    void close_now(CloseCode code, const std::string& reason);
    void mark_closed(CloseCode code, const std::string& reason);
};

} // namespace code_context
