#include "code_context/session/client_session.hpp"
#include "code_context/session/schema_registry.hpp"

namespace code_context {

const char* to_string(SessionState state) {
    switch (state) {
        case SessionState::Idle: return "idle";
        case SessionState::AwaitingLoadAck: return "awaiting_load_ack";
        case SessionState::AwaitingSelectResponse: return "awaiting_select_response";
        case SessionState::AwaitingWorkResponse: return "awaiting_work_response";
        case SessionState::Done: return "done";
        case SessionState::Closed: return "closed";
    }
    return "unknown";
}

const char* to_string(StageOutcome outcome) {
    switch (outcome) {
        case StageOutcome::Ok: return "ok";
        case StageOutcome::Failed: return "failed";
        case StageOutcome::Skipped: return "skipped";
    }
    return "unknown";
}

namespace {

std::string join(const std::vector<std::string>& items) {
    std::string out;
    for (const auto& item : items) {
        if (!out.empty()) out += "; ";
        out += item;
    }
    return out;
}

} // namespace

ClientSession::ClientSession(std::string client_id, CodebaseContext context, Transport& transport, FileSource& files,
                             std::shared_ptr<spdlog::logger> log)
    : client_id_(std::move(client_id)),
      context_(std::move(context)),
      transport_(transport),
      files_(files),
      log_(std::move(log)) {}

// --- 1. STAGES ---

bool ClientSession::load() {
    if (state_ == SessionState::Closed) return false;
    if (state_ != SessionState::Idle) {
        throw StageOrderError(std::string("load() called in state ") + to_string(state_));
    }

    state_ = SessionState::AwaitingLoadAck;
    log_->info("📤 LOAD: sending snapshot ({} roots, {} notes)", context_.snapshot.size(), context_.notes.size());

    auto response = exchange(make_request(Stage::Load));
    if (!response) return false;
    load_done_ = true;

    auto errors = check_response(Stage::Load, *response);
    if (!errors.empty()) {
        log_->warn("⚠️ LOAD acknowledgement rejected: {}", join(errors));
        return false;
    }
    log_->info("✅ LOAD acknowledged");
    return true;
}

FileChangePlan ClientSession::select(const std::string& task_prompt) {
    if (state_ == SessionState::Closed) return {};
    if (state_ != SessionState::AwaitingLoadAck || !load_done_) {
        throw StageOrderError(std::string("select() called in state ") + to_string(state_) +
                              ", load() must complete first");
    }

    task_prompt_ = task_prompt;
    state_ = SessionState::AwaitingSelectResponse;
    log_->info("📤 SELECT: asking for a change plan");

    auto response = exchange(make_request(Stage::Select));
    if (!response) return {};
    select_done_ = true;

    auto errors = check_response(Stage::Select, *response);
    if (!errors.empty()) {
        log_->warn("⚠️ SELECT response rejected: {}", join(errors));
        plan_ = FileChangePlan{};
        state_ = SessionState::Done;
        return plan_;
    }

    plan_ = response->data.get<FileChangePlan>();
    select_ok_ = true;
    log_->info("✅ SELECT: {} files to change, {} context files", plan_.files.size(),
               plan_.additional_context_files.size());

    gather_file_contents();
    if (plan_.files.empty()) state_ = SessionState::Done;
    return plan_;
}

std::vector<WorkResult> ClientSession::work() {
    std::vector<WorkResult> results;
    if (state_ == SessionState::Closed) return results;
    if (!select_done_) {
        throw StageOrderError(std::string("work() called in state ") + to_string(state_) +
                              ", select() must complete first");
    }
    if (state_ != SessionState::AwaitingSelectResponse) return results;

    state_ = SessionState::AwaitingWorkResponse;

    for (const auto& file : plan_.files) {
        WorkResult result;
        result.file = file;

        const std::string* content = nullptr;
        if (file.operation == FileOperation::Update) {
            auto it = context_.file_contents().find(file.path);
            if (it == context_.file_contents().end()) {
                result.outcome = StageOutcome::Skipped;
                result.error = "content unavailable";
                log_->warn("⏭️ WORK {}: skipped, content could not be read", file.path);
                results.push_back(std::move(result));
                continue;
            }
            content = &it->second;
        }

        SessionRequest request = make_request(Stage::Work);
        request.file_work_prompt = build_file_work_prompt(file.path, file.operation, content);
        log_->info("📤 WORK {} ({})", file.path, to_string(file.operation));

        auto response = exchange(request);
        if (!response) break;

        auto errors = check_response(Stage::Work, *response);
        if (errors.empty()) {
            auto patch = response->data.get<PatchData>();
            if (fs::path(patch.path).lexically_normal() != fs::path(file.path).lexically_normal()) {
                errors.push_back("patch targets '" + patch.path + "', expected '" + file.path + "'");
            } else {
                result.patch = std::move(patch);
            }
        }

        if (errors.empty()) {
            result.outcome = StageOutcome::Ok;
            log_->info("✅ WORK {}: patch received", file.path);
        } else {
            result.outcome = StageOutcome::Failed;
            result.error = join(errors);
            log_->warn("⚠️ WORK {} rejected, moving on: {}", file.path, result.error);
        }
        results.push_back(std::move(result));
    }

    if (state_ != SessionState::Closed) state_ = SessionState::Done;
    return results;
}

SessionSummary ClientSession::run(const std::string& task_prompt) {
    SessionSummary summary;
    summary.load_ok = load();
    if (state_ != SessionState::Closed) {
        summary.plan = select(task_prompt);
        summary.select_ok = select_ok_;
    }
    if (state_ != SessionState::Closed) {
        summary.work = work();
    }
    finish();
    summary.close_code = close_code_;
    summary.close_reason = close_reason_;
    return summary;
}

void ClientSession::finish() {
    if (close_code_) return;
    close_now(CloseCode::NormalClosure, "session complete");
}

// --- 2. EXCHANGE ---

SessionRequest ClientSession::make_request(Stage stage) const {
    SessionRequest request;
    request.client_id = client_id_;
    request.stage = stage;
    request.context = context_;
    if (stage != Stage::Load) request.task_prompt = task_prompt_;
    return request;
}

std::optional<SessionResponse> ClientSession::exchange(const SessionRequest& request) {
    if (close_requested_.load()) {
        log_->info("🛑 Close requested, not sending {}", to_string(request.stage));
        close_now(CloseCode::NormalClosure, "client shutdown");
        return std::nullopt;
    }

    if (!transport_.send_text(request.encode())) {
        mark_closed(CloseCode::AbnormalClosure, "send failed");
        return std::nullopt;
    }

    while (true) {
        InboundFrame frame = transport_.receive();
        if (frame.is_close()) {
            mark_closed(frame.close->code, frame.close->reason);
            return std::nullopt;
        }

        std::string error;
        auto response = SessionResponse::decode(*frame.text, &error);
        if (!response) {
            log_->warn("Dropping undecodable frame: {}", error);
            continue;
        }
        return response;
    }
}

std::vector<std::string> ClientSession::check_response(Stage stage, const SessionResponse& response) const {
    if (response.stage != stage) {
        return {std::string("response stage '") + to_string(response.stage) + "' does not match request stage '" +
                to_string(stage) + "'"};
    }
    if (!response.ok()) {
        return {"server status " + response.status + ": " + response.error_message()};
    }
    return validate_stage_payload(stage, response.data);
}

void ClientSession::gather_file_contents() {
    auto pull = [this](const FileEntry& entry) {
        if (entry.operation == FileOperation::Create) return;
        if (context_.has_file_content(entry.path)) return;

        std::string error;
        auto content = files_.read(entry.path, &error);
        if (!content) {
            log_->warn("⚠️ Could not read {}: {}", entry.path, error);
            return;
        }
        context_.add_file_content(entry.path, std::move(*content));
    };

    for (const auto& entry : plan_.files) pull(entry);
    for (const auto& entry : plan_.additional_context_files) pull(entry);
    log_->debug("Context now carries {} file bodies", context_.file_contents().size());
}

// --- 3. CLOSING ---

void ClientSession::close_now(CloseCode code, const std::string& reason) {
    if (!transport_.send_close(code, reason)) {
        mark_closed(CloseCode::AbnormalClosure, "close failed");
        return;
    }
    // Wait for the peer to echo the close
    while (true) {
        InboundFrame frame = transport_.receive();
        if (frame.is_close()) break;
    }
    mark_closed(code, reason);
}

void ClientSession::mark_closed(CloseCode code, const std::string& reason) {
    if (close_code_) return;
    close_code_ = code;
    close_reason_ = reason;
    if (state_ != SessionState::Done) state_ = SessionState::Closed;
    log_->info("🔌 Conversation closed: {} {}", to_string(code), reason);
}

} // namespace code_context
