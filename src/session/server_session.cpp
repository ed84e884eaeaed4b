#include "code_context/session/server_session.hpp"
#include <chrono>
#include "code_context/session/debug_dump.hpp"
#include "code_context/session/schema_registry.hpp"

namespace code_context {

namespace {

std::string utf8_safe_substr(const std::string& str, size_t length) {
    if (str.length() <= length) return str;
    std::string sub = str.substr(0, length);
    while (!sub.empty()) {
        unsigned char c = static_cast<unsigned char>(sub.back());
        if (c < 0x80) break;
        if (c >= 0xC0) { sub.pop_back(); break; }
        sub.pop_back();
    }
    return sub;
}

std::string join(const std::vector<std::string>& items) {
    std::string out;
    for (const auto& item : items) {
        if (!out.empty()) out += "; ";
        out += item;
    }
    return out;
}

std::string task_line(const std::string& task_prompt) {
    return "You are a senior software engineer and system architect. The codebase context above describes the "
           "project. This is the change requested: ``" + task_prompt + "``.";
}

} // namespace

ServerSession::ServerSession(Transport& transport, ModelBackend& model, std::shared_ptr<LogManager> journal,
                             ServerSessionOptions options, std::shared_ptr<spdlog::logger> log)
    : transport_(transport),
      model_(model),
      journal_(std::move(journal)),
      options_(std::move(options)),
      log_(std::move(log)) {}

// --- 1. PROMPTS ---

std::vector<std::string> ServerSession::build_instructions(const SessionRequest& request) {
    const std::string schema = instruction_text(request.stage);

    switch (request.stage) {
        case Stage::Load:
            return {
                "Acknowledge the codebase context above and respond with stage=load and status=ok.",
                "Respond with JSON only, using this JSON schema:\n" + schema,
            };
        case Stage::Select:
            return {
                task_line(request.task_prompt),
                "First list the files that must be updated, created or removed to implement the change, in the "
                "`files` array. Set `operation` to 0 for an update, 1 for a create and -1 for a remove.",
                "Then list the files whose content would help to make the change without being changed "
                "themselves, in the `additionalContextFiles` array. A path belongs to one of the two arrays only.",
                "Respond with JSON only, using this JSON schema:\n" + schema,
            };
        case Stage::Work:
            return {
                task_line(request.task_prompt),
                "Keep the change focused on the request. Do not touch unrelated code.",
                "Respond with a unified diff for the file below only, wrapped in JSON using this JSON schema:\n" +
                    schema,
                "Return the changes this file needs to implement the request:\n\n" + request.file_work_prompt,
            };
    }
    return {};
}

std::vector<std::string> ServerSession::build_parts(const SessionRequest& request) {
    std::vector<std::string> parts;
    parts.push_back(safe_dump(request.context.to_json()));
    for (auto& instruction : build_instructions(request)) {
        parts.push_back(std::move(instruction));
    }
    return parts;
}

// --- 2. CONVERSATION LOOP ---

CloseCode ServerSession::run() {
    log_->info("🔗 Conversation opened");

    while (true) {
        InboundFrame frame = transport_.receive();

        if (frame.is_close()) {
            const CloseFrame& close = *frame.close;
            log_->info("🔌 Client closed: {} {}", to_string(close.code), close.reason);
            if (close.code != CloseCode::AbnormalClosure) {
                transport_.send_close(close.code, close.reason);
            }
            return close.code;
        }

        std::string error;
        auto request = SessionRequest::decode(*frame.text, &error);
        if (!request) {
            log_->warn("Dropping undecodable frame: {}", error);
            continue;
        }

        CloseCode ended_with = CloseCode::NormalClosure;
        if (!handle(*request, ended_with)) {
            return ended_with;
        }
    }
}

std::optional<std::string> ServerSession::order_violation(Stage stage) const {
    switch (stage) {
        case Stage::Load:
            if (reached_) return "load has already run";
            return std::nullopt;
        case Stage::Select:
            if (!reached_) return "select received before load";
            if (*reached_ != Stage::Load) return "select has already run";
            return std::nullopt;
        case Stage::Work:
            if (!reached_ || *reached_ == Stage::Load) return "work received before select";
            return std::nullopt;
    }
    return std::nullopt;
}

bool ServerSession::handle(const SessionRequest& request, CloseCode& ended_with) {
    const Stage stage = request.stage;

    auto reply_with = [&](const SessionResponse& response) {
        if (!transport_.send_text(response.encode())) {
            log_->warn("Client went away before the {} reply", to_string(stage));
            ended_with = CloseCode::AbnormalClosure;
            return false;
        }
        return true;
    };

    // --- 1. REQUEST SHAPE ---
    if (stage != Stage::Load && request.task_prompt.empty()) {
        return reply_with(make_error_response(stage, status::kInvalidRequest, "taskPrompt is required"));
    }
    if (stage == Stage::Work && request.file_work_prompt.empty()) {
        return reply_with(make_error_response(stage, status::kInvalidRequest, "fileWorkPrompt is required"));
    }

    // --- 2. STAGE ORDER ---
    if (auto violation = order_violation(stage)) {
        log_->warn("⛔ {} from {}: {}", to_string(stage), request.client_id, *violation);
        return reply_with(make_error_response(stage, status::kStageOutOfOrder, *violation));
    }
    reached_ = stage;

    auto parts = build_parts(request);
    if (stage == Stage::Load && !options_.debug_snapshot_path.empty()) {
        debug_dump_ = spawn_debug_dump(options_.debug_snapshot_path, parts.front(), log_);
    }

    // --- 3. MODEL ---
    log_->info("🧠 {} for {}: {} parts, {} bytes of context", to_string(stage), request.client_id, parts.size(),
               parts.front().size());
    auto start = std::chrono::steady_clock::now();
    std::string reply;
    try {
        reply = model_.generate(parts, options_.generate);
    } catch (const std::exception& e) {
        double ms = std::chrono::duration<double, std::milli>(std::chrono::steady_clock::now() - start).count();
        log_->error("❌ Model call failed during {}: {}", to_string(stage), e.what());
        record(request, parts, "model_error", e.what(), ms);
        transport_.send_close(CloseCode::InternalServerError, e.what());
        ended_with = CloseCode::InternalServerError;
        return false;
    }
    double ms = std::chrono::duration<double, std::milli>(std::chrono::steady_clock::now() - start).count();

    // --- 4. VALIDATION ---
    std::vector<std::string> errors;
    auto payload = extract_json_payload(reply);
    if (!payload) {
        errors.push_back("model reply contains no JSON object");
    } else {
        errors = validate_stage_payload(stage, *payload);
    }

    if (!errors.empty()) {
        log_->warn("⚠️ {} reply failed validation: {}", to_string(stage), join(errors));
        record(request, parts, status::kInvalidModelResponse, reply, ms);
        return reply_with(make_error_response(stage, status::kInvalidModelResponse, join(errors)));
    }

    log_->info("✅ {} answered in {:.0f} ms", to_string(stage), ms);
    record(request, parts, status::kOk, reply, ms);
    return reply_with(make_response(stage, std::move(*payload)));
}

std::optional<std::future<void>> ServerSession::take_debug_dump() {
    auto dump = std::move(debug_dump_);
    debug_dump_.reset();
    return dump;
}

void ServerSession::record(const SessionRequest& request, const std::vector<std::string>& parts,
                           const std::string& status, const std::string& reply, double duration_ms) {
    if (!journal_) return;

    size_t bytes = 0;
    std::string instructions;
    for (size_t i = 0; i < parts.size(); ++i) {
        bytes += parts[i].size();
        if (i > 0) instructions += parts[i] + "\n";
    }

    InteractionLog entry;
    entry.timestamp = std::chrono::duration_cast<std::chrono::milliseconds>(
                          std::chrono::system_clock::now().time_since_epoch()).count();
    entry.client_id = request.client_id;
    entry.stage = to_string(request.stage);
    entry.status = status;
    entry.prompt_preview = utf8_safe_substr(instructions, 400);
    entry.ai_response = utf8_safe_substr(reply, 4000);
    entry.prompt_bytes = bytes;
    entry.duration_ms = duration_ms;
    journal_->add_log(entry);
}

} // namespace code_context
