#include "code_context/session/protocol.hpp"
#include <ctime>
#include <sstream>
#include <stdexcept>

namespace code_context {

using json = nlohmann::json;

// --- 1. STAGES ---

const char* to_string(Stage stage) {
    switch (stage) {
        case Stage::Load: return "load";
        case Stage::Select: return "select";
        case Stage::Work: return "work";
    }
    return "unknown";
}

std::optional<Stage> stage_from_string(const std::string& text) {
    if (text == "load") return Stage::Load;
    if (text == "select") return Stage::Select;
    if (text == "work") return Stage::Work;
    return std::nullopt;
}

std::string safe_dump(const json& j) {
    return j.dump(-1, ' ', false, json::error_handler_t::replace);
}

// --- 2. ENVELOPES ---

json SessionRequest::to_json() const {
    json j = {
        {"clientID", client_id},
        {"stage", to_string(stage)},
        {"context", context.to_json()}
    };
    if (!task_prompt.empty()) j["taskPrompt"] = task_prompt;
    if (!file_work_prompt.empty()) j["fileWorkPrompt"] = file_work_prompt;
    return j;
}

std::string SessionRequest::encode() const {
    return safe_dump(to_json());
}

std::optional<SessionRequest> SessionRequest::decode(const std::string& text, std::string* error) {
    auto fail = [error](const std::string& why) -> std::optional<SessionRequest> {
        if (error) *error = why;
        return std::nullopt;
    };

    json j = json::parse(text, nullptr, false);
    if (j.is_discarded() || !j.is_object()) return fail("frame is not a JSON object");

    if (!j.contains("clientID") || !j["clientID"].is_string()) return fail("missing clientID");
    if (!j.contains("stage") || !j["stage"].is_string()) return fail("missing stage");
    auto stage = stage_from_string(j["stage"].get<std::string>());
    if (!stage) return fail("unknown stage '" + j["stage"].get<std::string>() + "'");
    if (!j.contains("context") || !j["context"].is_object()) return fail("missing context");

    SessionRequest req;
    req.client_id = j["clientID"].get<std::string>();
    req.stage = *stage;
    try {
        req.context = CodebaseContext::from_json(j["context"]);
        req.task_prompt = j.value("taskPrompt", "");
        req.file_work_prompt = j.value("fileWorkPrompt", "");
    } catch (const json::exception& e) {
        return fail(std::string("malformed request: ") + e.what());
    }
    return req;
}

std::string SessionResponse::error_message() const {
    if (data.is_object() && data.contains("error") && data["error"].is_string()) {
        return data["error"].get<std::string>();
    }
    return "";
}

json SessionResponse::to_json() const {
    return {
        {"timestamp", timestamp},
        {"stage", to_string(stage)},
        {"status", status},
        {"data", data}
    };
}

std::string SessionResponse::encode() const {
    return safe_dump(to_json());
}

std::optional<SessionResponse> SessionResponse::decode(const std::string& text, std::string* error) {
    auto fail = [error](const std::string& why) -> std::optional<SessionResponse> {
        if (error) *error = why;
        return std::nullopt;
    };

    json j = json::parse(text, nullptr, false);
    if (j.is_discarded() || !j.is_object()) return fail("frame is not a JSON object");

    if (!j.contains("stage") || !j["stage"].is_string()) return fail("missing stage");
    auto stage = stage_from_string(j["stage"].get<std::string>());
    if (!stage) return fail("unknown stage '" + j["stage"].get<std::string>() + "'");
    if (!j.contains("status") || !j["status"].is_string()) return fail("missing status");

    SessionResponse res;
    res.stage = *stage;
    res.status = j["status"].get<std::string>();
    if (j.contains("timestamp") && j["timestamp"].is_string()) {
        res.timestamp = j["timestamp"].get<std::string>();
    }
    res.data = j.contains("data") ? j["data"] : json::object();
    return res;
}

SessionResponse make_response(Stage stage, json data) {
    SessionResponse res;
    res.timestamp = rfc3339_utc_now();
    res.stage = stage;
    res.status = status::kOk;
    res.data = std::move(data);
    return res;
}

SessionResponse make_error_response(Stage stage, const std::string& tag, const std::string& message) {
    SessionResponse res;
    res.timestamp = rfc3339_utc_now();
    res.stage = stage;
    res.status = tag;
    res.data = {{"error", message}};
    return res;
}

// --- 3. PAYLOADS ---

namespace {

json string_property(const char* description) {
    return {{"type", "string"}, {"description", description}};
}

} // namespace

json LoadAck::schema() {
    return {
        {"type", "object"},
        {"properties", {
            {"stage", string_property("Echo of the request stage, always \"load\".")},
            {"status", string_property("\"ok\" once the context has been taken in.")}
        }},
        {"required", {"stage", "status"}},
        {"additionalProperties", false}
    };
}

void to_json(json& j, const LoadAck& ack) {
    j = {{"stage", ack.stage}, {"status", ack.status}};
}

void from_json(const json& j, LoadAck& ack) {
    j.at("stage").get_to(ack.stage);
    j.at("status").get_to(ack.status);
}

const char* to_string(FileOperation op) {
    switch (op) {
        case FileOperation::Remove: return "remove";
        case FileOperation::Update: return "update";
        case FileOperation::Create: return "create";
    }
    return "unknown";
}

json FileEntry::schema() {
    return {
        {"type", "object"},
        {"properties", {
            {"path", string_property("File path relative to the workspace root.")},
            {"operation", {
                {"type", "integer"},
                {"enum", {-1, 0, 1}},
                {"description", "0 update, 1 create, -1 remove."}
            }},
            {"reason", string_property("Why this file is listed.")}
        }},
        {"required", {"path", "operation", "reason"}},
        {"additionalProperties", false}
    };
}

void to_json(json& j, const FileEntry& entry) {
    j = {
        {"path", entry.path},
        {"operation", static_cast<int>(entry.operation)},
        {"reason", entry.reason}
    };
}

void from_json(const json& j, FileEntry& entry) {
    j.at("path").get_to(entry.path);
    int op = j.at("operation").get<int>();
    if (op < -1 || op > 1) {
        throw std::invalid_argument("operation out of range: " + std::to_string(op));
    }
    entry.operation = static_cast<FileOperation>(op);
    entry.reason = j.value("reason", "");
}

std::optional<std::string> FileChangePlan::overlapping_path() const {
    for (const auto& f : files) {
        for (const auto& extra : additional_context_files) {
            if (f.path == extra.path) return f.path;
        }
    }
    return std::nullopt;
}

json FileChangePlan::schema() {
    json entries = {{"type", "array"}, {"items", FileEntry::schema()}};
    json files = entries;
    files["description"] = "Files to update, create or remove.";
    json extra = entries;
    extra["description"] = "Files whose content is needed as context only.";
    return {
        {"type", "object"},
        {"properties", {
            {"files", files},
            {"additionalContextFiles", extra}
        }},
        {"required", {"files", "additionalContextFiles"}},
        {"additionalProperties", false}
    };
}

void to_json(json& j, const FileChangePlan& plan) {
    j = {
        {"files", plan.files},
        {"additionalContextFiles", plan.additional_context_files}
    };
}

void from_json(const json& j, FileChangePlan& plan) {
    plan.files = j.at("files").get<std::vector<FileEntry>>();
    plan.additional_context_files = j.at("additionalContextFiles").get<std::vector<FileEntry>>();
}

json PatchData::schema() {
    return {
        {"type", "object"},
        {"properties", {
            {"path", string_property("The file the patch applies to.")},
            {"patch", string_property("Unified diff that only touches `path`.")},
            {"summary", string_property("One or two sentences describing the change.")}
        }},
        {"required", {"path", "patch", "summary"}},
        {"additionalProperties", false}
    };
}

void to_json(json& j, const PatchData& patch) {
    j = {{"path", patch.path}, {"patch", patch.patch}, {"summary", patch.summary}};
}

void from_json(const json& j, PatchData& patch) {
    j.at("path").get_to(patch.path);
    j.at("patch").get_to(patch.patch);
    patch.summary = j.value("summary", "");
}

// --- 4. HELPERS ---

std::string format_rfc3339_utc(std::chrono::system_clock::time_point tp) {
    std::time_t t = std::chrono::system_clock::to_time_t(tp);
    std::tm utc{};
    gmtime_r(&t, &utc);
    char buf[32];
    std::strftime(buf, sizeof(buf), "%Y-%m-%dT%H:%M:%SZ", &utc);
    return buf;
}

std::string rfc3339_utc_now() {
    return format_rfc3339_utc(std::chrono::system_clock::now());
}

std::string number_lines(const std::string& content) {
    std::ostringstream out;
    std::istringstream in(content);
    std::string line;
    int n = 1;
    while (std::getline(in, line)) {
        out << n++ << ": " << line << "\n";
    }
    return out.str();
}

std::string build_file_work_prompt(const std::string& path, FileOperation op, const std::string* content) {
    std::string prompt = "File: " + path + " (operation: " + to_string(op) + ")\n";
    if (op == FileOperation::Update && content) {
        prompt += "\n" + number_lines(*content);
    }
    return prompt;
}

std::optional<json> extract_json_payload(const std::string& raw) {
    auto try_parse = [](const std::string& text) -> std::optional<json> {
        json j = json::parse(text, nullptr, false);
        if (j.is_discarded() || !j.is_object()) return std::nullopt;
        return j;
    };

    if (auto whole = try_parse(raw)) return whole;

    const std::string fence = "```json";
    auto open = raw.find(fence);
    if (open != std::string::npos) {
        auto body = open + fence.size();
        auto close = raw.find("```", body);
        if (close != std::string::npos) {
            if (auto fenced = try_parse(raw.substr(body, close - body))) return fenced;
        }
    }

    auto first = raw.find('{');
    auto last = raw.rfind('}');
    if (first != std::string::npos && last != std::string::npos && last > first) {
        return try_parse(raw.substr(first, last - first + 1));
    }
    return std::nullopt;
}

} // namespace code_context
