#pragma once
#include <chrono>
#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "code_context/snapshot/snapshot_types.hpp"

namespace code_context {

enum class Stage { Load, Select, Work };

const char* to_string(Stage stage);
std::optional<Stage> stage_from_string(const std::string& text);

// Response status tags. Anything but kOk carries {"error": ...} as data.
namespace status {
inline constexpr const char* kOk = "ok";
inline constexpr const char* kInvalidRequest = "invalid_request";
inline constexpr const char* kStageOutOfOrder = "stage_out_of_order";
inline constexpr const char* kInvalidModelResponse = "invalid_model_response";
} // namespace status

struct SessionRequest {
    std::string client_id;
    Stage stage = Stage::Load;
    CodebaseContext context;
    std::string task_prompt;       // SELECT and WORK
    std::string file_work_prompt;  // WORK only

    nlohmann::json to_json() const;
    std::string encode() const;

    // nullopt when `text` is not a well-formed request; `error` says why.
    static std::optional<SessionRequest> decode(const std::string& text, std::string* error = nullptr);
};

struct SessionResponse {
    std::string timestamp;
    Stage stage = Stage::Load;
    std::string status = status::kOk;
    nlohmann::json data = nlohmann::json::object();

    bool ok() const { return status == status::kOk; }
    std::string error_message() const;

    nlohmann::json to_json() const;
    std::string encode() const;

    static std::optional<SessionResponse> decode(const std::string& text, std::string* error = nullptr);
};

SessionResponse make_response(Stage stage, nlohmann::json data);
SessionResponse make_error_response(Stage stage, const std::string& tag, const std::string& message);

// --- Stage payloads. Each declares the JSON Schema of its wire form. ---

struct LoadAck {
    std::string stage;
    std::string status;

    static nlohmann::json schema();
};

void to_json(nlohmann::json& j, const LoadAck& ack);
void from_json(const nlohmann::json& j, LoadAck& ack);

enum class FileOperation : int { Remove = -1, Update = 0, Create = 1 };

const char* to_string(FileOperation op);

struct FileEntry {
    std::string path;
    FileOperation operation = FileOperation::Update;
    std::string reason;

    static nlohmann::json schema();
};

void to_json(nlohmann::json& j, const FileEntry& entry);
void from_json(const nlohmann::json& j, FileEntry& entry);

struct FileChangePlan {
    std::vector<FileEntry> files;
    std::vector<FileEntry> additional_context_files;

    // First path listed in both `files` and `additional_context_files`.
    std::optional<std::string> overlapping_path() const;

    bool empty() const { return files.empty() && additional_context_files.empty(); }

    static nlohmann::json schema();
};

void to_json(nlohmann::json& j, const FileChangePlan& plan);
void from_json(const nlohmann::json& j, FileChangePlan& plan);

struct PatchData {
    std::string path;
    std::string patch;    // unified diff touching `path` only
    std::string summary;

    static nlohmann::json schema();
};

void to_json(nlohmann::json& j, const PatchData& patch);
void from_json(const nlohmann::json& j, PatchData& patch);

// --- Helpers ---

// Compact JSON text. Invalid UTF-8 in keys or strings (a Latin-1 file name
// or file body) is written as U+FFFD instead of throwing.
std::string safe_dump(const nlohmann::json& j);

// "2024-05-01T12:00:00Z"
std::string format_rfc3339_utc(std::chrono::system_clock::time_point tp);
std::string rfc3339_utc_now();

// "1: first\n2: second\n". A trailing newline does not add an empty line.
std::string number_lines(const std::string& content);

// Header line plus, for updates, the numbered content.
std::string build_file_work_prompt(const std::string& path, FileOperation op,
                                   const std::string* content = nullptr);

// The JSON object in a model reply. Prefers a ```json fenced block, then the
// outermost braces; nullopt if nothing parses to an object.
std::optional<nlohmann::json> extract_json_payload(const std::string& raw);

} // namespace code_context
