#include "code_context/tools/workspace_reader.hpp"
#include <fstream>
#include <sstream>

namespace code_context {

// Segment-wise, so "/a/bc" is not inside "/a/b"
bool is_inside_path(const fs::path& child, const fs::path& parent) {
    if (parent.empty()) return false;
    auto c = child.lexically_normal();
    auto p = parent.lexically_normal();
    auto it_c = c.begin();
    for (auto it_p = p.begin(); it_p != p.end(); ++it_p) {
        if (it_p->empty()) continue;  // trailing separator
        if (it_c == c.end() || *it_c != *it_p) return false;
        ++it_c;
    }
    return true;
}

WorkspaceReader::WorkspaceReader(fs::path root, std::shared_ptr<spdlog::logger> log, std::size_t max_bytes)
    : root_(fs::absolute(root).lexically_normal()), log_(std::move(log)), max_bytes_(max_bytes) {}

std::optional<std::string> WorkspaceReader::read(const std::string& path, std::string* error) {
    auto fail = [&](const std::string& why) -> std::optional<std::string> {
        log_->warn("❌ [I/O Read] {}: {}", path, why);
        if (error) *error = why;
        return std::nullopt;
    };

    fs::path requested(path);
    fs::path target = (requested.is_absolute() ? requested : root_ / requested).lexically_normal();

    if (!is_inside_path(target, root_)) return fail("path escapes the workspace root");

    std::error_code ec;
    if (!fs::is_regular_file(target, ec)) return fail("not a regular file");

    auto size = fs::file_size(target, ec);
    if (ec) return fail(ec.message());
    if (size > max_bytes_) return fail("file too large (" + std::to_string(size) + " bytes)");

    std::ifstream f(target, std::ios::in | std::ios::binary);
    if (!f.is_open()) return fail("cannot open");

    std::stringstream buffer;
    buffer << f.rdbuf();
    log_->debug("🔍 [I/O Read] Read {} ({} bytes)", path, size);
    return buffer.str();
}

} // namespace code_context
