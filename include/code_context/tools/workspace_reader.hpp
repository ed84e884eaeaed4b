#pragma once
#include <cstddef>
#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <spdlog/spdlog.h>

namespace code_context {

namespace fs = std::filesystem;

// Where file contents for the WORK stage come from.
class FileSource {
public:
    virtual ~FileSource() = default;

    // Content of `path`, nullopt when it cannot be read (`error` says why).
    virtual std::optional<std::string> read(const std::string& path, std::string* error = nullptr) = 0;
};

bool is_inside_path(const fs::path& child, const fs::path& parent);

// Reads files under a workspace root. Paths resolving outside the root are
// refused.
class WorkspaceReader : public FileSource {
public:
    WorkspaceReader(fs::path root, std::shared_ptr<spdlog::logger> log, std::size_t max_bytes = 1024 * 1024);

    std::optional<std::string> read(const std::string& path, std::string* error = nullptr) override;

    const fs::path& root() const { return root_; }

private:
    fs::path root_;
    std::shared_ptr<spdlog::logger> log_;
    std::size_t max_bytes_;
};

} // namespace code_context
