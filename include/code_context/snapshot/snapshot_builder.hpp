#pragma once
#include <cstddef>
#include <filesystem>
#include <memory>
#include <stdexcept>
#include <string>
#include <spdlog/spdlog.h>
#include "code_context/snapshot/identifier_extractor.hpp"
#include "code_context/snapshot/ignore_matcher.hpp"
#include "code_context/snapshot/snapshot_types.hpp"

namespace code_context {

namespace fs = std::filesystem;

class SnapshotError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

struct SnapshotOptions {
    std::size_t max_file_bytes = 512 * 1024;
};

struct SnapshotStats {
    int directories = 0;
    int files = 0;
    int excluded = 0;
    int unsupported = 0;
    int failed = 0;
};

inline constexpr const char* kExcludedNote = "excluded entries exist but are not expanded";

class SnapshotBuilder {
public:
    SnapshotBuilder(IgnoreMatcher matcher, SnapshotOptions options, std::shared_ptr<spdlog::logger> log);

    // Root directory node for `root_dir`. Throws SnapshotError when the root
    // itself cannot be walked; anything below the root is absorbed.
    SnapshotNode build(const fs::path& root_dir);

    // {root_dir: build(root_dir)} plus notes.
    CodebaseContext build_context(const fs::path& root_dir);

    const SnapshotStats& stats() const { return stats_; }

private:
    IgnoreMatcher matcher_;
    SnapshotOptions options_;
    std::shared_ptr<spdlog::logger> log_;
    IdentifierExtractor extractor_;
    SnapshotStats stats_;

    void walk_directory(const fs::path& dir, const fs::path& root, SnapshotNode& root_node);
    void visit_entry(const fs::directory_entry& entry, const fs::path& root, SnapshotNode& root_node);
    std::set<std::string> identifiers_for(const fs::path& file, const std::string& rel_path);
};

// Walks '/'-separated `relative_path` from `root`, creating any missing
// directory nodes on the way, and returns the parent slot for the last
// segment. The last segment itself is not created.
SnapshotNode& parent_for(SnapshotNode& root, const std::string& relative_path);

} // namespace code_context
