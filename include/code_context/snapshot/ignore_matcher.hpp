#pragma once
#include <filesystem>
#include <memory>
#include <string>
#include <vector>
#include <spdlog/spdlog.h>

namespace code_context {

namespace fs = std::filesystem;

/**
 * Decides whether a workspace entry stays out of the snapshot.
 * A path is ignored when its base name glob-matches a pattern, or when its
 * root-relative form (always '/'-separated) starts with a pattern.
 * No negation, no anchoring, no "**".
 */
class IgnoreMatcher {
public:
    IgnoreMatcher() = default;
    explicit IgnoreMatcher(std::vector<std::string> patterns);

    // Reads one pattern per line, skipping blanks and '#' comments.
    // A missing file gives an empty matcher, which ignores nothing.
    static IgnoreMatcher load(const fs::path& ignore_file, const std::shared_ptr<spdlog::logger>& log);

    bool should_ignore(const fs::path& relative_path) const;

    void add_patterns(const std::vector<std::string>& patterns);
    const std::vector<std::string>& patterns() const { return patterns_; }
    bool empty() const { return patterns_.empty(); }

private:
    std::vector<std::string> patterns_;
};

// Base-name glob: '*', '?' and '[...]' classes, no path separators involved.
bool glob_match(const std::string& pattern, const std::string& name);

// Common VCS, build-output and editor entries, merged in on request.
const std::vector<std::string>& default_excludes();

} // namespace code_context
