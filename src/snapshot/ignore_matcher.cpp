#include "code_context/snapshot/ignore_matcher.hpp"
#include <algorithm>
#include <fnmatch.h>
#include <fstream>

namespace code_context {

namespace {

std::string trim(const std::string& s) {
    const auto first = s.find_first_not_of(" \t\r\n");
    if (first == std::string::npos) return "";
    const auto last = s.find_last_not_of(" \t\r\n");
    return s.substr(first, last - first + 1);
}

} // namespace

IgnoreMatcher::IgnoreMatcher(std::vector<std::string> patterns) {
    add_patterns(patterns);
}

IgnoreMatcher IgnoreMatcher::load(const fs::path& ignore_file, const std::shared_ptr<spdlog::logger>& log) {
    std::ifstream f(ignore_file);
    if (!f.is_open()) {
        log->warn("Failed to load ignore file: {}", ignore_file.string());
        return IgnoreMatcher{};
    }

    std::vector<std::string> patterns;
    std::string line;
    while (std::getline(f, line)) {
        std::string clean = trim(line);
        if (clean.empty() || clean[0] == '#') continue;
        patterns.push_back(std::move(clean));
    }
    if (f.bad()) {
        log->warn("Error reading ignore file: {}", ignore_file.string());
    }

    IgnoreMatcher matcher(std::move(patterns));
    log->debug("Loaded {} ignore patterns from {}", matcher.patterns().size(), ignore_file.string());
    return matcher;
}

void IgnoreMatcher::add_patterns(const std::vector<std::string>& patterns) {
    for (const auto& p : patterns) {
        if (p.empty()) continue;
        if (std::find(patterns_.begin(), patterns_.end(), p) == patterns_.end()) {
            patterns_.push_back(p);
        }
    }
}

bool IgnoreMatcher::should_ignore(const fs::path& relative_path) const {
    const std::string base = relative_path.filename().string();
    const std::string full = relative_path.generic_string();

    for (const auto& pattern : patterns_) {
        if (glob_match(pattern, base)) return true;
        if (full.compare(0, pattern.size(), pattern) == 0) return true;
    }
    return false;
}

bool glob_match(const std::string& pattern, const std::string& name) {
    return ::fnmatch(pattern.c_str(), name.c_str(), 0) == 0;
}

const std::vector<std::string>& default_excludes() {
    static const std::vector<std::string> excludes = {
        ".git", "dist", "node_modules", ".svn", ".hg", ".DS_Store", "__MACOSX",
        "__pycache__", ".tox", ".mypy_cache", ".pytest_cache", "Debug", "Release",
        ".vs", ".idea", "cmake-build-debug", "target", ".gradle", ".classpath",
        ".project", ".bundle", "vendor/bundle", "bin", "pkg",
        "docker-compose.override.yml", ".dockerignore", ".vscode", ".env", "logs",
        "coverage"
    };
    return excludes;
}

} // namespace code_context
