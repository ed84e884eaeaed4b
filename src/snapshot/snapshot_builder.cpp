#include "code_context/snapshot/snapshot_builder.hpp"
#include <fstream>
#include <sstream>
#include <vector>

namespace code_context {

namespace {

std::vector<std::string> split_segments(const std::string& relative_path) {
    std::vector<std::string> parts;
    std::stringstream ss(relative_path);
    std::string part;
    while (std::getline(ss, part, '/')) {
        if (part.empty() || part == ".") continue;
        parts.push_back(part);
    }
    return parts;
}

} // namespace

SnapshotNode& parent_for(SnapshotNode& root, const std::string& relative_path) {
    auto parts = split_segments(relative_path);
    SnapshotNode* node = &root;
    for (size_t i = 0; i + 1 < parts.size(); ++i) {
        // An ancestor may be referenced before the walk reaches it
        SnapshotNode& child = node->children[parts[i]];
        child.is_directory = true;
        node = &child;
    }
    return *node;
}

SnapshotBuilder::SnapshotBuilder(IgnoreMatcher matcher, SnapshotOptions options, std::shared_ptr<spdlog::logger> log)
    : matcher_(std::move(matcher)), options_(options), log_(std::move(log)) {}

SnapshotNode SnapshotBuilder::build(const fs::path& root_dir) {
    stats_ = SnapshotStats{};

    std::error_code ec;
    auto status = fs::status(root_dir, ec);
    if (ec) {
        throw SnapshotError("failed to walk directory (" + root_dir.string() + "): " + ec.message());
    }
    if (!fs::is_directory(status)) {
        throw SnapshotError("failed to walk directory (" + root_dir.string() + "): not a directory");
    }

    fs::directory_iterator first_entry(root_dir, ec);
    if (ec) {
        throw SnapshotError("failed to walk directory (" + root_dir.string() + "): " + ec.message());
    }

    SnapshotNode root = SnapshotNode::directory();
    walk_directory(root_dir, root_dir, root);

    log_->info("Snapshot of {}: {} dirs, {} files, {} excluded, {} unsupported, {} failed",
               root_dir.string(), stats_.directories, stats_.files, stats_.excluded,
               stats_.unsupported, stats_.failed);
    return root;
}

CodebaseContext SnapshotBuilder::build_context(const fs::path& root_dir) {
    CodebaseContext ctx;
    ctx.snapshot[root_dir.string()] = build(root_dir);
    if (stats_.excluded > 0) {
        ctx.add_note(kExcludedNote);
    }
    return ctx;
}

void SnapshotBuilder::walk_directory(const fs::path& dir, const fs::path& root, SnapshotNode& root_node) {
    std::error_code ec;
    fs::directory_iterator it(dir, ec);
    if (ec) {
        log_->warn("Skipping unreadable directory {}: {}", dir.string(), ec.message());
        stats_.failed++;
        return;
    }

    for (const fs::directory_iterator end; it != end; it.increment(ec)) {
        if (ec) break;
        visit_entry(*it, root, root_node);
    }
    if (ec) {
        log_->warn("Listing of {} stopped early: {}", dir.string(), ec.message());
        stats_.failed++;
    }
}

void SnapshotBuilder::visit_entry(const fs::directory_entry& entry, const fs::path& root, SnapshotNode& root_node) {
    const fs::path& path = entry.path();
    const std::string rel_path = path.lexically_relative(root).generic_string();
    const std::string name = path.filename().string();

    SnapshotNode& parent = parent_for(root_node, rel_path);

    // Links are not followed, a linked directory is listed like a file
    std::error_code ec;
    bool is_dir = entry.is_directory(ec) && !entry.is_symlink(ec);
    if (ec) {
        log_->warn("Failed to stat {}: {}", rel_path, ec.message());
        is_dir = false;
    }

    if (matcher_.should_ignore(rel_path)) {
        parent.children[name] = SnapshotNode::excluded_marker(is_dir);
        stats_.excluded++;
        log_->debug("Excluded {}", rel_path);
        return;
    }

    if (is_dir) {
        SnapshotNode& node = parent.children[name];
        node.is_directory = true;
        stats_.directories++;
        walk_directory(path, root, root_node);
        return;
    }

    parent.children[name] = SnapshotNode::file(identifiers_for(path, rel_path));
    stats_.files++;
    log_->debug("Added to tree: {}", rel_path);
}

std::set<std::string> SnapshotBuilder::identifiers_for(const fs::path& file, const std::string& rel_path) {
    auto language = language_for_path(rel_path);
    if (!language) {
        stats_.unsupported++;
        log_->trace("No extractor for {}", rel_path);
        return {};
    }

    std::error_code ec;
    auto size = fs::file_size(file, ec);
    if (ec) {
        stats_.failed++;
        log_->warn("Failed to size {}: {}", rel_path, ec.message());
        return {};
    }
    if (size > options_.max_file_bytes) {
        log_->debug("Not parsing {} ({} bytes)", rel_path, size);
        return {};
    }

    std::ifstream f(file, std::ios::in | std::ios::binary);
    if (!f.is_open()) {
        stats_.failed++;
        log_->warn("Failed to read file: {}", rel_path);
        return {};
    }
    std::stringstream buffer;
    buffer << f.rdbuf();

    try {
        auto ids = extractor_.extract_source(*language, buffer.str());
        log_->trace("Parsed {} ({}): {} identifiers", rel_path, to_string(*language), ids.size());
        return ids;
    } catch (const ExtractionError& e) {
        stats_.failed++;
        log_->warn("Failed to parse file {}: {}", rel_path, e.what());
        return {};
    }
}

} // namespace code_context
