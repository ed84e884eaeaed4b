#pragma once
#include <map>
#include <set>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

namespace code_context {

// One filesystem entry. Directories carry children, files carry identifiers.
struct SnapshotNode {
    bool is_directory = false;
    bool excluded = false;
    std::map<std::string, SnapshotNode> children;
    std::set<std::string> identifiers;

    static SnapshotNode directory() {
        SnapshotNode n;
        n.is_directory = true;
        return n;
    }

    static SnapshotNode file(std::set<std::string> ids = {}) {
        SnapshotNode n;
        n.identifiers = std::move(ids);
        return n;
    }

    static SnapshotNode excluded_marker(bool dir) {
        SnapshotNode n;
        n.is_directory = dir;
        n.excluded = true;
        return n;
    }

    // Follows '/'-separated segments; nullptr when any segment is missing.
    const SnapshotNode* find(const std::string& relative_path) const;

    bool operator==(const SnapshotNode& other) const {
        return is_directory == other.is_directory && excluded == other.excluded &&
               children == other.children && identifiers == other.identifiers;
    }
    bool operator!=(const SnapshotNode& other) const { return !(*this == other); }
};

void to_json(nlohmann::json& j, const SnapshotNode& node);
void from_json(const nlohmann::json& j, SnapshotNode& node);

/**
 * What the remote side knows about the workspace. `file_contents` starts
 * empty and only ever grows: add_file_content() never replaces an entry.
 */
class CodebaseContext {
public:
    std::map<std::string, SnapshotNode> snapshot;
    std::vector<std::string> notes;

    const std::map<std::string, std::string>& file_contents() const { return file_contents_; }

    // false when the path was already present (the stored text is kept).
    bool add_file_content(const std::string& path, std::string content);

    bool has_file_content(const std::string& path) const { return file_contents_.count(path) != 0; }

    void add_note(const std::string& note);

    nlohmann::json to_json() const;
    static CodebaseContext from_json(const nlohmann::json& j);

private:
    std::map<std::string, std::string> file_contents_;
};

} // namespace code_context
