#include "code_context/snapshot/snapshot_types.hpp"
#include <algorithm>
#include <sstream>

namespace code_context {

using json = nlohmann::json;

const SnapshotNode* SnapshotNode::find(const std::string& relative_path) const {
    const SnapshotNode* current = this;
    std::stringstream ss(relative_path);
    std::string part;
    while (std::getline(ss, part, '/')) {
        if (part.empty() || part == ".") continue;
        auto it = current->children.find(part);
        if (it == current->children.end()) return nullptr;
        current = &it->second;
    }
    return current;
}

// Empty and false members stay off the wire
void to_json(json& j, const SnapshotNode& node) {
    j = json::object();
    if (node.is_directory) j["dir"] = true;
    if (node.excluded) j["excluded"] = true;
    if (!node.children.empty()) {
        json children = json::object();
        for (const auto& [name, child] : node.children) {
            children[name] = child;
        }
        j["children"] = std::move(children);
    }
    if (!node.identifiers.empty()) j["identifiers"] = node.identifiers;
}

void from_json(const json& j, SnapshotNode& node) {
    node.is_directory = j.value("dir", false);
    node.excluded = j.value("excluded", false);
    node.children.clear();
    node.identifiers.clear();
    if (j.contains("children")) {
        for (const auto& [name, child] : j.at("children").items()) {
            node.children[name] = child.get<SnapshotNode>();
        }
    }
    if (j.contains("identifiers")) {
        node.identifiers = j.at("identifiers").get<std::set<std::string>>();
    }
}

bool CodebaseContext::add_file_content(const std::string& path, std::string content) {
    return file_contents_.emplace(path, std::move(content)).second;
}

void CodebaseContext::add_note(const std::string& note) {
    if (std::find(notes.begin(), notes.end(), note) == notes.end()) {
        notes.push_back(note);
    }
}

json CodebaseContext::to_json() const {
    json j = json::object();
    json fs_json = json::object();
    for (const auto& [root, node] : snapshot) {
        fs_json[root] = node;
    }
    j["snapshot"] = std::move(fs_json);
    if (!notes.empty()) j["notes"] = notes;
    if (!file_contents_.empty()) j["fileContents"] = file_contents_;
    return j;
}

CodebaseContext CodebaseContext::from_json(const json& j) {
    CodebaseContext ctx;
    if (j.contains("snapshot")) {
        for (const auto& [root, node] : j.at("snapshot").items()) {
            ctx.snapshot[root] = node.get<SnapshotNode>();
        }
    }
    if (j.contains("notes")) {
        ctx.notes = j.at("notes").get<std::vector<std::string>>();
    }
    if (j.contains("fileContents")) {
        for (const auto& [path, content] : j.at("fileContents").items()) {
            ctx.file_contents_.emplace(path, content.get<std::string>());
        }
    }
    return ctx;
}

} // namespace code_context
