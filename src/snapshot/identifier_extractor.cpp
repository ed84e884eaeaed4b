#include "code_context/snapshot/identifier_extractor.hpp"
#include <algorithm>
#include <cctype>
#include <memory>
#include <vector>

namespace code_context {

namespace {

struct TreeDeleter {
    void operator()(TSTree* tree) const { ts_tree_delete(tree); }
};
using TreePtr = std::unique_ptr<TSTree, TreeDeleter>;

bool contains_kind(const std::vector<std::string>& kinds, const char* kind) {
    return std::find(kinds.begin(), kinds.end(), kind) != kinds.end();
}

std::string node_text(TSNode node, const std::string& source) {
    uint32_t start = ts_node_start_byte(node);
    uint32_t end = ts_node_end_byte(node);
    if (end <= start || end > source.size()) return "";
    return source.substr(start, end - start);
}

bool is_meaningful(const std::string& text) {
    if (text.size() <= 1) return false;
    return std::none_of(text.begin(), text.end(),
                        [](unsigned char c) { return std::isspace(c) != 0; });
}

// Every identifier leaf under `node`, the node itself included.
void collect_identifiers(TSNode node, const std::string& source, const LanguageSpec& spec,
                         IdentifierSet& out) {
    std::vector<TSNode> stack{node};
    while (!stack.empty()) {
        TSNode current = stack.back();
        stack.pop_back();

        if (ts_node_is_named(current) && contains_kind(spec.identifier_kinds, ts_node_type(current))) {
            std::string text = node_text(current, source);
            if (is_meaningful(text)) out.insert(std::move(text));
        }

        uint32_t count = ts_node_named_child_count(current);
        for (uint32_t i = 0; i < count; ++i) {
            stack.push_back(ts_node_named_child(current, i));
        }
    }
}

} // namespace

IdentifierExtractor::IdentifierExtractor() : parser_(ts_parser_new()) {}

IdentifierExtractor::~IdentifierExtractor() {
    if (parser_) ts_parser_delete(parser_);
}

IdentifierSet IdentifierExtractor::extract(TSNode root, const std::string& source, const LanguageSpec& spec) {
    IdentifierSet terms;
    if (ts_node_is_null(root)) return terms;

    // Non-recursive walk, deep ASTs would otherwise blow the stack
    std::vector<TSNode> stack{root};
    while (!stack.empty()) {
        TSNode node = stack.back();
        stack.pop_back();

        if (ts_node_is_named(node) && contains_kind(spec.declaration_kinds, ts_node_type(node))) {
            if (node_text(node, source).size() > 1) {
                collect_identifiers(node, source, spec, terms);
            }
            continue;
        }

        uint32_t count = ts_node_named_child_count(node);
        for (uint32_t i = 0; i < count; ++i) {
            stack.push_back(ts_node_named_child(node, i));
        }
    }
    return terms;
}

std::optional<IdentifierSet> IdentifierExtractor::extract_file(const std::string& path, const std::string& source) {
    auto language = language_for_path(path);
    if (!language) return std::nullopt;
    return extract_source(*language, source);
}

IdentifierSet IdentifierExtractor::extract_source(Language language, const std::string& source) {
    const LanguageSpec& spec = language_spec(language);
    const TSLanguage* grammar = spec.grammar();
    if (!grammar || !ts_parser_set_language(parser_, grammar)) {
        throw ExtractionError(std::string("grammar unavailable for ") + spec.name);
    }

    TreePtr tree(ts_parser_parse_string(parser_, nullptr, source.c_str(),
                                        static_cast<uint32_t>(source.size())));
    if (!tree) {
        ts_parser_reset(parser_);
        throw ExtractionError(std::string("parser returned no tree (") + spec.name + ")");
    }

    return extract(ts_tree_root_node(tree.get()), source, spec);
}

} // namespace code_context
