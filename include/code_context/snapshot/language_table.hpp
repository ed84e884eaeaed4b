#pragma once
#include <optional>
#include <string>
#include <vector>
#include <tree_sitter/api.h>

// Grammars are linked in from the tree-sitter grammar libraries
extern "C" {
    const TSLanguage* tree_sitter_go();
    const TSLanguage* tree_sitter_javascript();
    const TSLanguage* tree_sitter_python();
    const TSLanguage* tree_sitter_typescript();
    const TSLanguage* tree_sitter_tsx();
}

namespace code_context {

enum class Language {
    Go,
    JavaScript,
    TypeScript,
    Tsx,
    Python
};

// One entry of the extraction capability table.
struct LanguageSpec {
    Language id;
    const char* name;
    std::vector<std::string> extensions;
    const TSLanguage* (*grammar)();
    // Node kinds whose subtree is harvested as a whole.
    std::vector<std::string> declaration_kinds;
    // Leaf kinds whose text counts as an identifier.
    std::vector<std::string> identifier_kinds;
};

const std::vector<LanguageSpec>& language_table();

const LanguageSpec& language_spec(Language id);

// Extension lookup; "Dockerfile*" names map to the default grammar.
// Unknown files give std::nullopt.
std::optional<Language> language_for_path(const std::string& path);

const char* to_string(Language id);

} // namespace code_context
