#include "code_context/snapshot/language_table.hpp"
#include <filesystem>
#include <stdexcept>

namespace code_context {

namespace {

constexpr Language kDefaultLanguage = Language::Go;

const std::vector<std::string>& shared_declaration_kinds() {
    static const std::vector<std::string> kinds = {
        "function_declaration", "method_declaration", "struct_declaration",
        "interface_declaration", "type_declaration",
        "identifier", "field_identifier", "package_identifier"
    };
    return kinds;
}

const std::vector<std::string>& shared_identifier_kinds() {
    static const std::vector<std::string> kinds = {
        "identifier", "field_identifier", "package_identifier"
    };
    return kinds;
}

} // namespace

const std::vector<LanguageSpec>& language_table() {
    static const std::vector<LanguageSpec> table = {
        {Language::Go, "go", {".go"}, &tree_sitter_go,
         shared_declaration_kinds(), shared_identifier_kinds()},
        {Language::JavaScript, "javascript", {".js", ".jsx"}, &tree_sitter_javascript,
         shared_declaration_kinds(), shared_identifier_kinds()},
        {Language::TypeScript, "typescript", {".ts"}, &tree_sitter_typescript,
         shared_declaration_kinds(), shared_identifier_kinds()},
        {Language::Tsx, "tsx", {".tsx"}, &tree_sitter_tsx,
         shared_declaration_kinds(), shared_identifier_kinds()},
        {Language::Python, "python", {".py"}, &tree_sitter_python,
         shared_declaration_kinds(), shared_identifier_kinds()},
    };
    return table;
}

const LanguageSpec& language_spec(Language id) {
    for (const auto& spec : language_table()) {
        if (spec.id == id) return spec;
    }
    throw std::out_of_range("language missing from table");
}

std::optional<Language> language_for_path(const std::string& path) {
    std::filesystem::path p(path);
    const std::string name = p.filename().string();
    if (name.rfind("Dockerfile", 0) == 0) return kDefaultLanguage;

    const std::string ext = p.extension().string();
    if (ext.empty()) return std::nullopt;

    for (const auto& spec : language_table()) {
        for (const auto& e : spec.extensions) {
            if (e == ext) return spec.id;
        }
    }
    return std::nullopt;
}

const char* to_string(Language id) {
    return language_spec(id).name;
}

} // namespace code_context
