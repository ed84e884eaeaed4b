#pragma once
#include <optional>
#include <set>
#include <stdexcept>
#include <string>
#include <tree_sitter/api.h>
#include "code_context/snapshot/language_table.hpp"

namespace code_context {

class ExtractionError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

using IdentifierSet = std::set<std::string>;

/**
 * Harvests the identifiers a file declares or references.
 *
 * Named nodes are walked depth-first. When a node's kind is one of the
 * language's declaration kinds, every identifier leaf below it is collected
 * and the walk does not descend past it. Candidates of one byte or holding
 * whitespace are dropped.
 */
class IdentifierExtractor {
public:
    IdentifierExtractor();
    ~IdentifierExtractor();

    IdentifierExtractor(const IdentifierExtractor&) = delete;
    IdentifierExtractor& operator=(const IdentifierExtractor&) = delete;

    // Works on an already parsed tree.
    static IdentifierSet extract(TSNode root, const std::string& source, const LanguageSpec& spec);

    // Parses `source` with the grammar picked from `path`.
    // std::nullopt when no grammar handles the file; ExtractionError when
    // the parser produces no tree.
    std::optional<IdentifierSet> extract_file(const std::string& path, const std::string& source);

    IdentifierSet extract_source(Language language, const std::string& source);

private:
    TSParser* parser_;
};

} // namespace code_context
