#include <gtest/gtest.h>
#include "code_context/snapshot/identifier_extractor.hpp"
#include "code_context/snapshot/language_table.hpp"

using namespace code_context;

TEST(LanguageTable, DispatchesByExtension) {
    EXPECT_EQ(language_for_path("cmd/main.go"), Language::Go);
    EXPECT_EQ(language_for_path("web/app.js"), Language::JavaScript);
    EXPECT_EQ(language_for_path("web/App.jsx"), Language::JavaScript);
    EXPECT_EQ(language_for_path("web/api.ts"), Language::TypeScript);
    EXPECT_EQ(language_for_path("web/App.tsx"), Language::Tsx);
    EXPECT_EQ(language_for_path("tools/gen.py"), Language::Python);
}

TEST(LanguageTable, DockerfilesUseDefaultGrammar) {
    EXPECT_EQ(language_for_path("Dockerfile"), Language::Go);
    EXPECT_EQ(language_for_path("deploy/Dockerfile.prod"), Language::Go);
}

TEST(LanguageTable, UnknownExtensionHasNoExtractor) {
    EXPECT_FALSE(language_for_path("README.md").has_value());
    EXPECT_FALSE(language_for_path("Makefile").has_value());
    EXPECT_FALSE(language_for_path(".gitignore").has_value());
}

TEST(IdentifierExtractor, GoFunctionAndPackage) {
    IdentifierExtractor extractor;
    auto ids = extractor.extract_source(Language::Go, "package main\n\nfunc foo() {}\n");
    EXPECT_EQ(ids, (IdentifierSet{"main", "foo"}));
}

TEST(IdentifierExtractor, GoCollectsEachDistinctNameOnce) {
    const std::string source =
        "package calc\n"
        "\n"
        "func sum(first int, second int) int {\n"
        "\ttotal := first + second\n"
        "\treturn total\n"
        "}\n";

    IdentifierExtractor extractor;
    auto ids = extractor.extract_source(Language::Go, source);
    EXPECT_EQ(ids, (IdentifierSet{"calc", "sum", "first", "second", "total"}));
}

TEST(IdentifierExtractor, DropsSingleCharacterNames) {
    IdentifierExtractor extractor;
    auto ids = extractor.extract_source(Language::Go, "package main\n\nfunc f(x int) int { return x }\n");
    EXPECT_EQ(ids, (IdentifierSet{"main"}));
}

TEST(IdentifierExtractor, IsCaseSensitive) {
    IdentifierExtractor extractor;
    auto ids = extractor.extract_source(Language::Go,
                                        "package main\n\nfunc Load(load int, LOAD int) {}\n");
    EXPECT_EQ(ids, (IdentifierSet{"main", "Load", "load", "LOAD"}));
}

TEST(IdentifierExtractor, Python) {
    const std::string source =
        "def greet(name):\n"
        "    message = \"hi \" + name\n"
        "    return message\n";

    IdentifierExtractor extractor;
    auto ids = extractor.extract_source(Language::Python, source);
    EXPECT_EQ(ids, (IdentifierSet{"greet", "name", "message"}));
}

TEST(IdentifierExtractor, JavaScript) {
    IdentifierExtractor extractor;
    auto ids = extractor.extract_source(Language::JavaScript,
                                        "function hello(world) { return world; }\n");
    EXPECT_EQ(ids, (IdentifierSet{"hello", "world"}));
}

TEST(IdentifierExtractor, ExtractFileReturnsNulloptForUnsupportedFiles) {
    IdentifierExtractor extractor;
    EXPECT_FALSE(extractor.extract_file("notes.txt", "plain words here").has_value());
}

TEST(IdentifierExtractor, ExtractFileDispatchesOnPath) {
    IdentifierExtractor extractor;
    auto ids = extractor.extract_file("pkg/util.go", "package util\n\nfunc Helper() {}\n");
    ASSERT_TRUE(ids.has_value());
    EXPECT_EQ(*ids, (IdentifierSet{"util", "Helper"}));
}

TEST(IdentifierExtractor, EmptySourceYieldsEmptySet) {
    IdentifierExtractor extractor;
    EXPECT_TRUE(extractor.extract_source(Language::Go, "").empty());
}

TEST(IdentifierExtractor, ParserIsReusableAcrossLanguages) {
    IdentifierExtractor extractor;
    auto go = extractor.extract_source(Language::Go, "package first\n");
    auto py = extractor.extract_source(Language::Python, "second_name = 1\n");
    EXPECT_EQ(go, (IdentifierSet{"first"}));
    EXPECT_EQ(py, (IdentifierSet{"second_name"}));
}
