#include <gtest/gtest.h>
#include <algorithm>
#include "language_extractor.hpp"
#include "regex_extractor.hpp"

using namespace codescope;

namespace {

std::vector<std::pair<std::string, SymbolKind>> names_and_kinds(const std::vector<Symbol>& symbols) {
    std::vector<std::pair<std::string, SymbolKind>> out;
    for (const auto& s : symbols) out.emplace_back(s.name, s.kind);
    return out;
}

} // namespace

TEST(RegexExtractorTest, JavaScriptShapes) {
    RegexExtractor extractor(RegexExtractor::javascript_family());
    auto symbols = extractor.extract("src/app.ts",
        "import React from 'react';\n"
        "export async function fetchData(url) {\n"
        "  return fetch(url);\n"
        "}\n"
        "const add = (a, b) => a + b;\n"
        "export class Widget extends Base {\n"
        "}\n");

    std::vector<std::pair<std::string, SymbolKind>> expected = {
        {"react", SymbolKind::Import},
        {"fetchData", SymbolKind::Function},
        {"add", SymbolKind::Function},
        {"Widget", SymbolKind::Class},
    };
    EXPECT_EQ(names_and_kinds(symbols), expected);

    EXPECT_EQ(symbols[1].line_number, 2);
    EXPECT_EQ(symbols[1].definition, "export async function fetchData(url) {");
    EXPECT_TRUE(symbols[1].call_dependencies.empty());
    EXPECT_EQ(symbols[3].line_number, 6);
}

TEST(RegexExtractorTest, GoShapes) {
    RegexExtractor extractor(RegexExtractor::go());
    auto symbols = extractor.extract("server.go",
        "package main\n"
        "import \"fmt\"\n"
        "type Server struct {\n"
        "}\n"
        "func (s *Server) Start() error {\n"
        "\treturn nil\n"
        "}\n"
        "func helper(x int) int {\n"
        "\treturn x\n"
        "}\n");

    std::vector<std::pair<std::string, SymbolKind>> expected = {
        {"fmt", SymbolKind::Import},
        {"Server", SymbolKind::Class},
        {"Start", SymbolKind::Function},
        {"helper", SymbolKind::Function},
    };
    EXPECT_EQ(names_and_kinds(symbols), expected);
}

TEST(RegexExtractorTest, RustShapes) {
    RegexExtractor extractor(RegexExtractor::rust());
    auto symbols = extractor.extract("lib.rs",
        "use std::collections::HashMap;\n"
        "pub struct Config {\n"
        "}\n"
        "pub fn run(config: &Config) -> Result<()> {\n"
        "    Ok(())\n"
        "}\n");

    std::vector<std::pair<std::string, SymbolKind>> expected = {
        {"std::collections::HashMap", SymbolKind::Import},
        {"Config", SymbolKind::Class},
        {"run", SymbolKind::Function},
    };
    EXPECT_EQ(names_and_kinds(symbols), expected);
}

TEST(RegexExtractorTest, JavaShapes) {
    RegexExtractor extractor(RegexExtractor::java());
    auto symbols = extractor.extract("UserService.java",
        "import java.util.List;\n"
        "public class UserService {\n"
        "    public List<User> findAll() {\n"
        "        return repository.all();\n"
        "    }\n"
        "}\n");

    std::vector<std::pair<std::string, SymbolKind>> expected = {
        {"java.util.List", SymbolKind::Import},
        {"UserService", SymbolKind::Class},
        {"findAll", SymbolKind::Function},
    };
    EXPECT_EQ(names_and_kinds(symbols), expected);
}

TEST(RegexExtractorTest, RegistryDispatchesByExtension) {
    auto registry = ExtractorRegistry::with_defaults();

    ASSERT_NE(registry.for_file("a/b/view.tsx"), nullptr);
    EXPECT_EQ(registry.for_file("a/b/view.tsx")->language(), "javascript");
    ASSERT_NE(registry.for_file("main.py"), nullptr);
    EXPECT_EQ(registry.for_file("main.py")->language(), "python");
    ASSERT_NE(registry.for_extension("GO"), nullptr);
    EXPECT_EQ(registry.for_extension("GO")->language(), "go");
    EXPECT_EQ(registry.for_file("notes.txt"), nullptr);

    auto py = registry.extensions_for_language("python");
    EXPECT_NE(std::find(py.begin(), py.end(), ".py"), py.end());
    EXPECT_TRUE(registry.extensions_for_language("cobol").empty());
}

TEST(RegexExtractorTest, OversizedLinesAreSkippedAndExtractionContinues) {
    RegexExtractor extractor(RegexExtractor::javascript_family());
    const std::string filler(200 * 1024, 'v');
    auto symbols = extractor.extract("dist/bundle.js",
        "import a from 'x';" + filler + " import b from 'y';\n"
        "/*" + filler + "*/\n"
        "export function after(value) {\n"
        "  return value;\n"
        "}\n");

    std::vector<std::pair<std::string, SymbolKind>> expected = {{"after", SymbolKind::Function}};
    EXPECT_EQ(names_and_kinds(symbols), expected);
    ASSERT_EQ(symbols.size(), 1u);
    EXPECT_EQ(symbols[0].line_number, 3);
}
