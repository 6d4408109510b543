#include <gtest/gtest.h>
#include <algorithm>
#include "errors.hpp"
#include "python_extractor.hpp"

using namespace codescope;

namespace {

const char* kSample =
    "class Greeter:\n"                         // 1
    "    \"\"\"Says hello.\"\"\"\n"            // 2
    "\n"                                       // 3
    "    def greet(self, name):\n"             // 4
    "        return format_name(name)\n"       // 5
    "\n"                                       // 6
    "def format_name(name):\n"                 // 7
    "    '''Format a name.\n"                  // 8
    "\n"                                       // 9
    "    Longer text.\n"                       // 10
    "    '''\n"                                // 11
    "    return name.strip().title()\n"        // 12
    "\n"                                       // 13
    "import os\n"                              // 14
    "import os.path as osp\n"                  // 15
    "from collections import OrderedDict, defaultdict\n";  // 16

const Symbol* find(const std::vector<Symbol>& symbols, const std::string& name) {
    auto it = std::find_if(symbols.begin(), symbols.end(), [&name](const Symbol& s) { return s.name == name; });
    return it == symbols.end() ? nullptr : &*it;
}

} // namespace

TEST(PythonExtractorTest, ExtractsClassesAndFunctionsInSourceOrder) {
    PythonExtractor extractor;
    auto symbols = extractor.extract("pkg/greeter.py", kSample);

    ASSERT_GE(symbols.size(), 3u);
    EXPECT_EQ(symbols[0].name, "Greeter");
    EXPECT_EQ(symbols[0].kind, SymbolKind::Class);
    EXPECT_EQ(symbols[0].line_number, 1);
    EXPECT_EQ(symbols[0].definition, "class Greeter:");
    EXPECT_EQ(symbols[0].file_path, "pkg/greeter.py");

    EXPECT_EQ(symbols[1].name, "greet");
    EXPECT_EQ(symbols[1].kind, SymbolKind::Function);
    EXPECT_EQ(symbols[1].line_number, 4);
    EXPECT_EQ(symbols[1].definition, "def greet(self, name):");

    EXPECT_EQ(symbols[2].name, "format_name");
    EXPECT_EQ(symbols[2].line_number, 7);
}

TEST(PythonExtractorTest, CollectsDocstrings) {
    PythonExtractor extractor;
    auto symbols = extractor.extract("greeter.py", kSample);

    const Symbol* greeter = find(symbols, "Greeter");
    ASSERT_NE(greeter, nullptr);
    ASSERT_TRUE(greeter->docstring.has_value());
    EXPECT_EQ(*greeter->docstring, "Says hello.");

    const Symbol* format = find(symbols, "format_name");
    ASSERT_NE(format, nullptr);
    ASSERT_TRUE(format->docstring.has_value());
    EXPECT_EQ(*format->docstring, "Format a name.\n\nLonger text.");

    const Symbol* greet = find(symbols, "greet");
    ASSERT_NE(greet, nullptr);
    EXPECT_FALSE(greet->docstring.has_value());
}

TEST(PythonExtractorTest, CollectsDirectAndAttributeCalls) {
    PythonExtractor extractor;
    auto symbols = extractor.extract("greeter.py", kSample);

    const Symbol* greet = find(symbols, "greet");
    ASSERT_NE(greet, nullptr);
    EXPECT_EQ(greet->call_dependencies, (std::set<std::string>{"format_name"}));

    const Symbol* format = find(symbols, "format_name");
    ASSERT_NE(format, nullptr);
    EXPECT_EQ(format->call_dependencies, (std::set<std::string>{"strip", "title"}));
}

TEST(PythonExtractorTest, ExtractsImports) {
    PythonExtractor extractor;
    auto symbols = extractor.extract("greeter.py", kSample);

    const Symbol* os = find(symbols, "os");
    ASSERT_NE(os, nullptr);
    EXPECT_EQ(os->kind, SymbolKind::Import);
    EXPECT_EQ(os->definition, "import os");
    EXPECT_EQ(os->line_number, 14);

    const Symbol* os_path = find(symbols, "os.path");
    ASSERT_NE(os_path, nullptr);
    EXPECT_EQ(os_path->line_number, 15);

    const Symbol* ordered = find(symbols, "collections.OrderedDict");
    ASSERT_NE(ordered, nullptr);
    EXPECT_EQ(ordered->definition, "from collections import OrderedDict");
    EXPECT_EQ(ordered->line_number, 16);
    EXPECT_NE(find(symbols, "collections.defaultdict"), nullptr);

    EXPECT_FALSE(ordered->is_graph_node());
}

TEST(PythonExtractorTest, SyntaxErrorRaisesParseError) {
    PythonExtractor extractor;
    EXPECT_THROW(extractor.extract("broken.py", "def broken(:\n    pass\n"), ParseError);
}

TEST(PythonExtractorTest, EmptyFileHasNoSymbols) {
    PythonExtractor extractor;
    EXPECT_TRUE(extractor.extract("empty.py", "").empty());
}

TEST(PythonExtractorTest, CleanDocstringStripsQuotesAndIndent) {
    EXPECT_EQ(PythonExtractor::clean_docstring("\"\"\"One line.\"\"\""), "One line.");
    EXPECT_EQ(PythonExtractor::clean_docstring("r'raw'"), "raw");
    EXPECT_EQ(PythonExtractor::clean_docstring("\"\"\"\n    Body.\n    \"\"\""), "Body.");
}
