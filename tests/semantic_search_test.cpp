#include <gtest/gtest.h>
#include "python_extractor.hpp"
#include "semantic_search.hpp"
#include "test_support.hpp"

using namespace codescope;
using codescope::test::TempTree;

namespace {

const char* kUtil =
    "import os\n"                              // 1
    "\n"                                       // 2
    "def load_config(path):\n"                 // 3
    "    \"\"\"Load the config file.\"\"\"\n"  // 4
    "    return open(path)   \n"               // 5
    "\n"                                       // 6
    "def save_config(path, data):\n"           // 7
    "    pass\n";                              // 8

Symbol named(const std::string& name, const std::string& definition, std::optional<std::string> doc = std::nullopt) {
    Symbol s;
    s.name = name;
    s.file_path = "x.py";
    s.line_number = 1;
    s.definition = definition;
    s.docstring = std::move(doc);
    return s;
}

} // namespace

class SemanticSearchTest : public ::testing::Test {
protected:
    void SetUp() override {
        tree_.write("pkg/util.py", kUtil);
        tree_.write("other/tools.py", "def loader():\n    pass\n");

        PythonExtractor extractor;
        SymbolIndex index;
        index.upsert("other/tools.py", extractor.extract("other/tools.py", "def loader():\n    pass\n"));
        index.upsert("pkg/util.py", extractor.extract("pkg/util.py", kUtil));
        auto graph = DependencyGraphBuilder::build(index);

        IndexRequest request;
        request.root = tree_.str();
        snapshot_ = std::make_unique<IndexSnapshot>(1, tree_.root(), request, std::move(index), std::move(graph), 8);
    }

    TempTree tree_;
    std::unique_ptr<IndexSnapshot> snapshot_;
};

TEST(SemanticScoreTest, ExactNameScoresOne) {
    EXPECT_DOUBLE_EQ(SemanticSearchEngine::score("foo", named("foo", "def foo():")), 1.0);
    EXPECT_DOUBLE_EQ(SemanticSearchEngine::score("FOO", named("foo", "")), 1.0);
}

TEST(SemanticScoreTest, ContributionsStackAndCap) {
    // substring 0.7 + definition 0.3
    EXPECT_DOUBLE_EQ(SemanticSearchEngine::score("config", named("load_config", "def load_config():")), 1.0);
    // substring only
    EXPECT_DOUBLE_EQ(SemanticSearchEngine::score("config", named("load_config", "")), 0.7);
    // one query word in the name
    EXPECT_DOUBLE_EQ(SemanticSearchEngine::score("parse config", named("load_config", "")), 0.5);
    // docstring only
    EXPECT_DOUBLE_EQ(SemanticSearchEngine::score("settings", named("x", "", std::string("Reads SETTINGS"))), 0.4);
    EXPECT_DOUBLE_EQ(SemanticSearchEngine::score("nothing", named("x", "def x():")), 0.0);
}

TEST(SemanticScoreTest, ScoresStayInUnitInterval) {
    std::vector<std::string> queries = {"a", "load", "load config", "def", "", "config file path"};
    std::vector<Symbol> symbols = {
        named("load_config", "def load_config(path):", std::string("Load the config file.")),
        named("a", "def a():", std::string("a a a")),
        named("def", "def def():", std::string("def")),
    };
    for (const auto& q : queries) {
        for (const auto& s : symbols) {
            double score = SemanticSearchEngine::score(q, s);
            EXPECT_GE(score, 0.0);
            EXPECT_LE(score, 1.0);
        }
    }
}

TEST_F(SemanticSearchTest, ExactMatchRanksFirstWithContext) {
    SemanticSearchEngine engine(3);
    auto response = engine.search(*snapshot_, "load_config", "", 10);

    ASSERT_EQ(response.status, QueryStatus::Ok);
    ASSERT_FALSE(response.results.empty());

    const auto& top = response.results[0];
    EXPECT_EQ(top.file_path, "pkg/util.py");
    EXPECT_EQ(top.line_number, 3);
    EXPECT_DOUBLE_EQ(top.relevance_score, 1.0);
    EXPECT_EQ(top.match_type, MatchType::Exact);
    EXPECT_EQ(top.matched_text, "def load_config(path):");

    std::vector<std::string> before = {"import os", ""};
    std::vector<std::string> after = {"    \"\"\"Load the config file.\"\"\"", "    return open(path)", ""};
    EXPECT_EQ(top.context_before, before);
    EXPECT_EQ(top.context_after, after);
}

TEST_F(SemanticSearchTest, ResultsAreSortedAndTruncated) {
    SemanticSearchEngine engine(0);
    auto response = engine.search(*snapshot_, "config", "", 1);

    EXPECT_EQ(response.total_found, 2u);
    ASSERT_EQ(response.results.size(), 1u);
    EXPECT_EQ(response.results[0].line_number, 3);
    EXPECT_EQ(response.results[0].match_type, MatchType::Semantic);
    EXPECT_TRUE(response.results[0].context_before.empty());
}

TEST_F(SemanticSearchTest, SecondIdenticalQueryIsServedFromCache) {
    SemanticSearchEngine engine;
    auto first = engine.search(*snapshot_, "load", "", 10);
    auto second = engine.search(*snapshot_, "load", "", 10);

    EXPECT_FALSE(first.cached);
    EXPECT_TRUE(second.cached);
    EXPECT_EQ(first.total_found, second.total_found);
    EXPECT_EQ(snapshot_->search_cache().hits(), 1u);

    auto scoped = engine.search(*snapshot_, "load", "pkg", 10);
    EXPECT_FALSE(scoped.cached);
}

TEST_F(SemanticSearchTest, ScopeMatchesWholePathComponents) {
    SemanticSearchEngine engine;

    auto in_pkg = engine.search(*snapshot_, "load", "pkg", 10);
    ASSERT_FALSE(in_pkg.results.empty());
    for (const auto& r : in_pkg.results) EXPECT_EQ(r.file_path, "pkg/util.py");

    auto absolute = engine.search(*snapshot_, "load", (tree_.root() / "other").string(), 10);
    ASSERT_EQ(absolute.results.size(), 1u);
    EXPECT_EQ(absolute.results[0].file_path, "other/tools.py");

    EXPECT_TRUE(engine.search(*snapshot_, "load", "pk", 10).results.empty());
}

TEST_F(SemanticSearchTest, EmptyQueryReturnsNothing) {
    SemanticSearchEngine engine;
    auto response = engine.search(*snapshot_, "   ", "", 10);
    EXPECT_EQ(response.status, QueryStatus::Ok);
    EXPECT_TRUE(response.results.empty());
    EXPECT_EQ(snapshot_->search_cache().size(), 0u);
}
