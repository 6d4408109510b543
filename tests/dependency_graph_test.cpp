#include <gtest/gtest.h>
#include "dependency_graph.hpp"

using namespace codescope;

namespace {

Symbol fn(const std::string& file, const std::string& name, std::set<std::string> calls = {}) {
    Symbol s;
    s.name = name;
    s.kind = SymbolKind::Function;
    s.file_path = file;
    s.line_number = 1;
    s.definition = "def " + name + "():";
    s.call_dependencies = std::move(calls);
    return s;
}

Symbol import_of(const std::string& file, const std::string& name) {
    Symbol s;
    s.name = name;
    s.kind = SymbolKind::Import;
    s.file_path = file;
    s.line_number = 1;
    s.definition = "import " + name;
    return s;
}

SymbolIndex sample_index() {
    SymbolIndex index;
    index.upsert("a.py", {fn("a.py", "foo"), import_of("a.py", "os")});
    index.upsert("b.py", {fn("b.py", "bar", {"foo", "print"})});
    index.upsert("c.py", {fn("c.py", "baz")});
    return index;
}

} // namespace

TEST(DependencyGraphTest, BuildsSymmetricEdges) {
    auto graph = DependencyGraphBuilder::build(sample_index());

    const auto* bar = graph.find("b.py::bar");
    const auto* foo = graph.find("a.py::foo");
    ASSERT_NE(bar, nullptr);
    ASSERT_NE(foo, nullptr);

    EXPECT_EQ(bar->depends_on, (std::set<std::string>{"a.py::foo"}));
    EXPECT_EQ(foo->depended_by, (std::set<std::string>{"b.py::bar"}));
    EXPECT_TRUE(graph.is_symmetric());
    EXPECT_EQ(graph.edge_count(), 1u);
}

TEST(DependencyGraphTest, ImportsAreNotNodes) {
    auto graph = DependencyGraphBuilder::build(sample_index());
    EXPECT_FALSE(graph.contains("a.py::os"));
    EXPECT_EQ(graph.node_count(), 3u);
}

TEST(DependencyGraphTest, UnresolvedCallsAreRecordedNotInvented) {
    auto graph = DependencyGraphBuilder::build(sample_index());

    const auto* bar = graph.find("b.py::bar");
    ASSERT_NE(bar, nullptr);
    EXPECT_TRUE(bar->is_external);
    EXPECT_EQ(bar->unresolved, (std::set<std::string>{"print"}));
    EXPECT_FALSE(graph.contains("print"));

    EXPECT_FALSE(graph.find("a.py::foo")->is_external);
}

TEST(DependencyGraphTest, RecursionAddsNoSelfEdge) {
    SymbolIndex index;
    index.upsert("r.py", {fn("r.py", "walk", {"walk"})});
    auto graph = DependencyGraphBuilder::build(index);

    const auto* walk = graph.find("r.py::walk");
    ASSERT_NE(walk, nullptr);
    EXPECT_TRUE(walk->depends_on.empty());
    EXPECT_TRUE(walk->depended_by.empty());
    EXPECT_FALSE(walk->is_external);
}

TEST(DependencyGraphTest, FirstIndexedDefinitionWinsResolution) {
    SymbolIndex index;
    index.upsert("z_first.py", {fn("z_first.py", "dup")});
    index.upsert("a_second.py", {fn("a_second.py", "dup")});
    index.upsert("caller.py", {fn("caller.py", "use", {"dup"})});

    auto graph = DependencyGraphBuilder::build(index);
    EXPECT_EQ(graph.find("caller.py::use")->depends_on, (std::set<std::string>{"z_first.py::dup"}));
    EXPECT_TRUE(graph.find("a_second.py::dup")->depended_by.empty());
}

TEST(DependencyGraphTest, RemoveNodeKeepsSymmetry) {
    auto graph = DependencyGraphBuilder::build(sample_index());
    graph.remove_node("a.py::foo");

    EXPECT_FALSE(graph.contains("a.py::foo"));
    EXPECT_TRUE(graph.find("b.py::bar")->depends_on.empty());
    EXPECT_TRUE(graph.is_symmetric());
}

TEST(DependencyGraphTest, AddEdgeRejectsSelfAndMissingEnds) {
    auto graph = DependencyGraphBuilder::build(sample_index());
    EXPECT_FALSE(graph.add_edge("c.py::baz", "c.py::baz"));
    EXPECT_FALSE(graph.add_edge("c.py::baz", "nowhere.py::x"));
    EXPECT_TRUE(graph.add_edge("c.py::baz", "a.py::foo"));
    EXPECT_TRUE(graph.is_symmetric());
}

TEST(DependencyGraphTest, RebuildWithNoChangesReturnsSameGraph) {
    auto index = sample_index();
    auto graph = DependencyGraphBuilder::build(index);
    auto again = DependencyGraphBuilder::rebuild(graph, index, index, {});
    EXPECT_TRUE(again == graph);
}

TEST(DependencyGraphTest, IncrementalRebuildMatchesFullBuildWhenDefinitionMoves) {
    auto before = sample_index();
    auto graph = DependencyGraphBuilder::build(before);

    // foo leaves a.py and reappears in a new file
    SymbolIndex after = before;
    after.upsert("a.py", {fn("a.py", "helper")});
    after.upsert("d.py", {fn("d.py", "foo")});

    auto incremental = DependencyGraphBuilder::rebuild(graph, before, after, {"a.py", "d.py"});
    auto full = DependencyGraphBuilder::build(after);

    EXPECT_TRUE(incremental == full);
    EXPECT_TRUE(incremental.is_symmetric());
    EXPECT_EQ(incremental.find("b.py::bar")->depends_on, (std::set<std::string>{"d.py::foo"}));
}

TEST(DependencyGraphTest, IncrementalRebuildMatchesFullBuildWhenFileRemoved) {
    auto before = sample_index();
    auto graph = DependencyGraphBuilder::build(before);

    SymbolIndex after = before;
    after.remove("a.py");

    auto incremental = DependencyGraphBuilder::rebuild(graph, before, after, {"a.py"});
    auto full = DependencyGraphBuilder::build(after);

    EXPECT_TRUE(incremental == full);
    const auto* bar = incremental.find("b.py::bar");
    ASSERT_NE(bar, nullptr);
    EXPECT_TRUE(bar->depends_on.empty());
    EXPECT_EQ(bar->unresolved, (std::set<std::string>{"foo", "print"}));
}

TEST(DependencyGraphTest, IncrementalRebuildPicksUpNewCaller) {
    auto before = sample_index();
    auto graph = DependencyGraphBuilder::build(before);

    SymbolIndex after = before;
    after.upsert("c.py", {fn("c.py", "baz", {"bar"})});

    auto incremental = DependencyGraphBuilder::rebuild(graph, before, after, {"c.py"});
    EXPECT_TRUE(incremental == DependencyGraphBuilder::build(after));
    EXPECT_EQ(incremental.find("b.py::bar")->depended_by, (std::set<std::string>{"c.py::baz"}));
}
