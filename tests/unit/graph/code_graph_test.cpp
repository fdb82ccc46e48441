#include <gtest/gtest.h>
#include <scry/graph/code_graph.h>

using namespace scry::graph;

namespace {

CodeNode makeNode(std::string name, NodeKind kind, std::string file, uint32_t start = 1,
                  uint32_t end = 2) {
    CodeNode node;
    node.name = std::move(name);
    node.kind = kind;
    node.file_path = std::move(file);
    node.start_line = start;
    node.end_line = end;
    return node;
}

} // namespace

TEST(CodeGraphTest, IdsDistinguishModulesAndSymbols) {
    auto module = makeNode("a.py", NodeKind::Module, "pkg/a.py");
    auto fn = makeNode("f", NodeKind::Function, "pkg/a.py");
    EXPECT_EQ(module.id(), "module:pkg/a.py");
    EXPECT_EQ(fn.id(), "symbol:pkg/a.py:f");
}

TEST(CodeGraphTest, SameNameInDifferentFilesAreDistinctNodes) {
    CodeGraph graph;
    EXPECT_TRUE(graph.insert(makeNode("f", NodeKind::Function, "a.py")));
    EXPECT_TRUE(graph.insert(makeNode("f", NodeKind::Function, "b.py")));
    EXPECT_FALSE(graph.insert(makeNode("f", NodeKind::Function, "a.py", 10, 20)));

    EXPECT_EQ(graph.size(), 2u);
    EXPECT_EQ(graph.nodesNamed("f").size(), 2u);
    EXPECT_EQ(graph.find("symbol:a.py:f")->start_line, 1u);
}

TEST(CodeGraphTest, DependenciesAreDeduplicatedInFirstSeenOrder) {
    auto node = makeNode("f", NodeKind::Function, "a.py");
    EXPECT_TRUE(node.addDependency("print"));
    EXPECT_TRUE(node.addDependency("len"));
    EXPECT_FALSE(node.addDependency("print"));
    EXPECT_FALSE(node.addDependency(""));
    EXPECT_EQ(node.dependencies, (std::vector<std::string>{"print", "len"}));
}

TEST(CodeGraphTest, EdgesResolveAgainstSameFileSymbols) {
    CodeGraph graph;
    auto caller = makeNode("main", NodeKind::Function, "a.py");
    caller.addDependency("helper");
    caller.addDependency("print");
    graph.insert(std::move(caller));
    graph.insert(makeNode("helper", NodeKind::Function, "a.py"));
    graph.insert(makeNode("helper", NodeKind::Function, "b.py"));

    auto edges = graph.edges();
    ASSERT_EQ(edges.size(), 2u);
    EXPECT_EQ(edges[0].from, "symbol:a.py:main");
    EXPECT_EQ(edges[0].to, "symbol:a.py:helper");
    EXPECT_TRUE(edges[0].resolved);
    EXPECT_EQ(edges[1].to, "print");
    EXPECT_FALSE(edges[1].resolved);
}

TEST(CodeGraphTest, ValidityRequiresNameFileAndOrderedSpan) {
    EXPECT_TRUE(makeNode("f", NodeKind::Function, "a.py", 3, 3).is_valid());
    EXPECT_FALSE(makeNode("", NodeKind::Function, "a.py").is_valid());
    EXPECT_FALSE(makeNode("f", NodeKind::Function, "a.py", 0, 3).is_valid());
    EXPECT_FALSE(makeNode("f", NodeKind::Function, "a.py", 5, 4).is_valid());
}

TEST(CodeGraphTest, JsonKeyedById) {
    CodeGraph graph;
    auto fn = makeNode("f", NodeKind::Function, "a.py", 2, 9);
    fn.complexity = 3;
    graph.insert(std::move(fn));

    auto json = graph.toJson();
    ASSERT_TRUE(json.contains("symbol:a.py:f"));
    const auto& node = json["symbol:a.py:f"];
    EXPECT_EQ(node["name"], "f");
    EXPECT_EQ(node["type"], "function");
    EXPECT_EQ(node["file_path"], "a.py");
    EXPECT_EQ(node["start_line"], 2);
    EXPECT_EQ(node["end_line"], 9);
    EXPECT_EQ(node["complexity"], 3);
}

TEST(CodeGraphTest, NodeKindNamesRoundTrip) {
    for (auto kind : {NodeKind::Module, NodeKind::Class, NodeKind::Function, NodeKind::Interface,
                      NodeKind::Impl}) {
        EXPECT_EQ(parseNodeKind(toString(kind)), kind);
    }
    EXPECT_FALSE(parseNodeKind("struct").has_value());
}
