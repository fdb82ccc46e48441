#include "grammar_fixture.h"
#include "test_helpers.h"
#include <gtest/gtest.h>
#include <scry/extract/python_visitor.h>

#include <algorithm>

using namespace scry;
using namespace scry::extract;
using namespace scry::test;

namespace {

std::vector<detect::Finding> ofKind(const FileExtraction& out, detect::FindingKind kind) {
    std::vector<detect::Finding> matching;
    std::copy_if(out.findings.begin(), out.findings.end(), std::back_inserter(matching),
                 [&](const auto& f) { return f.kind == kind; });
    return matching;
}

const graph::CodeNode* nodeNamed(const FileExtraction& out, std::string_view name) {
    auto it = std::find_if(out.nodes.begin(), out.nodes.end(),
                           [&](const auto& n) { return n.name == name; });
    return it == out.nodes.end() ? nullptr : &*it;
}

} // namespace

class PythonVisitorTest : public ::testing::Test {
protected:
    void SetUp() override {
        grammar = installedGrammar(".py");
        if (!grammar) {
            GTEST_SKIP() << "tree-sitter-python not installed";
        }
    }

    Result<FileExtraction> extract(std::string path, std::string content) {
        PythonVisitor visitor(*grammar, thresholds);
        return visitor.extract(makeSourceFile(std::move(path), std::move(content)));
    }

    const grammar::Grammar* grammar = nullptr;
    config::Thresholds thresholds;
};

TEST_F(PythonVisitorTest, SixtyLineFunctionWithoutAnnotation) {
    auto out = extract("a.py", pythonFunction("f", 60));
    ASSERT_TRUE(out) << out.error().message;
    const auto& result = out.value();

    ASSERT_EQ(result.nodes.size(), 2u);
    EXPECT_EQ(result.nodes[0].kind, graph::NodeKind::Module);
    EXPECT_EQ(result.nodes[0].name, "a.py");
    EXPECT_EQ(result.nodes[0].definitions, (std::vector<std::string>{"symbol:a.py:f"}));

    const auto& f = result.nodes[1];
    EXPECT_EQ(f.name, "f");
    EXPECT_EQ(f.kind, graph::NodeKind::Function);
    EXPECT_EQ(f.start_line, 1u);
    EXPECT_EQ(f.end_line, 60u);

    auto hints = ofKind(result, detect::FindingKind::MissingTypeHint);
    ASSERT_EQ(hints.size(), 1u);
    EXPECT_EQ(hints[0].severity, detect::Severity::Low);
    EXPECT_EQ(hints[0].line, 1u);
    EXPECT_TRUE(ofKind(result, detect::FindingKind::MonolithFunction).empty());
}

TEST_F(PythonVisitorTest, MonolithAboveSixtyLines) {
    auto out = extract("a.py", pythonFunction("g", 61, true));
    ASSERT_TRUE(out);
    auto monoliths = ofKind(out.value(), detect::FindingKind::MonolithFunction);
    ASSERT_EQ(monoliths.size(), 1u);
    EXPECT_EQ(monoliths[0].severity, detect::Severity::Medium);
    EXPECT_EQ(monoliths[0].metadata["lines"], 61);
    EXPECT_TRUE(ofKind(out.value(), detect::FindingKind::MissingTypeHint).empty());
}

TEST_F(PythonVisitorTest, PrivateFunctionsNeedNoTypeHint) {
    auto out = extract("a.py", "def _internal():\n    return 1\n");
    ASSERT_TRUE(out);
    EXPECT_TRUE(ofKind(out.value(), detect::FindingKind::MissingTypeHint).empty());
}

TEST_F(PythonVisitorTest, DataAccessInsideLoopIsFlagged) {
    auto out = extract("repo.py", R"(def load(ids) -> list:
    out = []
    for i in ids:
        out.append(db.get(i))
    return out


def single(i) -> object:
    return db.get(i)
)");
    ASSERT_TRUE(out) << out.error().message;

    auto hits = ofKind(out.value(), detect::FindingKind::LoopDataAccess);
    ASSERT_EQ(hits.size(), 1u);
    EXPECT_EQ(hits[0].severity, detect::Severity::High);
    EXPECT_EQ(hits[0].line, 4u);
    EXPECT_EQ(hits[0].metadata["receiver"], "db");
    EXPECT_EQ(hits[0].metadata["method"], "get");
    EXPECT_EQ(hits[0].metadata["symbol"], "load");
}

TEST_F(PythonVisitorTest, AttributeReceiverUsesLastSegment) {
    auto out = extract("svc.py", R"(class Service:
    def names(self, ids) -> list:
        return [self.session.query(i) for i in ids]

    def each(self, ids) -> None:
        for i in ids:
            self.session.query(i)
)");
    ASSERT_TRUE(out);
    auto hits = ofKind(out.value(), detect::FindingKind::LoopDataAccess);
    ASSERT_EQ(hits.size(), 1u);
    EXPECT_EQ(hits[0].line, 7u);
    EXPECT_EQ(hits[0].metadata["receiver"], "session");
}

TEST_F(PythonVisitorTest, LoopIterableAndElseClauseAreNotLoopContext) {
    auto out = extract("rows.py", R"(def rows(sql) -> None:
    for r in db.query(sql):
        pass
    else:
        db.execute(sql)
)");
    ASSERT_TRUE(out) << out.error().message;
    EXPECT_TRUE(ofKind(out.value(), detect::FindingKind::LoopDataAccess).empty());
}

TEST_F(PythonVisitorTest, ComplexityCountsStatementsNotComments) {
    auto out = extract("c.py", R"(def f() -> int:
    # setup
    x = 1
    # result
    return x
)");
    ASSERT_TRUE(out);
    const auto* f = nodeNamed(out.value(), "f");
    ASSERT_NE(f, nullptr);
    EXPECT_EQ(f->complexity, 2u);
}

TEST_F(PythonVisitorTest, NestedLoopReportedOncePerOuterLoop) {
    auto out = extract("grid.py", R"(def walk(rows) -> None:
    for row in rows:
        for cell in row:
            print(cell)
    for row in rows:
        print(row)
)");
    ASSERT_TRUE(out);
    auto nested = ofKind(out.value(), detect::FindingKind::NestedLoop);
    ASSERT_EQ(nested.size(), 1u);
    EXPECT_EQ(nested[0].line, 2u);
    EXPECT_EQ(nested[0].severity, detect::Severity::Medium);
}

TEST_F(PythonVisitorTest, CallsAttachToInnermostDefinition) {
    auto out = extract("svc.py", R"(import os, sys as system
from collections import OrderedDict


class Service:
    def run(self) -> None:
        helper()

        def inner() -> None:
            nested_call()

        return inner


def helper() -> None:
    print("x")
)");
    ASSERT_TRUE(out) << out.error().message;
    const auto& result = out.value();

    EXPECT_EQ(result.nodes[0].dependencies,
              (std::vector<std::string>{"os", "sys", "collections"}));

    const auto* service = nodeNamed(result, "Service");
    const auto* run = nodeNamed(result, "run");
    const auto* inner = nodeNamed(result, "inner");
    const auto* helper = nodeNamed(result, "helper");
    ASSERT_TRUE(service && run && inner && helper);

    EXPECT_EQ(service->kind, graph::NodeKind::Class);
    EXPECT_TRUE(service->dependencies.empty());
    EXPECT_EQ(run->dependencies, (std::vector<std::string>{"helper"}));
    EXPECT_EQ(inner->dependencies, (std::vector<std::string>{"nested_call"}));
    EXPECT_EQ(helper->dependencies, (std::vector<std::string>{"print"}));
    EXPECT_EQ(result.nodes[0].definitions.size(), 4u);
}

TEST_F(PythonVisitorTest, SameNameDefinitionsMergeIntoFirst) {
    auto out = extract("dup.py", R"(def f() -> None:
    a()


def f() -> None:
    b()
)");
    ASSERT_TRUE(out);
    const auto& nodes = out.value().nodes;
    ASSERT_EQ(nodes.size(), 2u);
    EXPECT_EQ(nodes[1].start_line, 1u);
    EXPECT_EQ(nodes[1].dependencies, (std::vector<std::string>{"a", "b"}));
}

TEST_F(PythonVisitorTest, CollectsConditionalChains) {
    auto out = extract("cls.py", R"(def classify(x, y) -> str:
    if x == 1:
        return "a"
    elif (x == 2):
        return "b"
    elif x and y:
        return "c"
    else:
        return "d"
)");
    ASSERT_TRUE(out);
    const auto& chains = out.value().chains;
    ASSERT_EQ(chains.size(), 1u);
    EXPECT_EQ(chains[0].line, 2u);
    EXPECT_EQ(chains[0].signature(), "CMP:==|CMP:==|BOOL:and|ELSE");
}

TEST_F(PythonVisitorTest, SyntaxErrorsFailTheFile) {
    auto out = extract("broken.py", "def broken(:\n    return\n");
    EXPECT_FALSE(out);
}
