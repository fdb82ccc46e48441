#include <scry/core/format.h>
#include <scry/detect/loop_context.h>
#include <scry/extract/python_visitor.h>

#include <spdlog/spdlog.h>

#include <algorithm>
#include <cstring>
#include <filesystem>
#include <map>
#include <optional>

namespace scry::extract {

namespace {

bool isType(TSNode node, const char* type) {
    return std::strcmp(ts_node_type(node), type) == 0;
}

bool containsDescendant(TSNode node, const char* type) {
    uint32_t count = ts_node_named_child_count(node);
    for (uint32_t i = 0; i < count; ++i) {
        TSNode child = ts_node_named_child(node, i);
        if (isType(child, type) || containsDescendant(child, type))
            return true;
    }
    return false;
}

std::string classifyCondition(TSNode condition) {
    while (!ts_node_is_null(condition) && isType(condition, "parenthesized_expression") &&
           ts_node_named_child_count(condition) > 0) {
        condition = ts_node_named_child(condition, 0);
    }
    if (ts_node_is_null(condition))
        return "OTHER:none";

    if (isType(condition, "comparison_operator")) {
        std::string ops;
        uint32_t count = ts_node_child_count(condition);
        for (uint32_t i = 0; i < count; ++i) {
            TSNode child = ts_node_child(condition, i);
            if (ts_node_is_named(child))
                continue;
            if (!ops.empty())
                ops += ',';
            ops += ts_node_type(child);
        }
        return "CMP:" + ops;
    }
    if (isType(condition, "boolean_operator")) {
        TSNode op = childByField(condition, "operator");
        return std::string("BOOL:") + (ts_node_is_null(op) ? "and" : ts_node_type(op));
    }
    return std::string("OTHER:") + ts_node_type(condition);
}

uint32_t statementCount(TSNode definition) {
    TSNode body = childByField(definition, "body");
    if (ts_node_is_null(body))
        return 0;
    uint32_t statements = 0;
    uint32_t count = ts_node_named_child_count(body);
    for (uint32_t i = 0; i < count; ++i) {
        if (!isType(ts_node_named_child(body, i), "comment"))
            ++statements;
    }
    return statements;
}

/**
 * Walk state for one file. owners_ has one frame per enclosing definition (nullopt when the
 * definition had no usable name) so exits pop exactly what enters pushed.
 */
class Walk {
public:
    Walk(const SourceFile& file, const config::Thresholds& thresholds)
        : file_(file), thresholds_(thresholds) {
        module_.name = std::filesystem::path(file.relative_path).filename().string();
        module_.kind = graph::NodeKind::Module;
        module_.file_path = file.relative_path;
        module_.start_line = 1;
        module_.end_line = std::max<uint32_t>(1, file.lineCount());
    }

    void run(TSNode root) {
        module_.complexity = ts_node_named_child_count(root);

        TSTreeCursor cursor = ts_tree_cursor_new(root);
        struct CursorGuard {
            TSTreeCursor* c;
            ~CursorGuard() { ts_tree_cursor_delete(c); }
        } guard{&cursor};

        enter(root, nullptr);
        bool childrenDone = false;
        while (true) {
            if (!childrenDone && ts_tree_cursor_goto_first_child(&cursor)) {
                enter(ts_tree_cursor_current_node(&cursor),
                      ts_tree_cursor_current_field_name(&cursor));
                continue;
            }
            exit(ts_tree_cursor_current_node(&cursor));
            if (ts_tree_cursor_goto_next_sibling(&cursor)) {
                childrenDone = false;
                enter(ts_tree_cursor_current_node(&cursor),
                      ts_tree_cursor_current_field_name(&cursor));
                continue;
            }
            if (!ts_tree_cursor_goto_parent(&cursor))
                break;
            childrenDone = true;
        }
    }

    FileExtraction finish() {
        FileExtraction out;
        out.nodes.reserve(arena_.size() + 1);
        out.nodes.push_back(std::move(module_));
        for (auto& node : arena_)
            out.nodes.push_back(std::move(node));
        out.findings = std::move(findings_);
        out.chains = std::move(chains_);
        return out;
    }

private:
    void enter(TSNode node, const char* field) {
        if (isType(node, "function_definition")) {
            owners_.push_back(define(node, graph::NodeKind::Function));
        } else if (isType(node, "class_definition")) {
            owners_.push_back(define(node, graph::NodeKind::Class));
        } else if (isType(node, "for_statement")) {
            checkNestedLoop(node);
        } else if (isType(node, "call")) {
            onCall(node);
        } else if (isType(node, "import_statement")) {
            onImport(node);
        } else if (isType(node, "import_from_statement")) {
            auto moduleName = nodeText(childByField(node, "module_name"), file_.content);
            if (!moduleName.empty())
                module_.addDependency(moduleName);
        } else if (isType(node, "if_statement")) {
            collectChain(node);
        }
        ancestors_.push(ts_node_type(node), field ? field : "");
    }

    void exit(TSNode node) {
        ancestors_.pop();
        if ((isType(node, "function_definition") || isType(node, "class_definition")) &&
            !owners_.empty()) {
            owners_.pop_back();
        }
    }

    std::optional<size_t> define(TSNode node, graph::NodeKind kind) {
        auto name = nodeText(childByField(node, "name"), file_.content);
        if (name.empty())
            return std::nullopt;

        uint32_t start = startLine(node);
        uint32_t end = endLine(node);

        if (kind == graph::NodeKind::Function) {
            checkCallable(node, name, start, end);
        }

        if (auto it = slotByName_.find(name); it != slotByName_.end()) {
            return it->second;
        }

        graph::CodeNode symbol;
        symbol.name = name;
        symbol.kind = kind;
        symbol.file_path = file_.relative_path;
        symbol.start_line = start;
        symbol.end_line = end;
        symbol.complexity = statementCount(node);
        module_.addDefinition(symbol.id());

        size_t slot = arena_.size();
        slotByName_.emplace(std::move(name), slot);
        arena_.push_back(std::move(symbol));
        return slot;
    }

    void checkCallable(TSNode node, const std::string& name, uint32_t start, uint32_t end) {
        if (ts_node_is_null(childByField(node, "return_type")) && name.front() != '_') {
            detect::Finding finding;
            finding.kind = detect::FindingKind::MissingTypeHint;
            finding.severity = detect::Severity::Low;
            finding.file = file_.relative_path;
            finding.line = start;
            finding.message = scry::format("Function `{}` missing return type hint.", name);
            finding.suggested_action = "Add -> Type annotation.";
            finding.metadata = {{"symbol", name}};
            findings_.push_back(std::move(finding));
        }

        uint32_t lines = end - start + 1;
        if (lines > thresholds_.monolithLines) {
            detect::Finding finding;
            finding.kind = detect::FindingKind::MonolithFunction;
            finding.severity = detect::Severity::Medium;
            finding.file = file_.relative_path;
            finding.line = start;
            finding.message = scry::format("Function `{}` has {} lines ({} max).", name, lines,
                                           thresholds_.monolithLines);
            finding.suggested_action = "Extract smaller functions.";
            finding.metadata = {
                {"symbol", name}, {"lines", lines}, {"threshold", thresholds_.monolithLines}};
            findings_.push_back(std::move(finding));
        }
    }

    std::optional<size_t> currentOwner() const {
        for (auto it = owners_.rbegin(); it != owners_.rend(); ++it) {
            if (*it)
                return *it;
        }
        return std::nullopt;
    }

    void onCall(TSNode call) {
        TSNode callee = childByField(call, "function");
        if (ts_node_is_null(callee))
            return;

        std::string calleeName;
        if (isType(callee, "identifier")) {
            calleeName = nodeText(callee, file_.content);
        } else if (isType(callee, "attribute")) {
            calleeName = nodeText(childByField(callee, "attribute"), file_.content);
        }

        auto owner = currentOwner();
        if (owner && !calleeName.empty()) {
            arena_[*owner].addDependency(calleeName);
        }

        if (!isType(callee, "attribute") || !ancestors_.insideLoop())
            return;

        TSNode object = childByField(callee, "object");
        std::string receiver;
        if (!ts_node_is_null(object)) {
            if (isType(object, "identifier")) {
                receiver = nodeText(object, file_.content);
            } else if (isType(object, "attribute")) {
                receiver = nodeText(childByField(object, "attribute"), file_.content);
            }
        }
        if (!detect::isDataAccessCall(receiver, calleeName))
            return;

        detect::Finding finding;
        finding.kind = detect::FindingKind::LoopDataAccess;
        finding.severity = detect::Severity::High;
        finding.file = file_.relative_path;
        finding.line = startLine(call);
        finding.message = scry::format("`{}.{}()` called inside a loop (possible N+1 query).",
                                       receiver, calleeName);
        finding.suggested_action = "Batch the lookups before the loop or prefetch related rows.";
        finding.metadata = {{"receiver", receiver}, {"method", calleeName}};
        if (owner)
            finding.metadata["symbol"] = arena_[*owner].name;
        findings_.push_back(std::move(finding));
    }

    void checkNestedLoop(TSNode loop) {
        if (!containsDescendant(loop, "for_statement"))
            return;
        detect::Finding finding;
        finding.kind = detect::FindingKind::NestedLoop;
        finding.severity = detect::Severity::Medium;
        finding.file = file_.relative_path;
        finding.line = startLine(loop);
        finding.message = "Nested loop detected (O(n^2)).";
        finding.suggested_action = "Optimize algorithm or use hash maps.";
        findings_.push_back(std::move(finding));
    }

    void onImport(TSNode node) {
        uint32_t count = ts_node_named_child_count(node);
        for (uint32_t i = 0; i < count; ++i) {
            TSNode child = ts_node_named_child(node, i);
            TSNode target = isType(child, "aliased_import") ? childByField(child, "name") : child;
            auto name = nodeText(target, file_.content);
            if (!name.empty())
                module_.addDependency(name);
        }
    }

    void collectChain(TSNode ifNode) {
        detect::ConditionalChain chain;
        chain.file = file_.relative_path;
        chain.line = startLine(ifNode);
        chain.branches.push_back(classifyCondition(childByField(ifNode, "condition")));

        bool hasElse = false;
        uint32_t count = ts_node_named_child_count(ifNode);
        for (uint32_t i = 0; i < count; ++i) {
            TSNode child = ts_node_named_child(ifNode, i);
            if (isType(child, "elif_clause")) {
                chain.branches.push_back(classifyCondition(childByField(child, "condition")));
            } else if (isType(child, "else_clause")) {
                hasElse = true;
            }
        }
        if (hasElse)
            chain.branches.emplace_back("ELSE");
        chains_.push_back(std::move(chain));
    }

    const SourceFile& file_;
    const config::Thresholds& thresholds_;

    graph::CodeNode module_;
    std::vector<graph::CodeNode> arena_;
    std::map<std::string, size_t, std::less<>> slotByName_;
    std::vector<std::optional<size_t>> owners_;
    detect::AncestorStack ancestors_;
    std::vector<detect::Finding> findings_;
    std::vector<detect::ConditionalChain> chains_;
};

} // namespace

PythonVisitor::PythonVisitor(const grammar::Grammar& grammar, const config::Thresholds& thresholds)
    : grammar_(grammar), thresholds_(thresholds) {}

Result<FileExtraction> PythonVisitor::extract(const SourceFile& file) const {
    if (grammar_.strategy() != grammar::Strategy::NativeVisitor) {
        return Error{ErrorCode::InvalidState,
                     scry::format("{} grammar is not visited natively", grammar_.language())};
    }

    auto parsed = SyntaxTree::parse(grammar_.tsLanguage(), file.content, file.relative_path);
    if (!parsed) {
        return parsed.error();
    }

    Walk walk(file, thresholds_);
    walk.run(parsed.value().root());
    auto out = walk.finish();

    spdlog::debug("[PythonVisitor] {}: {} nodes, {} findings, {} if-chains", file.relative_path,
                  out.nodes.size(), out.findings.size(), out.chains.size());
    return out;
}

} // namespace scry::extract
