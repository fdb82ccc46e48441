#include <scry/core/format.h>
#include <scry/extract/query_extractor.h>

#include <spdlog/spdlog.h>

#include <algorithm>
#include <filesystem>
#include <iterator>
#include <map>
#include <memory>
#include <type_traits>
#include <variant>

namespace scry::extract {

namespace {

graph::NodeKind toNodeKind(grammar::SymbolKind kind) {
    switch (kind) {
        case grammar::SymbolKind::Function: return graph::NodeKind::Function;
        case grammar::SymbolKind::Class: return graph::NodeKind::Class;
        case grammar::SymbolKind::Interface: return graph::NodeKind::Interface;
        case grammar::SymbolKind::Impl: return graph::NodeKind::Impl;
    }
    return graph::NodeKind::Function;
}

std::string stripQuotes(std::string text) {
    auto isQuote = [](char c) { return c == '"' || c == '\'' || c == '`'; };
    while (!text.empty() && isQuote(text.front()))
        text.erase(text.begin());
    while (!text.empty() && isQuote(text.back()))
        text.pop_back();
    return text;
}

struct SymbolMatch {
    std::string name;
    graph::NodeKind kind;
    TSNode node;
};

struct CallMatch {
    uint32_t offset;
    std::string callee;
};

// Byte range of a symbol and the arena slot it feeds
struct SymbolSpan {
    uint32_t startByte;
    uint32_t endByte;
    size_t slot;
};

} // namespace

QueryExtractor::QueryExtractor(const grammar::Grammar& grammar) : grammar_(grammar) {}

Result<FileExtraction> QueryExtractor::extract(const SourceFile& file) const {
    if (grammar_.strategy() != grammar::Strategy::Query || !grammar_.query()) {
        return Error{ErrorCode::InvalidState,
                     scry::format("{} grammar has no match query", grammar_.language())};
    }

    auto parsed = SyntaxTree::parse(grammar_.tsLanguage(), file.content, file.relative_path);
    if (!parsed) {
        return parsed.error();
    }
    const auto& tree = parsed.value();
    TSNode root = tree.root();

    graph::CodeNode module;
    module.name = std::filesystem::path(file.relative_path).filename().string();
    module.kind = graph::NodeKind::Module;
    module.file_path = file.relative_path;
    module.start_line = 1;
    module.end_line = std::max<uint32_t>(1, file.lineCount());
    module.complexity = ts_node_named_child_count(root);

    std::vector<SymbolMatch> symbols;
    std::vector<CallMatch> calls;

    auto cursorDeleter = [](TSQueryCursor* c) {
        if (c)
            ts_query_cursor_delete(c);
    };
    std::unique_ptr<TSQueryCursor, decltype(cursorDeleter)> cursor(ts_query_cursor_new(),
                                                                  cursorDeleter);
    if (!cursor) {
        return Error{ErrorCode::InternalError, "Failed to allocate query cursor"};
    }
    ts_query_cursor_exec(cursor.get(), grammar_.query(), root);

    TSQueryMatch match;
    while (ts_query_cursor_next_match(cursor.get(), &match)) {
        TSNode nameNode{};
        TSNode symbolNode{};
        bool hasName = false;
        bool hasSymbol = false;
        graph::NodeKind kind = graph::NodeKind::Function;

        for (uint16_t i = 0; i < match.capture_count; ++i) {
            const TSQueryCapture& capture = match.captures[i];
            std::visit(
                [&](const auto& role) {
                    using T = std::decay_t<decltype(role)>;
                    if constexpr (std::is_same_v<T, grammar::NameRole>) {
                        nameNode = capture.node;
                        hasName = true;
                    } else if constexpr (std::is_same_v<T, grammar::CallRole>) {
                        auto callee = nodeText(capture.node, file.content);
                        if (!callee.empty())
                            calls.push_back({ts_node_start_byte(capture.node), std::move(callee)});
                    } else if constexpr (std::is_same_v<T, grammar::ImportRole>) {
                        auto target = stripQuotes(nodeText(capture.node, file.content));
                        if (!target.empty())
                            module.addDependency(target);
                    } else {
                        static_assert(std::is_same_v<T, grammar::SymbolRole>,
                                      "unhandled capture role");
                        symbolNode = capture.node;
                        hasSymbol = true;
                        kind = toNodeKind(role.kind);
                    }
                },
                grammar_.role(capture.index));
        }

        if (hasName && hasSymbol) {
            auto name = nodeText(nameNode, file.content);
            if (!name.empty())
                symbols.push_back({std::move(name), kind, symbolNode});
        }
    }

    // Document order; an enclosing node sorts before the nodes it contains
    std::stable_sort(symbols.begin(), symbols.end(), [](const auto& a, const auto& b) {
        uint32_t as = ts_node_start_byte(a.node), bs = ts_node_start_byte(b.node);
        if (as != bs)
            return as < bs;
        return ts_node_end_byte(a.node) > ts_node_end_byte(b.node);
    });

    std::vector<graph::CodeNode> arena;
    std::map<std::string, size_t, std::less<>> slotByName;
    std::vector<SymbolSpan> spans;
    spans.reserve(symbols.size());

    for (auto& symbol : symbols) {
        SymbolSpan span{ts_node_start_byte(symbol.node), ts_node_end_byte(symbol.node), 0};
        if (auto it = slotByName.find(symbol.name); it != slotByName.end()) {
            // Same (file, name): calls inside this span feed the first definition
            span.slot = it->second;
            spans.push_back(span);
            continue;
        }

        graph::CodeNode node;
        node.name = symbol.name;
        node.kind = symbol.kind;
        node.file_path = file.relative_path;
        node.start_line = startLine(symbol.node);
        node.end_line = endLine(symbol.node);
        node.complexity = ts_node_child_count(symbol.node);
        module.addDefinition(node.id());

        span.slot = arena.size();
        slotByName.emplace(symbol.name, span.slot);
        spans.push_back(span);
        arena.push_back(std::move(node));
    }

    std::stable_sort(calls.begin(), calls.end(),
                     [](const auto& a, const auto& b) { return a.offset < b.offset; });

    // Sweep calls against the open symbol spans; the top of the stack is the innermost owner
    std::vector<const SymbolSpan*> open;
    size_t next = 0;
    size_t dropped = 0;
    for (const auto& call : calls) {
        while (next < spans.size() && spans[next].startByte <= call.offset) {
            while (!open.empty() && open.back()->endByte <= spans[next].startByte)
                open.pop_back();
            open.push_back(&spans[next]);
            ++next;
        }
        while (!open.empty() && open.back()->endByte <= call.offset)
            open.pop_back();

        if (open.empty()) {
            ++dropped;
            continue;
        }
        arena[open.back()->slot].addDependency(call.callee);
    }

    spdlog::debug("[QueryExtractor] {}: {} symbols, {} calls ({} outside any symbol), {} imports",
                  file.relative_path, arena.size(), calls.size(), dropped,
                  module.dependencies.size());

    FileExtraction out;
    out.nodes.reserve(arena.size() + 1);
    out.nodes.push_back(std::move(module));
    std::move(arena.begin(), arena.end(), std::back_inserter(out.nodes));
    return out;
}

} // namespace scry::extract
