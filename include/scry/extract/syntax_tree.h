#pragma once

extern "C" {
#include <tree_sitter/api.h>
}

#include <memory>
#include <string>
#include <string_view>
#include <vector>

#include <scry/core/types.h>
#include <scry/detect/duplicate_pattern.h>
#include <scry/detect/finding.h>
#include <scry/graph/code_graph.h>

namespace scry::extract {

/**
 * @brief A parsed file; owns the TSTree
 */
class SyntaxTree {
public:
    /**
     * @brief Parse content with the given language
     *
     * Fails with ParseError when the content looks binary, the parser cannot be set up, or the
     * tree contains syntax errors. Files that fail here are skipped by the pipeline.
     */
    static Result<SyntaxTree> parse(const TSLanguage* language, std::string_view content,
                                    std::string_view filePath);

    TSNode root() const noexcept { return ts_tree_root_node(tree_.get()); }

private:
    explicit SyntaxTree(TSTree* tree) : tree_(tree, ts_tree_delete) {}

    std::unique_ptr<TSTree, decltype(&ts_tree_delete)> tree_;
};

// Source text of a node; empty for null nodes or out-of-range spans
std::string nodeText(TSNode node, std::string_view content);

// 1-based line numbers from tree-sitter's 0-based points
inline uint32_t startLine(TSNode node) {
    return ts_node_start_point(node).row + 1;
}
inline uint32_t endLine(TSNode node) {
    return ts_node_end_point(node).row + 1;
}

TSNode childByField(TSNode node, std::string_view field);

// Line of the first ERROR or MISSING node below node
uint32_t firstErrorLine(TSNode node);

/**
 * @brief Everything extracted from one file
 */
struct FileExtraction {
    std::vector<graph::CodeNode> nodes; // module node first, then symbols in document order
    std::vector<detect::Finding> findings;
    std::vector<detect::ConditionalChain> chains;
};

} // namespace scry::extract
