#pragma once

#include <cstdint>
#include <optional>
#include <string_view>
#include <vector>

#include <scry/config/analyzer_config.h>
#include <scry/detect/finding.h>
#include <scry/graph/code_graph.h>

namespace scry::detect {

/**
 * @brief Indentation-based cognitive complexity estimate of a function body
 *
 * The first code line (blank and comment-only lines are skipped) sets the base indentation.
 * Every later code line at nesting level n = (indent - base) / 4 adds n - 1 when n > 1, and one
 * more when it contains a branching keyword (if, elif, for, while, except, catch, case).
 * Tabs count as four columns.
 */
uint32_t estimateCognitiveComplexity(const std::vector<std::string_view>& functionLines);

// cognitive-complexity (HIGH) for a function node whose score exceeds the threshold.
// fileLines holds the whole file; the node's span selects its lines.
std::optional<Finding> checkCognitiveComplexity(const graph::CodeNode& node,
                                                const std::vector<std::string_view>& fileLines,
                                                const config::Thresholds& thresholds);

} // namespace scry::detect
