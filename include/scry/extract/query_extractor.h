#pragma once

#include <scry/core/types.h>
#include <scry/extract/source_file.h>
#include <scry/extract/syntax_tree.h>
#include <scry/grammar/grammar_registry.h>

namespace scry::extract {

/**
 * @brief Symbol and call-edge extraction driven by a grammar's match queries
 *
 * Each match is classified by the roles of its captures:
 * - name + symbol capture: one CodeNode spanning the symbol node
 * - call capture: a dependency of the innermost symbol whose byte range contains the call
 * - import capture: a dependency of the module node
 * Anything else is dropped. The module node (name = file name, span = whole file) is always
 * emitted and lists every symbol id in `definitions`.
 */
class QueryExtractor {
public:
    explicit QueryExtractor(const grammar::Grammar& grammar);

    Result<FileExtraction> extract(const SourceFile& file) const;

private:
    const grammar::Grammar& grammar_;
};

} // namespace scry::extract
