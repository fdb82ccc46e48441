#pragma once

#include <scry/config/analyzer_config.h>
#include <scry/core/types.h>
#include <scry/extract/source_file.h>
#include <scry/extract/syntax_tree.h>
#include <scry/grammar/grammar_registry.h>

namespace scry::extract {

/**
 * @brief Single-pass Python visitor that collects symbols and findings together
 *
 * On each function or class definition it emits a CodeNode and checks, for functions,
 * missing-type-hint (LOW, public functions without a return annotation) and monolith-function
 * (MEDIUM, more than `monolithLines` lines). Calls become dependencies of the innermost
 * enclosing definition; a data-access call (see detect::isDataAccessCall) under a `for` loop
 * raises loop-data-access (HIGH). Every `for` containing another `for` raises nested-loop
 * (MEDIUM). if/elif/else chains are collected for the duplicate-pattern detector.
 */
class PythonVisitor {
public:
    PythonVisitor(const grammar::Grammar& grammar, const config::Thresholds& thresholds);

    Result<FileExtraction> extract(const SourceFile& file) const;

private:
    const grammar::Grammar& grammar_;
    config::Thresholds thresholds_;
};

} // namespace scry::extract
