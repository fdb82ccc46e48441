#pragma once

#include <filesystem>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include <scry/config/analyzer_config.h>
#include <scry/core/types.h>
#include <scry/detect/finding.h>
#include <scry/detect/length_detector.h>
#include <scry/extract/source_file.h>
#include <scry/extract/syntax_tree.h>
#include <scry/graph/code_graph.h>
#include <scry/grammar/grammar_registry.h>

namespace scry::analysis {

/**
 * @brief Code graph and findings for one scanned tree
 *
 * Immutable once built; the scan cache hands the same instance to every scan of an unchanged
 * tree.
 */
struct CodeIntelligence {
    graph::CodeGraph graph;
    std::vector<detect::Finding> findings;
    detect::FileLengthVerdict fileLength;

    size_t filesAnalyzed = 0;            ///< files that produced a code graph
    std::vector<std::string> skipped;    ///< relative paths skipped after a per-file failure

    nlohmann::json summary() const;
};

/**
 * @brief Runs extraction and every detector over a file list
 *
 * Every readable text file gets the line-scan and file-length checks. Files are then routed by
 * extension through the grammar registry: query-based languages go to extract::QueryExtractor,
 * python to extract::PythonVisitor. A source file that cannot be read or parsed is logged and
 * skipped; the scan always continues with the remaining files.
 */
class CodeIntelPipeline {
public:
    CodeIntelPipeline(const grammar::GrammarRegistry& registry, config::AnalyzerConfig config);

    CodeIntelligence run(const std::filesystem::path& root,
                         const std::vector<std::filesystem::path>& files) const;

    /**
     * @brief Structural extraction of one file (no tree-wide detectors)
     *
     * NotSupported when no grammar is available for the file's extension.
     */
    Result<extract::FileExtraction> extractFile(const extract::SourceFile& file) const;

private:
    void analyzeText(const extract::SourceFile& file, CodeIntelligence& out) const;
    void analyzeNodes(const extract::SourceFile& file, const std::vector<graph::CodeNode>& nodes,
                      std::vector<detect::Finding>& findings) const;

    const grammar::GrammarRegistry& registry_;
    config::AnalyzerConfig config_;
};

} // namespace scry::analysis
