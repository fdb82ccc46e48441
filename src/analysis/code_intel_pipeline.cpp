#include <scry/analysis/code_intel_pipeline.h>
#include <scry/core/format.h>
#include <scry/detect/cognitive_complexity.h>
#include <scry/detect/duplicate_pattern.h>
#include <scry/detect/line_scanner.h>
#include <scry/extract/python_visitor.h>
#include <scry/extract/query_extractor.h>

#include <spdlog/spdlog.h>

#include <algorithm>
#include <chrono>
#include <iterator>
#include <utility>

namespace scry::analysis {

nlohmann::json CodeIntelligence::summary() const {
    return {{"nodes", graph.size()},
            {"findings", findings.size()},
            {"files_analyzed", filesAnalyzed},
            {"files_skipped", skipped}};
}

CodeIntelPipeline::CodeIntelPipeline(const grammar::GrammarRegistry& registry,
                                     config::AnalyzerConfig config)
    : registry_(registry), config_(std::move(config)) {}

Result<extract::FileExtraction>
CodeIntelPipeline::extractFile(const extract::SourceFile& file) const {
    const auto* grammar = registry_.resolve(file.extension());
    if (!grammar) {
        return Error{ErrorCode::NotSupported,
                     scry::format("No grammar available for {}", file.relative_path)};
    }

    switch (grammar->strategy()) {
        case grammar::Strategy::Query:
            return extract::QueryExtractor(*grammar).extract(file);
        case grammar::Strategy::NativeVisitor:
            return extract::PythonVisitor(*grammar, config_.thresholds).extract(file);
    }
    return Error{ErrorCode::InternalError, "unknown extraction strategy"};
}

void CodeIntelPipeline::analyzeText(const extract::SourceFile& file, CodeIntelligence& out) const {
    auto lines = file.lines();
    auto scanned = detect::scanLines(file.relative_path, lines);
    std::move(scanned.begin(), scanned.end(), std::back_inserter(out.findings));

    uint32_t lineCount = file.lineCount();
    if (auto finding = detect::checkFileLength(file.relative_path, lineCount, config_.thresholds))
        out.findings.push_back(std::move(*finding));
    out.fileLength.observe(file.relative_path, lineCount);
}

void CodeIntelPipeline::analyzeNodes(const extract::SourceFile& file,
                                     const std::vector<graph::CodeNode>& nodes,
                                     std::vector<detect::Finding>& findings) const {
    auto lines = file.lines();
    for (const auto& node : nodes) {
        if (!node.isCallable())
            continue;
        if (auto finding = detect::checkFunctionLength(node, config_.thresholds))
            findings.push_back(std::move(*finding));
        if (auto finding = detect::checkCognitiveComplexity(node, lines, config_.thresholds))
            findings.push_back(std::move(*finding));
    }
}

CodeIntelligence CodeIntelPipeline::run(const std::filesystem::path& root,
                                        const std::vector<std::filesystem::path>& files) const {
    auto started = std::chrono::steady_clock::now();

    CodeIntelligence out;
    out.fileLength = detect::FileLengthVerdict(config_.thresholds);
    detect::DuplicatePatternDetector duplicates(config_.thresholds);

    std::vector<std::pair<std::string, std::filesystem::path>> ordered;
    ordered.reserve(files.size());
    for (const auto& file : files) {
        ordered.emplace_back(extract::relativePathString(root, file), file);
    }
    std::sort(ordered.begin(), ordered.end());

    for (const auto& [rel, path] : ordered) {
        // Only files a grammar could route count as skipped; other files get text checks only
        bool routable =
            grammar::GrammarRegistry::languageForExtension(path.extension().string()).has_value();

        auto source = extract::readSourceFile(root, path);
        if (!source) {
            if (routable) {
                spdlog::warn("[CodeIntel] Skipping {}: {}", rel, source.error().message);
                out.skipped.push_back(rel);
            } else {
                spdlog::debug("[CodeIntel] Ignoring {}: {}", rel, source.error().message);
            }
            continue;
        }
        const auto& file = source.value();
        if (extract::looksBinary(file.content)) {
            if (routable) {
                spdlog::warn("[CodeIntel] Skipping {}: binary content", rel);
                out.skipped.push_back(rel);
            }
            continue;
        }

        try {
            analyzeText(file, out);
            if (!routable)
                continue;

            auto extraction = extractFile(file);
            if (!extraction) {
                if (extraction.error().code == ErrorCode::NotSupported) {
                    spdlog::debug("[CodeIntel] {}: {}", rel, extraction.error().message);
                } else {
                    spdlog::warn("[CodeIntel] Skipping {}: {}", rel, extraction.error().message);
                    out.skipped.push_back(rel);
                }
                continue;
            }

            auto& result = extraction.value();
            analyzeNodes(file, result.nodes, out.findings);
            std::move(result.findings.begin(), result.findings.end(),
                      std::back_inserter(out.findings));
            for (auto& chain : result.chains) {
                duplicates.add(std::move(chain));
            }
            for (auto& node : result.nodes) {
                auto id = node.id();
                if (!out.graph.insert(std::move(node))) {
                    spdlog::debug("[CodeIntel] Duplicate node id {} ignored", id);
                }
            }
            ++out.filesAnalyzed;
        } catch (const std::exception& e) {
            spdlog::warn("[CodeIntel] Skipping {}: {}", rel, e.what());
            out.skipped.push_back(rel);
        }
    }

    auto duplicateFindings = duplicates.findings();
    std::move(duplicateFindings.begin(), duplicateFindings.end(),
              std::back_inserter(out.findings));
    detect::sortFindings(out.findings);

    auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - started);
    spdlog::info("[CodeIntel] {} files analyzed, {} skipped, {} nodes, {} findings in {} ms",
                 out.filesAnalyzed, out.skipped.size(), out.graph.size(), out.findings.size(),
                 elapsed.count());
    return out;
}

} // namespace scry::analysis
