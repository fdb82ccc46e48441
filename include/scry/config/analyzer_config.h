#pragma once

#include <cstdint>
#include <filesystem>
#include <map>
#include <string>
#include <vector>

#include <scry/core/types.h>

namespace scry::config {

struct Thresholds {
    uint32_t monolithLines = 60;            ///< python visitor: body longer than this
    uint32_t functionLength = 250;          ///< end_line - start_line above this
    uint32_t fileLengthWarn = 1000;         ///< MEDIUM finding per file
    uint32_t fileLengthFail = 2000;         ///< escalates the file-length verdict to CRITICAL
    uint32_t cognitiveComplexity = 8;       ///< score above this is HIGH
    uint32_t duplicateMinBranches = 3;      ///< shorter if/elif chains are ignored
    uint32_t duplicateMinOccurrences = 3;   ///< group size that counts as duplication
    uint32_t duplicateEvidenceLimit = 4;    ///< locations attached to one duplicate finding
};

// Stable text form of every threshold; equal fingerprints mean identical detector output
std::string fingerprint(const Thresholds& thresholds);

/**
 * @brief Analyzer settings; every field has a working default
 */
struct AnalyzerConfig {
    Thresholds thresholds;

    /// Directory names skipped by the file walk and the content digest
    std::vector<std::string> ignoreDirs = defaultIgnoreDirs();

    /// language -> directory or library path checked before the standard grammar locations
    std::map<std::string, std::filesystem::path> grammarPaths;

    static std::vector<std::string> defaultIgnoreDirs();
};

/**
 * @brief Load config from a TOML file, keeping defaults for anything missing
 *
 * Recognised keys:
 *   [thresholds] monolith_lines, function_length, file_length_warn, file_length_fail,
 *                cognitive_complexity, duplicate_min_branches, duplicate_min_occurrences,
 *                duplicate_evidence_limit
 *   [scan]       ignore_dirs = ["...", ...]
 *   [grammars]   <language> = "/path/to/libtree-sitter-<language>.so"
 */
Result<AnalyzerConfig> loadAnalyzerConfig(const std::filesystem::path& path);

/**
 * @brief Resolve config for a project: <root>/.scry.toml, then the user config file, then
 * defaults.
 */
AnalyzerConfig resolveAnalyzerConfig(const std::filesystem::path& projectRoot);

} // namespace scry::config
