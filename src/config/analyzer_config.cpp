#include <scry/config/analyzer_config.h>
#include <scry/config/config_helpers.h>
#include <scry/core/format.h>

#include <spdlog/spdlog.h>

#include <charconv>
#include <system_error>

namespace scry::config {

namespace {

void readThreshold(const std::filesystem::path& path, const char* key, uint32_t& target) {
    auto raw = parse_config_value(path, "thresholds", key);
    if (raw.empty()) {
        return;
    }
    uint32_t value = 0;
    auto [ptr, ec] = std::from_chars(raw.data(), raw.data() + raw.size(), value);
    if (ec != std::errc{} || ptr != raw.data() + raw.size() || value == 0) {
        spdlog::warn("[Config] Ignoring invalid thresholds.{} = '{}' in {}", key, raw,
                     path.string());
        return;
    }
    target = value;
}

} // namespace

std::string fingerprint(const Thresholds& t) {
    return scry::format("{}/{}/{}/{}/{}/{}/{}/{}", t.monolithLines, t.functionLength,
                        t.fileLengthWarn, t.fileLengthFail, t.cognitiveComplexity,
                        t.duplicateMinBranches, t.duplicateMinOccurrences,
                        t.duplicateEvidenceLimit);
}

std::vector<std::string> AnalyzerConfig::defaultIgnoreDirs() {
    return {".git",  ".svn",        ".hg",  "node_modules", "venv",   ".venv",
            "env",   "__pycache__", "dist", "build",        "target", "coverage"};
}

Result<AnalyzerConfig> loadAnalyzerConfig(const std::filesystem::path& path) {
    std::error_code ec;
    if (!std::filesystem::is_regular_file(path, ec)) {
        return Error{ErrorCode::FileNotFound,
                     scry::format("Config file not found: {}", path.string())};
    }

    AnalyzerConfig cfg;
    auto& t = cfg.thresholds;
    readThreshold(path, "monolith_lines", t.monolithLines);
    readThreshold(path, "function_length", t.functionLength);
    readThreshold(path, "file_length_warn", t.fileLengthWarn);
    readThreshold(path, "file_length_fail", t.fileLengthFail);
    readThreshold(path, "cognitive_complexity", t.cognitiveComplexity);
    readThreshold(path, "duplicate_min_branches", t.duplicateMinBranches);
    readThreshold(path, "duplicate_min_occurrences", t.duplicateMinOccurrences);
    readThreshold(path, "duplicate_evidence_limit", t.duplicateEvidenceLimit);

    if (t.fileLengthFail < t.fileLengthWarn) {
        spdlog::warn("[Config] file_length_fail ({}) below file_length_warn ({}); using {}",
                     t.fileLengthFail, t.fileLengthWarn, t.fileLengthWarn);
        t.fileLengthFail = t.fileLengthWarn;
    }

    if (auto dirs = parse_config_value(path, "scan", "ignore_dirs"); !dirs.empty()) {
        cfg.ignoreDirs = parse_list(dirs);
    }

    for (auto& [language, libPath] : parse_config_section(path, "grammars")) {
        if (!libPath.empty()) {
            cfg.grammarPaths[language] = expand_tilde(libPath);
        }
    }

    spdlog::debug("[Config] Loaded {} ({} ignore dirs, {} grammar overrides)", path.string(),
                  cfg.ignoreDirs.size(), cfg.grammarPaths.size());
    return cfg;
}

AnalyzerConfig resolveAnalyzerConfig(const std::filesystem::path& projectRoot) {
    for (const auto& candidate : {projectRoot / ".scry.toml", get_config_path()}) {
        std::error_code ec;
        if (!std::filesystem::exists(candidate, ec)) {
            continue;
        }
        auto loaded = loadAnalyzerConfig(candidate);
        if (loaded) {
            return std::move(loaded).value();
        }
        spdlog::warn("[Config] Failed to load {}: {}", candidate.string(),
                     loaded.error().message);
    }
    return AnalyzerConfig{};
}

} // namespace scry::config
