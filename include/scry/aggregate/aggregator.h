#pragma once

#include <filesystem>
#include <memory>
#include <optional>
#include <vector>

#include <boost/asio/awaitable.hpp>
#include <nlohmann/json.hpp>

#include <scry/aggregate/manifest_analyzer.h>
#include <scry/aggregate/scan_result.h>
#include <scry/aggregate/vcs_probe.h>
#include <scry/cache/scan_cache.h>
#include <scry/config/analyzer_config.h>
#include <scry/core/types.h>
#include <scry/grammar/grammar_registry.h>

namespace scry::aggregate {

/**
 * @brief Whole-project scan: file walk, version-control probe, manifests and code intelligence
 *
 * Phases run one after another on the caller's executor; no two files are parsed concurrently.
 * The scan cache is the only state carried between scans, so scans sharing an Aggregator (or a
 * cache) must not overlap.
 */
class Aggregator {
public:
    explicit Aggregator(config::AnalyzerConfig config,
                        std::shared_ptr<grammar::GrammarRegistry> registry = nullptr,
                        std::shared_ptr<cache::ScanCache> cache = nullptr,
                        std::unique_ptr<IVersionControlProbe> vcs = nullptr);

    Aggregator(const Aggregator&) = delete;
    Aggregator& operator=(const Aggregator&) = delete;

    /**
     * @brief Scan root
     *
     * Without files the tree is walked with the configured ignore list; otherwise the
     * given absolute paths are used as-is. Fails only when root is not a directory.
     */
    boost::asio::awaitable<Result<ScanResult>>
    analyzeAsync(std::filesystem::path root,
                 std::optional<std::vector<std::filesystem::path>> files = std::nullopt);

    // Blocking wrappers driving analyzeAsync on a private io_context
    Result<ScanResult> analyze(const std::filesystem::path& root);
    Result<ScanResult> analyze(const std::filesystem::path& root,
                               std::vector<std::filesystem::path> files);

    const std::shared_ptr<cache::ScanCache>& cache() const noexcept { return cache_; }
    const grammar::GrammarRegistry& registry() const noexcept { return *registry_; }
    const config::AnalyzerConfig& config() const noexcept { return config_; }

private:
    boost::asio::awaitable<nlohmann::json> vcsPhase(const std::filesystem::path& root);
    boost::asio::awaitable<ManifestReport>
    dependencyPhase(const std::filesystem::path& root,
                    const std::vector<std::filesystem::path>& files);
    boost::asio::awaitable<cache::ScanCache::Entry>
    codeGraphPhase(const std::filesystem::path& root,
                   const std::vector<std::filesystem::path>& files);

    Result<ScanResult> runBlocking(std::filesystem::path root,
                                   std::optional<std::vector<std::filesystem::path>> files);

    config::AnalyzerConfig config_;
    std::shared_ptr<grammar::GrammarRegistry> registry_;
    std::shared_ptr<cache::ScanCache> cache_;
    std::unique_ptr<IVersionControlProbe> vcs_;
};

} // namespace scry::aggregate
