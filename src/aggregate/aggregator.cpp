#include <scry/aggregate/aggregator.h>
#include <scry/aggregate/file_collector.h>
#include <scry/analysis/code_intel_pipeline.h>
#include <scry/cache/content_digest.h>
#include <scry/core/format.h>

#include <boost/asio/co_spawn.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/use_future.hpp>
#include <spdlog/spdlog.h>

#include <chrono>
#include <iterator>
#include <system_error>
#include <utility>

namespace scry::aggregate {

Aggregator::Aggregator(config::AnalyzerConfig config,
                       std::shared_ptr<grammar::GrammarRegistry> registry,
                       std::shared_ptr<cache::ScanCache> cache,
                       std::unique_ptr<IVersionControlProbe> vcs)
    : config_(std::move(config)), registry_(std::move(registry)), cache_(std::move(cache)),
      vcs_(std::move(vcs)) {
    if (!registry_)
        registry_ = std::make_shared<grammar::GrammarRegistry>(config_);
    if (!cache_)
        cache_ = std::make_shared<cache::ScanCache>();
    if (!vcs_)
        vcs_ = std::make_unique<GitPresenceProbe>();
}

boost::asio::awaitable<Result<ScanResult>>
Aggregator::analyzeAsync(std::filesystem::path root,
                         std::optional<std::vector<std::filesystem::path>> files) {
    std::error_code ec;
    if (!std::filesystem::is_directory(root, ec)) {
        co_return Error{ErrorCode::InvalidArgument,
                        scry::format("Scan root is not a directory: {}", root.string())};
    }

    auto started = std::chrono::steady_clock::now();
    std::vector<std::filesystem::path> tracked =
        files ? std::move(*files) : collectFiles(root, config_.ignoreDirs);
    spdlog::info("[Aggregator] Scanning {} ({} files)", root.string(), tracked.size());

    ScanResult result;
    result.root = root;
    result.languages = countLanguages(tracked);
    result.primary_language = primaryLanguage(result.languages);

    result.health_signals["git"] = co_await vcsPhase(root);

    auto manifests = co_await dependencyPhase(root, tracked);
    result.dependencies = std::move(manifests.dependencies);
    result.frameworks = std::move(manifests.frameworks);

    result.intelligence = co_await codeGraphPhase(root, tracked);

    result.findings = result.intelligence->findings;
    result.findings.insert(result.findings.end(),
                           std::make_move_iterator(manifests.findings.begin()),
                           std::make_move_iterator(manifests.findings.end()));
    detect::sortFindings(result.findings);

    result.health_signals["file_length"] = result.intelligence->fileLength.toJson();
    result.health_signals["code_intel"] = result.intelligence->summary();
    result.health_signals["cache"] = {{"entries", cache_->size()},
                                      {"hits", cache_->hits()},
                                      {"misses", cache_->misses()},
                                      {"bypasses", cache_->bypasses()}};

    auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - started);
    spdlog::info("[Aggregator] Scan of {} done: {} nodes, {} findings in {}ms", root.string(),
                 result.codeGraph().size(), result.findings.size(), elapsed.count());
    co_return std::move(result);
}

boost::asio::awaitable<nlohmann::json> Aggregator::vcsPhase(const std::filesystem::path& root) {
    auto signals = vcs_->probe(root);
    if (!signals) {
        spdlog::warn("[Aggregator] Version-control probe failed: {}", signals.error().message);
        co_return nlohmann::json{{"error", signals.error().message}};
    }
    co_return signals.value();
}

boost::asio::awaitable<ManifestReport>
Aggregator::dependencyPhase(const std::filesystem::path& root,
                            const std::vector<std::filesystem::path>& files) {
    co_return analyzeManifests(root, files);
}

boost::asio::awaitable<cache::ScanCache::Entry>
Aggregator::codeGraphPhase(const std::filesystem::path& root,
                           const std::vector<std::filesystem::path>& files) {
    // Cached results depend on the thresholds, so a shared cache keys them in
    auto digest = cache::treeDigest(root, files);
    Result<std::string> key = digest.error();
    if (digest) {
        key = digest.value() + "@" + config::fingerprint(config_.thresholds);
    }
    co_return cache_->getOrCompute(key, [&] {
        analysis::CodeIntelPipeline pipeline(*registry_, config_);
        return pipeline.run(root, files);
    });
}

Result<ScanResult> Aggregator::analyze(const std::filesystem::path& root) {
    return runBlocking(root, std::nullopt);
}

Result<ScanResult> Aggregator::analyze(const std::filesystem::path& root,
                                       std::vector<std::filesystem::path> files) {
    return runBlocking(root, std::move(files));
}

Result<ScanResult>
Aggregator::runBlocking(std::filesystem::path root,
                        std::optional<std::vector<std::filesystem::path>> files) {
    boost::asio::io_context io;
    std::optional<Result<ScanResult>> outcome;
    auto done = boost::asio::co_spawn(
        io,
        [&]() -> boost::asio::awaitable<void> {
            outcome.emplace(co_await analyzeAsync(std::move(root), std::move(files)));
        },
        boost::asio::use_future);

    try {
        io.run();
        done.get();
    } catch (const std::exception& e) {
        spdlog::error("[Aggregator] Scan aborted: {}", e.what());
        return Error{ErrorCode::InternalError, e.what()};
    }

    if (!outcome) {
        return Error{ErrorCode::InternalError, "Scan finished without a result"};
    }
    return std::move(*outcome);
}

} // namespace scry::aggregate
