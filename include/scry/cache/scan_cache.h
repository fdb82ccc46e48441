#pragma once

#include <cstddef>
#include <functional>
#include <map>
#include <memory>
#include <string>

#include <scry/analysis/code_intel_pipeline.h>
#include <scry/core/types.h>

namespace scry::cache {

/**
 * @brief Process-local memo table: scan key -> code intelligence
 *
 * The Aggregator keys entries by tree digest plus the threshold fingerprint, so one cache can be
 * shared between analyzers with different configs.
 * Entries live until clear() or destruction; nothing is persisted. Not synchronised: scans
 * that share one cache must be serialised by the caller.
 */
class ScanCache {
public:
    using Entry = std::shared_ptr<const analysis::CodeIntelligence>;

    /**
     * @brief Cached entry for digest, otherwise compute(), store and return it
     *
     * When the digest could not be computed the cache is bypassed: compute() runs and its
     * result is returned without being stored.
     */
    Entry getOrCompute(const Result<std::string>& digest,
                       const std::function<analysis::CodeIntelligence()>& compute);

    Entry find(const std::string& digest) const;
    void store(const std::string& digest, Entry entry);

    size_t size() const noexcept { return entries_.size(); }
    size_t hits() const noexcept { return hits_; }
    size_t misses() const noexcept { return misses_; }
    size_t bypasses() const noexcept { return bypasses_; }

    void clear();

private:
    std::map<std::string, Entry> entries_;
    size_t hits_ = 0;
    size_t misses_ = 0;
    size_t bypasses_ = 0;
};

} // namespace scry::cache
