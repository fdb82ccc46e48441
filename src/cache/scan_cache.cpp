#include <scry/cache/scan_cache.h>

#include <spdlog/spdlog.h>

namespace scry::cache {

ScanCache::Entry ScanCache::getOrCompute(
    const Result<std::string>& digest,
    const std::function<analysis::CodeIntelligence()>& compute) {
    if (!digest) {
        ++bypasses_;
        spdlog::warn("[ScanCache] Digest unavailable ({}), running uncached scan",
                     digest.error().message);
        return std::make_shared<const analysis::CodeIntelligence>(compute());
    }

    const auto& key = digest.value();
    if (auto entry = find(key)) {
        ++hits_;
        spdlog::debug("[ScanCache] hit {}", key.substr(0, 12));
        return entry;
    }

    ++misses_;
    spdlog::debug("[ScanCache] miss {}", key.substr(0, 12));
    auto entry = std::make_shared<const analysis::CodeIntelligence>(compute());
    store(key, entry);
    return entry;
}

ScanCache::Entry ScanCache::find(const std::string& digest) const {
    auto it = entries_.find(digest);
    return it == entries_.end() ? nullptr : it->second;
}

void ScanCache::store(const std::string& digest, Entry entry) {
    if (!entry)
        return;
    entries_.insert_or_assign(digest, std::move(entry));
}

void ScanCache::clear() {
    entries_.clear();
    hits_ = misses_ = bypasses_ = 0;
}

} // namespace scry::cache
