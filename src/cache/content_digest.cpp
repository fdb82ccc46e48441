#include <scry/cache/content_digest.h>
#include <scry/core/format.h>
#include <scry/crypto/hasher.h>
#include <scry/extract/source_file.h>

#include <spdlog/spdlog.h>

#include <algorithm>
#include <fstream>
#include <system_error>
#include <utility>

namespace scry::cache {

namespace {

// Streams one framed file into the hasher; false when the file could not be read in full
bool hashFramed(crypto::IContentHasher& hasher, const std::string& relative,
                const std::filesystem::path& file) {
    std::error_code ec;
    auto size = std::filesystem::file_size(file, ec);
    if (ec) {
        return false;
    }
    std::ifstream in(file, std::ios::binary);
    if (!in) {
        return false;
    }

    // Read fully before hashing so a short read never leaves a half-written frame
    std::string content;
    content.resize(size);
    in.read(content.data(), static_cast<std::streamsize>(size));
    if (static_cast<uintmax_t>(in.gcount()) != size) {
        return false;
    }

    hasher.update(std::string_view(relative));
    hasher.update(std::string_view("\0", 1));
    hasher.update(std::string_view(std::to_string(size)));
    hasher.update(std::string_view("\0", 1));
    hasher.update(std::string_view(content));
    return true;
}

} // namespace

Result<std::string> treeDigest(const std::filesystem::path& root,
                               const std::vector<std::filesystem::path>& files) {
    std::vector<std::pair<std::string, std::filesystem::path>> ordered;
    ordered.reserve(files.size());
    for (const auto& file : files) {
        ordered.emplace_back(extract::relativePathString(root, file), file);
    }
    std::sort(ordered.begin(), ordered.end());

    try {
        auto hasher = crypto::createSHA256Hasher();
        hasher->init();
        size_t skipped = 0;
        for (const auto& [relative, file] : ordered) {
            if (!hashFramed(*hasher, relative, file)) {
                spdlog::warn("[ContentDigest] Skipping unreadable file {}", relative);
                ++skipped;
            }
        }
        auto digest = hasher->finalize();
        spdlog::debug("[ContentDigest] {} files ({} skipped) -> {}", ordered.size(), skipped,
                      digest.substr(0, 12));
        return digest;
    } catch (const std::exception& e) {
        return Error{ErrorCode::InternalError,
                     scry::format("Tree digest failed for {}: {}", root.string(), e.what())};
    }
}

Result<std::string> fileDigest(const std::filesystem::path& file) {
    try {
        crypto::SHA256Hasher hasher;
        return hasher.hashFile(file);
    } catch (const std::exception& e) {
        return Error{ErrorCode::InternalError, e.what()};
    }
}

} // namespace scry::cache
