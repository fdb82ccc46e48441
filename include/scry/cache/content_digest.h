#pragma once

#include <filesystem>
#include <string>
#include <vector>

#include <scry/core/types.h>

namespace scry::cache {

/**
 * @brief SHA-256 over a whole file tree
 *
 * Files are hashed in relative-path order, each framed as
 * `<relative path> NUL <byte length> NUL <bytes>`, so renames and moves change the digest.
 * Files that cannot be read are skipped with a warning. Fails only when hashing itself fails.
 */
Result<std::string> treeDigest(const std::filesystem::path& root,
                               const std::vector<std::filesystem::path>& files);

/**
 * @brief SHA-256 of one file's bytes; the path does not take part
 */
Result<std::string> fileDigest(const std::filesystem::path& file);

} // namespace scry::cache
