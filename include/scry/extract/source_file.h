#pragma once

#include <cstdint>
#include <filesystem>
#include <string>
#include <string_view>
#include <vector>

#include <scry/core/types.h>

namespace scry::extract {

/**
 * @brief One file's bytes plus its path relative to the scan root
 */
struct SourceFile {
    std::filesystem::path absolute_path;
    std::string relative_path; // generic format, '/' separated
    std::string content;

    // Lines as in str.splitlines(): a trailing newline does not open an extra line
    [[nodiscard]] std::vector<std::string_view> lines() const;
    [[nodiscard]] uint32_t lineCount() const noexcept;

    [[nodiscard]] std::string extension() const;
};

/**
 * @brief Read a file below root
 *
 * Fails with FileNotFound / PermissionDenied when the file cannot be read.
 */
Result<SourceFile> readSourceFile(const std::filesystem::path& root,
                                  const std::filesystem::path& file);

// Builds a SourceFile from in-memory content (used by tests and callers holding the bytes)
SourceFile makeSourceFile(std::string relativePath, std::string content);

// NUL bytes in the first block mark the content as binary
bool looksBinary(std::string_view content) noexcept;

std::string relativePathString(const std::filesystem::path& root,
                               const std::filesystem::path& file);

} // namespace scry::extract
