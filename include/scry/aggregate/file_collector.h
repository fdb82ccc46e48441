#pragma once

#include <filesystem>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace scry::aggregate {

/**
 * @brief Regular files below root, skipping any directory whose name is in ignoreDirs
 *
 * Symlinked directories are not followed and unreadable directories are skipped. The result is
 * sorted.
 */
std::vector<std::filesystem::path> collectFiles(const std::filesystem::path& root,
                                                const std::vector<std::string>& ignoreDirs);

// Language name for a source file extension, nullopt for non-source files
std::optional<std::string_view> languageOf(const std::filesystem::path& file);

std::map<std::string, size_t> countLanguages(const std::vector<std::filesystem::path>& files);

// Highest count wins, ties go to the alphabetically first language
std::optional<std::string> primaryLanguage(const std::map<std::string, size_t>& languages);

} // namespace scry::aggregate
