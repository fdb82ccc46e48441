#pragma once

#include <filesystem>
#include <map>
#include <string>
#include <vector>

#include <scry/core/types.h>
#include <scry/detect/finding.h>

namespace scry::aggregate {

struct ManifestReport {
    // ecosystem ("npm", "pip", "go", "cargo") -> declared package names
    std::map<std::string, std::vector<std::string>> dependencies;
    std::vector<std::string> frameworks;
    std::vector<detect::Finding> findings;
};

// dependencies + devDependencies keys
Result<std::vector<std::string>> parsePackageJson(const std::filesystem::path& path);
// requirement names, version specifiers, extras and options stripped
Result<std::vector<std::string>> parseRequirements(const std::filesystem::path& path);
// module paths of `require` lines and blocks
Result<std::vector<std::string>> parseGoMod(const std::filesystem::path& path);
// keys of the [dependencies] table
Result<std::vector<std::string>> parseCargoToml(const std::filesystem::path& path);

std::vector<std::string> detectFrameworks(
    const std::map<std::string, std::vector<std::string>>& dependencies);

/**
 * @brief Parse the manifests at the project root and derive frameworks and arch findings
 *
 * files is the collected file list, used to size the project for the Redux check. A manifest
 * that fails to parse is logged and left out.
 */
ManifestReport analyzeManifests(const std::filesystem::path& root,
                                const std::vector<std::filesystem::path>& files);

} // namespace scry::aggregate
