#pragma once

#include <filesystem>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include <scry/analysis/code_intel_pipeline.h>
#include <scry/detect/finding.h>

namespace scry::aggregate {

struct ScanResult {
    std::filesystem::path root;
    std::map<std::string, size_t> languages;
    std::optional<std::string> primary_language;
    std::map<std::string, std::vector<std::string>> dependencies;
    std::vector<std::string> frameworks;

    // Shared with the scan cache; never null after a successful scan
    std::shared_ptr<const analysis::CodeIntelligence> intelligence;

    std::vector<detect::Finding> findings; // code intelligence + manifest findings, sorted
    nlohmann::json health_signals = nlohmann::json::object();

    const graph::CodeGraph& codeGraph() const;

    nlohmann::json toJson() const;
};

} // namespace scry::aggregate
