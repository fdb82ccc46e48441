#pragma once

#include <cstdint>
#include <map>
#include <string>
#include <vector>

#include <scry/config/analyzer_config.h>
#include <scry/detect/finding.h>

namespace scry::detect {

/**
 * @brief Structural shape of one if/elif/else chain
 *
 * One token per branch: "CMP:<ops>" for comparisons, "BOOL:and" / "BOOL:or" for boolean
 * operators, "OTHER:<node kind>" for anything else, plus a trailing "ELSE" when the chain ends in
 * an else branch.
 */
struct ConditionalChain {
    std::string file;
    uint32_t line = 0;
    std::vector<std::string> branches;

    [[nodiscard]] std::string signature() const; // tokens joined by '|'
};

/**
 * @brief Groups chains by signature hash and reports groups that repeat
 *
 * A group is reported once, at its first location, with up to `duplicateEvidenceLimit`
 * locations attached.
 */
class DuplicatePatternDetector {
public:
    explicit DuplicatePatternDetector(const config::Thresholds& thresholds = {});

    // Chains shorter than duplicateMinBranches are ignored
    void add(ConditionalChain chain);

    [[nodiscard]] size_t trackedChains() const noexcept { return tracked_; }

    [[nodiscard]] std::vector<Finding> findings() const;

    static std::string signatureHash(const std::string& signature);

private:
    config::Thresholds thresholds_;
    std::map<std::string, std::vector<ConditionalChain>> groups_;
    size_t tracked_ = 0;
};

} // namespace scry::detect
