#include <scry/core/format.h>
#include <scry/crypto/hasher.h>
#include <scry/detect/duplicate_pattern.h>

#include <algorithm>
#include <tuple>

namespace scry::detect {

std::string ConditionalChain::signature() const {
    std::string out;
    for (size_t i = 0; i < branches.size(); ++i) {
        if (i > 0)
            out += '|';
        out += branches[i];
    }
    return out;
}

DuplicatePatternDetector::DuplicatePatternDetector(const config::Thresholds& thresholds)
    : thresholds_(thresholds) {}

std::string DuplicatePatternDetector::signatureHash(const std::string& signature) {
    return crypto::SHA256Hasher::hash(std::string_view(signature));
}

void DuplicatePatternDetector::add(ConditionalChain chain) {
    if (chain.branches.size() < thresholds_.duplicateMinBranches) {
        return;
    }
    ++tracked_;
    groups_[signatureHash(chain.signature())].push_back(std::move(chain));
}

std::vector<Finding> DuplicatePatternDetector::findings() const {
    std::vector<Finding> out;

    for (const auto& [hash, chains] : groups_) {
        if (chains.size() < thresholds_.duplicateMinOccurrences) {
            continue;
        }

        std::vector<const ConditionalChain*> ordered;
        ordered.reserve(chains.size());
        for (const auto& chain : chains) {
            ordered.push_back(&chain);
        }
        std::sort(ordered.begin(), ordered.end(), [](const auto* a, const auto* b) {
            return std::tie(a->file, a->line) < std::tie(b->file, b->line);
        });

        auto locations = nlohmann::json::array();
        for (size_t i = 0; i < ordered.size() && i < thresholds_.duplicateEvidenceLimit; ++i) {
            locations.push_back({{"file", ordered[i]->file}, {"line", ordered[i]->line}});
        }

        const auto& first = *ordered.front();
        Finding finding;
        finding.kind = FindingKind::DuplicatePattern;
        finding.severity = Severity::Medium;
        finding.file = first.file;
        finding.line = first.line;
        finding.message =
            scry::format("Similar conditional pattern found {} times", chains.size());
        finding.suggested_action = "Extract the repeated branching into a shared helper function.";
        finding.metadata = {{"occurrences", chains.size()},
                            {"signature", first.signature()},
                            {"hash", hash},
                            {"locations", std::move(locations)}};
        out.push_back(std::move(finding));
    }

    sortFindings(out);
    return out;
}

} // namespace scry::detect
