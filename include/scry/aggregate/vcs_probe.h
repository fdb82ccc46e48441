#pragma once

#include <filesystem>

#include <nlohmann/json.hpp>

#include <scry/core/types.h>

namespace scry::aggregate {

/**
 * @brief Source of version-control health signals for a project root
 *
 * Commit counts and recency belong to an external collaborator; an implementation returns
 * whatever it knows as a JSON object merged into health_signals["git"].
 */
class IVersionControlProbe {
public:
    virtual ~IVersionControlProbe() = default;
    virtual Result<nlohmann::json> probe(const std::filesystem::path& root) = 0;
};

// Reports only whether root is a git working tree
class GitPresenceProbe : public IVersionControlProbe {
public:
    Result<nlohmann::json> probe(const std::filesystem::path& root) override;
};

} // namespace scry::aggregate
