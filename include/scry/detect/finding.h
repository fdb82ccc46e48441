#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include <nlohmann/json.hpp>

namespace scry::detect {

enum class Severity { Low, Medium, High, Critical };

enum class FindingKind {
    MissingTypeHint,
    MonolithFunction,
    FunctionTooLong,
    FileTooLong,
    CognitiveComplexity,
    DuplicatePattern,
    LoopDataAccess,
    NestedLoop,
    HardcodedSecret,
    LeftoverTodo,
    ArchPurity
};

// Aggregate verdict of a whole check (e.g. file length across the tree)
enum class CheckStatus { Pass, Warn, Fail };

const char* toString(Severity severity) noexcept;
const char* toString(FindingKind kind) noexcept;
const char* toString(CheckStatus status) noexcept;

std::optional<Severity> parseSeverity(std::string_view text) noexcept;
std::optional<FindingKind> parseFindingKind(std::string_view text) noexcept;

/**
 * @brief A single detected issue
 *
 * Severity is fixed by the detector that raised the finding. kind, file and line are the
 * fields the persistence layer keys on, so detectors keep them stable across scans.
 */
struct Finding {
    FindingKind kind = FindingKind::MissingTypeHint;
    Severity severity = Severity::Low;
    std::string file;
    std::optional<uint32_t> line;
    std::string message;
    std::string suggested_action;
    nlohmann::json metadata = nlohmann::json::object();

    bool operator==(const Finding& other) const;
};

nlohmann::json toJson(const Finding& finding);
nlohmann::json toJson(const std::vector<Finding>& findings);

// Orders by file, line (unset first), kind, then message.
void sortFindings(std::vector<Finding>& findings);

} // namespace scry::detect
