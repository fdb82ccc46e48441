#include <scry/detect/finding.h>

#include <algorithm>
#include <array>
#include <tuple>
#include <utility>

namespace scry::detect {

namespace {

constexpr std::array<std::pair<FindingKind, std::string_view>, 11> kKindNames = {{
    {FindingKind::MissingTypeHint, "missing-type-hint"},
    {FindingKind::MonolithFunction, "monolith-function"},
    {FindingKind::FunctionTooLong, "function-too-long"},
    {FindingKind::FileTooLong, "file-too-long"},
    {FindingKind::CognitiveComplexity, "cognitive-complexity"},
    {FindingKind::DuplicatePattern, "duplicate-pattern"},
    {FindingKind::LoopDataAccess, "loop-data-access"},
    {FindingKind::NestedLoop, "nested-loop"},
    {FindingKind::HardcodedSecret, "hardcoded-secret"},
    {FindingKind::LeftoverTodo, "leftover-todo"},
    {FindingKind::ArchPurity, "arch-purity"},
}};

} // namespace

const char* toString(Severity severity) noexcept {
    switch (severity) {
        case Severity::Low: return "LOW";
        case Severity::Medium: return "MEDIUM";
        case Severity::High: return "HIGH";
        case Severity::Critical: return "CRITICAL";
    }
    return "LOW";
}

const char* toString(FindingKind kind) noexcept {
    for (const auto& [k, name] : kKindNames) {
        if (k == kind)
            return name.data();
    }
    return "unknown";
}

const char* toString(CheckStatus status) noexcept {
    switch (status) {
        case CheckStatus::Pass: return "PASS";
        case CheckStatus::Warn: return "WARN";
        case CheckStatus::Fail: return "FAIL";
    }
    return "PASS";
}

std::optional<Severity> parseSeverity(std::string_view text) noexcept {
    if (text == "LOW")
        return Severity::Low;
    if (text == "MEDIUM")
        return Severity::Medium;
    if (text == "HIGH")
        return Severity::High;
    if (text == "CRITICAL")
        return Severity::Critical;
    return std::nullopt;
}

std::optional<FindingKind> parseFindingKind(std::string_view text) noexcept {
    for (const auto& [kind, name] : kKindNames) {
        if (name == text)
            return kind;
    }
    return std::nullopt;
}

bool Finding::operator==(const Finding& other) const {
    return kind == other.kind && severity == other.severity && file == other.file &&
           line == other.line && message == other.message &&
           suggested_action == other.suggested_action && metadata == other.metadata;
}

nlohmann::json toJson(const Finding& finding) {
    nlohmann::json out{{"kind", toString(finding.kind)},
                       {"severity", toString(finding.severity)},
                       {"file", finding.file},
                       {"message", finding.message},
                       {"suggested_action", finding.suggested_action},
                       {"metadata", finding.metadata}};
    if (finding.line) {
        out["line"] = *finding.line;
    } else {
        out["line"] = nullptr;
    }
    return out;
}

nlohmann::json toJson(const std::vector<Finding>& findings) {
    auto out = nlohmann::json::array();
    for (const auto& f : findings) {
        out.push_back(toJson(f));
    }
    return out;
}

void sortFindings(std::vector<Finding>& findings) {
    std::stable_sort(findings.begin(), findings.end(), [](const Finding& a, const Finding& b) {
        return std::tie(a.file, a.line, a.kind, a.message) <
               std::tie(b.file, b.line, b.kind, b.message);
    });
}

} // namespace scry::detect
