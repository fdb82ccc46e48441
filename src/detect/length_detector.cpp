#include <scry/core/format.h>
#include <scry/detect/length_detector.h>

namespace scry::detect {

std::optional<Finding> checkFunctionLength(const graph::CodeNode& node,
                                           const config::Thresholds& thresholds) {
    if (!node.isCallable() || node.end_line < node.start_line) {
        return std::nullopt;
    }
    uint32_t length = node.end_line - node.start_line;
    if (length <= thresholds.functionLength) {
        return std::nullopt;
    }

    Finding finding;
    finding.kind = FindingKind::FunctionTooLong;
    finding.severity = Severity::Medium;
    finding.file = node.file_path;
    finding.line = node.start_line;
    finding.message = scry::format("Function `{}` spans {} lines (threshold: {}).", node.name,
                                   length, thresholds.functionLength);
    finding.suggested_action = "Split the function into smaller units.";
    finding.metadata = {{"symbol", node.name},
                        {"lines", length},
                        {"threshold", thresholds.functionLength}};
    return finding;
}

std::optional<Finding> checkFileLength(std::string_view file, uint32_t lineCount,
                                       const config::Thresholds& thresholds) {
    if (lineCount <= thresholds.fileLengthWarn) {
        return std::nullopt;
    }

    Finding finding;
    finding.kind = FindingKind::FileTooLong;
    finding.severity = Severity::Medium;
    finding.file = std::string(file);
    finding.message = scry::format("File has {} lines (threshold: {}).", lineCount,
                                   thresholds.fileLengthWarn);
    finding.suggested_action = "Refactor into smaller modules.";
    finding.metadata = {{"lines", lineCount}, {"threshold", thresholds.fileLengthWarn}};
    return finding;
}

FileLengthVerdict::FileLengthVerdict(const config::Thresholds& thresholds)
    : warnAbove_(thresholds.fileLengthWarn), failAbove_(thresholds.fileLengthFail) {}

void FileLengthVerdict::observe(std::string_view file, uint32_t lineCount) {
    if (lineCount > worstLines_ || (lineCount == worstLines_ && !worstFile_.empty() &&
                                    file < std::string_view(worstFile_))) {
        worstLines_ = lineCount;
        worstFile_ = std::string(file);
    }

    if (worstLines_ > failAbove_) {
        status_ = CheckStatus::Fail;
        severity_ = Severity::Critical;
    } else if (worstLines_ > warnAbove_) {
        status_ = CheckStatus::Warn;
        severity_ = Severity::Medium;
    }
}

nlohmann::json FileLengthVerdict::toJson() const {
    nlohmann::json j = {{"status", toString(status_)},
                        {"severity", toString(severity_)},
                        {"max_lines", worstLines_}};
    j["worst_file"] = worstFile_.empty() ? nlohmann::json(nullptr) : nlohmann::json(worstFile_);
    return j;
}

} // namespace scry::detect
