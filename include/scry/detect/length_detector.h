#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

#include <nlohmann/json.hpp>

#include <scry/config/analyzer_config.h>
#include <scry/detect/finding.h>
#include <scry/graph/code_graph.h>

namespace scry::detect {

// function-too-long (MEDIUM) when end_line - start_line exceeds thresholds.functionLength
std::optional<Finding> checkFunctionLength(const graph::CodeNode& node,
                                           const config::Thresholds& thresholds);

// file-too-long (MEDIUM) when lineCount exceeds thresholds.fileLengthWarn
std::optional<Finding> checkFileLength(std::string_view file, uint32_t lineCount,
                                       const config::Thresholds& thresholds);

/**
 * @brief Tree-wide file length verdict, driven by the longest file
 *
 * PASS below the warn threshold, WARN/MEDIUM above it, FAIL/CRITICAL above the fail threshold.
 */
class FileLengthVerdict {
public:
    explicit FileLengthVerdict(const config::Thresholds& thresholds = {});

    void observe(std::string_view file, uint32_t lineCount);

    CheckStatus status() const noexcept { return status_; }
    Severity severity() const noexcept { return severity_; }
    const std::string& worstFile() const noexcept { return worstFile_; }
    uint32_t worstLines() const noexcept { return worstLines_; }

    nlohmann::json toJson() const;

private:
    uint32_t warnAbove_;
    uint32_t failAbove_;
    CheckStatus status_ = CheckStatus::Pass;
    Severity severity_ = Severity::Low;
    std::string worstFile_;
    uint32_t worstLines_ = 0;
};

} // namespace scry::detect
