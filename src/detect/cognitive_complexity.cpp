#include <scry/core/format.h>
#include <scry/detect/cognitive_complexity.h>

#include <algorithm>
#include <array>
#include <cctype>

namespace scry::detect {

namespace {

constexpr std::array<std::string_view, 7> kBranchKeywords = {"if",     "elif",  "for", "while",
                                                             "except", "catch", "case"};

uint32_t indentWidth(std::string_view line) {
    uint32_t width = 0;
    for (char c : line) {
        if (c == ' ')
            width += 1;
        else if (c == '\t')
            width += 4;
        else
            break;
    }
    return width;
}

std::string_view stripLeading(std::string_view line) {
    size_t i = 0;
    while (i < line.size() && std::isspace(static_cast<unsigned char>(line[i])))
        ++i;
    return line.substr(i);
}

bool isCodeLine(std::string_view line) {
    auto text = stripLeading(line);
    if (text.empty())
        return false;
    if (text.front() == '#')
        return false;
    if (text.starts_with("//") || text.starts_with("/*") || text.starts_with("*"))
        return false;
    return true;
}

bool isWordChar(char c) {
    return std::isalnum(static_cast<unsigned char>(c)) || c == '_';
}

bool hasBranchKeyword(std::string_view line) {
    size_t i = 0;
    while (i < line.size()) {
        if (!isWordChar(line[i])) {
            ++i;
            continue;
        }
        size_t start = i;
        while (i < line.size() && isWordChar(line[i]))
            ++i;
        auto word = line.substr(start, i - start);
        if (std::find(kBranchKeywords.begin(), kBranchKeywords.end(), word) !=
            kBranchKeywords.end())
            return true;
    }
    return false;
}

} // namespace

uint32_t estimateCognitiveComplexity(const std::vector<std::string_view>& functionLines) {
    uint32_t score = 0;
    std::optional<uint32_t> base;

    for (auto line : functionLines) {
        if (!isCodeLine(line))
            continue;

        uint32_t indent = indentWidth(line);
        if (!base) {
            base = indent;
            continue;
        }

        uint32_t nesting = indent > *base ? (indent - *base) / 4 : 0;
        if (nesting > 1)
            score += nesting - 1;
        if (hasBranchKeyword(line))
            score += 1;
    }
    return score;
}

std::optional<Finding> checkCognitiveComplexity(const graph::CodeNode& node,
                                                const std::vector<std::string_view>& fileLines,
                                                const config::Thresholds& thresholds) {
    if (!node.isCallable() || node.start_line == 0 || node.start_line > fileLines.size()) {
        return std::nullopt;
    }

    auto first = fileLines.begin() + (node.start_line - 1);
    auto last = fileLines.begin() +
                std::min<size_t>(fileLines.size(), std::max(node.end_line, node.start_line));
    uint32_t score = estimateCognitiveComplexity(std::vector<std::string_view>(first, last));
    if (score <= thresholds.cognitiveComplexity) {
        return std::nullopt;
    }

    Finding finding;
    finding.kind = FindingKind::CognitiveComplexity;
    finding.severity = Severity::High;
    finding.file = node.file_path;
    finding.line = node.start_line;
    finding.message = scry::format("Function `{}` has cognitive complexity {} (threshold: {}).",
                                   node.name, score, thresholds.cognitiveComplexity);
    finding.suggested_action = "Flatten nesting with early returns or extract helpers.";
    finding.metadata = {{"symbol", node.name},
                        {"score", score},
                        {"threshold", thresholds.cognitiveComplexity}};
    return finding;
}

} // namespace scry::detect
