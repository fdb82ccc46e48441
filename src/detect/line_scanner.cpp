#include <scry/detect/line_scanner.h>

#include <regex>
#include <string>

namespace scry::detect {

namespace {

const std::regex& secretPattern() {
    static const std::regex re(R"((api_key|secret|password|token)\s*=\s*["'][A-Za-z0-9_\-]{8,}["'])",
                               std::regex_constants::icase);
    return re;
}

const std::regex& todoPattern() {
    static const std::regex re(R"((//|#)\s*(TODO|FIXME|XXX))", std::regex_constants::icase);
    return re;
}

} // namespace

std::vector<Finding> scanLines(std::string_view file, const std::vector<std::string_view>& lines) {
    std::vector<Finding> out;

    for (size_t i = 0; i < lines.size(); ++i) {
        const auto& text = lines[i];
        auto line = static_cast<uint32_t>(i + 1);

        if (std::regex_search(text.begin(), text.end(), secretPattern())) {
            Finding f;
            f.kind = FindingKind::HardcodedSecret;
            f.severity = Severity::Critical;
            f.file = std::string(file);
            f.line = line;
            f.message = "Potential hardcoded secret detected.";
            f.suggested_action = "Move to environment variables.";
            out.push_back(std::move(f));
        }

        if (std::regex_search(text.begin(), text.end(), todoPattern())) {
            Finding f;
            f.kind = FindingKind::LeftoverTodo;
            f.severity = Severity::Low;
            f.file = std::string(file);
            f.line = line;
            f.message = "Leftover TODO/FIXME comment.";
            f.suggested_action = "Resolve or track in backlog.";
            out.push_back(std::move(f));
        }
    }
    return out;
}

} // namespace scry::detect
