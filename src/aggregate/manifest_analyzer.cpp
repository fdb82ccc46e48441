#include <scry/aggregate/manifest_analyzer.h>
#include <scry/config/config_helpers.h>
#include <scry/core/format.h>

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <cctype>
#include <fstream>
#include <set>
#include <sstream>
#include <utility>

namespace scry::aggregate {

namespace {

struct FrameworkPattern {
    std::string_view framework;
    std::vector<std::string_view> packages;
};

const std::vector<FrameworkPattern>& frameworkPatterns() {
    static const std::vector<FrameworkPattern> kPatterns = {
        {"FastAPI", {"fastapi"}},
        {"Django", {"django"}},
        {"Flask", {"flask"}},
        {"React", {"react", "react-dom"}},
        {"Next.js", {"next"}},
        {"Vue", {"vue"}},
        {"Tailwind CSS", {"tailwindcss"}},
        {"Express", {"express"}},
        {"Gin", {"github.com/gin-gonic/gin"}},
        {"Actix", {"actix-web"}},
        {"Axum", {"axum"}},
    };
    return kPatterns;
}

// Redux in fewer than this many .tsx components is flagged
constexpr size_t kReduxComponentCeiling = 20;

std::string toLower(std::string_view text) {
    std::string out(text);
    std::transform(out.begin(), out.end(), out.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return out;
}

Result<std::string> readText(const std::filesystem::path& path) {
    std::ifstream in(path, std::ios::binary);
    if (!in) {
        return Error{ErrorCode::FileNotFound, scry::format("Cannot open {}", path.string())};
    }
    std::ostringstream buffer;
    buffer << in.rdbuf();
    return buffer.str();
}

std::vector<std::string> splitLines(const std::string& text) {
    std::vector<std::string> lines;
    std::istringstream in(text);
    std::string line;
    while (std::getline(in, line)) {
        config::trim(line);
        lines.push_back(std::move(line));
    }
    return lines;
}

} // namespace

Result<std::vector<std::string>> parsePackageJson(const std::filesystem::path& path) {
    auto text = readText(path);
    if (!text) {
        return text.error();
    }

    try {
        auto doc = nlohmann::json::parse(text.value());
        if (!doc.is_object()) {
            return Error{ErrorCode::InvalidData,
                         scry::format("{} is not a JSON object", path.string())};
        }
        std::vector<std::string> deps;
        for (const char* section : {"dependencies", "devDependencies"}) {
            auto it = doc.find(section);
            if (it == doc.end() || !it->is_object())
                continue;
            for (const auto& [name, version] : it->items()) {
                deps.push_back(name);
            }
        }
        return deps;
    } catch (const nlohmann::json::exception& e) {
        return Error{ErrorCode::ParseError, scry::format("{}: {}", path.string(), e.what())};
    }
}

Result<std::vector<std::string>> parseRequirements(const std::filesystem::path& path) {
    auto text = readText(path);
    if (!text) {
        return text.error();
    }

    std::vector<std::string> deps;
    for (auto& line : splitLines(text.value())) {
        if (line.empty() || line.front() == '#' || line.front() == '-')
            continue;
        auto end = line.find_first_of("=<>!~;[ \t#@");
        std::string name = line.substr(0, end);
        config::trim(name);
        if (!name.empty())
            deps.push_back(std::move(name));
    }
    return deps;
}

Result<std::vector<std::string>> parseGoMod(const std::filesystem::path& path) {
    auto text = readText(path);
    if (!text) {
        return text.error();
    }

    std::vector<std::string> deps;
    bool inBlock = false;
    for (auto& line : splitLines(text.value())) {
        if (line.empty() || line.starts_with("//"))
            continue;

        std::string_view spec;
        if (inBlock) {
            if (line.front() == ')') {
                inBlock = false;
                continue;
            }
            spec = line;
        } else if (line.starts_with("require")) {
            std::string_view rest = std::string_view(line).substr(7);
            while (!rest.empty() && std::isspace(static_cast<unsigned char>(rest.front())))
                rest.remove_prefix(1);
            if (rest.starts_with("(")) {
                inBlock = true;
                continue;
            }
            spec = rest;
        } else {
            continue;
        }

        auto end = spec.find_first_of(" \t");
        auto module = spec.substr(0, end);
        if (!module.empty())
            deps.emplace_back(module);
    }
    return deps;
}

Result<std::vector<std::string>> parseCargoToml(const std::filesystem::path& path) {
    std::error_code ec;
    if (!std::filesystem::is_regular_file(path, ec)) {
        return Error{ErrorCode::FileNotFound, scry::format("Cannot open {}", path.string())};
    }
    std::vector<std::string> deps;
    for (auto& [name, value] : config::parse_config_section(path, "dependencies")) {
        deps.push_back(config::unquote(name));
    }
    return deps;
}

std::vector<std::string>
detectFrameworks(const std::map<std::string, std::vector<std::string>>& dependencies) {
    std::set<std::string, std::less<>> declared;
    for (const auto& [ecosystem, names] : dependencies) {
        for (const auto& name : names)
            declared.insert(toLower(name));
    }

    std::vector<std::string> frameworks;
    for (const auto& pattern : frameworkPatterns()) {
        bool present = std::any_of(pattern.packages.begin(), pattern.packages.end(),
                                   [&](std::string_view pkg) { return declared.contains(pkg); });
        if (present)
            frameworks.emplace_back(pattern.framework);
    }
    return frameworks;
}

ManifestReport analyzeManifests(const std::filesystem::path& root,
                                const std::vector<std::filesystem::path>& files) {
    ManifestReport report;

    using Parser = Result<std::vector<std::string>> (*)(const std::filesystem::path&);
    const std::pair<const char*, std::pair<const char*, Parser>> manifests[] = {
        {"package.json", {"npm", &parsePackageJson}},
        {"requirements.txt", {"pip", &parseRequirements}},
        {"go.mod", {"go", &parseGoMod}},
        {"Cargo.toml", {"cargo", &parseCargoToml}},
    };

    for (const auto& [fileName, target] : manifests) {
        auto path = root / fileName;
        std::error_code ec;
        if (!std::filesystem::exists(path, ec))
            continue;

        auto parsed = target.second(path);
        if (!parsed) {
            spdlog::warn("[Manifests] Ignoring {}: {}", fileName, parsed.error().message);
            continue;
        }
        spdlog::debug("[Manifests] {}: {} dependencies", fileName, parsed.value().size());
        report.dependencies[target.first] = std::move(parsed).value();
    }

    report.frameworks = detectFrameworks(report.dependencies);

    if (auto npm = report.dependencies.find("npm"); npm != report.dependencies.end()) {
        bool usesRedux = std::any_of(npm->second.begin(), npm->second.end(), [](const auto& d) {
            return toLower(d).find("redux") != std::string::npos;
        });
        if (usesRedux) {
            auto tsxCount = static_cast<size_t>(
                std::count_if(files.begin(), files.end(),
                              [](const auto& f) { return f.extension() == ".tsx"; }));
            if (tsxCount > 0 && tsxCount < kReduxComponentCeiling) {
                detect::Finding finding;
                finding.kind = detect::FindingKind::ArchPurity;
                finding.severity = detect::Severity::High;
                finding.file = "package.json";
                finding.message =
                    scry::format("Redux detected in small project ({} components).", tsxCount);
                finding.suggested_action = "Consider Zustand or React Context for better velocity.";
                finding.metadata = {{"tsx_files", tsxCount}};
                report.findings.push_back(std::move(finding));
            }
        }
    }
    return report;
}

} // namespace scry::aggregate
