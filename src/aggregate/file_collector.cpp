#include <scry/aggregate/file_collector.h>

#include <spdlog/spdlog.h>

#include <algorithm>
#include <cctype>
#include <set>
#include <system_error>

namespace scry::aggregate {

namespace {

struct LanguageEntry {
    std::string_view extension;
    std::string_view language;
};

constexpr LanguageEntry kLanguages[] = {
    {".py", "python"},      {".pyi", "python"},     {".ts", "typescript"},  {".tsx", "typescript"},
    {".js", "javascript"},  {".jsx", "javascript"}, {".mjs", "javascript"}, {".cjs", "javascript"},
    {".go", "go"},          {".rs", "rust"},        {".java", "java"},      {".kt", "kotlin"},
    {".c", "c"},            {".h", "c"},            {".cc", "cpp"},         {".cpp", "cpp"},
    {".cxx", "cpp"},        {".hpp", "cpp"},        {".hh", "cpp"},         {".cs", "csharp"},
    {".rb", "ruby"},        {".php", "php"},        {".swift", "swift"},    {".scala", "scala"},
};

} // namespace

std::vector<std::filesystem::path> collectFiles(const std::filesystem::path& root,
                                                const std::vector<std::string>& ignoreDirs) {
    std::vector<std::filesystem::path> files;
    const std::set<std::string, std::less<>> ignored(ignoreDirs.begin(), ignoreDirs.end());

    std::error_code ec;
    std::filesystem::recursive_directory_iterator it(
        root, std::filesystem::directory_options::skip_permission_denied, ec);
    if (ec) {
        spdlog::warn("[FileCollector] Cannot walk {}: {}", root.string(), ec.message());
        return files;
    }

    for (const std::filesystem::recursive_directory_iterator end; it != end; it.increment(ec)) {
        if (ec) {
            spdlog::warn("[FileCollector] Walk of {} stopped early: {}", root.string(),
                         ec.message());
            break;
        }
        const auto& entry = *it;
        std::error_code statEc;
        if (entry.is_directory(statEc)) {
            if (ignored.contains(entry.path().filename().string()))
                it.disable_recursion_pending();
            continue;
        }
        if (entry.is_regular_file(statEc)) {
            files.push_back(entry.path());
        }
    }

    std::sort(files.begin(), files.end());
    spdlog::debug("[FileCollector] {} files under {}", files.size(), root.string());
    return files;
}

std::optional<std::string_view> languageOf(const std::filesystem::path& file) {
    std::string ext = file.extension().string();
    std::transform(ext.begin(), ext.end(), ext.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    for (const auto& entry : kLanguages) {
        if (entry.extension == ext)
            return entry.language;
    }
    return std::nullopt;
}

std::map<std::string, size_t> countLanguages(const std::vector<std::filesystem::path>& files) {
    std::map<std::string, size_t> counts;
    for (const auto& file : files) {
        if (auto language = languageOf(file))
            ++counts[std::string(*language)];
    }
    return counts;
}

std::optional<std::string> primaryLanguage(const std::map<std::string, size_t>& languages) {
    std::optional<std::string> best;
    size_t bestCount = 0;
    // std::map iterates alphabetically, so the first maximum wins ties
    for (const auto& [language, count] : languages) {
        if (count > bestCount) {
            best = language;
            bestCount = count;
        }
    }
    return best;
}

} // namespace scry::aggregate
