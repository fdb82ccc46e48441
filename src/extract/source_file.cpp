#include <scry/core/format.h>
#include <scry/extract/source_file.h>

#include <algorithm>
#include <cctype>
#include <fstream>
#include <iterator>
#include <system_error>

namespace scry::extract {

std::vector<std::string_view> SourceFile::lines() const {
    std::vector<std::string_view> out;
    std::string_view text(content);
    size_t start = 0;
    while (start < text.size()) {
        size_t nl = text.find('\n', start);
        if (nl == std::string_view::npos) {
            out.push_back(text.substr(start));
            break;
        }
        size_t end = nl;
        if (end > start && text[end - 1] == '\r')
            --end;
        out.push_back(text.substr(start, end - start));
        start = nl + 1;
    }
    return out;
}

uint32_t SourceFile::lineCount() const noexcept {
    if (content.empty())
        return 0;
    auto count = static_cast<uint32_t>(std::count(content.begin(), content.end(), '\n'));
    if (content.back() != '\n')
        ++count;
    return count;
}

std::string SourceFile::extension() const {
    std::string ext = std::filesystem::path(relative_path).extension().string();
    std::transform(ext.begin(), ext.end(), ext.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return ext;
}

std::string relativePathString(const std::filesystem::path& root,
                               const std::filesystem::path& file) {
    std::error_code ec;
    auto rel = std::filesystem::relative(file, root, ec);
    if (ec || rel.empty() || *rel.begin() == "..") {
        return file.filename().generic_string();
    }
    return rel.generic_string();
}

Result<SourceFile> readSourceFile(const std::filesystem::path& root,
                                  const std::filesystem::path& file) {
    std::error_code ec;
    if (!std::filesystem::is_regular_file(file, ec)) {
        return Error{ErrorCode::FileNotFound, scry::format("Not a readable file: {}", file.string())};
    }

    std::ifstream in(file, std::ios::binary);
    if (!in) {
        return Error{ErrorCode::PermissionDenied,
                     scry::format("Cannot open file: {}", file.string())};
    }

    SourceFile source;
    source.absolute_path = file;
    source.relative_path = relativePathString(root, file);
    source.content.assign(std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>());
    if (in.bad()) {
        return Error{ErrorCode::InvalidData, scry::format("Read error: {}", file.string())};
    }
    return source;
}

SourceFile makeSourceFile(std::string relativePath, std::string content) {
    SourceFile source;
    source.absolute_path = relativePath;
    source.relative_path = std::move(relativePath);
    source.content = std::move(content);
    return source;
}

bool looksBinary(std::string_view content) noexcept {
    constexpr size_t kProbe = 8192;
    auto probe = content.substr(0, std::min(content.size(), kProbe));
    return probe.find('\0') != std::string_view::npos;
}

} // namespace scry::extract
