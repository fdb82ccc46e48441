#include <scry/config/config_helpers.h>
#include <scry/core/format.h>
#include <scry/grammar/grammar_loader.h>

#include <dlfcn.h>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <system_error>

extern "C" {
#include <tree_sitter/api.h>
}

namespace scry::grammar {

GrammarLoader::GrammarLoader(std::map<std::string, std::filesystem::path> overrides)
    : overrides_(std::move(overrides)) {}

GrammarLoader::~GrammarLoader() {
    for (void* handle : handles_) {
        if (handle)
            dlclose(handle);
    }
}

void GrammarLoader::addGrammarPath(std::string_view language, const std::filesystem::path& path) {
    overrides_[std::string(language)] = path;
}

bool GrammarLoader::isKnownLanguage(std::string_view language) noexcept {
    return findSpec(language) != nullptr;
}

const GrammarLoader::GrammarSpec* GrammarLoader::findSpec(std::string_view language) noexcept {
    for (const auto& spec : kSpecs) {
        if (spec.key.size() != language.size())
            continue;
        bool same = std::equal(spec.key.begin(), spec.key.end(), language.begin(),
                               [](char a, char b) {
                                   return std::tolower(static_cast<unsigned char>(a)) ==
                                          std::tolower(static_cast<unsigned char>(b));
                               });
        if (same)
            return &spec;
    }
    return nullptr;
}

std::vector<std::filesystem::path> GrammarLoader::searchDirectories() const {
    std::vector<std::filesystem::path> paths;

    paths.push_back(config::get_data_dir() / "grammars");
    paths.emplace_back("/usr/local/share/scry/grammars");
    paths.emplace_back("/usr/share/scry/grammars");
    paths.emplace_back("/usr/local/lib");
    paths.emplace_back("/usr/lib");
    paths.emplace_back("/usr/lib/x86_64-linux-gnu");
    paths.emplace_back("/usr/lib/aarch64-linux-gnu");
    return paths;
}

std::vector<std::filesystem::path>
GrammarLoader::libraryCandidates(std::string_view language) const {
    const auto* spec = findSpec(language);
    if (!spec) {
        return {};
    }

    std::string core(spec->library);
    std::string underscore = core;
    std::replace(underscore.begin(), underscore.end(), '-', '_');
#ifdef __APPLE__
    const std::vector<std::string> names = {"lib" + core + ".dylib", core + ".dylib",
                                            "lib" + core + ".so", core + ".so"};
#else
    const std::vector<std::string> names = {"lib" + core + ".so", core + ".so",
                                            "lib" + underscore + ".so", underscore + ".so"};
#endif

    std::vector<std::filesystem::path> candidates;

    if (const char* env = std::getenv(spec->env_var.data()); env && *env) {
        candidates.emplace_back(env);
    }

    auto appendDirectory = [&](const std::filesystem::path& dir) {
        std::error_code ec;
        if (!std::filesystem::is_directory(dir, ec))
            return;
        for (const auto& name : names) {
            candidates.push_back(dir / name);
        }
    };

    if (auto it = overrides_.find(std::string(spec->key)); it != overrides_.end()) {
        std::error_code ec;
        if (std::filesystem::is_directory(it->second, ec)) {
            appendDirectory(it->second);
        } else {
            candidates.push_back(config::expand_tilde(it->second.string()));
        }
    }

    for (const auto& dir : searchDirectories()) {
        appendDirectory(dir);
    }
    return candidates;
}

Result<const TSLanguage*> GrammarLoader::loadGrammar(std::string_view language) {
    const auto* spec = findSpec(language);
    if (!spec) {
        return Error{ErrorCode::NotSupported,
                     scry::format("Language '{}' not supported", language)};
    }

    if (auto it = loaded_.find(spec->key); it != loaded_.end()) {
        return it->second;
    }

    auto candidates = libraryCandidates(spec->key);
    if (candidates.empty()) {
        return Error{ErrorCode::NotFound,
                     scry::format("No library candidates for language '{}'", language)};
    }

    std::string tried;
    for (const auto& candidate : candidates) {
        std::error_code ec;
        if (!std::filesystem::exists(candidate, ec)) {
            continue;
        }
        if (!tried.empty())
            tried += ", ";
        tried += candidate.string();

        spdlog::debug("[GrammarLoader] trying {} for {}", candidate.string(), spec->key);
        void* handle = dlopen(candidate.c_str(), RTLD_LAZY | RTLD_LOCAL);
        if (!handle) {
            const char* err = dlerror();
            spdlog::debug("[GrammarLoader] dlopen failed: {}", err ? err : "unknown");
            continue;
        }

        auto* factory = reinterpret_cast<const TSLanguage* (*)()>(dlsym(handle, spec->symbol.data()));
        const TSLanguage* lang = factory ? factory() : nullptr;
        if (!lang) {
            dlclose(handle);
            continue;
        }

        handles_.push_back(handle);
        loaded_.emplace(std::string(spec->key), lang);
        spdlog::debug("[GrammarLoader] loaded {} from {}", spec->key, candidate.string());
        return lang;
    }

    if (tried.empty()) {
        return Error{ErrorCode::NotFound,
                     scry::format("No grammar library found for '{}'", language)};
    }
    return Error{ErrorCode::NotInitialized,
                 scry::format("Failed to load grammar for '{}'. Tried: {}", language, tried)};
}

} // namespace scry::grammar
