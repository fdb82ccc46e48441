#pragma once

#include <filesystem>
#include <map>
#include <string>
#include <string_view>
#include <vector>

#include <scry/core/types.h>

// Forward declaration
struct TSLanguage;

namespace scry::grammar {

/**
 * @brief Discovers and loads tree-sitter grammar libraries
 *
 * Search order for libtree-sitter-<lang>.so:
 * - SCRY_TS_<LANG>_LIB environment variable (file path)
 * - config override (file path or directory)
 * - XDG_DATA_HOME/scry/grammars, ~/.local/share/scry/grammars
 * - /usr/local/share/scry/grammars, /usr/share/scry/grammars
 * - /usr/local/lib, /usr/lib, /usr/lib/x86_64-linux-gnu, /usr/lib/aarch64-linux-gnu
 *
 * Loaded library handles stay open until the loader is destroyed, so every TSLanguage*
 * returned by loadGrammar() is valid for the loader's lifetime.
 */
class GrammarLoader {
public:
    GrammarLoader() = default;
    explicit GrammarLoader(std::map<std::string, std::filesystem::path> overrides);
    ~GrammarLoader();

    GrammarLoader(const GrammarLoader&) = delete;
    GrammarLoader& operator=(const GrammarLoader&) = delete;

    void addGrammarPath(std::string_view language, const std::filesystem::path& path);

    /**
     * @brief Load (or return the already loaded) grammar for a language
     */
    Result<const TSLanguage*> loadGrammar(std::string_view language);

    /**
     * @brief Candidate library files for a language, in probe order
     */
    std::vector<std::filesystem::path> libraryCandidates(std::string_view language) const;

    static bool isKnownLanguage(std::string_view language) noexcept;

private:
    struct GrammarSpec {
        std::string_view key;
        std::string_view env_var;
        std::string_view symbol;
        std::string_view library;
    };

    static constexpr GrammarSpec kSpecs[] = {
        {"python", "SCRY_TS_PYTHON_LIB", "tree_sitter_python", "tree-sitter-python"},
        {"rust", "SCRY_TS_RUST_LIB", "tree_sitter_rust", "tree-sitter-rust"},
        {"go", "SCRY_TS_GO_LIB", "tree_sitter_go", "tree-sitter-go"},
        {"javascript", "SCRY_TS_JS_LIB", "tree_sitter_javascript", "tree-sitter-javascript"},
        {"typescript", "SCRY_TS_TS_LIB", "tree_sitter_typescript", "tree-sitter-typescript"},
        {"tsx", "SCRY_TS_TSX_LIB", "tree_sitter_tsx", "tree-sitter-tsx"},
        {"java", "SCRY_TS_JAVA_LIB", "tree_sitter_java", "tree-sitter-java"},
    };

    static const GrammarSpec* findSpec(std::string_view language) noexcept;
    std::vector<std::filesystem::path> searchDirectories() const;

    std::map<std::string, std::filesystem::path> overrides_;
    std::map<std::string, const TSLanguage*, std::less<>> loaded_;
    std::vector<void*> handles_;
};

} // namespace scry::grammar
