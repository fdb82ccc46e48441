#pragma once

#include <map>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

#include <scry/config/analyzer_config.h>
#include <scry/core/types.h>
#include <scry/grammar/grammar_loader.h>

struct TSLanguage;
struct TSQuery;

namespace scry::grammar {

enum class SymbolKind { Function, Class, Interface, Impl };

// Role tags a query capture can carry
struct NameRole {};
struct CallRole {};
struct ImportRole {};
struct SymbolRole {
    SymbolKind kind;
};

using CaptureRole = std::variant<NameRole, CallRole, ImportRole, SymbolRole>;

/// Maps a capture name ("name", "call", "import", "function", ...) to its role.
std::optional<CaptureRole> parseCaptureRole(std::string_view captureName) noexcept;

enum class Strategy {
    Query,        ///< declarative match queries, see extract::QueryExtractor
    NativeVisitor ///< single traversal, see extract::PythonVisitor
};

/**
 * @brief A loaded language: parser language, compiled query and the role of each capture
 */
class Grammar {
public:
    Grammar(std::string language, const TSLanguage* tsLanguage, Strategy strategy);
    ~Grammar();

    Grammar(const Grammar&) = delete;
    Grammar& operator=(const Grammar&) = delete;

    /**
     * @brief Compile a query and map every capture onto a role
     *
     * Fails on query syntax errors, unknown node types and capture names with no role.
     */
    static Result<std::unique_ptr<Grammar>>
    compile(std::string language, const TSLanguage* tsLanguage, std::string_view querySource);

    const std::string& language() const noexcept { return language_; }
    const TSLanguage* tsLanguage() const noexcept { return tsLanguage_; }
    Strategy strategy() const noexcept { return strategy_; }

    // null for native visitor grammars
    const TSQuery* query() const noexcept { return query_; }

    const CaptureRole& role(uint32_t captureIndex) const { return roles_.at(captureIndex); }

private:
    std::string language_;
    const TSLanguage* tsLanguage_;
    Strategy strategy_;
    TSQuery* query_ = nullptr;
    std::vector<CaptureRole> roles_;
};

/**
 * @brief Maps file extensions to loaded grammars
 *
 * Construction loads every supported language once. A language whose library cannot be loaded
 * or whose query does not compile is omitted with a single warning; files routed to it are
 * skipped by callers. resolve() is a pure lookup.
 */
class GrammarRegistry {
public:
    // Empty registry; populate with registerLanguage()
    GrammarRegistry();

    explicit GrammarRegistry(const config::AnalyzerConfig& config);
    ~GrammarRegistry();

    GrammarRegistry(const GrammarRegistry&) = delete;
    GrammarRegistry& operator=(const GrammarRegistry&) = delete;

    /**
     * @brief Grammar for an extension (".rs", "RS", ...), nullptr when unsupported or unavailable
     */
    const Grammar* resolve(std::string_view extension) const;

    /**
     * @brief Build and register the grammar for a supported language from a loaded TSLanguage
     */
    Result<void> registerLanguage(std::string_view language, const TSLanguage* tsLanguage);

    std::vector<std::string> languages() const;
    bool empty() const noexcept { return grammars_.empty(); }

    static std::optional<std::string_view> languageForExtension(std::string_view extension);
    static std::optional<std::string_view> querySource(std::string_view language);
    static const std::vector<std::string_view>& supportedLanguages();

private:
    std::unique_ptr<GrammarLoader> loader_;
    std::map<std::string, std::unique_ptr<Grammar>, std::less<>> grammars_;
};

} // namespace scry::grammar
