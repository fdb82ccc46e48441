#include <scry/core/format.h>
#include <scry/grammar/grammar_registry.h>

#include <spdlog/spdlog.h>

#include <algorithm>
#include <cctype>

extern "C" {
#include <tree_sitter/api.h>
}

namespace scry::grammar {

namespace {

// Capture names: @name, @call, @import and one symbol tag per definition pattern.
constexpr std::string_view kRustQuery = R"(
(function_item name: (identifier) @name) @function
(struct_item name: (type_identifier) @name) @class
(enum_item name: (type_identifier) @name) @class
(trait_item name: (type_identifier) @name) @interface
(impl_item type: (type_identifier) @name) @impl
(call_expression function: (identifier) @call)
(call_expression function: (field_expression field: (field_identifier) @call))
(call_expression function: (scoped_identifier name: (identifier) @call))
(use_declaration argument: (_) @import)
)";

constexpr std::string_view kGoQuery = R"(
(function_declaration name: (identifier) @name) @function
(method_declaration name: (field_identifier) @name) @function
(type_spec name: (type_identifier) @name type: (struct_type)) @class
(type_spec name: (type_identifier) @name type: (interface_type)) @interface
(call_expression function: (identifier) @call)
(call_expression function: (selector_expression field: (field_identifier) @call))
(import_spec path: (interpreted_string_literal) @import)
)";

constexpr std::string_view kTypeScriptQuery = R"(
(class_declaration name: (type_identifier) @name) @class
(abstract_class_declaration name: (type_identifier) @name) @class
(function_declaration name: (identifier) @name) @function
(interface_declaration name: (type_identifier) @name) @interface
(method_definition name: (property_identifier) @name) @function
(variable_declarator name: (identifier) @name value: (arrow_function)) @function
(call_expression function: (identifier) @call)
(call_expression function: (member_expression property: (property_identifier) @call))
(import_statement source: (string) @import)
)";

constexpr std::string_view kJavaScriptQuery = R"(
(class_declaration name: (identifier) @name) @class
(function_declaration name: (identifier) @name) @function
(method_definition name: (property_identifier) @name) @function
(variable_declarator name: (identifier) @name value: (arrow_function)) @function
(call_expression function: (identifier) @call)
(call_expression function: (member_expression property: (property_identifier) @call))
(import_statement source: (string) @import)
)";

constexpr std::string_view kJavaQuery = R"(
(class_declaration name: (identifier) @name) @class
(enum_declaration name: (identifier) @name) @class
(interface_declaration name: (identifier) @name) @interface
(method_declaration name: (identifier) @name) @function
(method_invocation name: (identifier) @call)
(import_declaration (scoped_identifier) @import)
)";

struct ExtensionEntry {
    std::string_view extension;
    std::string_view language;
};

constexpr ExtensionEntry kExtensions[] = {
    {".py", "python"},     {".rs", "rust"},         {".go", "go"},
    {".ts", "typescript"}, {".tsx", "tsx"},         {".js", "javascript"},
    {".jsx", "javascript"}, {".mjs", "javascript"}, {".java", "java"},
};

std::string normalizeExtension(std::string_view extension) {
    std::string ext;
    ext.reserve(extension.size() + 1);
    if (extension.empty() || extension.front() != '.') {
        ext.push_back('.');
    }
    for (char c : extension) {
        ext.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(c))));
    }
    return ext;
}

const char* queryErrorName(TSQueryError error) {
    switch (error) {
        case TSQueryErrorNone: return "none";
        case TSQueryErrorSyntax: return "syntax";
        case TSQueryErrorNodeType: return "node type";
        case TSQueryErrorField: return "field";
        case TSQueryErrorCapture: return "capture";
        case TSQueryErrorStructure: return "structure";
        default: return "language";
    }
}

} // namespace

std::optional<CaptureRole> parseCaptureRole(std::string_view captureName) noexcept {
    if (captureName == "name")
        return NameRole{};
    if (captureName == "call")
        return CallRole{};
    if (captureName == "import")
        return ImportRole{};
    if (captureName == "function")
        return SymbolRole{SymbolKind::Function};
    if (captureName == "class")
        return SymbolRole{SymbolKind::Class};
    if (captureName == "interface")
        return SymbolRole{SymbolKind::Interface};
    if (captureName == "impl")
        return SymbolRole{SymbolKind::Impl};
    return std::nullopt;
}

// Grammar

Grammar::Grammar(std::string language, const TSLanguage* tsLanguage, Strategy strategy)
    : language_(std::move(language)), tsLanguage_(tsLanguage), strategy_(strategy) {}

Grammar::~Grammar() {
    if (query_)
        ts_query_delete(query_);
}

Result<std::unique_ptr<Grammar>> Grammar::compile(std::string language,
                                                  const TSLanguage* tsLanguage,
                                                  std::string_view querySource) {
    if (!tsLanguage) {
        return Error{ErrorCode::InvalidArgument,
                     scry::format("No tree-sitter language for {}", language)};
    }

    uint32_t errorOffset = 0;
    TSQueryError errorType = TSQueryErrorNone;
    TSQuery* query = ts_query_new(tsLanguage, querySource.data(),
                                  static_cast<uint32_t>(querySource.size()), &errorOffset,
                                  &errorType);
    if (!query) {
        return Error{ErrorCode::ParseError,
                     scry::format("{} query failed to compile ({} error at offset {})", language,
                                  queryErrorName(errorType), errorOffset)};
    }

    auto grammar = std::make_unique<Grammar>(std::move(language), tsLanguage, Strategy::Query);
    grammar->query_ = query;

    uint32_t captureCount = ts_query_capture_count(query);
    grammar->roles_.reserve(captureCount);
    for (uint32_t i = 0; i < captureCount; ++i) {
        uint32_t length = 0;
        const char* name = ts_query_capture_name_for_id(query, i, &length);
        std::string_view captureName(name ? name : "", name ? length : 0);
        auto role = parseCaptureRole(captureName);
        if (!role) {
            return Error{ErrorCode::InvalidData,
                         scry::format("{} query uses unknown capture @{}", grammar->language_,
                                      captureName)};
        }
        grammar->roles_.push_back(*role);
    }
    return grammar;
}

// GrammarRegistry

GrammarRegistry::GrammarRegistry() = default;

GrammarRegistry::GrammarRegistry(const config::AnalyzerConfig& config)
    : loader_(std::make_unique<GrammarLoader>(config.grammarPaths)) {
    for (auto language : supportedLanguages()) {
        auto loaded = loader_->loadGrammar(language);
        if (!loaded) {
            spdlog::warn("[GrammarRegistry] {} unavailable, its files will be skipped: {}",
                         language, loaded.error().message);
            continue;
        }
        if (auto registered = registerLanguage(language, loaded.value()); !registered) {
            spdlog::warn("[GrammarRegistry] {} omitted: {}", language,
                         registered.error().message);
        }
    }
    spdlog::debug("[GrammarRegistry] {} of {} languages available", grammars_.size(),
                  supportedLanguages().size());
}

GrammarRegistry::~GrammarRegistry() = default;

Result<void> GrammarRegistry::registerLanguage(std::string_view language,
                                               const TSLanguage* tsLanguage) {
    if (!tsLanguage) {
        return Error{ErrorCode::InvalidArgument, "null tree-sitter language"};
    }

    if (language == "python") {
        grammars_[std::string(language)] =
            std::make_unique<Grammar>(std::string(language), tsLanguage, Strategy::NativeVisitor);
        return {};
    }

    auto source = querySource(language);
    if (!source) {
        return Error{ErrorCode::NotSupported,
                     scry::format("Language '{}' not supported", language)};
    }

    auto compiled = Grammar::compile(std::string(language), tsLanguage, *source);
    if (!compiled) {
        return compiled.error();
    }
    grammars_[std::string(language)] = std::move(compiled).value();
    return {};
}

const Grammar* GrammarRegistry::resolve(std::string_view extension) const {
    auto language = languageForExtension(extension);
    if (!language) {
        return nullptr;
    }
    auto it = grammars_.find(*language);
    return it == grammars_.end() ? nullptr : it->second.get();
}

std::vector<std::string> GrammarRegistry::languages() const {
    std::vector<std::string> out;
    out.reserve(grammars_.size());
    for (const auto& [name, grammar] : grammars_) {
        out.push_back(name);
    }
    return out;
}

std::optional<std::string_view> GrammarRegistry::languageForExtension(std::string_view extension) {
    if (extension.empty()) {
        return std::nullopt;
    }
    auto ext = normalizeExtension(extension);
    for (const auto& entry : kExtensions) {
        if (entry.extension == ext)
            return entry.language;
    }
    return std::nullopt;
}

std::optional<std::string_view> GrammarRegistry::querySource(std::string_view language) {
    if (language == "rust")
        return kRustQuery;
    if (language == "go")
        return kGoQuery;
    if (language == "typescript" || language == "tsx")
        return kTypeScriptQuery;
    if (language == "javascript")
        return kJavaScriptQuery;
    if (language == "java")
        return kJavaQuery;
    return std::nullopt;
}

const std::vector<std::string_view>& GrammarRegistry::supportedLanguages() {
    static const std::vector<std::string_view> kLanguages = {
        "python", "rust", "go", "typescript", "tsx", "javascript", "java"};
    return kLanguages;
}

} // namespace scry::grammar
