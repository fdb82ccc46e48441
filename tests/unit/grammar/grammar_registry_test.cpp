#include "grammar_fixture.h"
#include "test_helpers.h"
#include <gtest/gtest.h>
#include <scry/grammar/grammar_loader.h>
#include <scry/grammar/grammar_registry.h>

#include <algorithm>
#include <cstdlib>
#include <filesystem>
#include <string>
#include <type_traits>

using namespace scry;
using namespace scry::grammar;
using namespace scry::test;

TEST(CaptureRoleTest, MapsEveryKnownCaptureName) {
    EXPECT_TRUE(std::holds_alternative<NameRole>(*parseCaptureRole("name")));
    EXPECT_TRUE(std::holds_alternative<CallRole>(*parseCaptureRole("call")));
    EXPECT_TRUE(std::holds_alternative<ImportRole>(*parseCaptureRole("import")));

    auto impl = parseCaptureRole("impl");
    ASSERT_TRUE(impl && std::holds_alternative<SymbolRole>(*impl));
    EXPECT_EQ(std::get<SymbolRole>(*impl).kind, SymbolKind::Impl);
    EXPECT_EQ(std::get<SymbolRole>(*parseCaptureRole("interface")).kind, SymbolKind::Interface);

    EXPECT_FALSE(parseCaptureRole("definition.function").has_value());
    EXPECT_FALSE(parseCaptureRole("").has_value());
}

TEST(GrammarRegistryTest, ExtensionLookupIsCaseInsensitive) {
    EXPECT_EQ(GrammarRegistry::languageForExtension(".rs"), "rust");
    EXPECT_EQ(GrammarRegistry::languageForExtension("RS"), "rust");
    EXPECT_EQ(GrammarRegistry::languageForExtension(".Py"), "python");
    EXPECT_EQ(GrammarRegistry::languageForExtension(".tsx"), "tsx");
    EXPECT_EQ(GrammarRegistry::languageForExtension(".mjs"), "javascript");
    EXPECT_FALSE(GrammarRegistry::languageForExtension(".kt").has_value());
    EXPECT_FALSE(GrammarRegistry::languageForExtension("").has_value());
}

TEST(GrammarRegistryTest, EveryQueryLanguageHasAQuery) {
    for (auto language : GrammarRegistry::supportedLanguages()) {
        if (language == "python")
            EXPECT_FALSE(GrammarRegistry::querySource(language).has_value());
        else
            EXPECT_TRUE(GrammarRegistry::querySource(language).has_value()) << language;
    }
}

TEST(GrammarRegistryTest, EmptyRegistryResolvesNothing) {
    GrammarRegistry registry;
    EXPECT_TRUE(registry.empty());
    EXPECT_EQ(registry.resolve(".py"), nullptr);
    EXPECT_EQ(registry.resolve(".unknown"), nullptr);

    auto registered = registry.registerLanguage("rust", nullptr);
    EXPECT_FALSE(registered);
    EXPECT_EQ(registered.error().code, ErrorCode::InvalidArgument);
}

TEST(GrammarRegistryTest, LoadedGrammarsUseTheirStrategy) {
    const auto& registry = sharedRegistry();
    for (const auto& language : registry.languages()) {
        EXPECT_TRUE(GrammarLoader::isKnownLanguage(language));
    }
    if (const auto* python = registry.resolve(".py")) {
        EXPECT_EQ(python->strategy(), Strategy::NativeVisitor);
        EXPECT_EQ(python->query(), nullptr);
    }
    if (const auto* rust = registry.resolve(".rs")) {
        EXPECT_EQ(rust->strategy(), Strategy::Query);
        EXPECT_NE(rust->query(), nullptr);
    }
}

class GrammarLoaderTest : public ScryTest {};

TEST_F(GrammarLoaderTest, UnknownLanguageIsNotSupported) {
    GrammarLoader loader;
    EXPECT_FALSE(GrammarLoader::isKnownLanguage("cobol"));
    EXPECT_TRUE(GrammarLoader::isKnownLanguage("Python"));
    EXPECT_THAT(loader.loadGrammar("cobol"), HasErrorCode(ErrorCode::NotSupported));
    EXPECT_TRUE(loader.libraryCandidates("cobol").empty());
}

TEST_F(GrammarLoaderTest, OverrideDirectoryIsProbedBeforeSystemPaths) {
    GrammarLoader loader({{"rust", testDir}});
    auto candidates = loader.libraryCandidates("rust");
    ASSERT_FALSE(candidates.empty());
    EXPECT_EQ(candidates.front(), testDir / "libtree-sitter-rust.so");
}

TEST_F(GrammarLoaderTest, EnvironmentOverrideComesFirst) {
    auto lib = testDir / "custom-go.so";
    ::setenv("SCRY_TS_GO_LIB", lib.c_str(), 1);
    GrammarLoader loader;
    loader.addGrammarPath("go", testDir / "other.so");
    auto candidates = loader.libraryCandidates("go");
    ::unsetenv("SCRY_TS_GO_LIB");

    ASSERT_GE(candidates.size(), 2u);
    EXPECT_EQ(candidates[0], lib);
    EXPECT_EQ(candidates[1], testDir / "other.so");
}

TEST_F(GrammarLoaderTest, UserDataDirectoryIsSearched) {
    auto grammars = testDir / "data" / "scry" / "grammars";
    std::filesystem::create_directories(grammars);

    const char* previous = std::getenv("XDG_DATA_HOME");
    std::string saved = previous ? previous : "";
    ::setenv("XDG_DATA_HOME", (testDir / "data").c_str(), 1);
    GrammarLoader loader;
    auto candidates = loader.libraryCandidates("rust");
    if (previous) {
        ::setenv("XDG_DATA_HOME", saved.c_str(), 1);
    } else {
        ::unsetenv("XDG_DATA_HOME");
    }

    EXPECT_NE(std::find(candidates.begin(), candidates.end(),
                        grammars / "libtree-sitter-rust.so"),
              candidates.end());
}

TEST(GrammarCompileTest, UnknownCaptureFailsRegistration) {
    GrammarLoader loader;
    auto rust = loader.loadGrammar("rust");
    if (!rust) {
        GTEST_SKIP() << "tree-sitter-rust not installed: " << rust.error().message;
    }

    auto ok = Grammar::compile("rust", rust.value(), *GrammarRegistry::querySource("rust"));
    EXPECT_TRUE(ok) << (ok ? "" : ok.error().message);

    auto unknownCapture =
        Grammar::compile("rust", rust.value(), "(function_item name: (identifier) @label)");
    EXPECT_THAT(unknownCapture, HasErrorCode(ErrorCode::InvalidData));

    auto syntaxError = Grammar::compile("rust", rust.value(), "(function_item name: ");
    EXPECT_FALSE(syntaxError);
}
