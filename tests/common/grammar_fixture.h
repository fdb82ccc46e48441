#pragma once

#include <scry/config/analyzer_config.h>
#include <scry/grammar/grammar_registry.h>

#include <string_view>

namespace scry::test {

// One registry per test binary; grammar libraries are loaded once
inline const grammar::GrammarRegistry& sharedRegistry() {
    static const grammar::GrammarRegistry registry{config::AnalyzerConfig{}};
    return registry;
}

// nullptr when the grammar library is not installed on this host
inline const grammar::Grammar* installedGrammar(std::string_view extension) {
    return sharedRegistry().resolve(extension);
}

} // namespace scry::test
