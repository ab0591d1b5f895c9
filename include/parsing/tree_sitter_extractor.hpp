#pragma once
#include <tree_sitter/api.h>
#include <string>
#include "parsing/syntax_extractor.hpp"

// Grammars are linked from their own libraries
extern "C" {
    const TSLanguage* tree_sitter_cpp();
    const TSLanguage* tree_sitter_python();
    const TSLanguage* tree_sitter_typescript();
    const TSLanguage* tree_sitter_tsx();
}

namespace context_engine {

class TreeSitterExtractor : public SyntaxExtractor {
public:
    enum class Grammar { Cpp, Python, TypeScript, Tsx };

    explicit TreeSitterExtractor(Grammar grammar) : grammar_(grammar) {}

    ExtractionResult extract(const std::string& code) const override;

private:
    const TSLanguage* language() const;

    Grammar grammar_;
};

} // namespace context_engine
