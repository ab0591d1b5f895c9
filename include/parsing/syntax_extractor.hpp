#pragma once
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>
#include <vector>

namespace context_engine {

struct ExtractedFunction {
    std::string name;
    std::string code;
    int start_line = 0;   // 1-based, inclusive
    int end_line = 0;
};

struct ExtractedClass {
    std::string code;
    int start_line = 0;
    int end_line = 0;
};

struct ExtractionResult {
    std::vector<ExtractedFunction> functions;
    std::map<std::string, ExtractedClass> classes;
};

// Per-language source parser. Must be safe to call from several indexing
// workers at once.
class SyntaxExtractor {
public:
    virtual ~SyntaxExtractor() = default;
    virtual ExtractionResult extract(const std::string& code) const = 0;
};

// Line heuristic for anything without a grammar: `def`/`function` and
// `class` headers, with the body taken as the brace-balanced span when the
// header opens a brace and as the indented block otherwise.
class GenericExtractor : public SyntaxExtractor {
public:
    ExtractionResult extract(const std::string& code) const override;
};

class ExtractorRegistry {
public:
    ExtractorRegistry();

    void register_extractor(const std::string& language, std::shared_ptr<SyntaxExtractor> extractor);
    std::shared_ptr<SyntaxExtractor> for_language(const std::string& language) const;

    // Registry with tree-sitter grammars for the languages we ship.
    static std::shared_ptr<ExtractorRegistry> with_default_grammars();

private:
    std::shared_ptr<SyntaxExtractor> fallback_;
    std::unordered_map<std::string, std::shared_ptr<SyntaxExtractor>> by_language_;
    mutable std::mutex mutex_;
};

} // namespace context_engine
