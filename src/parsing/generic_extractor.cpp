#include "parsing/syntax_extractor.hpp"
#include "parsing/tree_sitter_extractor.hpp"
#include <regex>
#include <sstream>

namespace context_engine {

namespace {

std::vector<std::string> split_lines(const std::string& content) {
    std::vector<std::string> lines;
    std::istringstream stream(content);
    std::string line;
    while (std::getline(stream, line)) {
        if (!line.empty() && line.back() == '\r') line.pop_back();
        lines.push_back(line);
    }
    return lines;
}

size_t leading_whitespace(const std::string& line) {
    size_t pos = line.find_first_not_of(" \t");
    return pos == std::string::npos ? line.size() : pos;
}

bool is_blank(const std::string& line) {
    return line.find_first_not_of(" \t") == std::string::npos;
}

// Index of the last line belonging to the block that starts at `start`.
size_t block_end(const std::vector<std::string>& lines, size_t start) {
    const std::string& header = lines[start];

    if (header.find('{') != std::string::npos) {
        int depth = 0;
        for (size_t i = start; i < lines.size(); ++i) {
            for (char c : lines[i]) {
                if (c == '{') depth++;
                else if (c == '}') depth--;
            }
            if (depth <= 0) return i;
        }
        return lines.size() - 1;
    }

    // Indentation block: the body indent comes from the first following line.
    size_t header_indent = leading_whitespace(header);
    size_t body_indent = header_indent + 2;
    if (start + 1 < lines.size() && !is_blank(lines[start + 1])) {
        body_indent = std::max(leading_whitespace(lines[start + 1]), header_indent + 1);
    }

    size_t last = start;
    for (size_t i = start + 1; i < lines.size(); ++i) {
        if (is_blank(lines[i])) continue;
        if (leading_whitespace(lines[i]) < body_indent) break;
        last = i;
    }
    return last;
}

std::string join_lines(const std::vector<std::string>& lines, size_t from, size_t to) {
    std::string out;
    for (size_t i = from; i <= to; ++i) {
        if (i > from) out += '\n';
        out += lines[i];
    }
    return out;
}

} // namespace

ExtractionResult GenericExtractor::extract(const std::string& code) const {
    static const std::regex func_re(R"(^\s*(def|function)\s+([A-Za-z_][A-Za-z0-9_]*)\s*\()");
    static const std::regex class_re(R"(^\s*class\s+([A-Za-z_][A-Za-z0-9_]*))");

    ExtractionResult result;
    auto lines = split_lines(code);

    for (size_t i = 0; i < lines.size(); ++i) {
        std::smatch m;
        if (std::regex_search(lines[i], m, func_re)) {
            size_t end = block_end(lines, i);
            result.functions.push_back({m[2].str(), join_lines(lines, i, end),
                                        static_cast<int>(i + 1), static_cast<int>(end + 1)});
        } else if (std::regex_search(lines[i], m, class_re)) {
            size_t end = block_end(lines, i);
            result.classes[m[1].str()] = {join_lines(lines, i, end),
                                          static_cast<int>(i + 1), static_cast<int>(end + 1)};
        }
    }
    return result;
}

// --- registry ---

ExtractorRegistry::ExtractorRegistry() : fallback_(std::make_shared<GenericExtractor>()) {}

void ExtractorRegistry::register_extractor(const std::string& language, std::shared_ptr<SyntaxExtractor> extractor) {
    std::lock_guard<std::mutex> lock(mutex_);
    by_language_[language] = std::move(extractor);
}

std::shared_ptr<SyntaxExtractor> ExtractorRegistry::for_language(const std::string& language) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = by_language_.find(language);
    return it != by_language_.end() ? it->second : fallback_;
}

std::shared_ptr<ExtractorRegistry> ExtractorRegistry::with_default_grammars() {
    auto registry = std::make_shared<ExtractorRegistry>();
    auto cpp = std::make_shared<TreeSitterExtractor>(TreeSitterExtractor::Grammar::Cpp);
    auto python = std::make_shared<TreeSitterExtractor>(TreeSitterExtractor::Grammar::Python);
    auto typescript = std::make_shared<TreeSitterExtractor>(TreeSitterExtractor::Grammar::TypeScript);
    auto tsx = std::make_shared<TreeSitterExtractor>(TreeSitterExtractor::Grammar::Tsx);

    registry->register_extractor("cpp", cpp);
    registry->register_extractor("c", cpp);
    registry->register_extractor("python", python);
    registry->register_extractor("typescript", typescript);
    registry->register_extractor("typescriptreact", tsx);
    registry->register_extractor("javascript", typescript);
    registry->register_extractor("javascriptreact", tsx);
    return registry;
}

} // namespace context_engine
