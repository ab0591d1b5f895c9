#include "parsing/tree_sitter_extractor.hpp"
#include <cstring>
#include <memory>
#include <stack>
#include <spdlog/spdlog.h>

namespace context_engine {

namespace {

struct ParserDeleter {
    void operator()(TSParser* p) const { ts_parser_delete(p); }
};

struct TreeDeleter {
    void operator()(TSTree* t) const { ts_tree_delete(t); }
};

using ParserPtr = std::unique_ptr<TSParser, ParserDeleter>;
using TreePtr = std::unique_ptr<TSTree, TreeDeleter>;

std::string node_text(TSNode node, const std::string& content) {
    uint32_t start = ts_node_start_byte(node);
    uint32_t end = ts_node_end_byte(node);
    if (end > content.size() || start > end) return "";
    return content.substr(start, end - start);
}

TSNode field(TSNode node, const char* name) {
    return ts_node_child_by_field_name(node, name, static_cast<uint32_t>(std::strlen(name)));
}

bool is_one_of(const char* type, std::initializer_list<const char*> candidates) {
    for (const char* c : candidates) {
        if (std::strcmp(type, c) == 0) return true;
    }
    return false;
}

// C++ buries the name under nested declarators: pointer, reference, function.
std::string cpp_declarator_name(TSNode node, const std::string& content) {
    while (!ts_node_is_null(node)) {
        const char* type = ts_node_type(node);
        if (is_one_of(type, {"identifier", "field_identifier", "qualified_identifier",
                             "destructor_name", "operator_name"})) {
            return node_text(node, content);
        }
        node = field(node, "declarator");
    }
    return "";
}

} // namespace

const TSLanguage* TreeSitterExtractor::language() const {
    switch (grammar_) {
        case Grammar::Cpp: return tree_sitter_cpp();
        case Grammar::Python: return tree_sitter_python();
        case Grammar::TypeScript: return tree_sitter_typescript();
        case Grammar::Tsx: return tree_sitter_tsx();
    }
    return nullptr;
}

ExtractionResult TreeSitterExtractor::extract(const std::string& code) const {
    ExtractionResult result;

    // TSParser is not thread-safe; each call gets its own.
    ParserPtr parser(ts_parser_new());
    if (!ts_parser_set_language(parser.get(), language())) {
        spdlog::error("tree-sitter grammar version mismatch");
        return result;
    }

    TreePtr tree(ts_parser_parse_string(parser.get(), nullptr, code.c_str(), static_cast<uint32_t>(code.length())));
    if (!tree) return result;

    // Non-recursive traversal; children are pushed in reverse so the walk
    // visits nodes in source order.
    std::stack<TSNode> stack;
    stack.push(ts_tree_root_node(tree.get()));

    while (!stack.empty()) {
        TSNode node = stack.top();
        stack.pop();

        const char* type = ts_node_type(node);
        int start_line = static_cast<int>(ts_node_start_point(node).row) + 1;
        int end_line = static_cast<int>(ts_node_end_point(node).row) + 1;

        if (is_one_of(type, {"function_definition", "function_declaration", "method_definition",
                             "generator_function_declaration"})) {
            std::string name = grammar_ == Grammar::Cpp
                ? cpp_declarator_name(field(node, "declarator"), code)
                : node_text(field(node, "name"), code);
            if (!name.empty()) {
                result.functions.push_back({name, node_text(node, code), start_line, end_line});
            }
        } else if (is_one_of(type, {"class_specifier", "struct_specifier", "class_definition",
                                    "class_declaration", "abstract_class_declaration"})) {
            TSNode name_node = field(node, "name");
            TSNode body = field(node, "body");
            // Forward declarations have no body
            if (!ts_node_is_null(name_node) && !ts_node_is_null(body)) {
                result.classes[node_text(name_node, code)] = {node_text(node, code), start_line, end_line};
            }
        }

        uint32_t count = ts_node_named_child_count(node);
        for (uint32_t i = count; i > 0; --i) {
            stack.push(ts_node_named_child(node, i - 1));
        }
    }

    spdlog::debug("AST extraction: {} functions, {} classes", result.functions.size(), result.classes.size());
    return result;
}

} // namespace context_engine
