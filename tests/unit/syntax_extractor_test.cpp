#include "parsing/syntax_extractor.hpp"
#include "parsing/tree_sitter_extractor.hpp"

#include "../test_logger.hpp"

#include <algorithm>
#include <cstdlib>
#include <string>

using context_engine::tests::Require;

namespace {

bool has_function(const context_engine::ExtractionResult& r, const std::string& name) {
    return std::any_of(r.functions.begin(), r.functions.end(),
                       [&](const context_engine::ExtractedFunction& f) { return f.name == name; });
}

void ScenarioGenericIndentationBlocks() {
    context_engine::tests::log("scenario: generic extractor, indentation blocks");
    const std::string code =
        "def foo():\n"
        "    return 1\n"
        "\n"
        "class Bar:\n"
        "    def baz(self):\n"
        "        return 2\n"
        "\n"
        "x = foo()\n";

    context_engine::GenericExtractor extractor;
    auto result = extractor.extract(code);

    Require(result.functions.size() == 2, "expected foo and baz");
    Require(result.functions[0].name == "foo", "functions come in source order");
    Require(result.functions[0].start_line == 1 && result.functions[0].end_line == 2, "foo spans lines 1-2");
    Require(result.functions[0].code == "def foo():\n    return 1", "foo body excludes trailing blank lines");
    Require(result.functions[1].name == "baz", "nested method is found");

    Require(result.classes.count("Bar") == 1, "class Bar must be found");
    const auto& bar = result.classes.at("Bar");
    Require(bar.start_line == 4 && bar.end_line == 6, "Bar spans its indented block");
}

void ScenarioGenericBraceBlocks() {
    context_engine::tests::log("scenario: generic extractor, brace blocks");
    const std::string code =
        "function add(a, b) {\n"
        "  if (a) { return a + b; }\n"
        "  return b;\n"
        "}\n"
        "const y = 1;\n";

    context_engine::GenericExtractor extractor;
    auto result = extractor.extract(code);
    Require(result.functions.size() == 1, "expected one function");
    Require(result.functions[0].name == "add", "function name");
    Require(result.functions[0].end_line == 4, "braces must balance across nested blocks");
}

void ScenarioRegistryFallback() {
    context_engine::tests::log("scenario: registry fallback");
    context_engine::ExtractorRegistry registry;
    auto generic = registry.for_language("ruby");
    Require(generic != nullptr, "unknown languages get the generic extractor");
    Require(has_function(generic->extract("def hello()\n  1\nend\n"), "hello"), "generic extractor handles def");

    auto defaults = context_engine::ExtractorRegistry::with_default_grammars();
    Require(defaults->for_language("python") != defaults->for_language("ruby"),
            "python must use its grammar rather than the fallback");
}

void ScenarioTreeSitterPython() {
    context_engine::tests::log("scenario: tree-sitter python");
    context_engine::TreeSitterExtractor extractor(context_engine::TreeSitterExtractor::Grammar::Python);
    auto result = extractor.extract("def foo():\n    return 1\n\nclass Bar:\n    def baz(self):\n        pass\n");

    Require(has_function(result, "foo") && has_function(result, "baz"), "python functions must be found");
    Require(result.classes.count("Bar") == 1, "python class must be found");
    Require(result.functions[0].start_line == 1 && result.functions[0].end_line == 2, "python lines are 1-based");
}

void ScenarioTreeSitterCpp() {
    context_engine::tests::log("scenario: tree-sitter cpp");
    context_engine::TreeSitterExtractor extractor(context_engine::TreeSitterExtractor::Grammar::Cpp);
    const std::string code =
        "struct Point { int x; };\n"
        "class Shape;\n"
        "int* make(int n) { return new int[n]; }\n"
        "namespace geo { double area(const Point& p) { return p.x; } }\n";
    auto result = extractor.extract(code);

    Require(has_function(result, "make"), "pointer-returning function name must be unwrapped");
    Require(has_function(result, "area"), "functions inside namespaces must be found");
    Require(result.classes.count("Point") == 1, "struct with a body is a class");
    Require(result.classes.count("Shape") == 0, "forward declarations are skipped");
}

void ScenarioTreeSitterTypeScript() {
    context_engine::tests::log("scenario: tree-sitter typescript");
    context_engine::TreeSitterExtractor extractor(context_engine::TreeSitterExtractor::Grammar::TypeScript);
    auto result = extractor.extract(
        "export function greet(name: string): string { return name; }\n"
        "class Greeter {\n  hello() { return 1; }\n}\n");

    Require(has_function(result, "greet"), "function declaration must be found");
    Require(has_function(result, "hello"), "method must be found");
    Require(result.classes.count("Greeter") == 1, "class must be found");
}

void ScenarioTreeSitterTsx() {
    context_engine::tests::log("scenario: tree-sitter tsx");
    const std::string code =
        "export function App(props: Props) {\n"
        "  return <Button label={props.title} />;\n"
        "}\n"
        "class Card extends Component<Props> {\n"
        "  render() { return <div className=\"card\">{this.props.title}</div>; }\n"
        "}\n";

    auto registry = context_engine::ExtractorRegistry::with_default_grammars();
    auto result = registry->for_language("typescriptreact")->extract(code);
    Require(has_function(result, "App"), "component function in a .tsx file must be found");
    Require(has_function(result, "render"), "method returning JSX must be found");
    Require(result.classes.count("Card") == 1, "class with JSX body must be found");
    Require(result.classes.at("Card").start_line == 4 && result.classes.at("Card").end_line == 6,
            "class span covers its JSX body");
}

} // namespace

int main() {
    context_engine::tests::init_logging();
    try {
        context_engine::tests::log("syntax_extractor_test: start");
        ScenarioGenericIndentationBlocks();
        ScenarioGenericBraceBlocks();
        ScenarioRegistryFallback();
        ScenarioTreeSitterPython();
        ScenarioTreeSitterCpp();
        ScenarioTreeSitterTypeScript();
        ScenarioTreeSitterTsx();
        context_engine::tests::log("syntax_extractor_test: finished");
        return EXIT_SUCCESS;
    } catch (const std::exception& ex) {
        context_engine::tests::log_error(ex.what());
        return EXIT_FAILURE;
    }
}
