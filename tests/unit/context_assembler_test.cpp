#include "context_assembler.hpp"
#include "utils.hpp"

#include "../test_logger.hpp"

#include <algorithm>
#include <cstdlib>
#include <memory>
#include <random>
#include <string>
#include <vector>

using context_engine::tests::Require;
using context_engine::tests::TempDir;

namespace {

constexpr int kDimension = 64;

struct Harness {
    explicit Harness(bool online = true) {
        std::filesystem::create_directories(dir.path() / "ws");
        workspace = std::make_shared<context_engine::FilesystemWorkspace>(
            dir.path() / "ws", context_engine::IndexingConfig{}.exclude_patterns);

        store = std::make_shared<context_engine::ContextStore>(dir.path() / "store", kDimension);
        Require(store->open().ok(), "store must open");

        context_engine::EmbeddingConfig embedding_config;
        embedding_config.dimension = kDimension;
        embeddings = std::make_shared<context_engine::EmbeddingService>(
            embedding_config, std::vector<std::shared_ptr<context_engine::Embedder>>{});
        network = std::make_shared<context_engine::StaticNetworkStatus>(online);

        assembler = std::make_unique<context_engine::ContextAssembler>(
            context_engine::AssemblyConfig{}, store, embeddings, network, workspace);
    }

    TempDir dir;
    std::shared_ptr<context_engine::FilesystemWorkspace> workspace;
    std::shared_ptr<context_engine::ContextStore> store;
    std::shared_ptr<context_engine::EmbeddingService> embeddings;
    std::shared_ptr<context_engine::StaticNetworkStatus> network;
    std::unique_ptr<context_engine::ContextAssembler> assembler;
};

std::string numbered_lines(int count) {
    std::string out;
    for (int i = 1; i <= count; ++i) {
        out += "line " + std::to_string(i) + "\n";
    }
    return out;
}

context_engine::ContextItem code_item(const std::string& id, int lines, double relevance) {
    context_engine::ContextItem item;
    item.id = id;
    item.type = context_engine::ContextItemType::File;
    item.name = id + ".py";
    item.content = numbered_lines(lines);
    item.line_start = 1;
    item.line_end = lines;
    item.relevance = relevance;
    return item;
}

context_engine::ContextItem prose_item(const std::string& id, size_t length, double relevance) {
    context_engine::ContextItem item;
    item.id = id;
    item.type = context_engine::ContextItemType::ConversationHistory;
    item.name = id;
    item.content = std::string(length, 'p');
    item.relevance = relevance;
    return item;
}

bool ends_with(const std::string& s, const std::string& suffix) {
    return s.size() >= suffix.size() && s.compare(s.size() - suffix.size(), suffix.size(), suffix) == 0;
}

void ScenarioTokenEstimates() {
    context_engine::tests::log("scenario: token estimates");
    Harness h;
    Require(h.assembler->estimate_tokens(code_item("a", 4, 0.5)) == 40, "code costs overhead plus five per line");
    Require(h.assembler->estimate_tokens(prose_item("p", 10, 0.5)) == 23, "prose costs a quarter token per char, rounded up");

    context_engine::ContextItem empty;
    empty.line_start = 1;
    empty.line_end = 50;
    Require(h.assembler->estimate_tokens(empty) == 20, "empty content costs only the overhead");
}

void ScenarioGreedyStopsAtFirstOverflow() {
    context_engine::tests::log("scenario: greedy stop at first overflow");
    Harness h;
    std::vector<context_engine::ContextItem> ranked = {code_item("a", 4, 0.9), code_item("b", 1, 0.85)};

    auto result = h.assembler->fit_to_budget(ranked, 50);
    Require(result.items.size() == 1 && result.items[0].id == "a", "only the first item fits");
    Require(result.truncated, "overflow marks the result truncated");
    Require(result.token_count == 40, "token count is the sum of accepted estimates");

    auto roomy = h.assembler->fit_to_budget(ranked, 1000);
    Require(roomy.items.size() == 2 && !roomy.truncated, "everything fits in a large budget");
    Require(roomy.token_count == 65, "token count of both items");
}

void ScenarioBudgetIsNeverExceeded() {
    context_engine::tests::log("scenario: budget property");
    Harness h;
    std::mt19937 gen(42);
    std::uniform_int_distribution<int> lines(1, 120);
    std::uniform_int_distribution<int> chars(1, 3000);
    std::uniform_int_distribution<int> budget(0, 2500);

    for (int round = 0; round < 40; ++round) {
        std::vector<context_engine::ContextItem> items;
        for (int i = 0; i < 8; ++i) {
            std::string id = "r" + std::to_string(round) + "-" + std::to_string(i);
            if (i % 2 == 0) items.push_back(code_item(id, lines(gen), 1.0 - i * 0.1));
            else items.push_back(prose_item(id, static_cast<size_t>(chars(gen)), 1.0 - i * 0.1));
        }
        int max_tokens = budget(gen);
        auto result = h.assembler->fit_to_budget(items, max_tokens);

        int sum = 0;
        for (const auto& item : result.items) sum += h.assembler->estimate_tokens(item);
        Require(result.token_count <= max_tokens, "token count must respect the budget");
        Require(sum == result.token_count, "token count must equal the sum of item estimates");
    }
}

void ScenarioFirstItemIsCutDown() {
    context_engine::tests::log("scenario: forced truncation of the first item");
    Harness h;

    auto code = h.assembler->fit_to_budget({code_item("big", 100, 0.9)}, 100);
    Require(code.items.size() == 1 && code.truncated, "oversized first item is truncated, not dropped");
    const auto& cut = code.items[0];
    Require(ends_with(cut.content, "// ... content truncated ..."), "code carries the code truncation marker");
    Require(cut.line_start.value_or(0) == 1 && cut.line_end.value_or(0) == 16, "line range shrinks with the content");
    Require(code.token_count <= 100, "truncated item fits the budget");

    auto prose = h.assembler->fit_to_budget({prose_item("talk", 1000, 0.9)}, 100);
    Require(prose.items.size() == 1, "prose item is truncated");
    Require(ends_with(prose.items[0].content, "... [content truncated] ..."), "prose carries the prose marker");
    Require(prose.token_count <= 100, "truncated prose fits the budget");

    auto tiny = h.assembler->fit_to_budget({code_item("big", 100, 0.9)}, 10);
    Require(tiny.items.empty() && tiny.truncated, "budget below the overhead yields nothing");
    Require(tiny.token_count == 0, "empty result costs nothing");
}

void ScenarioScoring() {
    context_engine::tests::log("scenario: scoring");
    Harness h;

    context_engine::ContextItem unscored = prose_item("u", 10, 0.0);
    unscored.relevance.reset();
    auto ranked = h.assembler->score_items({code_item("low", 1, 0.2), unscored, code_item("high", 1, 0.9)}, "");
    Require(ranked[0].id == "high" && ranked[1].id == "u" && ranked[2].id == "low", "sorted by relevance");
    Require(ranked[1].relevance.value_or(-1) == 0.5, "unscored items default to 0.5 without a query");

    context_engine::ContextItem a = prose_item("a", 0, 0.0);
    a.content = "parse the configuration file";
    a.relevance.reset();
    context_engine::ContextItem b = a;
    b.id = "b";
    b.content = "render the sidebar";
    auto scored = h.assembler->score_items({a, b}, "configuration parser");
    for (const auto& item : scored) {
        Require(item.relevance.has_value(), "every item gets a relevance");
        Require(*item.relevance >= -1.0 && *item.relevance <= 1.0, "cosine relevance stays in range");
    }
    Require(*scored[0].relevance >= *scored[1].relevance, "scored items are sorted descending");
}

void ScenarioActiveAndOpenFiles() {
    context_engine::tests::log("scenario: active and open files");
    Harness h;
    context_engine::EditorDocument active{"/ws/main.py", "python", numbered_lines(10), context_engine::DocumentSelection{3, 5}};
    context_engine::EditorDocument other{"/ws/other.py", "python", "x = 1\n", std::nullopt};
    h.workspace->set_active_document(active);
    h.workspace->set_open_documents({other, active});

    context_engine::ContextRequest request;
    request.sources = {context_engine::ContextSource::ActiveFile};
    request.selection_only = true;
    auto selected = h.assembler->assemble_context(request);
    Require(selected.items.size() == 1, "active file yields one item");
    Require(selected.items[0].content == "line 3\nline 4\nline 5", "selection keeps only the selected lines");
    Require(selected.items[0].line_start.value_or(0) == 3 && selected.items[0].line_end.value_or(0) == 5,
            "selection carries its line range");
    Require(selected.items[0].relevance.value_or(0) == 1.0, "active file is the most relevant");

    request.sources = {context_engine::ContextSource::OpenFiles};
    request.selection_only = false;
    request.limit_files = 1;
    auto open = h.assembler->assemble_context(request);
    Require(open.items.size() == 1 && open.items[0].path.value_or("") == "/ws/main.py",
            "active document leads the open files");
}

void ScenarioWorkspaceSearch() {
    context_engine::tests::log("scenario: workspace search");
    Harness h;
    const std::string content = "def load_config(path):\n    return parse(path)\n";
    context_engine::ContextItem stored;
    stored.id = context_engine::hash_id("/ws/config.py");
    stored.name = "config.py";
    stored.path = "/ws/config.py";
    stored.language = "python";
    stored.content = content;
    stored.line_start = 1;
    stored.line_end = 2;
    Require(h.store->save_context_item(stored), "item saved");
    Require(h.store->save_vector(context_engine::vector_id_for(stored.id), h.embeddings->generate_embedding(content),
                                 context_engine::FileMeta{stored.id, "/ws/config.py", "python"}),
            "vector saved");

    context_engine::ContextRequest request;
    request.query = content;
    request.sources = {context_engine::ContextSource::Workspace};
    auto result = h.assembler->assemble_context(request);
    Require(result.items.size() == 1 && result.items[0].id == stored.id, "stored file must be found");
    Require(result.items[0].relevance.value_or(0) == 0.9, "first workspace hit has relevance 0.9");
    Require(result.available_sources.size() == 1 &&
                result.available_sources[0] == context_engine::ContextSource::Workspace,
            "workspace is listed as a source");

    h.network->set_online(false);
    auto offline = h.assembler->assemble_context(request);
    Require(offline.items.empty() && offline.available_sources.empty(),
            "offline without a local model skips similarity search");
}

void ScenarioSourcesOnlyListedWhenUsed() {
    context_engine::tests::log("scenario: sources listed only when they yield items");
    Harness h;
    context_engine::ContextRequest request;
    request.query = "anything";
    request.sources = {context_engine::ContextSource::ActiveFile, context_engine::ContextSource::OpenFiles,
                       context_engine::ContextSource::ConversationHistory};
    auto result = h.assembler->assemble_context(request);
    Require(result.items.empty(), "nothing to assemble");
    Require(result.available_sources.empty(), "empty sources are not listed");
    Require(!result.truncated && result.token_count == 0, "empty result is not truncated");
}

void ScenarioHistoryAndProjectInfo() {
    context_engine::tests::log("scenario: history and project info");
    Harness h;

    context_engine::Conversation conversation;
    conversation.id = "conv-1";
    conversation.title = "Config question";
    conversation.model_id = "default";
    conversation.created_at = 1;
    conversation.updated_at = 2;
    conversation.messages = {
        {"m1", context_engine::MessageRole::User, "how is config loaded?", 1, std::nullopt, std::nullopt, std::nullopt},
        {"m2", context_engine::MessageRole::Assistant, "from a json file", 2, std::nullopt, std::nullopt, std::nullopt},
    };
    Require(h.store->save_conversation(conversation), "conversation saved");

    h.dir.write("ws/package.json",
                R"({"name": "demo", "version": "1.2.3", "dependencies": {"lodash": "4", "express": "4"}})");

    context_engine::ContextRequest request;
    request.sources = {context_engine::ContextSource::ConversationHistory};
    request.conversation_id = "conv-1";
    request.include_project_info = true;
    auto result = h.assembler->assemble_context(request);

    Require(result.items.size() == 2, "history plus project info");
    const auto& history = result.items[0];
    Require(history.id == "history-conv-1", "history item id");
    Require(history.content == "User: how is config loaded?\n\nAssistant: from a json file", "history transcript");

    const auto& project = result.items[1];
    Require(project.id == "project-info", "project item id");
    Require(project.content.find("Project Type: Node.js") != std::string::npos, "package.json means Node.js");
    Require(project.content.find("Name: demo") != std::string::npos, "package name is reported");
    Require(project.content.find("Dependencies: express, lodash") != std::string::npos, "dependencies are listed");
    Require(result.available_sources.size() == 1, "project info is not a source");
}

void ScenarioRequestFromJson() {
    context_engine::tests::log("scenario: request parsing");
    auto request = context_engine::context_request_from_json(nlohmann::json{
        {"query", "find parser"},
        {"context_type", "agent"},
        {"sources", {"open_files", "bogus", "workspace"}},
        {"max_tokens", 300},
        {"include_project_info", true}});

    Require(request.query == "find parser", "query parsed");
    Require(request.context_type == context_engine::ContextType::Agent, "context type parsed");
    Require(request.sources.size() == 2, "unknown sources are dropped");
    Require(request.max_tokens.value_or(0) == 300, "max tokens parsed");
    Require(request.include_project_info, "project info flag parsed");

    auto defaults = context_engine::context_request_from_json(nlohmann::json::object());
    Require(defaults.context_type == context_engine::ContextType::Chat, "chat is the default type");
    Require(defaults.sources.size() == 2, "active file and workspace are the default sources");
}

} // namespace

int main() {
    context_engine::tests::init_logging();
    try {
        context_engine::tests::log("context_assembler_test: start");
        ScenarioTokenEstimates();
        ScenarioGreedyStopsAtFirstOverflow();
        ScenarioBudgetIsNeverExceeded();
        ScenarioFirstItemIsCutDown();
        ScenarioScoring();
        ScenarioActiveAndOpenFiles();
        ScenarioWorkspaceSearch();
        ScenarioSourcesOnlyListedWhenUsed();
        ScenarioHistoryAndProjectInfo();
        ScenarioRequestFromJson();
        context_engine::tests::log("context_assembler_test: finished");
        return EXIT_SUCCESS;
    } catch (const std::exception& ex) {
        context_engine::tests::log_error(ex.what());
        return EXIT_FAILURE;
    }
}
