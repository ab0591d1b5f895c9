#include "context_engine.hpp"
#include "utils.hpp"

#include "../test_logger.hpp"

#include <algorithm>
#include <chrono>
#include <cstdlib>
#include <memory>
#include <string>
#include <vector>

using context_engine::tests::Require;
using context_engine::tests::TempDir;

namespace {

constexpr int kDimension = 64;

context_engine::EngineConfig test_config(const std::filesystem::path& root) {
    context_engine::EngineConfig config;
    config.workspace_root = root.string();
    config.embedding.dimension = kDimension;
    config.indexing.enable_startup_sweep = false;
    config.indexing.batch_delay_ms = 50;
    config.indexing.next_batch_delay_ms = 10;
    config.network.monitor_enabled = false;
    return config;
}

context_engine::EngineDependencies test_dependencies(const context_engine::EngineConfig& config,
                                                     std::shared_ptr<context_engine::FilesystemWorkspace> workspace) {
    context_engine::EngineDependencies deps;
    deps.workspace = std::move(workspace);
    deps.network = std::make_shared<context_engine::StaticNetworkStatus>(true);
    deps.embeddings = std::make_shared<context_engine::EmbeddingService>(
        config.embedding, std::vector<std::shared_ptr<context_engine::Embedder>>{});
    deps.extractors = std::make_shared<context_engine::ExtractorRegistry>();
    return deps;
}

bool has_source(const context_engine::ContextResult& r, context_engine::ContextSource s) {
    return std::find(r.available_sources.begin(), r.available_sources.end(), s) != r.available_sources.end();
}

void ScenarioEditToContext() {
    context_engine::tests::log("scenario: edit event to assembled context");
    TempDir dir;
    auto root = dir.path() / "project";
    const std::string source =
        "def tokenize(text):\n"
        "    return text.split()\n";
    auto file = dir.write("project/src/lexer.py", source).generic_string();
    dir.write("project/go.mod", "module example.com/demo\n");

    auto config = test_config(root);
    auto workspace = std::make_shared<context_engine::FilesystemWorkspace>(root, config.indexing.exclude_patterns);
    context_engine::ContextEngine engine(config, test_dependencies(config, workspace));

    auto status = engine.initialize();
    Require(status.ok(), "engine must initialize");
    Require(engine.is_initialized(), "engine reports initialized");
    Require(std::filesystem::exists(root / ".context-engine" / "context.db"), "store lives under the workspace");

    workspace->set_active_document(context_engine::EditorDocument{file, "python", source, std::nullopt});
    engine.on_active_file_changed(file);
    Require(engine.indexing()->wait_idle(std::chrono::seconds(20)), "active file is indexed");
    Require(engine.store()->count_context_items() == 1, "one file item");
    Require(engine.store()->count_code_entities() == 1, "tokenize entity");

    auto result = engine.get_context(source, context_engine::ContextType::Chat);
    Require(has_source(result, context_engine::ContextSource::ActiveFile), "active file source used");
    Require(has_source(result, context_engine::ContextSource::Workspace), "workspace source used");
    Require(!has_source(result, context_engine::ContextSource::ConversationHistory), "no history yet");
    Require(result.items.front().relevance.value_or(0) == 1.0, "active file ranks first");

    auto project = std::find_if(result.items.begin(), result.items.end(),
                                [](const context_engine::ContextItem& i) { return i.id == "project-info"; });
    Require(project != result.items.end(), "project info is included");
    Require(project->content.find("Project Type: Go") != std::string::npos, "go.mod means Go");
    Require(result.token_count <= 6000, "chat budget respected");

    engine.on_file_deleted(file);
    Require(engine.store()->count_context_items() == 0, "deleted file leaves the index");
    Require(!engine.indexing()->is_indexed(file), "deleted file is no longer indexed");
}

void ScenarioConversationsAndPatterns() {
    context_engine::tests::log("scenario: conversations and usage patterns");
    TempDir dir;
    auto config = test_config(dir.path());
    auto workspace = std::make_shared<context_engine::FilesystemWorkspace>(dir.path(), config.indexing.exclude_patterns);
    context_engine::ContextEngine engine(config, test_dependencies(config, workspace));
    Require(engine.initialize().ok(), "engine must initialize");

    engine.add_message("c1", context_engine::MessageRole::User, "What does lexer.py do?");
    engine.add_message("c1", context_engine::MessageRole::Assistant, "It splits text into tokens.");
    auto conversation = engine.get_conversation("c1");
    Require(conversation && conversation->messages.size() == 2, "messages recorded");

    auto transcript = engine.get_conversation_context("c1", "");
    Require(transcript.find("user: What does lexer.py do?") == 0, "transcript starts with the first message");

    auto chat = engine.get_context("tokens", context_engine::ContextType::Chat, std::string("c1"));
    Require(has_source(chat, context_engine::ContextSource::ConversationHistory), "history source used for chat");

    auto completion = engine.get_context("tokens", context_engine::ContextType::CodeCompletion, std::string("c1"));
    Require(!has_source(completion, context_engine::ContextSource::ConversationHistory),
            "completion never includes history");

    Require(engine.track_usage_pattern("naming", "snake_case", {"parse_file"}), "pattern tracked");
    Require(engine.track_usage_pattern("naming", "snake_case", {"load_config"}), "repeat sighting tracked");
    Require(!engine.track_usage_pattern("", "x", {}), "pattern type is required");
    auto patterns = engine.store()->find_user_patterns("naming", 10);
    Require(patterns.size() == 1 && patterns[0].frequency == 2, "repeat sightings merge");

    auto options = engine.config().memory;
    options.conversation_memory_length = 1;
    engine.update_memory_options(options);
    engine.add_message("c1", context_engine::MessageRole::User, "And the parser?");
    Require(engine.get_conversation("c1")->messages.size() <= 2, "new options apply to the next message");
}

void ScenarioLifecycle() {
    context_engine::tests::log("scenario: lifecycle");
    TempDir dir;
    auto config = test_config(dir.path());
    // A regular file where the storage directory should be
    dir.write("blocked", "not a directory");
    config.storage.directory = (dir.path() / "blocked").string();

    auto workspace = std::make_shared<context_engine::FilesystemWorkspace>(dir.path(), config.indexing.exclude_patterns);
    context_engine::ContextEngine broken(config, test_dependencies(config, workspace));
    auto status = broken.initialize();
    Require(!status.ok(), "unusable storage fails initialization");
    Require(status.error().code == context_engine::ErrorCode::StorageUnavailable, "storage error code");
    Require(broken.get_context("anything", context_engine::ContextType::Agent).items.size() <= 1,
            "queries still answer without a store");

    auto good_config = test_config(dir.path());
    context_engine::ContextEngine engine(good_config, test_dependencies(good_config, workspace));
    Require(engine.initialize().ok(), "engine must initialize");
    Require(engine.initialize().ok(), "initialize is idempotent");
    engine.shutdown();
    engine.shutdown();
    Require(!engine.is_initialized(), "shutdown clears the initialized flag");
    Require(!engine.initialize().ok(), "a shut down engine cannot be restarted");
}

} // namespace

int main() {
    context_engine::tests::init_logging();
    try {
        context_engine::tests::log("context_engine_test: start");
        ScenarioEditToContext();
        ScenarioConversationsAndPatterns();
        ScenarioLifecycle();
        context_engine::tests::log("context_engine_test: finished");
        return EXIT_SUCCESS;
    } catch (const std::exception& ex) {
        context_engine::tests::log_error(ex.what());
        return EXIT_FAILURE;
    }
}
