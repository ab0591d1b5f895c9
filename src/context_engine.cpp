#include "context_engine.hpp"
#include <spdlog/spdlog.h>
#include "utils.hpp"

namespace context_engine {

ContextEngine::ContextEngine(EngineConfig config, EngineDependencies deps)
    : config_(std::move(config)) {
    workspace_ = deps.workspace
        ? deps.workspace
        : std::make_shared<FilesystemWorkspace>(config_.workspace_root, config_.indexing.exclude_patterns);

    if (deps.network) {
        network_ = deps.network;
    } else if (config_.network.monitor_enabled) {
        monitor_ = std::make_shared<NetworkMonitor>(config_.network);
        network_ = monitor_;
    } else {
        network_ = std::make_shared<StaticNetworkStatus>(false);
    }

    auto key_manager = deps.key_manager ? deps.key_manager : std::make_shared<KeyManager>();
    embeddings_ = deps.embeddings
        ? deps.embeddings
        : std::make_shared<EmbeddingService>(config_.embedding, key_manager, network_);
    extractors_ = deps.extractors ? deps.extractors : ExtractorRegistry::with_default_grammars();

    fs::path storage_dir(config_.storage.directory);
    if (storage_dir.is_relative()) storage_dir = workspace_->root() / storage_dir;
    store_ = std::make_shared<ContextStore>(storage_dir, config_.embedding.dimension,
                                            config_.storage.busy_timeout_ms);

    indexing_ = std::make_shared<IndexingService>(config_.indexing, store_, embeddings_, network_,
                                                  workspace_, extractors_);
    assembler_ = std::make_shared<ContextAssembler>(config_.assembly, store_, embeddings_, network_, workspace_);
    memory_ = std::make_shared<MemoryManager>(config_.memory, store_, embeddings_, config_.default_model);
}

ContextEngine::~ContextEngine() {
    shutdown();
}

Status ContextEngine::initialize() {
    std::lock_guard<std::mutex> lock(lifecycle_mutex_);
    if (initialized_) return Status::success();
    if (shut_down_) return make_error(ErrorCode::InvalidArgument, "engine already shut down");

    spdlog::info("🚀 Initializing context engine for {}", workspace_->root().string());

    if (monitor_) {
        monitor_->check_now();
        monitor_->start();
    }

    embeddings_->initialize();

    auto status = store_->open();
    if (!status) {
        spdlog::error("❌ Store unavailable, queries will return empty results: {}", status.error().describe());
        return status;
    }

    indexing_->initialize();
    initialized_ = true;
    spdlog::info("✅ Context engine ready");
    return Status::success();
}

bool ContextEngine::is_initialized() const {
    std::lock_guard<std::mutex> lock(lifecycle_mutex_);
    return initialized_;
}

void ContextEngine::shutdown() {
    std::lock_guard<std::mutex> lock(lifecycle_mutex_);
    if (shut_down_) return;
    shut_down_ = true;

    indexing_->dispose();
    if (monitor_) monitor_->stop();
    store_->close();
    initialized_ = false;
    spdlog::info("👋 Context engine shut down");
}

ContextResult ContextEngine::get_context(const std::string& query,
                                         ContextType context_type,
                                         const std::optional<std::string>& conversation_id) {
    ContextRequest request;
    request.query = query;
    request.context_type = context_type;
    request.include_project_info = true;
    request.conversation_id = conversation_id;

    switch (context_type) {
        case ContextType::CodeCompletion:
            request.sources = {ContextSource::ActiveFile, ContextSource::Workspace};
            break;
        case ContextType::Chat:
            request.sources = {ContextSource::ActiveFile, ContextSource::Workspace,
                               ContextSource::ConversationHistory};
            break;
        case ContextType::Agent:
            request.sources = {ContextSource::ActiveFile, ContextSource::OpenFiles,
                               ContextSource::Workspace, ContextSource::ConversationHistory};
            break;
    }
    return assembler_->assemble_context(request);
}

ContextResult ContextEngine::assemble_context(const ContextRequest& request) {
    return assembler_->assemble_context(request);
}

void ContextEngine::reindex_workspace() {
    spdlog::info("🔄 Re-indexing workspace");
    indexing_->index_workspace_in_background();
}

bool ContextEngine::track_usage_pattern(const std::string& pattern_type,
                                        const std::string& pattern,
                                        const std::vector<std::string>& examples) {
    if (pattern_type.empty() || pattern.empty()) return false;

    int64_t now = now_ms();
    UserPattern record;
    record.id = hash_id(pattern_type + ":" + pattern);
    record.type = pattern_type;
    record.pattern = pattern;
    record.examples = examples;
    record.first_seen = now;
    record.last_seen = now;
    return store_->save_user_pattern(record);
}

void ContextEngine::on_active_file_changed(const std::string& path) {
    indexing_->queue_file_for_indexing(path, true);
}

void ContextEngine::on_file_changed(const std::string& path) {
    indexing_->queue_file_for_indexing(path, false);
}

void ContextEngine::on_file_deleted(const std::string& path) {
    indexing_->remove_file(path);
}

std::string ContextEngine::add_message(const std::string& conversation_id, MessageRole role, const std::string& content) {
    return memory_->add_message(conversation_id, role, content);
}

std::optional<Conversation> ContextEngine::get_conversation(const std::string& conversation_id) {
    return memory_->get_conversation(conversation_id);
}

std::string ContextEngine::get_conversation_context(const std::string& conversation_id,
                                                    const std::string& query,
                                                    int max_tokens) {
    return memory_->get_conversation_context(conversation_id, query, max_tokens);
}

void ContextEngine::update_memory_options(const MemoryOptions& options) {
    memory_->set_options(options);
    config_.memory = options;
}

} // namespace context_engine
