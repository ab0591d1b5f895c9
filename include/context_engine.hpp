#pragma once
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>
#include "KeyManager.hpp"
#include "config.hpp"
#include "context_assembler.hpp"
#include "embedding_service.hpp"
#include "indexing_service.hpp"
#include "memory/memory_manager.hpp"
#include "network_monitor.hpp"
#include "parsing/syntax_extractor.hpp"
#include "result.hpp"
#include "storage/context_store.hpp"
#include "workspace.hpp"

namespace context_engine {

// Collaborators the engine does not build itself. Any left empty get the
// production default during construction.
struct EngineDependencies {
    std::shared_ptr<WorkspaceProvider> workspace;
    std::shared_ptr<NetworkStatus> network;
    std::shared_ptr<EmbeddingService> embeddings;
    std::shared_ptr<ExtractorRegistry> extractors;
    std::shared_ptr<KeyManager> key_manager;
};

// Public facade. Wires every service once at construction and tears them
// down in shutdown().
class ContextEngine {
public:
    explicit ContextEngine(EngineConfig config, EngineDependencies deps = {});
    ~ContextEngine();

    ContextEngine(const ContextEngine&) = delete;
    ContextEngine& operator=(const ContextEngine&) = delete;

    Status initialize();
    void shutdown();
    bool is_initialized() const;

    ContextResult get_context(const std::string& query,
                              ContextType context_type,
                              const std::optional<std::string>& conversation_id = std::nullopt);
    ContextResult assemble_context(const ContextRequest& request);

    void reindex_workspace();
    bool track_usage_pattern(const std::string& pattern_type,
                             const std::string& pattern,
                             const std::vector<std::string>& examples);

    // --- editor events ---
    void on_active_file_changed(const std::string& path);
    void on_file_changed(const std::string& path);
    void on_file_deleted(const std::string& path);

    // --- conversations ---
    std::string add_message(const std::string& conversation_id, MessageRole role, const std::string& content);
    std::optional<Conversation> get_conversation(const std::string& conversation_id);
    std::string get_conversation_context(const std::string& conversation_id,
                                         const std::string& query,
                                         int max_tokens = 2000);

    void update_memory_options(const MemoryOptions& options);

    const EngineConfig& config() const { return config_; }
    std::shared_ptr<ContextStore> store() const { return store_; }
    std::shared_ptr<IndexingService> indexing() const { return indexing_; }
    std::shared_ptr<WorkspaceProvider> workspace() const { return workspace_; }
    std::shared_ptr<EmbeddingService> embeddings() const { return embeddings_; }

private:
    EngineConfig config_;
    std::shared_ptr<WorkspaceProvider> workspace_;
    std::shared_ptr<NetworkStatus> network_;
    std::shared_ptr<NetworkMonitor> monitor_;   // set only when we own the poller
    std::shared_ptr<ContextStore> store_;
    std::shared_ptr<EmbeddingService> embeddings_;
    std::shared_ptr<ExtractorRegistry> extractors_;
    std::shared_ptr<IndexingService> indexing_;
    std::shared_ptr<ContextAssembler> assembler_;
    std::shared_ptr<MemoryManager> memory_;

    mutable std::mutex lifecycle_mutex_;
    bool initialized_ = false;
    bool shut_down_ = false;
};

} // namespace context_engine
