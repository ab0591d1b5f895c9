#pragma once
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>
#include "config.hpp"
#include "embedding_service.hpp"
#include "storage/context_store.hpp"
#include "types.hpp"

namespace context_engine {

// Owns conversations: appends messages, keeps them within the configured
// size and token budget, and persists every change through the store.
class MemoryManager {
public:
    MemoryManager(MemoryOptions options,
                  std::shared_ptr<ContextStore> store,
                  std::shared_ptr<EmbeddingService> embeddings,
                  std::string default_model);

    // Creates the conversation on first use. Returns the new message id.
    std::string add_message(const std::string& conversation_id, MessageRole role, const std::string& content);

    std::optional<Conversation> get_conversation(const std::string& conversation_id);
    std::vector<Conversation> get_recent_conversations(size_t limit);

    bool update_message_importance(const std::string& conversation_id,
                                   const std::string& message_id,
                                   double importance);
    bool set_model(const std::string& conversation_id, const std::string& model_id);

    // Transcript of `role: content` blocks, most relevant first when a query
    // is given, cut off with a marker once `max_tokens` is reached.
    std::string get_conversation_context(const std::string& conversation_id,
                                         const std::string& query,
                                         int max_tokens = 2000);

    void set_options(const MemoryOptions& options);
    MemoryOptions options() const;

    // --- exposed for tests ---
    static double calculate_importance(const std::string& content);
    static std::string generate_title(const std::string& content);
    bool should_prune(const Conversation& conversation) const;
    void prune(Conversation& conversation) const;
    size_t cached_conversation_count() const;

private:
    std::optional<Conversation> load_locked(const std::string& conversation_id);
    // Inserts or refreshes an entry, evicting one when the cache is full.
    void cache_locked(Conversation conversation);

    void prune_lru(Conversation& conversation, size_t keep) const;
    void prune_importance(Conversation& conversation, size_t keep) const;
    void prune_hybrid(Conversation& conversation, size_t keep) const;

    MemoryOptions options_;
    std::shared_ptr<ContextStore> store_;
    std::shared_ptr<EmbeddingService> embeddings_;
    std::string default_model_;

    mutable std::mutex mutex_;
    std::unordered_map<std::string, Conversation> conversations_;
};

} // namespace context_engine
