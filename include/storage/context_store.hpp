#pragma once
#include <filesystem>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>
#include "config.hpp"
#include "result.hpp"
#include "types.hpp"
#include "storage/faiss_vector_store.hpp"

struct sqlite3;

namespace context_engine {

struct VectorRecord {
    int64_t id;
    std::vector<float> vector;
    VectorMetadata metadata;
};

// Durable home of every indexed artifact: the relational tables in
// context.db plus the persisted vector index beside it.
//
// Public operations never throw. Failures are logged and surface as false or
// an empty collection, and every call on a store that is not open behaves
// the same way.
class ContextStore {
public:
    static constexpr const char* kDatabaseFile = "context.db";

    ContextStore(std::filesystem::path directory, int dimension, int busy_timeout_ms = 5000);
    ~ContextStore();

    ContextStore(const ContextStore&) = delete;
    ContextStore& operator=(const ContextStore&) = delete;

    Status open();
    void close();
    bool is_ready() const;

    const std::filesystem::path& directory() const { return directory_; }

    // --- context items ---
    bool save_context_item(const ContextItem& item);
    std::optional<ContextItem> get_context_item(const std::string& id);
    std::vector<ContextItem> find_context_items(const std::string& path_pattern, int limit);
    // Paths of file items whose vector is in the index.
    std::vector<std::string> indexed_paths();
    int count_context_items();

    // --- code entities ---
    bool save_code_entity(const CodeEntity& entity);
    std::optional<CodeEntity> get_code_entity(const std::string& id);
    std::vector<CodeEntity> find_code_entities(const std::string& name_pattern, int limit);
    std::vector<CodeEntity> find_entities_for_file(const std::string& file_path);
    int count_code_entities();

    // --- conversations ---
    bool save_conversation(const Conversation& conversation);
    std::vector<Conversation> load_conversations();
    std::optional<Conversation> load_conversation(const std::string& id);
    bool delete_conversation(const std::string& id);

    // --- usage patterns ---
    bool save_user_pattern(const UserPattern& pattern);
    std::vector<UserPattern> find_user_patterns(const std::string& type, int limit);

    // --- vectors ---
    bool save_vector(int64_t id, const std::vector<float>& vector, const VectorMetadata& metadata);
    // Links and indexes every record whose row exists, in one transaction and
    // one index write. Returns the ids that were stored.
    std::vector<int64_t> save_vectors(const std::vector<VectorRecord>& records);
    std::vector<VectorMatch> find_similar_vectors(const std::vector<float>& query_vector, int limit);
    std::vector<int64_t> vector_ids() const;

    // Drops the file item, its entities and all of their vectors.
    bool remove_file(const std::string& path);

private:
    Status exec(const char* sql);
    Status create_schema();
    void persist_vectors();
    bool link_vector(const VectorRecord& record);
    void clear_vector_links();
    std::vector<ConversationMessage> load_messages(const std::string& conversation_id);
    std::optional<VectorMetadata> metadata_for_vector(int64_t id);

    std::filesystem::path directory_;
    int busy_timeout_ms_;
    sqlite3* db_ = nullptr;
    std::unique_ptr<FaissVectorStore> vectors_;
    mutable std::mutex db_mutex_;
};

} // namespace context_engine
