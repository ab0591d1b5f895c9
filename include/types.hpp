#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <variant>
#include <vector>
#include <nlohmann/json.hpp>

namespace context_engine {

enum class ContextItemType { File, Entity, ConversationHistory, ProjectInfo };
enum class EntityKind { Function, Class };
enum class MessageRole { User, Assistant, System };
enum class ContextSource { ActiveFile, OpenFiles, Workspace, ConversationHistory };
enum class ContextType { CodeCompletion, Chat, Agent };

std::string to_string(ContextItemType type);
std::string to_string(EntityKind kind);
std::string to_string(MessageRole role);
std::string to_string(ContextSource source);
std::string to_string(ContextType type);

ContextItemType parse_item_type(const std::string& s);
EntityKind parse_entity_kind(const std::string& s);
MessageRole parse_role(const std::string& s);
std::optional<ContextSource> parse_source(const std::string& s);
std::optional<ContextType> parse_context_type(const std::string& s);

// --- Vector metadata: one shape per kind of vector owner ---

struct FileMeta {
    std::string item_id;
    std::string path;
    std::string language;
};

struct EntityMeta {
    std::string entity_id;
    std::string name;
    EntityKind kind = EntityKind::Function;
    std::string file_path;
};

struct ProjectMeta {
    std::string name;
    std::string path;
};

using VectorMetadata = std::variant<FileMeta, EntityMeta, ProjectMeta>;

nlohmann::json metadata_to_json(const VectorMetadata& meta);
std::optional<VectorMetadata> metadata_from_json(const nlohmann::json& j);

// --- Stored artifacts ---

struct ContextItem {
    std::string id;
    ContextItemType type = ContextItemType::File;
    std::string name;
    std::optional<std::string> path;
    std::string language;
    std::string content;
    std::optional<int> line_start;
    std::optional<int> line_end;
    int64_t size = 0;
    int64_t last_accessed = 0;
    double importance_score = 0.5;
    std::optional<int64_t> vector_id;
    std::optional<VectorMetadata> metadata;

    // Query-time only, never persisted.
    std::optional<double> relevance;

    nlohmann::json to_json() const;
};

struct CodeEntity {
    std::string id;
    std::string name;
    EntityKind type = EntityKind::Function;
    std::string file_path;
    std::string code;
    int64_t first_seen = 0;
    int64_t last_seen = 0;
    int frequency = 1;
    std::optional<int64_t> vector_id;
};

struct VectorMatch {
    int64_t id = 0;
    float distance = 0.0f;   // cosine distance, 0 = identical direction
    std::optional<VectorMetadata> metadata;
};

struct ConversationMessage {
    std::string id;
    MessageRole role = MessageRole::User;
    std::string content;
    int64_t timestamp = 0;
    std::optional<double> importance;

    // Computed per query.
    std::optional<double> relevance;
    std::optional<double> combined_score;

    nlohmann::json to_json() const;
};

struct Conversation {
    std::string id;
    std::string title;
    std::vector<ConversationMessage> messages;
    std::string model_id;
    std::optional<std::string> system_prompt;
    double temperature = 0.7;
    int64_t created_at = 0;
    int64_t updated_at = 0;

    nlohmann::json to_json() const;
};

struct UserPattern {
    std::string id;
    std::string type;
    std::string pattern;
    std::vector<std::string> examples;
    int frequency = 1;
    int64_t first_seen = 0;
    int64_t last_seen = 0;
};

struct ContextResult {
    std::vector<ContextItem> items;
    int token_count = 0;
    bool truncated = false;
    std::vector<ContextSource> available_sources;

    nlohmann::json to_json() const;
};

} // namespace context_engine
