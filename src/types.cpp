#include "types.hpp"

namespace context_engine {

using json = nlohmann::json;

std::string to_string(ContextItemType type) {
    switch (type) {
        case ContextItemType::File: return "file";
        case ContextItemType::Entity: return "entity";
        case ContextItemType::ConversationHistory: return "conversation_history";
        case ContextItemType::ProjectInfo: return "project_info";
    }
    return "file";
}

std::string to_string(EntityKind kind) {
    return kind == EntityKind::Class ? "class" : "function";
}

std::string to_string(MessageRole role) {
    switch (role) {
        case MessageRole::User: return "user";
        case MessageRole::Assistant: return "assistant";
        case MessageRole::System: return "system";
    }
    return "user";
}

std::string to_string(ContextSource source) {
    switch (source) {
        case ContextSource::ActiveFile: return "active_file";
        case ContextSource::OpenFiles: return "open_files";
        case ContextSource::Workspace: return "workspace";
        case ContextSource::ConversationHistory: return "conversation_history";
    }
    return "active_file";
}

std::string to_string(ContextType type) {
    switch (type) {
        case ContextType::CodeCompletion: return "code_completion";
        case ContextType::Chat: return "chat";
        case ContextType::Agent: return "agent";
    }
    return "chat";
}

ContextItemType parse_item_type(const std::string& s) {
    if (s == "entity" || s == "function" || s == "class") return ContextItemType::Entity;
    if (s == "conversation_history") return ContextItemType::ConversationHistory;
    if (s == "project_info") return ContextItemType::ProjectInfo;
    return ContextItemType::File;
}

EntityKind parse_entity_kind(const std::string& s) {
    return s == "class" ? EntityKind::Class : EntityKind::Function;
}

MessageRole parse_role(const std::string& s) {
    if (s == "assistant") return MessageRole::Assistant;
    if (s == "system") return MessageRole::System;
    return MessageRole::User;
}

std::optional<ContextSource> parse_source(const std::string& s) {
    if (s == "active_file") return ContextSource::ActiveFile;
    if (s == "open_files") return ContextSource::OpenFiles;
    if (s == "workspace") return ContextSource::Workspace;
    if (s == "conversation_history") return ContextSource::ConversationHistory;
    return std::nullopt;
}

std::optional<ContextType> parse_context_type(const std::string& s) {
    if (s == "code_completion" || s == "completion") return ContextType::CodeCompletion;
    if (s == "chat") return ContextType::Chat;
    if (s == "agent") return ContextType::Agent;
    return std::nullopt;
}

namespace {

template<class... Ts> struct overloaded : Ts... { using Ts::operator()...; };
template<class... Ts> overloaded(Ts...) -> overloaded<Ts...>;

} // namespace

json metadata_to_json(const VectorMetadata& meta) {
    return std::visit(overloaded{
        [](const FileMeta& m) {
            return json{{"type", "file"}, {"item_id", m.item_id}, {"path", m.path}, {"language", m.language}};
        },
        [](const EntityMeta& m) {
            return json{{"type", "entity"}, {"entity_id", m.entity_id}, {"name", m.name},
                        {"kind", to_string(m.kind)}, {"file_path", m.file_path}};
        },
        [](const ProjectMeta& m) {
            return json{{"type", "project"}, {"name", m.name}, {"path", m.path}};
        }
    }, meta);
}

std::optional<VectorMetadata> metadata_from_json(const json& j) {
    if (!j.is_object() || !j.contains("type")) return std::nullopt;
    std::string type = j.value("type", "");
    if (type == "file") {
        return FileMeta{j.value("item_id", ""), j.value("path", ""), j.value("language", "")};
    }
    if (type == "entity") {
        return EntityMeta{j.value("entity_id", ""), j.value("name", ""),
                          parse_entity_kind(j.value("kind", "function")), j.value("file_path", "")};
    }
    if (type == "project") {
        return ProjectMeta{j.value("name", ""), j.value("path", "")};
    }
    return std::nullopt;
}

json ContextItem::to_json() const {
    json j = {
        {"id", id},
        {"type", to_string(type)},
        {"name", name},
        {"language", language},
        {"content", content},
        {"size", size},
        {"last_accessed", last_accessed},
        {"importance_score", importance_score}
    };
    if (path) j["path"] = *path;
    if (line_start) j["line_start"] = *line_start;
    if (line_end) j["line_end"] = *line_end;
    if (vector_id) j["vector_id"] = *vector_id;
    if (metadata) j["metadata"] = metadata_to_json(*metadata);
    if (relevance) j["relevance"] = *relevance;
    return j;
}

json ConversationMessage::to_json() const {
    json j = {
        {"id", id},
        {"role", to_string(role)},
        {"content", content},
        {"timestamp", timestamp}
    };
    if (importance) j["importance"] = *importance;
    return j;
}

json Conversation::to_json() const {
    json msgs = json::array();
    for (const auto& m : messages) msgs.push_back(m.to_json());
    json j = {
        {"id", id},
        {"title", title},
        {"model_id", model_id},
        {"temperature", temperature},
        {"created_at", created_at},
        {"updated_at", updated_at},
        {"messages", msgs}
    };
    if (system_prompt) j["system_prompt"] = *system_prompt;
    return j;
}

json ContextResult::to_json() const {
    json list = json::array();
    for (const auto& item : items) list.push_back(item.to_json());
    json sources = json::array();
    for (auto s : available_sources) sources.push_back(to_string(s));
    return {
        {"items", list},
        {"token_count", token_count},
        {"truncated", truncated},
        {"available_sources", sources}
    };
}

} // namespace context_engine
