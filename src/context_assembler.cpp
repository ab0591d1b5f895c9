#include "context_assembler.hpp"
#include <algorithm>
#include <cmath>
#include <sstream>
#include <unordered_set>
#include <spdlog/spdlog.h>
#include "utils.hpp"
#include "vector_math.hpp"

namespace context_engine {

using json = nlohmann::json;

namespace {

const char* kCodeTruncationMarker = "\n// ... content truncated ...";
const char* kProseTruncationMarker = "... [content truncated] ...";

std::vector<std::string> split_lines(const std::string& content) {
    std::vector<std::string> lines;
    std::istringstream stream(content);
    std::string line;
    while (std::getline(stream, line)) lines.push_back(line);
    if (lines.empty()) lines.emplace_back();
    return lines;
}

std::string join_lines(const std::vector<std::string>& lines, size_t count) {
    std::string out;
    for (size_t i = 0; i < count && i < lines.size(); ++i) {
        if (i > 0) out += '\n';
        out += lines[i];
    }
    return out;
}

bool is_code(ContextItemType type) {
    return type == ContextItemType::File || type == ContextItemType::Entity;
}

ContextItem document_item(const EditorDocument& doc, double relevance) {
    auto lines = split_lines(doc.content);

    ContextItem item;
    item.id = hash_id(doc.path);
    item.type = ContextItemType::File;
    item.name = fs::path(doc.path).filename().string();
    item.path = doc.path;
    item.language = doc.language;
    item.content = doc.content;
    item.size = static_cast<int64_t>(doc.content.size());
    item.line_start = 1;
    item.line_end = static_cast<int>(lines.size());
    item.last_accessed = now_ms();
    item.relevance = relevance;
    return item;
}

} // namespace

ContextRequest context_request_from_json(const json& j) {
    ContextRequest req;
    req.query = j.value("query", "");
    if (auto type = parse_context_type(j.value("context_type", "chat"))) {
        req.context_type = *type;
    }
    if (j.contains("sources") && j["sources"].is_array()) {
        req.sources.clear();
        for (const auto& s : j["sources"]) {
            if (!s.is_string()) continue;
            if (auto source = parse_source(s.get<std::string>())) req.sources.push_back(*source);
        }
    }
    if (j.contains("max_tokens") && j["max_tokens"].is_number_integer()) {
        req.max_tokens = j["max_tokens"].get<int>();
    }
    req.include_project_info = j.value("include_project_info", false);
    if (j.contains("conversation_id") && j["conversation_id"].is_string()) {
        req.conversation_id = j["conversation_id"].get<std::string>();
    }
    req.selection_only = j.value("selection_only", false);
    if (j.contains("limit_files") && j["limit_files"].is_number_integer()) {
        req.limit_files = j["limit_files"].get<int>();
    }
    return req;
}

ContextAssembler::ContextAssembler(AssemblyConfig config,
                                   std::shared_ptr<ContextStore> store,
                                   std::shared_ptr<EmbeddingService> embeddings,
                                   std::shared_ptr<NetworkStatus> network,
                                   std::shared_ptr<WorkspaceProvider> workspace)
    : config_(std::move(config)),
      store_(std::move(store)),
      embeddings_(std::move(embeddings)),
      network_(std::move(network)),
      workspace_(std::move(workspace)) {}

int ContextAssembler::default_max_tokens(ContextType type) const {
    switch (type) {
        case ContextType::CodeCompletion: return config_.completion_max_tokens;
        case ContextType::Chat: return config_.chat_max_tokens;
        case ContextType::Agent: return config_.agent_max_tokens;
    }
    return config_.agent_max_tokens;
}

ContextResult ContextAssembler::assemble_context(const ContextRequest& request) {
    try {
        int max_tokens = request.max_tokens.value_or(default_max_tokens(request.context_type));

        std::vector<ContextItem> candidates;
        std::vector<ContextSource> available;
        auto collect = [&](ContextSource source, std::vector<ContextItem> items) {
            if (items.empty()) return;
            available.push_back(source);
            for (auto& item : items) candidates.push_back(std::move(item));
        };

        for (ContextSource source : request.sources) {
            switch (source) {
                case ContextSource::ActiveFile:
                    collect(source, active_file_items(request.selection_only));
                    break;
                case ContextSource::OpenFiles:
                    collect(source, open_file_items(request.limit_files.value_or(config_.open_files_limit)));
                    break;
                case ContextSource::Workspace:
                    if (!request.query.empty()) {
                        collect(source, workspace_items(request.query,
                                                        request.limit_files.value_or(config_.workspace_limit)));
                    }
                    break;
                case ContextSource::ConversationHistory:
                    collect(source, history_items(request.conversation_id));
                    break;
            }
        }

        if (request.include_project_info) {
            if (auto info = project_info()) candidates.push_back(std::move(*info));
        }

        auto ranked = score_items(std::move(candidates), request.query);
        ContextResult result = fit_to_budget(ranked, max_tokens);
        result.available_sources = std::move(available);

        spdlog::debug("Assembled {} items ({} tokens, truncated: {})",
                      result.items.size(), result.token_count, result.truncated);
        return result;
    } catch (const std::exception& e) {
        spdlog::error("❌ Context assembly failed: {}", e.what());
        return ContextResult{};
    }
}

std::vector<ContextItem> ContextAssembler::active_file_items(bool selection_only) {
    auto doc = workspace_->active_document();
    if (!doc) return {};

    ContextItem item = document_item(*doc, 1.0);
    if (selection_only && doc->selection && doc->selection->line_end >= doc->selection->line_start) {
        auto lines = split_lines(doc->content);
        int first = std::max(1, doc->selection->line_start);
        int last = std::min(static_cast<int>(lines.size()), doc->selection->line_end);
        if (first <= last) {
            std::vector<std::string> selected(lines.begin() + (first - 1), lines.begin() + last);
            item.content = join_lines(selected, selected.size());
            item.line_start = first;
            item.line_end = last;
            item.size = static_cast<int64_t>(item.content.size());
        }
    }
    return {item};
}

std::vector<ContextItem> ContextAssembler::open_file_items(int limit) {
    std::vector<ContextItem> items;
    auto active = workspace_->active_document();

    // Active document first, the rest in editor order
    auto docs = workspace_->open_documents();
    std::stable_partition(docs.begin(), docs.end(), [&](const EditorDocument& d) {
        return active && d.path == active->path;
    });

    for (const auto& doc : docs) {
        if (static_cast<int>(items.size()) >= limit) break;
        items.push_back(document_item(doc, 0.8));
    }
    return items;
}

std::vector<ContextItem> ContextAssembler::workspace_items(const std::string& query, int limit) {
    if (!network_->is_online() && embeddings_->requires_network()) {
        spdlog::debug("Offline without local model; skipping workspace similarity search");
        return {};
    }

    auto query_vector = embeddings_->generate_embedding(query);
    auto matches = store_->find_similar_vectors(query_vector, limit * 2);

    std::vector<ContextItem> items;
    std::unordered_set<std::string> seen_paths;
    for (const auto& match : matches) {
        if (static_cast<int>(items.size()) >= limit) break;
        if (!match.metadata) continue;

        if (const auto* file = std::get_if<FileMeta>(&*match.metadata)) {
            auto stored = store_->get_context_item(file->item_id);
            if (!stored) continue;
            std::string path = stored->path.value_or("");
            if (!path.empty() && !seen_paths.insert(path).second) continue;

            stored->relevance = std::max(0.1, 0.9 - 0.05 * static_cast<double>(items.size()));
            items.push_back(std::move(*stored));
        } else if (const auto* entity_meta = std::get_if<EntityMeta>(&*match.metadata)) {
            auto entity = store_->get_code_entity(entity_meta->entity_id);
            if (!entity) continue;

            ContextItem item;
            item.id = entity->id;
            item.type = ContextItemType::Entity;
            item.name = entity->name;
            item.path = entity->file_path;
            item.language = language_for_path(entity->file_path);
            item.content = entity->code;
            item.size = static_cast<int64_t>(entity->code.size());
            item.last_accessed = entity->last_seen;
            item.vector_id = entity->vector_id;
            item.metadata = *match.metadata;
            item.relevance = std::max(0.1, 0.85 - 0.05 * static_cast<double>(items.size()));
            items.push_back(std::move(item));
        }
        // Project vectors are not workspace content
    }
    return items;
}

std::vector<ContextItem> ContextAssembler::history_items(const std::optional<std::string>& conversation_id) {
    std::optional<Conversation> conversation;
    if (conversation_id) {
        conversation = store_->load_conversation(*conversation_id);
    } else {
        auto all = store_->load_conversations();
        if (!all.empty()) conversation = std::move(all.front());
    }
    if (!conversation || conversation->messages.empty()) return {};

    std::string transcript;
    for (const auto& msg : conversation->messages) {
        if (!transcript.empty()) transcript += "\n\n";
        transcript += (msg.role == MessageRole::User ? "User: " : "Assistant: ") + msg.content;
    }

    ContextItem item;
    item.id = "history-" + conversation->id;
    item.type = ContextItemType::ConversationHistory;
    item.name = "Conversation: " + conversation->title;
    item.content = std::move(transcript);
    item.size = static_cast<int64_t>(item.content.size());
    item.last_accessed = conversation->updated_at;
    item.relevance = 0.7;
    return {item};
}

std::optional<ContextItem> ContextAssembler::project_info() {
    fs::path root = workspace_->root();
    std::string project_type = "unknown";
    std::string details;

    if (auto package = workspace_->read_file(root / "package.json")) {
        project_type = "Node.js";
        try {
            json pkg = json::parse(*package);
            std::string deps;
            if (pkg.contains("dependencies") && pkg["dependencies"].is_object()) {
                for (auto it = pkg["dependencies"].begin(); it != pkg["dependencies"].end(); ++it) {
                    if (!deps.empty()) deps += ", ";
                    deps += it.key();
                }
            }
            auto field = [&](const char* key) {
                return pkg.contains(key) && pkg[key].is_string() ? pkg[key].get<std::string>() : std::string("N/A");
            };
            details = "Name: " + field("name") + "\nVersion: " + field("version") +
                      "\nDescription: " + field("description") + "\nDependencies: " + deps;
        } catch (const json::exception& e) {
            spdlog::debug("package.json unreadable: {}", e.what());
            details = "Failed to parse package.json";
        }
    } else if (workspace_->file_size(root / "requirements.txt") || workspace_->file_size(root / "setup.py")) {
        project_type = "Python";
    } else if (workspace_->file_size(root / "go.mod")) {
        project_type = "Go";
    } else if (workspace_->file_size(root / "Cargo.toml")) {
        project_type = "Rust";
    } else if (workspace_->file_size(root / "pom.xml") || workspace_->file_size(root / "build.gradle")) {
        project_type = "Java";
    } else if (!workspace_->find_files({".csproj", ".fsproj", ".sln"}, 1).empty()) {
        project_type = ".NET";
    }

    std::string content = "Workspace: " + root.filename().string() +
                          "\nPath: " + root.generic_string() +
                          "\nProject Type: " + project_type;
    if (!details.empty()) content += "\n" + details;

    ContextItem item;
    item.id = "project-info";
    item.type = ContextItemType::ProjectInfo;
    item.name = "Project Information";
    item.path = root.generic_string();
    item.content = std::move(content);
    item.size = static_cast<int64_t>(item.content.size());
    item.last_accessed = now_ms();
    item.metadata = ProjectMeta{root.filename().string(), root.generic_string()};
    item.relevance = 0.5;
    return item;
}

std::vector<ContextItem> ContextAssembler::score_items(std::vector<ContextItem> items, const std::string& query) {
    bool all_scored = std::all_of(items.begin(), items.end(),
                                  [](const ContextItem& i) { return i.relevance.has_value(); });

    if (query.empty() || items.size() <= 1) {
        for (auto& item : items) {
            if (!item.relevance) item.relevance = 0.5;
        }
    } else if (!all_scored) {
        auto query_vector = embeddings_->generate_embedding(query);
        for (auto& item : items) {
            if (item.relevance) continue;
            try {
                auto v = embeddings_->generate_embedding(item.name + "\n" + item.content);
                item.relevance = cosine_similarity(query_vector, v);
            } catch (const std::exception& e) {
                spdlog::warn("⚠️ Scoring {} failed: {}", item.name, e.what());
                item.relevance = 0.3;
            }
        }
    }

    std::stable_sort(items.begin(), items.end(), [](const ContextItem& a, const ContextItem& b) {
        return a.relevance.value_or(0.0) > b.relevance.value_or(0.0);
    });
    return items;
}

int ContextAssembler::estimate_tokens(const ContextItem& item) const {
    int tokens = config_.item_overhead_tokens;
    if (item.content.empty()) return tokens;

    if (item.line_start && item.line_end) {
        tokens += (*item.line_end - *item.line_start + 1) * config_.tokens_per_code_line;
    } else {
        tokens += static_cast<int>(std::ceil(static_cast<double>(item.content.size()) * config_.tokens_per_char));
    }
    return tokens;
}

ContextItem ContextAssembler::truncate_to_fit(const ContextItem& item, int max_tokens) const {
    if (estimate_tokens(item) <= max_tokens) return item;

    ContextItem cut = item;
    int content_budget = max_tokens - config_.item_overhead_tokens;
    size_t max_chars = static_cast<size_t>(std::floor(content_budget / config_.tokens_per_char));

    if (is_code(item.type)) {
        auto lines = split_lines(item.content);

        if (item.line_start && item.line_end) {
            // The marker occupies a line of its own
            int max_lines = content_budget / config_.tokens_per_code_line;
            size_t keep = static_cast<size_t>(std::max(0, max_lines - 1));
            cut.content = join_lines(lines, keep) + (keep > 0 ? kCodeTruncationMarker : kCodeTruncationMarker + 1);
            cut.line_end = *item.line_start + static_cast<int>(keep);
        } else {
            size_t marker_len = std::char_traits<char>::length(kCodeTruncationMarker);
            size_t budget = max_chars > marker_len ? max_chars - marker_len : 0;
            size_t used = 0, keep = 0;
            for (const auto& line : lines) {
                size_t cost = line.size() + (keep > 0 ? 1 : 0);
                if (used + cost > budget) break;
                used += cost;
                ++keep;
            }
            if (keep == 0) {
                cut.content = utf8_safe_substr(item.content, budget) + kCodeTruncationMarker;
            } else {
                cut.content = join_lines(lines, keep) + kCodeTruncationMarker;
            }
        }
    } else {
        size_t marker_len = std::char_traits<char>::length(kProseTruncationMarker);
        size_t budget = max_chars > marker_len ? max_chars - marker_len : 0;
        cut.content = utf8_safe_substr(item.content, budget) + kProseTruncationMarker;
    }
    cut.size = static_cast<int64_t>(cut.content.size());
    return cut;
}

ContextResult ContextAssembler::fit_to_budget(const std::vector<ContextItem>& ranked, int max_tokens) const {
    ContextResult result;
    int total = 0;

    for (const auto& item : ranked) {
        int cost = estimate_tokens(item);
        if (total + cost <= max_tokens) {
            result.items.push_back(item);
            total += cost;
            continue;
        }

        result.truncated = true;
        if (result.items.empty()) {
            // Too small to hold even the per-item overhead plus a marker line
            int floor_cost = config_.item_overhead_tokens + config_.tokens_per_code_line;
            if (max_tokens >= floor_cost) {
                ContextItem cut = truncate_to_fit(item, max_tokens);
                int cut_cost = estimate_tokens(cut);
                if (cut_cost <= max_tokens) {
                    result.items.push_back(std::move(cut));
                    total = cut_cost;
                }
            }
        }
        break;
    }

    result.token_count = total;
    return result;
}

} // namespace context_engine
