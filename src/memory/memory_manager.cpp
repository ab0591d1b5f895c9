#include "memory/memory_manager.hpp"
#include <algorithm>
#include <cctype>
#include <cmath>
#include <numeric>
#include <unordered_set>
#include <spdlog/spdlog.h>
#include "utils.hpp"
#include "vector_math.hpp"

namespace context_engine {

namespace {

const char* kTruncatedMarker = "[...conversation truncated for brevity...]\n\n";

// Conversations kept in memory at once; older ones reload from the store.
constexpr size_t kMaxCachedConversations = 64;

const char* kCodeExtensions[] = {"ts", "js", "py", "java", "html", "css", "json",
                                 "cpp", "hpp", "h", "c", "go", "rs"};

const std::unordered_set<std::string> kCodeKeywords = {
    "function", "class", "interface", "import", "export", "const", "let", "var", "struct", "def"
};

bool is_word_char(char c) {
    return std::isalnum(static_cast<unsigned char>(c)) || c == '_';
}

bool is_path_char(char c) {
    return is_word_char(c) || c == '/' || c == '.' || c == '-';
}

// Linear scans only; messages may be pasted bundles of any size.
bool has_url(const std::string& s) {
    for (const char* scheme : {"http://", "https://"}) {
        size_t len = std::char_traits<char>::length(scheme);
        for (size_t pos = s.find(scheme); pos != std::string::npos; pos = s.find(scheme, pos + 1)) {
            if (pos + len < s.size() && !std::isspace(static_cast<unsigned char>(s[pos + len]))) return true;
        }
    }
    return false;
}

bool has_file_path(const std::string& s) {
    for (size_t dot = s.find('.', 1); dot != std::string::npos; dot = s.find('.', dot + 1)) {
        if (!is_path_char(s[dot - 1])) continue;
        for (const char* ext : kCodeExtensions) {
            if (s.compare(dot + 1, std::char_traits<char>::length(ext), ext) == 0) return true;
        }
    }
    return false;
}

bool has_code_keyword(const std::string& s) {
    size_t i = 0;
    while (i < s.size()) {
        if (!is_word_char(s[i])) {
            ++i;
            continue;
        }
        size_t start = i;
        while (i < s.size() && is_word_char(s[i])) ++i;
        // Longest keyword is nine characters
        if (i - start <= 9 && kCodeKeywords.count(s.substr(start, i - start))) return true;
    }
    return false;
}

int estimate_tokens(const std::string& text) {
    return static_cast<int>((text.size() + 3) / 4);
}

bool is_blank(const std::string& s) {
    return s.find_first_not_of(" \t\r\n") == std::string::npos;
}

// Keeps system messages plus the non-system messages whose position is in
// `keep`, in their original order.
void retain(Conversation& conversation, const std::unordered_set<size_t>& keep) {
    std::vector<ConversationMessage> retained;
    retained.reserve(conversation.messages.size());
    for (size_t i = 0; i < conversation.messages.size(); ++i) {
        if (conversation.messages[i].role == MessageRole::System || keep.count(i)) {
            retained.push_back(std::move(conversation.messages[i]));
        }
    }
    conversation.messages = std::move(retained);
}

std::vector<size_t> non_system_positions(const Conversation& conversation) {
    std::vector<size_t> positions;
    for (size_t i = 0; i < conversation.messages.size(); ++i) {
        if (conversation.messages[i].role != MessageRole::System) positions.push_back(i);
    }
    return positions;
}

} // namespace

MemoryManager::MemoryManager(MemoryOptions options,
                             std::shared_ptr<ContextStore> store,
                             std::shared_ptr<EmbeddingService> embeddings,
                             std::string default_model)
    : options_(std::move(options)),
      store_(std::move(store)),
      embeddings_(std::move(embeddings)),
      default_model_(std::move(default_model)) {}

double MemoryManager::calculate_importance(const std::string& content) {
    double score = 0.5;
    if (content.find("```") != std::string::npos) score += 0.2;

    if (has_url(content) || has_file_path(content) || has_code_keyword(content)) {
        score += 0.1;
    }

    if (content.size() > 500) score += 0.1;
    else if (content.size() < 50) score -= 0.1;

    if (content.find('?') != std::string::npos) score += 0.1;

    return std::clamp(score, 0.0, 1.0);
}

std::string MemoryManager::generate_title(const std::string& content) {
    std::string first_line = content.substr(0, content.find('\n'));
    first_line = collapse_whitespace(first_line);
    if (first_line.size() <= 50) return first_line;
    return utf8_safe_substr(first_line, 47) + "...";
}

std::optional<Conversation> MemoryManager::load_locked(const std::string& conversation_id) {
    auto it = conversations_.find(conversation_id);
    if (it != conversations_.end()) return it->second;

    auto loaded = store_->load_conversation(conversation_id);
    if (!loaded) return std::nullopt;

    // Importance lives in memory only
    for (auto& msg : loaded->messages) {
        if (!is_blank(msg.content)) msg.importance = calculate_importance(msg.content);
    }
    cache_locked(*loaded);
    return loaded;
}

void MemoryManager::cache_locked(Conversation conversation) {
    std::string id = conversation.id;
    conversations_[id] = std::move(conversation);
    if (conversations_.size() <= kMaxCachedConversations) return;

    // Drop the least recently updated conversation other than this one
    auto victim = conversations_.end();
    for (auto it = conversations_.begin(); it != conversations_.end(); ++it) {
        if (it->first == id) continue;
        if (victim == conversations_.end() || it->second.updated_at < victim->second.updated_at) victim = it;
    }
    if (victim != conversations_.end()) conversations_.erase(victim);
}

size_t MemoryManager::cached_conversation_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return conversations_.size();
}

std::string MemoryManager::add_message(const std::string& conversation_id, MessageRole role, const std::string& content) {
    std::lock_guard<std::mutex> lock(mutex_);
    int64_t now = now_ms();

    auto existing = load_locked(conversation_id);
    Conversation conversation;
    if (existing) {
        conversation = std::move(*existing);
    } else {
        conversation.id = conversation_id;
        conversation.title = generate_title(content);
        conversation.model_id = default_model_;
        conversation.created_at = now;
        spdlog::info("💬 New conversation {} \"{}\"", conversation_id, conversation.title);
    }

    ConversationMessage message;
    message.id = generate_uuid();
    message.role = role;
    message.content = content;
    // Keep timestamps non-decreasing so load order matches append order
    message.timestamp = conversation.messages.empty() ? now : std::max(now, conversation.messages.back().timestamp);
    if (!is_blank(content)) message.importance = calculate_importance(content);

    conversation.messages.push_back(message);
    conversation.updated_at = now;

    if (should_prune(conversation)) {
        size_t before = conversation.messages.size();
        prune(conversation);
        spdlog::debug("Pruned conversation {} from {} to {} messages ({})",
                      conversation_id, before, conversation.messages.size(),
                      to_string(options_.pruning_strategy));
    }

    if (!store_->save_conversation(conversation)) {
        spdlog::warn("⚠️ Conversation {} kept in memory only; persisting failed", conversation_id);
    }
    cache_locked(std::move(conversation));
    return message.id;
}

std::optional<Conversation> MemoryManager::get_conversation(const std::string& conversation_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    return load_locked(conversation_id);
}

std::vector<Conversation> MemoryManager::get_recent_conversations(size_t limit) {
    auto all = store_->load_conversations();
    if (all.size() > limit) all.resize(limit);

    std::lock_guard<std::mutex> lock(mutex_);
    for (auto& conversation : all) {
        auto it = conversations_.find(conversation.id);
        if (it != conversations_.end()) {
            conversation = it->second;
            continue;
        }
        for (auto& msg : conversation.messages) {
            if (!is_blank(msg.content)) msg.importance = calculate_importance(msg.content);
        }
    }
    return all;
}

bool MemoryManager::update_message_importance(const std::string& conversation_id,
                                              const std::string& message_id,
                                              double importance) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!load_locked(conversation_id)) return false;

    auto& conversation = conversations_[conversation_id];
    for (auto& msg : conversation.messages) {
        if (msg.id == message_id) {
            msg.importance = std::clamp(importance, 0.0, 1.0);
            return true;
        }
    }
    return false;
}

bool MemoryManager::set_model(const std::string& conversation_id, const std::string& model_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!load_locked(conversation_id)) return false;

    auto& conversation = conversations_[conversation_id];
    conversation.model_id = model_id;
    conversation.updated_at = now_ms();
    return store_->save_conversation(conversation);
}

std::string MemoryManager::get_conversation_context(const std::string& conversation_id,
                                                    const std::string& query,
                                                    int max_tokens) {
    std::optional<Conversation> conversation;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        conversation = load_locked(conversation_id);
    }
    if (!conversation) return "";

    auto messages = conversation->messages;
    if (!is_blank(query)) {
        auto query_vector = embeddings_->generate_embedding(query);
        for (auto& msg : messages) {
            try {
                msg.relevance = cosine_similarity(query_vector, embeddings_->generate_embedding(msg.content));
            } catch (const std::invalid_argument& e) {
                spdlog::warn("⚠️ Relevance for message {} unavailable: {}", msg.id, e.what());
                msg.relevance = 0.0;
            }
        }
        std::stable_sort(messages.begin(), messages.end(),
                         [](const ConversationMessage& a, const ConversationMessage& b) {
                             return a.relevance.value_or(0.0) > b.relevance.value_or(0.0);
                         });
    }

    std::string context;
    int tokens = 0;
    for (const auto& msg : messages) {
        std::string block = to_string(msg.role) + ": " + msg.content + "\n\n";
        int cost = estimate_tokens(block);
        if (tokens + cost > max_tokens) {
            context += kTruncatedMarker;
            break;
        }
        context += block;
        tokens += cost;
    }
    return context;
}

void MemoryManager::set_options(const MemoryOptions& options) {
    std::lock_guard<std::mutex> lock(mutex_);
    options_ = options;
    spdlog::info("🧠 Memory options: length {}, {} tokens/item, threshold {:.2f}, strategy {}",
                 options_.conversation_memory_length, options_.max_tokens_per_item,
                 options_.importance_threshold, to_string(options_.pruning_strategy));
}

MemoryOptions MemoryManager::options() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return options_;
}

bool MemoryManager::should_prune(const Conversation& conversation) const {
    int non_system = 0;
    int tokens = 0;
    for (const auto& msg : conversation.messages) {
        if (msg.role != MessageRole::System) ++non_system;
        tokens += estimate_tokens(msg.content);
    }
    return non_system > options_.keep_count() || tokens > options_.token_budget();
}

void MemoryManager::prune(Conversation& conversation) const {
    size_t keep = static_cast<size_t>(std::max(1, options_.keep_count()));
    switch (options_.pruning_strategy) {
        case PruningStrategy::Lru: prune_lru(conversation, keep); break;
        case PruningStrategy::Importance: prune_importance(conversation, keep); break;
        case PruningStrategy::Hybrid: prune_hybrid(conversation, keep); break;
    }
}

void MemoryManager::prune_lru(Conversation& conversation, size_t keep) const {
    auto positions = non_system_positions(conversation);
    size_t skip = positions.size() > keep ? positions.size() - keep : 0;
    retain(conversation, std::unordered_set<size_t>(positions.begin() + skip, positions.end()));
}

void MemoryManager::prune_importance(Conversation& conversation, size_t keep) const {
    auto positions = non_system_positions(conversation);
    auto importance = [&](size_t pos) { return conversation.messages[pos].importance.value_or(0.0); };

    std::stable_sort(positions.begin(), positions.end(),
                     [&](size_t a, size_t b) { return importance(a) > importance(b); });

    std::unordered_set<size_t> kept;
    for (size_t pos : positions) {
        if (importance(pos) >= options_.importance_threshold) kept.insert(pos);
    }
    size_t remaining = keep > kept.size() ? keep - kept.size() : 0;
    for (size_t pos : positions) {
        if (remaining == 0) break;
        if (importance(pos) < options_.importance_threshold) {
            kept.insert(pos);
            --remaining;
        }
    }
    retain(conversation, kept);
}

void MemoryManager::prune_hybrid(Conversation& conversation, size_t keep) const {
    auto positions = non_system_positions(conversation);
    if (positions.empty()) return;

    size_t half_keep = (keep + 1) / 2;
    auto importance = [&](size_t pos) { return conversation.messages[pos].importance.value_or(0.5); };

    std::vector<size_t> candidates;
    std::unordered_set<size_t> seen;

    // Most recent half
    size_t recent_from = positions.size() > half_keep ? positions.size() - half_keep : 0;
    for (size_t i = recent_from; i < positions.size(); ++i) {
        if (seen.insert(positions[i]).second) candidates.push_back(positions[i]);
    }

    // Most important half; ties favour the later message
    std::vector<size_t> by_importance(positions.rbegin(), positions.rend());
    std::stable_sort(by_importance.begin(), by_importance.end(),
                     [&](size_t a, size_t b) { return importance(a) > importance(b); });
    for (size_t i = 0; i < by_importance.size() && i < half_keep; ++i) {
        if (seen.insert(by_importance[i]).second) candidates.push_back(by_importance[i]);
    }

    if (candidates.size() > keep) {
        // Recency is the message's rank among non-system messages, scaled to [0,1]
        std::unordered_map<size_t, double> recency;
        double span = positions.size() > 1 ? static_cast<double>(positions.size() - 1) : 1.0;
        for (size_t i = 0; i < positions.size(); ++i) {
            recency[positions[i]] = positions.size() > 1 ? static_cast<double>(i) / span : 1.0;
        }

        for (size_t pos : candidates) {
            conversation.messages[pos].combined_score = (recency[pos] + importance(pos)) / 2.0;
        }
        std::sort(candidates.begin(), candidates.end(), [&](size_t a, size_t b) {
            double sa = *conversation.messages[a].combined_score;
            double sb = *conversation.messages[b].combined_score;
            if (sa != sb) return sa > sb;
            return a > b;
        });
        candidates.resize(keep);
    }

    retain(conversation, std::unordered_set<size_t>(candidates.begin(), candidates.end()));
}

} // namespace context_engine
