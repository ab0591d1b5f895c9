#include "storage/context_store.hpp"
#include <sqlite3.h>
#include <algorithm>
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>
#include "utils.hpp"

namespace context_engine {

namespace fs = std::filesystem;
using json = nlohmann::json;

namespace {

struct StmtGuard {
    sqlite3_stmt* stmt = nullptr;
    ~StmtGuard() { if (stmt) sqlite3_finalize(stmt); }
};

const char* kSchema = R"SQL(
CREATE TABLE IF NOT EXISTS conversations (
    id TEXT PRIMARY KEY,
    title TEXT NOT NULL,
    created_at INTEGER NOT NULL,
    updated_at INTEGER NOT NULL,
    model_id TEXT,
    system_prompt TEXT,
    temperature REAL
);
CREATE TABLE IF NOT EXISTS messages (
    id TEXT PRIMARY KEY,
    conversation_id TEXT NOT NULL REFERENCES conversations(id) ON DELETE CASCADE,
    role TEXT NOT NULL,
    content TEXT NOT NULL,
    timestamp INTEGER NOT NULL
);
CREATE TABLE IF NOT EXISTS context_items (
    id TEXT PRIMARY KEY,
    type TEXT NOT NULL,
    name TEXT NOT NULL,
    path TEXT,
    language TEXT,
    content TEXT,
    line_start INTEGER,
    line_end INTEGER,
    size INTEGER,
    last_accessed INTEGER,
    importance_score REAL,
    vector_id TEXT,
    metadata TEXT
);
CREATE TABLE IF NOT EXISTS code_entities (
    id TEXT PRIMARY KEY,
    name TEXT NOT NULL,
    type TEXT NOT NULL,
    file_path TEXT NOT NULL,
    code TEXT,
    first_seen INTEGER,
    last_seen INTEGER,
    frequency INTEGER DEFAULT 1,
    vector_id TEXT
);
CREATE TABLE IF NOT EXISTS user_patterns (
    id TEXT PRIMARY KEY,
    type TEXT NOT NULL,
    pattern TEXT NOT NULL,
    examples TEXT,
    frequency INTEGER DEFAULT 1,
    first_seen INTEGER,
    last_seen INTEGER
);
CREATE INDEX IF NOT EXISTS idx_messages_conversation ON messages(conversation_id);
CREATE INDEX IF NOT EXISTS idx_entities_name ON code_entities(name);
CREATE INDEX IF NOT EXISTS idx_entities_file ON code_entities(file_path);
CREATE INDEX IF NOT EXISTS idx_entities_vector ON code_entities(vector_id);
CREATE INDEX IF NOT EXISTS idx_items_path ON context_items(path);
CREATE INDEX IF NOT EXISTS idx_items_vector ON context_items(vector_id);
)SQL";

const char* kItemColumns =
    "id, type, name, path, language, content, line_start, line_end, size, "
    "last_accessed, importance_score, vector_id, metadata";

const char* kEntityColumns =
    "id, name, type, file_path, code, first_seen, last_seen, frequency, vector_id";

std::string column_text(sqlite3_stmt* stmt, int col) {
    auto* v = sqlite3_column_text(stmt, col);
    return v ? reinterpret_cast<const char*>(v) : "";
}

std::optional<std::string> column_opt_text(sqlite3_stmt* stmt, int col) {
    if (sqlite3_column_type(stmt, col) == SQLITE_NULL) return std::nullopt;
    return column_text(stmt, col);
}

std::optional<int> column_opt_int(sqlite3_stmt* stmt, int col) {
    if (sqlite3_column_type(stmt, col) == SQLITE_NULL) return std::nullopt;
    return sqlite3_column_int(stmt, col);
}

std::optional<int64_t> column_vector_id(sqlite3_stmt* stmt, int col) {
    auto text = column_opt_text(stmt, col);
    if (!text || text->empty()) return std::nullopt;
    try {
        return std::stoll(*text);
    } catch (const std::exception&) {
        return std::nullopt;
    }
}

void bind_text(sqlite3_stmt* stmt, int col, const std::string& value) {
    sqlite3_bind_text(stmt, col, value.c_str(), -1, SQLITE_TRANSIENT);
}

void bind_opt_text(sqlite3_stmt* stmt, int col, const std::optional<std::string>& value) {
    if (value) bind_text(stmt, col, *value);
    else sqlite3_bind_null(stmt, col);
}

void bind_opt_int(sqlite3_stmt* stmt, int col, const std::optional<int>& value) {
    if (value) sqlite3_bind_int(stmt, col, *value);
    else sqlite3_bind_null(stmt, col);
}

void bind_vector_id(sqlite3_stmt* stmt, int col, const std::optional<int64_t>& value) {
    if (value) bind_text(stmt, col, std::to_string(*value));
    else sqlite3_bind_null(stmt, col);
}

ContextItem read_item(sqlite3_stmt* stmt) {
    ContextItem item;
    item.id = column_text(stmt, 0);
    item.type = parse_item_type(column_text(stmt, 1));
    item.name = column_text(stmt, 2);
    item.path = column_opt_text(stmt, 3);
    item.language = column_text(stmt, 4);
    item.content = column_text(stmt, 5);
    item.line_start = column_opt_int(stmt, 6);
    item.line_end = column_opt_int(stmt, 7);
    item.size = sqlite3_column_int64(stmt, 8);
    item.last_accessed = sqlite3_column_int64(stmt, 9);
    item.importance_score = sqlite3_column_double(stmt, 10);
    item.vector_id = column_vector_id(stmt, 11);
    if (auto meta = column_opt_text(stmt, 12); meta && !meta->empty()) {
        item.metadata = metadata_from_json(json::parse(*meta, nullptr, false));
    }
    return item;
}

CodeEntity read_entity(sqlite3_stmt* stmt) {
    CodeEntity e;
    e.id = column_text(stmt, 0);
    e.name = column_text(stmt, 1);
    e.type = parse_entity_kind(column_text(stmt, 2));
    e.file_path = column_text(stmt, 3);
    e.code = column_text(stmt, 4);
    e.first_seen = sqlite3_column_int64(stmt, 5);
    e.last_seen = sqlite3_column_int64(stmt, 6);
    e.frequency = sqlite3_column_int(stmt, 7);
    e.vector_id = column_vector_id(stmt, 8);
    return e;
}

} // namespace

ContextStore::ContextStore(fs::path directory, int dimension, int busy_timeout_ms)
    : directory_(std::move(directory)),
      busy_timeout_ms_(busy_timeout_ms),
      vectors_(std::make_unique<FaissVectorStore>(dimension)) {}

ContextStore::~ContextStore() {
    close();
}

Status ContextStore::exec(const char* sql) {
    char* err = nullptr;
    if (sqlite3_exec(db_, sql, nullptr, nullptr, &err) != SQLITE_OK) {
        std::string msg = err ? err : "unknown error";
        sqlite3_free(err);
        return make_error(ErrorCode::StorageUnavailable, msg);
    }
    return Status::success();
}

Status ContextStore::create_schema() {
    if (auto s = exec("PRAGMA journal_mode=WAL;"); !s) return s;
    if (auto s = exec("PRAGMA foreign_keys=ON;"); !s) return s;
    return exec(kSchema);
}

Status ContextStore::open() {
    std::lock_guard<std::mutex> lock(db_mutex_);
    if (db_) return Status::success();

    try {
        fs::create_directories(directory_);
    } catch (const fs::filesystem_error& e) {
        spdlog::error("❌ Cannot create storage directory {}: {}", directory_.string(), e.what());
        return make_error(ErrorCode::StorageUnavailable, e.what());
    }

    fs::path db_path = directory_ / kDatabaseFile;
    if (sqlite3_open_v2(db_path.string().c_str(), &db_,
                        SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE | SQLITE_OPEN_FULLMUTEX,
                        nullptr) != SQLITE_OK) {
        std::string err = db_ ? sqlite3_errmsg(db_) : "unknown error";
        if (db_) {
            sqlite3_close(db_);
            db_ = nullptr;
        }
        spdlog::error("❌ Failed to open {}: {}", db_path.string(), err);
        return make_error(ErrorCode::StorageUnavailable, err);
    }
    sqlite3_busy_timeout(db_, busy_timeout_ms_);

    if (auto s = create_schema(); !s) {
        spdlog::error("❌ Schema creation failed: {}", s.error().message);
        sqlite3_close(db_);
        db_ = nullptr;
        return s;
    }

    auto loaded = vectors_->load(directory_);
    if (!loaded) {
        spdlog::warn("⚠️ Vector index unreadable ({}); starting fresh", loaded.error().message);
    }
    if (!loaded || !loaded.value()) {
        // Pin a fresh index (and its sidecar) to the current dimension. Rows
        // must not keep pointing at vectors the new index does not hold.
        clear_vector_links();
        vectors_ = std::make_unique<FaissVectorStore>(vectors_->dimension());
        if (auto s = vectors_->save(directory_); !s) {
            spdlog::warn("⚠️ Could not write vector index: {}", s.error().message);
        }
    }

    spdlog::info("🗄️ Context store open at {} ({} vectors)", directory_.string(), vectors_->size());
    return Status::success();
}

void ContextStore::close() {
    std::lock_guard<std::mutex> lock(db_mutex_);
    if (!db_) return;
    persist_vectors();
    sqlite3_close(db_);
    db_ = nullptr;
    spdlog::info("🗄️ Context store closed");
}

bool ContextStore::is_ready() const {
    std::lock_guard<std::mutex> lock(db_mutex_);
    return db_ != nullptr;
}

void ContextStore::clear_vector_links() {
    for (const char* sql : {"UPDATE context_items SET vector_id = NULL WHERE vector_id IS NOT NULL;",
                            "UPDATE code_entities SET vector_id = NULL WHERE vector_id IS NOT NULL;"}) {
        if (auto s = exec(sql); !s) {
            spdlog::warn("⚠️ Could not clear stale vector links: {}", s.error().message);
            continue;
        }
        if (int n = sqlite3_changes(db_); n > 0) {
            spdlog::info("🔄 Cleared {} stale vector links", n);
        }
    }
}

void ContextStore::persist_vectors() {
    if (auto s = vectors_->save(directory_); !s) {
        spdlog::error("❌ Failed to persist vector index: {}", s.error().message);
    }
}

// --- context items ---

bool ContextStore::save_context_item(const ContextItem& item) {
    std::lock_guard<std::mutex> lock(db_mutex_);
    if (!db_) return false;

    static const char* sql =
        "INSERT INTO context_items (id, type, name, path, language, content, line_start, line_end, "
        "size, last_accessed, importance_score, vector_id, metadata) "
        "VALUES (?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?) "
        "ON CONFLICT(id) DO UPDATE SET type = excluded.type, name = excluded.name, path = excluded.path, "
        "language = excluded.language, content = excluded.content, line_start = excluded.line_start, "
        "line_end = excluded.line_end, size = excluded.size, last_accessed = excluded.last_accessed, "
        "importance_score = excluded.importance_score, "
        "vector_id = COALESCE(excluded.vector_id, context_items.vector_id), "
        "metadata = COALESCE(excluded.metadata, context_items.metadata);";

    StmtGuard g;
    if (sqlite3_prepare_v2(db_, sql, -1, &g.stmt, nullptr) != SQLITE_OK) {
        spdlog::error("save_context_item prepare failed: {}", sqlite3_errmsg(db_));
        return false;
    }
    bind_text(g.stmt, 1, item.id);
    bind_text(g.stmt, 2, to_string(item.type));
    bind_text(g.stmt, 3, item.name);
    bind_opt_text(g.stmt, 4, item.path);
    bind_text(g.stmt, 5, item.language);
    bind_text(g.stmt, 6, item.content);
    bind_opt_int(g.stmt, 7, item.line_start);
    bind_opt_int(g.stmt, 8, item.line_end);
    sqlite3_bind_int64(g.stmt, 9, item.size);
    sqlite3_bind_int64(g.stmt, 10, now_ms());
    sqlite3_bind_double(g.stmt, 11, item.importance_score);
    bind_vector_id(g.stmt, 12, item.vector_id);
    if (item.metadata) bind_text(g.stmt, 13, metadata_to_json(*item.metadata).dump());
    else sqlite3_bind_null(g.stmt, 13);

    if (sqlite3_step(g.stmt) != SQLITE_DONE) {
        spdlog::error("save_context_item failed for {}: {}", item.id, sqlite3_errmsg(db_));
        return false;
    }
    return true;
}

std::optional<ContextItem> ContextStore::get_context_item(const std::string& id) {
    std::lock_guard<std::mutex> lock(db_mutex_);
    if (!db_) return std::nullopt;

    std::string sql = std::string("SELECT ") + kItemColumns + " FROM context_items WHERE id = ?;";
    StmtGuard g;
    if (sqlite3_prepare_v2(db_, sql.c_str(), -1, &g.stmt, nullptr) != SQLITE_OK) return std::nullopt;
    bind_text(g.stmt, 1, id);
    if (sqlite3_step(g.stmt) != SQLITE_ROW) return std::nullopt;
    return read_item(g.stmt);
}

std::vector<ContextItem> ContextStore::find_context_items(const std::string& path_pattern, int limit) {
    std::lock_guard<std::mutex> lock(db_mutex_);
    if (!db_) return {};

    std::string sql = std::string("SELECT ") + kItemColumns +
        " FROM context_items WHERE path LIKE ? ORDER BY last_accessed DESC LIMIT ?;";
    StmtGuard g;
    if (sqlite3_prepare_v2(db_, sql.c_str(), -1, &g.stmt, nullptr) != SQLITE_OK) {
        spdlog::error("find_context_items prepare failed: {}", sqlite3_errmsg(db_));
        return {};
    }
    bind_text(g.stmt, 1, "%" + path_pattern + "%");
    sqlite3_bind_int(g.stmt, 2, limit);

    std::vector<ContextItem> results;
    while (sqlite3_step(g.stmt) == SQLITE_ROW) {
        results.push_back(read_item(g.stmt));
    }
    return results;
}

std::vector<std::string> ContextStore::indexed_paths() {
    std::lock_guard<std::mutex> lock(db_mutex_);
    if (!db_) return {};

    StmtGuard g;
    const char* sql = "SELECT path FROM context_items WHERE type = 'file' AND path IS NOT NULL AND vector_id IS NOT NULL;";
    if (sqlite3_prepare_v2(db_, sql, -1, &g.stmt, nullptr) != SQLITE_OK) return {};

    std::vector<std::string> paths;
    while (sqlite3_step(g.stmt) == SQLITE_ROW) {
        paths.push_back(column_text(g.stmt, 0));
    }
    return paths;
}

int ContextStore::count_context_items() {
    std::lock_guard<std::mutex> lock(db_mutex_);
    if (!db_) return 0;
    StmtGuard g;
    if (sqlite3_prepare_v2(db_, "SELECT COUNT(*) FROM context_items;", -1, &g.stmt, nullptr) != SQLITE_OK) return 0;
    return sqlite3_step(g.stmt) == SQLITE_ROW ? sqlite3_column_int(g.stmt, 0) : 0;
}

// --- code entities ---

bool ContextStore::save_code_entity(const CodeEntity& entity) {
    std::lock_guard<std::mutex> lock(db_mutex_);
    if (!db_) return false;

    // first_seen/last_seen carry the line span on creation; a re-sighting
    // stamps last_seen with the current time and bumps frequency.
    static const char* sql =
        "INSERT INTO code_entities (id, name, type, file_path, code, first_seen, last_seen, frequency, vector_id) "
        "VALUES (?, ?, ?, ?, ?, ?, ?, 1, ?) "
        "ON CONFLICT(id) DO UPDATE SET name = excluded.name, type = excluded.type, "
        "file_path = excluded.file_path, code = excluded.code, last_seen = ?, "
        "frequency = code_entities.frequency + 1, "
        "vector_id = COALESCE(excluded.vector_id, code_entities.vector_id);";

    StmtGuard g;
    if (sqlite3_prepare_v2(db_, sql, -1, &g.stmt, nullptr) != SQLITE_OK) {
        spdlog::error("save_code_entity prepare failed: {}", sqlite3_errmsg(db_));
        return false;
    }
    bind_text(g.stmt, 1, entity.id);
    bind_text(g.stmt, 2, entity.name);
    bind_text(g.stmt, 3, to_string(entity.type));
    bind_text(g.stmt, 4, entity.file_path);
    bind_text(g.stmt, 5, entity.code);
    sqlite3_bind_int64(g.stmt, 6, entity.first_seen);
    sqlite3_bind_int64(g.stmt, 7, entity.last_seen);
    bind_vector_id(g.stmt, 8, entity.vector_id);
    sqlite3_bind_int64(g.stmt, 9, now_ms());

    if (sqlite3_step(g.stmt) != SQLITE_DONE) {
        spdlog::error("save_code_entity failed for {}: {}", entity.id, sqlite3_errmsg(db_));
        return false;
    }
    return true;
}

std::optional<CodeEntity> ContextStore::get_code_entity(const std::string& id) {
    std::lock_guard<std::mutex> lock(db_mutex_);
    if (!db_) return std::nullopt;

    std::string sql = std::string("SELECT ") + kEntityColumns + " FROM code_entities WHERE id = ?;";
    StmtGuard g;
    if (sqlite3_prepare_v2(db_, sql.c_str(), -1, &g.stmt, nullptr) != SQLITE_OK) return std::nullopt;
    bind_text(g.stmt, 1, id);
    if (sqlite3_step(g.stmt) != SQLITE_ROW) return std::nullopt;
    return read_entity(g.stmt);
}

std::vector<CodeEntity> ContextStore::find_code_entities(const std::string& name_pattern, int limit) {
    std::lock_guard<std::mutex> lock(db_mutex_);
    if (!db_) return {};

    std::string sql = std::string("SELECT ") + kEntityColumns +
        " FROM code_entities WHERE name LIKE ? ORDER BY frequency DESC, last_seen DESC LIMIT ?;";
    StmtGuard g;
    if (sqlite3_prepare_v2(db_, sql.c_str(), -1, &g.stmt, nullptr) != SQLITE_OK) {
        spdlog::error("find_code_entities prepare failed: {}", sqlite3_errmsg(db_));
        return {};
    }
    bind_text(g.stmt, 1, "%" + name_pattern + "%");
    sqlite3_bind_int(g.stmt, 2, limit);

    std::vector<CodeEntity> results;
    while (sqlite3_step(g.stmt) == SQLITE_ROW) {
        results.push_back(read_entity(g.stmt));
    }
    return results;
}

std::vector<CodeEntity> ContextStore::find_entities_for_file(const std::string& file_path) {
    std::lock_guard<std::mutex> lock(db_mutex_);
    if (!db_) return {};

    std::string sql = std::string("SELECT ") + kEntityColumns +
        " FROM code_entities WHERE file_path = ? ORDER BY name;";
    StmtGuard g;
    if (sqlite3_prepare_v2(db_, sql.c_str(), -1, &g.stmt, nullptr) != SQLITE_OK) return {};
    bind_text(g.stmt, 1, file_path);

    std::vector<CodeEntity> results;
    while (sqlite3_step(g.stmt) == SQLITE_ROW) {
        results.push_back(read_entity(g.stmt));
    }
    return results;
}

int ContextStore::count_code_entities() {
    std::lock_guard<std::mutex> lock(db_mutex_);
    if (!db_) return 0;
    StmtGuard g;
    if (sqlite3_prepare_v2(db_, "SELECT COUNT(*) FROM code_entities;", -1, &g.stmt, nullptr) != SQLITE_OK) return 0;
    return sqlite3_step(g.stmt) == SQLITE_ROW ? sqlite3_column_int(g.stmt, 0) : 0;
}

// --- conversations ---

bool ContextStore::save_conversation(const Conversation& conversation) {
    std::lock_guard<std::mutex> lock(db_mutex_);
    if (!db_) return false;

    if (!exec("BEGIN IMMEDIATE;")) {
        spdlog::error("save_conversation could not start transaction: {}", sqlite3_errmsg(db_));
        return false;
    }

    auto rollback = [this](const char* what) {
        spdlog::error("save_conversation {} failed: {}", what, sqlite3_errmsg(db_));
        if (auto s = exec("ROLLBACK;"); !s) {
            spdlog::error("Rollback failed: {}", s.error().message);
        }
        return false;
    };

    {
        static const char* sql =
            "INSERT INTO conversations (id, title, created_at, updated_at, model_id, system_prompt, temperature) "
            "VALUES (?, ?, ?, ?, ?, ?, ?) "
            "ON CONFLICT(id) DO UPDATE SET title = excluded.title, updated_at = excluded.updated_at, "
            "model_id = excluded.model_id, system_prompt = excluded.system_prompt, "
            "temperature = excluded.temperature;";
        StmtGuard g;
        if (sqlite3_prepare_v2(db_, sql, -1, &g.stmt, nullptr) != SQLITE_OK) return rollback("prepare");
        bind_text(g.stmt, 1, conversation.id);
        bind_text(g.stmt, 2, conversation.title);
        sqlite3_bind_int64(g.stmt, 3, conversation.created_at);
        sqlite3_bind_int64(g.stmt, 4, conversation.updated_at);
        bind_text(g.stmt, 5, conversation.model_id);
        bind_opt_text(g.stmt, 6, conversation.system_prompt);
        sqlite3_bind_double(g.stmt, 7, conversation.temperature);
        if (sqlite3_step(g.stmt) != SQLITE_DONE) return rollback("upsert");
    }

    {
        StmtGuard g;
        if (sqlite3_prepare_v2(db_, "DELETE FROM messages WHERE conversation_id = ?;", -1, &g.stmt, nullptr) != SQLITE_OK) {
            return rollback("prepare delete");
        }
        bind_text(g.stmt, 1, conversation.id);
        if (sqlite3_step(g.stmt) != SQLITE_DONE) return rollback("delete messages");
    }

    {
        StmtGuard g;
        const char* sql = "INSERT INTO messages (id, conversation_id, role, content, timestamp) VALUES (?, ?, ?, ?, ?);";
        if (sqlite3_prepare_v2(db_, sql, -1, &g.stmt, nullptr) != SQLITE_OK) return rollback("prepare insert");
        for (const auto& m : conversation.messages) {
            sqlite3_reset(g.stmt);
            sqlite3_clear_bindings(g.stmt);
            bind_text(g.stmt, 1, m.id);
            bind_text(g.stmt, 2, conversation.id);
            bind_text(g.stmt, 3, to_string(m.role));
            bind_text(g.stmt, 4, m.content);
            sqlite3_bind_int64(g.stmt, 5, m.timestamp);
            if (sqlite3_step(g.stmt) != SQLITE_DONE) return rollback("insert message");
        }
    }

    if (auto s = exec("COMMIT;"); !s) return rollback("commit");
    return true;
}

std::vector<ConversationMessage> ContextStore::load_messages(const std::string& conversation_id) {
    StmtGuard g;
    const char* sql =
        "SELECT id, role, content, timestamp FROM messages WHERE conversation_id = ? "
        "ORDER BY timestamp ASC, rowid ASC;";
    if (sqlite3_prepare_v2(db_, sql, -1, &g.stmt, nullptr) != SQLITE_OK) return {};
    bind_text(g.stmt, 1, conversation_id);

    std::vector<ConversationMessage> messages;
    while (sqlite3_step(g.stmt) == SQLITE_ROW) {
        ConversationMessage m;
        m.id = column_text(g.stmt, 0);
        m.role = parse_role(column_text(g.stmt, 1));
        m.content = column_text(g.stmt, 2);
        m.timestamp = sqlite3_column_int64(g.stmt, 3);
        messages.push_back(std::move(m));
    }
    return messages;
}

std::vector<Conversation> ContextStore::load_conversations() {
    std::lock_guard<std::mutex> lock(db_mutex_);
    if (!db_) return {};

    StmtGuard g;
    const char* sql =
        "SELECT id, title, created_at, updated_at, model_id, system_prompt, temperature "
        "FROM conversations ORDER BY updated_at DESC;";
    if (sqlite3_prepare_v2(db_, sql, -1, &g.stmt, nullptr) != SQLITE_OK) {
        spdlog::error("load_conversations prepare failed: {}", sqlite3_errmsg(db_));
        return {};
    }

    std::vector<Conversation> conversations;
    while (sqlite3_step(g.stmt) == SQLITE_ROW) {
        Conversation c;
        c.id = column_text(g.stmt, 0);
        c.title = column_text(g.stmt, 1);
        c.created_at = sqlite3_column_int64(g.stmt, 2);
        c.updated_at = sqlite3_column_int64(g.stmt, 3);
        c.model_id = column_text(g.stmt, 4);
        c.system_prompt = column_opt_text(g.stmt, 5);
        c.temperature = sqlite3_column_double(g.stmt, 6);
        conversations.push_back(std::move(c));
    }
    for (auto& c : conversations) {
        c.messages = load_messages(c.id);
    }
    return conversations;
}

std::optional<Conversation> ContextStore::load_conversation(const std::string& id) {
    std::lock_guard<std::mutex> lock(db_mutex_);
    if (!db_) return std::nullopt;

    StmtGuard g;
    const char* sql =
        "SELECT id, title, created_at, updated_at, model_id, system_prompt, temperature "
        "FROM conversations WHERE id = ?;";
    if (sqlite3_prepare_v2(db_, sql, -1, &g.stmt, nullptr) != SQLITE_OK) return std::nullopt;
    bind_text(g.stmt, 1, id);
    if (sqlite3_step(g.stmt) != SQLITE_ROW) return std::nullopt;

    Conversation c;
    c.id = column_text(g.stmt, 0);
    c.title = column_text(g.stmt, 1);
    c.created_at = sqlite3_column_int64(g.stmt, 2);
    c.updated_at = sqlite3_column_int64(g.stmt, 3);
    c.model_id = column_text(g.stmt, 4);
    c.system_prompt = column_opt_text(g.stmt, 5);
    c.temperature = sqlite3_column_double(g.stmt, 6);
    c.messages = load_messages(c.id);
    return c;
}

bool ContextStore::delete_conversation(const std::string& id) {
    std::lock_guard<std::mutex> lock(db_mutex_);
    if (!db_) return false;

    StmtGuard g;
    if (sqlite3_prepare_v2(db_, "DELETE FROM conversations WHERE id = ?;", -1, &g.stmt, nullptr) != SQLITE_OK) {
        return false;
    }
    bind_text(g.stmt, 1, id);
    if (sqlite3_step(g.stmt) != SQLITE_DONE) {
        spdlog::error("delete_conversation failed for {}: {}", id, sqlite3_errmsg(db_));
        return false;
    }
    return true;
}

// --- usage patterns ---

bool ContextStore::save_user_pattern(const UserPattern& pattern) {
    std::lock_guard<std::mutex> lock(db_mutex_);
    if (!db_) return false;

    std::vector<std::string> examples;
    {
        StmtGuard g;
        if (sqlite3_prepare_v2(db_, "SELECT examples FROM user_patterns WHERE id = ?;", -1, &g.stmt, nullptr) == SQLITE_OK) {
            bind_text(g.stmt, 1, pattern.id);
            if (sqlite3_step(g.stmt) == SQLITE_ROW) {
                auto j = json::parse(column_text(g.stmt, 0), nullptr, false);
                if (j.is_array()) {
                    for (const auto& e : j) {
                        if (e.is_string()) examples.push_back(e.get<std::string>());
                    }
                }
            }
        }
    }
    for (const auto& e : pattern.examples) {
        if (std::find(examples.begin(), examples.end(), e) == examples.end()) {
            examples.push_back(e);
        }
    }

    static const char* sql =
        "INSERT INTO user_patterns (id, type, pattern, examples, frequency, first_seen, last_seen) "
        "VALUES (?, ?, ?, ?, 1, ?, ?) "
        "ON CONFLICT(id) DO UPDATE SET examples = excluded.examples, "
        "frequency = user_patterns.frequency + 1, last_seen = excluded.last_seen;";
    StmtGuard g;
    if (sqlite3_prepare_v2(db_, sql, -1, &g.stmt, nullptr) != SQLITE_OK) {
        spdlog::error("save_user_pattern prepare failed: {}", sqlite3_errmsg(db_));
        return false;
    }
    int64_t now = now_ms();
    bind_text(g.stmt, 1, pattern.id);
    bind_text(g.stmt, 2, pattern.type);
    bind_text(g.stmt, 3, pattern.pattern);
    bind_text(g.stmt, 4, json(examples).dump());
    sqlite3_bind_int64(g.stmt, 5, pattern.first_seen > 0 ? pattern.first_seen : now);
    sqlite3_bind_int64(g.stmt, 6, now);

    if (sqlite3_step(g.stmt) != SQLITE_DONE) {
        spdlog::error("save_user_pattern failed for {}: {}", pattern.id, sqlite3_errmsg(db_));
        return false;
    }
    return true;
}

std::vector<UserPattern> ContextStore::find_user_patterns(const std::string& type, int limit) {
    std::lock_guard<std::mutex> lock(db_mutex_);
    if (!db_) return {};

    StmtGuard g;
    const char* sql =
        "SELECT id, type, pattern, examples, frequency, first_seen, last_seen FROM user_patterns "
        "WHERE type = ? ORDER BY frequency DESC, last_seen DESC LIMIT ?;";
    if (sqlite3_prepare_v2(db_, sql, -1, &g.stmt, nullptr) != SQLITE_OK) return {};
    bind_text(g.stmt, 1, type);
    sqlite3_bind_int(g.stmt, 2, limit);

    std::vector<UserPattern> results;
    while (sqlite3_step(g.stmt) == SQLITE_ROW) {
        UserPattern p;
        p.id = column_text(g.stmt, 0);
        p.type = column_text(g.stmt, 1);
        p.pattern = column_text(g.stmt, 2);
        auto j = json::parse(column_text(g.stmt, 3), nullptr, false);
        if (j.is_array()) {
            for (const auto& e : j) {
                if (e.is_string()) p.examples.push_back(e.get<std::string>());
            }
        }
        p.frequency = sqlite3_column_int(g.stmt, 4);
        p.first_seen = sqlite3_column_int64(g.stmt, 5);
        p.last_seen = sqlite3_column_int64(g.stmt, 6);
        results.push_back(std::move(p));
    }
    return results;
}

// --- vectors ---

bool ContextStore::save_vector(int64_t id, const std::vector<float>& vector, const VectorMetadata& metadata) {
    return save_vectors({VectorRecord{id, vector, metadata}}).size() == 1;
}

bool ContextStore::link_vector(const VectorRecord& record) {
    std::string id_text = std::to_string(record.id);
    StmtGuard g;
    if (const auto* entity = std::get_if<EntityMeta>(&record.metadata)) {
        if (sqlite3_prepare_v2(db_, "UPDATE code_entities SET vector_id = ? WHERE id = ?;", -1, &g.stmt, nullptr) != SQLITE_OK) {
            return false;
        }
        bind_text(g.stmt, 1, id_text);
        bind_text(g.stmt, 2, entity->entity_id);
    } else if (const auto* file = std::get_if<FileMeta>(&record.metadata)) {
        if (sqlite3_prepare_v2(db_, "UPDATE context_items SET vector_id = ?, metadata = ? WHERE id = ?;", -1, &g.stmt, nullptr) != SQLITE_OK) {
            return false;
        }
        bind_text(g.stmt, 1, id_text);
        bind_text(g.stmt, 2, metadata_to_json(record.metadata).dump());
        bind_text(g.stmt, 3, file->item_id);
    } else {
        const auto& project = std::get<ProjectMeta>(record.metadata);
        if (sqlite3_prepare_v2(db_, "UPDATE context_items SET vector_id = ?, metadata = ? WHERE type = 'project_info' AND path = ?;", -1, &g.stmt, nullptr) != SQLITE_OK) {
            return false;
        }
        bind_text(g.stmt, 1, id_text);
        bind_text(g.stmt, 2, metadata_to_json(record.metadata).dump());
        bind_text(g.stmt, 3, project.path);
    }

    if (sqlite3_step(g.stmt) != SQLITE_DONE) {
        spdlog::error("save_vector link failed for {}: {}", record.id, sqlite3_errmsg(db_));
        return false;
    }
    if (sqlite3_changes(db_) != 1) {
        spdlog::warn("⚠️ Vector {} has no row to link to; not indexed", record.id);
        return false;
    }
    return true;
}

std::vector<int64_t> ContextStore::save_vectors(const std::vector<VectorRecord>& records) {
    std::lock_guard<std::mutex> lock(db_mutex_);
    if (!db_ || records.empty()) return {};

    for (const auto& record : records) {
        if (static_cast<int>(record.vector.size()) != vectors_->dimension()) {
            spdlog::error("save_vector {} rejected: {} dims, index expects {}",
                          record.id, record.vector.size(), vectors_->dimension());
            return {};
        }
    }

    if (auto s = exec("BEGIN;"); !s) {
        spdlog::error("save_vectors could not begin: {}", s.error().message);
        return {};
    }

    // Rows first, so the index never holds a vector without a link
    std::vector<std::pair<int64_t, std::vector<float>>> accepted;
    for (const auto& record : records) {
        if (link_vector(record)) accepted.emplace_back(record.id, record.vector);
    }

    if (auto s = vectors_->upsert_many(accepted); !s) {
        spdlog::error("save_vectors rejected by the index: {}", s.error().message);
        if (auto r = exec("ROLLBACK;"); !r) spdlog::error("save_vectors rollback failed: {}", r.error().message);
        return {};
    }

    std::vector<int64_t> stored;
    for (const auto& [id, v] : accepted) stored.push_back(id);

    if (auto s = exec("COMMIT;"); !s) {
        spdlog::error("save_vectors commit failed: {}", s.error().message);
        if (auto r = exec("ROLLBACK;"); !r) spdlog::error("save_vectors rollback failed: {}", r.error().message);
        if (auto r = vectors_->remove_many(stored); !r) {
            spdlog::error("❌ Could not drop unlinked vectors: {}", r.error().message);
        }
        return {};
    }

    if (!stored.empty()) persist_vectors();
    return stored;
}

std::optional<VectorMetadata> ContextStore::metadata_for_vector(int64_t id) {
    std::string id_text = std::to_string(id);
    {
        StmtGuard g;
        const char* sql = "SELECT id, path, language, metadata, type, name FROM context_items WHERE vector_id = ? LIMIT 1;";
        if (sqlite3_prepare_v2(db_, sql, -1, &g.stmt, nullptr) == SQLITE_OK) {
            bind_text(g.stmt, 1, id_text);
            if (sqlite3_step(g.stmt) == SQLITE_ROW) {
                if (auto meta = column_opt_text(g.stmt, 3); meta && !meta->empty()) {
                    if (auto parsed = metadata_from_json(json::parse(*meta, nullptr, false))) return parsed;
                }
                if (column_text(g.stmt, 4) == "project_info") {
                    return ProjectMeta{column_text(g.stmt, 5), column_text(g.stmt, 1)};
                }
                return FileMeta{column_text(g.stmt, 0), column_text(g.stmt, 1), column_text(g.stmt, 2)};
            }
        }
    }
    {
        StmtGuard g;
        const char* sql = "SELECT id, name, type, file_path FROM code_entities WHERE vector_id = ? LIMIT 1;";
        if (sqlite3_prepare_v2(db_, sql, -1, &g.stmt, nullptr) == SQLITE_OK) {
            bind_text(g.stmt, 1, id_text);
            if (sqlite3_step(g.stmt) == SQLITE_ROW) {
                return EntityMeta{column_text(g.stmt, 0), column_text(g.stmt, 1),
                                  parse_entity_kind(column_text(g.stmt, 2)), column_text(g.stmt, 3)};
            }
        }
    }
    return std::nullopt;
}

std::vector<VectorMatch> ContextStore::find_similar_vectors(const std::vector<float>& query_vector, int limit) {
    std::lock_guard<std::mutex> lock(db_mutex_);
    if (!db_) return {};

    std::vector<VectorMatch> matches;
    for (const auto& hit : vectors_->search(query_vector, limit)) {
        matches.push_back({hit.id, hit.distance, metadata_for_vector(hit.id)});
    }
    return matches;
}

std::vector<int64_t> ContextStore::vector_ids() const {
    std::lock_guard<std::mutex> lock(db_mutex_);
    return vectors_->ids();
}

bool ContextStore::remove_file(const std::string& path) {
    std::lock_guard<std::mutex> lock(db_mutex_);
    if (!db_) return false;

    std::vector<int64_t> doomed;
    auto collect = [&](const char* sql) {
        StmtGuard g;
        if (sqlite3_prepare_v2(db_, sql, -1, &g.stmt, nullptr) != SQLITE_OK) return;
        bind_text(g.stmt, 1, path);
        while (sqlite3_step(g.stmt) == SQLITE_ROW) {
            if (auto v = column_vector_id(g.stmt, 0)) doomed.push_back(*v);
        }
    };
    collect("SELECT vector_id FROM context_items WHERE path = ? AND vector_id IS NOT NULL;");
    collect("SELECT vector_id FROM code_entities WHERE file_path = ? AND vector_id IS NOT NULL;");

    for (const char* sql : {"DELETE FROM code_entities WHERE file_path = ?;",
                            "DELETE FROM context_items WHERE path = ?;"}) {
        StmtGuard g;
        if (sqlite3_prepare_v2(db_, sql, -1, &g.stmt, nullptr) != SQLITE_OK) return false;
        bind_text(g.stmt, 1, path);
        if (sqlite3_step(g.stmt) != SQLITE_DONE) {
            spdlog::error("remove_file failed for {}: {}", path, sqlite3_errmsg(db_));
            return false;
        }
    }

    if (auto s = vectors_->remove_many(doomed); !s) {
        spdlog::warn("⚠️ Could not drop vectors for {}: {}", path, s.error().message);
    }
    if (!doomed.empty()) persist_vectors();

    spdlog::info("🗑️ Removed {} from store ({} vectors)", path, doomed.size());
    return true;
}

} // namespace context_engine
