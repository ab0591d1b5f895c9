#include "indexing_service.hpp"
#include <algorithm>
#include <future>
#include <unordered_map>
#include <spdlog/spdlog.h>
#include "utils.hpp"

namespace context_engine {

namespace {

const std::unordered_set<std::string> kBinaryExtensions = {
    ".exe", ".dll", ".obj", ".bin", ".dat", ".db", ".sqlite", ".mdb",
    ".jpg", ".jpeg", ".png", ".gif", ".bmp", ".ico", ".svg",
    ".mp3", ".mp4", ".avi", ".mov", ".wav", ".flac",
    ".zip", ".rar", ".7z", ".tar", ".gz",
    ".pdf", ".doc", ".docx", ".xls", ".xlsx", ".ppt", ".pptx"
};

const std::unordered_set<std::string> kPriorityExtensions = {
    ".ts", ".tsx", ".js", ".jsx", ".py", ".java", ".c", ".cpp", ".cs", ".go", ".rb", ".php"
};

int count_lines(const std::string& content) {
    if (content.empty()) return 1;
    int lines = static_cast<int>(std::count(content.begin(), content.end(), '\n'));
    return content.back() == '\n' ? lines : lines + 1;
}

} // namespace

IndexingService::IndexingService(IndexingConfig config,
                                 std::shared_ptr<ContextStore> store,
                                 std::shared_ptr<EmbeddingService> embeddings,
                                 std::shared_ptr<NetworkStatus> network,
                                 std::shared_ptr<WorkspaceProvider> workspace,
                                 std::shared_ptr<ExtractorRegistry> extractors)
    : config_(std::move(config)),
      store_(std::move(store)),
      embeddings_(std::move(embeddings)),
      network_(std::move(network)),
      workspace_(std::move(workspace)),
      extractors_(std::move(extractors)),
      pool_(std::make_unique<WorkerPool>(std::max<size_t>(1, config_.batch_size))) {
    config_.batch_size = std::max<size_t>(1, config_.batch_size);
    config_.max_queue_size = std::max<size_t>(1, config_.max_queue_size);
    for (const auto& p : config_.exclude_patterns) {
        try {
            excludes_.emplace_back(p);
        } catch (const std::regex_error& e) {
            spdlog::warn("⚠️ Ignoring bad exclude pattern '{}': {}", p, e.what());
        }
    }
}

IndexingService::~IndexingService() {
    dispose();
}

std::string IndexingService::normalize_path(const std::string& path) const {
    fs::path p(path);
    if (p.is_relative()) p = workspace_->root() / p;
    return p.lexically_normal().generic_string();
}

bool IndexingService::should_exclude(const fs::path& path) const {
    fs::path root = workspace_->root();
    std::string subject = is_inside(path, root)
        ? path.lexically_normal().lexically_relative(root).generic_string()
        : path.generic_string();

    for (const auto& re : excludes_) {
        if (std::regex_search(subject, re)) return true;
    }
    return kBinaryExtensions.count(file_extension(path)) > 0;
}

double IndexingService::compute_importance(const fs::path& path, std::optional<fs::file_time_type> modified) const {
    double score = 0.5;

    if (kPriorityExtensions.count(file_extension(path))) score += 0.2;

    if (modified) {
        auto age = fs::file_time_type::clock::now() - *modified;
        if (age < std::chrono::hours(24)) score += 0.3;
        else if (age < std::chrono::hours(24 * 7)) score += 0.1;
    }

    std::string generic = path.generic_string();
    if (generic.find("/src/") != std::string::npos) score += 0.1;

    fs::path root = workspace_->root();
    fs::path rel = is_inside(path, root) ? path.lexically_normal().lexically_relative(root) : path;
    if (std::distance(rel.begin(), rel.end()) <= 2) score += 0.1;

    return std::min(score, 1.0);
}

void IndexingService::initialize() {
    std::unique_lock<std::mutex> lock(mutex_);
    if (started_ || stop_) return;
    started_ = true;

    for (auto& p : store_->indexed_paths()) {
        indexed_.insert(std::move(p));
    }
    spdlog::info("📚 Indexing service ready ({} files already indexed)", indexed_.size());

    scheduler_thread_ = std::thread(&IndexingService::scheduler_loop, this);

    if (config_.enable_startup_sweep) {
        sweep_running_ = true;
        sweep_thread_ = std::thread([this] {
            if (wait_or_stop(std::chrono::milliseconds(config_.startup_delay_ms))) {
                sweep_workspace();
            }
            sweep_running_ = false;
        });
    }
}

bool IndexingService::wait_or_stop(std::chrono::milliseconds delay) {
    std::unique_lock<std::mutex> lock(mutex_);
    return !scheduler_cv_.wait_for(lock, delay, [this] { return stop_; });
}

bool IndexingService::queue_file_for_indexing(const std::string& path, bool priority) {
    std::string key = normalize_path(path);
    if (should_exclude(key)) {
        spdlog::debug("Skipping excluded path {}", key);
        return false;
    }

    std::lock_guard<std::mutex> lock(mutex_);
    if (stop_) return false;

    if (priority) {
        // Priority paths jump ahead of anything already waiting
        if (!queued_.insert(key).second) {
            queue_.erase(std::remove(queue_.begin(), queue_.end(), key), queue_.end());
        }
        queue_.insert(queue_.begin(), key);
    } else if (queued_.insert(key).second) {
        queue_.push_back(key);
    }

    auto now = std::chrono::steady_clock::now();
    if (priority) {
        deadline_ = now;
    } else if (!deadline_ || *deadline_ > now) {
        // Debounce: every new arrival pushes the drain out again
        deadline_ = now + std::chrono::milliseconds(config_.batch_delay_ms);
    }
    scheduler_cv_.notify_all();
    return true;
}

void IndexingService::scheduler_loop() {
    std::unique_lock<std::mutex> lock(mutex_);
    while (!stop_) {
        if (!deadline_) {
            scheduler_cv_.wait(lock, [this] { return stop_ || deadline_.has_value(); });
            continue;
        }
        if (std::chrono::steady_clock::now() < *deadline_) {
            scheduler_cv_.wait_until(lock, *deadline_);
            continue;
        }

        deadline_.reset();
        std::vector<std::string> batch;
        while (!queue_.empty() && batch.size() < config_.batch_size) {
            batch.push_back(queue_.front());
            queued_.erase(queue_.front());
            queue_.erase(queue_.begin());
        }
        if (batch.empty()) {
            idle_cv_.notify_all();
            continue;
        }

        in_flight_ = batch.size();
        lock.unlock();
        run_batch(batch);
        lock.lock();
        in_flight_ = 0;

        if (!queue_.empty() && !deadline_) {
            deadline_ = std::chrono::steady_clock::now() + std::chrono::milliseconds(config_.next_batch_delay_ms);
        }
        idle_cv_.notify_all();
    }
    idle_cv_.notify_all();
}

void IndexingService::run_batch(const std::vector<std::string>& batch) {
    std::vector<std::future<Status>> results;
    results.reserve(batch.size());
    for (const auto& path : batch) {
        results.push_back(pool_->enqueue([this, path] { return index_file(path); }));
    }

    for (size_t i = 0; i < results.size(); ++i) {
        try {
            Status s = results[i].get();
            if (!s) {
                spdlog::warn("⚠️ Indexing {} failed: {}", batch[i], s.error().describe());
            }
        } catch (const std::exception& e) {
            spdlog::error("❌ Indexing {} threw: {}", batch[i], e.what());
        }
    }
}

Status IndexingService::index_file(const std::string& raw_path) {
    std::string path = normalize_path(raw_path);
    fs::path fs_path(path);

    if (should_exclude(fs_path)) {
        return make_error(ErrorCode::IndexingFailure, "excluded path");
    }

    auto size = workspace_->file_size(fs_path);
    if (!size) {
        return make_error(ErrorCode::Io, "cannot stat file");
    }
    if (*size > config_.max_file_size) {
        spdlog::info("Skipping {}: {} bytes exceeds limit of {}", path, *size, config_.max_file_size);
        return make_error(ErrorCode::IndexingFailure, "file too large");
    }

    auto content = workspace_->read_file(fs_path);
    if (!content) {
        return make_error(ErrorCode::Io, "cannot read file");
    }

    try {
        ContextItem item;
        item.id = hash_id(path);
        item.type = ContextItemType::File;
        item.name = fs_path.filename().string();
        item.path = path;
        item.language = language_for_path(fs_path);
        item.content = *content;
        item.size = static_cast<int64_t>(content->size());
        item.line_start = 1;
        item.line_end = count_lines(*content);
        item.last_accessed = now_ms();
        item.importance_score = compute_importance(fs_path, workspace_->last_write_time(fs_path));

        if (!store_->save_context_item(item)) {
            return make_error(ErrorCode::StorageUnavailable, "could not save file item");
        }

        auto extracted = extractors_->for_language(item.language)->extract(*content);

        // first_seen/last_seen carry the source span until the entity is seen again
        std::vector<CodeEntity> entities;
        std::unordered_set<std::string> seen;
        for (const auto& fn : extracted.functions) {
            std::string id = hash_id(path + ":func:" + fn.name);
            if (!seen.insert(id).second) continue;
            entities.push_back({id, fn.name, EntityKind::Function, path, fn.code,
                                fn.start_line, fn.end_line, 1, std::nullopt});
        }
        for (const auto& [name, cls] : extracted.classes) {
            std::string id = hash_id(path + ":class:" + name);
            if (!seen.insert(id).second) continue;
            entities.push_back({id, name, EntityKind::Class, path, cls.code,
                                cls.start_line, cls.end_line, 1, std::nullopt});
        }

        for (const auto& entity : entities) {
            if (!store_->save_code_entity(entity)) {
                spdlog::warn("⚠️ Could not save entity {} in {}", entity.name, path);
            }
        }

        // A file only counts as indexed once its vector is in; deferred files
        // are picked up again by the next sweep.
        bool embedded = false;
        if (network_->is_online() || !embeddings_->requires_network()) {
            embedded = embed_file(item, entities);
        } else {
            spdlog::debug("Offline without local model; deferring vectors for {}", path);
        }

        if (embedded) {
            std::lock_guard<std::mutex> lock(mutex_);
            indexed_.insert(path);
        }
        spdlog::debug("Indexed {} ({} entities)", path, entities.size());
        return Status::success();
    } catch (const std::exception& e) {
        return make_error(ErrorCode::IndexingFailure, e.what());
    }
}

bool IndexingService::embed_file(const ContextItem& item, const std::vector<CodeEntity>& entities) {
    int64_t file_vector_id = vector_id_for(item.id);
    std::vector<VectorRecord> records;
    records.reserve(entities.size() + 1);
    records.push_back({file_vector_id, embeddings_->generate_embedding(item.content),
                       FileMeta{item.id, item.path.value_or(""), item.language}});
    for (const auto& entity : entities) {
        records.push_back({vector_id_for(entity.id),
                           embeddings_->generate_embedding(entity.name + " - " + entity.code),
                           EntityMeta{entity.id, entity.name, entity.type, entity.file_path}});
    }

    auto stored = store_->save_vectors(records);
    if (stored.size() < records.size()) {
        spdlog::warn("⚠️ Stored {} of {} vectors for {}", stored.size(), records.size(),
                     item.path.value_or(item.id));
    }
    return std::find(stored.begin(), stored.end(), file_vector_id) != stored.end();
}

size_t IndexingService::sweep_workspace() {
    std::unordered_set<std::string> extensions(config_.include_extensions.begin(),
                                               config_.include_extensions.end());
    auto files = workspace_->find_files(extensions, config_.max_sweep_files);
    spdlog::info("🔍 Workspace sweep found {} candidate files", files.size());

    size_t queued = 0;
    for (const auto& file : files) {
        std::string key = normalize_path(file.string());
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (stop_) break;
            if (indexed_.count(key) || queued_.count(key)) continue;
        }
        if (!queue_file_for_indexing(key, false)) continue;

        if (++queued % config_.max_queue_size == 0) {
            // Let the queue drain before adding more
            if (!wait_or_stop(std::chrono::milliseconds(config_.sweep_pause_ms))) break;
        }
    }
    spdlog::info("🔍 Workspace sweep queued {} files", queued);
    return queued;
}

void IndexingService::index_workspace_in_background() {
    if (sweep_running_.exchange(true)) {
        spdlog::info("Workspace sweep already running");
        return;
    }
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (stop_) {
            sweep_running_ = false;
            return;
        }
    }
    if (sweep_thread_.joinable()) sweep_thread_.join();
    sweep_thread_ = std::thread([this] {
        sweep_workspace();
        sweep_running_ = false;
    });
}

void IndexingService::force_index_file(const std::string& path) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        indexed_.erase(normalize_path(path));
    }
    queue_file_for_indexing(path, true);
}

void IndexingService::remove_file(const std::string& path) {
    std::string key = normalize_path(path);
    {
        std::lock_guard<std::mutex> lock(mutex_);
        indexed_.erase(key);
        if (queued_.erase(key)) {
            queue_.erase(std::remove(queue_.begin(), queue_.end(), key), queue_.end());
        }
    }
    if (!store_->remove_file(key)) {
        spdlog::warn("⚠️ Could not remove {} from the store", key);
    }
}

bool IndexingService::wait_idle(std::chrono::milliseconds timeout) {
    std::unique_lock<std::mutex> lock(mutex_);
    return idle_cv_.wait_for(lock, timeout, [this] {
        return stop_ || (queue_.empty() && in_flight_ == 0);
    });
}

size_t IndexingService::pending_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return queue_.size() + in_flight_;
}

bool IndexingService::is_indexed(const std::string& path) const {
    std::string key = normalize_path(path);
    std::lock_guard<std::mutex> lock(mutex_);
    return indexed_.count(key) > 0;
}

void IndexingService::dispose() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (stop_) return;
        stop_ = true;
        deadline_.reset();
    }
    scheduler_cv_.notify_all();
    idle_cv_.notify_all();

    if (scheduler_thread_.joinable()) scheduler_thread_.join();
    if (sweep_thread_.joinable()) sweep_thread_.join();
    pool_.reset();
    spdlog::info("📚 Indexing service disposed");
}

} // namespace context_engine
