#pragma once
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <filesystem>
#include <memory>
#include <mutex>
#include <optional>
#include <regex>
#include <string>
#include <thread>
#include <unordered_set>
#include <vector>
#include "config.hpp"
#include "embedding_service.hpp"
#include "network_monitor.hpp"
#include "parsing/syntax_extractor.hpp"
#include "result.hpp"
#include "storage/context_store.hpp"
#include "worker_pool.hpp"
#include "workspace.hpp"

namespace context_engine {

namespace fs = std::filesystem;

// Background pipeline that keeps the store in step with the workspace.
//
// Paths land in an insertion-ordered, de-duplicated queue. A scheduler thread
// drains it in batches of `batch_size` on a fixed worker pool once the
// debounce deadline passes; a priority request moves the deadline to now.
class IndexingService {
public:
    IndexingService(IndexingConfig config,
                    std::shared_ptr<ContextStore> store,
                    std::shared_ptr<EmbeddingService> embeddings,
                    std::shared_ptr<NetworkStatus> network,
                    std::shared_ptr<WorkspaceProvider> workspace,
                    std::shared_ptr<ExtractorRegistry> extractors);
    ~IndexingService();

    IndexingService(const IndexingService&) = delete;
    IndexingService& operator=(const IndexingService&) = delete;

    // Loads already indexed paths, starts the scheduler and, when enabled,
    // arms the one-off startup sweep.
    void initialize();

    // Returns false when the path is excluded or the service is disposed.
    bool queue_file_for_indexing(const std::string& path, bool priority = false);

    // Starts a sweep on a background thread unless one is already running.
    void index_workspace_in_background();

    // Enqueues every matching, not yet indexed file; pauses every
    // `max_queue_size` files. Returns the number queued.
    size_t sweep_workspace();

    void force_index_file(const std::string& path);
    void remove_file(const std::string& path);

    // Indexes one file synchronously: item, then entities, then vectors.
    Status index_file(const std::string& path);

    bool wait_idle(std::chrono::milliseconds timeout);
    size_t pending_count() const;
    bool is_indexed(const std::string& path) const;

    void dispose();

    bool should_exclude(const fs::path& path) const;
    double compute_importance(const fs::path& path, std::optional<fs::file_time_type> modified) const;

private:
    std::string normalize_path(const std::string& path) const;
    void scheduler_loop();
    void run_batch(const std::vector<std::string>& batch);
    // True when the file's own vector was stored.
    bool embed_file(const ContextItem& item, const std::vector<CodeEntity>& entities);
    bool wait_or_stop(std::chrono::milliseconds delay);

    IndexingConfig config_;
    std::shared_ptr<ContextStore> store_;
    std::shared_ptr<EmbeddingService> embeddings_;
    std::shared_ptr<NetworkStatus> network_;
    std::shared_ptr<WorkspaceProvider> workspace_;
    std::shared_ptr<ExtractorRegistry> extractors_;
    std::vector<std::regex> excludes_;

    mutable std::mutex mutex_;
    std::condition_variable scheduler_cv_;
    std::condition_variable idle_cv_;
    std::vector<std::string> queue_;
    std::unordered_set<std::string> queued_;
    std::unordered_set<std::string> indexed_;
    std::optional<std::chrono::steady_clock::time_point> deadline_;
    size_t in_flight_ = 0;
    bool stop_ = false;
    bool started_ = false;

    std::atomic<bool> sweep_running_{false};
    std::thread scheduler_thread_;
    std::thread sweep_thread_;
    std::unique_ptr<WorkerPool> pool_;
};

} // namespace context_engine
