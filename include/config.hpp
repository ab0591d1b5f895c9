#pragma once
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

namespace context_engine {

enum class PruningStrategy { Lru, Importance, Hybrid };

std::string to_string(PruningStrategy s);
PruningStrategy parse_pruning_strategy(const std::string& s);

struct StorageConfig {
    std::string directory = ".context-engine";
    int busy_timeout_ms = 5000;
};

struct EmbeddingConfig {
    int dimension = 384;
    bool cache_enabled = true;
    size_t cache_size = 1000;
    size_t max_text_length = 32000;
    int request_timeout_ms = 5000;
    int probe_timeout_ms = 2000;
    bool use_local_model = true;
    std::string ollama_url = "http://localhost:11434";
    std::string ollama_model = "all-minilm";
    std::string remote_endpoint = "https://api.openai.com/v1/embeddings";
    std::string remote_model = "text-embedding-3-small";
    int max_retries = 3;
};

struct IndexingConfig {
    size_t max_file_size = 500 * 1024;
    int batch_delay_ms = 1000;
    size_t batch_size = 3;
    int next_batch_delay_ms = 100;
    int startup_delay_ms = 10000;
    size_t max_queue_size = 100;
    int sweep_pause_ms = 2000;
    size_t max_sweep_files = 1000;
    bool enable_startup_sweep = true;
    std::vector<std::string> exclude_patterns = {
        "node_modules", "\\.git", "dist", "build", "\\.vscode", "\\.idea", "\\.DS_Store",
        "\\.context-engine"
    };
    std::vector<std::string> include_extensions = {
        ".ts", ".tsx", ".js", ".jsx", ".py", ".java", ".c", ".cpp", ".cc", ".h", ".hpp",
        ".cs", ".go", ".rb", ".php", ".rs", ".swift", ".kt", ".md", ".json", ".yaml", ".yml"
    };
};

struct AssemblyConfig {
    int completion_max_tokens = 2000;
    int chat_max_tokens = 6000;
    int agent_max_tokens = 4000;
    double tokens_per_char = 0.25;
    int tokens_per_code_line = 5;
    int item_overhead_tokens = 20;
    int open_files_limit = 5;
    int workspace_limit = 10;
};

struct MemoryOptions {
    int conversation_memory_length = 10;
    int max_tokens_per_item = 2000;
    double importance_threshold = 0.3;
    PruningStrategy pruning_strategy = PruningStrategy::Hybrid;

    int keep_count() const { return conversation_memory_length * 2; }
    int token_budget() const { return conversation_memory_length * max_tokens_per_item; }
};

struct NetworkConfig {
    bool monitor_enabled = true;
    std::string probe_url = "https://www.gstatic.com/generate_204";
    int check_interval_ms = 180000;
    int timeout_ms = 5000;
    int reliability_threshold = 2;
    int unreliable_threshold = 2;
};

struct EngineConfig {
    std::string workspace_root = ".";
    StorageConfig storage;
    EmbeddingConfig embedding;
    IndexingConfig indexing;
    AssemblyConfig assembly;
    MemoryOptions memory;
    NetworkConfig network;
    std::string default_model = "default";
    int server_port = 5002;
    std::string log_level = "info";
};

EngineConfig engine_config_from_json(const nlohmann::json& j);
nlohmann::json memory_options_to_json(const MemoryOptions& o);
MemoryOptions memory_options_from_json(const nlohmann::json& j, MemoryOptions base = {});

// Missing or malformed files fall back to defaults with a warning.
EngineConfig load_engine_config(const std::string& path);

} // namespace context_engine
