#include "config.hpp"
#include <algorithm>
#include <fstream>
#include <spdlog/spdlog.h>

namespace context_engine {

using json = nlohmann::json;

std::string to_string(PruningStrategy s) {
    switch (s) {
        case PruningStrategy::Lru: return "lru";
        case PruningStrategy::Importance: return "importance";
        case PruningStrategy::Hybrid: return "hybrid";
    }
    return "hybrid";
}

PruningStrategy parse_pruning_strategy(const std::string& s) {
    if (s == "lru") return PruningStrategy::Lru;
    if (s == "importance") return PruningStrategy::Importance;
    return PruningStrategy::Hybrid;
}

json memory_options_to_json(const MemoryOptions& o) {
    return {
        {"conversation_memory_length", o.conversation_memory_length},
        {"max_tokens_per_item", o.max_tokens_per_item},
        {"importance_threshold", o.importance_threshold},
        {"pruning_strategy", to_string(o.pruning_strategy)}
    };
}

MemoryOptions memory_options_from_json(const json& j, MemoryOptions base) {
    if (!j.is_object()) return base;
    base.conversation_memory_length = j.value("conversation_memory_length", base.conversation_memory_length);
    base.max_tokens_per_item = j.value("max_tokens_per_item", base.max_tokens_per_item);
    base.importance_threshold = j.value("importance_threshold", base.importance_threshold);
    base.pruning_strategy = parse_pruning_strategy(j.value("pruning_strategy", to_string(base.pruning_strategy)));
    return base;
}

EngineConfig engine_config_from_json(const json& j) {
    EngineConfig cfg;
    cfg.workspace_root = j.value("workspace_root", cfg.workspace_root);
    cfg.default_model = j.value("default_model", cfg.default_model);
    cfg.server_port = j.value("server_port", cfg.server_port);
    cfg.log_level = j.value("log_level", cfg.log_level);

    if (j.contains("storage")) {
        const auto& s = j["storage"];
        cfg.storage.directory = s.value("directory", cfg.storage.directory);
        cfg.storage.busy_timeout_ms = s.value("busy_timeout_ms", cfg.storage.busy_timeout_ms);
    }

    if (j.contains("embedding")) {
        const auto& e = j["embedding"];
        auto& c = cfg.embedding;
        c.dimension = e.value("dimension", c.dimension);
        c.cache_enabled = e.value("cache_enabled", c.cache_enabled);
        c.cache_size = e.value("cache_size", c.cache_size);
        c.max_text_length = e.value("max_text_length", c.max_text_length);
        c.request_timeout_ms = e.value("request_timeout_ms", c.request_timeout_ms);
        c.probe_timeout_ms = e.value("probe_timeout_ms", c.probe_timeout_ms);
        c.use_local_model = e.value("use_local_model", c.use_local_model);
        c.ollama_url = e.value("ollama_url", c.ollama_url);
        c.ollama_model = e.value("ollama_model", c.ollama_model);
        c.remote_endpoint = e.value("remote_endpoint", c.remote_endpoint);
        c.remote_model = e.value("remote_model", c.remote_model);
        c.max_retries = e.value("max_retries", c.max_retries);
    }

    if (j.contains("indexing")) {
        const auto& i = j["indexing"];
        auto& c = cfg.indexing;
        c.max_file_size = i.value("max_file_size", c.max_file_size);
        c.batch_delay_ms = i.value("batch_delay_ms", c.batch_delay_ms);
        c.batch_size = i.value("batch_size", c.batch_size);
        c.next_batch_delay_ms = i.value("next_batch_delay_ms", c.next_batch_delay_ms);
        c.startup_delay_ms = i.value("startup_delay_ms", c.startup_delay_ms);
        c.max_queue_size = i.value("max_queue_size", c.max_queue_size);
        c.sweep_pause_ms = i.value("sweep_pause_ms", c.sweep_pause_ms);
        c.max_sweep_files = i.value("max_sweep_files", c.max_sweep_files);
        c.enable_startup_sweep = i.value("enable_startup_sweep", c.enable_startup_sweep);
        c.exclude_patterns = i.value("exclude_patterns", c.exclude_patterns);
        c.include_extensions = i.value("include_extensions", c.include_extensions);
        // Zero would stall the drain loop and the sweep pause
        c.batch_size = std::max<size_t>(1, c.batch_size);
        c.max_queue_size = std::max<size_t>(1, c.max_queue_size);
    }

    if (j.contains("assembly")) {
        const auto& a = j["assembly"];
        auto& c = cfg.assembly;
        c.completion_max_tokens = a.value("completion_max_tokens", c.completion_max_tokens);
        c.chat_max_tokens = a.value("chat_max_tokens", c.chat_max_tokens);
        c.agent_max_tokens = a.value("agent_max_tokens", c.agent_max_tokens);
        c.tokens_per_char = a.value("tokens_per_char", c.tokens_per_char);
        c.tokens_per_code_line = a.value("tokens_per_code_line", c.tokens_per_code_line);
        c.item_overhead_tokens = a.value("item_overhead_tokens", c.item_overhead_tokens);
        c.open_files_limit = a.value("open_files_limit", c.open_files_limit);
        c.workspace_limit = a.value("workspace_limit", c.workspace_limit);
    }

    if (j.contains("memory")) {
        cfg.memory = memory_options_from_json(j["memory"], cfg.memory);
    }

    if (j.contains("network")) {
        const auto& n = j["network"];
        auto& c = cfg.network;
        c.monitor_enabled = n.value("monitor_enabled", c.monitor_enabled);
        c.probe_url = n.value("probe_url", c.probe_url);
        c.check_interval_ms = n.value("check_interval_ms", c.check_interval_ms);
        c.timeout_ms = n.value("timeout_ms", c.timeout_ms);
        c.reliability_threshold = n.value("reliability_threshold", c.reliability_threshold);
        c.unreliable_threshold = n.value("unreliable_threshold", c.unreliable_threshold);
    }
    return cfg;
}

EngineConfig load_engine_config(const std::string& path) {
    std::ifstream f(path);
    if (!f.is_open()) {
        spdlog::warn("⚠️ Config {} not found, using defaults", path);
        return EngineConfig{};
    }
    try {
        auto j = json::parse(f);
        auto cfg = engine_config_from_json(j);
        spdlog::info("⚙️ Loaded engine config from {}", path);
        return cfg;
    } catch (const json::exception& e) {
        spdlog::warn("⚠️ Config {} is malformed ({}), using defaults", path, e.what());
        return EngineConfig{};
    }
}

} // namespace context_engine
