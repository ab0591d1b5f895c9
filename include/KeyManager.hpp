#pragma once
#include <vector>
#include <string>
#include <shared_mutex>
#include <nlohmann/json.hpp>
#include <fstream>
#include <spdlog/spdlog.h>

namespace context_engine {

// Pool of API keys for the remote embedding endpoint, rotated on rate limits.
class KeyManager {
private:
    struct ApiKey {
        std::string key;
        bool is_active = true;
        int fail_count = 0;
    };

    std::vector<ApiKey> key_pool;
    mutable std::shared_mutex pool_mutex;
    size_t current_index = 0;
    std::string embedding_model;

public:
    KeyManager() {
        refresh_key_pool();
    }

    explicit KeyManager(const std::vector<std::string>& keys, std::string model = "")
        : embedding_model(std::move(model)) {
        for (const auto& k : keys) {
            if (!k.empty()) key_pool.push_back({k, true, 0});
        }
    }

    void refresh_key_pool() {
        std::unique_lock lock(pool_mutex);

        std::vector<std::string> search_paths = {
            "keys.json",
            "../keys.json",
            "build/keys.json",
            "../../keys.json"
        };

        std::ifstream f;
        std::string found_path;

        for (const auto& path : search_paths) {
            f.open(path);
            if (f.is_open()) {
                found_path = path;
                break;
            }
        }

        if (found_path.empty()) {
            spdlog::info("🔑 No keys.json found; remote embeddings disabled");
            return;
        }

        try {
            auto j = nlohmann::json::parse(f);

            key_pool.clear();
            current_index = 0;
            if (j.contains("keys")) {
                for (auto& k : j["keys"]) {
                    key_pool.push_back({k.get<std::string>(), true, 0});
                }
            }
            embedding_model = j.value("embedding_model", "");

            spdlog::info("🔑 Key pool loaded from {}: {} keys", found_path, key_pool.size());
        } catch (const std::exception& e) {
            spdlog::error("💥 Failed to parse {}: {}", found_path, e.what());
        }
    }

    size_t get_active_key_count() const {
        std::shared_lock lock(pool_mutex);
        size_t count = 0;
        for (const auto& k : key_pool) {
            if (k.is_active) count++;
        }
        return count;
    }

    bool has_key() const { return get_active_key_count() > 0; }

    std::string get_current_key() const {
        std::shared_lock lock(pool_mutex);
        if (key_pool.empty()) return "";
        for (size_t i = 0; i < key_pool.size(); ++i) {
            const auto& k = key_pool[(current_index + i) % key_pool.size()];
            if (k.is_active) return k.key;
        }
        return "";
    }

    // Empty when keys.json does not override the configured model.
    std::string get_embedding_model() const {
        std::shared_lock lock(pool_mutex);
        return embedding_model;
    }

    void report_rate_limit() {
        std::unique_lock lock(pool_mutex);
        if (key_pool.empty()) return;

        auto& current = key_pool[current_index % key_pool.size()];
        current.fail_count++;
        if (current.fail_count > 2) {
            current.is_active = false;
            spdlog::warn("⚠️ Key #{} decommissioned after repeated rate limits", current_index);
        }
        current_index = (current_index + 1) % key_pool.size();
    }
};

} // namespace context_engine
