#include "embedding_service.hpp"
#include "utils.hpp"
#include <chrono>
#include <spdlog/spdlog.h>

namespace context_engine {

EmbeddingService::EmbeddingService(EmbeddingConfig config,
                                   std::shared_ptr<KeyManager> key_manager,
                                   std::shared_ptr<NetworkStatus> network)
    : config_(std::move(config)),
      fallback_(std::make_shared<PseudoEmbedder>(config_.dimension)),
      cache_(config_.cache_size) {
    if (config_.use_local_model) {
        providers_.push_back(std::make_shared<OllamaEmbedder>(config_));
    }
    providers_.push_back(std::make_shared<RemoteApiEmbedder>(config_, std::move(key_manager), std::move(network)));
}

EmbeddingService::EmbeddingService(EmbeddingConfig config,
                                   std::vector<std::shared_ptr<Embedder>> providers)
    : config_(std::move(config)),
      providers_(std::move(providers)),
      fallback_(std::make_shared<PseudoEmbedder>(config_.dimension)),
      cache_(config_.cache_size) {}

void EmbeddingService::initialize() {
    for (auto& provider : providers_) {
        auto status = provider->initialize();
        if (!status) {
            spdlog::debug("Embedder {} not initialized: {}", provider->name(), status.error().describe());
        }
    }
    spdlog::info("🧠 Embedding chain ready (dimension {}, network required: {})",
                 config_.dimension, requires_network() ? "yes" : "no");
}

std::string EmbeddingService::normalize_text(const std::string& text) const {
    return utf8_safe_substr(collapse_whitespace(text), config_.max_text_length);
}

std::string EmbeddingService::cache_key(const std::string& normalized) {
    return utf8_safe_substr(normalized, 100) + ":" + std::to_string(normalized.size());
}

std::vector<float> EmbeddingService::generate_embedding(const std::string& text) {
    std::string normalized = normalize_text(text);
    std::string key = cache_key(normalized);

    if (config_.cache_enabled) {
        if (auto cached = cache_.get(key)) return *cached;
    }

    // Only the first ready provider is asked; mixing model spaces in one
    // index is worse than the deterministic fallback.
    std::vector<float> embedding;
    for (auto& provider : providers_) {
        if (!provider->is_ready()) continue;

        auto start = std::chrono::steady_clock::now();
        auto result = provider->embed(normalized);
        double ms = std::chrono::duration<double, std::milli>(std::chrono::steady_clock::now() - start).count();

        if (!result) {
            spdlog::debug("Embedder {} failed after {:.1f} ms: {}", provider->name(), ms, result.error().describe());
        } else if (static_cast<int>(result->size()) != config_.dimension) {
            spdlog::warn("⚠️ Embedder {} returned {} dims, expected {}",
                         provider->name(), result->size(), config_.dimension);
        } else {
            embedding = std::move(result.value());
        }
        break;
    }

    if (embedding.empty()) {
        spdlog::debug("Using deterministic fallback embedding");
        embedding = fallback_->generate(normalized);
    }

    if (config_.cache_enabled) {
        cache_.set(key, embedding);
    }
    return embedding;
}

bool EmbeddingService::requires_network() const {
    for (const auto& provider : providers_) {
        if (!provider->requires_network() && provider->is_ready()) return false;
    }
    return true;
}

void EmbeddingService::clear_cache() {
    cache_.clear();
    spdlog::info("🧹 Embedding cache cleared");
}

} // namespace context_engine
