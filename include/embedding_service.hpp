#pragma once
#include <string>
#include <vector>
#include <memory>
#include "cache_manager.hpp"
#include "config.hpp"
#include "embedding/embedder.hpp"

namespace context_engine {

// Ordered chain of embedders (local model, remote API, deterministic
// fallback) behind one bounded cache. generate_embedding() always returns a
// vector of dimension().
class EmbeddingService {
public:
    EmbeddingService(EmbeddingConfig config,
                     std::shared_ptr<KeyManager> key_manager,
                     std::shared_ptr<NetworkStatus> network);

    // Injects a custom chain; the deterministic fallback is always appended.
    EmbeddingService(EmbeddingConfig config,
                     std::vector<std::shared_ptr<Embedder>> providers);

    void initialize();

    std::vector<float> generate_embedding(const std::string& text);

    // False only when a local model can serve every request.
    bool requires_network() const;

    void clear_cache();
    size_t cache_size() const { return cache_.size(); }
    int dimension() const { return config_.dimension; }

    // Whitespace-collapsed, trimmed and length-capped form used for every lookup.
    std::string normalize_text(const std::string& text) const;
    static std::string cache_key(const std::string& normalized);

    const PseudoEmbedder& fallback() const { return *fallback_; }

private:
    EmbeddingConfig config_;
    std::vector<std::shared_ptr<Embedder>> providers_;
    std::shared_ptr<PseudoEmbedder> fallback_;
    EmbeddingCache cache_;
};

} // namespace context_engine
