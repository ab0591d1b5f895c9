#pragma once
#include <atomic>
#include <memory>
#include <string>
#include <vector>
#include "result.hpp"
#include "config.hpp"
#include "KeyManager.hpp"
#include "network_monitor.hpp"

namespace context_engine {

// One way of turning text into a vector. Implementations never throw from
// embed(); failures come back as an Error.
class Embedder {
public:
    virtual ~Embedder() = default;

    virtual std::string name() const = 0;
    virtual bool requires_network() const = 0;
    virtual Status initialize() { return Status::success(); }
    virtual bool is_ready() const = 0;
    virtual Result<std::vector<float>> embed(const std::string& text) = 0;
};

// Local Ollama server.
class OllamaEmbedder : public Embedder {
public:
    explicit OllamaEmbedder(const EmbeddingConfig& config);

    std::string name() const override { return "ollama"; }
    bool requires_network() const override { return false; }
    Status initialize() override;
    bool is_ready() const override { return ready_.load(); }
    Result<std::vector<float>> embed(const std::string& text) override;

private:
    Result<std::vector<float>> request(const std::string& text, int timeout_ms);

    std::string endpoint_;
    std::string model_;
    int dimension_;
    int probe_timeout_ms_;
    int request_timeout_ms_;
    std::atomic<bool> ready_{false};
};

// OpenAI-compatible embeddings endpoint, keyed through KeyManager.
class RemoteApiEmbedder : public Embedder {
public:
    RemoteApiEmbedder(const EmbeddingConfig& config,
                      std::shared_ptr<KeyManager> key_manager,
                      std::shared_ptr<NetworkStatus> network);

    std::string name() const override { return "remote"; }
    bool requires_network() const override { return true; }
    bool is_ready() const override;
    Result<std::vector<float>> embed(const std::string& text) override;

private:
    std::string endpoint_;
    std::string model_;
    int dimension_;
    int request_timeout_ms_;
    int max_retries_;
    std::shared_ptr<KeyManager> key_manager_;
    std::shared_ptr<NetworkStatus> network_;
};

// Deterministic vector derived from the text alone. Always ready.
class PseudoEmbedder : public Embedder {
public:
    explicit PseudoEmbedder(int dimension) : dimension_(dimension) {}

    std::string name() const override { return "pseudo"; }
    bool requires_network() const override { return false; }
    bool is_ready() const override { return true; }
    Result<std::vector<float>> embed(const std::string& text) override;

    std::vector<float> generate(const std::string& text) const;

private:
    int dimension_;
};

} // namespace context_engine
