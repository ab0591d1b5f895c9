#include "embedding/embedder.hpp"
#include <cmath>
#include <chrono>
#include <thread>
#include <cpr/cpr.h>
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

namespace context_engine {

using json = nlohmann::json;

namespace {

template<typename Func>
cpr::Response perform_request_with_retry(Func request_factory, std::shared_ptr<KeyManager> km, int max_retries) {
    cpr::Response r;
    for (int i = 0; i < max_retries; ++i) {
        r = request_factory();
        if (r.status_code == 200) return r;
        if ((r.status_code == 429 || r.status_code == 503) && km) {
            spdlog::warn("⚠️ Embedding API {} ({}). Rotating key (attempt {}/{})",
                         r.status_code, (r.status_code == 429 ? "quota" : "overload"), i + 1, max_retries);
            km->report_rate_limit();
            std::this_thread::sleep_for(std::chrono::milliseconds(500 * (i + 1)));
            continue;
        }
        break;
    }
    return r;
}

Result<std::vector<float>> parse_vector(const json& values, const char* provider) {
    if (!values.is_array() || values.empty()) {
        return make_error(ErrorCode::EmbeddingUnavailable,
                          std::string(provider) + " returned no embedding");
    }
    return values.get<std::vector<float>>();
}

} // namespace

// --- Ollama ---

OllamaEmbedder::OllamaEmbedder(const EmbeddingConfig& config)
    : endpoint_(config.ollama_url + "/api/embeddings"),
      model_(config.ollama_model),
      dimension_(config.dimension),
      probe_timeout_ms_(config.probe_timeout_ms),
      request_timeout_ms_(config.request_timeout_ms) {}

Result<std::vector<float>> OllamaEmbedder::request(const std::string& text, int timeout_ms) {
    auto r = cpr::Post(cpr::Url{endpoint_},
                       cpr::Body{json{{"model", model_}, {"prompt", text}}.dump(-1, ' ', false, json::error_handler_t::replace)},
                       cpr::Header{{"Content-Type", "application/json"}},
                       cpr::Timeout{timeout_ms});

    if (r.error.code != cpr::ErrorCode::OK) {
        return make_error(ErrorCode::EmbeddingUnavailable, "ollama unreachable: " + r.error.message);
    }
    if (r.status_code != 200) {
        return make_error(ErrorCode::EmbeddingUnavailable, "ollama status " + std::to_string(r.status_code));
    }
    try {
        auto j = json::parse(r.text);
        return parse_vector(j.value("embedding", json::array()), "ollama");
    } catch (const json::exception& e) {
        return make_error(ErrorCode::EmbeddingUnavailable, std::string("ollama response: ") + e.what());
    }
}

Status OllamaEmbedder::initialize() {
    auto probe = request("test", probe_timeout_ms_);
    if (!probe) {
        ready_ = false;
        spdlog::info("🧩 Local embedding model not available ({})", probe.error().message);
        return probe.error();
    }
    if (static_cast<int>(probe->size()) != dimension_) {
        ready_ = false;
        spdlog::warn("⚠️ Ollama model {} produces {} dims, engine is pinned to {}; local model disabled",
                     model_, probe->size(), dimension_);
        return make_error(ErrorCode::EmbeddingUnavailable, "dimension mismatch");
    }
    ready_ = true;
    spdlog::info("🧩 Using Ollama ({}) for local embeddings", model_);
    return Status::success();
}

Result<std::vector<float>> OllamaEmbedder::embed(const std::string& text) {
    if (!ready_) {
        return make_error(ErrorCode::EmbeddingUnavailable, "local model not initialized");
    }
    return request(text, request_timeout_ms_);
}

// --- Remote API ---

RemoteApiEmbedder::RemoteApiEmbedder(const EmbeddingConfig& config,
                                     std::shared_ptr<KeyManager> key_manager,
                                     std::shared_ptr<NetworkStatus> network)
    : endpoint_(config.remote_endpoint),
      model_(config.remote_model),
      dimension_(config.dimension),
      request_timeout_ms_(config.request_timeout_ms),
      max_retries_(config.max_retries),
      key_manager_(std::move(key_manager)),
      network_(std::move(network)) {
    if (key_manager_) {
        auto override_model = key_manager_->get_embedding_model();
        if (!override_model.empty()) model_ = override_model;
    }
}

bool RemoteApiEmbedder::is_ready() const {
    return key_manager_ && key_manager_->has_key() && network_ && network_->is_online();
}

Result<std::vector<float>> RemoteApiEmbedder::embed(const std::string& text) {
    if (!network_ || !network_->is_online()) {
        return make_error(ErrorCode::NetworkDegraded, "offline");
    }
    if (!key_manager_ || !key_manager_->has_key()) {
        return make_error(ErrorCode::EmbeddingUnavailable, "no API key");
    }

    std::string payload = json{{"input", text}, {"model", model_}, {"dimensions", dimension_}}
        .dump(-1, ' ', false, json::error_handler_t::replace);

    // Key is re-read per attempt so a rotation takes effect on retry.
    auto r = perform_request_with_retry([&]() {
        return cpr::Post(cpr::Url{endpoint_},
                         cpr::Body{payload},
                         cpr::Header{{"Content-Type", "application/json"},
                                     {"Authorization", "Bearer " + key_manager_->get_current_key()}},
                         cpr::Timeout{request_timeout_ms_});
    }, key_manager_, max_retries_);

    if (r.error.code != cpr::ErrorCode::OK) {
        return make_error(ErrorCode::NetworkDegraded, "remote embedding failed: " + r.error.message);
    }
    if (r.status_code != 200) {
        spdlog::error("❌ Embedding API error [{}]", r.status_code);
        return make_error(ErrorCode::EmbeddingUnavailable, "remote status " + std::to_string(r.status_code));
    }

    try {
        auto j = json::parse(r.text);
        if (!j.contains("data") || j["data"].empty()) {
            return make_error(ErrorCode::EmbeddingUnavailable, "remote response without data");
        }
        return parse_vector(j["data"][0].value("embedding", json::array()), "remote");
    } catch (const json::exception& e) {
        return make_error(ErrorCode::EmbeddingUnavailable, std::string("remote response: ") + e.what());
    }
}

// --- Deterministic fallback ---

std::vector<float> PseudoEmbedder::generate(const std::string& text) const {
    // 32-bit wrapping accumulator over the bytes of the text
    uint32_t acc = 0;
    for (unsigned char c : text) {
        acc = acc * 31u + c;
    }
    int32_t seed = static_cast<int32_t>(acc);

    std::vector<double> raw(dimension_);
    double sum = 0.0;
    for (int i = 0; i < dimension_; ++i) {
        double x = std::sin(static_cast<double>(seed) + i) * 10000.0;
        raw[i] = x - std::floor(x);
        sum += raw[i] * raw[i];
    }

    double norm = std::sqrt(sum);
    std::vector<float> embedding(dimension_);
    for (int i = 0; i < dimension_; ++i) {
        embedding[i] = static_cast<float>(norm > 0.0 ? raw[i] / norm : 0.0);
    }
    return embedding;
}

Result<std::vector<float>> PseudoEmbedder::embed(const std::string& text) {
    return generate(text);
}

} // namespace context_engine
