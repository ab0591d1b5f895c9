#include "embedding_service.hpp"
#include "vector_math.hpp"

#include "../test_logger.hpp"

#include <cmath>
#include <cstdlib>
#include <stdexcept>
#include <string>
#include <vector>

using context_engine::tests::Require;

namespace {

// Scripted provider: fixed vector, fixed failure, or a configurable size.
class ScriptedEmbedder : public context_engine::Embedder {
public:
    ScriptedEmbedder(std::string name, bool ready, bool network, int dimension, bool fail = false)
        : name_(std::move(name)), ready_(ready), network_(network), dimension_(dimension), fail_(fail) {}

    std::string name() const override { return name_; }
    bool requires_network() const override { return network_; }
    bool is_ready() const override { return ready_; }

    context_engine::Result<std::vector<float>> embed(const std::string&) override {
        ++calls;
        if (fail_) return context_engine::make_error(context_engine::ErrorCode::EmbeddingUnavailable, "scripted failure");
        std::vector<float> v(dimension_, 0.0f);
        if (!v.empty()) v[0] = 1.0f;
        return v;
    }

    int calls = 0;

private:
    std::string name_;
    bool ready_;
    bool network_;
    int dimension_;
    bool fail_;
};

bool approx(double a, double b, double eps = 1e-5) {
    return std::fabs(a - b) <= eps;
}

context_engine::EmbeddingConfig small_config(size_t cache_size = 1000) {
    context_engine::EmbeddingConfig config;
    config.cache_size = cache_size;
    return config;
}

void ScenarioPseudoEmbeddingIsDeterministicAndNormalized() {
    context_engine::tests::log("scenario: pseudo embedding deterministic and unit length");
    context_engine::PseudoEmbedder embedder(384);

    auto first = embedder.generate("function foo() { return 1; }");
    auto second = embedder.generate("function foo() { return 1; }");
    auto other = embedder.generate("class Bar {}");

    Require(first.size() == 384, "pseudo embedding has wrong dimension");
    Require(first == second, "same text must give identical vectors");
    Require(first != other, "different text should give different vectors");
    Require(approx(context_engine::l2_norm(first), 1.0), "pseudo embedding must be unit length");
    Require(approx(context_engine::l2_norm(embedder.generate("")), 1.0), "empty text still yields a unit vector");
}

void ScenarioCosineSimilarity() {
    context_engine::tests::log("scenario: cosine similarity");
    context_engine::PseudoEmbedder embedder(64);
    auto a = embedder.generate("alpha");
    auto b = embedder.generate("beta");

    Require(approx(context_engine::cosine_similarity(a, a), 1.0), "self similarity must be 1");
    Require(approx(context_engine::cosine_similarity(a, b), context_engine::cosine_similarity(b, a)),
            "cosine must be symmetric");

    std::vector<float> zero(64, 0.0f);
    Require(context_engine::cosine_similarity(a, zero) == 0.0, "zero vector gives similarity 0");

    bool threw = false;
    try {
        context_engine::cosine_similarity(a, std::vector<float>(32, 1.0f));
    } catch (const std::invalid_argument&) {
        threw = true;
    }
    Require(threw, "mismatched dimensions must throw");
}

void ScenarioInsertionOrderCache() {
    context_engine::tests::log("scenario: insertion order cache");
    context_engine::InsertionOrderCache<std::string, int> cache(2);
    cache.set("a", 1);
    cache.set("b", 2);
    Require(cache.get("a").value_or(0) == 1, "a should be cached");

    // Reading "a" does not protect it: it is still the oldest insertion
    cache.set("c", 3);
    Require(!cache.contains("a"), "oldest entry must be evicted first");
    Require(cache.contains("b") && cache.contains("c"), "newer entries must survive");
    Require(cache.size() == 2, "cache must stay at capacity");

    cache.set("b", 20);
    Require(cache.get("b").value_or(0) == 20, "overwrite must update the value");
    Require(cache.size() == 2, "overwrite must not grow the cache");

    context_engine::InsertionOrderCache<std::string, int> disabled(0);
    disabled.set("x", 1);
    Require(disabled.size() == 0, "zero-capacity cache stores nothing");
}

void ScenarioServiceCacheIsBounded() {
    context_engine::tests::log("scenario: service cache bounded");
    context_engine::EmbeddingService service(small_config(3), {});
    for (int i = 0; i < 5; ++i) {
        service.generate_embedding("text number " + std::to_string(i));
    }
    Require(service.cache_size() == 3, "cache must hold at most cache_size entries");

    service.clear_cache();
    Require(service.cache_size() == 0, "clear_cache must empty the cache");
}

void ScenarioNormalizationSharesCacheEntries() {
    context_engine::tests::log("scenario: normalization");
    context_engine::EmbeddingService service(small_config(), {});
    Require(service.normalize_text("  a \n\t b  ") == "a b", "whitespace must be collapsed and trimmed");

    auto first = service.generate_embedding("foo   bar");
    auto second = service.generate_embedding("foo bar\n");
    Require(first == second, "texts equal after normalization must embed identically");
    Require(service.cache_size() == 1, "normalized duplicates share one cache entry");
    Require(first == service.fallback().generate("foo bar"), "empty chain must use the fallback");

    std::string long_text(40000, 'x');
    Require(service.normalize_text(long_text).size() == 32000, "text must be capped at max_text_length");
    Require(context_engine::EmbeddingService::cache_key("hello") == "hello:5", "cache key is prefix plus length");
}

void ScenarioChainOrderAndFallthrough() {
    context_engine::tests::log("scenario: provider chain");
    auto config = small_config();
    config.cache_enabled = false;

    // A failing local model goes straight to the fallback, never to the remote API
    auto broken_local = std::make_shared<ScriptedEmbedder>("local", true, false, 384, true);
    auto remote = std::make_shared<ScriptedEmbedder>("remote", true, true, 384);
    context_engine::EmbeddingService local_first(config, {broken_local, remote});
    auto v = local_first.generate_embedding("chain test");
    Require(v.size() == 384, "result must keep the configured dimension");
    Require(v == local_first.fallback().generate("chain test"), "a failed local model ends in the fallback");
    Require(broken_local->calls == 1, "the local model is tried once");
    Require(remote->calls == 0, "the remote API is not consulted after a local failure");

    auto wrong_size = std::make_shared<ScriptedEmbedder>("wrong-size", true, true, 768);
    auto spare = std::make_shared<ScriptedEmbedder>("spare", true, true, 384);
    context_engine::EmbeddingService mismatched(config, {wrong_size, spare});
    Require(mismatched.generate_embedding("chain test") == mismatched.fallback().generate("chain test"),
            "a dimension mismatch ends in the fallback");
    Require(spare->calls == 0, "no second provider after a mismatch");

    auto offline = std::make_shared<ScriptedEmbedder>("offline", false, false, 384);
    auto good = std::make_shared<ScriptedEmbedder>("good", true, true, 384);
    auto never = std::make_shared<ScriptedEmbedder>("never", true, true, 384);
    context_engine::EmbeddingService ordered(config, {offline, good, never});
    auto w = ordered.generate_embedding("chain test");
    Require(w[0] == 1.0f, "first ready provider must answer");
    Require(offline->calls == 0, "providers that are not ready are skipped");
    Require(never->calls == 0, "later providers are not consulted after a success");
}

void ScenarioDefaultModelsMatchTheDimension() {
    context_engine::tests::log("scenario: default models");
    context_engine::EmbeddingConfig defaults;
    Require(defaults.dimension == 384, "default dimension");
    Require(defaults.ollama_model == "all-minilm", "default local model produces 384 dims");
    Require(defaults.remote_model == "text-embedding-3-small", "default remote model accepts a dimensions field");
}

void ScenarioRequiresNetwork() {
    context_engine::tests::log("scenario: requires network");
    auto local = std::make_shared<ScriptedEmbedder>("local", true, false, 384);
    auto remote = std::make_shared<ScriptedEmbedder>("remote", true, true, 384);
    auto local_down = std::make_shared<ScriptedEmbedder>("local-down", false, false, 384);

    Require(!context_engine::EmbeddingService(small_config(), {local, remote}).requires_network(),
            "a ready local model removes the network requirement");
    Require(context_engine::EmbeddingService(small_config(), {local_down, remote}).requires_network(),
            "without a ready local model the network is required");
}

void ScenarioRemoteEmbedderOffline() {
    context_engine::tests::log("scenario: remote embedder offline");
    auto keys = std::make_shared<context_engine::KeyManager>(std::vector<std::string>{"sk-test"});
    auto network = std::make_shared<context_engine::StaticNetworkStatus>(false);
    context_engine::RemoteApiEmbedder remote(small_config(), keys, network);

    Require(!remote.is_ready(), "remote embedder is not ready while offline");
    auto result = remote.embed("anything");
    Require(!result.ok(), "offline embed must fail without a request");
    Require(result.error().code == context_engine::ErrorCode::NetworkDegraded, "offline failure code");

    context_engine::EmbeddingService service(small_config(),
                                             {std::make_shared<context_engine::RemoteApiEmbedder>(
                                                 small_config(), keys, network)});
    auto v = service.generate_embedding("anything");
    Require(v == service.fallback().generate("anything"), "offline chain must fall back");
}

} // namespace

int main() {
    context_engine::tests::init_logging();
    try {
        context_engine::tests::log("embedding_service_test: start");
        ScenarioPseudoEmbeddingIsDeterministicAndNormalized();
        ScenarioCosineSimilarity();
        ScenarioInsertionOrderCache();
        ScenarioServiceCacheIsBounded();
        ScenarioNormalizationSharesCacheEntries();
        ScenarioChainOrderAndFallthrough();
        ScenarioDefaultModelsMatchTheDimension();
        ScenarioRequiresNetwork();
        ScenarioRemoteEmbedderOffline();
        context_engine::tests::log("embedding_service_test: finished");
        return EXIT_SUCCESS;
    } catch (const std::exception& ex) {
        context_engine::tests::log_error(ex.what());
        return EXIT_FAILURE;
    }
}
