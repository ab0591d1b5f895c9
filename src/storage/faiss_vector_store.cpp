#include "storage/faiss_vector_store.hpp"
#include <faiss/IndexHNSW.h>
#include <faiss/IndexIDMap.h>
#include <faiss/index_io.h>
#include <faiss/impl/FaissAssert.h>
#include <faiss/utils/distances.h>
#include <algorithm>
#include <fstream>
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>
#include "utils.hpp"

namespace fs = std::filesystem;
using json = nlohmann::json;

namespace context_engine {

namespace {

faiss::IndexIDMap2* as_id_map(const std::unique_ptr<faiss::Index>& index) {
    return static_cast<faiss::IndexIDMap2*>(index.get());
}

} // namespace

FaissVectorStore::FaissVectorStore(int dimension) : dimension_(dimension), created_(now_ms()) {
    reset_index();
}

FaissVectorStore::~FaissVectorStore() {
}

void FaissVectorStore::reset_index() {
    auto hnsw = new faiss::IndexHNSWFlat(dimension_, 32, faiss::METRIC_INNER_PRODUCT);
    hnsw->hnsw.efConstruction = 40;
    hnsw->hnsw.efSearch = 64;
    auto id_map = new faiss::IndexIDMap2(hnsw);
    id_map->own_fields = true;
    index_.reset(id_map);
}

void FaissVectorStore::rebuild_index() {
    reset_index();
    if (vectors_.empty()) return;

    std::vector<float> flat;
    std::vector<faiss::idx_t> ids;
    flat.reserve(vectors_.size() * dimension_);
    ids.reserve(vectors_.size());
    for (const auto& [id, vec] : vectors_) {
        flat.insert(flat.end(), vec.begin(), vec.end());
        ids.push_back(id);
    }
    index_->add_with_ids(static_cast<faiss::idx_t>(ids.size()), flat.data(), ids.data());
}

Status FaissVectorStore::upsert(int64_t id, const std::vector<float>& vector) {
    return upsert_many({{id, vector}});
}

Status FaissVectorStore::upsert_many(const std::vector<std::pair<int64_t, std::vector<float>>>& entries) {
    for (const auto& [id, vector] : entries) {
        if (static_cast<int>(vector.size()) != dimension_) {
            return make_error(ErrorCode::InvalidArgument,
                              "vector " + std::to_string(id) + " has " + std::to_string(vector.size()) +
                              " dims, index expects " + std::to_string(dimension_));
        }
    }
    if (entries.empty()) return Status::success();

    std::map<int64_t, std::vector<float>> normalized;
    for (const auto& [id, vector] : entries) {
        std::vector<float> v = vector;
        faiss::fvec_renorm_L2(dimension_, 1, v.data());
        normalized[id] = std::move(v);
    }

    std::lock_guard<std::mutex> lock(mutex_);
    auto previous = vectors_;
    bool replaced = false;
    for (auto& [id, v] : normalized) {
        replaced = replaced || vectors_.count(id) > 0;
        vectors_[id] = v;
    }

    try {
        if (replaced) {
            rebuild_index();
        } else {
            std::vector<float> flat;
            std::vector<faiss::idx_t> ids;
            flat.reserve(normalized.size() * dimension_);
            for (const auto& [id, v] : normalized) {
                flat.insert(flat.end(), v.begin(), v.end());
                ids.push_back(id);
            }
            index_->add_with_ids(static_cast<faiss::idx_t>(ids.size()), flat.data(), ids.data());
        }
    } catch (const faiss::FaissException& e) {
        vectors_ = std::move(previous);
        try {
            rebuild_index();
        } catch (const faiss::FaissException& inner) {
            spdlog::error("❌ Vector index rebuild failed: {}", inner.what());
        }
        return make_error(ErrorCode::StorageUnavailable, e.what());
    }
    return Status::success();
}

Status FaissVectorStore::remove(int64_t id) {
    return remove_many({id});
}

Status FaissVectorStore::remove_many(const std::vector<int64_t>& ids) {
    std::lock_guard<std::mutex> lock(mutex_);
    size_t erased = 0;
    for (auto id : ids) erased += vectors_.erase(id);
    if (erased == 0) return Status::success();
    try {
        rebuild_index();
    } catch (const faiss::FaissException& e) {
        return make_error(ErrorCode::StorageUnavailable, e.what());
    }
    return Status::success();
}

bool FaissVectorStore::contains(int64_t id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    const auto& id_map = as_id_map(index_)->id_map;
    return std::find(id_map.begin(), id_map.end(), id) != id_map.end();
}

std::vector<int64_t> FaissVectorStore::ids() const {
    std::lock_guard<std::mutex> lock(mutex_);
    const auto& id_map = as_id_map(index_)->id_map;
    return std::vector<int64_t>(id_map.begin(), id_map.end());
}

size_t FaissVectorStore::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return static_cast<size_t>(index_->ntotal);
}

std::vector<VectorHit> FaissVectorStore::search(const std::vector<float>& query_vector, int k) const {
    std::lock_guard<std::mutex> lock(mutex_);
    if (index_->ntotal == 0 || k <= 0) return {};
    if (static_cast<int>(query_vector.size()) != dimension_) {
        spdlog::warn("⚠️ Query vector has {} dims, index expects {}", query_vector.size(), dimension_);
        return {};
    }

    k = std::min<int>(k, static_cast<int>(index_->ntotal));

    std::vector<float> query_copy = query_vector;
    faiss::fvec_renorm_L2(dimension_, 1, query_copy.data());

    std::vector<float> scores(k);
    std::vector<faiss::idx_t> labels(k);

    try {
        index_->search(1, query_copy.data(), k, scores.data(), labels.data());
    } catch (const faiss::FaissException& e) {
        spdlog::error("FAISS search failed: {}", e.what());
        return {};
    }

    std::vector<VectorHit> results;
    for (int i = 0; i < k; ++i) {
        if (labels[i] == -1) continue;
        results.push_back({static_cast<int64_t>(labels[i]), 1.0f - scores[i]});
    }
    return results;
}

Status FaissVectorStore::save(const fs::path& dir) const {
    std::lock_guard<std::mutex> lock(mutex_);
    try {
        fs::create_directories(dir);
        faiss::write_index(index_.get(), (dir / kIndexFile).string().c_str());

        json meta = {
            {"dimension", dimension_},
            {"metric", "cosine"},
            {"type", "hnsw"},
            {"created", created_}
        };
        std::ofstream meta_file(dir / kMetaFile);
        meta_file << meta.dump(2);
        if (!meta_file) {
            return make_error(ErrorCode::Io, "cannot write " + (dir / kMetaFile).string());
        }
    } catch (const faiss::FaissException& e) {
        return make_error(ErrorCode::StorageUnavailable, e.what());
    } catch (const fs::filesystem_error& e) {
        return make_error(ErrorCode::Io, e.what());
    }
    return Status::success();
}

Result<bool> FaissVectorStore::load(const fs::path& dir) {
    fs::path index_path = dir / kIndexFile;
    fs::path meta_path = dir / kMetaFile;
    if (!fs::exists(index_path) || !fs::exists(meta_path)) return false;

    try {
        std::ifstream meta_file(meta_path);
        json meta = json::parse(meta_file);
        int recorded = meta.value("dimension", 0);
        if (recorded != dimension_) {
            spdlog::warn("⚠️ Vector index dimension {} does not match embedding dimension {}; starting fresh",
                         recorded, dimension_);
            return false;
        }

        std::unique_ptr<faiss::Index> loaded(faiss::read_index(index_path.string().c_str()));
        auto* id_map = dynamic_cast<faiss::IndexIDMap2*>(loaded.get());
        if (!id_map || id_map->d != dimension_) {
            spdlog::warn("⚠️ {} is not a usable id-mapped index; starting fresh", index_path.string());
            return false;
        }

        std::map<int64_t, std::vector<float>> vectors;
        std::vector<float> buf(dimension_);
        for (auto id : id_map->id_map) {
            id_map->reconstruct(id, buf.data());
            vectors[id] = buf;
        }

        std::lock_guard<std::mutex> lock(mutex_);
        index_ = std::move(loaded);
        vectors_ = std::move(vectors);
        created_ = meta.value("created", created_);
        spdlog::info("✅ Loaded vector index with {} entries from {}", index_->ntotal, dir.string());
        return true;
    } catch (const faiss::FaissException& e) {
        return make_error(ErrorCode::StorageUnavailable, e.what());
    } catch (const json::exception& e) {
        return make_error(ErrorCode::StorageUnavailable, std::string("vector metadata: ") + e.what());
    }
}

} // namespace context_engine
