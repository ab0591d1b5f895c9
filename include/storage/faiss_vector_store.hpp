#pragma once

#include <cstdint>
#include <filesystem>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <utility>
#include <vector>
#include "result.hpp"

// Forward declare FAISS index types
namespace faiss { struct Index; }

namespace context_engine {

struct VectorHit {
    int64_t id;
    float distance;   // 1 - cosine similarity
};

// HNSW index over L2-normalised vectors keyed by caller-chosen ids.
// Inner product on unit vectors is cosine similarity.
class FaissVectorStore {
public:
    static constexpr const char* kIndexFile = "vectors.faiss";
    static constexpr const char* kMetaFile = "vectors.meta.json";

    explicit FaissVectorStore(int dimension);
    ~FaissVectorStore(); // Destructor must be defined in .cpp

    int dimension() const { return dimension_; }

    // Replaces the vector when the id is already indexed, inserts otherwise.
    Status upsert(int64_t id, const std::vector<float>& vector);
    // All-or-nothing; replacing any number of ids costs one rebuild.
    Status upsert_many(const std::vector<std::pair<int64_t, std::vector<float>>>& entries);
    Status remove(int64_t id);
    Status remove_many(const std::vector<int64_t>& ids);

    bool contains(int64_t id) const;
    std::vector<int64_t> ids() const;
    size_t size() const;

    std::vector<VectorHit> search(const std::vector<float>& query_vector, int k) const;

    Status save(const std::filesystem::path& dir) const;

    // Ok(true) when an index with matching dimension was loaded, Ok(false)
    // when nothing usable was on disk.
    Result<bool> load(const std::filesystem::path& dir);

private:
    void reset_index();
    void rebuild_index();

    int dimension_;
    int64_t created_;
    std::unique_ptr<faiss::Index> index_;

    // HNSW cannot delete, so the normalised vectors are kept for rebuilds.
    std::map<int64_t, std::vector<float>> vectors_;
    mutable std::mutex mutex_;
};

} // namespace context_engine
