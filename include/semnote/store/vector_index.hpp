#pragma once

#include <semnote/result.hpp>
#include <semnote/types.hpp>

#include <cstddef>
#include <memory>
#include <vector>

namespace semnote::store {

// ============================================================================
// Vector Search Result
// ============================================================================

struct VectorHit {
    DocId doc_id = INVALID_DOC_ID;
    float distance = 0.0f;      // 1 - cosine similarity, in [0, 2]

    // Closest first, ties by ascending doc_id
    bool operator<(const VectorHit& other) const {
        if (distance != other.distance) {
            return distance < other.distance;
        }
        return doc_id < other.doc_id;
    }
};

// ============================================================================
// Vector Index Configuration
// ============================================================================

struct VectorIndexConfig {
    // Embedding dimension (must match the embedder)
    int dimension = 768;

    // HNSW parameters
    size_t initial_capacity = 1024;     // Grows by doubling
    size_t M = 16;                      // Max connections per node
    size_t ef_construction = 200;       // Construction-time search width
    size_t ef_search = 64;              // Query-time search width

    // Indexes holding at most this many live vectors are searched exactly
    size_t exact_search_threshold = 2048;
};

// ============================================================================
// Vector Index
// ============================================================================

/**
 * VectorIndex - in-memory nearest neighbor search over cosine distance.
 *
 * Uses hnswlib's HNSW graph in inner product space; vectors are normalized
 * on insert, so distance = 1 - cosine similarity. Small indexes are scanned
 * exactly, larger ones use approximate HNSW search. Removed labels are
 * marked deleted and their slots reused by later inserts.
 *
 * Not thread-safe; the owning DocumentStore serializes access.
 */
class VectorIndex {
public:
    explicit VectorIndex(VectorIndexConfig config = {});
    ~VectorIndex();

    VectorIndex(const VectorIndex&) = delete;
    VectorIndex& operator=(const VectorIndex&) = delete;
    VectorIndex(VectorIndex&& other) noexcept;
    VectorIndex& operator=(VectorIndex&& other) noexcept;

    /**
     * Create an empty index. Must be called before use; calling it again
     * drops every vector.
     */
    Result<void> initialize();

    bool is_initialized() const { return impl_ != nullptr; }

    /**
     * Add a vector under doc_id.
     */
    Result<void> add(DocId doc_id, const Embedding& embedding);

    /**
     * Remove the vector stored under doc_id.
     */
    Result<void> remove(DocId doc_id);

    bool contains(DocId doc_id) const;

    /**
     * Find the k nearest vectors, closest first, ties by ascending doc_id.
     */
    Result<std::vector<VectorHit>> search(const Embedding& query, size_t k) const;

    /**
     * Number of live vectors.
     */
    size_t size() const;

    size_t capacity() const;
    int dimension() const { return config_.dimension; }
    const VectorIndexConfig& config() const { return config_; }

private:
    struct Impl;

    Result<void> ensure_capacity();
    std::vector<VectorHit> search_exact(const float* query, size_t k) const;
    std::vector<VectorHit> search_approximate(const float* query, size_t k) const;

    VectorIndexConfig config_;
    std::unique_ptr<Impl> impl_;
};

}  // namespace semnote::store
