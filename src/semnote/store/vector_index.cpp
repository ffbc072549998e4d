#include <semnote/store/vector_index.hpp>
#include <semnote/embedding/embedder.hpp>

#include <hnswlib/hnswlib.h>

#include <algorithm>
#include <exception>

namespace semnote::store {

struct VectorIndex::Impl {
    explicit Impl(const VectorIndexConfig& config)
        : space(static_cast<size_t>(config.dimension))
        , hnsw(&space, config.initial_capacity, config.M, config.ef_construction,
               /* random_seed */ 42, /* allow_replace_deleted */ true) {
        hnsw.setEf(config.ef_search);
    }

    hnswlib::InnerProductSpace space;
    hnswlib::HierarchicalNSW<float> hnsw;
};

// ============================================================================
// VectorIndex Implementation
// ============================================================================

VectorIndex::VectorIndex(VectorIndexConfig config)
    : config_(std::move(config)) {}

VectorIndex::~VectorIndex() = default;

VectorIndex::VectorIndex(VectorIndex&& other) noexcept = default;

VectorIndex& VectorIndex::operator=(VectorIndex&& other) noexcept = default;

Result<void> VectorIndex::initialize() {
    if (config_.dimension <= 0) {
        return Error(ErrorCode::INVALID_ARGUMENT, "Invalid dimension");
    }
    if (config_.initial_capacity == 0) {
        config_.initial_capacity = 1;
    }

    try {
        impl_.reset();
        impl_ = std::make_unique<Impl>(config_);
        return {};
    } catch (const std::exception& e) {
        return Error(ErrorCode::INTERNAL_ERROR,
            std::string("Failed to initialize HNSW index: ") + e.what());
    }
}

Result<void> VectorIndex::ensure_capacity() {
    auto& hnsw = impl_->hnsw;
    if (hnsw.getCurrentElementCount() < hnsw.getMaxElements() || hnsw.getDeletedCount() > 0) {
        return {};
    }

    try {
        hnsw.resizeIndex(std::max<size_t>(hnsw.getMaxElements() * 2, 1));
        return {};
    } catch (const std::exception& e) {
        return Error(ErrorCode::INTERNAL_ERROR,
            std::string("Failed to resize index: ") + e.what());
    }
}

Result<void> VectorIndex::add(DocId doc_id, const Embedding& embedding) {
    if (!impl_) {
        return Error(ErrorCode::INTERNAL_ERROR, "Index not initialized");
    }

    if (static_cast<int>(embedding.size()) != config_.dimension) {
        return Error(ErrorCode::DIMENSION_MISMATCH,
            "Embedding dimension mismatch: expected " +
            std::to_string(config_.dimension) + ", got " +
            std::to_string(embedding.size()));
    }

    auto capacity = ensure_capacity();
    if (!capacity.ok()) {
        return capacity;
    }

    try {
        Embedding normalized = embedding;
        embedding::Embedder::normalize(normalized);
        impl_->hnsw.addPoint(normalized.data(), static_cast<hnswlib::labeltype>(doc_id),
                             /* replace_deleted */ true);
        return {};
    } catch (const std::exception& e) {
        return Error(ErrorCode::INTERNAL_ERROR,
            std::string("Failed to add vector: ") + e.what());
    }
}

Result<void> VectorIndex::remove(DocId doc_id) {
    if (!impl_) {
        return Error(ErrorCode::INTERNAL_ERROR, "Index not initialized");
    }

    if (!contains(doc_id)) {
        return Error(ErrorCode::NOT_FOUND,
            "Vector " + std::to_string(doc_id) + " not in index");
    }

    try {
        impl_->hnsw.markDelete(static_cast<hnswlib::labeltype>(doc_id));
        return {};
    } catch (const std::exception& e) {
        return Error(ErrorCode::INTERNAL_ERROR,
            std::string("Failed to remove vector: ") + e.what());
    }
}

bool VectorIndex::contains(DocId doc_id) const {
    if (!impl_) {
        return false;
    }

    const auto& hnsw = impl_->hnsw;
    auto it = hnsw.label_lookup_.find(static_cast<hnswlib::labeltype>(doc_id));
    return it != hnsw.label_lookup_.end() && !hnsw.isMarkedDeleted(it->second);
}

size_t VectorIndex::size() const {
    if (!impl_) {
        return 0;
    }
    return impl_->hnsw.getCurrentElementCount() - impl_->hnsw.getDeletedCount();
}

size_t VectorIndex::capacity() const {
    return impl_ ? impl_->hnsw.getMaxElements() : 0;
}

Result<std::vector<VectorHit>> VectorIndex::search(const Embedding& query, size_t k) const {
    if (!impl_) {
        return Error(ErrorCode::INTERNAL_ERROR, "Index not initialized");
    }

    if (static_cast<int>(query.size()) != config_.dimension) {
        return Error(ErrorCode::DIMENSION_MISMATCH,
            "Query dimension mismatch: expected " + std::to_string(config_.dimension) +
            ", got " + std::to_string(query.size()));
    }

    size_t live = size();
    k = std::min(k, live);
    if (k == 0) {
        return std::vector<VectorHit>{};
    }

    // Local buffer keeps the caller's query untouched
    Embedding normalized_query = query;
    embedding::Embedder::normalize(normalized_query);

    try {
        if (live <= config_.exact_search_threshold) {
            return search_exact(normalized_query.data(), k);
        }
        return search_approximate(normalized_query.data(), k);
    } catch (const std::exception& e) {
        return Error(ErrorCode::INTERNAL_ERROR,
            std::string("Search failed: ") + e.what());
    }
}

std::vector<VectorHit> VectorIndex::search_exact(const float* query, size_t k) const {
    const auto& hnsw = impl_->hnsw;

    std::vector<VectorHit> hits;
    hits.reserve(hnsw.label_lookup_.size());

    for (const auto& entry : hnsw.label_lookup_) {
        if (hnsw.isMarkedDeleted(entry.second)) {
            continue;
        }
        VectorHit hit;
        hit.doc_id = static_cast<DocId>(entry.first);
        hit.distance = hnsw.fstdistfunc_(query, hnsw.getDataByInternalId(entry.second),
                                         hnsw.dist_func_param_);
        hits.push_back(hit);
    }

    k = std::min(k, hits.size());
    std::partial_sort(hits.begin(), hits.begin() + static_cast<std::ptrdiff_t>(k), hits.end());
    hits.resize(k);
    return hits;
}

std::vector<VectorHit> VectorIndex::search_approximate(const float* query, size_t k) const {
    auto& hnsw = impl_->hnsw;
    hnsw.setEf(std::max(config_.ef_search, k));

    auto result = hnsw.searchKnn(query, k);

    std::vector<VectorHit> hits;
    hits.reserve(result.size());
    while (!result.empty()) {
        VectorHit hit;
        hit.distance = result.top().first;
        hit.doc_id = static_cast<DocId>(result.top().second);
        result.pop();
        hits.push_back(hit);
    }

    std::sort(hits.begin(), hits.end());
    return hits;
}

}  // namespace semnote::store
