#include <semnote/embedding/embedding_client.hpp>

#include <exception>

namespace semnote::embedding {

EmbeddingClient::EmbeddingClient(EmbedderPtr embedder, int dimension)
    : embedder_(std::move(embedder))
    , dimension_(dimension) {}

std::future<Result<Embedding>> EmbeddingClient::embed(std::string text) const {
    EmbedderPtr embedder = embedder_;
    int dimension = dimension_;
    return std::async(std::launch::async,
        [embedder, dimension, text = std::move(text)]() {
            return run(embedder, dimension, text);
        });
}

Result<Embedding> EmbeddingClient::embed_now(const std::string& text) const {
    return embed(text).get();
}

Result<Embedding> EmbeddingClient::run(const EmbedderPtr& embedder, int dimension,
                                       const std::string& text) {
    if (!embedder) {
        return Error(ErrorCode::PROVIDER_UNAVAILABLE, "No embedding provider configured");
    }

    Result<Embedding> result = Error(ErrorCode::INTERNAL_ERROR);
    try {
        result = embedder->embed(text);
    } catch (const std::exception& e) {
        return Error(ErrorCode::EMBEDDING_FAILED,
            std::string("Embedding provider threw: ") + e.what());
    }

    if (!result.ok()) {
        const Error& cause = result.error();
        if (cause.is_embedding_error()) {
            return cause;
        }
        return Error(ErrorCode::EMBEDDING_FAILED, "Embedding provider failed", cause);
    }

    if (static_cast<int>(result->size()) != dimension) {
        return Error(ErrorCode::EMBEDDING_DIMENSION_MISMATCH,
            "Embedding dimension mismatch: expected " + std::to_string(dimension) +
            ", got " + std::to_string(result->size()));
    }

    return result;
}

}  // namespace semnote::embedding
