#pragma once

#include <semnote/embedding/embedder.hpp>
#include <semnote/result.hpp>
#include <semnote/types.hpp>

#include <future>
#include <string>

namespace semnote::embedding {

/**
 * EmbeddingClient - asynchronous "text -> vector" adapter over an Embedder.
 *
 * Each embed() call runs the provider on its own task and returns a future
 * holding either a vector of exactly dimension() floats or an embedding
 * error that keeps the provider's failure as its cause. Vectors of the wrong
 * length are rejected, never truncated or padded. No retries are performed.
 */
class EmbeddingClient {
public:
    EmbeddingClient(EmbedderPtr embedder, int dimension);

    std::future<Result<Embedding>> embed(std::string text) const;

    /**
     * Blocking convenience wrapper around embed().
     */
    Result<Embedding> embed_now(const std::string& text) const;

    int dimension() const { return dimension_; }
    const EmbedderPtr& embedder() const { return embedder_; }

private:
    static Result<Embedding> run(const EmbedderPtr& embedder, int dimension,
                                 const std::string& text);

    EmbedderPtr embedder_;
    int dimension_;
};

}  // namespace semnote::embedding
