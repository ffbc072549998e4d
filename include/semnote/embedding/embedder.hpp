#pragma once

#include <semnote/result.hpp>
#include <semnote/types.hpp>

#include <memory>
#include <string>

namespace semnote::embedding {

// ============================================================================
// Embedder Settings
// ============================================================================

struct EmbedderSettings {
    // Provider type: "ollama"
    std::string type = "ollama";

    // Ollama server
    std::string base_url = "http://localhost:11434";
    std::string model = "nomic-embed-text";
    int timeout_ms = 30000;

    // Probe the provider once on creation
    bool probe_on_create = true;
};

// ============================================================================
// Embedder Interface
// ============================================================================

/**
 * Abstract base class for text embedding providers.
 *
 * embed() may be called concurrently from several threads; implementations
 * must not share per-request state.
 *
 * Implementations:
 * - OllamaEmbedder: Uses Ollama's /api/embeddings endpoint
 */
class Embedder {
public:
    virtual ~Embedder() = default;

    /**
     * Get the embedding dimension reported by the provider (0 if unknown).
     */
    virtual int dimension() const = 0;

    /**
     * Get the model name/identifier.
     */
    virtual std::string model_name() const = 0;

    /**
     * Check if the embedder is ready.
     */
    virtual bool is_available() const = 0;

    /**
     * Embed a single text.
     *
     * @param text The text to embed
     * @return Embedding vector or error
     */
    virtual Result<Embedding> embed(const std::string& text) = 0;

    /**
     * Normalize an embedding to unit length.
     */
    static void normalize(Embedding& embedding);
};

using EmbedderPtr = std::shared_ptr<Embedder>;

// ============================================================================
// Ollama Embedder
// ============================================================================

/**
 * OllamaEmbedder - Uses Ollama's embedding API.
 *
 * Requires Ollama to be running with an embedding model pulled. Each request
 * uses its own curl handle.
 */
class OllamaEmbedder : public Embedder {
public:
    explicit OllamaEmbedder(EmbedderSettings settings);

    OllamaEmbedder(const OllamaEmbedder&) = delete;
    OllamaEmbedder& operator=(const OllamaEmbedder&) = delete;

    int dimension() const override { return dimension_; }
    std::string model_name() const override { return settings_.model; }
    bool is_available() const override { return initialized_; }

    Result<Embedding> embed(const std::string& text) override;

    /**
     * Create and probe the server for the model's dimension.
     */
    static Result<EmbedderPtr> create(EmbedderSettings settings);

    /**
     * Parse an /api/embeddings response body.
     */
    static Result<Embedding> parse_response(const std::string& body);

private:
    Result<void> initialize();

    EmbedderSettings settings_;
    int dimension_ = 0;
    bool initialized_ = false;
};

// ============================================================================
// Embedder Factory
// ============================================================================

class EmbedderFactory {
public:
    /**
     * Create embedder by settings.type.
     */
    static Result<EmbedderPtr> create(const EmbedderSettings& settings);
};

}  // namespace semnote::embedding
