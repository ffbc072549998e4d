#pragma once

#include <semnote/chunker.hpp>
#include <semnote/embedding/embedder.hpp>
#include <semnote/result.hpp>
#include <semnote/store/document_store.hpp>
#include <semnote/store/vector_index.hpp>

#include <filesystem>
#include <string>
#include <vector>

namespace semnote {

namespace fs = std::filesystem;

/**
 * Configuration for the indexer, query engine and store.
 */
struct Config {
    fs::path database_path;
    fs::path notes_directory;
    std::vector<std::string> note_extensions = {".md", ".txt"};

    // Embedding dimension D. Changing it invalidates every stored embedding.
    int dimension = 768;

    ChunkPolicy chunking = ChunkPolicy::PARAGRAPH;
    embedding::EmbedderSettings embedder;

    // Upper bound on outstanding embedding requests during a reindex
    size_t max_concurrent_embeds = 4;

    store::VectorIndexConfig index;
    bool rebuild_on_dimension_change = false;
    bool verbose = false;
};

/**
 * Defaults: ~/.semnote/index.db and ~/notes (or relative paths when HOME
 * is unset).
 */
Config default_config();

/**
 * Apply SEMNOTE_DB, SEMNOTE_NOTES_DIR, SEMNOTE_DIMENSION, SEMNOTE_CHUNKING,
 * SEMNOTE_OLLAMA_URL and SEMNOTE_EMBED_MODEL.
 *
 * @return INVALID_ARGUMENT for malformed values; config is left unchanged
 */
Result<void> apply_env_overrides(Config& config);

/**
 * Check values that would otherwise fail deep inside a component.
 */
Result<void> validate(const Config& config);

store::StoreOptions make_store_options(const Config& config);

}  // namespace semnote
