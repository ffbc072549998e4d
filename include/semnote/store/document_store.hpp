#pragma once

#include <semnote/result.hpp>
#include <semnote/store/database.hpp>
#include <semnote/store/vector_index.hpp>
#include <semnote/types.hpp>
#include <semnote/util/logger.hpp>

#include <memory>
#include <string>
#include <vector>

namespace semnote::store {

/**
 * Options for opening a DocumentStore.
 */
struct StoreOptions {
    std::string database_path;          // SQLite file, or ":memory:"
    VectorIndexConfig index;            // index.dimension is the store's D

    // Reset a non-empty store whose recorded dimension differs from
    // index.dimension instead of refusing to open it
    bool rebuild_on_dimension_change = false;
};

/**
 * DocumentStore - the single source of truth for document records and their
 * embedding entries.
 *
 * Document records live in the `documents` table, embedding entries in the
 * `embeddings` table keyed by the same doc_id. Every mutation of both tables
 * happens inside one SQLite transaction, so a reader never sees a document
 * without its embedding or an embedding without its document. The in-memory
 * VectorIndex mirrors `embeddings`; it is brought in line right after each
 * commit and rebuilt from the table whenever that fails. A failed rebuild
 * never fails the committed mutation: the index is marked stale and the
 * next top_k_similar rebuilds it first.
 *
 * Distance metric: cosine distance (1 - cosine similarity).
 *
 * Not thread-safe: one store handle owns one connection, and all calls must
 * come from the same thread.
 */
class DocumentStore {
public:
    /**
     * Open or create a store.
     *
     * Fails with DIMENSION_MISMATCH if the database holds embeddings of a
     * different dimension (unless rebuild_on_dimension_change is set).
     */
    static Result<std::unique_ptr<DocumentStore>> open(const StoreOptions& options,
                                                       Logger* logger = nullptr);

    ~DocumentStore();

    DocumentStore(const DocumentStore&) = delete;
    DocumentStore& operator=(const DocumentStore&) = delete;

    /**
     * Close the connection and drop the in-memory index.
     */
    void close();

    bool is_open() const { return db_ != nullptr && db_->is_open(); }

    // ========================================================================
    // Mutations
    // ========================================================================

    /**
     * Delete every document of a note together with its embeddings.
     * Clearing a note without documents is a no-op.
     *
     * @return Number of documents removed, once committed
     */
    Result<size_t> clear_note(const NoteId& note_id);

    /**
     * Insert one document and its embedding.
     *
     * @return The new doc_id; DIMENSION_MISMATCH (nothing written) if
     *         vector.size() differs from dimension()
     */
    Result<DocId> insert_document(const NoteId& note_id,
                                  int64_t start_offset,
                                  const std::string& text,
                                  const Embedding& vector);

    /**
     * Drop all documents and embeddings and recreate the empty schema.
     * Callers are responsible for confirming this.
     */
    Result<void> reset();

    // ========================================================================
    // Queries
    // ========================================================================

    /**
     * The k documents nearest to query_vector, closest first, ties broken
     * by ascending doc_id. Returns fewer than k results when the store holds
     * fewer embeddings.
     */
    Result<std::vector<SimilarDocument>> top_k_similar(const Embedding& query_vector,
                                                       size_t k);

    Result<std::vector<DocumentRecord>> documents_for_note(const NoteId& note_id);
    Result<std::vector<NoteId>> list_note_ids();
    Result<size_t> count_documents();
    Result<size_t> count_embeddings();

    int dimension() const { return options_.index.dimension; }
    const StoreOptions& options() const { return options_; }
    const VectorIndex& vector_index() const { return index_; }

private:
    DocumentStore(StoreOptions options, Logger* logger);

    Result<void> ensure_schema();
    Result<void> check_dimension();
    Result<void> rebuild_index();
    void resync_index();
    Result<size_t> count_rows(const char* sql);
    Result<void> require_open() const;

    StoreOptions options_;
    Logger* logger_;
    NullLogger null_logger_;
    std::unique_ptr<Database> db_;
    VectorIndex index_;
    bool index_stale_ = false;
};

}  // namespace semnote::store
