#pragma once

#include <semnote/chunker.hpp>
#include <semnote/embedding/embedding_client.hpp>
#include <semnote/notes.hpp>
#include <semnote/result.hpp>
#include <semnote/store/document_store.hpp>
#include <semnote/types.hpp>
#include <semnote/util/logger.hpp>

#include <functional>
#include <string>
#include <vector>

namespace semnote {

/**
 * A document of a note that could not be embedded or stored.
 */
struct DocumentFailure {
    int64_t start_offset = 0;
    Error error;
};

/**
 * Outcome of reindexing one note.
 */
struct ReindexReport {
    NoteId note_id;
    size_t removed = 0;                 // Documents cleared before inserting
    size_t chunks = 0;                  // Documents produced by the chunker
    std::vector<DocId> inserted;
    std::vector<DocumentFailure> failures;

    bool ok() const { return failures.empty(); }
};

struct NoteFailure {
    NoteId note_id;
    Error error;
};

/**
 * Outcome of reindexing every note.
 */
struct ReindexSummary {
    size_t notes_indexed = 0;
    size_t documents_inserted = 0;
    size_t document_failures = 0;
    std::vector<NoteFailure> failures;  // Notes that could not be read

    bool ok() const { return failures.empty() && document_failures == 0; }
};

// Asked before destructive operations; returns true to proceed
using ConfirmFunction = std::function<bool(const std::string& prompt)>;

/**
 * IndexManager - keeps the document store in line with note content.
 *
 * Reindexing a note clears its documents, chunks the new text and embeds
 * every chunk; each embedded chunk is inserted on its own. A chunk whose
 * embedding fails is reported in the ReindexReport and skipped, while
 * chunks already inserted stay. Store failures abort the call.
 */
class IndexManager {
public:
    IndexManager(store::DocumentStore& store,
                 const embedding::EmbeddingClient& embeddings,
                 Chunker chunker,
                 Logger& logger,
                 size_t max_concurrent_embeds = 4);

    /**
     * Replace every document of note_id with the chunks of raw_text.
     */
    Result<ReindexReport> reindex_note(const NoteId& note_id, const std::string& raw_text);

    /**
     * Validate a note file, read it and reindex it.
     *
     * @return NOT_A_NOTE if notes.is_note(path) is false
     */
    Result<ReindexReport> reindex_path(const NoteSource& notes, const fs::path& path);

    /**
     * Reindex every note the source enumerates, one note at a time.
     */
    Result<ReindexSummary> reindex_all(const NoteSource& notes);

    /**
     * Drop the whole index. Runs only when force is set or confirm approves.
     *
     * @return CONFIRMATION_REQUIRED (nothing dropped) otherwise
     */
    Result<void> reset_database(const ConfirmFunction& confirm, bool force = false);

    const Chunker& chunker() const { return chunker_; }

private:
    store::DocumentStore& store_;
    const embedding::EmbeddingClient& embeddings_;
    Chunker chunker_;
    Logger& logger_;
    size_t max_concurrent_embeds_;
};

}  // namespace semnote
