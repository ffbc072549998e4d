#pragma once

#include <semnote/embedding/embedding_client.hpp>
#include <semnote/notes.hpp>
#include <semnote/result.hpp>
#include <semnote/store/document_store.hpp>
#include <semnote/types.hpp>
#include <semnote/util/logger.hpp>

#include <map>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace semnote {

/**
 * A search hit located in its note file.
 */
struct LocatedResult {
    NoteId note_id;
    fs::path path;              // Empty when the note cannot be resolved
    int64_t start_offset = 0;   // Byte offset of the document in the note
    int line = 0;               // 1-based; 0 when the file is unreadable
    int column = 0;             // 1-based byte column
    std::string text;
    float distance = 0.0f;
};

/**
 * 1-based line and column of a byte offset in text. Offsets past the end
 * map to the end of the text.
 */
std::pair<int, int> line_column_at(const std::string& text, int64_t offset);

/**
 * QueryEngine - "find notes similar to this query".
 */
class QueryEngine {
public:
    static constexpr size_t DEFAULT_K = 20;

    /**
     * @param notes Optional; without it results carry no path or position
     */
    QueryEngine(store::DocumentStore& store,
                const embedding::EmbeddingClient& embeddings,
                const NoteSource* notes,
                Logger& logger);

    /**
     * Embed query_text and return the k most similar documents, closest
     * first. An embedding failure is returned without touching the store.
     */
    Result<std::vector<LocatedResult>> search(const std::string& query_text,
                                              size_t k = DEFAULT_K);

    /**
     * Search with an already computed query embedding.
     */
    Result<std::vector<LocatedResult>> search_vector(const Embedding& query, size_t k = DEFAULT_K);

private:
    // Resolved path and content of a note, shared by all hits of one search
    struct NoteFile {
        fs::path path;
        std::optional<std::string> content;
    };
    using NoteFileCache = std::map<NoteId, std::optional<NoteFile>>;

    LocatedResult locate(SimilarDocument doc, NoteFileCache& cache) const;
    const std::optional<NoteFile>& note_file(const NoteId& note_id, NoteFileCache& cache) const;

    store::DocumentStore& store_;
    const embedding::EmbeddingClient& embeddings_;
    const NoteSource* notes_;
    Logger& logger_;
};

}  // namespace semnote
