#pragma once

#include <cstdint>
#include <string>
#include <vector>

namespace semnote {

// Stable identifier of a note, owned by the note-management layer
using NoteId = std::string;

// Document identifier - primary key of a document record and key of its
// embedding entry
using DocId = int64_t;
constexpr DocId INVALID_DOC_ID = 0;

// Fixed-length embedding vector
using Embedding = std::vector<float>;

/**
 * A contiguous span of a note's text, produced by the chunker.
 */
struct Document {
    int64_t start_offset = 0;   // Byte offset of the span within the note
    std::string text;           // Literal content of the span

    bool operator==(const Document& other) const {
        return start_offset == other.start_offset && text == other.text;
    }
};

/**
 * A persisted document.
 */
struct DocumentRecord {
    DocId doc_id = INVALID_DOC_ID;
    NoteId note_id;
    int64_t start_offset = 0;
    std::string text;
};

/**
 * One row of a similarity query, closest first.
 */
struct SimilarDocument {
    DocId doc_id = INVALID_DOC_ID;
    NoteId note_id;
    int64_t start_offset = 0;
    std::string text;
    float distance = 0.0f;      // Cosine distance (1 - cosine similarity)
};

}  // namespace semnote
