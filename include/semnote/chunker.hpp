#pragma once

#include <semnote/result.hpp>
#include <semnote/types.hpp>

#include <functional>
#include <string>
#include <vector>

namespace semnote {

enum class ChunkPolicy {
    WHOLE,          // One document spanning the entire note
    PARAGRAPH       // One document per paragraph (split on blank lines)
};

// Custom chunking policy: note text -> ordered documents
using ChunkFunction = std::function<std::vector<Document>(const std::string&)>;

/**
 * Parse "whole" or "paragraph" (case-insensitive).
 */
Result<ChunkPolicy> parse_chunk_policy(const std::string& name);

const char* chunk_policy_name(ChunkPolicy policy);

/**
 * Chunker - splits a note's text into ordered (start_offset, text) documents.
 *
 * Chunking is a pure function of the input text. Empty and whitespace-only
 * spans are dropped, so an empty note produces no documents.
 */
class Chunker {
public:
    explicit Chunker(ChunkPolicy policy = ChunkPolicy::PARAGRAPH);
    explicit Chunker(ChunkFunction custom);

    std::vector<Document> chunk(const std::string& text) const;

    bool is_custom() const { return static_cast<bool>(custom_); }
    ChunkPolicy policy() const { return policy_; }

    // Built-in policies
    static std::vector<Document> chunk_whole(const std::string& text);
    static std::vector<Document> chunk_paragraphs(const std::string& text);

private:
    ChunkPolicy policy_;
    ChunkFunction custom_;
};

}  // namespace semnote
