#include <semnote/chunker.hpp>

#include <algorithm>
#include <cctype>

namespace semnote {

namespace {

bool is_blank(const std::string& text, size_t begin, size_t end) {
    for (size_t i = begin; i < end; ++i) {
        if (!std::isspace(static_cast<unsigned char>(text[i]))) {
            return false;
        }
    }
    return true;
}

void append_span(std::vector<Document>& out, const std::string& text,
                 size_t begin, size_t end) {
    if (begin >= end || is_blank(text, begin, end)) {
        return;
    }
    Document doc;
    doc.start_offset = static_cast<int64_t>(begin);
    doc.text = text.substr(begin, end - begin);
    out.push_back(std::move(doc));
}

}  // namespace

Result<ChunkPolicy> parse_chunk_policy(const std::string& name) {
    std::string lower = name;
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    if (lower == "whole") return ChunkPolicy::WHOLE;
    if (lower == "paragraph") return ChunkPolicy::PARAGRAPH;

    return Error(ErrorCode::INVALID_ARGUMENT,
        "Unknown chunking policy: '" + name + "' (expected whole or paragraph)");
}

const char* chunk_policy_name(ChunkPolicy policy) {
    switch (policy) {
        case ChunkPolicy::WHOLE: return "whole";
        case ChunkPolicy::PARAGRAPH: return "paragraph";
    }
    return "unknown";
}

Chunker::Chunker(ChunkPolicy policy)
    : policy_(policy) {}

Chunker::Chunker(ChunkFunction custom)
    : policy_(ChunkPolicy::WHOLE)
    , custom_(std::move(custom)) {}

std::vector<Document> Chunker::chunk(const std::string& text) const {
    if (custom_) {
        return custom_(text);
    }

    switch (policy_) {
        case ChunkPolicy::WHOLE:
            return chunk_whole(text);
        case ChunkPolicy::PARAGRAPH:
            return chunk_paragraphs(text);
    }
    return {};
}

std::vector<Document> Chunker::chunk_whole(const std::string& text) {
    std::vector<Document> docs;
    append_span(docs, text, 0, text.size());
    return docs;
}

std::vector<Document> Chunker::chunk_paragraphs(const std::string& text) {
    std::vector<Document> docs;

    size_t span_start = 0;
    size_t pos = 0;

    while (pos < text.size()) {
        if (text[pos] != '\n') {
            ++pos;
            continue;
        }

        // Measure the run of consecutive newlines
        size_t run_end = pos;
        while (run_end < text.size() && text[run_end] == '\n') {
            ++run_end;
        }

        if (run_end - pos >= 2) {
            append_span(docs, text, span_start, pos);
            span_start = run_end;
        }
        pos = run_end;
    }

    // Final span extends to end-of-text
    append_span(docs, text, span_start, text.size());
    return docs;
}

}  // namespace semnote
