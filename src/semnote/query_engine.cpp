#include <semnote/query_engine.hpp>

#include <algorithm>
#include <cctype>

namespace semnote {

std::pair<int, int> line_column_at(const std::string& text, int64_t offset) {
    size_t end = std::min(static_cast<size_t>(std::max<int64_t>(offset, 0)), text.size());

    int line = 1;
    size_t line_start = 0;
    for (size_t i = 0; i < end; ++i) {
        if (text[i] == '\n') {
            ++line;
            line_start = i + 1;
        }
    }
    return {line, static_cast<int>(end - line_start) + 1};
}

QueryEngine::QueryEngine(store::DocumentStore& store,
                         const embedding::EmbeddingClient& embeddings,
                         const NoteSource* notes,
                         Logger& logger)
    : store_(store)
    , embeddings_(embeddings)
    , notes_(notes)
    , logger_(logger) {}

Result<std::vector<LocatedResult>> QueryEngine::search(const std::string& query_text, size_t k) {
    bool blank = std::all_of(query_text.begin(), query_text.end(),
                             [](unsigned char c) { return std::isspace(c); });
    if (blank) {
        return Error(ErrorCode::INVALID_ARGUMENT, "Search query cannot be empty");
    }

    auto query = embeddings_.embed(query_text).get();
    if (!query.ok()) {
        return query.error();
    }

    return search_vector(query.value(), k);
}

Result<std::vector<LocatedResult>> QueryEngine::search_vector(const Embedding& query, size_t k) {
    auto similar = store_.top_k_similar(query, k);
    if (!similar.ok()) {
        return similar.error();
    }

    NoteFileCache cache;
    std::vector<LocatedResult> results;
    results.reserve(similar->size());
    for (auto& doc : similar.value()) {
        results.push_back(locate(std::move(doc), cache));
    }

    logger_.debug("Search returned " + std::to_string(results.size()) + " results");
    return results;
}

const std::optional<QueryEngine::NoteFile>& QueryEngine::note_file(
        const NoteId& note_id, NoteFileCache& cache) const {
    auto it = cache.find(note_id);
    if (it != cache.end()) {
        return it->second;
    }

    std::optional<NoteFile> file;
    auto path = notes_->path_for_id(note_id);
    if (path.ok()) {
        file = NoteFile{path.value(), std::nullopt};
        auto content = read_file(file->path);
        if (content.ok()) {
            file->content = std::move(content.value());
        }
    } else {
        logger_.debug("Cannot locate '" + note_id + "': " + path.error().to_string());
    }
    return cache.emplace(note_id, std::move(file)).first->second;
}

LocatedResult QueryEngine::locate(SimilarDocument doc, NoteFileCache& cache) const {
    LocatedResult result;
    result.note_id = std::move(doc.note_id);
    result.start_offset = doc.start_offset;
    result.text = std::move(doc.text);
    result.distance = doc.distance;

    if (!notes_) {
        return result;
    }

    const auto& file = note_file(result.note_id, cache);
    if (!file) {
        return result;
    }
    result.path = file->path;

    if (file->content) {
        auto position = line_column_at(*file->content, result.start_offset);
        result.line = position.first;
        result.column = position.second;
    }
    return result;
}

}  // namespace semnote
