#include <semnote/index_manager.hpp>

#include <algorithm>
#include <future>

namespace semnote {

IndexManager::IndexManager(store::DocumentStore& store,
                           const embedding::EmbeddingClient& embeddings,
                           Chunker chunker,
                           Logger& logger,
                           size_t max_concurrent_embeds)
    : store_(store)
    , embeddings_(embeddings)
    , chunker_(std::move(chunker))
    , logger_(logger)
    , max_concurrent_embeds_(std::max<size_t>(max_concurrent_embeds, 1)) {}

Result<ReindexReport> IndexManager::reindex_note(const NoteId& note_id,
                                                 const std::string& raw_text) {
    if (note_id.empty()) {
        return Error(ErrorCode::INVALID_ARGUMENT, "Note id cannot be empty");
    }

    ReindexReport report;
    report.note_id = note_id;

    // Clear synchronously before any embedding request is issued
    auto cleared = store_.clear_note(note_id);
    if (!cleared.ok()) {
        return cleared.error();
    }
    report.removed = cleared.value();

    std::vector<Document> docs = chunker_.chunk(raw_text);
    report.chunks = docs.size();

    for (size_t window = 0; window < docs.size(); window += max_concurrent_embeds_) {
        size_t window_end = std::min(docs.size(), window + max_concurrent_embeds_);

        std::vector<std::future<Result<Embedding>>> pending;
        pending.reserve(window_end - window);
        for (size_t i = window; i < window_end; ++i) {
            pending.push_back(embeddings_.embed(docs[i].text));
        }

        for (size_t i = window; i < window_end; ++i) {
            const Document& doc = docs[i];
            Result<Embedding> vector = pending[i - window].get();

            if (!vector.ok()) {
                logger_.warning("Embedding failed for '" + note_id + "' at offset " +
                                std::to_string(doc.start_offset) + ": " +
                                vector.error().to_string());
                report.failures.push_back({doc.start_offset, vector.error()});
                continue;
            }

            auto inserted = store_.insert_document(note_id, doc.start_offset, doc.text,
                                                   vector.value());
            if (!inserted.ok()) {
                if (inserted.error_code() != ErrorCode::DIMENSION_MISMATCH) {
                    return inserted.error();
                }
                logger_.warning("Skipping document of '" + note_id + "' at offset " +
                                std::to_string(doc.start_offset) + ": " +
                                inserted.error().to_string());
                report.failures.push_back({doc.start_offset, inserted.error()});
                continue;
            }
            report.inserted.push_back(inserted.value());
        }
    }

    if (report.failures.empty()) {
        logger_.info("Indexed '" + note_id + "': " +
                     std::to_string(report.inserted.size()) + " documents");
    } else {
        logger_.warning("Indexed '" + note_id + "': " +
                        std::to_string(report.inserted.size()) + " documents, " +
                        std::to_string(report.failures.size()) + " failed");
    }

    return report;
}

Result<ReindexReport> IndexManager::reindex_path(const NoteSource& notes, const fs::path& path) {
    if (!notes.is_note(path)) {
        return Error(ErrorCode::NOT_A_NOTE, path.string() + " is not a note");
    }

    auto note_id = notes.id_for_path(path);
    if (!note_id.ok()) {
        return note_id.error();
    }

    auto content = read_file(path);
    if (!content.ok()) {
        return content.error();
    }

    return reindex_note(note_id.value(), content.value());
}

Result<ReindexSummary> IndexManager::reindex_all(const NoteSource& notes) {
    auto ids = notes.list_notes();
    if (!ids.ok()) {
        return ids.error();
    }

    ReindexSummary summary;
    for (const auto& note_id : ids.value()) {
        auto content = notes.read_note(note_id);
        if (!content.ok()) {
            logger_.warning("Skipping '" + note_id + "': " + content.error().to_string());
            summary.failures.push_back({note_id, content.error()});
            continue;
        }

        auto report = reindex_note(note_id, content.value());
        if (!report.ok()) {
            return report.error();
        }

        summary.notes_indexed++;
        summary.documents_inserted += report->inserted.size();
        summary.document_failures += report->failures.size();
    }

    logger_.info("Reindexed " + std::to_string(summary.notes_indexed) + " notes (" +
                 std::to_string(summary.documents_inserted) + " documents)");
    return summary;
}

Result<void> IndexManager::reset_database(const ConfirmFunction& confirm, bool force) {
    if (!force) {
        bool approved = confirm && confirm("Drop every indexed document and embedding?");
        if (!approved) {
            return Error(ErrorCode::CONFIRMATION_REQUIRED,
                "Database reset was not confirmed");
        }
    }

    auto result = store_.reset();
    if (!result.ok()) {
        return result;
    }

    logger_.info("Database reset");
    return {};
}

}  // namespace semnote
