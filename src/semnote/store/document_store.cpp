#include <semnote/store/document_store.hpp>

#include <algorithm>
#include <filesystem>
#include <optional>

namespace semnote::store {

namespace fs = std::filesystem;

namespace {

constexpr const char* METRIC_NAME = "cosine";

constexpr const char* SCHEMA_SQL = R"SQL(
    CREATE TABLE IF NOT EXISTS documents (
        doc_id INTEGER PRIMARY KEY AUTOINCREMENT,
        note_id TEXT NOT NULL,
        start_offset INTEGER NOT NULL,
        content TEXT NOT NULL
    );

    CREATE INDEX IF NOT EXISTS idx_documents_note_id ON documents(note_id);

    CREATE TABLE IF NOT EXISTS embeddings (
        doc_id INTEGER PRIMARY KEY
            REFERENCES documents(doc_id) ON DELETE CASCADE,
        vector BLOB NOT NULL
    );

    CREATE TABLE IF NOT EXISTS store_meta (
        key TEXT PRIMARY KEY,
        value TEXT NOT NULL
    );
)SQL";

constexpr const char* DROP_SQL = R"SQL(
    DROP TABLE IF EXISTS embeddings;
    DROP TABLE IF EXISTS documents;
    DROP TABLE IF EXISTS store_meta;
)SQL";

Error store_error(const std::string& context, const Error& cause) {
    if (cause.is_store_error()) {
        return Error(cause.code(), context + ": " + cause.message());
    }
    return Error(ErrorCode::TRANSACTION_ABORTED, context, cause);
}

Result<void> write_meta(Database& db, const std::string& key, const std::string& value) {
    auto stmt = db.prepare("INSERT OR REPLACE INTO store_meta (key, value) VALUES (?, ?)");
    if (!stmt.ok()) return stmt.error();

    auto b1 = stmt->bind_text(1, key);
    if (!b1.ok()) return b1;
    auto b2 = stmt->bind_text(2, value);
    if (!b2.ok()) return b2;
    return stmt->execute();
}

}  // namespace

// ============================================================================
// Lifecycle
// ============================================================================

DocumentStore::DocumentStore(StoreOptions options, Logger* logger)
    : options_(std::move(options))
    , logger_(logger ? logger : &null_logger_)
    , index_(options_.index) {}

DocumentStore::~DocumentStore() {
    close();
}

Result<std::unique_ptr<DocumentStore>> DocumentStore::open(const StoreOptions& options,
                                                           Logger* logger) {
    if (options.database_path.empty()) {
        return Error(ErrorCode::INVALID_ARGUMENT, "Database path is required");
    }
    if (options.index.dimension <= 0) {
        return Error(ErrorCode::INVALID_ARGUMENT,
            "Embedding dimension must be positive, got " +
            std::to_string(options.index.dimension));
    }

    auto store = std::unique_ptr<DocumentStore>(new DocumentStore(options, logger));

    if (options.database_path != ":memory:") {
        fs::path parent = fs::path(options.database_path).parent_path();
        if (!parent.empty()) {
            std::error_code ec;
            fs::create_directories(parent, ec);
            if (ec) {
                return Error(ErrorCode::IO_ERROR,
                    "Failed to create database directory: " + ec.message());
            }
        }
    }

    auto db = Database::open(options.database_path);
    if (!db.ok()) {
        return db.error();
    }
    store->db_ = std::move(db.value());

    auto schema = store->ensure_schema();
    if (!schema.ok()) {
        return schema.error();
    }

    auto dimension = store->check_dimension();
    if (!dimension.ok()) {
        return dimension.error();
    }

    auto index = store->rebuild_index();
    if (!index.ok()) {
        return index.error();
    }

    store->logger_->debug("Opened document store at " + options.database_path +
                          " (dimension " + std::to_string(options.index.dimension) + ")");
    return std::move(store);
}

void DocumentStore::close() {
    if (db_) {
        db_->close();
        db_.reset();
    }
    index_ = VectorIndex(options_.index);
}

Result<void> DocumentStore::require_open() const {
    if (!is_open()) {
        return Error(ErrorCode::STORE_NOT_OPEN, "Document store is not open");
    }
    return {};
}

Result<void> DocumentStore::ensure_schema() {
    auto result = db_->exec(SCHEMA_SQL);
    if (!result.ok()) {
        return Error(ErrorCode::SCHEMA_ERROR, "Failed to create schema", result.error());
    }
    return {};
}

Result<void> DocumentStore::check_dimension() {
    std::optional<std::string> recorded;
    {
        auto stmt = db_->prepare("SELECT value FROM store_meta WHERE key = 'dimension'");
        if (!stmt.ok()) return stmt.error();

        auto row = stmt->step();
        if (!row.ok()) return row.error();
        if (row.value()) {
            recorded = stmt->column_text(0);
        }
    }

    const std::string configured = std::to_string(options_.index.dimension);

    if (!recorded) {
        auto dim = write_meta(*db_, "dimension", configured);
        if (!dim.ok()) return dim;
        return write_meta(*db_, "metric", METRIC_NAME);
    }

    if (*recorded == configured) {
        return {};
    }

    auto embeddings = count_embeddings();
    if (!embeddings.ok()) return embeddings.error();

    if (embeddings.value() == 0) {
        logger_->info("Recording new embedding dimension " + configured +
                      " (was " + *recorded + ")");
        return write_meta(*db_, "dimension", configured);
    }

    if (options_.rebuild_on_dimension_change) {
        logger_->warning("Embedding dimension changed from " + *recorded + " to " +
                         configured + "; dropping " +
                         std::to_string(embeddings.value()) + " stale embeddings");
        return reset();
    }

    return Error(ErrorCode::DIMENSION_MISMATCH,
        "Database '" + options_.database_path + "' holds embeddings of dimension " +
        *recorded + " but dimension " + configured +
        " is configured; reset the database and reindex to change it");
}

Result<void> DocumentStore::rebuild_index() {
    auto total = count_embeddings();
    if (!total.ok()) return total.error();

    VectorIndexConfig config = options_.index;
    config.initial_capacity = std::max(config.initial_capacity, total.value() + 1);

    VectorIndex rebuilt(config);
    auto init = rebuilt.initialize();
    if (!init.ok()) return init;

    auto stmt = db_->prepare("SELECT doc_id, vector FROM embeddings ORDER BY doc_id");
    if (!stmt.ok()) return stmt.error();

    while (true) {
        auto row = stmt->step();
        if (!row.ok()) return row.error();
        if (!row.value()) break;

        DocId doc_id = stmt->column_int64(0);
        Embedding vector = stmt->column_floats(1);
        if (static_cast<int>(vector.size()) != options_.index.dimension) {
            return Error(ErrorCode::CORRUPTION,
                "Embedding " + std::to_string(doc_id) + " has " +
                std::to_string(vector.size()) + " components, expected " +
                std::to_string(options_.index.dimension));
        }

        auto added = rebuilt.add(doc_id, vector);
        if (!added.ok()) return added;
    }

    index_ = std::move(rebuilt);
    index_stale_ = false;
    logger_->debug("Vector index loaded with " + std::to_string(index_.size()) + " entries");
    return {};
}

void DocumentStore::resync_index() {
    auto rebuilt = rebuild_index();
    if (!rebuilt.ok()) {
        index_stale_ = true;
        logger_->error("Vector index rebuild failed, retrying on next query: " +
                       rebuilt.error().to_string());
    }
}

// ============================================================================
// Mutations
// ============================================================================

Result<size_t> DocumentStore::clear_note(const NoteId& note_id) {
    auto open = require_open();
    if (!open.ok()) return open.error();

    auto txn = Transaction::begin(*db_);
    if (!txn.ok()) return txn.error();

    std::vector<DocId> removed;
    {
        auto select = db_->prepare("SELECT doc_id FROM documents WHERE note_id = ?");
        if (!select.ok()) return store_error("clear_note", select.error());
        auto bound = select->bind_text(1, note_id);
        if (!bound.ok()) return bound.error();

        while (true) {
            auto row = select->step();
            if (!row.ok()) return store_error("clear_note", row.error());
            if (!row.value()) break;
            removed.push_back(select->column_int64(0));
        }
    }

    if (removed.empty()) {
        auto committed = txn->commit();
        if (!committed.ok()) return committed.error();
        return size_t{0};
    }

    for (const char* sql : {
             "DELETE FROM embeddings WHERE doc_id IN "
             "(SELECT doc_id FROM documents WHERE note_id = ?)",
             "DELETE FROM documents WHERE note_id = ?"}) {
        auto stmt = db_->prepare(sql);
        if (!stmt.ok()) return store_error("clear_note", stmt.error());
        auto bound = stmt->bind_text(1, note_id);
        if (!bound.ok()) return bound.error();
        auto done = stmt->execute();
        if (!done.ok()) return store_error("clear_note", done.error());
    }

    auto committed = txn->commit();
    if (!committed.ok()) return committed.error();

    bool index_in_sync = true;
    for (DocId doc_id : removed) {
        if (!index_.remove(doc_id).ok()) {
            index_in_sync = false;
        }
    }
    if (!index_in_sync) {
        logger_->warning("Vector index out of sync after clearing '" + note_id +
                         "'; rebuilding");
        resync_index();
    }

    return removed.size();
}

Result<DocId> DocumentStore::insert_document(const NoteId& note_id,
                                             int64_t start_offset,
                                             const std::string& text,
                                             const Embedding& vector) {
    auto open = require_open();
    if (!open.ok()) return open.error();

    if (static_cast<int>(vector.size()) != options_.index.dimension) {
        return Error(ErrorCode::DIMENSION_MISMATCH,
            "Vector has " + std::to_string(vector.size()) +
            " components, store dimension is " + std::to_string(options_.index.dimension));
    }

    auto txn = Transaction::begin(*db_);
    if (!txn.ok()) return txn.error();

    auto doc = db_->prepare(
        "INSERT INTO documents (note_id, start_offset, content) VALUES (?, ?, ?)");
    if (!doc.ok()) return store_error("insert_document", doc.error());
    auto b1 = doc->bind_text(1, note_id);
    if (!b1.ok()) return b1.error();
    auto b2 = doc->bind_int64(2, start_offset);
    if (!b2.ok()) return b2.error();
    auto b3 = doc->bind_text(3, text);
    if (!b3.ok()) return b3.error();
    auto doc_done = doc->execute();
    if (!doc_done.ok()) return store_error("insert_document", doc_done.error());

    DocId doc_id = db_->last_insert_rowid();

    auto emb = db_->prepare("INSERT INTO embeddings (doc_id, vector) VALUES (?, ?)");
    if (!emb.ok()) return store_error("insert_document", emb.error());
    auto b4 = emb->bind_int64(1, doc_id);
    if (!b4.ok()) return b4.error();
    auto b5 = emb->bind_blob(2, vector.data(), vector.size() * sizeof(float));
    if (!b5.ok()) return b5.error();
    auto emb_done = emb->execute();
    if (!emb_done.ok()) return store_error("insert_document", emb_done.error());

    auto committed = txn->commit();
    if (!committed.ok()) return committed.error();

    auto indexed = index_.add(doc_id, vector);
    if (!indexed.ok()) {
        logger_->warning("Vector index rejected doc " + std::to_string(doc_id) + " (" +
                         indexed.error().to_string() + "); rebuilding");
        resync_index();
    }

    return doc_id;
}

Result<void> DocumentStore::reset() {
    auto open = require_open();
    if (!open.ok()) return open;

    auto txn = Transaction::begin(*db_);
    if (!txn.ok()) return txn.error();

    auto dropped = db_->exec(DROP_SQL);
    if (!dropped.ok()) return store_error("reset", dropped.error());

    auto schema = ensure_schema();
    if (!schema.ok()) return schema;

    auto dim = write_meta(*db_, "dimension", std::to_string(options_.index.dimension));
    if (!dim.ok()) return store_error("reset", dim.error());
    auto metric = write_meta(*db_, "metric", METRIC_NAME);
    if (!metric.ok()) return store_error("reset", metric.error());

    auto committed = txn->commit();
    if (!committed.ok()) return committed;

    return rebuild_index();
}

// ============================================================================
// Queries
// ============================================================================

Result<std::vector<SimilarDocument>> DocumentStore::top_k_similar(const Embedding& query_vector,
                                                                  size_t k) {
    auto open = require_open();
    if (!open.ok()) return open.error();

    if (static_cast<int>(query_vector.size()) != options_.index.dimension) {
        return Error(ErrorCode::DIMENSION_MISMATCH,
            "Query vector has " + std::to_string(query_vector.size()) +
            " components, store dimension is " + std::to_string(options_.index.dimension));
    }

    if (index_stale_) {
        auto rebuilt = rebuild_index();
        if (!rebuilt.ok()) return rebuilt.error();
    }

    auto hits = index_.search(query_vector, k);
    if (!hits.ok()) return hits.error();

    std::vector<SimilarDocument> results;
    if (hits->empty()) {
        return results;
    }

    auto txn = Transaction::begin(*db_, Transaction::Mode::DEFERRED);
    if (!txn.ok()) return txn.error();

    auto stmt = db_->prepare(
        "SELECT note_id, start_offset, content FROM documents WHERE doc_id = ?");
    if (!stmt.ok()) return store_error("top_k_similar", stmt.error());

    results.reserve(hits->size());
    for (const auto& hit : hits.value()) {
        stmt->reset();
        auto bound = stmt->bind_int64(1, hit.doc_id);
        if (!bound.ok()) return bound.error();

        auto row = stmt->step();
        if (!row.ok()) return store_error("top_k_similar", row.error());
        if (!row.value()) {
            return Error(ErrorCode::CORRUPTION,
                "Embedding " + std::to_string(hit.doc_id) + " has no document record");
        }

        SimilarDocument doc;
        doc.doc_id = hit.doc_id;
        doc.note_id = stmt->column_text(0);
        doc.start_offset = stmt->column_int64(1);
        doc.text = stmt->column_text(2);
        doc.distance = hit.distance;
        results.push_back(std::move(doc));
    }

    stmt->reset();

    auto committed = txn->commit();
    if (!committed.ok()) return committed.error();

    return results;
}

Result<std::vector<DocumentRecord>> DocumentStore::documents_for_note(const NoteId& note_id) {
    auto open = require_open();
    if (!open.ok()) return open.error();

    auto stmt = db_->prepare(
        "SELECT doc_id, note_id, start_offset, content FROM documents "
        "WHERE note_id = ? ORDER BY doc_id");
    if (!stmt.ok()) return stmt.error();
    auto bound = stmt->bind_text(1, note_id);
    if (!bound.ok()) return bound.error();

    std::vector<DocumentRecord> records;
    while (true) {
        auto row = stmt->step();
        if (!row.ok()) return row.error();
        if (!row.value()) break;

        DocumentRecord record;
        record.doc_id = stmt->column_int64(0);
        record.note_id = stmt->column_text(1);
        record.start_offset = stmt->column_int64(2);
        record.text = stmt->column_text(3);
        records.push_back(std::move(record));
    }
    return records;
}

Result<std::vector<NoteId>> DocumentStore::list_note_ids() {
    auto open = require_open();
    if (!open.ok()) return open.error();

    auto stmt = db_->prepare("SELECT DISTINCT note_id FROM documents ORDER BY note_id");
    if (!stmt.ok()) return stmt.error();

    std::vector<NoteId> ids;
    while (true) {
        auto row = stmt->step();
        if (!row.ok()) return row.error();
        if (!row.value()) break;
        ids.push_back(stmt->column_text(0));
    }
    return ids;
}

Result<size_t> DocumentStore::count_rows(const char* sql) {
    auto open = require_open();
    if (!open.ok()) return open.error();

    auto stmt = db_->prepare(sql);
    if (!stmt.ok()) return stmt.error();

    auto row = stmt->step();
    if (!row.ok()) return row.error();
    if (!row.value()) return size_t{0};
    return static_cast<size_t>(stmt->column_int64(0));
}

Result<size_t> DocumentStore::count_documents() {
    return count_rows("SELECT COUNT(*) FROM documents");
}

Result<size_t> DocumentStore::count_embeddings() {
    return count_rows("SELECT COUNT(*) FROM embeddings");
}

}  // namespace semnote::store
