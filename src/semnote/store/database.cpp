#include <semnote/store/database.hpp>

#include <sqlite3.h>

#include <cstring>

namespace semnote::store {

namespace {

ErrorCode map_sqlite_error(int rc) {
    switch (rc & 0xff) {
        case SQLITE_CORRUPT:
        case SQLITE_NOTADB:
            return ErrorCode::CORRUPTION;
        case SQLITE_BUSY:
        case SQLITE_LOCKED:
        case SQLITE_ABORT:
        case SQLITE_CONSTRAINT:
            return ErrorCode::TRANSACTION_ABORTED;
        case SQLITE_CANTOPEN:
        case SQLITE_IOERR:
        case SQLITE_FULL:
        case SQLITE_READONLY:
            return ErrorCode::IO_ERROR;
        default:
            return ErrorCode::SCHEMA_ERROR;
    }
}

}  // namespace

// ============================================================================
// Statement Implementation
// ============================================================================

Statement::~Statement() {
    if (stmt_) {
        sqlite3_finalize(stmt_);
    }
}

Statement::Statement(Statement&& other) noexcept
    : db_(other.db_)
    , stmt_(other.stmt_) {
    other.db_ = nullptr;
    other.stmt_ = nullptr;
}

Statement& Statement::operator=(Statement&& other) noexcept {
    if (this != &other) {
        if (stmt_) {
            sqlite3_finalize(stmt_);
        }
        db_ = other.db_;
        stmt_ = other.stmt_;
        other.db_ = nullptr;
        other.stmt_ = nullptr;
    }
    return *this;
}

Error Statement::bind_error(int index) const {
    return Error(ErrorCode::SCHEMA_ERROR,
        "Failed to bind parameter " + std::to_string(index) + ": " + sqlite3_errmsg(db_));
}

Result<void> Statement::bind_int64(int index, int64_t value) {
    if (sqlite3_bind_int64(stmt_, index, static_cast<sqlite3_int64>(value)) != SQLITE_OK) {
        return bind_error(index);
    }
    return {};
}

Result<void> Statement::bind_text(int index, const std::string& value) {
    if (sqlite3_bind_text(stmt_, index, value.c_str(), static_cast<int>(value.size()),
                          SQLITE_TRANSIENT) != SQLITE_OK) {
        return bind_error(index);
    }
    return {};
}

Result<void> Statement::bind_blob(int index, const void* data, size_t size) {
    if (sqlite3_bind_blob(stmt_, index, data, static_cast<int>(size),
                          SQLITE_TRANSIENT) != SQLITE_OK) {
        return bind_error(index);
    }
    return {};
}

Result<bool> Statement::step() {
    int rc = sqlite3_step(stmt_);
    if (rc == SQLITE_ROW) {
        return true;
    }
    if (rc == SQLITE_DONE) {
        return false;
    }
    return Error(map_sqlite_error(rc), sqlite3_errmsg(db_));
}

Result<void> Statement::execute() {
    auto result = step();
    if (!result.ok()) {
        return result.error();
    }
    return {};
}

void Statement::reset() {
    sqlite3_reset(stmt_);
    sqlite3_clear_bindings(stmt_);
}

int64_t Statement::column_int64(int index) const {
    return static_cast<int64_t>(sqlite3_column_int64(stmt_, index));
}

std::string Statement::column_text(int index) const {
    const auto* text = sqlite3_column_text(stmt_, index);
    int bytes = sqlite3_column_bytes(stmt_, index);
    if (!text) {
        return {};
    }
    return std::string(reinterpret_cast<const char*>(text), static_cast<size_t>(bytes));
}

std::vector<float> Statement::column_floats(int index) const {
    const void* data = sqlite3_column_blob(stmt_, index);
    int bytes = sqlite3_column_bytes(stmt_, index);
    std::vector<float> values(static_cast<size_t>(bytes) / sizeof(float));
    if (data && !values.empty()) {
        std::memcpy(values.data(), data, values.size() * sizeof(float));
    }
    return values;
}

// ============================================================================
// Database Implementation
// ============================================================================

Result<std::unique_ptr<Database>> Database::open(const std::string& path) {
    auto db = std::unique_ptr<Database>(new Database());
    db->path_ = path;

    int rc = sqlite3_open_v2(path.c_str(), &db->db_,
                             SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE, nullptr);
    if (rc != SQLITE_OK) {
        std::string message = db->db_ ? sqlite3_errmsg(db->db_) : sqlite3_errstr(rc);
        db->close();
        return Error(ErrorCode::IO_ERROR,
            "Failed to open database '" + path + "': " + message);
    }

    sqlite3_busy_timeout(db->db_, 5000);

    auto pragmas = db->exec("PRAGMA foreign_keys = ON;");
    if (!pragmas.ok()) {
        return pragmas.error();
    }

    return std::move(db);
}

Database::~Database() {
    close();
}

void Database::close() {
    if (db_) {
        sqlite3_close_v2(db_);
        db_ = nullptr;
    }
}

Result<void> Database::exec(const std::string& sql) {
    if (!db_) {
        return Error(ErrorCode::STORE_NOT_OPEN, "Database is closed");
    }

    char* err = nullptr;
    int rc = sqlite3_exec(db_, sql.c_str(), nullptr, nullptr, &err);
    if (rc != SQLITE_OK) {
        std::string message = err ? err : sqlite3_errmsg(db_);
        if (err) sqlite3_free(err);
        return Error(map_sqlite_error(rc), message);
    }
    return {};
}

Result<Statement> Database::prepare(const std::string& sql) {
    if (!db_) {
        return Error(ErrorCode::STORE_NOT_OPEN, "Database is closed");
    }

    sqlite3_stmt* stmt = nullptr;
    int rc = sqlite3_prepare_v2(db_, sql.c_str(), -1, &stmt, nullptr);
    if (rc != SQLITE_OK) {
        if (stmt) sqlite3_finalize(stmt);
        return Error(map_sqlite_error(rc),
            std::string("Failed to prepare statement: ") + sqlite3_errmsg(db_));
    }
    return Statement(db_, stmt);
}

int64_t Database::last_insert_rowid() const {
    return db_ ? static_cast<int64_t>(sqlite3_last_insert_rowid(db_)) : 0;
}

bool Database::in_transaction() const {
    return db_ && sqlite3_get_autocommit(db_) == 0;
}

// ============================================================================
// Transaction Implementation
// ============================================================================

Result<Transaction> Transaction::begin(Database& db, Mode mode) {
    const char* sql = (mode == Mode::IMMEDIATE) ? "BEGIN IMMEDIATE" : "BEGIN DEFERRED";
    auto result = db.exec(sql);
    if (!result.ok()) {
        return Error(ErrorCode::TRANSACTION_ABORTED, "Failed to begin transaction", result.error());
    }
    return Transaction(&db);
}

Transaction::~Transaction() {
    rollback();
}

Transaction::Transaction(Transaction&& other) noexcept
    : db_(other.db_)
    , active_(other.active_) {
    other.db_ = nullptr;
    other.active_ = false;
}

Result<void> Transaction::commit() {
    if (!active_) {
        return Error(ErrorCode::TRANSACTION_ABORTED, "Transaction is not active");
    }

    auto result = db_->exec("COMMIT");
    if (!result.ok()) {
        rollback();
        return Error(ErrorCode::TRANSACTION_ABORTED, "Commit failed", result.error());
    }
    active_ = false;
    return {};
}

void Transaction::rollback() {
    if (active_ && db_ && db_->in_transaction()) {
        // A failed ROLLBACK means SQLite already rolled the transaction back
        db_->exec("ROLLBACK");
    }
    active_ = false;
}

}  // namespace semnote::store
