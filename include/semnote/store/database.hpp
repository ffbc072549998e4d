#pragma once

#include <semnote/result.hpp>

#include <cstdint>
#include <memory>
#include <string>
#include <vector>

struct sqlite3;
struct sqlite3_stmt;

namespace semnote::store {

class Database;

/**
 * Statement - a prepared SQLite statement, finalized on destruction.
 *
 * Bind indexes are 1-based, column indexes 0-based (SQLite convention).
 */
class Statement {
public:
    Statement() = default;
    ~Statement();

    Statement(const Statement&) = delete;
    Statement& operator=(const Statement&) = delete;
    Statement(Statement&& other) noexcept;
    Statement& operator=(Statement&& other) noexcept;

    Result<void> bind_int64(int index, int64_t value);
    Result<void> bind_text(int index, const std::string& value);
    Result<void> bind_blob(int index, const void* data, size_t size);

    /**
     * Advance the statement.
     *
     * @return true if a row is available, false when done
     */
    Result<bool> step();

    /**
     * Run a statement that returns no rows.
     */
    Result<void> execute();

    /**
     * Reset for re-execution and clear bindings.
     */
    void reset();

    int64_t column_int64(int index) const;
    std::string column_text(int index) const;
    std::vector<float> column_floats(int index) const;

private:
    friend class Database;
    Statement(sqlite3* db, sqlite3_stmt* stmt) : db_(db), stmt_(stmt) {}

    Error bind_error(int index) const;

    sqlite3* db_ = nullptr;
    sqlite3_stmt* stmt_ = nullptr;
};

/**
 * Database - owns one SQLite connection.
 */
class Database {
public:
    /**
     * Open or create a database file. ":memory:" opens a private
     * in-memory database.
     */
    static Result<std::unique_ptr<Database>> open(const std::string& path);

    ~Database();

    Database(const Database&) = delete;
    Database& operator=(const Database&) = delete;

    void close();
    bool is_open() const { return db_ != nullptr; }

    /**
     * Execute one or more SQL statements without results.
     */
    Result<void> exec(const std::string& sql);

    Result<Statement> prepare(const std::string& sql);

    int64_t last_insert_rowid() const;
    bool in_transaction() const;

    const std::string& path() const { return path_; }

private:
    Database() = default;

    sqlite3* db_ = nullptr;
    std::string path_;
};

/**
 * Transaction - scoped SQLite transaction.
 *
 * Rolls back on destruction unless commit() succeeded, so every exit path,
 * including early error returns, leaves the database either fully updated or
 * untouched.
 */
class Transaction {
public:
    enum class Mode {
        DEFERRED,       // Read snapshot
        IMMEDIATE       // Takes the write lock up front
    };

    static Result<Transaction> begin(Database& db, Mode mode = Mode::IMMEDIATE);

    ~Transaction();

    Transaction(const Transaction&) = delete;
    Transaction& operator=(const Transaction&) = delete;
    Transaction(Transaction&& other) noexcept;
    Transaction& operator=(Transaction&& other) = delete;

    Result<void> commit();
    void rollback();

    bool is_active() const { return active_; }

private:
    explicit Transaction(Database* db) : db_(db), active_(true) {}

    Database* db_ = nullptr;
    bool active_ = false;
};

}  // namespace semnote::store
