#pragma once

#include "core/result.hpp"
#include "core/types.hpp"
#include <sqlite3.h>
#include <string>
#include <string_view>
#include <memory>
#include <functional>
#include <vector>
#include <optional>

namespace waypool::storage {

/**
 * SQLite statement wrapper with RAII.
 *
 * Bind failures are remembered and reported by the next step(), so a
 * chain of binds needs a single error check.
 */
class Statement {
public:
    Statement() = default;
    explicit Statement(sqlite3_stmt* stmt) : stmt_(stmt, sqlite3_finalize) {}

    [[nodiscard]] sqlite3_stmt* get() const { return stmt_.get(); }
    [[nodiscard]] explicit operator bool() const { return stmt_ != nullptr; }

    // Bind helpers (1-based index)
    void bind_text(int index, std::string_view text);
    void bind_int(int index, int value);
    void bind_int64(int index, int64_t value);
    void bind_double(int index, double value);
    void bind_null(int index);
    void bind_optional_text(int index, const std::optional<std::string>& text);
    void bind_optional_timestamp(int index, const std::optional<Timestamp>& ts);

    // Column getters (0-based index)
    [[nodiscard]] std::string column_text(int index) const;
    [[nodiscard]] int column_int(int index) const;
    [[nodiscard]] int64_t column_int64(int index) const;
    [[nodiscard]] double column_double(int index) const;
    [[nodiscard]] bool column_is_null(int index) const;
    [[nodiscard]] std::optional<std::string> column_optional_text(int index) const;
    [[nodiscard]] std::optional<Timestamp> column_optional_timestamp(int index) const;

    // Execute
    [[nodiscard]] Result<bool, Error> step();  // Returns true if there's a row

private:
    void record_bind(int rc, const char* what);

    std::shared_ptr<sqlite3_stmt> stmt_;
    std::optional<Error> bind_error_;
};

/**
 * Database - SQLite connection wrapper.
 *
 * One connection per worker thread. Transactions start with
 * BEGIN IMMEDIATE so the write lock is held before any precondition is
 * read; nested transactions become savepoints of the enclosing one.
 */
class Database {
public:
    static constexpr int DEFAULT_BUSY_TIMEOUT_MS = 5000;

    Database() = default;
    ~Database();

    Database(const Database&) = delete;
    Database& operator=(const Database&) = delete;
    Database(Database&& other) noexcept;
    Database& operator=(Database&& other) noexcept;

    /**
     * Open (or create) a database file in WAL mode.
     */
    [[nodiscard]] static Result<Database, Error> open(
        const std::string& path,
        int busy_timeout_ms = DEFAULT_BUSY_TIMEOUT_MS);

    /**
     * Open an in-memory database (for testing).
     */
    [[nodiscard]] static Result<Database, Error> open_memory();

    [[nodiscard]] bool is_open() const { return db_ != nullptr; }

    void close();

    [[nodiscard]] sqlite3* handle() const { return db_; }

    [[nodiscard]] Result<Statement, Error> prepare(std::string_view sql);

    /**
     * Execute one or more SQL statements without results.
     */
    [[nodiscard]] Result<void, Error> execute(const std::string& sql);

    /**
     * Begin a transaction, or a savepoint when one is already open.
     */
    [[nodiscard]] Result<void, Error> begin_transaction();

    /**
     * Commit the innermost transaction level.
     */
    [[nodiscard]] Result<void, Error> commit();

    /**
     * Roll back the innermost transaction level.
     */
    [[nodiscard]] Result<void, Error> rollback();

    [[nodiscard]] bool in_transaction() const { return depth_ > 0; }

    /**
     * Execute a function within a transaction.
     * Commits when it returns ok, rolls back when it returns an error or throws.
     */
    template<typename F>
    [[nodiscard]] auto transaction(F&& f) -> decltype(f());

    [[nodiscard]] int64_t last_insert_rowid() const;

    [[nodiscard]] int changes() const;

    [[nodiscard]] std::string last_error() const;

private:
    explicit Database(sqlite3* db) : db_(db) {}

    [[nodiscard]] Result<void, Error> enable_wal(int busy_timeout_ms);

    sqlite3* db_ = nullptr;
    int depth_ = 0;
};

/**
 * Transaction RAII guard.
 * Rolls back on scope exit unless commit() succeeded, including when the
 * scope is left by an exception.
 */
class TransactionGuard {
public:
    explicit TransactionGuard(Database& db);
    ~TransactionGuard();

    TransactionGuard(const TransactionGuard&) = delete;
    TransactionGuard& operator=(const TransactionGuard&) = delete;

    [[nodiscard]] Result<void, Error> commit();

    [[nodiscard]] bool is_active() const { return active_; }

    // Why begin failed, when is_active() is false right after construction.
    [[nodiscard]] const std::optional<Error>& begin_error() const { return begin_error_; }

private:
    Database& db_;
    bool active_ = false;
    std::optional<Error> begin_error_;
};

template<typename F>
auto Database::transaction(F&& f) -> decltype(f()) {
    using ResultType = decltype(f());

    TransactionGuard guard(*this);
    if (!guard.is_active()) {
        return ResultType::err(*guard.begin_error());
    }

    auto result = f();
    if (result.is_err()) {
        return result;
    }

    auto commit_result = guard.commit();
    if (commit_result.is_err()) {
        return ResultType::err(commit_result.unwrap_err());
    }

    return result;
}

} // namespace waypool::storage
