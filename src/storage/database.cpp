#include "storage/database.hpp"
#include "core/logging.hpp"

#include <chrono>
#include <thread>

namespace waypool::storage {
namespace {

Error sqlite_error(const std::string& what, int rc) {
    return Error{what + " (sqlite " + std::to_string(rc) + ": " + sqlite3_errstr(rc) + ")"};
}

std::string savepoint_name(int depth) {
    return "wp_sp_" + std::to_string(depth);
}

} // namespace

// ============================================================================
// Statement implementation
// ============================================================================

void Statement::record_bind(int rc, const char* what) {
    if (rc != SQLITE_OK && !bind_error_) {
        bind_error_ = sqlite_error(std::string("Failed to bind ") + what, rc);
    }
}

void Statement::bind_text(int index, std::string_view text) {
    record_bind(sqlite3_bind_text(stmt_.get(), index, text.data(),
                                  static_cast<int>(text.size()), SQLITE_TRANSIENT), "text");
}

void Statement::bind_int(int index, int value) {
    record_bind(sqlite3_bind_int(stmt_.get(), index, value), "int");
}

void Statement::bind_int64(int index, int64_t value) {
    record_bind(sqlite3_bind_int64(stmt_.get(), index, value), "int64");
}

void Statement::bind_double(int index, double value) {
    record_bind(sqlite3_bind_double(stmt_.get(), index, value), "double");
}

void Statement::bind_null(int index) {
    record_bind(sqlite3_bind_null(stmt_.get(), index), "null");
}

void Statement::bind_optional_text(int index, const std::optional<std::string>& text) {
    if (text) {
        bind_text(index, *text);
    } else {
        bind_null(index);
    }
}

void Statement::bind_optional_timestamp(int index, const std::optional<Timestamp>& ts) {
    if (ts) {
        bind_int64(index, ts->millis());
    } else {
        bind_null(index);
    }
}

std::string Statement::column_text(int index) const {
    const unsigned char* text = sqlite3_column_text(stmt_.get(), index);
    if (!text) return "";
    return reinterpret_cast<const char*>(text);
}

int Statement::column_int(int index) const {
    return sqlite3_column_int(stmt_.get(), index);
}

int64_t Statement::column_int64(int index) const {
    return sqlite3_column_int64(stmt_.get(), index);
}

double Statement::column_double(int index) const {
    return sqlite3_column_double(stmt_.get(), index);
}

bool Statement::column_is_null(int index) const {
    return sqlite3_column_type(stmt_.get(), index) == SQLITE_NULL;
}

std::optional<std::string> Statement::column_optional_text(int index) const {
    if (column_is_null(index)) return std::nullopt;
    return column_text(index);
}

std::optional<Timestamp> Statement::column_optional_timestamp(int index) const {
    if (column_is_null(index)) return std::nullopt;
    return Timestamp(column_int64(index));
}

Result<bool, Error> Statement::step() {
    if (bind_error_) {
        return Result<bool, Error>::err(*bind_error_);
    }
    int rc = sqlite3_step(stmt_.get());
    if (rc == SQLITE_ROW) {
        return Result<bool, Error>::ok(true);
    }
    if (rc == SQLITE_DONE) {
        return Result<bool, Error>::ok(false);
    }
    sqlite3* db = sqlite3_db_handle(stmt_.get());
    return Result<bool, Error>::err(Error{
        std::string("Step failed: ") + (db ? sqlite3_errmsg(db) : sqlite3_errstr(rc))});
}

// ============================================================================
// Database implementation
// ============================================================================

Database::~Database() {
    close();
}

Database::Database(Database&& other) noexcept : db_(other.db_), depth_(other.depth_) {
    other.db_ = nullptr;
    other.depth_ = 0;
}

Database& Database::operator=(Database&& other) noexcept {
    if (this != &other) {
        close();
        db_ = other.db_;
        depth_ = other.depth_;
        other.db_ = nullptr;
        other.depth_ = 0;
    }
    return *this;
}

Result<Database, Error> Database::open(const std::string& path, int busy_timeout_ms) {
    sqlite3* raw = nullptr;
    int rc = sqlite3_open_v2(path.c_str(), &raw,
                             SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE, nullptr);
    if (rc != SQLITE_OK) {
        std::string error = raw ? sqlite3_errmsg(raw) : "Unknown error";
        if (raw) sqlite3_close(raw);
        return Result<Database, Error>::err(Error{"Cannot open " + path + ": " + error});
    }

    Database db(raw);
    sqlite3_busy_timeout(raw, busy_timeout_ms);

    auto pragmas = db.execute("PRAGMA foreign_keys = ON;");
    if (pragmas.is_err()) {
        return Result<Database, Error>::err(pragmas.unwrap_err());
    }

    auto wal = db.enable_wal(busy_timeout_ms);
    if (wal.is_err()) {
        return Result<Database, Error>::err(wal.unwrap_err());
    }

    return Result<Database, Error>::ok(std::move(db));
}

// Switching a fresh file to WAL needs an exclusive lock, and SQLite does not
// run the busy handler for it, so retry until another connection lets go.
Result<void, Error> Database::enable_wal(int busy_timeout_ms) {
    const auto deadline = std::chrono::steady_clock::now() +
                          std::chrono::milliseconds(busy_timeout_ms);
    while (true) {
        auto stmt_result = prepare("PRAGMA journal_mode = WAL;");
        if (stmt_result.is_err()) {
            return Result<void, Error>::err(stmt_result.unwrap_err());
        }
        auto stmt = std::move(stmt_result).unwrap();

        auto step_result = stmt.step();
        if (step_result.is_ok()) {
            const auto mode = step_result.unwrap() ? stmt.column_text(0) : std::string();
            // In-memory databases stay in "memory" mode.
            if (mode == "wal" || mode == "memory") {
                return Result<void, Error>::ok();
            }
            return Result<void, Error>::err(Error{"Cannot enable WAL, journal mode is '" + mode + "'"});
        }

        const int rc = sqlite3_errcode(db_) & 0xff;
        if ((rc != SQLITE_BUSY && rc != SQLITE_LOCKED) ||
            std::chrono::steady_clock::now() >= deadline) {
            return Result<void, Error>::err(step_result.unwrap_err());
        }
        qCDebug(waypoolStorage) << "journal mode switch busy, retrying";
        std::this_thread::sleep_for(std::chrono::milliseconds(10));
    }
}

Result<Database, Error> Database::open_memory() {
    return open(":memory:");
}

void Database::close() {
    if (db_) {
        sqlite3_close(db_);
        db_ = nullptr;
        depth_ = 0;
    }
}

Result<Statement, Error> Database::prepare(std::string_view sql) {
    sqlite3_stmt* stmt = nullptr;
    int rc = sqlite3_prepare_v2(db_, sql.data(),
                                static_cast<int>(sql.size()), &stmt, nullptr);
    if (rc != SQLITE_OK) {
        return Result<Statement, Error>::err(Error{"Prepare failed: " + last_error()});
    }
    return Result<Statement, Error>::ok(Statement(stmt));
}

Result<void, Error> Database::execute(const std::string& sql) {
    char* error_msg = nullptr;
    int rc = sqlite3_exec(db_, sql.c_str(), nullptr, nullptr, &error_msg);
    if (rc != SQLITE_OK) {
        std::string error = error_msg ? error_msg : sqlite3_errstr(rc);
        sqlite3_free(error_msg);
        return Result<void, Error>::err(Error{"Execute failed: " + error});
    }
    return Result<void, Error>::ok();
}

Result<void, Error> Database::begin_transaction() {
    auto result = depth_ == 0
        ? execute("BEGIN IMMEDIATE;")
        : execute("SAVEPOINT " + savepoint_name(depth_) + ";");
    if (result.is_ok()) {
        ++depth_;
    }
    return result;
}

Result<void, Error> Database::commit() {
    if (depth_ == 0) {
        return Result<void, Error>::err(Error{"No active transaction"});
    }
    auto result = depth_ == 1
        ? execute("COMMIT;")
        : execute("RELEASE " + savepoint_name(depth_ - 1) + ";");
    if (result.is_ok()) {
        --depth_;
    }
    return result;
}

Result<void, Error> Database::rollback() {
    if (depth_ == 0) {
        return Result<void, Error>::err(Error{"No active transaction"});
    }
    Result<void, Error> result = Result<void, Error>::ok();
    if (depth_ == 1) {
        result = execute("ROLLBACK;");
    } else {
        const auto name = savepoint_name(depth_ - 1);
        result = execute("ROLLBACK TO " + name + "; RELEASE " + name + ";");
    }
    // The level is gone either way: a failed ROLLBACK leaves SQLite in autocommit.
    --depth_;
    return result;
}

int64_t Database::last_insert_rowid() const {
    return sqlite3_last_insert_rowid(db_);
}

int Database::changes() const {
    return sqlite3_changes(db_);
}

std::string Database::last_error() const {
    return db_ ? sqlite3_errmsg(db_) : "Database not open";
}

// ============================================================================
// TransactionGuard implementation
// ============================================================================

TransactionGuard::TransactionGuard(Database& db) : db_(db) {
    auto result = db_.begin_transaction();
    active_ = result.is_ok();
    if (!active_) {
        begin_error_ = result.unwrap_err();
    }
}

TransactionGuard::~TransactionGuard() {
    if (active_) {
        auto result = db_.rollback();
        if (result.is_err()) {
            qCWarning(waypoolStorage) << "rollback failed:" << result.unwrap_err().message.c_str();
        }
    }
}

Result<void, Error> TransactionGuard::commit() {
    if (!active_) {
        return Result<void, Error>::err(Error{"No active transaction"});
    }
    auto result = db_.commit();
    if (result.is_ok()) {
        active_ = false;
    }
    return result;
}

} // namespace waypool::storage
