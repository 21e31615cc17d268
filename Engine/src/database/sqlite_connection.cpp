/**
 * @file sqlite_connection.cpp
 * @brief SQLite connection implementation
 */

#include <database/sqlite_connection.hpp>
#include <core/errors.hpp>
#include <utils/logger.hpp>

namespace Lexicore {

SqliteConnection::SqliteConnection(const std::filesystem::path& path, Mode mode, int busy_timeout_ms)
    : path_(path), mode_(mode) {
    open(busy_timeout_ms);
}

SqliteConnection::~SqliteConnection() {
    close();
}

SqliteConnection::SqliteConnection(SqliteConnection&& other) noexcept
    : db_(other.db_), path_(std::move(other.path_)), mode_(other.mode_),
      last_error_(std::move(other.last_error_)) {
    other.db_ = nullptr;
}

SqliteConnection& SqliteConnection::operator=(SqliteConnection&& other) noexcept {
    if (this != &other) {
        close();
        db_ = other.db_;
        path_ = std::move(other.path_);
        mode_ = other.mode_;
        last_error_ = std::move(other.last_error_);
        other.db_ = nullptr;
    }
    return *this;
}

void SqliteConnection::open(int busy_timeout_ms) {
    int flags = SQLITE_OPEN_NOMUTEX;
    flags |= mode_ == Mode::ReadOnly ? SQLITE_OPEN_READONLY : (SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE);

    int rc = sqlite3_open_v2(path_.string().c_str(), &db_, flags, nullptr);
    if (rc != SQLITE_OK) {
        last_error_ = db_ ? sqlite3_errmsg(db_) : sqlite3_errstr(rc);
        sqlite3_close(db_);
        db_ = nullptr;
        if (rc == SQLITE_CORRUPT || rc == SQLITE_NOTADB) {
            throw CorruptStoreError("SQLite open failed for " + path_.string() + ": " + last_error_);
        }
        throw StorageError("SQLite open failed for " + path_.string() + ": " + last_error_);
    }

    sqlite3_extended_result_codes(db_, 1);
    sqlite3_busy_timeout(db_, busy_timeout_ms);
    execute("PRAGMA foreign_keys = ON");
}

void SqliteConnection::close() {
    if (db_) {
        int rc = sqlite3_close(db_);
        if (rc != SQLITE_OK) {
            Logger::warn("SQLite close on " + path_.string() + " reported: " + sqlite3_errstr(rc));
            sqlite3_close_v2(db_);
        }
        db_ = nullptr;
    }
}

void SqliteConnection::fail(int rc, const std::string& context) {
    last_error_ = db_ ? sqlite3_errmsg(db_) : sqlite3_errstr(rc);
    std::string message = context + ": " + last_error_;
    switch (rc & 0xff) {
        case SQLITE_BUSY:
        case SQLITE_LOCKED:
            throw LockedError("Store is locked (" + path_.string() + "): " + message);
        case SQLITE_CORRUPT:
        case SQLITE_NOTADB:
            throw CorruptStoreError("Store is corrupt (" + path_.string() + "): " + message);
        default:
            throw StorageError("SQLite query failed: " + message);
    }
}

void SqliteConnection::execute(const std::string& sql) {
    if (!db_) {
        throw StorageError("Not connected to database");
    }
    char* err = nullptr;
    int rc = sqlite3_exec(db_, sql.c_str(), nullptr, nullptr, &err);
    if (err) sqlite3_free(err);
    if (rc != SQLITE_OK) {
        fail(rc, sql.substr(0, 80));
    }
}

void SqliteConnection::execute(const std::string& sql, const std::vector<SqlParam>& params) {
    Statement stmt(*this, sql);
    stmt.bind_all(params);
    while (stmt.step()) {}
}

std::optional<std::string> SqliteConnection::query_single(const std::string& sql, const std::vector<SqlParam>& params) {
    Statement stmt(*this, sql);
    stmt.bind_all(params);
    if (stmt.step() && stmt.column_count() > 0) {
        return stmt.column(0);
    }
    return std::nullopt;
}

void SqliteConnection::query(const std::string& sql, const std::function<void(const SqlRow&)>& callback) {
    query(sql, {}, callback);
}

void SqliteConnection::query(const std::string& sql, const std::vector<SqlParam>& params,
                             const std::function<void(const SqlRow&)>& callback) {
    Statement stmt(*this, sql);
    stmt.bind_all(params);
    const int ncols = stmt.column_count();
    SqlRow row;
    while (stmt.step()) {
        row.clear();
        row.reserve(ncols);
        for (int i = 0; i < ncols; ++i) {
            row.push_back(stmt.column(i));
        }
        callback(row);
    }
}

long long SqliteConnection::changes() const {
    return db_ ? static_cast<long long>(sqlite3_changes(db_)) : 0;
}

void SqliteConnection::begin() {
    execute("BEGIN DEFERRED");
}

void SqliteConnection::begin_immediate() {
    execute("BEGIN IMMEDIATE");
}

void SqliteConnection::commit() {
    execute("COMMIT");
}

void SqliteConnection::rollback() {
    execute("ROLLBACK");
}

bool SqliteConnection::in_transaction() const {
    return db_ && sqlite3_get_autocommit(db_) == 0;
}

// ============================================================================
// Statement
// ============================================================================

SqliteConnection::Statement::Statement(SqliteConnection& conn, const std::string& sql) : conn_(conn) {
    if (!conn_.db_) {
        throw StorageError("Not connected to database");
    }
    int rc = sqlite3_prepare_v2(conn_.db_, sql.c_str(), -1, &stmt_, nullptr);
    if (rc != SQLITE_OK) {
        conn_.fail(rc, "prepare " + sql.substr(0, 80));
    }
}

SqliteConnection::Statement::~Statement() {
    if (stmt_) sqlite3_finalize(stmt_);
}

void SqliteConnection::Statement::bind(int index, const SqlParam& value) {
    int rc = value
        ? sqlite3_bind_text(stmt_, index, value->data(), static_cast<int>(value->size()), SQLITE_TRANSIENT)
        : sqlite3_bind_null(stmt_, index);
    if (rc != SQLITE_OK) {
        conn_.fail(rc, "bind parameter " + std::to_string(index));
    }
}

void SqliteConnection::Statement::bind_all(const std::vector<SqlParam>& params) {
    for (std::size_t i = 0; i < params.size(); ++i) {
        bind(static_cast<int>(i + 1), params[i]);
    }
}

bool SqliteConnection::Statement::step() {
    int rc = sqlite3_step(stmt_);
    if (rc == SQLITE_ROW) return true;
    if (rc == SQLITE_DONE) return false;
    conn_.fail(rc, "step");
}

void SqliteConnection::Statement::reset() {
    sqlite3_reset(stmt_);
    sqlite3_clear_bindings(stmt_);
}

std::string SqliteConnection::Statement::column(int index) const {
    const unsigned char* text = sqlite3_column_text(stmt_, index);
    if (!text) return {};
    return std::string(reinterpret_cast<const char*>(text),
                       static_cast<std::size_t>(sqlite3_column_bytes(stmt_, index)));
}

int SqliteConnection::Statement::column_count() const {
    return sqlite3_column_count(stmt_);
}

// ============================================================================
// Transaction
// ============================================================================

SqliteConnection::Transaction::Transaction(SqliteConnection& conn, bool immediate) : conn_(conn) {
    if (immediate) conn_.begin_immediate();
    else conn_.begin();
}

SqliteConnection::Transaction::~Transaction() {
    if (!committed_ && !rolled_back_ && conn_.in_transaction()) {
        try {
            conn_.rollback();
        } catch (const std::exception& e) {
            Logger::error(std::string("Rollback failed: ") + e.what());
        }
    }
}

void SqliteConnection::Transaction::commit() {
    conn_.commit();
    committed_ = true;
}

void SqliteConnection::Transaction::rollback() {
    conn_.rollback();
    rolled_back_ = true;
}

} // namespace Lexicore
