/**
 * @file sqlite_connection.hpp
 * @brief SQLite connection and query interface
 */

#pragma once

#include <filesystem>
#include <functional>
#include <optional>
#include <string>
#include <vector>
#include <sqlite3.h>

namespace Lexicore {

/// Bound parameter; nullopt binds SQL NULL.
using SqlParam = std::optional<std::string>;

/// One result row. NULL columns read as empty strings.
using SqlRow = std::vector<std::string>;

/**
 * @brief SQLite connection wrapper
 *
 * Error mapping: SQLITE_BUSY/SQLITE_LOCKED throw LockedError,
 * SQLITE_CORRUPT/SQLITE_NOTADB throw CorruptStoreError, everything
 * else throws StorageError.
 */
class SqliteConnection {
public:
    enum class Mode { ReadWrite, ReadOnly };

    /**
     * @brief Open (and for ReadWrite, create) the database file.
     * @param busy_timeout_ms How long to wait on a lock before raising LockedError
     */
    explicit SqliteConnection(const std::filesystem::path& path, Mode mode = Mode::ReadWrite,
                              int busy_timeout_ms = 1000);

    ~SqliteConnection();

    // No copy
    SqliteConnection(const SqliteConnection&) = delete;
    SqliteConnection& operator=(const SqliteConnection&) = delete;

    // Move OK
    SqliteConnection(SqliteConnection&& other) noexcept;
    SqliteConnection& operator=(SqliteConnection&& other) noexcept;

    bool is_open() const { return db_ != nullptr; }
    Mode mode() const { return mode_; }

    /**
     * @brief Execute one or more statements without parameters
     */
    void execute(const std::string& sql);

    /**
     * @brief Execute a single statement with parameters
     */
    void execute(const std::string& sql, const std::vector<SqlParam>& params);

    /**
     * @brief First column of the first row, or nullopt when there is no row
     */
    std::optional<std::string> query_single(const std::string& sql, const std::vector<SqlParam>& params = {});

    /**
     * @brief Execute query and iterate rows
     * @param callback Called for each row: callback(row_data)
     */
    void query(const std::string& sql, const std::function<void(const SqlRow&)>& callback);

    void query(const std::string& sql, const std::vector<SqlParam>& params,
               const std::function<void(const SqlRow&)>& callback);

    /// Rows modified by the most recent statement.
    long long changes() const;

    /**
     * @brief Prepared statement, finalized on destruction
     */
    class Statement {
    public:
        Statement(SqliteConnection& conn, const std::string& sql);
        ~Statement();

        Statement(const Statement&) = delete;
        Statement& operator=(const Statement&) = delete;

        void bind(int index, const SqlParam& value);
        void bind_all(const std::vector<SqlParam>& params);

        /// Returns true while a row is available.
        bool step();

        void reset();

        std::string column(int index) const;
        int column_count() const;

    private:
        SqliteConnection& conn_;
        sqlite3_stmt* stmt_ = nullptr;
    };

    /**
     * @brief Begin a deferred (read) transaction
     */
    void begin();

    /**
     * @brief Begin a write transaction, acquiring the write lock immediately
     */
    void begin_immediate();

    void commit();
    void rollback();

    bool in_transaction() const;

    /**
     * @brief RAII transaction guard, rolls back unless committed
     */
    class Transaction {
    public:
        explicit Transaction(SqliteConnection& conn, bool immediate = true);
        ~Transaction();

        Transaction(const Transaction&) = delete;
        Transaction& operator=(const Transaction&) = delete;

        void commit();
        void rollback();

    private:
        SqliteConnection& conn_;
        bool committed_ = false;
        bool rolled_back_ = false;
    };

    std::string last_error() const { return last_error_; }

    const std::filesystem::path& path() const { return path_; }

private:
    void open(int busy_timeout_ms);
    void close();

    [[noreturn]] void fail(int rc, const std::string& context);

    sqlite3* db_ = nullptr;
    std::filesystem::path path_;
    Mode mode_ = Mode::ReadWrite;
    std::string last_error_;
};

} // namespace Lexicore
