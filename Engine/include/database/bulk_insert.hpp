#pragma once

#include <database/sqlite_connection.hpp>
#include <cstddef>
#include <memory>
#include <string>
#include <vector>

namespace Lexicore {

/**
 * @brief Batches many rows into multi-row INSERT statements.
 *
 * Usage:
 *   BulkInsert bi(conn);
 *   bi.begin_table("words", {"id","lexicon_rowid","lemma","pos"});
 *   for (...) bi.add_row({...});
 *   bi.flush();
 *
 * Notes:
 * - Batches stay under SQLite's 999 host-parameter limit (MAX_VARIABLES).
 * - The full-size statement is prepared once per table and reused.
 * - Rows still pending at destruction are discarded, never written.
 * - Not thread-safe; one instance per connection.
 */
class BulkInsert {
public:
    static constexpr std::size_t MAX_VARIABLES = 900;

    explicit BulkInsert(SqliteConnection& db) noexcept;
    ~BulkInsert();

    BulkInsert(const BulkInsert&) = delete;
    BulkInsert& operator=(const BulkInsert&) = delete;

    /// Flushes any pending rows of the previous table first.
    /// @param verb "INSERT" or e.g. "INSERT OR IGNORE"
    void begin_table(const std::string& table, const std::vector<std::string>& columns,
                     const std::string& verb = "INSERT");

    /// values.size() must equal the column count.
    void add_row(std::vector<SqlParam> values);

    void flush();

    /// Rows written to the current table so far, pending rows included.
    std::size_t count() const noexcept { return written_ + pending_.size() / (columns_.empty() ? 1 : columns_.size()); }

private:
    std::string build_sql(std::size_t rows) const;
    void write_rows(std::size_t rows);

    SqliteConnection& db_;
    std::string table_;
    std::string verb_;
    std::vector<std::string> columns_;
    std::size_t rows_per_batch_ = 0;
    std::vector<SqlParam> pending_;
    std::unique_ptr<SqliteConnection::Statement> full_batch_;
    std::size_t written_ = 0;
};

} // namespace Lexicore
