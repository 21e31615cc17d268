/**
 * @file bulk_insert.cpp
 * @brief Multi-row INSERT batching under the SQLite bound-variable limit
 */

#include <database/bulk_insert.hpp>
#include <core/errors.hpp>
#include <utils/logger.hpp>
#include <algorithm>

namespace Lexicore {

BulkInsert::BulkInsert(SqliteConnection& db) noexcept : db_(db) {}

BulkInsert::~BulkInsert() {
    if (!pending_.empty()) {
        Logger::debug("BulkInsert: discarding " + std::to_string(pending_.size() / columns_.size()) +
                      " unflushed rows for " + table_);
    }
}

void BulkInsert::begin_table(const std::string& table, const std::vector<std::string>& columns,
                             const std::string& verb) {
    if (columns.empty()) {
        throw StorageError("BulkInsert: no columns for " + table);
    }
    flush();
    table_ = table;
    verb_ = verb;
    columns_ = columns;
    rows_per_batch_ = std::max<std::size_t>(1, MAX_VARIABLES / columns_.size());
    full_batch_.reset();
    written_ = 0;
    pending_.reserve(rows_per_batch_ * columns_.size());
}

std::string BulkInsert::build_sql(std::size_t rows) const {
    std::string row = "(";
    for (std::size_t i = 0; i < columns_.size(); ++i) {
        row += i ? ",?" : "?";
    }
    row += ")";

    std::string sql = verb_ + " INTO " + table_ + " (";
    for (std::size_t i = 0; i < columns_.size(); ++i) {
        if (i) sql += ",";
        sql += columns_[i];
    }
    sql += ") VALUES ";
    for (std::size_t r = 0; r < rows; ++r) {
        if (r) sql += ",";
        sql += row;
    }
    return sql;
}

void BulkInsert::add_row(std::vector<SqlParam> values) {
    if (columns_.empty()) {
        throw StorageError("BulkInsert: add_row before begin_table");
    }
    if (values.size() != columns_.size()) {
        throw StorageError("BulkInsert: " + table_ + " expects " + std::to_string(columns_.size()) +
                           " values, got " + std::to_string(values.size()));
    }
    for (auto& v : values) pending_.push_back(std::move(v));
    if (pending_.size() >= rows_per_batch_ * columns_.size()) {
        write_rows(rows_per_batch_);
    }
}

void BulkInsert::write_rows(std::size_t rows) {
    if (rows == rows_per_batch_) {
        if (!full_batch_) {
            full_batch_ = std::make_unique<SqliteConnection::Statement>(db_, build_sql(rows));
        }
        full_batch_->reset();
        full_batch_->bind_all(pending_);
        while (full_batch_->step()) {}
    } else {
        SqliteConnection::Statement stmt(db_, build_sql(rows));
        stmt.bind_all(pending_);
        while (stmt.step()) {}
    }
    written_ += rows;
    pending_.clear();
}

void BulkInsert::flush() {
    if (pending_.empty()) return;
    write_rows(pending_.size() / columns_.size());
}

} // namespace Lexicore
