/**
 * @file store.hpp
 * @brief Store handle: one writer connection, pooled readers, write locking
 */

#pragma once

#include <database/sqlite_connection.hpp>
#include <export.hpp>
#include <filesystem>
#include <functional>
#include <memory>
#include <mutex>
#include <vector>

namespace Lexicore {

/**
 * @brief Single-writer / multi-reader access to one store file.
 *
 * Writes (add/remove) serialize on an in-process mutex, then take the
 * cross-process lock file without waiting, then open a BEGIN IMMEDIATE
 * transaction. Reads run on separate read-only connections inside a
 * deferred transaction, so each read() sees one committed snapshot and is
 * never blocked by a writer (WAL mode).
 */
class LEXICORE_API Store {
public:
    Store(const std::filesystem::path& db_path, const std::filesystem::path& lock_path,
          int busy_timeout_ms = 1000);
    ~Store();

    Store(const Store&) = delete;
    Store& operator=(const Store&) = delete;

    /**
     * @brief Run fn inside one write transaction; commits on return, rolls back on throw.
     * @throws LockedError when another process holds the write lock
     */
    void write(const std::function<void(SqliteConnection&)>& fn);

    /**
     * @brief Run fn against a consistent read snapshot.
     */
    void read(const std::function<void(SqliteConnection&)>& fn);

    const std::filesystem::path& path() const { return db_path_; }

private:
    std::unique_ptr<SqliteConnection> acquire_reader();
    void release_reader(std::unique_ptr<SqliteConnection> conn);

    std::filesystem::path db_path_;
    std::filesystem::path lock_path_;
    int busy_timeout_ms_;

    std::mutex write_mutex_;
    SqliteConnection writer_;

    std::mutex pool_mutex_;
    std::vector<std::unique_ptr<SqliteConnection>> idle_readers_;
};

} // namespace Lexicore
