/**
 * @file store.cpp
 * @brief Store locking and connection pool
 */

#include <storage/store.hpp>
#include <core/errors.hpp>
#include <storage/file_lock.hpp>
#include <storage/schema.hpp>
#include <utils/logger.hpp>

namespace Lexicore {

namespace {

constexpr std::size_t MAX_IDLE_READERS = 8;

} // namespace

Store::Store(const std::filesystem::path& db_path, const std::filesystem::path& lock_path, int busy_timeout_ms)
    : db_path_(db_path), lock_path_(lock_path), busy_timeout_ms_(busy_timeout_ms),
      writer_(db_path, SqliteConnection::Mode::ReadWrite, busy_timeout_ms) {
    auto mode = writer_.query_single("PRAGMA journal_mode = WAL");
    if (!mode || *mode != "wal") {
        Logger::warn("Store " + db_path_.string() + " is not in WAL mode (" + mode.value_or("?") +
                     "); readers may block on writes");
    }
    writer_.execute("PRAGMA synchronous = NORMAL");

    // Opening an initialized store must not need the write lock.
    if (writer_.query_single("PRAGMA user_version").value_or("0") != std::to_string(SCHEMA_VERSION)) {
        write([](SqliteConnection& db) { ensure_schema(db); });
    }
}

Store::~Store() = default;

void Store::write(const std::function<void(SqliteConnection&)>& fn) {
    std::lock_guard<std::mutex> guard(write_mutex_);
    FileLock lock(lock_path_);
    SqliteConnection::Transaction tx(writer_, true);
    fn(writer_);
    tx.commit();
}

std::unique_ptr<SqliteConnection> Store::acquire_reader() {
    {
        std::lock_guard<std::mutex> guard(pool_mutex_);
        if (!idle_readers_.empty()) {
            auto conn = std::move(idle_readers_.back());
            idle_readers_.pop_back();
            return conn;
        }
    }
    return std::make_unique<SqliteConnection>(db_path_, SqliteConnection::Mode::ReadOnly, busy_timeout_ms_);
}

void Store::release_reader(std::unique_ptr<SqliteConnection> conn) {
    if (conn->in_transaction()) {
        return; // drop connections left in an unknown state
    }
    std::lock_guard<std::mutex> guard(pool_mutex_);
    if (idle_readers_.size() < MAX_IDLE_READERS) {
        idle_readers_.push_back(std::move(conn));
    }
}

void Store::read(const std::function<void(SqliteConnection&)>& fn) {
    auto conn = acquire_reader();
    {
        SqliteConnection::Transaction tx(*conn, false);
        fn(*conn);
        tx.commit();
    }
    release_reader(std::move(conn));
}

} // namespace Lexicore
