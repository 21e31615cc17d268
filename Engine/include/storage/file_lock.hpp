/**
 * @file file_lock.hpp
 * @brief Advisory, non-blocking cross-process lock on a file
 */

#pragma once

#include <filesystem>

namespace Lexicore {

/**
 * @brief Exclusive flock() held for the lifetime of the object.
 *
 * Never waits: a lock held elsewhere throws LockedError immediately.
 * The lock file itself is left in place; stale lock files are harmless
 * because the kernel drops the lock when its holder exits.
 */
class FileLock {
public:
    explicit FileLock(const std::filesystem::path& path);
    ~FileLock();

    FileLock(const FileLock&) = delete;
    FileLock& operator=(const FileLock&) = delete;

private:
    int fd_ = -1;
};

} // namespace Lexicore
