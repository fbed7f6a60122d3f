#pragma once
///@file

#include "arbor/util/file-descriptor.hh"

#include <filesystem>
#include <list>
#include <set>
#include <utility>

namespace arbor {

/**
 * Open a lock file, creating it if `create` is set. Returns an empty
 * descriptor if the file does not exist and `create` is false.
 */
AutoCloseFD openLockFile(const std::filesystem::path & path, bool create);

/**
 * Remove a lock file that is held through `desc`, so that processes
 * waiting on it retry with a fresh file.
 */
void deleteLockFile(const std::filesystem::path & path, Descriptor desc);

enum LockType { ltRead, ltWrite, ltNone };

/**
 * flock() `desc`. Returns false if `wait` is false and the lock is
 * held elsewhere.
 */
bool lockFile(Descriptor desc, LockType lockType, bool wait);

/**
 * Like `lockFile()` with `wait`, but gives up after `timeout` seconds
 * (0 waits forever).
 */
bool lockFileWithTimeout(Descriptor desc, LockType lockType, unsigned int timeout);

/**
 * Exclusively lock `lockPath`, retrying while the lock turns out to
 * be on a deleted file. Release it with `deleteLockFile()`.
 *
 * @param identity What the lock protects, for messages.
 */
AutoCloseFD
acquireExclusiveFileLock(const std::filesystem::path & lockPath, unsigned int timeout, std::string_view identity);

/**
 * Exclusive locks on `<path>.lock` for a set of paths, released on
 * destruction.
 */
class PathLocks
{
    std::list<std::pair<Descriptor, std::filesystem::path>> fds;
    bool deletePaths;

public:
    PathLocks();
    PathLocks(const std::set<std::filesystem::path> & paths, const std::string & waitMsg = "");

    PathLocks(PathLocks && other) noexcept
        : fds(std::exchange(other.fds, {}))
        , deletePaths(other.deletePaths)
    {
    }

    PathLocks & operator=(PathLocks && other) noexcept
    {
        unlock();
        fds = std::exchange(other.fds, {});
        deletePaths = other.deletePaths;
        return *this;
    }

    PathLocks(const PathLocks &) = delete;
    PathLocks & operator=(const PathLocks &) = delete;

    ~PathLocks();

    /**
     * Returns false, holding nothing, if `wait` is false and some path
     * is locked elsewhere.
     */
    bool lockPaths(const std::set<std::filesystem::path> & paths, const std::string & waitMsg = "", bool wait = true);

    void unlock();

    /**
     * Delete the lock files when unlocking.
     */
    void setDeletion(bool deletePaths);
};

} // namespace arbor
