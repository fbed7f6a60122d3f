#include "arbor/store/pathlocks.hh"
#include "arbor/util/logging.hh"
#include "arbor/util/signals.hh"

#include <cassert>
#include <cerrno>
#include <chrono>
#include <functional>
#include <thread>

#include <fcntl.h>
#include <sys/file.h>
#include <sys/stat.h>
#include <unistd.h>

using namespace std::chrono_literals;

namespace arbor {

AutoCloseFD openLockFile(const std::filesystem::path & path, bool create)
{
    AutoCloseFD fd(open(path.c_str(), O_CLOEXEC | O_RDWR | (create ? O_CREAT : 0), 0600));
    if (!fd && (create || errno != ENOENT))
        throw SysError("opening lock file '%s'", path.string());
    return fd;
}

void deleteLockFile(const std::filesystem::path & path, Descriptor desc)
{
    /* Processes blocked on this file notice the deletion through the
       marker byte, or through st_nlink == 0 if writing it fails. The
       marker is only written once the file is gone from `path`,
       otherwise it would poison every later lock. */
    if (unlink(path.c_str()) == -1)
        return;
    if (write(desc, "d", 1) != 1)
        debug("cannot mark lock file '%s' as deleted", path.string());
}

static int flockOperation(LockType lockType)
{
    switch (lockType) {
    case ltRead:
        return LOCK_SH;
    case ltWrite:
        return LOCK_EX;
    case ltNone:
        return LOCK_UN;
    }
    unreachable();
}

bool lockFile(Descriptor desc, LockType lockType, bool wait)
{
    auto op = flockOperation(lockType) | (wait ? 0 : LOCK_NB);

    while (flock(desc, op) != 0) {
        checkInterrupt();
        if (!wait && errno == EWOULDBLOCK)
            return false;
        if (errno != EINTR)
            throw SysError("acquiring/releasing lock");
    }

    return true;
}

bool lockFileWithTimeout(Descriptor desc, LockType lockType, unsigned int timeout)
{
    if (timeout == 0)
        return lockFile(desc, lockType, true);

    /* flock() cannot time out, so poll. */
    auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(timeout);
    std::chrono::steady_clock::duration delay = 10ms;

    while (!lockFile(desc, lockType, false)) {
        auto now = std::chrono::steady_clock::now();
        if (now >= deadline)
            return false;
        std::this_thread::sleep_for(std::min(delay, deadline - now));
        delay = std::min<std::chrono::steady_clock::duration>(delay * 2, 500ms);
    }

    return true;
}

/**
 * Whether the lock held through `fd` no longer protects `path`: the
 * previous holder deleted the file, or another file has replaced it.
 */
static bool lockIsStale(Descriptor fd, const std::filesystem::path & path)
{
    struct stat st;
    if (fstat(fd, &st) == -1)
        throw SysError("statting lock file '%s'", path.string());

    if (st.st_size != 0) {
        /* A marked file that is still linked would be reopened
           forever. */
        if (st.st_nlink > 0)
            unlink(path.c_str());
        return true;
    }

    if (st.st_nlink == 0)
        return true;

    struct stat current;
    if (stat(path.c_str(), &current) == -1)
        return true;

    return st.st_ino != current.st_ino || st.st_dev != current.st_dev;
}

/**
 * Lock `lockPath` exclusively. Calls `waiting` before blocking. Returns
 * an empty descriptor if `wait` is false and someone else holds the
 * lock.
 */
static AutoCloseFD lockExclusive(
    const std::filesystem::path & lockPath, bool wait, unsigned int timeout, const std::function<void()> & waiting)
{
    while (true) {
        checkInterrupt();

        auto fd = openLockFile(lockPath, true);

        if (!lockFile(fd.get(), ltWrite, false)) {
            if (!wait)
                return {};
            waiting();
            if (!lockFileWithTimeout(fd.get(), ltWrite, timeout))
                throw Error("timed out after %d seconds waiting for lock '%s'", timeout, lockPath.string());
        }

        if (!lockIsStale(fd.get(), lockPath)) {
            debug("lock acquired on '%s'", lockPath.string());
            return fd;
        }

        debug("lock file '%s' has become stale, retrying", lockPath.string());
    }
}

AutoCloseFD
acquireExclusiveFileLock(const std::filesystem::path & lockPath, unsigned int timeout, std::string_view identity)
{
    return lockExclusive(lockPath, true, timeout, [&]() {
        if (timeout > 0)
            printInfo("waiting up to %d seconds for the lock on '%s'...", timeout, identity);
        else
            printInfo("waiting for the lock on '%s'...", identity);
    });
}

bool PathLocks::lockPaths(const std::set<std::filesystem::path> & paths, const std::string & waitMsg, bool wait)
{
    assert(fds.empty());

    /* Locks are taken in sorted order so that overlapping sets cannot
       deadlock, and recorded one by one so that a failure releases
       only what is held. */
    for (auto & path : paths) {
        std::filesystem::path lockPath = path.string() + ".lock";

        auto fd = lockExclusive(lockPath, wait, 0, [&]() {
            if (!waitMsg.empty())
                printError(waitMsg);
        });

        if (!fd) {
            unlock();
            return false;
        }

        fds.emplace_back(fd.release(), lockPath);
    }

    return true;
}

void PathLocks::unlock()
{
    for (auto & [fd, lockPath] : fds) {
        if (deletePaths)
            deleteLockFile(lockPath, fd);

        if (close(fd) == -1)
            printError("error (ignored): cannot close lock file '%s'", lockPath.string());

        debug("lock released on '%s'", lockPath.string());
    }

    fds.clear();
}

PathLocks::PathLocks()
    : deletePaths(false)
{
}

PathLocks::PathLocks(const std::set<std::filesystem::path> & paths, const std::string & waitMsg)
    : deletePaths(false)
{
    lockPaths(paths, waitMsg);
}

PathLocks::~PathLocks()
{
    unlock();
}

void PathLocks::setDeletion(bool deletePaths)
{
    this->deletePaths = deletePaths;
}

} // namespace arbor
