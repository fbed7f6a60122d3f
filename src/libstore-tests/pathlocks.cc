#include <gtest/gtest.h>

#include "arbor/store/pathlocks.hh"
#include "arbor/util/file-system.hh"
#include "arbor/util/processes.hh"

#include <atomic>
#include <thread>

#include <sys/stat.h>
#include <sys/wait.h>
#include <unistd.h>

namespace arbor {

class PathLocksTest : public ::testing::Test
{
    std::unique_ptr<AutoDelete> delTmpDir;

protected:
    std::filesystem::path tmpDir;

    void SetUp() override
    {
        tmpDir = createTempDir();
        delTmpDir = std::make_unique<AutoDelete>(tmpDir, true);
    }

    void TearDown() override
    {
        delTmpDir.reset();
    }
};

TEST_F(PathLocksTest, writeLockIsExclusive)
{
    auto lockPath = tmpDir / "objects.lock";
    auto fd1 = openLockFile(lockPath, true);
    auto fd2 = openLockFile(lockPath, true);

    ASSERT_TRUE(lockFile(fd1.get(), ltWrite, false));
    ASSERT_FALSE(lockFile(fd2.get(), ltWrite, false));

    ASSERT_TRUE(lockFile(fd1.get(), ltNone, false));
    ASSERT_TRUE(lockFile(fd2.get(), ltWrite, false));
}

TEST_F(PathLocksTest, readLocksAreShared)
{
    auto lockPath = tmpDir / "objects.lock";
    auto fd1 = openLockFile(lockPath, true);
    auto fd2 = openLockFile(lockPath, true);

    ASSERT_TRUE(lockFile(fd1.get(), ltRead, false));
    ASSERT_TRUE(lockFile(fd2.get(), ltRead, false));
}

TEST_F(PathLocksTest, openWithoutCreateOnMissingFile)
{
    auto fd = openLockFile(tmpDir / "missing.lock", false);

    ASSERT_FALSE(fd);
}

TEST_F(PathLocksTest, timeoutExpires)
{
    auto lockPath = tmpDir / "objects.lock";
    auto fd1 = openLockFile(lockPath, true);
    auto fd2 = openLockFile(lockPath, true);

    ASSERT_TRUE(lockFileWithTimeout(fd1.get(), ltWrite, 1));
    ASSERT_FALSE(lockFileWithTimeout(fd2.get(), ltWrite, 1));
}

TEST_F(PathLocksTest, pathLocksExcludeOtherProcesses)
{
    auto path = tmpDir / "abc123";

    PathLocks locks({path});

    /* A child process cannot take the same lock while we hold it. */
    Pid pid = startProcess([&]() {
        PathLocks theirs;
        _exit(theirs.lockPaths({path}, "", false) ? 1 : 0);
    });
    ASSERT_EQ(WEXITSTATUS(pid.wait()), 0);

    locks.unlock();

    Pid pid2 = startProcess([&]() {
        PathLocks theirs;
        _exit(theirs.lockPaths({path}, "", false) ? 0 : 1);
    });
    ASSERT_EQ(WEXITSTATUS(pid2.wait()), 0);
}

TEST_F(PathLocksTest, deletionRemovesLockFile)
{
    auto path = tmpDir / "abc123";
    {
        PathLocks locks({path});
        ASSERT_TRUE(pathExists((tmpDir / "abc123.lock").string()));
        locks.setDeletion(true);
    }
    ASSERT_FALSE(pathExists((tmpDir / "abc123.lock").string()));
}

TEST_F(PathLocksTest, exclusiveFileLockWaitsForHolder)
{
    auto lockPath = tmpDir / "source.lock";

    auto fd = acquireExclusiveFileLock(lockPath, 0, "source");

    std::atomic<bool> acquired{false};
    std::thread other([&]() {
        auto fd2 = acquireExclusiveFileLock(lockPath, 0, "source");
        acquired = true;
        deleteLockFile(lockPath, fd2.get());
    });

    std::this_thread::sleep_for(std::chrono::milliseconds(100));
    ASSERT_FALSE(acquired);

    deleteLockFile(lockPath, fd.get());
    fd.close();
    other.join();

    ASSERT_TRUE(acquired);
}

} // namespace arbor
