#include <gtest/gtest.h>

#include "arbor/util/processes.hh"

#include <cerrno>

#include <signal.h>
#include <unistd.h>
#include <sys/wait.h>

namespace arbor {

TEST(Pid, waitReturnsExitStatus)
{
    Pid pid = startProcess([]() { _exit(3); });

    auto status = pid.wait();

    ASSERT_TRUE(WIFEXITED(status));
    ASSERT_EQ(WEXITSTATUS(status), 3);
    ASSERT_FALSE(statusOk(status));
    ASSERT_EQ(statusToString(status), "failed with exit code 3");
}

TEST(Pid, killTerminatesAndReaps)
{
    Pid pid = startProcess([]() {
        while (true)
            pause();
    });

    auto status = pid.kill();

    ASSERT_TRUE(WIFSIGNALED(status));
    ASSERT_EQ(WTERMSIG(status), SIGKILL);
    ASSERT_EQ((pid_t) pid, -1);
}

TEST(Pid, customKillSignal)
{
    Pid pid = startProcess([]() {
        while (true)
            pause();
    });
    pid.setKillSignal(SIGTERM);

    auto status = pid.kill();

    ASSERT_TRUE(WIFSIGNALED(status));
    ASSERT_EQ(WTERMSIG(status), SIGTERM);
}

TEST(Pid, destructorKillsRunningChild)
{
    pid_t raw;
    {
        Pid pid = startProcess([]() {
            while (true)
                pause();
        });
        raw = pid;
    }

    ASSERT_EQ(::kill(raw, 0), -1);
    ASSERT_EQ(errno, ESRCH);
}

TEST(startProcess, exceptionExitsWithStatusOne)
{
    Pid pid = startProcess([]() { throw Error("child failed"); });

    auto status = pid.wait();

    ASSERT_TRUE(WIFEXITED(status));
    ASSERT_EQ(WEXITSTATUS(status), 1);
}

TEST(statusToString, success)
{
    ASSERT_EQ(statusToString(0), "succeeded");
    ASSERT_TRUE(statusOk(0));
}

} // namespace arbor
