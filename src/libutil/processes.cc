#include "arbor/util/processes.hh"
#include "arbor/util/finally.hh"
#include "arbor/util/logging.hh"
#include "arbor/util/signals.hh"

#include <cstring>
#include <iostream>

#include <sched.h>
#include <sys/mman.h>
#include <sys/prctl.h>
#include <sys/wait.h>
#include <unistd.h>

namespace arbor {

Pid & Pid::operator=(Pid && other)
{
    if (this != &other) {
        if (pid != -1)
            kill();
        pid = std::exchange(other.pid, -1);
        killSignal = other.killSignal;
    }
    return *this;
}

Pid::~Pid()
{
    if (pid == -1)
        return;
    try {
        kill();
    } catch (...) {
        ignoreExceptionInDestructor();
    }
}

int Pid::kill()
{
    debug("sending signal %d to process %d", killSignal, pid);

    if (::kill(pid, killSignal) == -1 && errno != ESRCH)
        logError(SysError("sending signal %d to process %d", killSignal, pid).info());

    return wait();
}

int Pid::wait()
{
    int status;
    while (waitpid(pid, &status, 0) == -1) {
        if (errno != EINTR)
            throw SysError("waiting for process %d", pid);
        checkInterrupt();
    }
    pid = -1;
    return status;
}

[[noreturn]]
static void runChild(const std::function<void()> & fun, const ProcessOptions & options)
{
    logger = makeSimpleLogger();
    try {
        if (options.dieWithParent && prctl(PR_SET_PDEATHSIG, SIGKILL) == -1)
            throw SysError("setting parent death signal");
        fun();
    } catch (std::exception & e) {
        std::cerr << e.what() << "\n";
    }
    _exit(1);
}

static int cloneEntry(void * arg)
{
    auto & [fun, options] = *static_cast<std::pair<const std::function<void()> &, const ProcessOptions &> *>(arg);
    runChild(fun, options);
}

pid_t startProcess(std::function<void()> fun, const ProcessOptions & options)
{
    if (!options.cloneFlags) {
        pid_t pid = fork();
        if (pid == -1)
            throw SysError("forking");
        if (pid == 0)
            runChild(fun, options);
        return pid;
    }

    if (options.cloneFlags & CLONE_VM)
        throw Error("cannot start a process that shares memory with arbor");

    /* Without CLONE_VM the child gets its own copy of this stack, so it
       can be released as soon as clone() returns. */
    constexpr size_t stackSize = 1024 * 1024;
    auto stack = static_cast<char *>(
        mmap(nullptr, stackSize, PROT_READ | PROT_WRITE, MAP_PRIVATE | MAP_ANONYMOUS | MAP_STACK, -1, 0));
    if (stack == MAP_FAILED)
        throw SysError("allocating a stack for the child process");
    Finally releaseStack([&]() { munmap(stack, stackSize); });

    std::pair<const std::function<void()> &, const ProcessOptions &> arg{fun, options};
    pid_t pid = clone(cloneEntry, stack + stackSize, options.cloneFlags | SIGCHLD, &arg);
    if (pid == -1)
        throw SysError("cloning a child process");
    return pid;
}

std::string statusToString(int status)
{
    if (statusOk(status))
        return "succeeded";
    if (WIFEXITED(status))
        return fmt("failed with exit code %d", WEXITSTATUS(status));
    if (WIFSIGNALED(status))
        return fmt("failed due to signal %d (%s)", WTERMSIG(status), strsignal(WTERMSIG(status)));
    return "died abnormally";
}

bool statusOk(int status)
{
    return WIFEXITED(status) && WEXITSTATUS(status) == 0;
}

} // namespace arbor
