#pragma once
///@file

#include "arbor/util/types.hh"
#include "arbor/util/error.hh"

#include <functional>
#include <utility>

#include <signal.h>
#include <sys/types.h>

namespace arbor {

/**
 * A child process that is killed and reaped when this object goes out
 * of scope, unless wait() reaped it first.
 */
class Pid
{
    pid_t pid = -1;
    int killSignal = SIGKILL;

public:
    Pid() = default;

    Pid(pid_t pid)
        : pid(pid)
    {
    }

    Pid(Pid && other) noexcept
        : pid(std::exchange(other.pid, -1))
        , killSignal(other.killSignal)
    {
    }

    Pid & operator=(Pid && other);

    ~Pid();

    operator pid_t() const
    {
        return pid;
    }

    /**
     * Send the kill signal (SIGKILL unless changed) and reap the
     * child.
     *
     * @return The wait status.
     */
    int kill();

    /**
     * Block until the child exits.
     *
     * @return The wait status.
     */
    int wait();

    void setKillSignal(int signal)
    {
        killSignal = signal;
    }
};

struct ProcessOptions
{
    /**
     * Create the child with clone(2) and these namespace flags instead
     * of fork(2). Must not include CLONE_VM.
     */
    int cloneFlags = 0;

    /**
     * Have the kernel send SIGKILL to the child when arbor exits.
     */
    bool dieWithParent = true;
};

/**
 * Run `fun` in a child process. If `fun` returns or throws, the child
 * prints the error and exits with status 1 without running exit
 * handlers.
 */
pid_t startProcess(std::function<void()> fun, const ProcessOptions & options = {});

/**
 * Describe a wait status, e.g. "failed with exit code 3".
 */
std::string statusToString(int status);

/**
 * Whether the process exited normally with status 0.
 */
bool statusOk(int status);

} // namespace arbor
