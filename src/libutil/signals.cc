#include "arbor/util/signals.hh"

#include <thread>

namespace arbor {

std::atomic<bool> _isInterrupted = false;

thread_local std::function<bool()> interruptCheck;

/* Set once this thread has thrown `Interrupted`. */
static thread_local bool interruptThrown = false;

void setInterruptThrown()
{
    interruptThrown = true;
}

void _interrupted()
{
    /* Never throw while another exception is propagating, or from
       a thread that has already been told. */
    if (interruptThrown || std::uncaught_exceptions())
        return;
    interruptThrown = true;
    throw Interrupted("interrupted by the user");
}

static sigset_t originalMask;
static bool originalMaskSaved = false;

static void waitForSignals(sigset_t signals)
{
    while (true) {
        int sig = 0;
        if (sigwait(&signals, &sig) != 0)
            continue;
        if (sig != SIGPIPE)
            _isInterrupted = true;
    }
}

void startSignalHandlerThread()
{
    if (sigprocmask(SIG_BLOCK, nullptr, &originalMask) == -1)
        throw SysError("querying signal mask");
    originalMaskSaved = true;

    /* Every thread started after this point inherits the mask, so only
       the waiter below ever sees these signals. SIGPIPE is blocked so
       that writes to a closed pipe fail with EPIPE instead. */
    sigset_t signals;
    sigemptyset(&signals);
    for (auto sig : {SIGINT, SIGTERM, SIGHUP, SIGPIPE})
        sigaddset(&signals, sig);
    if (auto err = pthread_sigmask(SIG_BLOCK, &signals, nullptr))
        throw SysError(err, "blocking termination signals");

    std::thread(waitForSignals, signals).detach();
}

void restoreSignals()
{
    if (originalMaskSaved && sigprocmask(SIG_SETMASK, &originalMask, nullptr) == -1)
        throw SysError("restoring signal mask");
}

} // namespace arbor
