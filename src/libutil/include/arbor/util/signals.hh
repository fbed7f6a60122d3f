#pragma once
///@file

#include "arbor/util/error.hh"

#include <atomic>
#include <functional>

#include <signal.h>

namespace arbor {

MakeError(Interrupted, BaseError);

/**
 * Set by the signal handler thread on SIGINT, SIGTERM or SIGHUP.
 */
extern std::atomic<bool> _isInterrupted;

/**
 * Additional stop condition for the current thread. Thread pool
 * workers use it to stop once another work item has failed.
 */
extern thread_local std::function<bool()> interruptCheck;

void _interrupted();

static inline bool getInterrupted()
{
    return _isInterrupted;
}

/**
 * Throw `Interrupted` if the user asked arbor to stop or the current
 * thread's `interruptCheck` fires. Throws at most once per thread.
 */
inline void checkInterrupt()
{
    if (_isInterrupted || (interruptCheck && interruptCheck()))
        _interrupted();
}

/**
 * Record that the current thread has already handled an interrupt.
 */
void setInterruptThrown();

/**
 * Block SIGINT, SIGTERM, SIGHUP and SIGPIPE in the calling thread (and
 * so in every thread it starts later) and wait for them on a
 * dedicated thread instead.
 */
void startSignalHandlerThread();

/**
 * Undo `startSignalHandlerThread()`'s mask. Called in forked children
 * before exec.
 */
void restoreSignals();

} // namespace arbor
