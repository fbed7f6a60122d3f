#include "arbor/util/thread-pool.hh"
#include "arbor/util/logging.hh"
#include "arbor/util/signals.hh"

#include <algorithm>

namespace arbor {

ThreadPool::ThreadPool(size_t maxThreads)
    : maxThreads(maxThreads ? maxThreads : std::max(1u, std::thread::hardware_concurrency()))
{
    debug("thread pool allows %d threads", this->maxThreads);
}

ThreadPool::~ThreadPool()
{
    shutdown();
}

void ThreadPool::shutdown()
{
    std::vector<std::thread> workers;
    {
        auto state(state_.lock());
        stopping = true;
        workers.swap(state->workers);
    }

    wakeup.notify_all();

    for (auto & worker : workers)
        worker.join();
}

void ThreadPool::enqueue(work_t item)
{
    auto state(state_.lock());
    if (stopping)
        throw ThreadPoolShutDown("thread pool is no longer accepting work");

    state->queue.push_back(std::move(item));

    /* The thread in process() counts as one worker. */
    auto threads = state->workers.size() + 1;
    if (state->queue.size() > threads && threads < maxThreads)
        state->workers.emplace_back([this]() { run(false); });

    wakeup.notify_one();
}

void ThreadPool::process()
{
    state_.lock()->draining = true;

    run(true);

    /* Join before rethrowing: items still running on other threads may
       refer to the caller's stack. */
    shutdown();

    if (auto failure = state_.lock()->failure)
        std::rethrow_exception(failure);
}

void ThreadPool::fail(State & state, std::exception_ptr failure)
{
    if (!state.failure) {
        state.failure = failure;
        stopping = true;
        wakeup.notify_all();
        return;
    }

    try {
        std::rethrow_exception(failure);
    } catch (Interrupted &) {
    } catch (ThreadPoolShutDown &) {
    } catch (std::exception & e) {
        printError("error (ignored): %s", e.what());
    } catch (...) {
        printError("error (ignored): unknown exception");
    }
}

void ThreadPool::run(bool caller)
{
    if (!caller)
        interruptCheck = [this]() { return stopping.load(); };

    while (true) {
        work_t item;
        {
            auto state(state_.lock());
            while (!stopping && state->queue.empty()) {
                if (state->draining && state->running == 0) {
                    stopping = true;
                    wakeup.notify_all();
                } else
                    state.wait(wakeup);
            }
            if (stopping)
                return;
            item = std::move(state->queue.front());
            state->queue.pop_front();
            state->running++;
        }

        std::exception_ptr failure;
        try {
            item();
        } catch (...) {
            failure = std::current_exception();
        }

        auto state(state_.lock());
        state->running--;
        if (failure)
            fail(*state, failure);
    }
}

} // namespace arbor
