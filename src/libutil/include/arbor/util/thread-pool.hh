#pragma once
///@file

#include "arbor/util/error.hh"
#include "arbor/util/sync.hh"

#include <atomic>
#include <condition_variable>
#include <deque>
#include <functional>
#include <map>
#include <set>
#include <thread>
#include <vector>

namespace arbor {

MakeError(ThreadPoolShutDown, Error);

/**
 * Runs queued work items on up to `maxThreads` threads, one of which
 * is the thread calling process(). Worker threads are started lazily
 * as the queue grows.
 */
class ThreadPool
{
public:

    typedef std::function<void()> work_t;

    /**
     * @param maxThreads 0 means one thread per hardware core.
     */
    ThreadPool(size_t maxThreads = 0);

    ~ThreadPool();

    /**
     * Queue `item`. Work items may call this themselves.
     *
     * @throws ThreadPoolShutDown once the pool has stopped.
     */
    void enqueue(work_t item);

    /**
     * Run queued items until the queue is empty and nothing is
     * running, then stop the pool.
     *
     * The first exception thrown by an item stops the pool and is
     * rethrown here once all workers have exited. Exceptions thrown
     * concurrently by other items are logged and dropped.
     */
    void process();

private:

    struct State
    {
        std::deque<work_t> queue;
        size_t running = 0;
        bool draining = false;
        std::exception_ptr failure;
        std::vector<std::thread> workers;
    };

    size_t maxThreads;

    std::atomic_bool stopping{false};

    Sync<State> state_;

    std::condition_variable wakeup;

    void run(bool caller);

    void fail(State & state, std::exception_ptr failure);

    void shutdown();
};

/**
 * Call `processNode` on every element of `nodes` in parallel, starting
 * a node only after every node in `getEdges(node)` has finished.
 * Edges pointing outside `nodes` and self edges are ignored.
 *
 * @throws Error if the edges form a cycle.
 */
template<typename T>
void processGraph(
    const std::set<T> & nodes,
    std::function<std::set<T>(const T &)> getEdges,
    std::function<void(const T &)> processNode,
    size_t maxThreads = 0)
{
    struct Graph
    {
        std::map<T, size_t> unfinishedDeps;
        std::map<T, std::vector<T>> dependents;
        size_t unprocessed = 0;
    };

    Graph initial;
    initial.unprocessed = nodes.size();
    for (auto & node : nodes) {
        auto & count = initial.unfinishedDeps[node];
        for (auto & dep : getEdges(node))
            if (dep != node && nodes.count(dep)) {
                count++;
                initial.dependents[dep].push_back(node);
            }
    }

    std::vector<T> roots;
    for (auto & [node, count] : initial.unfinishedDeps)
        if (count == 0)
            roots.push_back(node);

    if (roots.empty() && !nodes.empty())
        throw Error("cannot process graph: every node is part of a dependency cycle");

    Sync<Graph> graph_(std::move(initial));

    std::function<void(const T &)> visit;

    /* Declared last so that its threads are joined before `visit` and
       `graph_` are destroyed. */
    ThreadPool pool(maxThreads);

    visit = [&](const T & node) {
        processNode(node);

        std::vector<T> ready;
        {
            auto graph(graph_.lock());
            graph->unprocessed--;
            for (auto & dependent : graph->dependents[node])
                if (--graph->unfinishedDeps[dependent] == 0)
                    ready.push_back(dependent);
        }

        for (auto & next : ready)
            pool.enqueue([&visit, next]() { visit(next); });
    };

    for (auto & node : roots)
        pool.enqueue([&visit, node]() { visit(node); });

    pool.process();

    if (auto left = graph_.lock()->unprocessed)
        throw Error("cannot process graph: %d nodes are part of a dependency cycle", left);
}

} // namespace arbor
