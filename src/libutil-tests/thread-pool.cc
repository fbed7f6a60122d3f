#include <gtest/gtest.h>

#include "arbor/util/thread-pool.hh"

#include <algorithm>
#include <atomic>
#include <chrono>
#include <mutex>
#include <string>
#include <vector>

namespace arbor {

TEST(ThreadPool, runsAllWorkItems)
{
    std::atomic<int> count{0};

    ThreadPool pool(4);
    for (int i = 0; i < 100; ++i)
        pool.enqueue([&]() { ++count; });
    pool.process();

    ASSERT_EQ(count.load(), 100);
}

TEST(ThreadPool, workItemsMayEnqueueMore)
{
    std::atomic<int> count{0};

    ThreadPool pool(2);
    pool.enqueue([&]() {
        for (int i = 0; i < 10; ++i)
            pool.enqueue([&]() { ++count; });
    });
    pool.process();

    ASSERT_EQ(count.load(), 10);
}

TEST(ThreadPool, rethrowsFirstException)
{
    ThreadPool pool(2);
    pool.enqueue([]() { throw Error("stage failed"); });

    ASSERT_THROW(pool.process(), Error);
}

TEST(ThreadPool, enqueueAfterShutdownThrows)
{
    ThreadPool pool(1);
    pool.enqueue([]() {});
    pool.process();

    ASSERT_THROW(pool.enqueue([]() {}), ThreadPoolShutDown);
}

/* ----------------------------------------------------------------------------
 * processGraph
 * --------------------------------------------------------------------------*/

TEST(processGraph, dependenciesRunFirst)
{
    std::map<std::string, std::set<std::string>> deps{
        {"build", {}},
        {"tree", {"build"}},
        {"image", {"tree", "build"}},
        {"other", {}},
    };

    std::mutex mutex;
    std::vector<std::string> order;

    processGraph<std::string>(
        {"build", "tree", "image", "other"},
        [&](const std::string & node) { return deps[node]; },
        [&](const std::string & node) {
            std::lock_guard<std::mutex> lock(mutex);
            order.push_back(node);
        },
        4);

    ASSERT_EQ(order.size(), 4u);
    auto pos = [&](const std::string & s) { return std::find(order.begin(), order.end(), s) - order.begin(); };
    ASSERT_LT(pos("build"), pos("tree"));
    ASSERT_LT(pos("tree"), pos("image"));
}

TEST(processGraph, independentNodesRunConcurrently)
{
    std::atomic<int> running{0};
    std::atomic<int> maxRunning{0};

    processGraph<int>(
        {1, 2, 3},
        [](const int &) { return std::set<int>{}; },
        [&](const int &) {
            auto now = ++running;
            int prev = maxRunning;
            while (now > prev && !maxRunning.compare_exchange_weak(prev, now))
                ;
            std::this_thread::sleep_for(std::chrono::milliseconds(100));
            --running;
        },
        3);

    ASSERT_GE(maxRunning.load(), 2);
}

TEST(processGraph, propagatesExceptions)
{
    std::atomic<bool> dependentRan{false};

    ASSERT_THROW(
        processGraph<int>(
            {1, 2},
            [](const int & n) { return n == 2 ? std::set<int>{1} : std::set<int>{}; },
            [&](const int & n) {
                if (n == 1)
                    throw Error("node 1 failed");
                dependentRan = true;
            },
            2),
        Error);

    ASSERT_FALSE(dependentRan);
}

TEST(processGraph, cycleIsReported)
{
    ASSERT_THROW(
        processGraph<int>(
            {1, 2}, [](const int & n) { return std::set<int>{n == 1 ? 2 : 1}; }, [](const int &) {}, 2),
        Error);
}

} // namespace arbor
