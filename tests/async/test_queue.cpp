#include "weave/async/queue.hpp"

#include <gtest/gtest.h>

#include <algorithm>
#include <atomic>
#include <chrono>
#include <future>
#include <mutex>
#include <stdexcept>
#include <thread>
#include <vector>

using namespace weave::async;
using namespace std::chrono_literals;

class QueueTest : public ::testing::Test {
protected:
    void record(int id) {
        std::lock_guard lock(mutex);
        order.push_back(id);
    }

    std::mutex mutex;
    std::vector<int> order;
};

TEST_F(QueueTest, ReturnsTaskResult) {
    Queue<int> queue;
    auto result = queue.add([] { return 42; });
    EXPECT_EQ(result.get(), 42);
}

TEST_F(QueueTest, TaskErrorReachesFuture) {
    Queue<int> queue;
    auto result = queue.add([]() -> int { throw std::runtime_error("bad"); });
    EXPECT_THROW(result.get(), std::runtime_error);
    EXPECT_EQ(queue.add([] { return 1; }).get(), 1);
}

TEST_F(QueueTest, RunsInFifoOrder) {
    Queue<void> queue;
    queue.pause();
    std::vector<std::future<void>> futures;
    for (int i = 0; i < 5; ++i) {
        futures.push_back(queue.add([this, i] { record(i); }));
    }
    queue.resume();
    for (auto& future : futures) {
        future.get();
    }
    EXPECT_EQ(order, (std::vector<int>{0, 1, 2, 3, 4}));
}

TEST_F(QueueTest, ConcurrencyIsBounded) {
    Queue<void> queue(QueueOptions{.concurrency = 2});
    std::atomic<int> running{0};
    std::atomic<int> peak{0};

    std::vector<std::future<void>> futures;
    for (int i = 0; i < 5; ++i) {
        futures.push_back(queue.add([&] {
            int now = ++running;
            int seen = peak.load();
            while (now > seen && !peak.compare_exchange_weak(seen, now)) {
            }
            std::this_thread::sleep_for(100ms);
            --running;
        }));
    }

    auto start = std::chrono::steady_clock::now();
    for (auto& future : futures) {
        future.get();
    }
    auto elapsed = std::chrono::steady_clock::now() - start;

    EXPECT_EQ(peak.load(), 2);
    EXPECT_GE(elapsed, 280ms);
}

TEST_F(QueueTest, PauseHoldsQueuedTasks) {
    Queue<int> queue;
    queue.pause();
    EXPECT_TRUE(queue.isPaused());
    auto result = queue.add([] { return 1; });
    EXPECT_EQ(result.wait_for(100ms), std::future_status::timeout);
    EXPECT_EQ(queue.pending(), 1u);
    queue.resume();
    EXPECT_EQ(result.get(), 1);
}

TEST_F(QueueTest, ClearFailsQueuedTasks) {
    Queue<int> queue;
    queue.pause();
    auto first = queue.add([] { return 1; });
    auto second = queue.add([] { return 2; });
    queue.clear();
    EXPECT_EQ(queue.size(), 0u);
    EXPECT_THROW(first.get(), QueueClearedError);
    EXPECT_THROW(second.get(), QueueClearedError);
    queue.resume();
    EXPECT_EQ(queue.add([] { return 3; }).get(), 3);
}

TEST_F(QueueTest, ClearLeavesRunningTaskAlone) {
    Queue<int> queue;
    std::promise<void> started;
    auto running = queue.add([&] {
        started.set_value();
        std::this_thread::sleep_for(100ms);
        return 1;
    });
    started.get_future().wait();
    auto queued = queue.add([] { return 2; });
    EXPECT_EQ(queue.active(), 1u);
    queue.clear();
    EXPECT_EQ(running.get(), 1);
    EXPECT_THROW(queued.get(), QueueClearedError);
}

TEST_F(QueueTest, WaitIdleReturnsAfterDrain) {
    Queue<void> queue(QueueOptions{.concurrency = 3});
    std::atomic<int> done{0};
    for (int i = 0; i < 6; ++i) {
        queue.add([&] {
            std::this_thread::sleep_for(20ms);
            ++done;
        });
    }
    queue.waitIdle();
    EXPECT_EQ(done.load(), 6);
    EXPECT_EQ(queue.size(), 0u);
}

TEST_F(QueueTest, DestructionFailsUnstartedTasks) {
    std::future<int> orphan;
    {
        Queue<int> queue;
        queue.pause();
        orphan = queue.add([] { return 1; });
    }
    EXPECT_THROW(orphan.get(), QueueClearedError);
}

TEST_F(QueueTest, RejectsInvalidInput) {
    EXPECT_THROW(Queue<void>(QueueOptions{.concurrency = 0}),
                 weave::error::InvalidArgument);
    Queue<int> queue;
    EXPECT_THROW(queue.add(nullptr), weave::error::InvalidArgument);
}

TEST_F(QueueTest, PriorityQueueStartsHighestFirst) {
    PriorityQueue<void> queue;
    queue.pause();
    std::vector<std::future<void>> futures;
    futures.push_back(queue.add([this] { record(1); }, 1));
    futures.push_back(queue.add([this] { record(10); }, 10));
    futures.push_back(queue.add([this] { record(5); }, 5));
    futures.push_back(queue.add([this] { record(11); }, 10));
    futures.push_back(queue.add([this] { record(0); }));
    queue.resume();
    for (auto& future : futures) {
        future.get();
    }
    EXPECT_EQ(order, (std::vector<int>{10, 11, 5, 1, 0}));
}

TEST_F(QueueTest, PriorityQueueClearFailsEveryBucket) {
    PriorityQueue<int> queue;
    queue.pause();
    auto low = queue.add([] { return 1; }, -3);
    auto high = queue.add([] { return 2; }, 3);
    EXPECT_EQ(queue.pending(), 2u);
    queue.clear();
    EXPECT_THROW(low.get(), QueueClearedError);
    EXPECT_THROW(high.get(), QueueClearedError);
}
