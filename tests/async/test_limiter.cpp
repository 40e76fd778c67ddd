#include "weave/async/limiter.hpp"

#include <gtest/gtest.h>

#include <chrono>
#include <future>
#include <mutex>
#include <thread>
#include <vector>

using namespace weave::async;
using namespace std::chrono_literals;

class RateLimitedQueueTest : public ::testing::Test {
protected:
    using Clock = std::chrono::steady_clock;

    std::mutex mutex;
    std::vector<Clock::time_point> starts;
};

TEST_F(RateLimitedQueueTest, EnforcesStartInterval) {
    RateLimitedQueue<void> queue(RateLimitOptions{.rateLimit = 10.0});
    EXPECT_EQ(queue.interval(), 100ms);

    std::vector<std::future<void>> futures;
    for (int i = 0; i < 4; ++i) {
        futures.push_back(queue.add([this] {
            std::lock_guard lock(mutex);
            starts.push_back(Clock::now());
        }));
    }
    for (auto& future : futures) {
        future.get();
    }

    ASSERT_EQ(starts.size(), 4u);
    for (std::size_t i = 1; i < starts.size(); ++i) {
        EXPECT_GE(starts[i] - starts[i - 1], 99ms);
    }
}

TEST_F(RateLimitedQueueTest, LongTaskCountsTowardInterval) {
    RateLimitedQueue<void> queue(RateLimitOptions{.rateLimit = 10.0});
    auto first = queue.add([this] {
        {
            std::lock_guard lock(mutex);
            starts.push_back(Clock::now());
        }
        std::this_thread::sleep_for(150ms);
    });
    auto second = queue.add([this] {
        std::lock_guard lock(mutex);
        starts.push_back(Clock::now());
    });
    first.get();
    second.get();
    ASSERT_EQ(starts.size(), 2u);
    EXPECT_GE(starts[1] - starts[0], 150ms);
    EXPECT_LT(starts[1] - starts[0], 240ms);
}

TEST_F(RateLimitedQueueTest, ZeroRateMeansNoLimit) {
    RateLimitedQueue<int> queue;
    EXPECT_EQ(queue.interval(), 0ns);
    auto start = Clock::now();
    std::vector<std::future<int>> futures;
    for (int i = 0; i < 10; ++i) {
        futures.push_back(queue.add([i] { return i; }));
    }
    for (int i = 0; i < 10; ++i) {
        EXPECT_EQ(futures[i].get(), i);
    }
    EXPECT_LT(Clock::now() - start, 500ms);
}

TEST_F(RateLimitedQueueTest, ClearFailsQueuedTasks) {
    RateLimitedQueue<int> queue(RateLimitOptions{.rateLimit = 1.0});
    queue.pause();
    auto dropped = queue.add([] { return 1; });
    queue.clear();
    EXPECT_THROW(dropped.get(), QueueClearedError);
}

TEST_F(RateLimitedQueueTest, RejectsNegativeRate) {
    EXPECT_THROW(RateLimitedQueue<void>(RateLimitOptions{.rateLimit = -1.0}),
                 weave::error::InvalidArgument);
}
