#ifndef WEAVE_ASYNC_LIMITER_HPP
#define WEAVE_ASYNC_LIMITER_HPP

#include <chrono>
#include <future>
#include <mutex>
#include <optional>
#include <utility>

#include "weave/async/queue.hpp"

namespace weave::async {

/**
 * @brief Settings of a RateLimitedQueue.
 */
struct RateLimitOptions {
    /// Maximum task starts per second; 0 disables the limit.
    double rateLimit{0.0};
};

/**
 * @brief Enforces a minimum interval between consecutive starts.
 *
 * Thread-safe. acquire() blocks until at least the interval has elapsed
 * since the previous acquire() returned, then records the new start.
 * Concurrent callers are served one at a time.
 */
class IntervalGate {
public:
    using Clock = std::chrono::steady_clock;

    /**
     * @param rate_limit Starts per second, 0 for no limit.
     * @throws weave::error::InvalidArgument if rate_limit is negative.
     */
    explicit IntervalGate(double rate_limit);

    /**
     * @brief Waits for the next permitted start and claims it.
     */
    void acquire();

    [[nodiscard]] auto interval() const noexcept
        -> std::chrono::nanoseconds {
        return interval_;
    }

private:
    std::chrono::nanoseconds interval_;
    std::optional<Clock::time_point> last_start_;
    std::mutex mutex_;
};

/**
 * @brief Serial queue that enforces a floor on the time between starts.
 *
 * Wraps a concurrency-1 Queue. Before each task starts the worker waits
 * until 1000 / rateLimit milliseconds have passed since the previous start,
 * regardless of how long the previous task ran.
 */
template <typename T = void>
class RateLimitedQueue {
public:
    explicit RateLimitedQueue(RateLimitOptions options = {})
        : gate_(options.rateLimit), queue_(QueueOptions{1}) {}

    std::future<T> add(QueueTask<T> task) {
        if (!task) {
            THROW_INVALID_ARGUMENT("RateLimitedQueue rejects an empty task");
        }
        return queue_.add([this, task = std::move(task)]() -> T {
            gate_.acquire();
            return task();
        });
    }

    void pause() { queue_.pause(); }
    void resume() { queue_.resume(); }
    void clear() { queue_.clear(); }
    void waitIdle() { queue_.waitIdle(); }

    [[nodiscard]] std::size_t size() const { return queue_.size(); }
    [[nodiscard]] std::size_t pending() const { return queue_.pending(); }

    [[nodiscard]] auto interval() const noexcept {
        return gate_.interval();
    }

private:
    IntervalGate gate_;
    Queue<T> queue_;
};

}  // namespace weave::async

#endif  // WEAVE_ASYNC_LIMITER_HPP
