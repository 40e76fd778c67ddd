#ifndef WEAVE_ASYNC_UTILS_HPP
#define WEAVE_ASYNC_UTILS_HPP

#include <chrono>
#include <cstddef>
#include <functional>
#include <future>
#include <thread>
#include <type_traits>
#include <vector>

#include <spdlog/spdlog.h>

#include "weave/async/errors.hpp"
#include "weave/async/queue.hpp"

namespace weave::async {

/**
 * @brief Runs @p tasks one after another on the calling thread.
 *
 * Stops at the first failure, which propagates.
 */
template <typename T>
auto sequence(const std::vector<QueueTask<T>>& tasks) -> std::vector<T> {
    std::vector<T> results;
    results.reserve(tasks.size());
    for (const auto& task : tasks) {
        results.push_back(task());
    }
    return results;
}

/**
 * @brief Runs @p tasks with at most @p concurrency at a time.
 *
 * Results keep the input order. The first failure in input order
 * propagates once the tasks before it have finished; tasks not yet
 * started are then dropped.
 */
template <typename T>
auto parallel(const std::vector<QueueTask<T>>& tasks,
              std::size_t concurrency = 5) -> std::vector<T> {
    Queue<T> queue(QueueOptions{concurrency});
    std::vector<std::future<T>> futures;
    futures.reserve(tasks.size());
    for (const auto& task : tasks) {
        futures.push_back(queue.add(task));
    }

    std::vector<T> results;
    results.reserve(tasks.size());
    for (auto& future : futures) {
        results.push_back(future.get());
    }
    return results;
}

/**
 * @brief Waits at most @p timeout for @p future.
 *
 * @throws TimeoutError when the future is not ready in time; the work
 * behind it is not cancelled.
 */
template <typename Future, typename Rep, typename Period>
auto withTimeout(Future& future, std::chrono::duration<Rep, Period> timeout)
    -> decltype(future.get()) {
    if (future.wait_for(timeout) != std::future_status::ready) {
        THROW_TIMEOUT_ERROR(
            "Operation timed out after {} ms",
            std::chrono::duration_cast<std::chrono::milliseconds>(timeout)
                .count());
    }
    return future.get();
}

/**
 * @brief Polls @p condition until it holds.
 *
 * @throws TimeoutError when @p timeout elapses first.
 */
inline void pollUntil(
    const std::function<bool()>& condition,
    std::chrono::milliseconds interval = std::chrono::milliseconds(100),
    std::chrono::milliseconds timeout = std::chrono::seconds(30)) {
    auto deadline = std::chrono::steady_clock::now() + timeout;
    while (!condition()) {
        if (std::chrono::steady_clock::now() + interval > deadline) {
            THROW_TIMEOUT_ERROR("Condition not met within {} ms",
                                timeout.count());
        }
        std::this_thread::sleep_for(interval);
    }
    spdlog::debug("Polled condition satisfied");
}

}  // namespace weave::async

#endif  // WEAVE_ASYNC_UTILS_HPP
