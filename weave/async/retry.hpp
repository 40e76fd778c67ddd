#ifndef WEAVE_ASYNC_RETRY_HPP
#define WEAVE_ASYNC_RETRY_HPP

#include <chrono>
#include <cstddef>
#include <exception>
#include <functional>
#include <optional>
#include <thread>
#include <type_traits>
#include <utility>

#include <spdlog/spdlog.h>

#include "weave/async/errors.hpp"
#include "weave/async/queue.hpp"
#include "weave/error/exception.hpp"

namespace weave::async {

/**
 * @brief Retry configuration shared by retry() and RetryQueue.
 */
struct RetryOptions {
    /// Additional attempts after the first failure.
    std::size_t maxRetries{3};
    /// Base delay between attempts.
    std::chrono::milliseconds retryDelay{1000};
    /// Double the delay after every failed attempt when true.
    bool backoff{true};
    /// Upper bound of a single delay.
    std::optional<std::chrono::milliseconds> maxDelay;
    /// Observer called with the 1-based attempt number before each retry.
    std::function<void(std::size_t, const std::exception_ptr&)> onRetry;

    /**
     * @brief Delay to wait after the failed attempt @p attempt (0-based).
     *
     * retryDelay for linear retries, retryDelay * 2^attempt with backoff,
     * capped at maxDelay when set and saturating at one year. No jitter
     * is applied.
     */
    [[nodiscard]] std::chrono::milliseconds delayFor(
        std::size_t attempt) const;

    /**
     * @throws weave::error::InvalidArgument on a negative delay.
     */
    void validate() const;
};

/**
 * @brief Runs @p fn until it succeeds or the retries are exhausted.
 *
 * At most options.maxRetries + 1 attempts are made. The exception of the
 * last attempt propagates. A CancelledError propagates at once.
 *
 * @return The result of the first successful attempt.
 */
template <typename F>
auto retry(F&& fn, const RetryOptions& options)
    -> std::invoke_result_t<F&> {
    for (std::size_t attempt = 0;; ++attempt) {
        try {
            return fn();
        } catch (const CancelledError&) {
            throw;
        } catch (...) {
            if (attempt >= options.maxRetries) {
                spdlog::warn("Giving up after {} attempts: {}", attempt + 1,
                             weave::error::describe(std::current_exception()));
                throw;
            }
            auto delay = options.delayFor(attempt);
            spdlog::debug("Attempt {} failed, retrying in {} ms", attempt + 1,
                          delay.count());
            if (options.onRetry) {
                options.onRetry(attempt + 1, std::current_exception());
            }
            std::this_thread::sleep_for(delay);
        }
    }
}

/**
 * @brief Executes tasks with bounded retry and optional exponential backoff.
 */
template <typename T = void>
class RetryQueue {
public:
    explicit RetryQueue(RetryOptions options = {})
        : options_(std::move(options)) {
        options_.validate();
    }

    /**
     * @brief Runs @p task on the calling thread with retries.
     *
     * @return The result of the first successful attempt.
     * @throws The exception of the final attempt.
     */
    T execute(const QueueTask<T>& task) const {
        if (!task) {
            THROW_INVALID_ARGUMENT("RetryQueue rejects an empty task");
        }
        return retry(task, options_);
    }

    [[nodiscard]] const RetryOptions& options() const noexcept {
        return options_;
    }

private:
    RetryOptions options_;
};

}  // namespace weave::async

#endif  // WEAVE_ASYNC_RETRY_HPP
