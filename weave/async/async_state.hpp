/*
 * async_state.hpp
 *
 * Copyright (C) 2024 weave contributors
 */

/*************************************************

Date: 2024-6-9

Description: Status tracking state machine for async operations

**************************************************/

#ifndef WEAVE_ASYNC_ASYNC_STATE_HPP
#define WEAVE_ASYNC_ASYNC_STATE_HPP

#include <algorithm>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <exception>
#include <functional>
#include <future>
#include <mutex>
#include <optional>
#include <string_view>
#include <system_error>
#include <tuple>
#include <type_traits>
#include <utility>
#include <vector>

#include <spdlog/spdlog.h>

#include "weave/async/errors.hpp"
#include "weave/async/retry.hpp"
#include "weave/error/exception.hpp"

namespace weave::async {

enum class AsyncStatus { Idle, Loading, Success, Error };

[[nodiscard]] auto toString(AsyncStatus status) noexcept -> std::string_view;

/**
 * @brief Snapshot of an async operation.
 *
 * Outside Idle and Loading exactly one of data (Success) or error (Error)
 * describes the outcome of the latest committed run.
 */
template <typename T>
struct AsyncState {
    std::optional<T> data;
    std::exception_ptr error;
    AsyncStatus status{AsyncStatus::Idle};

    [[nodiscard]] bool isIdle() const noexcept {
        return status == AsyncStatus::Idle;
    }
    [[nodiscard]] bool isLoading() const noexcept {
        return status == AsyncStatus::Loading;
    }
    [[nodiscard]] bool isSuccess() const noexcept {
        return status == AsyncStatus::Success;
    }
    [[nodiscard]] bool isError() const noexcept {
        return status == AsyncStatus::Error;
    }
};

/**
 * @brief Behaviour and observers of an AsyncController.
 */
template <typename T>
struct AsyncOptions {
    /// Data of the idle state, restored by reset().
    std::optional<T> initialData;
    /// Start one execution from the constructor (zero-argument only).
    bool immediate{false};
    std::function<void(const T&)> onSuccess;
    std::function<void(const std::exception_ptr&)> onError;
    std::function<void()> onLoading;
    std::function<void()> onReset;
    /// maxRetries, retryDelay and backoff map to count, delay and
    /// exponential.
    std::optional<RetryOptions> retry;
    /// Cancel outstanding executions, retries included, when a new one
    /// starts. Their results are dropped either way.
    bool abortPrevious{true};
};

/**
 * @brief Drives an async function through idle/loading/success/error.
 *
 * Each execute() runs on its own thread and is tagged with a generation.
 * Only the most recent run commits, and only while the controller is
 * alive and no reset() came after the run started. Older runs are dropped
 * whatever abortPrevious says: their future fails with CancelledError and
 * they never reach onSuccess or onError.
 *
 * abortPrevious decides whether a superseded run keeps retrying. With it
 * set (and after reset()) the run is cancelled: it stops before its next
 * attempt and its retry wait ends early. A running function still runs to
 * completion.
 *
 * @code
 * AsyncController<Quote, std::string> quote(fetchQuote,
 *     {.onError = [](auto& e) { showToast(weave::error::describe(e)); }});
 * quote.execute("ETH");
 * if (quote.state().isSuccess()) render(*quote.state().data);
 * @endcode
 */
template <typename T, typename... Args>
class AsyncController {
    static_assert(!std::is_void_v<T>,
                  "AsyncController requires a value producing function");

public:
    using Function = std::function<T(Args...)>;
    using State = AsyncState<T>;

    /**
     * @throws weave::error::InvalidArgument on an empty function, or when
     * immediate is requested for a function taking arguments.
     */
    explicit AsyncController(Function fn, AsyncOptions<T> options = {})
        : fn_(std::move(fn)), options_(std::move(options)) {
        if (!fn_) {
            THROW_INVALID_ARGUMENT("AsyncController requires a function");
        }
        if (options_.retry) {
            options_.retry->validate();
        }
        state_.data = options_.initialData;

        if (options_.immediate) {
            if constexpr (sizeof...(Args) == 0) {
                execute();
            } else {
                THROW_INVALID_ARGUMENT(
                    "immediate execution needs a zero-argument function");
            }
        }
    }

    /**
     * @brief Drops pending outcomes and waits for running executions.
     */
    ~AsyncController() {
        std::vector<std::shared_future<T>> running;
        {
            std::lock_guard lock(mutex_);
            alive_ = false;
            running.swap(inflight_);
        }
        cancelled_.notify_all();
        for (auto& future : running) {
            future.wait();
        }
    }

    AsyncController(const AsyncController&) = delete;
    AsyncController& operator=(const AsyncController&) = delete;

    /**
     * @brief Starts a run with @p args.
     *
     * @return Future of the run: the result, the final error, or
     * CancelledError when the outcome was dropped.
     */
    std::shared_future<T> execute(Args... args) {
        std::uint64_t generation;
        {
            std::lock_guard lock(mutex_);
            generation = ++generation_;
            if (options_.abortPrevious) {
                floor_ = generation;
            }
            state_.status = AsyncStatus::Loading;
            std::erase_if(inflight_, [](const std::shared_future<T>& f) {
                return f.wait_for(std::chrono::seconds(0)) ==
                       std::future_status::ready;
            });
        }
        cancelled_.notify_all();
        notify(options_.onLoading);

        try {
            auto future =
                std::async(std::launch::async,
                           [this, generation,
                            arguments = std::make_tuple(
                                std::move(args)...)]() mutable {
                               return run(generation, arguments);
                           })
                    .share();
            std::lock_guard lock(mutex_);
            inflight_.push_back(future);
            return future;
        } catch (const std::system_error& e) {
            spdlog::error("Cannot start execution {}: {}", generation,
                          e.what());
            commitFailure(generation, std::current_exception());
            throw;
        }
    }

    /**
     * @brief Cancels outstanding runs and returns to Idle with the
     * initial data.
     */
    void reset() {
        {
            std::lock_guard lock(mutex_);
            floor_ = generation_ + 1;
            state_ = State{options_.initialData, nullptr, AsyncStatus::Idle};
        }
        cancelled_.notify_all();
        notify(options_.onReset);
    }

    /**
     * @brief Injects a successful result without running the function.
     */
    void setData(T data) {
        std::lock_guard lock(mutex_);
        state_.data = std::move(data);
        state_.status = AsyncStatus::Success;
    }

    /**
     * @brief Injects a failure without running the function.
     */
    void setError(std::exception_ptr error) {
        std::lock_guard lock(mutex_);
        state_.error = std::move(error);
        state_.status = AsyncStatus::Error;
    }

    [[nodiscard]] State state() const {
        std::lock_guard lock(mutex_);
        return state_;
    }

    [[nodiscard]] AsyncStatus status() const {
        std::lock_guard lock(mutex_);
        return state_.status;
    }

    /**
     * @brief Blocks until every execution started so far has finished.
     */
    void wait() const {
        std::vector<std::shared_future<T>> running;
        {
            std::lock_guard lock(mutex_);
            running = inflight_;
        }
        for (auto& future : running) {
            future.wait();
        }
    }

private:
    T run(std::uint64_t generation, std::tuple<Args...>& arguments) {
        const std::size_t attempts =
            options_.retry ? options_.retry->maxRetries + 1 : 1;
        std::exception_ptr last_error;

        for (std::size_t attempt = 0; attempt < attempts; ++attempt) {
            throwIfCancelled(generation);
            try {
                T result = std::apply(fn_, arguments);
                if (!commitSuccess(generation, result)) {
                    THROW_CANCELLED_ERROR("Execution {} was superseded",
                                          generation);
                }
                return result;
            } catch (const CancelledError&) {
                throw;
            } catch (...) {
                last_error = std::current_exception();
            }

            throwIfCancelled(generation);
            if (attempt + 1 < attempts) {
                auto delay = options_.retry->delayFor(attempt);
                spdlog::debug("Execution {} attempt {} failed, retrying in {} ms",
                              generation, attempt + 1, delay.count());
                std::unique_lock lock(mutex_);
                cancelled_.wait_for(lock, delay, [this, generation] {
                    return isCancelled(generation);
                });
            }
        }

        if (!commitFailure(generation, last_error)) {
            THROW_CANCELLED_ERROR("Execution {} was superseded", generation);
        }
        std::rethrow_exception(last_error);
    }

    // Caller holds mutex_.
    [[nodiscard]] bool isCancelled(std::uint64_t generation) const {
        return !alive_ || generation < floor_;
    }

    // Caller holds mutex_.
    [[nodiscard]] bool isCommittable(std::uint64_t generation) const {
        return !isCancelled(generation) && generation == generation_;
    }

    void throwIfCancelled(std::uint64_t generation) const {
        std::lock_guard lock(mutex_);
        if (isCancelled(generation)) {
            THROW_CANCELLED_ERROR("Execution {} was cancelled", generation);
        }
    }

    bool commitSuccess(std::uint64_t generation, const T& result) {
        {
            std::lock_guard lock(mutex_);
            if (!isCommittable(generation)) {
                return false;
            }
            state_ = State{result, nullptr, AsyncStatus::Success};
        }
        if (options_.onSuccess) {
            invokeObserver("onSuccess", [&] { options_.onSuccess(result); });
        }
        return true;
    }

    bool commitFailure(std::uint64_t generation,
                       const std::exception_ptr& error) {
        {
            std::lock_guard lock(mutex_);
            if (!isCommittable(generation)) {
                return false;
            }
            state_ = State{std::nullopt, error, AsyncStatus::Error};
        }
        spdlog::debug("Execution {} failed: {}", generation,
                      weave::error::describe(error));
        if (options_.onError) {
            invokeObserver("onError", [&] { options_.onError(error); });
        }
        return true;
    }

    static void notify(const std::function<void()>& observer) {
        if (observer) {
            invokeObserver("observer", observer);
        }
    }

    template <typename F>
    static void invokeObserver(std::string_view name, F&& observer) {
        try {
            std::forward<F>(observer)();
        } catch (...) {
            spdlog::error("AsyncController {} threw: {}", name,
                          weave::error::describe(std::current_exception()));
        }
    }

    Function fn_;
    AsyncOptions<T> options_;

    State state_;
    std::uint64_t generation_{0};
    std::uint64_t floor_{0};
    bool alive_{true};
    std::vector<std::shared_future<T>> inflight_;

    mutable std::mutex mutex_;
    std::condition_variable cancelled_;
};

}  // namespace weave::async

#endif  // WEAVE_ASYNC_ASYNC_STATE_HPP
