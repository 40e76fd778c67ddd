#ifndef WEAVE_ASYNC_POLLER_HPP
#define WEAVE_ASYNC_POLLER_HPP

#include <chrono>
#include <condition_variable>
#include <functional>
#include <future>
#include <mutex>
#include <thread>
#include <utility>

#include <spdlog/spdlog.h>

#include "weave/async/async_state.hpp"
#include "weave/error/exception.hpp"

namespace weave::async {

/**
 * @brief AsyncOptions plus the polling schedule.
 */
template <typename T>
struct PollingOptions : AsyncOptions<T> {
    std::chrono::milliseconds interval{std::chrono::seconds(1)};
    /// Start polling from the constructor.
    bool enabled{true};
    /// Keep polling after a failed run.
    bool retryOnError{false};
};

/**
 * @brief Re-runs a function on a fixed interval through an
 * AsyncController.
 *
 * Polling runs once on start and then on every tick. A tick is skipped
 * while a run is loading, and after a failure unless retryOnError is set.
 */
template <typename T>
class AsyncPoller {
public:
    using Function = std::function<T()>;

    explicit AsyncPoller(Function fn, PollingOptions<T> options = {})
        : interval_(options.interval),
          retry_on_error_(options.retryOnError),
          controller_(std::move(fn), controllerOptions(options)) {
        if (interval_ <= std::chrono::milliseconds::zero()) {
            THROW_INVALID_ARGUMENT("Polling interval must be positive, got {} ms",
                                   interval_.count());
        }
        if (options.enabled) {
            start();
        }
    }

    ~AsyncPoller() { stop(); }

    AsyncPoller(const AsyncPoller&) = delete;
    AsyncPoller& operator=(const AsyncPoller&) = delete;

    /**
     * @brief Runs immediately, then once per interval. No-op when already
     * polling.
     */
    void start() {
        {
            std::lock_guard lock(mutex_);
            if (polling_) {
                return;
            }
            polling_ = true;
        }
        spdlog::info("Polling every {} ms", interval_.count());
        ticker_ = std::thread([this] { tickLoop(); });
    }

    /**
     * @brief Stops the ticker. A run already started is left to finish.
     */
    void stop() {
        {
            std::lock_guard lock(mutex_);
            if (!polling_) {
                return;
            }
            polling_ = false;
        }
        cv_.notify_all();
        if (ticker_.joinable()) {
            ticker_.join();
        }
        spdlog::info("Polling stopped");
    }

    [[nodiscard]] bool isPolling() const {
        std::lock_guard lock(mutex_);
        return polling_;
    }

    [[nodiscard]] AsyncState<T> state() const { return controller_.state(); }

    /**
     * @brief Runs once now, outside the schedule.
     */
    std::shared_future<T> refetch() { return controller_.execute(); }

    [[nodiscard]] AsyncController<T>& controller() { return controller_; }

private:
    static AsyncOptions<T> controllerOptions(const PollingOptions<T>& options) {
        AsyncOptions<T> result = options;
        result.immediate = false;
        return result;
    }

    void tickLoop() {
        controller_.execute();
        std::unique_lock lock(mutex_);
        while (polling_) {
            if (cv_.wait_for(lock, interval_, [this] { return !polling_; })) {
                break;
            }
            lock.unlock();
            tick();
            lock.lock();
        }
    }

    void tick() {
        switch (controller_.status()) {
            case AsyncStatus::Loading:
                spdlog::debug("Previous poll still loading, skipping tick");
                return;
            case AsyncStatus::Error:
                if (!retry_on_error_) {
                    spdlog::debug("Last poll failed, skipping tick");
                    return;
                }
                break;
            default:
                break;
        }
        controller_.execute();
    }

    std::chrono::milliseconds interval_;
    bool retry_on_error_;

    bool polling_{false};
    std::thread ticker_;
    mutable std::mutex mutex_;
    std::condition_variable cv_;

    AsyncController<T> controller_;
};

}  // namespace weave::async

#endif  // WEAVE_ASYNC_POLLER_HPP
