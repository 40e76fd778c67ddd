#ifndef WEAVE_ASYNC_BATCH_HPP
#define WEAVE_ASYNC_BATCH_HPP

#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <exception>
#include <functional>
#include <mutex>
#include <optional>
#include <thread>
#include <type_traits>
#include <utility>
#include <vector>

#include <spdlog/spdlog.h>

#include "weave/error/exception.hpp"

namespace weave::async {

/**
 * @brief Flush triggers of a BatchQueue.
 */
struct BatchOptions {
    /// Flush as soon as this many items are collected.
    std::size_t maxBatchSize{10};
    /// Flush this long after the first unflushed item arrived.
    std::chrono::milliseconds maxWait{100};
};

/**
 * @brief Collects items and hands them to a processor in batches.
 *
 * A batch is flushed by whichever happens first: it reaches maxBatchSize,
 * or maxWait elapses since its first item was added. A size-triggered
 * flush runs the processor on the thread calling add() and propagates its
 * exceptions there. A time-triggered flush runs on the internal timer
 * thread; its exceptions are logged and passed to the error handler.
 *
 * @tparam Item Type of the collected items.
 * @tparam Result Type produced by the processor for one batch.
 */
template <typename Item, typename Result>
class BatchQueue {
    static_assert(!std::is_void_v<Result>,
                  "BatchQueue processor must produce a value");

public:
    using Clock = std::chrono::steady_clock;
    using Processor = std::function<Result(std::vector<Item>)>;
    using ErrorHandler = std::function<void(std::exception_ptr)>;

    /**
     * @param processor Receives every flushed batch.
     * @param options Size and time triggers.
     * @param on_error Observer of failures of time-triggered flushes.
     * @throws weave::error::InvalidArgument on an empty processor, a zero
     * maxBatchSize or a negative maxWait.
     */
    explicit BatchQueue(Processor processor, BatchOptions options = {},
                        ErrorHandler on_error = nullptr)
        : processor_(std::move(processor)),
          options_(options),
          on_error_(std::move(on_error)) {
        if (!processor_) {
            THROW_INVALID_ARGUMENT("BatchQueue requires a processor");
        }
        if (options_.maxBatchSize == 0) {
            THROW_INVALID_ARGUMENT("maxBatchSize must be greater than zero");
        }
        if (options_.maxWait < std::chrono::milliseconds::zero()) {
            THROW_INVALID_ARGUMENT("maxWait must not be negative");
        }
        timer_ = std::thread([this] { timerLoop(); });
    }

    /**
     * @brief Stops the timer and flushes what is left.
     */
    ~BatchQueue() {
        {
            std::lock_guard lock(mutex_);
            stop_ = true;
        }
        condition_.notify_all();
        if (timer_.joinable()) {
            timer_.join();
        }

        auto items = takeBatch();
        if (!items.empty()) {
            process(std::move(items));
        }
    }

    BatchQueue(const BatchQueue&) = delete;
    BatchQueue& operator=(const BatchQueue&) = delete;

    /**
     * @brief Adds an item, flushing inline when the batch becomes full.
     */
    void add(Item item) {
        std::vector<Item> full;
        {
            std::lock_guard lock(mutex_);
            batch_.push_back(std::move(item));
            if (batch_.size() >= options_.maxBatchSize) {
                full = takeBatchLocked();
            } else if (!deadline_) {
                deadline_ = Clock::now() + options_.maxWait;
            }
        }
        condition_.notify_all();

        if (!full.empty()) {
            spdlog::debug("Batch full, flushing {} items", full.size());
            processor_(std::move(full));
        }
    }

    /**
     * @brief Flushes the current batch now.
     *
     * @return The processor result, or std::nullopt when the batch was
     * empty, in which case nothing happens.
     */
    std::optional<Result> flush() {
        auto items = takeBatch();
        if (items.empty()) {
            return std::nullopt;
        }
        return processor_(std::move(items));
    }

    /// Number of items waiting for the next flush.
    [[nodiscard]] std::size_t pending() const {
        std::lock_guard lock(mutex_);
        return batch_.size();
    }

    [[nodiscard]] const BatchOptions& options() const noexcept {
        return options_;
    }

private:
    std::vector<Item> takeBatch() {
        std::vector<Item> items;
        {
            std::lock_guard lock(mutex_);
            items = takeBatchLocked();
        }
        condition_.notify_all();
        return items;
    }

    // Caller holds mutex_.
    std::vector<Item> takeBatchLocked() {
        std::vector<Item> items;
        items.swap(batch_);
        deadline_.reset();
        return items;
    }

    void process(std::vector<Item> items) noexcept {
        auto count = items.size();
        try {
            processor_(std::move(items));
        } catch (const std::exception& e) {
            spdlog::error("Batch of {} items failed: {}", count, e.what());
            reportError(std::current_exception());
        } catch (...) {
            spdlog::error("Batch of {} items failed with unknown error",
                          count);
            reportError(std::current_exception());
        }
    }

    void reportError(std::exception_ptr error) noexcept {
        if (!on_error_) {
            return;
        }
        try {
            on_error_(std::move(error));
        } catch (...) {
            spdlog::error("Batch error handler threw: {}",
                          weave::error::describe(std::current_exception()));
        }
    }

    void timerLoop() {
        std::unique_lock lock(mutex_);
        while (!stop_) {
            if (!deadline_) {
                condition_.wait(lock,
                                [this] { return stop_ || deadline_.has_value(); });
                continue;
            }

            auto deadline = *deadline_;
            bool interrupted = condition_.wait_until(lock, deadline, [&] {
                return stop_ || deadline_ != deadline;
            });
            if (interrupted) {
                continue;
            }

            auto items = takeBatchLocked();
            lock.unlock();
            spdlog::debug("Batch wait elapsed, flushing {} items",
                          items.size());
            process(std::move(items));
            lock.lock();
        }
    }

    Processor processor_;
    BatchOptions options_;
    ErrorHandler on_error_;

    std::vector<Item> batch_;
    std::optional<Clock::time_point> deadline_;
    bool stop_{false};

    mutable std::mutex mutex_;
    std::condition_variable condition_;
    std::thread timer_;
};

}  // namespace weave::async

#endif  // WEAVE_ASYNC_BATCH_HPP
