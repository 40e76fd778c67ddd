/*
 * queue.hpp
 *
 * Copyright (C) 2024 weave contributors
 */

/*************************************************

Date: 2024-5-20

Description: Task queues with bounded concurrency

**************************************************/

#ifndef WEAVE_ASYNC_QUEUE_HPP
#define WEAVE_ASYNC_QUEUE_HPP

#include <condition_variable>
#include <cstddef>
#include <deque>
#include <exception>
#include <functional>
#include <future>
#include <map>
#include <mutex>
#include <string>
#include <thread>
#include <type_traits>
#include <utility>
#include <vector>

#include <spdlog/spdlog.h>

#include "weave/async/errors.hpp"
#include "weave/error/exception.hpp"

namespace weave::async {

/**
 * @brief A zero-argument unit of work producing T.
 */
template <typename T>
using QueueTask = std::function<T()>;

/**
 * @brief Configuration of Queue and PriorityQueue.
 */
struct QueueOptions {
    /// Maximum number of tasks running at the same time.
    std::size_t concurrency{1};
};

namespace detail {

template <typename T>
struct QueuedTask {
    QueueTask<T> task;
    std::promise<T> promise;
};

/**
 * @brief Runs @p task and stores its outcome in @p promise.
 */
template <typename T>
void fulfil(std::promise<T>& promise, const QueueTask<T>& task) noexcept {
    try {
        if constexpr (std::is_void_v<T>) {
            task();
            promise.set_value();
        } else {
            promise.set_value(task());
        }
    } catch (...) {
        try {
            promise.set_exception(std::current_exception());
        } catch (const std::future_error& e) {
            spdlog::error("Failed to store task failure: {}", e.what());
        }
    }
}

/**
 * @brief Plain FIFO task selection.
 */
template <typename T>
class FifoSelector {
public:
    using Item = QueuedTask<T>;

    void push(Item item, int /*priority*/) {
        items_.push_back(std::move(item));
    }

    Item pop() {
        Item item = std::move(items_.front());
        items_.pop_front();
        return item;
    }

    [[nodiscard]] bool empty() const noexcept { return items_.empty(); }
    [[nodiscard]] std::size_t size() const noexcept { return items_.size(); }

    std::vector<Item> drain() {
        std::vector<Item> drained;
        drained.reserve(items_.size());
        for (auto& item : items_) {
            drained.push_back(std::move(item));
        }
        items_.clear();
        return drained;
    }

private:
    std::deque<Item> items_;
};

/**
 * @brief Highest priority bucket first, FIFO inside a bucket.
 */
template <typename T>
class PrioritySelector {
public:
    using Item = QueuedTask<T>;

    void push(Item item, int priority) {
        buckets_[priority].push_back(std::move(item));
        ++size_;
    }

    Item pop() {
        auto bucket = buckets_.begin();
        Item item = std::move(bucket->second.front());
        bucket->second.pop_front();
        if (bucket->second.empty()) {
            buckets_.erase(bucket);
        }
        --size_;
        return item;
    }

    [[nodiscard]] bool empty() const noexcept { return size_ == 0; }
    [[nodiscard]] std::size_t size() const noexcept { return size_; }

    std::vector<Item> drain() {
        std::vector<Item> drained;
        drained.reserve(size_);
        for (auto& [priority, bucket] : buckets_) {
            for (auto& item : bucket) {
                drained.push_back(std::move(item));
            }
        }
        buckets_.clear();
        size_ = 0;
        return drained;
    }

private:
    std::map<int, std::deque<Item>, std::greater<>> buckets_;
    std::size_t size_{0};
};

/**
 * @brief Worker engine shared by the queue variants.
 *
 * Owns one worker thread per unit of concurrency. Workers take the next
 * task chosen by the Selector, so the number of running tasks never exceeds
 * the concurrency and tasks start in selection order.
 */
template <typename T, typename Selector>
class QueueEngine {
public:
    QueueEngine(QueueOptions options, std::string name)
        : concurrency_(options.concurrency), name_(std::move(name)) {
        if (concurrency_ == 0) {
            THROW_INVALID_ARGUMENT("{} concurrency must be greater than zero",
                                   name_);
        }
        workers_.reserve(concurrency_);
        for (std::size_t i = 0; i < concurrency_; ++i) {
            workers_.emplace_back([this] { workerLoop(); });
        }
        spdlog::debug("{} started with concurrency {}", name_, concurrency_);
    }

    /**
     * @brief Stops the workers after their current task.
     *
     * Tasks that never started fail with QueueClearedError.
     */
    ~QueueEngine() {
        std::vector<typename Selector::Item> dropped;
        {
            std::lock_guard lock(mutex_);
            stop_ = true;
            dropped = selector_.drain();
        }
        condition_.notify_all();
        for (auto& worker : workers_) {
            if (worker.joinable()) {
                worker.join();
            }
        }
        failDropped(dropped, "Queue destroyed before the task started");
    }

    QueueEngine(const QueueEngine&) = delete;
    QueueEngine& operator=(const QueueEngine&) = delete;

    /**
     * @brief Stops starting new tasks. Running tasks are not interrupted.
     */
    void pause() {
        std::lock_guard lock(mutex_);
        paused_ = true;
        spdlog::info("{} paused", name_);
    }

    /**
     * @brief Restarts task processing.
     */
    void resume() {
        {
            std::lock_guard lock(mutex_);
            paused_ = false;
        }
        spdlog::info("{} resumed", name_);
        condition_.notify_all();
    }

    /**
     * @brief Drops every queued task.
     *
     * Futures of the dropped tasks fail with QueueClearedError. Running
     * tasks are not affected.
     */
    void clear() {
        std::vector<typename Selector::Item> dropped;
        {
            std::lock_guard lock(mutex_);
            dropped = selector_.drain();
        }
        if (!dropped.empty()) {
            spdlog::debug("{} cleared {} queued tasks", name_, dropped.size());
        }
        failDropped(dropped, "Task dropped by queue clear");
        idle_.notify_all();
    }

    /**
     * @brief Blocks until no task is running and none can start.
     */
    void waitIdle() {
        std::unique_lock lock(mutex_);
        idle_.wait(lock, [this] {
            return running_ == 0 && (selector_.empty() || paused_);
        });
    }

    /// Number of queued tasks that have not started.
    [[nodiscard]] std::size_t pending() const {
        std::lock_guard lock(mutex_);
        return selector_.size();
    }

    /// Number of running tasks.
    [[nodiscard]] std::size_t active() const {
        std::lock_guard lock(mutex_);
        return running_;
    }

    /// Queued plus running tasks.
    [[nodiscard]] std::size_t size() const {
        std::lock_guard lock(mutex_);
        return selector_.size() + running_;
    }

    [[nodiscard]] bool isPaused() const {
        std::lock_guard lock(mutex_);
        return paused_;
    }

    [[nodiscard]] std::size_t concurrency() const noexcept {
        return concurrency_;
    }

protected:
    std::future<T> enqueue(QueueTask<T> task, int priority) {
        if (!task) {
            THROW_INVALID_ARGUMENT("{} rejects an empty task", name_);
        }
        typename Selector::Item item{std::move(task), std::promise<T>{}};
        auto future = item.promise.get_future();
        {
            std::lock_guard lock(mutex_);
            selector_.push(std::move(item), priority);
        }
        condition_.notify_one();
        return future;
    }

private:
    void workerLoop() {
        while (true) {
            typename Selector::Item item;
            {
                std::unique_lock lock(mutex_);
                condition_.wait(lock, [this] {
                    return stop_ || (!paused_ && !selector_.empty());
                });
                if (stop_) {
                    return;
                }
                item = selector_.pop();
                ++running_;
            }

            fulfil(item.promise, item.task);

            {
                std::lock_guard lock(mutex_);
                --running_;
            }
            idle_.notify_all();
        }
    }

    static void failDropped(std::vector<typename Selector::Item>& dropped,
                            const char* reason) {
        for (auto& item : dropped) {
            item.promise.set_exception(std::make_exception_ptr(
                QueueClearedError(WEAVE_FILE_NAME, WEAVE_FILE_LINE,
                                  WEAVE_FUNC_NAME, "{}", reason)));
        }
    }

    std::size_t concurrency_;
    std::string name_;

    Selector selector_;
    std::size_t running_{0};
    bool paused_{false};
    bool stop_{false};

    mutable std::mutex mutex_;
    std::condition_variable condition_;
    std::condition_variable idle_;
    std::vector<std::thread> workers_;
};

}  // namespace detail

/**
 * @brief FIFO task queue with bounded concurrency.
 *
 * @code
 * weave::async::Queue<int> queue({.concurrency = 2});
 * auto result = queue.add([] { return fetchBalance(); });
 * int balance = result.get();
 * @endcode
 */
template <typename T = void>
class Queue : public detail::QueueEngine<T, detail::FifoSelector<T>> {
public:
    explicit Queue(QueueOptions options = {})
        : detail::QueueEngine<T, detail::FifoSelector<T>>(options, "Queue") {}

    /**
     * @brief Appends a task.
     *
     * @return Future of the task outcome.
     */
    std::future<T> add(QueueTask<T> task) {
        return this->enqueue(std::move(task), 0);
    }
};

/**
 * @brief Task queue that starts higher priorities first.
 *
 * Among queued tasks the highest numeric priority starts first; tasks of
 * equal priority start in the order they were added.
 */
template <typename T = void>
class PriorityQueue
    : public detail::QueueEngine<T, detail::PrioritySelector<T>> {
public:
    explicit PriorityQueue(QueueOptions options = {})
        : detail::QueueEngine<T, detail::PrioritySelector<T>>(
              options, "PriorityQueue") {}

    std::future<T> add(QueueTask<T> task, int priority = 0) {
        return this->enqueue(std::move(task), priority);
    }
};

}  // namespace weave::async

#endif  // WEAVE_ASYNC_QUEUE_HPP
