#ifndef WEAVE_CACHE_DEDUP_HPP
#define WEAVE_CACHE_DEDUP_HPP

#include <cstddef>
#include <exception>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <type_traits>
#include <unordered_map>
#include <utility>

#include <spdlog/spdlog.h>

namespace weave::cache {

/**
 * @brief Collapses concurrent identical requests into one execution.
 *
 * The first caller for a key registers a shared future and runs the
 * function; callers arriving while it is in flight wait on that future
 * instead of running the function again. The pending entry is dropped as
 * soon as the function settles, so the next call after completion starts a
 * fresh attempt. All callers of one flight observe the same value or the
 * same exception object.
 *
 * @tparam T Result type of the deduplicated function.
 */
template <typename T>
class RequestDeduplicator {
public:
    using Function = std::function<T()>;
    using SharedFuture = std::shared_future<T>;

    RequestDeduplicator() = default;
    RequestDeduplicator(const RequestDeduplicator&) = delete;
    RequestDeduplicator& operator=(const RequestDeduplicator&) = delete;

    /**
     * @brief Runs @p fn for @p key unless a call for @p key is in flight.
     *
     * Blocks until the flight settles. @p fn runs on the thread of the
     * caller that started the flight.
     *
     * @return The result of the flight.
     * @throws Whatever @p fn threw, shared between all callers.
     */
    T execute(const std::string& key, const Function& fn) {
        std::shared_ptr<std::promise<T>> promise;
        SharedFuture future;
        {
            std::lock_guard lock(mutex_);
            auto it = pending_.find(key);
            if (it != pending_.end()) {
                future = it->second;
            } else {
                promise = std::make_shared<std::promise<T>>();
                future = promise->get_future().share();
                pending_.emplace(key, future);
            }
        }

        if (promise) {
            settle(key, *promise, fn);
        } else {
            spdlog::debug("Joining in-flight request for key: {}", key);
        }
        return future.get();
    }

    /**
     * @brief Registers a flight for @p key and hands it to an executor.
     *
     * When @p key is already in flight the existing future is returned and
     * @p submit is not called. Otherwise @p submit receives a job that runs
     * @p fn and settles the flight; the job must be run exactly once.
     *
     * @param key Request key.
     * @param fn The function to run.
     * @param submit Callable taking a std::function<void()>.
     * @return The shared future of the flight.
     */
    template <typename Submit>
    SharedFuture executeDetached(const std::string& key, Function fn,
                                 Submit&& submit) {
        std::shared_ptr<std::promise<T>> promise;
        SharedFuture future;
        {
            std::lock_guard lock(mutex_);
            auto it = pending_.find(key);
            if (it != pending_.end()) {
                return it->second;
            }
            promise = std::make_shared<std::promise<T>>();
            future = promise->get_future().share();
            pending_.emplace(key, future);
        }

        try {
            std::forward<Submit>(submit)(
                [this, key, promise, fn = std::move(fn)]() {
                    settle(key, *promise, fn);
                });
        } catch (...) {
            std::lock_guard lock(mutex_);
            pending_.erase(key);
            throw;
        }
        return future;
    }

    /**
     * @brief Whether a flight for @p key is outstanding.
     */
    [[nodiscard]] bool inFlight(const std::string& key) const {
        std::lock_guard lock(mutex_);
        return pending_.contains(key);
    }

    /**
     * @brief The future of the outstanding flight for @p key, if any.
     */
    [[nodiscard]] std::optional<SharedFuture> pending(
        const std::string& key) const {
        std::lock_guard lock(mutex_);
        auto it = pending_.find(key);
        if (it == pending_.end()) {
            return std::nullopt;
        }
        return it->second;
    }

    [[nodiscard]] std::size_t pendingCount() const {
        std::lock_guard lock(mutex_);
        return pending_.size();
    }

private:
    void settle(const std::string& key, std::promise<T>& promise,
                const Function& fn) {
        if constexpr (std::is_void_v<T>) {
            std::exception_ptr error;
            try {
                fn();
            } catch (...) {
                error = std::current_exception();
            }
            release(key);
            if (error) {
                promise.set_exception(error);
            } else {
                promise.set_value();
            }
        } else {
            std::optional<T> value;
            std::exception_ptr error;
            try {
                value.emplace(fn());
            } catch (...) {
                error = std::current_exception();
            }
            release(key);
            if (error) {
                promise.set_exception(error);
            } else {
                promise.set_value(std::move(*value));
            }
        }
    }

    void release(const std::string& key) {
        std::lock_guard lock(mutex_);
        pending_.erase(key);
    }

    std::unordered_map<std::string, SharedFuture> pending_;
    mutable std::mutex mutex_;
};

}  // namespace weave::cache

#endif  // WEAVE_CACHE_DEDUP_HPP
