#ifndef WEAVE_CACHE_SWR_HPP
#define WEAVE_CACHE_SWR_HPP

#include <chrono>
#include <cstddef>
#include <exception>
#include <functional>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <utility>

#include <spdlog/spdlog.h>

#include "weave/async/queue.hpp"
#include "weave/cache/dedup.hpp"
#include "weave/error/exception.hpp"

namespace weave::cache {

/**
 * @brief Freshness windows of an SWRCache.
 */
struct SWROptions {
    /// Age after which a cached value is served but refreshed.
    std::chrono::milliseconds staleTime{std::chrono::seconds(30)};
    /// Age after which a cached value is no longer served.
    std::chrono::milliseconds cacheTime{std::chrono::minutes(5)};
    /// Number of background revalidations allowed to run at once.
    std::size_t revalidateConcurrency{2};
};

/**
 * @brief Stale-while-revalidate cache over a fetcher.
 *
 * - fresh (age <= staleTime): the cached value, no fetch;
 * - stale (staleTime < age < cacheTime): the cached value at once, plus at
 *   most one background revalidation per key;
 * - expired or missing: the caller blocks on a fetch. Concurrent misses
 *   for one key, and misses arriving during a revalidation, share a single
 *   fetch.
 *
 * @tparam T Value type.
 * @tparam Clock Time source, replaceable in tests.
 */
template <typename T, typename Clock = std::chrono::steady_clock>
class SWRCache {
public:
    using TimePoint = typename Clock::time_point;
    using Fetcher = std::function<T(const std::string&)>;

    /**
     * @throws weave::error::InvalidArgument on an empty fetcher or when
     * staleTime is not below cacheTime.
     */
    explicit SWRCache(Fetcher fetcher, SWROptions options = {})
        : fetcher_(std::move(fetcher)),
          options_(options),
          background_(async::QueueOptions{options.revalidateConcurrency}) {
        if (!fetcher_) {
            THROW_INVALID_ARGUMENT("SWRCache requires a fetcher");
        }
        if (options_.staleTime < std::chrono::milliseconds::zero() ||
            options_.staleTime >= options_.cacheTime) {
            THROW_INVALID_ARGUMENT(
                "staleTime ({} ms) must be non-negative and below cacheTime "
                "({} ms)",
                options_.staleTime.count(), options_.cacheTime.count());
        }
    }

    SWRCache(const SWRCache&) = delete;
    SWRCache& operator=(const SWRCache&) = delete;

    /**
     * @brief Returns the value for @p key.
     *
     * @throws Whatever the fetcher threw when a blocking fetch failed.
     */
    T get(const std::string& key) {
        std::optional<T> cached;
        bool stale = false;
        {
            std::lock_guard lock(mutex_);
            auto it = entries_.find(key);
            if (it != entries_.end()) {
                auto now = Clock::now();
                if (now < it->second.expiresAt) {
                    cached = it->second.value;
                    stale = now > it->second.staleAt;
                } else {
                    entries_.erase(it);
                }
            }
        }

        if (cached) {
            if (stale) {
                revalidate(key);
            }
            return std::move(*cached);
        }

        return dedup_.execute(key, [this, &key] { return fetchAndStore(key); });
    }

    /**
     * @brief Drops the cached value of @p key.
     *
     * An in-flight revalidation is not cancelled and will store its result.
     */
    void invalidate(const std::string& key) {
        std::lock_guard lock(mutex_);
        entries_.erase(key);
    }

    /**
     * @brief Drops every cached value.
     */
    void invalidateAll() {
        std::lock_guard lock(mutex_);
        entries_.clear();
    }

    /**
     * @brief Whether a fetch for @p key is in flight.
     */
    [[nodiscard]] bool isFetching(const std::string& key) const {
        return dedup_.inFlight(key);
    }

    /**
     * @brief Blocks until no background revalidation is queued or running.
     */
    void waitForRevalidations() { background_.waitIdle(); }

    [[nodiscard]] std::size_t size() const {
        std::lock_guard lock(mutex_);
        return entries_.size();
    }

private:
    struct Entry {
        T value;
        TimePoint staleAt;
        TimePoint expiresAt;
    };

    T fetchAndStore(const std::string& key) {
        T value = fetcher_(key);
        auto now = Clock::now();
        std::lock_guard lock(mutex_);
        entries_.insert_or_assign(key, Entry{value, now + options_.staleTime,
                                             now + options_.cacheTime});
        return value;
    }

    void revalidate(const std::string& key) {
        auto flight = dedup_.executeDetached(
            key,
            [this, key]() -> T {
                try {
                    return fetchAndStore(key);
                } catch (const std::exception& e) {
                    spdlog::warn("Background revalidation of {} failed: {}",
                                 key, e.what());
                    throw;
                }
            },
            [this](std::function<void()> job) {
                spdlog::debug("Scheduling background revalidation");
                background_.add(std::move(job));
            });
        (void)flight;
    }

    Fetcher fetcher_;
    SWROptions options_;

    std::unordered_map<std::string, Entry> entries_;
    mutable std::mutex mutex_;

    RequestDeduplicator<T> dedup_;
    async::Queue<void> background_;
};

}  // namespace weave::cache

#endif  // WEAVE_CACHE_SWR_HPP
