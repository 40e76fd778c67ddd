#ifndef WEAVE_CACHE_MEMORY_CACHE_HPP
#define WEAVE_CACHE_MEMORY_CACHE_HPP

#include <chrono>
#include <cstddef>
#include <list>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <utility>

#include <spdlog/spdlog.h>

#include "weave/error/exception.hpp"

namespace weave::cache {

/**
 * @brief Configuration of a MemoryCache.
 */
struct CacheOptions {
    /// Default lifetime of an entry.
    std::chrono::milliseconds ttl{std::chrono::minutes(5)};
    /// Maximum number of entries held at once.
    std::size_t maxSize{1000};
};

/**
 * @brief Counters describing cache usage.
 */
struct CacheStatistics {
    std::size_t hits{0};
    std::size_t misses{0};
    std::size_t evictions{0};
    std::size_t expirations{0};
    std::size_t size{0};

    [[nodiscard]] double hitRate() const noexcept {
        auto total = hits + misses;
        return total == 0 ? 0.0
                          : static_cast<double>(hits) /
                                static_cast<double>(total);
    }
};

/**
 * @brief A bounded key-value store with per-entry expiry and LRU eviction.
 *
 * Entries expire a fixed duration after they were stored. Expired entries
 * are purged lazily when a lookup encounters them and opportunistically
 * when size() is queried; there is no background sweeper. When a new key is
 * inserted into a full cache, exactly one entry is evicted: the one touched
 * least recently, where both get() and set() count as a touch.
 *
 * Recency is kept in a doubly linked list indexed by a hash map, so every
 * operation except size() is O(1).
 *
 * @tparam Value The type of the cached values.
 * @tparam Clock Time source, replaceable in tests.
 */
template <typename Value, typename Clock = std::chrono::steady_clock>
class MemoryCache {
public:
    using TimePoint = typename Clock::time_point;
    using Duration = std::chrono::milliseconds;

    /**
     * @brief Constructs a cache.
     *
     * @param options TTL and capacity.
     * @throws weave::error::InvalidArgument if ttl <= 0 or maxSize == 0
     */
    explicit MemoryCache(CacheOptions options = {})
        : ttl_(options.ttl), max_size_(options.maxSize) {
        if (ttl_ <= Duration::zero()) {
            THROW_INVALID_ARGUMENT("Cache TTL must be greater than zero");
        }
        if (max_size_ == 0) {
            THROW_INVALID_ARGUMENT("Cache maxSize must be greater than zero");
        }
    }

    MemoryCache(const MemoryCache&) = delete;
    MemoryCache& operator=(const MemoryCache&) = delete;

    /**
     * @brief Looks up a key.
     *
     * A hit refreshes the recency of the entry. An expired entry is removed
     * and reported as a miss.
     *
     * @return The value, or std::nullopt on a miss.
     */
    [[nodiscard]] std::optional<Value> get(const std::string& key) {
        std::lock_guard lock(mutex_);
        auto it = cache_map_.find(key);
        if (it == cache_map_.end()) {
            ++misses_;
            return std::nullopt;
        }

        auto now = Clock::now();
        if (isExpired(*it->second, now)) {
            cache_list_.erase(it->second);
            cache_map_.erase(it);
            ++expirations_;
            ++misses_;
            return std::nullopt;
        }

        it->second->access_time = now;
        cache_list_.splice(cache_list_.begin(), cache_list_, it->second);
        ++hits_;
        return it->second->value;
    }

    /**
     * @brief Inserts or overwrites a key.
     *
     * @param key The key.
     * @param value The value to store.
     * @param custom_ttl Lifetime of this entry, the cache TTL when absent.
     */
    void set(const std::string& key, Value value,
             std::optional<Duration> custom_ttl = std::nullopt) {
        std::lock_guard lock(mutex_);
        auto now = Clock::now();
        auto expiry = now + custom_ttl.value_or(ttl_);

        auto it = cache_map_.find(key);
        if (it != cache_map_.end()) {
            it->second->value = std::move(value);
            it->second->expiry_time = expiry;
            it->second->access_time = now;
            cache_list_.splice(cache_list_.begin(), cache_list_, it->second);
            return;
        }

        if (cache_list_.size() >= max_size_) {
            evictLeastRecent();
        }

        cache_list_.push_front(CacheItem{key, std::move(value), expiry, now});
        cache_map_.emplace(key, cache_list_.begin());
    }

    /**
     * @brief Whether a live entry exists for @p key.
     *
     * Purges the entry if it has expired. Does not count as a touch.
     */
    [[nodiscard]] bool has(const std::string& key) {
        std::lock_guard lock(mutex_);
        auto it = cache_map_.find(key);
        if (it == cache_map_.end()) {
            return false;
        }
        if (isExpired(*it->second, Clock::now())) {
            cache_list_.erase(it->second);
            cache_map_.erase(it);
            ++expirations_;
            return false;
        }
        return true;
    }

    /**
     * @brief Removes a key.
     *
     * @return true if an entry was removed, false if none existed.
     */
    bool remove(const std::string& key) noexcept {
        std::lock_guard lock(mutex_);
        auto it = cache_map_.find(key);
        if (it == cache_map_.end()) {
            return false;
        }
        cache_list_.erase(it->second);
        cache_map_.erase(it);
        return true;
    }

    /**
     * @brief Removes every entry. Statistics are kept.
     */
    void clear() noexcept {
        std::lock_guard lock(mutex_);
        cache_list_.clear();
        cache_map_.clear();
    }

    /**
     * @brief Number of live entries; purges expired ones first.
     */
    [[nodiscard]] std::size_t size() {
        std::lock_guard lock(mutex_);
        purgeExpired(Clock::now());
        return cache_list_.size();
    }

    [[nodiscard]] CacheStatistics statistics() const {
        std::lock_guard lock(mutex_);
        return CacheStatistics{hits_, misses_, evictions_, expirations_,
                               cache_list_.size()};
    }

    [[nodiscard]] std::size_t capacity() const noexcept { return max_size_; }
    [[nodiscard]] Duration ttl() const noexcept { return ttl_; }

private:
    struct CacheItem {
        std::string key;
        Value value;
        TimePoint expiry_time;
        TimePoint access_time;
    };

    using CacheList = std::list<CacheItem>;
    using CacheMap =
        std::unordered_map<std::string, typename CacheList::iterator>;

    [[nodiscard]] static bool isExpired(const CacheItem& item,
                                        const TimePoint& now) noexcept {
        return now > item.expiry_time;
    }

    // Caller holds mutex_.
    void evictLeastRecent() {
        if (cache_list_.empty()) {
            return;
        }
        auto& victim = cache_list_.back();
        spdlog::debug("Evicting least recently used cache key: {}",
                      victim.key);
        cache_map_.erase(victim.key);
        cache_list_.pop_back();
        ++evictions_;
    }

    // Caller holds mutex_.
    void purgeExpired(const TimePoint& now) {
        for (auto it = cache_list_.begin(); it != cache_list_.end();) {
            if (isExpired(*it, now)) {
                cache_map_.erase(it->key);
                it = cache_list_.erase(it);
                ++expirations_;
            } else {
                ++it;
            }
        }
    }

    Duration ttl_;
    std::size_t max_size_;

    CacheList cache_list_;
    CacheMap cache_map_;
    mutable std::mutex mutex_;

    std::size_t hits_{0};
    std::size_t misses_{0};
    std::size_t evictions_{0};
    std::size_t expirations_{0};
};

}  // namespace weave::cache

#endif  // WEAVE_CACHE_MEMORY_CACHE_HPP
