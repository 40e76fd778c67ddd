#ifndef WEAVE_CACHE_CACHED_FUNCTION_HPP
#define WEAVE_CACHE_CACHED_FUNCTION_HPP

#include <functional>
#include <string>
#include <type_traits>
#include <utility>

#include <spdlog/fmt/fmt.h>

#include "weave/cache/dedup.hpp"
#include "weave/cache/memory_cache.hpp"
#include "weave/error/exception.hpp"

namespace weave::cache {

template <typename Signature>
class CachedFunction;

/**
 * @brief Memoizes a function with TTL/LRU caching and in-flight dedup.
 *
 * Arguments are mapped to a string key. A cached result is returned
 * without calling the function; concurrent misses with the same key call
 * it once and share the outcome. Failures are not cached.
 *
 * Without a key generator the arguments are formatted with fmt and joined
 * with ','; they must then be formattable.
 *
 * @code
 * auto balance = weave::cache::makeCached(
 *     std::function<double(std::string)>(fetchBalance),
 *     {.ttl = std::chrono::seconds(30), .maxSize = 256});
 * double b = balance("0xabc");
 * @endcode
 */
template <typename R, typename... Args>
class CachedFunction<R(Args...)> {
public:
    using Function = std::function<R(Args...)>;
    using KeyGenerator = std::function<std::string(const Args&...)>;

    explicit CachedFunction(Function fn, CacheOptions options = {},
                            KeyGenerator key_generator = nullptr)
        : fn_(std::move(fn)),
          key_generator_(std::move(key_generator)),
          cache_(options) {
        if (!fn_) {
            THROW_INVALID_ARGUMENT("CachedFunction requires a function");
        }
    }

    CachedFunction(const CachedFunction&) = delete;
    CachedFunction& operator=(const CachedFunction&) = delete;

    R operator()(const Args&... args) {
        auto key = keyFor(args...);
        if (auto cached = cache_.get(key)) {
            return std::move(*cached);
        }
        return dedup_.execute(key, [&]() -> R {
            R result = fn_(args...);
            cache_.set(key, result);
            return result;
        });
    }

    /**
     * @brief Forgets the cached result for @p args.
     */
    bool invalidate(const Args&... args) {
        return cache_.remove(keyFor(args...));
    }

    void clear() noexcept { cache_.clear(); }

    [[nodiscard]] CacheStatistics statistics() const {
        return cache_.statistics();
    }

private:
    std::string keyFor(const Args&... args) const {
        if (key_generator_) {
            return key_generator_(args...);
        }
        if constexpr ((fmt::is_formattable<std::decay_t<Args>>::value &&
                       ...)) {
            std::string key;
            bool first = true;
            ((key += std::exchange(first, false) ? "" : ",",
              key += fmt::format("{}", args)),
             ...);
            return key;
        } else {
            THROW_INVALID_ARGUMENT(
                "Arguments are not formattable, a key generator is required");
        }
    }

    Function fn_;
    KeyGenerator key_generator_;
    MemoryCache<R> cache_;
    RequestDeduplicator<R> dedup_;
};

/**
 * @brief Builds a CachedFunction deducing its signature.
 */
template <typename R, typename... Args>
auto makeCached(std::function<R(Args...)> fn, CacheOptions options = {},
                typename CachedFunction<R(Args...)>::KeyGenerator
                    key_generator = nullptr) -> CachedFunction<R(Args...)> {
    return CachedFunction<R(Args...)>(std::move(fn), options,
                                      std::move(key_generator));
}

}  // namespace weave::cache

#endif  // WEAVE_CACHE_CACHED_FUNCTION_HPP
