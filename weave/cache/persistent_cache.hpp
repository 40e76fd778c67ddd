/*
 * persistent_cache.hpp
 *
 * Copyright (C) 2024 weave contributors
 */

/*************************************************

Date: 2024-6-2

Description: Best-effort file backed cache with expiry

**************************************************/

#ifndef WEAVE_CACHE_PERSISTENT_CACHE_HPP
#define WEAVE_CACHE_PERSISTENT_CACHE_HPP

#include <chrono>
#include <filesystem>
#include <mutex>
#include <optional>
#include <string>
#include <utility>

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

namespace weave::cache {

/**
 * @brief Location and lifetime settings of a PersistentCache.
 */
struct PersistentCacheOptions {
    /// Directory holding the namespace files; the system temp directory
    /// when empty.
    std::filesystem::path directory;
    /// Lifetime of every stored entry.
    std::chrono::milliseconds ttl{std::chrono::hours(24)};
};

/**
 * @brief JSON document of one namespace stored in a single file.
 *
 * The file holds an object mapping keys to `{"value": ..., "expiresAt":
 * <unix ms>}`. Every storage problem is logged and turned into a miss or a
 * no-op; nothing here throws.
 */
class JsonFileStore {
public:
    JsonFileStore(std::filesystem::path directory, const std::string& ns);

    /**
     * @brief The stored value of @p key, removing it when expired.
     */
    [[nodiscard]] auto get(const std::string& key)
        -> std::optional<nlohmann::json>;

    void set(const std::string& key, const nlohmann::json& value,
             std::chrono::milliseconds ttl);

    void remove(const std::string& key);

    /**
     * @brief Deletes the namespace file.
     */
    void clear();

    [[nodiscard]] auto path() const -> const std::filesystem::path& {
        return file_;
    }

private:
    [[nodiscard]] auto load() const -> nlohmann::json;
    void save(const nlohmann::json& document) const;

    std::filesystem::path file_;
    std::mutex mutex_;
};

/**
 * @brief Namespaced key-value cache persisted to disk.
 *
 * A convenience, not a store of record: unreadable or corrupt files and
 * failed writes degrade to cache misses. Values are serialized with
 * nlohmann::json, so T needs to_json/from_json.
 */
template <typename T>
class PersistentCache {
public:
    PersistentCache(const std::string& ns,
                    PersistentCacheOptions options = {})
        : ttl_(options.ttl), store_(std::move(options.directory), ns) {}

    [[nodiscard]] std::optional<T> get(const std::string& key) {
        auto stored = store_.get(key);
        if (!stored) {
            return std::nullopt;
        }
        try {
            return stored->template get<T>();
        } catch (const nlohmann::json::exception& e) {
            spdlog::warn("Discarding undecodable cache entry {}: {}", key,
                         e.what());
            store_.remove(key);
            return std::nullopt;
        }
    }

    void set(const std::string& key, const T& value) {
        nlohmann::json encoded;
        try {
            encoded = value;
        } catch (const nlohmann::json::exception& e) {
            spdlog::warn("Cannot encode cache entry {}: {}", key, e.what());
            return;
        }
        store_.set(key, encoded, ttl_);
    }

    void remove(const std::string& key) { store_.remove(key); }

    void clear() { store_.clear(); }

    [[nodiscard]] auto path() const -> const std::filesystem::path& {
        return store_.path();
    }

private:
    std::chrono::milliseconds ttl_;
    JsonFileStore store_;
};

}  // namespace weave::cache

#endif  // WEAVE_CACHE_PERSISTENT_CACHE_HPP
