#include "weave/cache/memory_cache.hpp"

#include <gtest/gtest.h>

#include <memory>
#include <optional>
#include <string>
#include <thread>
#include <vector>

#include "../manual_clock.hpp"

using namespace weave::cache;
using namespace std::chrono_literals;

class MemoryCacheTest : public ::testing::Test {
protected:
    void SetUp() override {
        ManualClock::reset();
        cache = std::make_unique<MemoryCache<int, ManualClock>>(
            CacheOptions{.ttl = 1000ms, .maxSize = 3});
    }

    void TearDown() override { cache.reset(); }

    std::unique_ptr<MemoryCache<int, ManualClock>> cache;
};

TEST_F(MemoryCacheTest, SetAndGet) {
    cache->set("a", 1);
    auto value = cache->get("a");
    ASSERT_TRUE(value.has_value());
    EXPECT_EQ(value.value(), 1);
}

TEST_F(MemoryCacheTest, GetMissingKey) {
    EXPECT_FALSE(cache->get("missing").has_value());
    EXPECT_EQ(cache->statistics().misses, 1u);
}

TEST_F(MemoryCacheTest, OverwriteUpdatesValue) {
    cache->set("a", 1);
    cache->set("a", 2);
    EXPECT_EQ(cache->get("a").value(), 2);
    EXPECT_EQ(cache->size(), 1u);
}

TEST_F(MemoryCacheTest, EntryLivesUntilTtl) {
    cache->set("a", 1);
    ManualClock::advance(999ms);
    EXPECT_EQ(cache->get("a").value_or(-1), 1);
    ManualClock::advance(2ms);
    EXPECT_FALSE(cache->get("a").has_value());
    EXPECT_EQ(cache->statistics().expirations, 1u);
}

TEST_F(MemoryCacheTest, CustomTtlOverridesDefault) {
    cache->set("short", 1, 100ms);
    cache->set("long", 2);
    ManualClock::advance(150ms);
    EXPECT_FALSE(cache->get("short").has_value());
    EXPECT_TRUE(cache->get("long").has_value());
}

TEST_F(MemoryCacheTest, HasPurgesExpiredEntry) {
    cache->set("a", 1);
    EXPECT_TRUE(cache->has("a"));
    ManualClock::advance(1001ms);
    EXPECT_FALSE(cache->has("a"));
    EXPECT_EQ(cache->statistics().size, 0u);
}

TEST_F(MemoryCacheTest, EvictsLeastRecentlyUsed) {
    cache->set("a", 1);
    cache->set("b", 2);
    cache->set("c", 3);
    cache->get("a");
    cache->set("d", 4);

    EXPECT_FALSE(cache->has("b"));
    EXPECT_TRUE(cache->has("a"));
    EXPECT_TRUE(cache->has("c"));
    EXPECT_TRUE(cache->has("d"));
    EXPECT_EQ(cache->statistics().evictions, 1u);
}

TEST_F(MemoryCacheTest, SetCountsAsTouch) {
    cache->set("a", 1);
    cache->set("b", 2);
    cache->set("c", 3);
    cache->set("a", 10);
    cache->set("d", 4);

    EXPECT_FALSE(cache->has("b"));
    EXPECT_EQ(cache->get("a").value(), 10);
}

TEST_F(MemoryCacheTest, OverwriteInFullCacheDoesNotEvict) {
    cache->set("a", 1);
    cache->set("b", 2);
    cache->set("c", 3);
    cache->set("c", 30);
    EXPECT_EQ(cache->size(), 3u);
    EXPECT_EQ(cache->statistics().evictions, 0u);
}

TEST_F(MemoryCacheTest, RemoveMissingKeyIsNoop) {
    cache->set("a", 1);
    EXPECT_FALSE(cache->remove("missing"));
    EXPECT_TRUE(cache->remove("a"));
    EXPECT_FALSE(cache->remove("a"));
    EXPECT_EQ(cache->size(), 0u);
}

TEST_F(MemoryCacheTest, SizeSweepsExpiredEntries) {
    cache->set("a", 1, 100ms);
    cache->set("b", 2);
    ManualClock::advance(200ms);
    EXPECT_EQ(cache->size(), 1u);
}

TEST_F(MemoryCacheTest, ClearKeepsStatistics) {
    cache->set("a", 1);
    cache->get("a");
    cache->get("b");
    cache->clear();
    auto stats = cache->statistics();
    EXPECT_EQ(stats.size, 0u);
    EXPECT_EQ(stats.hits, 1u);
    EXPECT_EQ(stats.misses, 1u);
    EXPECT_DOUBLE_EQ(stats.hitRate(), 0.5);
}

TEST_F(MemoryCacheTest, RejectsInvalidOptions) {
    EXPECT_THROW((MemoryCache<int>(CacheOptions{.ttl = 0ms, .maxSize = 1})),
                 weave::error::InvalidArgument);
    EXPECT_THROW((MemoryCache<int>(CacheOptions{.ttl = 1s, .maxSize = 0})),
                 weave::error::InvalidArgument);
}

TEST_F(MemoryCacheTest, ConcurrentAccess) {
    MemoryCache<int> shared(CacheOptions{.ttl = 10s, .maxSize = 64});
    std::vector<std::thread> threads;
    for (int t = 0; t < 4; ++t) {
        threads.emplace_back([&shared, t] {
            for (int i = 0; i < 200; ++i) {
                auto key = std::to_string((t * 200 + i) % 100);
                shared.set(key, i);
                shared.get(key);
            }
        });
    }
    for (auto& thread : threads) {
        thread.join();
    }
    EXPECT_LE(shared.size(), 64u);
}

TEST(MemoryCacheScenarioTest, CustomTtlWindow) {
    ManualClock::reset();
    MemoryCache<int, ManualClock> cache;
    cache.set("k", 1, 100ms);
    ManualClock::advance(50ms);
    EXPECT_EQ(cache.get("k"), 1);
    ManualClock::advance(100ms);
    EXPECT_EQ(cache.get("k"), std::nullopt);
}

TEST(MemoryCacheScenarioTest, ReadTouchProtectsFromEviction) {
    MemoryCache<int> cache(CacheOptions{.ttl = 1min, .maxSize = 2});
    cache.set("a", 1);
    cache.set("b", 2);
    cache.get("a");
    cache.set("c", 3);
    EXPECT_FALSE(cache.has("b"));
    EXPECT_TRUE(cache.has("a"));
    EXPECT_TRUE(cache.has("c"));
}
