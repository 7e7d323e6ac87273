/*
 * test_bounded_cache.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2024-11-28

Description: Tests for BoundedCache LRU, TTL and single-flight behavior

**************************************************/

#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include "cache/bounded_cache.hpp"
#include "exception/exception.hpp"

#include <atomic>
#include <chrono>
#include <future>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

using namespace curator::cache;
using namespace std::chrono_literals;

class BoundedCacheTest : public ::testing::Test {
protected:
    static auto options(size_t maxSize) -> BoundedCacheOptions {
        BoundedCacheOptions opts;
        opts.maxSize = maxSize;
        opts.sweepInterval = 0ms;
        opts.waitPollInterval = 5ms;
        return opts;
    }
};

// ============================================================================
// Basic Operations
// ============================================================================

TEST_F(BoundedCacheTest, SetThenGet) {
    BoundedCache<std::string, int> cache(options(4));
    cache.set("a", 1);
    ASSERT_TRUE(cache.get("a").has_value());
    EXPECT_EQ(*cache.get("a"), 1);
    EXPECT_FALSE(cache.get("missing").has_value());
}

TEST_F(BoundedCacheTest, ZeroCapacityIsRejected) {
    EXPECT_THROW((BoundedCache<std::string, int>(options(0))),
                 curator::CuratorException);
}

TEST_F(BoundedCacheTest, RemoveAndClear) {
    BoundedCache<std::string, int> cache(options(4));
    cache.set("a", 1);
    cache.set("b", 2);
    EXPECT_TRUE(cache.remove("a"));
    EXPECT_FALSE(cache.remove("a"));
    EXPECT_EQ(cache.size(), 1u);
    cache.clear();
    EXPECT_EQ(cache.size(), 0u);
}

TEST_F(BoundedCacheTest, StatisticsTrackHitsAndMisses) {
    BoundedCache<std::string, int> cache(options(4));
    cache.set("a", 1);
    (void)cache.get("a");
    (void)cache.get("a");
    (void)cache.get("b");
    auto stats = cache.statistics();
    EXPECT_EQ(stats.hits, 2u);
    EXPECT_EQ(stats.misses, 1u);
    EXPECT_EQ(stats.size, 1u);
    EXPECT_EQ(stats.maxSize, 4u);
    EXPECT_NEAR(stats.hitRate, 2.0 / 3.0, 1e-9);
    EXPECT_GT(stats.approximateMemory, 0u);
    EXPECT_TRUE(stats.toJson().contains("hitRate"));
}

// ============================================================================
// LRU Eviction
// ============================================================================

TEST_F(BoundedCacheTest, SetEvictsLeastRecentlyUsed) {
    BoundedCache<std::string, int> cache(options(2));
    cache.set("a", 1);
    cache.set("b", 2);
    ASSERT_TRUE(cache.get("a").has_value());  // a is now most recent
    cache.set("c", 3);

    EXPECT_EQ(cache.size(), 2u);
    EXPECT_TRUE(cache.contains("a"));
    EXPECT_FALSE(cache.contains("b"));
    EXPECT_TRUE(cache.contains("c"));
    EXPECT_EQ(cache.statistics().evictions, 1u);
}

TEST_F(BoundedCacheTest, GetOrComputeRespectsCapacity) {
    BoundedCache<std::string, int> cache(options(3));
    for (int i = 0; i < 10; ++i) {
        auto value = cache.getOrCompute(
            "key" + std::to_string(i),
            [i](std::stop_token) { return i * 10; });
        EXPECT_EQ(value, i * 10);
        EXPECT_LE(cache.size(), 3u);
    }
    EXPECT_TRUE(cache.contains("key9"));
    EXPECT_FALSE(cache.contains("key0"));
    EXPECT_EQ(cache.statistics().evictions, 7u);
}

TEST_F(BoundedCacheTest, OverwriteDoesNotEvict) {
    BoundedCache<std::string, int> cache(options(2));
    cache.set("a", 1);
    cache.set("b", 2);
    cache.set("a", 5);
    EXPECT_EQ(cache.size(), 2u);
    EXPECT_EQ(*cache.get("a"), 5);
    EXPECT_EQ(cache.statistics().evictions, 0u);
}

// ============================================================================
// Expiry
// ============================================================================

TEST_F(BoundedCacheTest, ExpiredEntryIsAbsent) {
    BoundedCache<std::string, int> cache(options(4));
    cache.set("short", 1, 20ms);
    cache.set("long", 2, 10min);
    std::this_thread::sleep_for(60ms);

    EXPECT_FALSE(cache.get("short").has_value());
    EXPECT_TRUE(cache.get("long").has_value());
}

TEST_F(BoundedCacheTest, PurgeExpiredRemovesOnlyExpired) {
    auto opts = options(16);
    opts.sweepBatchSize = 2;
    BoundedCache<std::string, int> cache(opts);
    for (int i = 0; i < 5; ++i) {
        cache.set("tmp" + std::to_string(i), i, 10ms);
    }
    cache.set("keep", 42, 10min);
    std::this_thread::sleep_for(40ms);

    EXPECT_EQ(cache.purgeExpired(), 5u);
    EXPECT_EQ(cache.size(), 1u);
    EXPECT_EQ(cache.statistics().expirations, 5u);
}

TEST_F(BoundedCacheTest, SweeperPurgesInBackground) {
    auto opts = options(16);
    opts.sweepInterval = 20ms;
    BoundedCache<std::string, int> cache(opts);
    cache.set("tmp", 1, 10ms);

    auto deadline = std::chrono::steady_clock::now() + 2s;
    while (cache.size() > 0 && std::chrono::steady_clock::now() < deadline) {
        std::this_thread::sleep_for(10ms);
    }
    EXPECT_EQ(cache.size(), 0u);
}

// ============================================================================
// Single Flight
// ============================================================================

TEST_F(BoundedCacheTest, ConcurrentGetOrComputeRunsFactoryOnce) {
    BoundedCache<std::string, int> cache(options(8));
    std::atomic<int> calls{0};
    auto factory = [&calls](std::stop_token) {
        ++calls;
        std::this_thread::sleep_for(50ms);
        return 7;
    };

    constexpr int kCallers = 16;
    std::vector<std::future<int>> results;
    for (int i = 0; i < kCallers; ++i) {
        results.push_back(std::async(std::launch::async, [&cache, &factory] {
            return cache.getOrCompute("shared", factory);
        }));
    }
    for (auto& result : results) {
        EXPECT_EQ(result.get(), 7);
    }
    EXPECT_EQ(calls.load(), 1);
    EXPECT_EQ(cache.statistics().misses, 1u);
}

TEST_F(BoundedCacheTest, FactoryFailureIsNotCached) {
    BoundedCache<std::string, int> cache(options(4));
    EXPECT_THROW(cache.getOrCompute("k",
                                    [](std::stop_token) -> int {
                                        throw std::runtime_error("boom");
                                    }),
                 std::runtime_error);
    EXPECT_FALSE(cache.contains("k"));

    EXPECT_EQ(cache.getOrCompute("k", [](std::stop_token) { return 3; }), 3);
    EXPECT_TRUE(cache.contains("k"));
}

TEST_F(BoundedCacheTest, FactoryFailureReachesWaiters) {
    BoundedCache<std::string, int> cache(options(4));
    std::promise<void> started;
    auto startedFuture = started.get_future();
    std::promise<void> release;
    auto releaseFuture = release.get_future().share();

    auto owner = std::async(std::launch::async, [&] {
        return cache.getOrCompute("k", [&](std::stop_token) -> int {
            started.set_value();
            releaseFuture.wait();
            throw std::runtime_error("provider down");
        });
    });
    startedFuture.wait();
    auto waiter = std::async(std::launch::async, [&] {
        return cache.getOrCompute("k", [](std::stop_token) { return 1; });
    });
    std::this_thread::sleep_for(30ms);
    release.set_value();

    EXPECT_THROW(owner.get(), std::runtime_error);
    // The waiter either shared the failure or started after it and computed.
    try {
        EXPECT_EQ(waiter.get(), 1);
    } catch (const std::runtime_error& e) {
        EXPECT_STREQ(e.what(), "provider down");
    }
}

TEST_F(BoundedCacheTest, WaiterCancellationDoesNotAffectOwner) {
    BoundedCache<std::string, int> cache(options(4));
    std::promise<void> started;
    auto startedFuture = started.get_future();
    std::promise<void> release;
    auto releaseFuture = release.get_future().share();

    auto owner = std::async(std::launch::async, [&] {
        return cache.getOrCompute("k", [&](std::stop_token) {
            started.set_value();
            releaseFuture.wait();
            return 11;
        });
    });
    startedFuture.wait();

    std::stop_source waiterStop;
    auto waiter = std::async(std::launch::async, [&] {
        return cache.getOrCompute(
            "k", [](std::stop_token) { return -1; }, std::nullopt,
            waiterStop.get_token());
    });
    std::this_thread::sleep_for(20ms);
    waiterStop.request_stop();

    EXPECT_THROW(waiter.get(), curator::OperationCancelledException);
    release.set_value();
    EXPECT_EQ(owner.get(), 11);
    EXPECT_EQ(*cache.get("k"), 11);
}

TEST_F(BoundedCacheTest, AsyncComputeDeliversValue) {
    BoundedCache<std::string, int> cache(options(4));
    auto future =
        cache.getOrComputeAsync("k", [](std::stop_token) { return 99; });
    EXPECT_EQ(future.get(), 99);
    EXPECT_TRUE(cache.contains("k"));
}
