#include <gtest/gtest.h>
#include "actiondag/common/engine_errors.hpp"
#include "actiondag/execution/result_cache.hpp"

#include <atomic>
#include <thread>

using namespace actiondag;

// =============================================================================
// Fixture
// =============================================================================

class ResultCacheTests : public ::testing::Test
{
protected:
    ResultCache cache;
    ResultCacheKey key{ActionKind::Build, "api", "v-0123456789"};
};

// =============================================================================
// get / put
// =============================================================================

TEST_F(ResultCacheTests, Key_RendersAsArtifactKey)
{
    EXPECT_EQ(key.to_string(), "build.api.v-0123456789");
}

TEST_F(ResultCacheTests, Get_Missing_ReturnsNullopt)
{
    EXPECT_FALSE(cache.get(key).has_value());
    EXPECT_EQ(cache.miss_count(), 1u);
}

TEST_F(ResultCacheTests, Put_ThenGet)
{
    EXPECT_TRUE(cache.put(key, {{"image", "api:1"}}));
    auto outputs = cache.get(key);
    ASSERT_TRUE(outputs.has_value());
    EXPECT_EQ(outputs->at("image"), "api:1");
    EXPECT_TRUE(cache.contains(key));
    EXPECT_EQ(cache.size(), 1u);
    EXPECT_EQ(cache.hit_count(), 1u);
}

TEST_F(ResultCacheTests, Put_IsWriteOnce)
{
    EXPECT_TRUE(cache.put(key, {{"image", "first"}}));
    EXPECT_FALSE(cache.put(key, {{"image", "second"}}));
    EXPECT_EQ(cache.get(key)->at("image"), "first");
}

TEST_F(ResultCacheTests, DifferentVersions_AreDifferentEntries)
{
    ResultCacheKey other{ActionKind::Build, "api", "v-9999999999"};
    cache.put(key, {{"n", "1"}});
    EXPECT_FALSE(cache.contains(other));
    cache.put(other, {{"n", "2"}});
    EXPECT_EQ(cache.size(), 2u);
}

TEST_F(ResultCacheTests, InvalidateAll_DropsEntries)
{
    cache.put(key, {});
    cache.invalidate_all();
    EXPECT_EQ(cache.size(), 0u);
    EXPECT_FALSE(cache.contains(key));
}

// =============================================================================
// get_or_compute
// =============================================================================

TEST_F(ResultCacheTests, GetOrCompute_ComputesThenHits)
{
    int calls = 0;
    auto compute = [&calls]() {
        ++calls;
        CacheComputation value;
        value.outputs = {{"n", std::to_string(calls)}};
        return value;
    };

    CacheLookup first = cache.get_or_compute(key, compute);
    EXPECT_EQ(first.source, CacheSource::Computed);
    CacheLookup second = cache.get_or_compute(key, compute);
    EXPECT_EQ(second.source, CacheSource::Hit);
    EXPECT_EQ(second.value.outputs.at("n"), "1");
    EXPECT_EQ(calls, 1);
}

TEST_F(ResultCacheTests, GetOrCompute_NonCacheable_IsNotStored)
{
    auto compute = []() {
        CacheComputation value;
        value.cacheable = false;
        return value;
    };
    EXPECT_EQ(cache.get_or_compute(key, compute).source, CacheSource::Computed);
    EXPECT_FALSE(cache.contains(key));
}

TEST_F(ResultCacheTests, GetOrCompute_Failure_IsNotStoredAndRethrown)
{
    auto failing = []() -> CacheComputation { throw std::runtime_error("failed"); };
    EXPECT_THROW(cache.get_or_compute(key, failing), std::runtime_error);
    EXPECT_FALSE(cache.contains(key));

    // The in-flight slot was released: the next caller computes again
    auto succeeding = []() { return CacheComputation{}; };
    EXPECT_EQ(cache.get_or_compute(key, succeeding).source, CacheSource::Computed);
}

TEST_F(ResultCacheTests, GetOrCompute_ConcurrentCallers_ComputeOnce)
{
    constexpr int kThreads = 8;
    std::atomic<int> computations{0};
    std::atomic<bool> release{false};

    auto compute = [&]() {
        ++computations;
        while (!release.load())
        {
            std::this_thread::sleep_for(std::chrono::milliseconds(1));
        }
        CacheComputation value;
        value.outputs = {{"n", "shared"}};
        return value;
    };

    std::vector<CacheLookup> lookups(kThreads);
    std::vector<std::thread> threads;
    for (int i = 0; i < kThreads; ++i)
    {
        threads.emplace_back([&, i]() { lookups[i] = cache.get_or_compute(key, compute); });
    }

    // Hold the computation until every other thread has joined it
    const auto give_up = std::chrono::steady_clock::now() + std::chrono::seconds(5);
    while (cache.dedup_count() < kThreads - 1 && std::chrono::steady_clock::now() < give_up)
    {
        std::this_thread::sleep_for(std::chrono::milliseconds(1));
    }
    release.store(true);
    for (auto& thread : threads)
    {
        thread.join();
    }

    EXPECT_EQ(computations.load(), 1);
    int computed = 0;
    for (const auto& lookup : lookups)
    {
        EXPECT_EQ(lookup.value.outputs.at("n"), "shared");
        if (lookup.source == CacheSource::Computed)
        {
            ++computed;
        }
    }
    EXPECT_EQ(computed, 1);
    EXPECT_EQ(cache.dedup_count(), static_cast<uint64_t>(kThreads - 1));
}

TEST_F(ResultCacheTests, GetOrCompute_FailureIsSharedWithWaiters)
{
    std::atomic<bool> release{false};
    auto failing = [&]() -> CacheComputation {
        while (!release.load())
        {
            std::this_thread::sleep_for(std::chrono::milliseconds(1));
        }
        throw std::runtime_error("shared failure");
    };

    std::atomic<int> failures{0};
    auto call = [&]() {
        try
        {
            cache.get_or_compute(key, failing);
        }
        catch (const std::runtime_error&)
        {
            ++failures;
        }
    };

    std::thread first(call);
    const auto give_up = std::chrono::steady_clock::now() + std::chrono::seconds(5);
    while (cache.miss_count() < 1 && std::chrono::steady_clock::now() < give_up)
    {
        std::this_thread::sleep_for(std::chrono::milliseconds(1));
    }
    std::thread second(call);
    while (cache.dedup_count() < 1 && std::chrono::steady_clock::now() < give_up)
    {
        std::this_thread::sleep_for(std::chrono::milliseconds(1));
    }
    release.store(true);
    first.join();
    second.join();

    EXPECT_EQ(failures.load(), 2);
    EXPECT_FALSE(cache.contains(key));
}

TEST_F(ResultCacheTests, GetOrCompute_AbortedComputation_WaiterComputesItself)
{
    std::atomic<bool> release{false};
    auto timing_out = [&]() -> CacheComputation {
        while (!release.load())
        {
            std::this_thread::sleep_for(std::chrono::milliseconds(1));
        }
        throw TimeoutError("build.api timed out after 10 ms");
    };

    bool first_timed_out = false;
    std::thread first([&]() {
        try
        {
            cache.get_or_compute(key, timing_out);
        }
        catch (const TimeoutError&)
        {
            first_timed_out = true;
        }
    });
    const auto give_up = std::chrono::steady_clock::now() + std::chrono::seconds(5);
    while (cache.miss_count() < 1 && std::chrono::steady_clock::now() < give_up)
    {
        std::this_thread::sleep_for(std::chrono::milliseconds(1));
    }

    CacheLookup second;
    std::thread waiter([&]() {
        second = cache.get_or_compute(key, []() {
            CacheComputation value;
            value.outputs = {{"n", "own"}};
            return value;
        });
    });
    while (cache.dedup_count() < 1 && std::chrono::steady_clock::now() < give_up)
    {
        std::this_thread::sleep_for(std::chrono::milliseconds(1));
    }
    release.store(true);
    first.join();
    waiter.join();

    EXPECT_TRUE(first_timed_out);
    EXPECT_EQ(second.source, CacheSource::Computed);
    EXPECT_EQ(second.value.outputs.at("n"), "own");
    EXPECT_TRUE(cache.contains(key));
}

TEST_F(ResultCacheTests, GetOrCompute_CancelledComputation_IsNotSharedWithWaiters)
{
    std::atomic<bool> release{false};
    auto cancelled = [&]() -> CacheComputation {
        while (!release.load())
        {
            std::this_thread::sleep_for(std::chrono::milliseconds(1));
        }
        throw OperationCancelledError();
    };

    std::thread first([&]() { EXPECT_THROW(cache.get_or_compute(key, cancelled), OperationCancelledError); });
    const auto give_up = std::chrono::steady_clock::now() + std::chrono::seconds(5);
    while (cache.miss_count() < 1 && std::chrono::steady_clock::now() < give_up)
    {
        std::this_thread::sleep_for(std::chrono::milliseconds(1));
    }

    CacheLookup second;
    std::thread waiter([&]() { second = cache.get_or_compute(key, []() { return CacheComputation{}; }); });
    while (cache.dedup_count() < 1 && std::chrono::steady_clock::now() < give_up)
    {
        std::this_thread::sleep_for(std::chrono::milliseconds(1));
    }
    release.store(true);
    first.join();
    waiter.join();

    EXPECT_EQ(second.source, CacheSource::Computed);
    EXPECT_EQ(cache.miss_count(), 2u);
}
