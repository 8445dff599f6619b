// tests/test_counterstore.cpp
#include <atomic>
#include <chrono>
#include <memory>
#include <thread>
#include <vector>

#include "gtest/gtest.h"

#include "../src/store/InMemoryCounterStore.hpp"
#include "TestMocks.hpp"

namespace {
std::vector<CounterCondition> dailyAndMonthly(const std::string& subject, int64_t daily, int64_t monthly) {
    return {
        {CounterKey{subject, "2024-03-15"}, "daily_count", daily},
        {CounterKey{subject, "2024-03"}, "monthly_count", monthly},
    };
}

IncrementAttributes attributes(std::chrono::seconds ttl = std::chrono::seconds(0)) {
    IncrementAttributes attrs;
    attrs.operation = "search";
    attrs.timestamp = "2024-03-15T10:00:00.000Z";
    attrs.ttl = ttl;
    return attrs;
}
}

TEST(InMemoryCounterStoreTest, IncrementsBothRecords) {
    InMemoryCounterStore store;
    IncrementResult result = store.conditionalIncrement(dailyAndMonthly("u1", 5, 100), attributes());

    ASSERT_TRUE(result.applied);
    EXPECT_EQ(result.new_values["daily_count"], 1);
    EXPECT_EQ(result.new_values["monthly_count"], 1);

    auto day = store.get(CounterKey{"u1", "2024-03-15"});
    ASSERT_TRUE(day.has_value());
    EXPECT_EQ(day->valueOf("daily_count"), 1);
    EXPECT_EQ(day->last_operation, "search");
    EXPECT_EQ(day->last_updated, "2024-03-15T10:00:00.000Z");
}

TEST(InMemoryCounterStoreTest, RejectsWithoutMutatingAnyRecord) {
    InMemoryCounterStore store;
    for (int i = 0; i < 3; ++i) {
        ASSERT_TRUE(store.conditionalIncrement(dailyAndMonthly("u1", 10, 3), attributes()).applied);
    }

    // Monthly is full, so the daily counter must not move either.
    IncrementResult result = store.conditionalIncrement(dailyAndMonthly("u1", 10, 3), attributes());
    EXPECT_FALSE(result.applied);
    EXPECT_TRUE(result.new_values.empty());
    EXPECT_EQ(store.get(CounterKey{"u1", "2024-03-15"})->valueOf("daily_count"), 3);
    EXPECT_EQ(store.get(CounterKey{"u1", "2024-03"})->valueOf("monthly_count"), 3);
}

TEST(InMemoryCounterStoreTest, ZeroLimitNeverAdmits) {
    InMemoryCounterStore store;
    EXPECT_FALSE(store.conditionalIncrement(dailyAndMonthly("u1", 0, 10), attributes()).applied);
    EXPECT_FALSE(store.get(CounterKey{"u1", "2024-03-15"}).has_value());
}

TEST(InMemoryCounterStoreTest, RecordsExpireAfterTtl) {
    auto clock = std::make_shared<ManualClock>();
    InMemoryCounterStore store(clock);
    ASSERT_TRUE(store.conditionalIncrement(dailyAndMonthly("u1", 5, 5), attributes(std::chrono::hours(24))).applied);

    clock->advance(std::chrono::hours(23));
    EXPECT_TRUE(store.get(CounterKey{"u1", "2024-03-15"}).has_value());
    clock->advance(std::chrono::hours(2));
    EXPECT_FALSE(store.get(CounterKey{"u1", "2024-03-15"}).has_value());
}

TEST(InMemoryCounterStoreTest, ConcurrentIncrementsNeverExceedLimit) {
    InMemoryCounterStore store;
    std::atomic<int> admitted{0};
    std::vector<std::thread> threads;
    for (int t = 0; t < 8; ++t) {
        threads.emplace_back([&store, &admitted]() {
            for (int i = 0; i < 50; ++i) {
                if (store.conditionalIncrement(dailyAndMonthly("hot", 100, 1000), attributes()).applied) {
                    ++admitted;
                }
            }
        });
    }
    for (auto& thread : threads) {
        thread.join();
    }

    EXPECT_EQ(admitted.load(), 100);
    EXPECT_EQ(store.get(CounterKey{"hot", "2024-03-15"})->valueOf("daily_count"), 100);
}
