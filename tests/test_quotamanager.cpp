// tests/test_quotamanager.cpp
#include <atomic>
#include <chrono>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <thread>
#include <vector>

#include "gtest/gtest.h"
#include "gmock/gmock.h"

#include "../src/cache/InMemoryCache.hpp"
#include "../src/config/AppConfig.hpp"
#include "../src/core/QuotaManager.hpp"
#include "../src/models/ResilienceErrors.hpp"
#include "../src/store/InMemoryCounterStore.hpp"
#include "TestMocks.hpp"

using ::testing::_;
using ::testing::AnyNumber;
using ::testing::NiceMock;
using ::testing::Return;
using ::testing::Throw;

class QuotaManagerTest : public ::testing::Test {
protected:
    std::shared_ptr<ManualClock> clock_ = std::make_shared<ManualClock>();
    std::shared_ptr<InMemoryCounterStore> store_ = std::make_shared<InMemoryCounterStore>(clock_);
    std::shared_ptr<InMemoryCache> cache_ = std::make_shared<InMemoryCache>(300, 100, clock_);
    std::shared_ptr<NiceMock<MockLogger>> logger_ = std::make_shared<NiceMock<MockLogger>>();
    std::shared_ptr<NiceMock<MockStatsDClient>> statsd_ = std::make_shared<NiceMock<MockStatsDClient>>();

    QuotaConfig limits(int64_t daily, int64_t monthly) {
        QuotaConfig config;
        config.daily_limit = daily;
        config.monthly_limit = monthly;
        return config;
    }

    std::unique_ptr<QuotaManager> makeManager(QuotaConfig config) {
        return std::make_unique<QuotaManager>(store_, cache_, config, logger_, statsd_, clock_);
    }
};

TEST_F(QuotaManagerTest, DailyLimitRejectsFourthOperation) {
    auto manager = makeManager(limits(3, 100));

    for (int i = 1; i <= 3; ++i) {
        QuotaInfo info = manager->checkAndIncrement("u1", "search");
        ASSERT_TRUE(info.allowed) << "operation " << i;
        EXPECT_TRUE(info.atomic);
        EXPECT_EQ(info.daily_used, i);
        EXPECT_EQ(info.bucket_date, "2024-03-15");
    }

    QuotaInfo rejected = manager->checkAndIncrement("u1", "search");
    EXPECT_FALSE(rejected.allowed);
    EXPECT_EQ(rejected.exceeded, QuotaLimit::Daily);
    EXPECT_EQ(rejected.daily_used, 3);
    EXPECT_EQ(rejected.dailyRemaining(), 0);
    EXPECT_FALSE(rejected.tracking_error.has_value());

    UsageStats stats = manager->getUsageStats("u1");
    EXPECT_EQ(stats.daily.used, 3);
    EXPECT_EQ(stats.monthly.used, 3);
    EXPECT_EQ(stats.status, UsageStatus::Exceeded);
}

TEST_F(QuotaManagerTest, MonthlyLimitIsReportedAsMonthly) {
    auto manager = makeManager(limits(10, 2));
    ASSERT_TRUE(manager->checkAndIncrement("u1", "a").allowed);
    ASSERT_TRUE(manager->checkAndIncrement("u1", "b").allowed);

    QuotaInfo rejected = manager->checkAndIncrement("u1", "c");
    EXPECT_FALSE(rejected.allowed);
    EXPECT_EQ(rejected.exceeded, QuotaLimit::Monthly);
    EXPECT_EQ(rejected.daily_used, 2);
}

TEST_F(QuotaManagerTest, RejectedOperationDoesNotConsume) {
    auto manager = makeManager(limits(1, 100));
    ASSERT_TRUE(manager->checkAndIncrement("u1", "a").allowed);
    for (int i = 0; i < 5; ++i) {
        EXPECT_FALSE(manager->checkAndIncrement("u1", "a").allowed);
    }
    EXPECT_EQ(manager->getUsageStats("u1").monthly.used, 1);
}

TEST_F(QuotaManagerTest, ZeroLimitDeniesEverything) {
    auto manager = makeManager(limits(0, 100));
    QuotaInfo info = manager->checkAndIncrement("u1", "a");
    EXPECT_FALSE(info.allowed);
    EXPECT_EQ(info.exceeded, QuotaLimit::Daily);
    EXPECT_FALSE(manager->checkFast("u1").allowed);
}

TEST_F(QuotaManagerTest, CheckFastNeverConsumes) {
    auto manager = makeManager(limits(2, 100));
    for (int i = 0; i < 10; ++i) {
        QuotaInfo info = manager->checkFast("u1");
        EXPECT_TRUE(info.allowed);
        EXPECT_EQ(info.daily_used, 0);
    }
    EXPECT_EQ(manager->getUsageStats("u1").daily.used, 0);
}

TEST_F(QuotaManagerTest, CheckFastServesRepeatReadsFromCache) {
    auto store = std::make_shared<NiceMock<MockCounterStore>>();
    CounterRecord day;
    day.fields[Constants::DAILY_COUNT_FIELD] = 2;
    day.last_operation = "search";
    day.last_updated = "2024-03-15T09:00:00.000Z";
    CounterRecord month;
    month.fields[Constants::MONTHLY_COUNT_FIELD] = 9;
    // Day and month record on the first call only.
    EXPECT_CALL(*store, get(CounterKey{"u1", "2024-03-15"})).Times(1).WillOnce(Return(day));
    EXPECT_CALL(*store, get(CounterKey{"u1", "2024-03"})).Times(1).WillOnce(Return(month));
    QuotaManager manager(store, cache_, limits(5, 100), logger_, statsd_, clock_);

    QuotaInfo first = manager.checkFast("u1");
    EXPECT_FALSE(first.cached);
    for (int i = 0; i < 3; ++i) {
        clock_->advance(std::chrono::seconds(60));
        QuotaInfo again = manager.checkFast("u1");
        EXPECT_TRUE(again.cached);
        EXPECT_EQ(again.allowed, first.allowed);
        EXPECT_EQ(again.exceeded, first.exceeded);
        EXPECT_EQ(again.bucket_date, first.bucket_date);
        EXPECT_EQ(again.daily_used, 2);
        EXPECT_EQ(again.monthly_used, 9);
        EXPECT_EQ(again.daily_limit, first.daily_limit);
        EXPECT_EQ(again.monthly_limit, first.monthly_limit);
    }
}

TEST_F(QuotaManagerTest, IncrementInvalidatesCachedUsage) {
    auto manager = makeManager(limits(5, 100));
    EXPECT_EQ(manager->checkFast("u1").daily_used, 0);
    ASSERT_TRUE(manager->checkAndIncrement("u1", "a").allowed);

    QuotaInfo after = manager->checkFast("u1");
    EXPECT_FALSE(after.cached);
    EXPECT_EQ(after.daily_used, 1);
}

namespace {
// Runs a hook in the middle of a usage read, after the day record was read
// and before the month record is.
class InterleavingCounterStore : public ICounterStore {
public:
    explicit InterleavingCounterStore(std::shared_ptr<ICounterStore> inner) : inner_(std::move(inner)) {}

    IncrementResult conditionalIncrement(const std::vector<CounterCondition>& conditions,
                                         const IncrementAttributes& attributes) override {
        return inner_->conditionalIncrement(conditions, attributes);
    }

    std::optional<CounterRecord> get(const CounterKey& key) override {
        if (key.bucket.size() == 7 && during_month_read) {
            auto hook = std::move(during_month_read);
            during_month_read = nullptr;
            hook();
        }
        return inner_->get(key);
    }

    std::function<void()> during_month_read;

private:
    std::shared_ptr<ICounterStore> inner_;
};
}

TEST_F(QuotaManagerTest, IncrementDuringCheckFastReadIsNotMaskedByCache) {
    auto store = std::make_shared<InterleavingCounterStore>(store_);
    QuotaManager manager(store, cache_, limits(5, 100), logger_, statsd_, clock_);
    store->during_month_read = [&manager]() {
        ASSERT_TRUE(manager.checkAndIncrement("u1", "search").allowed);
    };

    QuotaInfo raced = manager.checkFast("u1");
    EXPECT_EQ(raced.daily_used, 0);

    QuotaInfo next = manager.checkFast("u1");
    EXPECT_EQ(next.daily_used, 1);
    EXPECT_EQ(next.monthly_used, 1);
}

TEST_F(QuotaManagerTest, NewDayStartsFreshDailyWindowButKeepsMonth) {
    auto manager = makeManager(limits(1, 100));
    ASSERT_TRUE(manager->checkAndIncrement("u1", "a").allowed);
    ASSERT_FALSE(manager->checkAndIncrement("u1", "a").allowed);

    clock_->advance(std::chrono::hours(24));
    QuotaInfo next_day = manager->checkAndIncrement("u1", "a");
    EXPECT_TRUE(next_day.allowed);
    EXPECT_EQ(next_day.bucket_date, "2024-03-16");
    EXPECT_EQ(next_day.daily_used, 1);
    EXPECT_EQ(next_day.monthly_used, 2);
}

TEST_F(QuotaManagerTest, SubjectsAreIndependent) {
    auto manager = makeManager(limits(1, 100));
    ASSERT_TRUE(manager->checkAndIncrement("u1", "a").allowed);
    EXPECT_TRUE(manager->checkAndIncrement("u2", "a").allowed);
}

TEST_F(QuotaManagerTest, ConcurrentCallersAdmitExactlyTheLimit) {
    auto manager = makeManager(limits(25, 1000));
    std::atomic<int> admitted{0};
    std::vector<std::thread> threads;
    for (int t = 0; t < 10; ++t) {
        threads.emplace_back([&manager, &admitted]() {
            for (int i = 0; i < 10; ++i) {
                if (manager->checkAndIncrement("shared", "op").allowed) {
                    ++admitted;
                }
            }
        });
    }
    for (auto& thread : threads) {
        thread.join();
    }
    EXPECT_EQ(admitted.load(), 25);
    EXPECT_EQ(manager->getUsageStats("shared").daily.used, 25);
}

TEST_F(QuotaManagerTest, EmptySubjectIsRejected) {
    auto manager = makeManager(limits(1, 1));
    EXPECT_THROW(manager->checkFast(""), std::invalid_argument);
    EXPECT_THROW(manager->checkAndIncrement("", "a"), std::invalid_argument);
}

TEST_F(QuotaManagerTest, NegativeLimitIsRejected) {
    EXPECT_THROW(makeManager(limits(-1, 10)), std::invalid_argument);
}

TEST_F(QuotaManagerTest, ClearCacheForcesStoreRead) {
    auto manager = makeManager(limits(5, 100));
    manager->checkFast("u1");
    ASSERT_TRUE(manager->clearCache(std::string("u1")));
    EXPECT_FALSE(manager->checkFast("u1").cached);
}

TEST_F(QuotaManagerTest, UsageStatusThresholds) {
    EXPECT_EQ(usageStatusFor(10.0), UsageStatus::Ok);
    EXPECT_EQ(usageStatusFor(50.0), UsageStatus::Moderate);
    EXPECT_EQ(usageStatusFor(80.0), UsageStatus::Warning);
    EXPECT_EQ(usageStatusFor(95.0), UsageStatus::Critical);
    EXPECT_EQ(usageStatusFor(100.0), UsageStatus::Exceeded);

    auto manager = makeManager(limits(4, 100));
    manager->checkAndIncrement("u1", "a");
    manager->checkAndIncrement("u1", "a");
    UsageStats stats = manager->getUsageStats("u1");
    EXPECT_DOUBLE_EQ(stats.daily.percent(), 50.0);
    EXPECT_EQ(stats.status, UsageStatus::Moderate);
    EXPECT_EQ(stats.last_operation, "a");
}

// --- Store failure handling ---

class QuotaManagerStoreFailureTest : public ::testing::Test {
protected:
    std::shared_ptr<NiceMock<MockCounterStore>> store_ = std::make_shared<NiceMock<MockCounterStore>>();
    std::shared_ptr<NiceMock<MockLogger>> logger_ = std::make_shared<NiceMock<MockLogger>>();
    std::shared_ptr<NiceMock<MockStatsDClient>> statsd_ = std::make_shared<NiceMock<MockStatsDClient>>();
    std::shared_ptr<ManualClock> clock_ = std::make_shared<ManualClock>();

    std::unique_ptr<QuotaManager> makeManager(StoreFailurePolicy policy) {
        QuotaConfig config;
        config.daily_limit = 5;
        config.monthly_limit = 100;
        config.store_failure_policy = policy;
        return std::make_unique<QuotaManager>(store_, nullptr, config, logger_, statsd_, clock_);
    }
};

TEST_F(QuotaManagerStoreFailureTest, FailOpenAdmitsWithTrackingError) {
    auto manager = makeManager(StoreFailurePolicy::FailOpen);
    EXPECT_CALL(*store_, conditionalIncrement(_, _)).WillOnce(Throw(StoreUnavailableError("connection refused")));
    EXPECT_CALL(*statsd_, increment(_, _)).Times(AnyNumber());
    EXPECT_CALL(*statsd_, increment(MetricsDefinitions::QUOTA_TRACKING_ERROR, 1));

    QuotaInfo info = manager->checkAndIncrement("u1", "a");
    EXPECT_TRUE(info.allowed);
    ASSERT_TRUE(info.tracking_error.has_value());
    EXPECT_NE(info.tracking_error->find("connection refused"), std::string::npos);
}

TEST_F(QuotaManagerStoreFailureTest, FailClosedDeniesWithTrackingError) {
    auto manager = makeManager(StoreFailurePolicy::FailClosed);
    EXPECT_CALL(*store_, get(_)).WillRepeatedly(Throw(StoreUnavailableError("timeout")));

    QuotaInfo info = manager->checkFast("u1");
    EXPECT_FALSE(info.allowed);
    EXPECT_EQ(info.exceeded, QuotaLimit::Unknown);
    EXPECT_TRUE(info.tracking_error.has_value());
}

TEST_F(QuotaManagerStoreFailureTest, UnattributableRejectionIsUnknown) {
    auto manager = makeManager(StoreFailurePolicy::FailOpen);
    EXPECT_CALL(*store_, conditionalIncrement(_, _)).WillOnce(Return(IncrementResult{}));
    EXPECT_CALL(*store_, get(_)).WillRepeatedly(Throw(StoreUnavailableError("read failed")));

    EXPECT_CALL(*statsd_, increment(_, _)).Times(AnyNumber());
    EXPECT_CALL(*statsd_, increment(MetricsDefinitions::QUOTA_REJECTED_UNKNOWN, 1));
    EXPECT_CALL(*statsd_, increment(MetricsDefinitions::QUOTA_REJECTED_DAILY, _)).Times(0);

    QuotaInfo info = manager->checkAndIncrement("u1", "a");
    EXPECT_FALSE(info.allowed);
    EXPECT_EQ(info.exceeded, QuotaLimit::Unknown);
    EXPECT_TRUE(info.tracking_error.has_value());

    std::string message = QuotaExceededError("u1", info.exceeded).what();
    EXPECT_EQ(message.find("Daily"), std::string::npos);
    EXPECT_NE(message.find("unknown"), std::string::npos);
}

TEST_F(QuotaManagerStoreFailureTest, IncrementUsesDayAndMonthBuckets) {
    auto manager = makeManager(StoreFailurePolicy::FailOpen);
    std::vector<CounterCondition> seen;
    IncrementAttributes seen_attributes;
    IncrementResult applied;
    applied.applied = true;
    applied.new_values = {{"daily_count", 1}, {"monthly_count", 7}};
    EXPECT_CALL(*store_, conditionalIncrement(_, _))
        .WillOnce([&](const std::vector<CounterCondition>& conditions, const IncrementAttributes& attributes) {
            seen = conditions;
            seen_attributes = attributes;
            return applied;
        });

    QuotaInfo info = manager->checkAndIncrement("u1", "export");
    EXPECT_TRUE(info.allowed);
    EXPECT_EQ(info.monthly_used, 7);

    ASSERT_EQ(seen.size(), 2u);
    EXPECT_EQ(seen[0].key, (CounterKey{"u1", "2024-03-15"}));
    EXPECT_EQ(seen[0].field, "daily_count");
    EXPECT_EQ(seen[0].limit, 5);
    EXPECT_EQ(seen[1].key, (CounterKey{"u1", "2024-03"}));
    EXPECT_EQ(seen[1].field, "monthly_count");
    EXPECT_EQ(seen[1].limit, 100);
    EXPECT_EQ(seen_attributes.operation, "export");
    EXPECT_EQ(seen_attributes.timestamp, "2024-03-15T10:00:00.000Z");
    EXPECT_EQ(seen_attributes.ttl, std::chrono::hours(24 * 32));
}
