// tests/test_backoff.cpp
#include <chrono>
#include <stdexcept>
#include <vector>

#include "gtest/gtest.h"

#include "../src/core/BackoffPolicy.hpp"

using std::chrono::milliseconds;

namespace {
RetryConfig retryConfig(RetryStrategy strategy, int base_ms, int max_ms, bool jitter) {
    RetryConfig config;
    config.strategy = strategy;
    config.base_delay = milliseconds(base_ms);
    config.max_delay = milliseconds(max_ms);
    config.jitter = jitter;
    return config;
}
}

TEST(BackoffPolicyTest, ExponentialDoublesUpToCap) {
    BackoffPolicy policy(retryConfig(RetryStrategy::Exponential, 1000, 8000, false));
    std::vector<long long> delays;
    for (int attempt = 0; attempt < 6; ++attempt) {
        delays.push_back(policy.delayFor(attempt).count());
    }
    EXPECT_EQ(delays, (std::vector<long long>{1000, 2000, 4000, 8000, 8000, 8000}));
}

TEST(BackoffPolicyTest, LinearGrowsByBase) {
    BackoffPolicy policy(retryConfig(RetryStrategy::Linear, 500, 60000, false));
    EXPECT_EQ(policy.delayFor(0), milliseconds(500));
    EXPECT_EQ(policy.delayFor(1), milliseconds(1000));
    EXPECT_EQ(policy.delayFor(3), milliseconds(2000));
}

TEST(BackoffPolicyTest, FixedNeverGrows) {
    BackoffPolicy policy(retryConfig(RetryStrategy::Fixed, 250, 60000, false));
    EXPECT_EQ(policy.delayFor(0), milliseconds(250));
    EXPECT_EQ(policy.delayFor(9), milliseconds(250));
}

TEST(BackoffPolicyTest, JitteredStaysWithinTenPercent) {
    BackoffPolicy policy(retryConfig(RetryStrategy::Jittered, 1000, 60000, false), 7);
    for (int i = 0; i < 200; ++i) {
        auto delay = policy.delayFor(2).count();
        EXPECT_GE(delay, 3600);
        EXPECT_LE(delay, 4400);
    }
}

TEST(BackoffPolicyTest, JitterFlagAddsNoiseProportionalToBase) {
    BackoffPolicy policy(retryConfig(RetryStrategy::Exponential, 1000, 60000, true), 11);
    for (int i = 0; i < 200; ++i) {
        auto delay = policy.delayFor(3).count();
        EXPECT_GE(delay, 7900);
        EXPECT_LE(delay, 8100);
    }
}

TEST(BackoffPolicyTest, JitterNeverExceedsCap) {
    BackoffPolicy policy(retryConfig(RetryStrategy::Jittered, 1000, 1000, true), 3);
    for (int i = 0; i < 200; ++i) {
        EXPECT_LE(policy.delayFor(5).count(), 1000);
    }
}

TEST(BackoffPolicyTest, QuotaErrorsWaitLonger) {
    BackoffPolicy policy(retryConfig(RetryStrategy::Fixed, 1000, 60000, false));
    EXPECT_EQ(policy.delayFor(0, ErrorClass::Quota), milliseconds(2000));
    EXPECT_EQ(policy.delayFor(0, ErrorClass::Transient), milliseconds(1000));
}

TEST(BackoffPolicyTest, QuotaMultiplierIsStillCapped) {
    BackoffPolicy policy(retryConfig(RetryStrategy::Fixed, 1000, 1500, false));
    EXPECT_EQ(policy.delayFor(0, ErrorClass::Quota), milliseconds(1500));
}

TEST(BackoffPolicyTest, LargeAttemptDoesNotOverflow) {
    BackoffPolicy policy(retryConfig(RetryStrategy::Exponential, 1000, 60000, false));
    EXPECT_EQ(policy.delayFor(500), milliseconds(60000));
    EXPECT_EQ(policy.baseDelayFor(500), milliseconds(60000));
}

TEST(BackoffPolicyTest, NegativeConfigurationIsRejected) {
    RetryConfig config = retryConfig(RetryStrategy::Fixed, -1, 1000, false);
    EXPECT_THROW(BackoffPolicy{config}, std::invalid_argument);
}
