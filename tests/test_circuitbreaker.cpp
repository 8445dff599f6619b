// tests/test_circuitbreaker.cpp
#include <chrono>
#include <functional>
#include <memory>
#include <stdexcept>
#include <string>

#include "gtest/gtest.h"
#include "gmock/gmock.h"

#include "../src/config/AppConfig.hpp"
#include "../src/core/CircuitBreaker.hpp"
#include "../src/core/CircuitBreakerRegistry.hpp"
#include "TestMocks.hpp"

using ::testing::_;
using ::testing::AnyNumber;
using ::testing::NiceMock;

namespace {
OperationError backendDown() {
    OperationError error;
    error.code = "ServiceUnavailable";
    error.http_status = 503;
    error.message = "backend down";
    return error;
}

std::function<Outcome<int>()> failing(int* calls = nullptr) {
    return [calls]() {
        if (calls) ++*calls;
        return Outcome<int>::retryable(backendDown());
    };
}

std::function<Outcome<int>()> succeeding(int* calls = nullptr) {
    return [calls]() {
        if (calls) ++*calls;
        return Outcome<int>::success(42);
    };
}
}

class CircuitBreakerTest : public ::testing::Test {
protected:
    std::shared_ptr<ManualClock> clock_ = std::make_shared<ManualClock>();
    std::shared_ptr<NiceMock<MockLogger>> logger_ = std::make_shared<NiceMock<MockLogger>>();
    std::shared_ptr<NiceMock<MockStatsDClient>> statsd_ = std::make_shared<NiceMock<MockStatsDClient>>();

    CircuitBreakerConfig config(int failures, int successes, std::chrono::milliseconds timeout) {
        CircuitBreakerConfig c;
        c.failure_threshold = failures;
        c.success_threshold = successes;
        c.open_timeout = timeout;
        return c;
    }

    std::unique_ptr<CircuitBreaker> makeBreaker(CircuitBreakerConfig c) {
        return std::make_unique<CircuitBreaker>("billing", c, logger_, statsd_, clock_);
    }
};

TEST_F(CircuitBreakerTest, OpensAfterThresholdAndRejectsWithoutCalling) {
    auto breaker = makeBreaker(config(2, 1, std::chrono::seconds(10)));
    breaker->call<int>(failing());
    EXPECT_EQ(breaker->state(), CircuitState::Closed);
    breaker->call<int>(failing());
    EXPECT_EQ(breaker->state(), CircuitState::Open);

    clock_->advance(std::chrono::seconds(5));
    int calls = 0;
    try {
        breaker->call<int>(succeeding(&calls));
        FAIL() << "Expected CircuitOpenError";
    } catch (const CircuitOpenError& e) {
        EXPECT_EQ(e.dependency(), "billing");
        EXPECT_EQ(e.retryAfter(), std::chrono::seconds(5));
    }
    EXPECT_EQ(calls, 0);
}

TEST_F(CircuitBreakerTest, HalfOpenProbeClosesAfterTimeout) {
    auto breaker = makeBreaker(config(2, 1, std::chrono::seconds(10)));
    breaker->call<int>(failing());
    breaker->call<int>(failing());

    clock_->advance(std::chrono::seconds(11));
    Outcome<int> outcome = breaker->call<int>(succeeding());
    EXPECT_TRUE(outcome.ok());
    EXPECT_EQ(outcome.value(), 42);
    EXPECT_EQ(breaker->state(), CircuitState::Closed);
}

TEST_F(CircuitBreakerTest, SuccessResetsConsecutiveFailureCount) {
    auto breaker = makeBreaker(config(3, 1, std::chrono::seconds(10)));
    breaker->call<int>(failing());
    breaker->call<int>(failing());
    breaker->call<int>(succeeding());
    breaker->call<int>(failing());
    breaker->call<int>(failing());
    EXPECT_EQ(breaker->state(), CircuitState::Closed);
    breaker->call<int>(failing());
    EXPECT_EQ(breaker->state(), CircuitState::Open);
}

TEST_F(CircuitBreakerTest, HalfOpenFailureReopensAndRestartsTimeout) {
    auto breaker = makeBreaker(config(1, 2, std::chrono::seconds(10)));
    breaker->call<int>(failing());
    clock_->advance(std::chrono::seconds(10));

    breaker->call<int>(failing());
    EXPECT_EQ(breaker->state(), CircuitState::Open);

    clock_->advance(std::chrono::seconds(9));
    EXPECT_THROW(breaker->call<int>(succeeding()), CircuitOpenError);
}

TEST_F(CircuitBreakerTest, NeedsSuccessThresholdProbesToClose) {
    auto breaker = makeBreaker(config(1, 2, std::chrono::seconds(1)));
    breaker->call<int>(failing());
    clock_->advance(std::chrono::seconds(1));

    breaker->call<int>(succeeding());
    EXPECT_EQ(breaker->state(), CircuitState::HalfOpen);
    breaker->call<int>(succeeding());
    EXPECT_EQ(breaker->state(), CircuitState::Closed);
}

TEST_F(CircuitBreakerTest, LimitsConcurrentHalfOpenProbes) {
    CircuitBreakerConfig c = config(1, 2, std::chrono::seconds(1));
    c.half_open_max_calls = 1;
    auto breaker = makeBreaker(c);
    breaker->call<int>(failing());
    clock_->advance(std::chrono::seconds(1));

    CircuitBreaker::Permit probe = breaker->acquirePermission();
    EXPECT_TRUE(probe.probe);
    try {
        breaker->acquirePermission();
        FAIL() << "Expected CircuitOpenError";
    } catch (const CircuitOpenError& e) {
        EXPECT_EQ(e.retryAfter(), std::chrono::milliseconds(0));
    }
    breaker->onSuccess(probe);
    EXPECT_NO_THROW(breaker->acquirePermission());
}

TEST_F(CircuitBreakerTest, StaleResultFromEarlierStateIsIgnored) {
    auto breaker = makeBreaker(config(1, 1, std::chrono::seconds(10)));
    CircuitBreaker::Permit slow = breaker->acquirePermission();

    breaker->call<int>(failing());
    ASSERT_EQ(breaker->state(), CircuitState::Open);

    // The slow Closed-state call finishes after the breaker opened.
    breaker->onSuccess(slow);
    EXPECT_EQ(breaker->state(), CircuitState::Open);
}

TEST_F(CircuitBreakerTest, ThrownExceptionCountsAsFailureAndPropagates) {
    auto breaker = makeBreaker(config(1, 1, std::chrono::seconds(10)));
    std::function<Outcome<int>()> throwing = []() -> Outcome<int> { throw std::runtime_error("socket closed"); };

    EXPECT_THROW(breaker->call<int>(throwing), std::runtime_error);
    EXPECT_EQ(breaker->state(), CircuitState::Open);
}

TEST_F(CircuitBreakerTest, NonStandardThrowFromProbeReleasesHalfOpenSlot) {
    CircuitBreakerConfig c = config(1, 1, std::chrono::seconds(1));
    c.half_open_max_calls = 1;
    auto breaker = makeBreaker(c);
    breaker->call<int>(failing());
    clock_->advance(std::chrono::seconds(1));

    std::function<Outcome<int>()> throwing = []() -> Outcome<int> { throw 7; };
    EXPECT_THROW(breaker->call<int>(throwing), int);
    EXPECT_EQ(breaker->state(), CircuitState::Open);

    clock_->advance(std::chrono::seconds(1));
    int calls = 0;
    EXPECT_TRUE(breaker->call<int>(succeeding(&calls)).ok());
    EXPECT_EQ(calls, 1);
    EXPECT_EQ(breaker->state(), CircuitState::Closed);
}

TEST_F(CircuitBreakerTest, TransitionsAreLoggedAndCounted) {
    auto breaker = makeBreaker(config(1, 1, std::chrono::seconds(1)));
    EXPECT_CALL(*statsd_, increment(_, _)).Times(AnyNumber());
    EXPECT_CALL(*statsd_, increment(MetricsDefinitions::BREAKER_OPENED, 1)).Times(1);
    EXPECT_CALL(*statsd_, increment(MetricsDefinitions::BREAKER_CLOSED, 1)).Times(1);
    EXPECT_CALL(*logger_, warn(::testing::HasSubstr("closed -> open")));

    breaker->call<int>(failing());
    clock_->advance(std::chrono::seconds(1));
    breaker->call<int>(succeeding());
}

TEST_F(CircuitBreakerTest, SnapshotAndReset) {
    auto breaker = makeBreaker(config(1, 1, std::chrono::seconds(10)));
    breaker->call<int>(failing());

    CircuitBreakerSnapshot snapshot = breaker->snapshot();
    EXPECT_EQ(snapshot.state, CircuitState::Open);
    EXPECT_FALSE(snapshot.is_healthy);
    EXPECT_TRUE(snapshot.last_failure_time.has_value());
    EXPECT_EQ(snapshot.toJson()["state"], "open");

    breaker->reset();
    EXPECT_EQ(breaker->state(), CircuitState::Closed);
    EXPECT_TRUE(breaker->snapshot().is_healthy);
}

TEST_F(CircuitBreakerTest, InvalidThresholdIsRejected) {
    EXPECT_THROW(makeBreaker(config(0, 1, std::chrono::seconds(1))), std::invalid_argument);
}

TEST_F(CircuitBreakerTest, RegistryReturnsOneBreakerPerDependency) {
    AppConfig app;
    app.mutableDependencyConfig("payments").breaker.failure_threshold = 1;
    CircuitBreakerRegistry registry(app, logger_, statsd_, clock_);

    auto payments = registry.get("payments");
    EXPECT_EQ(payments, registry.get("payments"));
    EXPECT_EQ(payments->config().failure_threshold, 1);
    EXPECT_EQ(registry.get("search")->config().failure_threshold, app.default_dependency.breaker.failure_threshold);

    payments->call<int>(failing());
    EXPECT_EQ(registry.get("search")->state(), CircuitState::Closed);
    EXPECT_EQ(registry.snapshots().size(), 2u);

    registry.resetAll();
    EXPECT_EQ(payments->state(), CircuitState::Closed);
}
