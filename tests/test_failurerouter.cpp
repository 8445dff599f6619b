// tests/test_failurerouter.cpp
#include <memory>
#include <stdexcept>
#include <string>

#include "gtest/gtest.h"
#include "gmock/gmock.h"

#include <nlohmann/json.hpp>

#include "../src/config/AppConfig.hpp"
#include "../src/core/FailureRouter.hpp"
#include "../src/deadletter/LoggerDeadLetterSink.hpp"
#include "TestMocks.hpp"

using ::testing::_;
using ::testing::AnyNumber;
using ::testing::HasSubstr;
using ::testing::NiceMock;
using ::testing::StrictMock;
using ::testing::Throw;

namespace {
OperationError throttled() {
    OperationError error;
    error.code = "ThrottlingException";
    error.message = "Rate exceeded";
    error.http_status = 429;
    error.error_class = ErrorClass::Transient;
    error.details["region"] = "eu-west-1";
    return error;
}

FailureContext context() {
    FailureContext ctx;
    ctx.subject_id = "u1";
    ctx.dependency = "payments";
    ctx.operation = "charge";
    ctx.attempts = 4;
    return ctx;
}
}

class FailureRouterTest : public ::testing::Test {
protected:
    std::shared_ptr<ManualClock> clock_ = std::make_shared<ManualClock>();
    std::shared_ptr<NiceMock<MockLogger>> logger_ = std::make_shared<NiceMock<MockLogger>>();
    std::shared_ptr<NiceMock<MockStatsDClient>> statsd_ = std::make_shared<NiceMock<MockStatsDClient>>();
};

TEST_F(FailureRouterTest, BuildsRecordFromErrorAndContext) {
    auto sink = std::make_shared<RecordingDeadLetterSink>();
    FailureRouter router(sink, logger_, statsd_, clock_);

    FailureRecord record = router.buildRecord(throttled(), ErrorSeverity::Medium, context());
    EXPECT_EQ(record.error_id.rfind("payments#1710496800000#", 0), 0u);
    EXPECT_EQ(record.timestamp, "2024-03-15T10:00:00.000Z");
    EXPECT_EQ(record.subject_id, "u1");
    EXPECT_EQ(record.exception_type, "ThrottlingException");
    EXPECT_EQ(record.exception_message, "Rate exceeded");
    EXPECT_EQ(record.raw_details.at("attempts"), "4");
    EXPECT_EQ(record.raw_details.at("error_class"), "transient");
    EXPECT_EQ(record.raw_details.at("http_status"), "429");
    EXPECT_EQ(record.raw_details.at("region"), "eu-west-1");
}

TEST_F(FailureRouterTest, ErrorIdsAreUnique) {
    auto sink = std::make_shared<RecordingDeadLetterSink>();
    FailureRouter router(sink, logger_, statsd_, clock_);
    EXPECT_NE(router.buildRecord(throttled(), ErrorSeverity::Low, context()).error_id,
              router.buildRecord(throttled(), ErrorSeverity::Low, context()).error_id);
}

TEST_F(FailureRouterTest, MissingSubjectBecomesUnknown) {
    auto sink = std::make_shared<RecordingDeadLetterSink>();
    FailureRouter router(sink, logger_, statsd_, clock_);
    FailureContext ctx = context();
    ctx.subject_id.clear();
    EXPECT_EQ(router.buildRecord(throttled(), ErrorSeverity::Low, ctx).subject_id, "unknown");
}

TEST_F(FailureRouterTest, NotifiesOnlyHighAndCritical) {
    auto sink = std::make_shared<RecordingDeadLetterSink>();
    FailureRouter router(sink, logger_, statsd_, clock_);

    router.route(throttled(), ErrorSeverity::Low, context());
    router.route(throttled(), ErrorSeverity::Medium, context());
    router.route(throttled(), ErrorSeverity::High, context());
    router.route(throttled(), ErrorSeverity::Critical, context());

    EXPECT_EQ(sink->enqueued.size(), 4u);
    EXPECT_EQ(sink->persisted.size(), 4u);
    ASSERT_EQ(sink->notified.size(), 2u);
    EXPECT_EQ(sink->notified[0].severity, ErrorSeverity::High);
    EXPECT_EQ(sink->notified[1].severity, ErrorSeverity::Critical);
}

TEST_F(FailureRouterTest, SinkErrorsAreLoggedAndCounted) {
    auto sink = std::make_shared<NiceMock<MockDeadLetterSink>>();
    EXPECT_CALL(*sink, enqueue(_)).WillOnce(Throw(std::runtime_error("queue full")));
    EXPECT_CALL(*sink, persist(_)).Times(1);
    EXPECT_CALL(*sink, notify(_)).Times(1);
    EXPECT_CALL(*logger_, error(_)).Times(AnyNumber());
    EXPECT_CALL(*logger_, error(HasSubstr("queue full"))).Times(1);
    EXPECT_CALL(*statsd_, increment(MetricsDefinitions::DEAD_LETTER_ROUTE_FAILED, 1)).Times(1);

    FailureRouter router(sink, logger_, statsd_, clock_);
    EXPECT_NO_THROW(router.route(throttled(), ErrorSeverity::Critical, context()));
}

TEST_F(FailureRouterTest, NullSinkIsRejected) {
    EXPECT_THROW(FailureRouter(nullptr, logger_, statsd_, clock_), std::invalid_argument);
}

TEST(FailureRecordTest, JsonRoundTripKeepsSeverityAndDetails) {
    FailureRecord record;
    record.error_id = "payments#1#1";
    record.severity = ErrorSeverity::High;
    record.raw_details["attempts"] = "3";

    FailureRecord parsed = FailureRecord::fromJson(nlohmann::json::parse(record.toJson().dump()));
    EXPECT_EQ(parsed.error_id, "payments#1#1");
    EXPECT_EQ(parsed.severity, ErrorSeverity::High);
    EXPECT_EQ(parsed.raw_details.at("attempts"), "3");
}

TEST(FailureRecordTest, FromJsonFillsDefaults) {
    FailureRecord parsed = FailureRecord::fromJson(nlohmann::json::object());
    EXPECT_EQ(parsed.subject_id, "unknown");
    EXPECT_EQ(parsed.severity, ErrorSeverity::Low);
}

TEST(LoggerDeadLetterSinkTest, WritesRecordsToLog) {
    auto logger = std::make_shared<StrictMock<MockLogger>>();
    LoggerDeadLetterSink sink(logger);
    FailureRecord record;
    record.error_id = "payments#1#7";
    record.dependency = "payments";

    EXPECT_CALL(*logger, warn(HasSubstr("payments#1#7")));
    EXPECT_CALL(*logger, error(HasSubstr("Error ID: payments#1#7")));
    sink.enqueue(record);
    sink.persist(record);
    sink.notify(record);
}
