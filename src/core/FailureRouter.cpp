#include "FailureRouter.hpp"

#include <chrono>
#include <stdexcept>

#include "../config/AppConfig.hpp"
#include "../utils/Utils.hpp"

FailureRouter::FailureRouter(std::shared_ptr<IDeadLetterSink> sink,
                             std::shared_ptr<ILogger> logger,
                             std::shared_ptr<IStatsDClient> statsd_client,
                             std::shared_ptr<IClock> clock)
    : sink_(std::move(sink)),
      logger_(std::move(logger)),
      statsd_client_(std::move(statsd_client)),
      clock_(std::move(clock)) {
    if (!sink_) {
        throw std::invalid_argument("Dead-letter sink cannot be null for FailureRouter");
    }
    if (!logger_) {
        throw std::invalid_argument("Logger cannot be null for FailureRouter");
    }
    if (!statsd_client_) {
        throw std::invalid_argument("StatsDClient cannot be null for FailureRouter");
    }
}

std::string FailureRouter::nextErrorId(const std::string& dependency) {
    auto epoch_ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        clock_->wallNow().time_since_epoch()).count();
    return dependency + "#" + std::to_string(epoch_ms) + "#" + std::to_string(++sequence_);
}

FailureRecord FailureRouter::buildRecord(const OperationError& error, ErrorSeverity severity,
                                         const FailureContext& context) {
    FailureRecord record;
    record.error_id = nextErrorId(context.dependency);
    record.timestamp = Utils::formatIsoTimestamp(clock_->wallNow());
    record.subject_id = context.subject_id.empty() ? "unknown" : context.subject_id;
    record.dependency = context.dependency;
    record.operation = context.operation.empty() ? "unknown" : context.operation;
    record.exception_type = !error.exception_type.empty() ? error.exception_type
                          : !error.code.empty() ? error.code
                          : "OperationError";
    record.exception_message = error.message;
    record.severity = severity;

    record.raw_details = error.details;
    for (const auto& [key, value] : context.details) {
        record.raw_details[key] = value;
    }
    record.raw_details["attempts"] = std::to_string(context.attempts);
    record.raw_details["error_class"] = errorClassToString(error.error_class);
    if (!error.code.empty()) {
        record.raw_details["error_code"] = error.code;
    }
    if (error.http_status != 0) {
        record.raw_details["http_status"] = std::to_string(error.http_status);
    }
    return record;
}

FailureRecord FailureRouter::route(const OperationError& error, ErrorSeverity severity,
                                   const FailureContext& context) {
    FailureRecord record = buildRecord(error, severity, context);
    bool delivered = true;

    try {
        sink_->enqueue(record);
    } catch (const std::exception& e) {
        delivered = false;
        logger_->error("Failed to enqueue failure " + record.error_id + ": " + e.what());
    }

    try {
        sink_->persist(record);
    } catch (const std::exception& e) {
        delivered = false;
        logger_->error("Failed to persist failure " + record.error_id + ": " + e.what());
    }

    if (requiresNotification(severity)) {
        try {
            sink_->notify(record);
        } catch (const std::exception& e) {
            delivered = false;
            logger_->error("Failed to send notification for " + record.error_id + ": " + e.what());
        }
    }

    statsd_client_->increment(delivered ? MetricsDefinitions::DEAD_LETTER_ROUTED
                                        : MetricsDefinitions::DEAD_LETTER_ROUTE_FAILED);
    logger_->error("Routed " + severityToString(severity) + " failure " + record.error_id +
                   " (" + record.dependency + "/" + record.operation + "): " + record.exception_message);
    return record;
}
