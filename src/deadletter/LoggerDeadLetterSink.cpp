#include "LoggerDeadLetterSink.hpp"

#include <stdexcept>

LoggerDeadLetterSink::LoggerDeadLetterSink(std::shared_ptr<ILogger> logger)
    : logger_(std::move(logger)) {
    if (!logger_) {
        throw std::invalid_argument("Logger cannot be null for LoggerDeadLetterSink");
    }
}

void LoggerDeadLetterSink::enqueue(const FailureRecord& record) {
    logger_->warn("Dead letter: " + record.toJson().dump());
}

// The log line written by enqueue is the durable copy.
void LoggerDeadLetterSink::persist(const FailureRecord&) {}

void LoggerDeadLetterSink::notify(const FailureRecord& record) {
    logger_->error(record.to_string());
}
