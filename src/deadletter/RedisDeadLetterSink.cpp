#include "RedisDeadLetterSink.hpp"

#include <stdexcept>

#include "../interfaces/ILogger.hpp"

RedisDeadLetterSink::RedisDeadLetterSink(std::shared_ptr<RedisConnection> connection,
                                         std::string key_prefix,
                                         DeadLetterConfig config,
                                         std::shared_ptr<ILogger> logger)
    : connection_(std::move(connection)),
      key_prefix_(std::move(key_prefix)),
      config_(std::move(config)),
      logger_(std::move(logger)) {
    if (!connection_) {
        throw std::invalid_argument("Redis connection cannot be null for RedisDeadLetterSink");
    }
    if (!logger_) {
        throw std::invalid_argument("Logger cannot be null for RedisDeadLetterSink");
    }
}

void RedisDeadLetterSink::enqueue(const FailureRecord& record) {
    connection_->command({"LPUSH", key_prefix_ + config_.queue_key, record.toJson().dump()});
    logger_->debug("Queued failure " + record.error_id + " on " + key_prefix_ + config_.queue_key);
}

void RedisDeadLetterSink::persist(const FailureRecord& record) {
    int ttl_seconds = config_.retention_days * 24 * 3600;
    connection_->command({"SETEX", key_prefix_ + config_.error_log_prefix + record.error_id,
                          std::to_string(ttl_seconds), record.toJson().dump()});
}

void RedisDeadLetterSink::notify(const FailureRecord& record) {
    json message;
    message["subject"] = "[" + severityToString(record.severity) + "] " + record.dependency +
                         " failure: " + record.exception_type;
    message["body"] = record.to_string();
    message["record"] = record.toJson();
    connection_->command({"PUBLISH", config_.notification_channel, message.dump()});
}
