#pragma once

#include <memory>

#include "../interfaces/IDeadLetterSink.hpp"
#include "../interfaces/ILogger.hpp"

// Dead-letter sink for deployments without Redis: records are written to the log.
class LoggerDeadLetterSink : public IDeadLetterSink {
public:
    explicit LoggerDeadLetterSink(std::shared_ptr<ILogger> logger);

    void enqueue(const FailureRecord& record) override;
    void persist(const FailureRecord& record) override;
    void notify(const FailureRecord& record) override;

private:
    std::shared_ptr<ILogger> logger_;
};
