#pragma once

#include "../models/FailureRecord.hpp"

// Durable destination for terminally failed operations.
class IDeadLetterSink {
public:
    virtual ~IDeadLetterSink() = default;

    virtual void enqueue(const FailureRecord& record) = 0;
    virtual void persist(const FailureRecord& record) = 0;
    // Only called for High and Critical severities.
    virtual void notify(const FailureRecord& record) = 0;
};
