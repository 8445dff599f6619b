#ifndef RESILIENCEERRORS_HPP
#define RESILIENCEERRORS_HPP

#include <chrono>
#include <stdexcept>
#include <string>

#include "ErrorTypes.hpp"

// Base for every error raised by the admission and resilience layer itself.
class ResilienceError : public std::runtime_error {
public:
    explicit ResilienceError(const std::string& message) : std::runtime_error(message) {}
};

enum class QuotaLimit {
    None,
    Daily,
    Monthly,
    Unknown
};

inline std::string quotaLimitToString(QuotaLimit limit) {
    switch (limit) {
        case QuotaLimit::None: return "none";
        case QuotaLimit::Daily: return "daily";
        case QuotaLimit::Monthly: return "monthly";
        case QuotaLimit::Unknown: return "unknown";
    }
    return "unknown";
}

class QuotaExceededError : public ResilienceError {
public:
    QuotaExceededError(const std::string& subject_id, QuotaLimit limit)
        : ResilienceError(describe(subject_id, limit)), limit_(limit) {}

    QuotaLimit limit() const { return limit_; }

private:
    static std::string describe(const std::string& subject_id, QuotaLimit limit) {
        switch (limit) {
            case QuotaLimit::Daily:
                return "Daily quota exceeded for subject: " + subject_id;
            case QuotaLimit::Monthly:
                return "Monthly quota exceeded for subject: " + subject_id;
            default:
                return "Quota denied for subject: " + subject_id + " (exceeded limit unknown)";
        }
    }

    QuotaLimit limit_;
};

class CircuitOpenError : public ResilienceError {
public:
    CircuitOpenError(const std::string& dependency, std::chrono::milliseconds retry_after)
        : ResilienceError("Circuit breaker open for " + dependency),
          dependency_(dependency),
          retry_after_(retry_after) {}

    const std::string& dependency() const { return dependency_; }
    std::chrono::milliseconds retryAfter() const { return retry_after_; }

private:
    std::string dependency_;
    std::chrono::milliseconds retry_after_;
};

// Raised once a call has definitively failed. Carries the classified
// downstream error and the severity it was routed with.
class OperationFailedError : public ResilienceError {
public:
    OperationFailedError(const std::string& what, OperationError error, ErrorSeverity severity, int attempts)
        : ResilienceError(what), error_(std::move(error)), severity_(severity), attempts_(attempts) {}

    const OperationError& error() const { return error_; }
    ErrorSeverity severity() const { return severity_; }
    int attempts() const { return attempts_; }

private:
    OperationError error_;
    ErrorSeverity severity_;
    int attempts_;
};

// Transient failure that kept failing until retries ran out.
class RetryableError : public OperationFailedError {
public:
    RetryableError(const std::string& dependency, OperationError error, ErrorSeverity severity, int attempts)
        : OperationFailedError(
              dependency + " failed after " + std::to_string(attempts) + " attempts: " + error.message,
              std::move(error), severity, attempts) {}
};

// Failure that will not self-resolve; propagated without further attempts.
class TerminalError : public OperationFailedError {
public:
    TerminalError(const std::string& dependency, OperationError error, ErrorSeverity severity, int attempts)
        : OperationFailedError(
              dependency + " failed with non-retryable error: " + error.message,
              std::move(error), severity, attempts) {}
};

// Durable counter store or shared cache could not be reached.
class StoreUnavailableError : public ResilienceError {
public:
    explicit StoreUnavailableError(const std::string& message) : ResilienceError(message) {}
};

class OperationCancelledError : public ResilienceError {
public:
    explicit OperationCancelledError(const std::string& message) : ResilienceError(message) {}
};

// Thrown by dependency adapters that prefer exceptions over Outcome. Carries
// the backend's error details so the classifier can see code and status.
class DependencyCallError : public std::runtime_error {
public:
    explicit DependencyCallError(OperationError error)
        : std::runtime_error(error.message), error_(std::move(error)) {}

    const OperationError& error() const { return error_; }

private:
    OperationError error_;
};

#endif // RESILIENCEERRORS_HPP
