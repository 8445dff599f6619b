#ifndef DEPENDENCYCONFIG_HPP
#define DEPENDENCYCONFIG_HPP

#include <chrono>
#include <map>
#include <set>
#include <sstream>
#include <string>
#include <vector>

#include "../models/ErrorTypes.hpp"

enum class RetryStrategy {
    Fixed,
    Linear,
    Exponential,
    Jittered
};

inline std::string retryStrategyToString(RetryStrategy strategy) {
    switch (strategy) {
        case RetryStrategy::Fixed: return "fixed";
        case RetryStrategy::Linear: return "linear";
        case RetryStrategy::Exponential: return "exponential";
        case RetryStrategy::Jittered: return "jittered";
    }
    return "unknown";
}

struct RetryConfig {
    int max_retries = 3;
    std::chrono::milliseconds base_delay{1000};
    std::chrono::milliseconds max_delay{60000};
    RetryStrategy strategy = RetryStrategy::Exponential;
    bool jitter = true;
    // Applied to the computed delay when the failure is a quota/limit error.
    double quota_backoff_multiplier = 2.0;
    std::set<ErrorClass> retryable_error_classes{
        ErrorClass::Transient, ErrorClass::Unavailable, ErrorClass::Quota};

    // Authentication, validation and missing-resource errors never self-resolve,
    // whatever the configured set says.
    bool allowsRetryOf(ErrorClass error_class) const {
        switch (error_class) {
            case ErrorClass::Authentication:
            case ErrorClass::Validation:
            case ErrorClass::ResourceNotFound:
                return false;
            case ErrorClass::Unclassified:
                return true;
            default:
                return retryable_error_classes.count(error_class) > 0;
        }
    }
};

struct CircuitBreakerConfig {
    int failure_threshold = 5;
    int success_threshold = 2;
    std::chrono::milliseconds open_timeout{60000};
    // 0 means "same as success_threshold".
    int half_open_max_calls = 0;

    int effectiveHalfOpenMaxCalls() const {
        return half_open_max_calls > 0 ? half_open_max_calls : success_threshold;
    }
};

// Everything that differs per protected dependency: breaker thresholds,
// retry policy and the dependency's own error-code vocabulary.
struct DependencyConfig {
    std::string name = "default";
    CircuitBreakerConfig breaker;
    RetryConfig retry;
    std::map<ErrorClass, std::vector<std::string>> error_codes;

    std::string to_string() const {
        std::stringstream ss;
        ss << "[" << name << "]"
           << " failure_threshold=" << breaker.failure_threshold
           << " success_threshold=" << breaker.success_threshold
           << " open_timeout_ms=" << breaker.open_timeout.count()
           << " half_open_max_calls=" << breaker.effectiveHalfOpenMaxCalls()
           << " max_retries=" << retry.max_retries
           << " base_delay_ms=" << retry.base_delay.count()
           << " max_delay_ms=" << retry.max_delay.count()
           << " strategy=" << retryStrategyToString(retry.strategy)
           << " jitter=" << std::boolalpha << retry.jitter << std::noboolalpha
           << " retryable=";
        bool first = true;
        for (const auto& error_class : retry.retryable_error_classes) {
            ss << (first ? "" : ",") << errorClassToString(error_class);
            first = false;
        }
        return ss.str();
    }
};

#endif // DEPENDENCYCONFIG_HPP
