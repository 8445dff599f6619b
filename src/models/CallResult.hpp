#ifndef CALLRESULT_HPP
#define CALLRESULT_HPP

#include <chrono>
#include <optional>
#include <string>

#include "ErrorTypes.hpp"
#include "QuotaInfo.hpp"

enum class CallStatus {
    Succeeded,
    QuotaExceeded,
    CircuitOpen,
    OperationFailed,
    TrackingFailed
};

inline std::string callStatusToString(CallStatus status) {
    switch (status) {
        case CallStatus::Succeeded: return "succeeded";
        case CallStatus::QuotaExceeded: return "quota_exceeded";
        case CallStatus::CircuitOpen: return "circuit_open";
        case CallStatus::OperationFailed: return "operation_failed";
        case CallStatus::TrackingFailed: return "tracking_failed";
    }
    return "unknown";
}

// The closed set of outcomes a guarded call can produce.
template <typename T>
struct CallResult {
    CallStatus status = CallStatus::OperationFailed;
    std::optional<T> value;                              // Succeeded
    std::optional<QuotaInfo> quota;                      // Whenever the quota was consulted
    std::optional<std::chrono::milliseconds> retry_after; // CircuitOpen
    std::optional<ErrorSeverity> severity;               // OperationFailed
    std::optional<OperationError> error;                 // OperationFailed
    int attempts = 0;
    std::string message;

    bool ok() const { return status == CallStatus::Succeeded; }
};

#endif // CALLRESULT_HPP
