#ifndef ERRORTYPES_HPP
#define ERRORTYPES_HPP

#include <map>
#include <optional>
#include <sstream>
#include <string>

// Error buckets used to decide retryability. Unavailable is the
// internal-error/service-unavailable subset of transient failures.
enum class ErrorClass {
    Transient,
    Unavailable,
    Authentication,
    Validation,
    ResourceNotFound,
    Quota,
    Unclassified
};

enum class ErrorSeverity {
    Low,
    Medium,
    High,
    Critical
};

inline std::string errorClassToString(ErrorClass error_class) {
    switch (error_class) {
        case ErrorClass::Transient: return "transient";
        case ErrorClass::Unavailable: return "unavailable";
        case ErrorClass::Authentication: return "authentication";
        case ErrorClass::Validation: return "validation";
        case ErrorClass::ResourceNotFound: return "resource";
        case ErrorClass::Quota: return "quota";
        case ErrorClass::Unclassified: return "unclassified";
    }
    return "unclassified";
}

inline std::optional<ErrorClass> errorClassFromString(const std::string& name) {
    if (name == "transient") return ErrorClass::Transient;
    if (name == "unavailable") return ErrorClass::Unavailable;
    if (name == "authentication") return ErrorClass::Authentication;
    if (name == "validation") return ErrorClass::Validation;
    if (name == "resource") return ErrorClass::ResourceNotFound;
    if (name == "quota") return ErrorClass::Quota;
    if (name == "unclassified") return ErrorClass::Unclassified;
    return std::nullopt;
}

inline std::string severityToString(ErrorSeverity severity) {
    switch (severity) {
        case ErrorSeverity::Low: return "low";
        case ErrorSeverity::Medium: return "medium";
        case ErrorSeverity::High: return "high";
        case ErrorSeverity::Critical: return "critical";
    }
    return "low";
}

inline std::optional<ErrorSeverity> severityFromString(const std::string& name) {
    if (name == "low") return ErrorSeverity::Low;
    if (name == "medium") return ErrorSeverity::Medium;
    if (name == "high") return ErrorSeverity::High;
    if (name == "critical") return ErrorSeverity::Critical;
    return std::nullopt;
}

// A failure reported by a wrapped downstream call, in backend-neutral terms.
struct OperationError {
    std::string code;            // Backend error code, e.g. "ThrottlingException"
    std::string message;
    std::string exception_type;  // Set when the failure came from a thrown exception
    int http_status = 0;         // 0 when the backend reported no status
    ErrorClass error_class = ErrorClass::Unclassified;
    std::map<std::string, std::string> details;

    std::string to_string() const {
        std::ostringstream oss;
        oss << "OperationError{code: " << (code.empty() ? "-" : code)
            << ", class: " << errorClassToString(error_class)
            << ", status: " << http_status
            << ", message: " << message;
        if (!exception_type.empty()) {
            oss << ", exception: " << exception_type;
        }
        oss << "}";
        return oss.str();
    }
};

#endif // ERRORTYPES_HPP
