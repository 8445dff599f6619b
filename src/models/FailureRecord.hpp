#ifndef FAILURERECORD_HPP
#define FAILURERECORD_HPP

#include <map>
#include <sstream>
#include <string>

#include <nlohmann/json.hpp>

#include "ErrorTypes.hpp"

using json = nlohmann::json;

// One exhausted or terminal call, written once to the dead-letter sink.
class FailureRecord {
public:
    std::string error_id;
    std::string timestamp;
    std::string subject_id;
    std::string dependency;
    std::string operation;
    std::string exception_type;
    std::string exception_message;
    ErrorSeverity severity = ErrorSeverity::Low;
    std::map<std::string, std::string> raw_details;

    json toJson() const {
        json j;
        j["error_id"] = error_id;
        j["timestamp"] = timestamp;
        j["subject_id"] = subject_id;
        j["dependency"] = dependency;
        j["operation"] = operation;
        j["exception_type"] = exception_type;
        j["exception_message"] = exception_message;
        j["severity"] = severityToString(severity);
        j["raw_details"] = raw_details;
        return j;
    }

    static FailureRecord fromJson(const json& j) {
        FailureRecord record;
        record.error_id = j.value("error_id", "");
        record.timestamp = j.value("timestamp", "");
        record.subject_id = j.value("subject_id", "unknown");
        record.dependency = j.value("dependency", "unknown");
        record.operation = j.value("operation", "unknown");
        record.exception_type = j.value("exception_type", "Unknown");
        record.exception_message = j.value("exception_message", "");
        record.severity = severityFromString(j.value("severity", "low")).value_or(ErrorSeverity::Low);
        if (j.contains("raw_details") && j["raw_details"].is_object()) {
            record.raw_details = j["raw_details"].get<std::map<std::string, std::string>>();
        }
        return record;
    }

    // Human-readable form used for notifications.
    std::string to_string() const {
        std::ostringstream oss;
        oss << "A " << severityToString(severity) << " error occurred:\n"
            << "  Error ID: " << error_id << "\n"
            << "  Dependency: " << dependency << "\n"
            << "  Operation: " << operation << "\n"
            << "  Subject: " << subject_id << "\n"
            << "  Timestamp: " << timestamp << "\n"
            << "  Exception: " << exception_type << "\n"
            << "  Message: " << exception_message << "\n";
        for (const auto& [key, value] : raw_details) {
            oss << "  " << key << ": " << value << "\n";
        }
        return oss.str();
    }
};

#endif // FAILURERECORD_HPP
