#include "ErrorClassifier.hpp"

#include <algorithm>
#include <cctype>

ErrorClassifier::ErrorClassifier(std::map<ErrorClass, std::vector<std::string>> error_codes,
                                 ClassifierFn override_fn)
    : override_fn_(std::move(override_fn)) {
    for (const auto& [error_class, codes] : error_codes) {
        for (const auto& code : codes) {
            code_table_[code] = error_class;
        }
    }
}

std::optional<ErrorClass> ErrorClassifier::classifyHttpStatus(int status) {
    switch (status) {
        case 429:
        case 502:
        case 504:
            return ErrorClass::Transient;
        case 500:
        case 503:
            return ErrorClass::Unavailable;
        case 401:
        case 403:
            return ErrorClass::Authentication;
        case 404:
            return ErrorClass::ResourceNotFound;
        case 400:
        case 422:
            return ErrorClass::Validation;
        default:
            return std::nullopt;
    }
}

ErrorClass ErrorClassifier::classify(const OperationError& error) const {
    if (override_fn_) {
        if (auto overridden = override_fn_(error)) {
            return *overridden;
        }
    }
    if (!error.code.empty()) {
        auto it = code_table_.find(error.code);
        if (it != code_table_.end()) {
            return it->second;
        }
    }
    if (auto by_status = classifyHttpStatus(error.http_status)) {
        return *by_status;
    }
    return error.error_class;
}

OperationError ErrorClassifier::annotate(OperationError error) const {
    error.error_class = classify(error);
    return error;
}

bool ErrorClassifier::isRetryable(const OperationError& error) const {
    switch (error.error_class) {
        case ErrorClass::Transient:
        case ErrorClass::Unavailable:
        case ErrorClass::Quota:
            return true;
        case ErrorClass::Authentication:
        case ErrorClass::Validation:
        case ErrorClass::ResourceNotFound:
            return false;
        case ErrorClass::Unclassified:
            return error.http_status >= 500;
    }
    return false;
}

ErrorSeverity ErrorClassifier::severityOf(const OperationError& error) const {
    if (error.error_class == ErrorClass::Unavailable) {
        return ErrorSeverity::Critical;
    }

    std::string type = error.exception_type;
    std::transform(type.begin(), type.end(), type.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (error.error_class == ErrorClass::Quota || error.http_status >= 500 ||
        type.find("timeout") != std::string::npos) {
        return ErrorSeverity::High;
    }

    if (error.error_class == ErrorClass::ResourceNotFound ||
        error.error_class == ErrorClass::Validation ||
        error.http_status >= 400) {
        return ErrorSeverity::Medium;
    }
    return ErrorSeverity::Low;
}
