#ifndef ERRORCLASSIFIER_HPP
#define ERRORCLASSIFIER_HPP

#include <functional>
#include <map>
#include <optional>
#include <string>
#include <vector>

#include "../models/ErrorTypes.hpp"
#include "../models/Outcome.hpp"

// Optional per-dependency override. Returning nullopt falls through to the
// code table and HTTP status fallback.
using ClassifierFn = std::function<std::optional<ErrorClass>(const OperationError&)>;

// Maps a backend failure to an ErrorClass, decides retryability and severity.
//
// Lookup order: override function, dependency code table (exact match on
// OperationError::code), HTTP status, Unclassified.
class ErrorClassifier {
public:
    ErrorClassifier() = default;
    explicit ErrorClassifier(std::map<ErrorClass, std::vector<std::string>> error_codes,
                             ClassifierFn override_fn = nullptr);

    ErrorClass classify(const OperationError& error) const;

    // Returns a copy of error with error_class filled in.
    OperationError annotate(OperationError error) const;

    bool isRetryable(const OperationError& error) const;

    ErrorSeverity severityOf(const OperationError& error) const;

    void setOverride(ClassifierFn override_fn) { override_fn_ = std::move(override_fn); }

    template <typename T>
    Outcome<T> toOutcome(OperationError error) const {
        error = annotate(std::move(error));
        if (isRetryable(error)) {
            return Outcome<T>::retryable(std::move(error));
        }
        return Outcome<T>::terminal(std::move(error));
    }

    static std::optional<ErrorClass> classifyHttpStatus(int status);

private:
    std::map<std::string, ErrorClass> code_table_;
    ClassifierFn override_fn_;
};

#endif // ERRORCLASSIFIER_HPP
