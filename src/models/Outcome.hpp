#ifndef OUTCOME_HPP
#define OUTCOME_HPP

#include <optional>
#include <stdexcept>
#include <utility>

#include "ErrorTypes.hpp"

enum class OutcomeKind {
    Success,
    RetryableFailure,
    TerminalFailure
};

// Result of one invocation of a wrapped dependency call. Adapters around a
// backend client return this instead of throwing the client's exception
// types, so breaker and retry logic branch on data.
template <typename T>
class Outcome {
public:
    static Outcome success(T value) {
        return Outcome(OutcomeKind::Success, std::optional<T>(std::move(value)), std::nullopt);
    }

    static Outcome retryable(OperationError error) {
        return Outcome(OutcomeKind::RetryableFailure, std::nullopt, std::move(error));
    }

    static Outcome terminal(OperationError error) {
        return Outcome(OutcomeKind::TerminalFailure, std::nullopt, std::move(error));
    }

    bool ok() const { return kind_ == OutcomeKind::Success; }
    OutcomeKind kind() const { return kind_; }

    const T& value() const {
        if (!value_) {
            throw std::logic_error("Outcome holds an error, not a value");
        }
        return *value_;
    }

    T takeValue() {
        if (!value_) {
            throw std::logic_error("Outcome holds an error, not a value");
        }
        return std::move(*value_);
    }

    const OperationError& error() const {
        if (!error_) {
            throw std::logic_error("Outcome holds a value, not an error");
        }
        return *error_;
    }

private:
    Outcome(OutcomeKind kind, std::optional<T> value, std::optional<OperationError> error)
        : kind_(kind), value_(std::move(value)), error_(std::move(error)) {}

    OutcomeKind kind_;
    std::optional<T> value_;
    std::optional<OperationError> error_;
};

#endif // OUTCOME_HPP
