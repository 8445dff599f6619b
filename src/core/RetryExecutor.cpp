#include "RetryExecutor.hpp"

#include <stdexcept>
#include <typeinfo>

#include <boost/core/demangle.hpp>

#include "../config/AppConfig.hpp"

RetryExecutor::RetryExecutor(std::string dependency,
                             RetryConfig config,
                             ErrorClassifier classifier,
                             std::shared_ptr<FailureRouter> router,
                             std::shared_ptr<ILogger> logger,
                             std::shared_ptr<IStatsDClient> statsd_client,
                             Sleeper sleeper,
                             uint64_t seed)
    : dependency_(std::move(dependency)),
      config_(config),
      classifier_(std::move(classifier)),
      backoff_(config, seed),
      router_(std::move(router)),
      logger_(std::move(logger)),
      statsd_client_(std::move(statsd_client)),
      sleeper_(std::move(sleeper)) {
    if (!router_) {
        throw std::invalid_argument("FailureRouter cannot be null for RetryExecutor");
    }
    if (!logger_) {
        throw std::invalid_argument("Logger cannot be null for RetryExecutor");
    }
    if (!statsd_client_) {
        throw std::invalid_argument("StatsDClient cannot be null for RetryExecutor");
    }
    if (!sleeper_) {
        sleeper_ = [](std::chrono::milliseconds delay, CancellationToken& token) {
            return token.waitFor(delay);
        };
    }
}

AttemptFailure RetryExecutor::assessOutcome(OutcomeKind kind, const OperationError& error) const {
    AttemptFailure failure;
    failure.error = classifier_.annotate(error);
    // The adapter's verdict is final for terminal outcomes; a retryable one
    // is still subject to the never-retry classes and the configured set.
    failure.retryable = kind == OutcomeKind::RetryableFailure &&
                        config_.allowsRetryOf(failure.error.error_class);
    return failure;
}

AttemptFailure RetryExecutor::assessException(const std::exception& e) const {
    OperationError error;
    if (const auto* call_error = dynamic_cast<const DependencyCallError*>(&e)) {
        error = call_error->error();
    } else {
        error.message = e.what();
    }
    if (error.exception_type.empty()) {
        error.exception_type = boost::core::demangle(typeid(e).name());
    }
    if (error.code.empty()) {
        // Code tables match on the unqualified exception name.
        auto pos = error.exception_type.rfind("::");
        error.code = pos == std::string::npos ? error.exception_type : error.exception_type.substr(pos + 2);
    }

    AttemptFailure failure;
    failure.error = classifier_.annotate(std::move(error));
    failure.retryable = classifier_.isRetryable(failure.error) &&
                        config_.allowsRetryOf(failure.error.error_class);
    return failure;
}

RetryPlan RetryExecutor::planRetry(const AttemptFailure& failure, int attempt, CancellationToken& token) {
    RetryPlan plan;
    if (!failure.retryable) {
        plan.stop_reason = "terminal";
        return plan;
    }
    if (attempt >= config_.max_retries) {
        plan.stop_reason = "exhausted";
        return plan;
    }
    if (token.isCancelled()) {
        plan.stop_reason = "cancelled";
        return plan;
    }

    auto delay = backoff_.delayFor(attempt, failure.error.error_class);
    auto remaining = token.remaining();
    if (remaining && delay >= *remaining) {
        logger_->warn(dependency_ + ": next retry in " + std::to_string(delay.count()) +
                      "ms would pass the deadline (" + std::to_string(remaining->count()) + "ms left)");
        plan.stop_reason = "deadline";
        return plan;
    }

    logger_->warn(dependency_ + " attempt " + std::to_string(attempt + 1) + "/" +
                  std::to_string(config_.max_retries + 1) + " failed (" + failure.error.to_string() +
                  "), retrying in " + std::to_string(delay.count()) + "ms");
    statsd_client_->increment(MetricsDefinitions::RETRY_ATTEMPTED);
    plan.delay = delay;
    return plan;
}

void RetryExecutor::recordSuccess(int attempt, const CallContext& context,
                                  std::chrono::steady_clock::time_point started) {
    statsd_client_->timing(MetricsDefinitions::OPERATION_LATENCY,
                           std::chrono::duration_cast<std::chrono::milliseconds>(
                               std::chrono::steady_clock::now() - started));
    if (attempt > 0) {
        logger_->info(dependency_ + "/" + context.operation + " recovered after " +
                      std::to_string(attempt) + " retries");
        statsd_client_->increment(MetricsDefinitions::RETRY_RECOVERED);
    }
}

FailureContext RetryExecutor::failureContext(int attempts, const CallContext& context) const {
    FailureContext failure_context;
    failure_context.subject_id = context.subject_id;
    failure_context.dependency = dependency_;
    failure_context.operation = context.operation;
    failure_context.attempts = attempts;
    failure_context.details = context.details;
    if (!context.request_id.empty()) {
        failure_context.details["request_id"] = context.request_id;
    }
    return failure_context;
}

std::exception_ptr RetryExecutor::concludeFailure(const AttemptFailure& failure, int attempts,
                                                  const CallContext& context,
                                                  std::chrono::steady_clock::time_point started,
                                                  const std::string& stop_reason) {
    statsd_client_->timing(MetricsDefinitions::OPERATION_LATENCY,
                           std::chrono::duration_cast<std::chrono::milliseconds>(
                               std::chrono::steady_clock::now() - started));
    if (stop_reason == "exhausted") {
        statsd_client_->increment(MetricsDefinitions::RETRY_EXHAUSTED);
    }

    ErrorSeverity severity = classifier_.severityOf(failure.error);
    FailureContext failure_context = failureContext(attempts, context);
    failure_context.details["stop_reason"] = stop_reason;
    router_->route(failure.error, severity, failure_context);

    if (failure.retryable) {
        return std::make_exception_ptr(RetryableError(dependency_, failure.error, severity, attempts));
    }
    return std::make_exception_ptr(TerminalError(dependency_, failure.error, severity, attempts));
}

void RetryExecutor::routeInterrupted(const AttemptFailure& failure, int attempts, const CallContext& context,
                                     const std::string& reason) {
    FailureContext failure_context = failureContext(attempts, context);
    failure_context.details["stop_reason"] = reason;
    failure_context.details[reason] = "true";
    router_->route(failure.error, classifier_.severityOf(failure.error), failure_context);
}
