#ifndef RETRYEXECUTOR_HPP
#define RETRYEXECUTOR_HPP

#include <chrono>
#include <cstdint>
#include <exception>
#include <functional>
#include <map>
#include <memory>
#include <optional>
#include <random>
#include <string>

#include <boost/asio/error.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/post.hpp>
#include <boost/asio/steady_timer.hpp>
#include <boost/beast/core/bind_handler.hpp>
#include <boost/beast/core/error.hpp>

#include "../config/DependencyConfig.hpp"
#include "../interfaces/ILogger.hpp"
#include "../interfaces/IStatsDClient.hpp"
#include "../models/Outcome.hpp"
#include "../models/ResilienceErrors.hpp"
#include "BackoffPolicy.hpp"
#include "CancellationToken.hpp"
#include "ErrorClassifier.hpp"
#include "FailureRouter.hpp"

namespace beast = boost::beast;
namespace net = boost::asio;

// Who is calling and why; copied into the FailureRecord on final failure.
struct CallContext {
    std::string subject_id;
    std::string operation;
    std::string request_id;
    std::map<std::string, std::string> details;
};

// The classified failure of the most recent attempt.
struct AttemptFailure {
    OperationError error;
    bool retryable = false;
};

struct RetryPlan {
    std::optional<std::chrono::milliseconds> delay;   // nullopt: stop retrying
    std::string stop_reason;                         // "terminal", "exhausted", "deadline"
};

// Bounded retries with backoff for one dependency. On terminal failure or
// exhaustion the last error is routed to the dead-letter sink exactly once
// and surfaced as TerminalError / RetryableError. Errors raised by the
// resilience layer itself (CircuitOpenError, QuotaExceededError, ...) are
// never retried and pass through unchanged.
class RetryExecutor {
public:
    // Returns false when the wait was cut short (cancelled or past deadline).
    using Sleeper = std::function<bool(std::chrono::milliseconds, CancellationToken&)>;

    RetryExecutor(std::string dependency,
                  RetryConfig config,
                  ErrorClassifier classifier,
                  std::shared_ptr<FailureRouter> router,
                  std::shared_ptr<ILogger> logger,
                  std::shared_ptr<IStatsDClient> statsd_client,
                  Sleeper sleeper = nullptr,
                  uint64_t seed = std::random_device{}());

    template <typename T>
    T execute(const std::function<Outcome<T>()>& operation, const CallContext& context, CancellationToken& token) {
        const auto started = std::chrono::steady_clock::now();
        if (token.isCancelled()) {
            throw OperationCancelledError("Call to " + dependency_ + " cancelled before first attempt");
        }

        std::optional<AttemptFailure> last;
        for (int attempt = 0;; ++attempt) {
            try {
                Outcome<T> outcome = operation();
                if (outcome.ok()) {
                    recordSuccess(attempt, context, started);
                    return outcome.takeValue();
                }
                last = assessOutcome(outcome.kind(), outcome.error());
            } catch (const CircuitOpenError&) {
                if (last) {
                    routeInterrupted(*last, attempt, context, "circuit_open");
                }
                throw;
            } catch (const ResilienceError&) {
                throw;
            } catch (const std::exception& e) {
                last = assessException(e);
            }

            RetryPlan plan = planRetry(*last, attempt, token);
            if (!plan.delay) {
                std::rethrow_exception(concludeFailure(*last, attempt + 1, context, started, plan.stop_reason));
            }
            if (!sleeper_(*plan.delay, token)) {
                std::rethrow_exception(concludeFailure(*last, attempt + 1, context, started, "cancelled"));
            }
        }
    }

    template <typename T>
    T execute(const std::function<Outcome<T>()>& operation, const CallContext& context) {
        CancellationToken token;
        return execute<T>(operation, context, token);
    }

    // Same loop as execute(), but waits between attempts on a steady_timer so
    // other handlers on ioc keep running. on_complete receives either the
    // value or the exception execute() would have thrown. The executor must
    // outlive the operation.
    template <typename T>
    void asyncExecute(net::io_context& ioc,
                      std::function<Outcome<T>()> operation,
                      CallContext context,
                      std::shared_ptr<CancellationToken> token,
                      std::function<void(std::optional<T>, std::exception_ptr)> on_complete);

    // Building blocks shared by execute() and the asynchronous loop.
    AttemptFailure assessOutcome(OutcomeKind kind, const OperationError& error) const;
    AttemptFailure assessException(const std::exception& e) const;
    RetryPlan planRetry(const AttemptFailure& failure, int attempt, CancellationToken& token);
    void recordSuccess(int attempt, const CallContext& context, std::chrono::steady_clock::time_point started);
    // Routes the failure and returns the exception to surface to the caller.
    std::exception_ptr concludeFailure(const AttemptFailure& failure, int attempts, const CallContext& context,
                                       std::chrono::steady_clock::time_point started, const std::string& stop_reason);
    // A breaker opened between retries: the call has failed, record it.
    void routeInterrupted(const AttemptFailure& failure, int attempts, const CallContext& context,
                          const std::string& reason);

    const std::string& dependency() const { return dependency_; }
    const RetryConfig& config() const { return config_; }
    ErrorClassifier& classifier() { return classifier_; }

private:
    FailureContext failureContext(int attempts, const CallContext& context) const;

    std::string dependency_;
    RetryConfig config_;
    ErrorClassifier classifier_;
    BackoffPolicy backoff_;
    std::shared_ptr<FailureRouter> router_;
    std::shared_ptr<ILogger> logger_;
    std::shared_ptr<IStatsDClient> statsd_client_;
    Sleeper sleeper_;
};

// One in-flight asynchronous retry loop. Keeps itself alive through the
// handlers it schedules, like a Beast session.
template <typename T>
class AsyncRetryOperation : public std::enable_shared_from_this<AsyncRetryOperation<T>> {
public:
    using Completion = std::function<void(std::optional<T>, std::exception_ptr)>;

    AsyncRetryOperation(net::io_context& ioc,
                        RetryExecutor& executor,
                        std::function<Outcome<T>()> operation,
                        CallContext context,
                        std::shared_ptr<CancellationToken> token,
                        Completion on_complete)
        : ioc_(ioc),
          executor_(executor),
          operation_(std::move(operation)),
          context_(std::move(context)),
          token_(token ? std::move(token) : std::make_shared<CancellationToken>()),
          on_complete_(std::move(on_complete)),
          timer_(ioc),
          started_(std::chrono::steady_clock::now()) {}

    void run() {
        std::weak_ptr<AsyncRetryOperation> weak = this->weak_from_this();
        subscription_ = token_->subscribe([weak]() {
            if (auto self = weak.lock()) {
                net::post(self->ioc_, [self]() { self->timer_.cancel(); });
            }
        });
        net::post(ioc_, beast::bind_front_handler(&AsyncRetryOperation::doAttempt, this->shared_from_this()));
    }

private:
    void doAttempt() {
        if (attempt_ == 0 && token_->isCancelled()) {
            return complete(std::nullopt, std::make_exception_ptr(OperationCancelledError(
                "Call to " + executor_.dependency() + " cancelled before first attempt")));
        }

        try {
            Outcome<T> outcome = operation_();
            if (outcome.ok()) {
                executor_.recordSuccess(attempt_, context_, started_);
                return complete(outcome.takeValue(), nullptr);
            }
            last_ = executor_.assessOutcome(outcome.kind(), outcome.error());
        } catch (const CircuitOpenError&) {
            if (last_) {
                executor_.routeInterrupted(*last_, attempt_, context_, "circuit_open");
            }
            return complete(std::nullopt, std::current_exception());
        } catch (const ResilienceError&) {
            return complete(std::nullopt, std::current_exception());
        } catch (const std::exception& e) {
            last_ = executor_.assessException(e);
        }

        RetryPlan plan = executor_.planRetry(*last_, attempt_, *token_);
        if (!plan.delay) {
            return fail(plan.stop_reason);
        }
        timer_.expires_after(*plan.delay);
        timer_.async_wait(beast::bind_front_handler(&AsyncRetryOperation::onDelayElapsed, this->shared_from_this()));
    }

    void onDelayElapsed(beast::error_code ec) {
        if (ec == net::error::operation_aborted || token_->isCancelled()) {
            return fail("cancelled");
        }
        ++attempt_;
        doAttempt();
    }

    void fail(const std::string& stop_reason) {
        complete(std::nullopt, executor_.concludeFailure(*last_, attempt_ + 1, context_, started_, stop_reason));
    }

    void complete(std::optional<T> value, std::exception_ptr error) {
        token_->unsubscribe(subscription_);
        if (on_complete_) {
            on_complete_(std::move(value), error);
        }
    }

    net::io_context& ioc_;
    RetryExecutor& executor_;
    std::function<Outcome<T>()> operation_;
    CallContext context_;
    std::shared_ptr<CancellationToken> token_;
    Completion on_complete_;
    net::steady_timer timer_;
    std::chrono::steady_clock::time_point started_;
    int attempt_ = 0;
    uint64_t subscription_ = 0;
    std::optional<AttemptFailure> last_;
};

template <typename T>
void RetryExecutor::asyncExecute(net::io_context& ioc,
                                 std::function<Outcome<T>()> operation,
                                 CallContext context,
                                 std::shared_ptr<CancellationToken> token,
                                 std::function<void(std::optional<T>, std::exception_ptr)> on_complete) {
    std::make_shared<AsyncRetryOperation<T>>(
        ioc, *this, std::move(operation), std::move(context), std::move(token), std::move(on_complete))->run();
}

#endif // RETRYEXECUTOR_HPP
