#ifndef RESILIENCEGATEWAY_HPP
#define RESILIENCEGATEWAY_HPP

#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <string>

#include <nlohmann/json.hpp>

#include "../config/AppConfig.hpp"
#include "../interfaces/ILogger.hpp"
#include "../interfaces/IStatsDClient.hpp"
#include "../models/CallResult.hpp"
#include "CancellationToken.hpp"
#include "CircuitBreakerRegistry.hpp"
#include "ErrorClassifier.hpp"
#include "FailureRouter.hpp"
#include "QuotaManager.hpp"
#include "RetryExecutor.hpp"

using json = nlohmann::json;

// Caller-facing entry point: quota admission, then the retry loop around the
// dependency's circuit breaker. Every call ends in one CallResult status;
// no downstream exception escapes.
class ResilienceGateway {
public:
    ResilienceGateway(AppConfig config,
                      std::shared_ptr<QuotaManager> quota_manager,
                      std::shared_ptr<CircuitBreakerRegistry> breakers,
                      std::shared_ptr<FailureRouter> router,
                      std::shared_ptr<ILogger> logger,
                      std::shared_ptr<IStatsDClient> statsd_client,
                      RetryExecutor::Sleeper sleeper = nullptr);

    ResilienceGateway(const ResilienceGateway&) = delete;
    ResilienceGateway& operator=(const ResilienceGateway&) = delete;

    template <typename T>
    CallResult<T> call(const std::string& subject_id,
                       const std::string& operation_name,
                       const std::string& dependency,
                       const std::function<Outcome<T>()>& operation,
                       CancellationToken& token) {
        CallResult<T> result;
        QuotaInfo quota = quota_manager_->checkAndIncrement(subject_id, operation_name);
        result.quota = quota;

        if (!quota.allowed) {
            if (quota.tracking_error && quota.exceeded == QuotaLimit::Unknown) {
                result.status = CallStatus::TrackingFailed;
                result.message = *quota.tracking_error;
            } else {
                result.status = CallStatus::QuotaExceeded;
                result.message = QuotaExceededError(subject_id, quota.exceeded).what();
            }
            return result;
        }
        if (quota.tracking_error) {
            logger_->warn("Admitting " + operation_name + " for " + subject_id +
                          " without quota tracking: " + *quota.tracking_error);
        }

        std::shared_ptr<CircuitBreaker> breaker = breakers_->get(dependency);
        std::shared_ptr<RetryExecutor> executor = executorFor(dependency);
        CallContext context{subject_id, operation_name, "", {}};

        try {
            result.value = executor->execute<T>(
                [&breaker, &operation]() { return breaker->call<T>(operation); }, context, token);
            result.status = CallStatus::Succeeded;
        } catch (const CircuitOpenError& e) {
            result.status = CallStatus::CircuitOpen;
            result.retry_after = e.retryAfter();
            result.message = e.what();
        } catch (const OperationFailedError& e) {
            result.status = CallStatus::OperationFailed;
            result.severity = e.severity();
            result.error = e.error();
            result.attempts = e.attempts();
            result.message = e.what();
        } catch (const ResilienceError& e) {
            result.status = CallStatus::OperationFailed;
            result.severity = ErrorSeverity::Low;
            result.message = e.what();
        }
        return result;
    }

    template <typename T>
    CallResult<T> call(const std::string& subject_id,
                       const std::string& operation_name,
                       const std::string& dependency,
                       const std::function<Outcome<T>()>& operation) {
        CancellationToken token;
        return call<T>(subject_id, operation_name, dependency, operation, token);
    }

    // Must be called before the dependency's first call to take effect.
    void registerClassifier(const std::string& dependency, ClassifierFn classifier);

    QuotaInfo quotaStatus(const std::string& subject_id);

    json healthSnapshot();

    // What an out-of-process caller can report: configured dependencies and
    // their policies. Live breaker state exists only inside the process that
    // owns the gateway.
    static json configurationReport(const AppConfig& config);

    std::shared_ptr<RetryExecutor> executorFor(const std::string& dependency);

private:
    AppConfig config_;
    std::shared_ptr<QuotaManager> quota_manager_;
    std::shared_ptr<CircuitBreakerRegistry> breakers_;
    std::shared_ptr<FailureRouter> router_;
    std::shared_ptr<ILogger> logger_;
    std::shared_ptr<IStatsDClient> statsd_client_;
    RetryExecutor::Sleeper sleeper_;

    std::mutex mutex_;
    std::map<std::string, std::shared_ptr<RetryExecutor>> executors_;
    std::map<std::string, ClassifierFn> classifiers_;
};

#endif // RESILIENCEGATEWAY_HPP
