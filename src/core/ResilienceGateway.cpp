#include "ResilienceGateway.hpp"

#include <stdexcept>

ResilienceGateway::ResilienceGateway(AppConfig config,
                                     std::shared_ptr<QuotaManager> quota_manager,
                                     std::shared_ptr<CircuitBreakerRegistry> breakers,
                                     std::shared_ptr<FailureRouter> router,
                                     std::shared_ptr<ILogger> logger,
                                     std::shared_ptr<IStatsDClient> statsd_client,
                                     RetryExecutor::Sleeper sleeper)
    : config_(std::move(config)),
      quota_manager_(std::move(quota_manager)),
      breakers_(std::move(breakers)),
      router_(std::move(router)),
      logger_(std::move(logger)),
      statsd_client_(std::move(statsd_client)),
      sleeper_(std::move(sleeper)) {
    if (!quota_manager_) {
        throw std::invalid_argument("QuotaManager cannot be null for ResilienceGateway");
    }
    if (!breakers_) {
        throw std::invalid_argument("CircuitBreakerRegistry cannot be null for ResilienceGateway");
    }
    if (!router_) {
        throw std::invalid_argument("FailureRouter cannot be null for ResilienceGateway");
    }
    if (!logger_) {
        throw std::invalid_argument("Logger cannot be null for ResilienceGateway");
    }
    if (!statsd_client_) {
        throw std::invalid_argument("StatsDClient cannot be null for ResilienceGateway");
    }
    logger_->debug("ResilienceGateway initialized");
}

void ResilienceGateway::registerClassifier(const std::string& dependency, ClassifierFn classifier) {
    std::lock_guard<std::mutex> lock(mutex_);
    classifiers_[dependency] = classifier;
    auto it = executors_.find(dependency);
    if (it != executors_.end()) {
        logger_->warn("Classifier for " + dependency + " registered after its first call; ignored");
    }
}

std::shared_ptr<RetryExecutor> ResilienceGateway::executorFor(const std::string& dependency) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = executors_.find(dependency);
    if (it != executors_.end()) {
        return it->second;
    }

    DependencyConfig dependency_config = config_.dependencyConfig(dependency);
    ClassifierFn override_fn;
    auto classifier_it = classifiers_.find(dependency);
    if (classifier_it != classifiers_.end()) {
        override_fn = classifier_it->second;
    }
    auto executor = std::make_shared<RetryExecutor>(
        dependency, dependency_config.retry,
        ErrorClassifier(dependency_config.error_codes, override_fn),
        router_, logger_, statsd_client_, sleeper_);
    executors_.emplace(dependency, executor);
    logger_->debug("Created retry executor: " + dependency_config.to_string());
    return executor;
}

QuotaInfo ResilienceGateway::quotaStatus(const std::string& subject_id) {
    return quota_manager_->checkFast(subject_id);
}

json ResilienceGateway::healthSnapshot() {
    json breakers = json::array();
    bool healthy = true;
    for (const auto& snapshot : breakers_->snapshots()) {
        healthy = healthy && snapshot.is_healthy;
        breakers.push_back(snapshot.toJson());
    }
    json j;
    j["status"] = healthy ? "healthy" : "degraded";
    j["breaker_scope"] = config_.breaker_scope;
    j["breakers"] = breakers;
    return j;
}

json ResilienceGateway::configurationReport(const AppConfig& config) {
    json dependencies = json::array();
    for (const auto& [name, dependency] : config.dependencies) {
        dependencies.push_back({
            {"name", name},
            {"failure_threshold", dependency.breaker.failure_threshold},
            {"success_threshold", dependency.breaker.success_threshold},
            {"open_timeout_ms", dependency.breaker.open_timeout.count()},
            {"max_retries", dependency.retry.max_retries},
            {"strategy", retryStrategyToString(dependency.retry.strategy)},
        });
    }
    json j;
    j["breaker_scope"] = config.breaker_scope;
    j["breaker_state"] = "per-process; not observable from another process";
    j["dependencies"] = dependencies;
    return j;
}
