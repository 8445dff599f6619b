#include "CircuitBreakerRegistry.hpp"

#include <stdexcept>

CircuitBreakerRegistry::CircuitBreakerRegistry(AppConfig config,
                                               std::shared_ptr<ILogger> logger,
                                               std::shared_ptr<IStatsDClient> statsd_client,
                                               std::shared_ptr<IClock> clock)
    : config_(std::move(config)),
      logger_(std::move(logger)),
      statsd_client_(std::move(statsd_client)),
      clock_(std::move(clock)) {
    if (!logger_) {
        throw std::invalid_argument("Logger cannot be null for CircuitBreakerRegistry");
    }
    if (!statsd_client_) {
        throw std::invalid_argument("StatsDClient cannot be null for CircuitBreakerRegistry");
    }
}

std::shared_ptr<CircuitBreaker> CircuitBreakerRegistry::get(const std::string& dependency) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = breakers_.find(dependency);
    if (it != breakers_.end()) {
        return it->second;
    }
    auto breaker = std::make_shared<CircuitBreaker>(
        dependency, config_.dependencyConfig(dependency).breaker, logger_, statsd_client_, clock_);
    breakers_.emplace(dependency, breaker);
    logger_->debug("Created circuit breaker for " + dependency);
    return breaker;
}

std::vector<CircuitBreakerSnapshot> CircuitBreakerRegistry::snapshots() {
    std::vector<std::shared_ptr<CircuitBreaker>> breakers;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        for (const auto& [name, breaker] : breakers_) {
            breakers.push_back(breaker);
        }
    }
    std::vector<CircuitBreakerSnapshot> result;
    result.reserve(breakers.size());
    for (const auto& breaker : breakers) {
        result.push_back(breaker->snapshot());
    }
    return result;
}

void CircuitBreakerRegistry::resetAll() {
    std::lock_guard<std::mutex> lock(mutex_);
    for (const auto& [name, breaker] : breakers_) {
        breaker->reset();
    }
}
