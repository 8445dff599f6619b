#ifndef CIRCUITBREAKERREGISTRY_HPP
#define CIRCUITBREAKERREGISTRY_HPP

#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

#include "../config/AppConfig.hpp"
#include "CircuitBreaker.hpp"

// One breaker per dependency name, created from AppConfig on first use and
// kept for the registry's lifetime.
class CircuitBreakerRegistry {
public:
    CircuitBreakerRegistry(AppConfig config,
                           std::shared_ptr<ILogger> logger,
                           std::shared_ptr<IStatsDClient> statsd_client,
                           std::shared_ptr<IClock> clock = std::make_shared<SystemClock>());

    std::shared_ptr<CircuitBreaker> get(const std::string& dependency);

    std::vector<CircuitBreakerSnapshot> snapshots();
    void resetAll();

private:
    AppConfig config_;
    std::shared_ptr<ILogger> logger_;
    std::shared_ptr<IStatsDClient> statsd_client_;
    std::shared_ptr<IClock> clock_;
    std::mutex mutex_;
    std::map<std::string, std::shared_ptr<CircuitBreaker>> breakers_;
};

#endif // CIRCUITBREAKERREGISTRY_HPP
