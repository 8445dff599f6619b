#ifndef CIRCUITBREAKER_HPP
#define CIRCUITBREAKER_HPP

#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>

#include <nlohmann/json.hpp>

#include "../config/AppConfig.hpp"
#include "../config/DependencyConfig.hpp"
#include "../interfaces/IClock.hpp"
#include "../interfaces/ILogger.hpp"
#include "../interfaces/IStatsDClient.hpp"
#include "../models/Outcome.hpp"
#include "../models/ResilienceErrors.hpp"

using json = nlohmann::json;

enum class CircuitState {
    Closed,
    Open,
    HalfOpen
};

std::string circuitStateToString(CircuitState state);

struct CircuitBreakerSnapshot {
    std::string name;
    CircuitState state = CircuitState::Closed;
    int failure_count = 0;
    int success_count = 0;
    std::optional<std::chrono::system_clock::time_point> last_failure_time;
    bool is_healthy = true;

    json toJson() const;
};

// Per-dependency fault detector. Open -> HalfOpen happens lazily on the
// first call after open_timeout; there is no background timer.
//
// Each admitted call carries the generation it was admitted in. A result
// that arrives after the breaker has moved on (e.g. a slow Closed-state call
// finishing while Open) is ignored.
class CircuitBreaker {
public:
    CircuitBreaker(std::string name,
                   CircuitBreakerConfig config,
                   std::shared_ptr<ILogger> logger,
                   std::shared_ptr<IStatsDClient> statsd_client,
                   std::shared_ptr<IClock> clock = std::make_shared<SystemClock>());

    struct Permit {
        uint64_t generation = 0;
        bool probe = false;
    };

    // Runs operation if the breaker admits it. Throws CircuitOpenError
    // without invoking operation otherwise. Failure outcomes and thrown
    // exceptions both count as failures; exceptions are rethrown unchanged.
    template <typename T>
    Outcome<T> call(const std::function<Outcome<T>()>& operation) {
        Permit permit = acquirePermission();
        try {
            Outcome<T> outcome = operation();
            if (outcome.ok()) {
                onSuccess(permit);
            } else {
                onFailure(permit);
            }
            return outcome;
        } catch (...) {
            onFailure(permit);
            throw;
        }
    }

    // Throws CircuitOpenError when the call must be rejected.
    Permit acquirePermission();
    void onSuccess(const Permit& permit);
    void onFailure(const Permit& permit);

    CircuitState state();
    CircuitBreakerSnapshot snapshot();
    void reset();

    const std::string& name() const { return name_; }
    const CircuitBreakerConfig& config() const { return config_; }

private:
    // Callers hold mutex_.
    void transitionTo(CircuitState next);
    void trip(std::chrono::steady_clock::time_point now);

    const std::string name_;
    const CircuitBreakerConfig config_;
    std::shared_ptr<ILogger> logger_;
    std::shared_ptr<IStatsDClient> statsd_client_;
    std::shared_ptr<IClock> clock_;

    std::mutex mutex_;
    CircuitState state_ = CircuitState::Closed;
    int failure_count_ = 0;
    int success_count_ = 0;
    int half_open_in_flight_ = 0;
    uint64_t generation_ = 0;
    std::chrono::steady_clock::time_point last_failure_time_{};
    std::optional<std::chrono::system_clock::time_point> last_failure_wall_time_;
};

#endif // CIRCUITBREAKER_HPP
