#include "CircuitBreaker.hpp"

#include <stdexcept>

#include "../utils/Utils.hpp"

std::string circuitStateToString(CircuitState state) {
    switch (state) {
        case CircuitState::Closed: return "closed";
        case CircuitState::Open: return "open";
        case CircuitState::HalfOpen: return "half_open";
    }
    return "unknown";
}

json CircuitBreakerSnapshot::toJson() const {
    json j;
    j["name"] = name;
    j["state"] = circuitStateToString(state);
    j["failure_count"] = failure_count;
    j["success_count"] = success_count;
    j["last_failure_time"] = last_failure_time ? json(Utils::formatIsoTimestamp(*last_failure_time)) : json(nullptr);
    j["is_healthy"] = is_healthy;
    return j;
}

CircuitBreaker::CircuitBreaker(std::string name,
                               CircuitBreakerConfig config,
                               std::shared_ptr<ILogger> logger,
                               std::shared_ptr<IStatsDClient> statsd_client,
                               std::shared_ptr<IClock> clock)
    : name_(std::move(name)),
      config_(config),
      logger_(std::move(logger)),
      statsd_client_(std::move(statsd_client)),
      clock_(std::move(clock)) {
    if (!logger_) {
        throw std::invalid_argument("Logger cannot be null for CircuitBreaker");
    }
    if (!statsd_client_) {
        throw std::invalid_argument("StatsDClient cannot be null for CircuitBreaker");
    }
    if (!clock_) {
        throw std::invalid_argument("Clock cannot be null for CircuitBreaker");
    }
    if (config_.failure_threshold < 1 || config_.success_threshold < 1) {
        throw std::invalid_argument("Circuit breaker thresholds must be at least 1 for " + name_);
    }
}

void CircuitBreaker::transitionTo(CircuitState next) {
    CircuitState previous = state_;
    state_ = next;
    ++generation_;
    half_open_in_flight_ = 0;

    std::string message = "Circuit breaker " + name_ + ": " + circuitStateToString(previous) +
                          " -> " + circuitStateToString(next);
    switch (next) {
        case CircuitState::Open:
            logger_->warn(message + " after " + std::to_string(failure_count_) + " consecutive failures");
            statsd_client_->increment(MetricsDefinitions::BREAKER_OPENED);
            break;
        case CircuitState::Closed:
            logger_->info(message);
            statsd_client_->increment(MetricsDefinitions::BREAKER_CLOSED);
            break;
        case CircuitState::HalfOpen:
            logger_->info(message + ", probing recovery");
            break;
    }
}

void CircuitBreaker::trip(std::chrono::steady_clock::time_point now) {
    last_failure_time_ = now;
    last_failure_wall_time_ = clock_->wallNow();
    success_count_ = 0;
    transitionTo(CircuitState::Open);
}

CircuitBreaker::Permit CircuitBreaker::acquirePermission() {
    std::lock_guard<std::mutex> lock(mutex_);
    auto now = clock_->now();

    if (state_ == CircuitState::Open) {
        auto elapsed = now - last_failure_time_;
        if (elapsed < config_.open_timeout) {
            auto retry_after = std::chrono::duration_cast<std::chrono::milliseconds>(config_.open_timeout - elapsed);
            statsd_client_->increment(MetricsDefinitions::BREAKER_REJECTED);
            logger_->debug("Circuit breaker " + name_ + " rejected call, retry after " +
                           std::to_string(retry_after.count()) + "ms");
            throw CircuitOpenError(name_, retry_after);
        }
        success_count_ = 0;
        transitionTo(CircuitState::HalfOpen);
    }

    if (state_ == CircuitState::HalfOpen) {
        if (half_open_in_flight_ >= config_.effectiveHalfOpenMaxCalls()) {
            statsd_client_->increment(MetricsDefinitions::BREAKER_REJECTED);
            throw CircuitOpenError(name_, std::chrono::milliseconds(0));
        }
        ++half_open_in_flight_;
        return Permit{generation_, true};
    }

    return Permit{generation_, false};
}

void CircuitBreaker::onSuccess(const Permit& permit) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (permit.generation != generation_) {
        return;
    }

    if (state_ == CircuitState::Closed) {
        failure_count_ = 0;
    } else if (state_ == CircuitState::HalfOpen) {
        if (permit.probe && half_open_in_flight_ > 0) {
            --half_open_in_flight_;
        }
        ++success_count_;
        if (success_count_ >= config_.success_threshold) {
            failure_count_ = 0;
            success_count_ = 0;
            transitionTo(CircuitState::Closed);
        }
    }
}

void CircuitBreaker::onFailure(const Permit& permit) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (permit.generation != generation_) {
        return;
    }
    auto now = clock_->now();

    if (state_ == CircuitState::Closed) {
        ++failure_count_;
        last_failure_time_ = now;
        last_failure_wall_time_ = clock_->wallNow();
        if (failure_count_ >= config_.failure_threshold) {
            trip(now);
        }
    } else if (state_ == CircuitState::HalfOpen) {
        ++failure_count_;
        trip(now);
    }
}

CircuitState CircuitBreaker::state() {
    std::lock_guard<std::mutex> lock(mutex_);
    return state_;
}

CircuitBreakerSnapshot CircuitBreaker::snapshot() {
    std::lock_guard<std::mutex> lock(mutex_);
    CircuitBreakerSnapshot snapshot;
    snapshot.name = name_;
    snapshot.state = state_;
    snapshot.failure_count = failure_count_;
    snapshot.success_count = success_count_;
    snapshot.last_failure_time = last_failure_wall_time_;
    snapshot.is_healthy = state_ == CircuitState::Closed;
    return snapshot;
}

void CircuitBreaker::reset() {
    std::lock_guard<std::mutex> lock(mutex_);
    failure_count_ = 0;
    success_count_ = 0;
    last_failure_wall_time_.reset();
    if (state_ != CircuitState::Closed) {
        transitionTo(CircuitState::Closed);
    }
}
