#ifndef BACKOFFPOLICY_HPP
#define BACKOFFPOLICY_HPP

#include <chrono>
#include <cstdint>
#include <mutex>
#include <random>

#include "../config/DependencyConfig.hpp"
#include "../models/ErrorTypes.hpp"

// Maps a retry attempt number (0-based: the delay before attempt + 1) to a
// wait duration according to a RetryConfig. Thread-safe; one instance may be
// shared by all calls against a dependency.
class BackoffPolicy {
public:
    explicit BackoffPolicy(RetryConfig config, uint64_t seed = std::random_device{}());

    std::chrono::milliseconds delayFor(int attempt, ErrorClass error_class = ErrorClass::Transient);

    // Delay before jitter, quota multiplier and cap.
    std::chrono::milliseconds baseDelayFor(int attempt) const;

    const RetryConfig& config() const { return config_; }

private:
    double rawDelay(int attempt) const;
    double uniformNoise(double amplitude);

    RetryConfig config_;
    std::mt19937_64 rng_;
    std::mutex rng_mutex_;
};

#endif // BACKOFFPOLICY_HPP
