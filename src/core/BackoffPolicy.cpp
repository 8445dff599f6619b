#include "BackoffPolicy.hpp"

#include <algorithm>
#include <cmath>
#include <stdexcept>

namespace {
constexpr double JITTER_FRACTION = 0.1;
constexpr int MAX_EXPONENT = 62;
}

BackoffPolicy::BackoffPolicy(RetryConfig config, uint64_t seed)
    : config_(std::move(config)), rng_(seed) {
    if (config_.base_delay.count() < 0 || config_.max_delay.count() < 0) {
        throw std::invalid_argument("Retry delays must be non-negative");
    }
    if (config_.max_retries < 0) {
        throw std::invalid_argument("max_retries must be non-negative");
    }
}

double BackoffPolicy::rawDelay(int attempt) const {
    const double base = static_cast<double>(config_.base_delay.count());
    attempt = std::max(attempt, 0);
    switch (config_.strategy) {
        case RetryStrategy::Fixed:
            return base;
        case RetryStrategy::Linear:
            return base * (attempt + 1);
        case RetryStrategy::Exponential:
        case RetryStrategy::Jittered:
            break;
    }
    return base * std::pow(2.0, std::min(attempt, MAX_EXPONENT));
}

std::chrono::milliseconds BackoffPolicy::baseDelayFor(int attempt) const {
    const double cap = static_cast<double>(config_.max_delay.count());
    return std::chrono::milliseconds(static_cast<int64_t>(std::min(rawDelay(attempt), cap)));
}

double BackoffPolicy::uniformNoise(double amplitude) {
    if (amplitude <= 0.0) {
        return 0.0;
    }
    std::uniform_real_distribution<double> dist(-amplitude, amplitude);
    std::lock_guard<std::mutex> lock(rng_mutex_);
    return dist(rng_);
}

std::chrono::milliseconds BackoffPolicy::delayFor(int attempt, ErrorClass error_class) {
    const double base = static_cast<double>(config_.base_delay.count());
    const double cap = static_cast<double>(config_.max_delay.count());
    double delay = rawDelay(attempt);

    if (config_.strategy == RetryStrategy::Jittered) {
        delay += uniformNoise(delay * JITTER_FRACTION);
    } else if (config_.jitter) {
        // Layered jitter is proportional to the base delay, not the grown delay.
        delay += uniformNoise(base * JITTER_FRACTION);
    }

    if (error_class == ErrorClass::Quota && config_.quota_backoff_multiplier > 0.0) {
        delay *= config_.quota_backoff_multiplier;
    }

    delay = std::max(0.0, std::min(delay, cap));
    return std::chrono::milliseconds(static_cast<int64_t>(std::llround(delay)));
}
