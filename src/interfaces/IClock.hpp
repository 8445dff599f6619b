#pragma once

#include <chrono>

// Time source for breaker timeouts, cache expiry and bucket dates.
class IClock {
public:
    virtual ~IClock() = default;

    // Monotonic time, used for durations.
    virtual std::chrono::steady_clock::time_point now() = 0;

    // Wall-clock time, used for bucket dates and record timestamps.
    virtual std::chrono::system_clock::time_point wallNow() = 0;
};

class SystemClock : public IClock {
public:
    std::chrono::steady_clock::time_point now() override {
        return std::chrono::steady_clock::now();
    }

    std::chrono::system_clock::time_point wallNow() override {
        return std::chrono::system_clock::now();
    }
};
