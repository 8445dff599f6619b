#pragma once

#include <memory>
#include <mutex>

#include "../interfaces/IStatsDClient.hpp"

// Used when no StatsD endpoint is configured; every call is a no-op.
class DummyStatsDClient : public IStatsDClient {
public:
    static std::shared_ptr<DummyStatsDClient> getInstance();
    ~DummyStatsDClient() override = default;

    void increment(const std::string&, int = 1) override {}
    void decrement(const std::string&, int = 1) override {}
    void gauge(const std::string&, double) override {}
    void timing(const std::string&, std::chrono::milliseconds) override {}
    void set(const std::string&, const std::string&) override {}

private:
    DummyStatsDClient() = default;

    static std::shared_ptr<DummyStatsDClient> instance;
    static std::once_flag init_flag;

    DummyStatsDClient(const DummyStatsDClient&) = delete;
    DummyStatsDClient& operator=(const DummyStatsDClient&) = delete;
};
