#pragma once

#include <chrono>
#include <cstdint>
#include <memory>
#include <mutex>
#include <string>

#include <cpp-statsd-client/UDPSender.hpp>

#include "../config/AppConfig.hpp"
#include "../interfaces/ILogger.hpp"
#include "../interfaces/IStatsDClient.hpp"

// UDP StatsD client. Every metric name is sent as "quotaguard.<key>".
class StatsDClient : public IStatsDClient {
public:
    static constexpr auto METRIC_PREFIX = "quotaguard.";

    // statsd_address is "<host>:<port>"; throws std::runtime_error when malformed.
    static std::shared_ptr<StatsDClient> getInstance(
        const AppConfig& config,
        std::shared_ptr<ILogger> logger,
        const std::string& statsd_address);
    ~StatsDClient();

    void increment(const std::string& key, int value = 1) override;
    void decrement(const std::string& key, int value = 1) override;
    void gauge(const std::string& key, double value) override;
    void timing(const std::string& key, std::chrono::milliseconds value) override;
    void set(const std::string& key, const std::string& value) override;

private:
    StatsDClient(
        const AppConfig& config,
        std::shared_ptr<ILogger> logger,
        const std::string& statsd_address);
    void send(const std::string& key, const std::string& value, const char* type);

    std::shared_ptr<ILogger> logger_;
    std::unique_ptr<Statsd::UDPSender> udp_sender_;

    static std::shared_ptr<StatsDClient> instance;
    static std::once_flag init_flag;

    StatsDClient(const StatsDClient&) = delete;
    StatsDClient& operator=(const StatsDClient&) = delete;
    StatsDClient(StatsDClient&&) = delete;
    StatsDClient& operator=(StatsDClient&&) = delete;
};
