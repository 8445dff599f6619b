#include <memory>
#include <sstream>
#include <stdexcept>

#include "StatsDClient.hpp"

std::shared_ptr<StatsDClient> StatsDClient::instance = nullptr;
std::once_flag StatsDClient::init_flag;

std::shared_ptr<StatsDClient> StatsDClient::getInstance(
    const AppConfig& config,
    std::shared_ptr<ILogger> logger,
    const std::string& statsd_address) {
    std::call_once(init_flag, [&config, &logger, &statsd_address]() {
        instance = std::shared_ptr<StatsDClient>(new StatsDClient(config, logger, statsd_address));
    });
    return instance;
}

StatsDClient::StatsDClient(
    const AppConfig& config,
    std::shared_ptr<ILogger> logger,
    const std::string& statsd_address) : logger_(std::move(logger)), udp_sender_(nullptr) {
    if (!logger_) {
        throw std::invalid_argument("Logger cannot be null for StatsDClient");
    }
    auto colon_pos = statsd_address.find(':');
    if (colon_pos == std::string::npos) {
        throw std::runtime_error("STATSD_SERVER must be in the format <host>:<port>");
    }

    std::string host = statsd_address.substr(0, colon_pos);
    if (host == "localhost") {
        host = "127.0.0.1";
    }

    uint16_t port;
    try {
        port = static_cast<uint16_t>(std::stoi(statsd_address.substr(colon_pos + 1)));
    } catch (const std::exception& e) {
        throw std::runtime_error("Invalid port in STATSD_SERVER: " + std::string(e.what()));
    }

    try {
        udp_sender_ = std::make_unique<Statsd::UDPSender>(
            host, port, config.metrics_batch_size, config.metrics_send_interval_in_millis);
        logger_->setup("StatsD metrics sent to " + host + ":" + std::to_string(port));
    } catch (const std::exception& e) {
        throw std::runtime_error("Failed to initialize UDPSender: " + std::string(e.what()));
    }
}

StatsDClient::~StatsDClient() {
    logger_->debug("StatsDClient destroyed.");
}

void StatsDClient::send(const std::string& key, const std::string& value, const char* type) {
    if (!udp_sender_) {
        logger_->error("StatsDClient: UDPSender is not initialized, dropping metric " + key);
        return;
    }
    std::stringstream ss;
    ss << METRIC_PREFIX << key << ":" << value << "|" << type;
    try {
        udp_sender_->send(ss.str());
    } catch (const std::exception& e) {
        logger_->error("StatsDClient: Failed to send UDP message: " + std::string(e.what()));
    }
}

void StatsDClient::increment(const std::string& key, int value) {
    send(key, std::to_string(value), "c");
}

void StatsDClient::decrement(const std::string& key, int value) {
    increment(key, -value);
}

void StatsDClient::gauge(const std::string& key, double value) {
    std::stringstream ss;
    ss << value;
    send(key, ss.str(), "g");
}

void StatsDClient::timing(const std::string& key, std::chrono::milliseconds value) {
    send(key, std::to_string(value.count()), "ms");
}

void StatsDClient::set(const std::string& key, const std::string& value) {
    send(key, value, "s");
}
