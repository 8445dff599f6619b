#include <cstdlib>
#include <iostream>
#include <map>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "cache/InMemoryCache.hpp"
#include "cache/RedisCache.hpp"
#include "cache/TieredCache.hpp"
#include "config/AppConfig.hpp"
#include "core/QuotaManager.hpp"
#include "core/ResilienceGateway.hpp"
#include "logging/ConsoleLogger.hpp"
#include "metrics/DummyStatsDClient.hpp"
#include "metrics/StatsDClient.hpp"
#include "store/InMemoryCounterStore.hpp"
#include "store/RedisConnection.hpp"
#include "store/RedisCounterStore.hpp"
#include "utils/Utils.hpp"

using json = nlohmann::json;

namespace {
    constexpr int EXIT_OK = 0;
    constexpr int EXIT_USAGE_ERROR = 1;
    constexpr int EXIT_QUOTA_DENIED = 2;

    const char* USAGE =
        "usage: quotaguardctl command=<check|consume|usage|clear-cache|health> "
        "[subject=<id>] [operation=<name>] [config=<path>] [key=value ...]";
}

// --- Helper Function to Initialize StatsD Client ---
std::shared_ptr<IStatsDClient> initializeStatsDClient(const AppConfig& config, std::shared_ptr<ILogger> logger_) {
    std::string statsd_server_endpoint;
    const char* statsd_server_value = std::getenv("STATSD_SERVER");
    if (statsd_server_value != nullptr) {
        statsd_server_endpoint = std::string(statsd_server_value);
    }

    if (statsd_server_endpoint.empty()) {
        logger_->debug("STATSD_SERVER not set, metrics disabled.");
        return DummyStatsDClient::getInstance();
    }
    try {
        return StatsDClient::getInstance(config, logger_, statsd_server_endpoint);
    } catch (const std::exception& e) {
        logger_->error("StatsDClient failed to get created (" + std::string(e.what()) +
                       "). Creating DummyStatsDClient instance.");
    }
    return DummyStatsDClient::getInstance();
}

// --- Helper Function to Connect Redis (null when disabled or unreachable) ---
std::shared_ptr<RedisConnection> initializeRedis(const AppConfig& config, std::shared_ptr<ILogger> logger_) {
    if (!config.use_redis) {
        return nullptr;
    }
    auto connection = std::make_shared<RedisConnection>(config.redis_host, config.redis_port, logger_);
    if (!connection->isConnected()) {
        logger_->warn("Redis unreachable at " + config.redis_host + ":" + std::to_string(config.redis_port) +
                      ", falling back to process-local store and cache.");
        return nullptr;
    }
    logger_->debug("Redis connected at " + config.redis_host + ":" + std::to_string(config.redis_port));
    return connection;
}

// --- Helper Function to Initialize the Cache Tiers ---
std::shared_ptr<CacheInterface> initializeCache(const AppConfig& config,
                                                std::shared_ptr<RedisConnection> redis,
                                                std::shared_ptr<ILogger> logger_,
                                                std::shared_ptr<IStatsDClient> statsd_client) {
    std::vector<CacheTier> tiers;
    tiers.push_back({"memory", std::make_shared<InMemoryCache>(
        config.quota.cache_ttl_seconds, static_cast<size_t>(config.in_memory_cache_max_size))});
    if (redis) {
        tiers.push_back({"redis", std::make_shared<RedisCache>(
            redis, config.redis_key_prefix + "cache:", config.quota.cache_ttl_seconds, logger_)});
    }
    return std::make_shared<TieredCache>(std::move(tiers), logger_, statsd_client);
}

std::shared_ptr<ICounterStore> initializeCounterStore(const AppConfig& config,
                                                      std::shared_ptr<RedisConnection> redis,
                                                      std::shared_ptr<ILogger> logger_) {
    if (redis) {
        return std::make_shared<RedisCounterStore>(redis, config.redis_key_prefix, logger_);
    }
    logger_->warn("Using process-local counter store; usage is not shared between processes.");
    return std::make_shared<InMemoryCounterStore>();
}

std::optional<std::string> argument(const std::map<std::string, std::string>& args, const std::string& key) {
    auto it = args.find(key);
    if (it == args.end() || it->second.empty()) {
        return std::nullopt;
    }
    return it->second;
}

// --- Main Function ---
int main(int argc, char** argv) {
    try {
        std::vector<std::string> args_vec;
        for (int i = 1; i < argc; ++i) {
            args_vec.push_back(argv[i]);
        }

        std::optional<std::map<std::string, std::string>> parsedArgsOpt = Utils::parseArguments(args_vec);
        if (!parsedArgsOpt) {
            std::cerr << USAGE << std::endl;
            return EXIT_USAGE_ERROR;
        }
        std::map<std::string, std::string> startupArguments = parsedArgsOpt.value();

        auto command = argument(startupArguments, "command");
        if (!command) {
            std::cerr << USAGE << std::endl;
            return EXIT_USAGE_ERROR;
        }
        auto subject = argument(startupArguments, "subject");
        bool needs_subject = *command == "check" || *command == "consume" || *command == "usage";
        if (needs_subject && !subject) {
            std::cerr << "Error: command '" << *command << "' requires subject=<id>" << std::endl;
            return EXIT_USAGE_ERROR;
        }

        AppConfig config_ = Utils::loadConfiguration(startupArguments);

        std::shared_ptr<ILogger> logger_ = ConsoleLogger::getInstance(config_.log_level);
        logger_->debug("Configuration loaded.\n" + config_.to_string());

        std::shared_ptr<IStatsDClient> statsd_client = initializeStatsDClient(config_, logger_);
        std::shared_ptr<RedisConnection> redis = initializeRedis(config_, logger_);

        auto quota_manager = std::make_shared<QuotaManager>(
            initializeCounterStore(config_, redis, logger_),
            initializeCache(config_, redis, logger_, statsd_client),
            config_.quota, logger_, statsd_client);

        json output;
        int exit_code = EXIT_OK;

        if (*command == "check" || *command == "consume") {
            QuotaInfo info = *command == "check"
                ? quota_manager->checkFast(*subject)
                : quota_manager->checkAndIncrement(*subject, argument(startupArguments, "operation").value_or("cli"));
            output = info.toJson();
            if (!info.allowed) {
                exit_code = EXIT_QUOTA_DENIED;
            }
        } else if (*command == "usage") {
            output = quota_manager->getUsageStats(*subject).toJson();
        } else if (*command == "clear-cache") {
            bool cleared = quota_manager->clearCache(subject);
            output = json{{"cleared", cleared}, {"subject", subject ? json(*subject) : json(nullptr)}};
        } else if (*command == "health") {
            output = ResilienceGateway::configurationReport(config_);
            bool redis_ok = !config_.use_redis || redis != nullptr;
            output["redis"] = config_.use_redis ? json(redis != nullptr) : json("disabled");
            output["status"] = redis_ok ? "ok" : "redis_unreachable";
        } else {
            std::cerr << "Error: unknown command '" << *command << "'\n" << USAGE << std::endl;
            return EXIT_USAGE_ERROR;
        }

        std::cout << output.dump(2) << std::endl;
        return exit_code;
    } catch (const StoreUnavailableError& e) {
        ConsoleLogger::getInstance(LogUtils::LogLevel::CERROR)->error("Counter store unavailable: " + std::string(e.what()));
        return EXIT_USAGE_ERROR;
    } catch (const std::exception& e) {
        ConsoleLogger::getInstance(LogUtils::LogLevel::CERROR)->error("Unhandled exception: " + std::string(e.what()));
        return EXIT_USAGE_ERROR;
    }
}
