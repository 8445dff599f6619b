#ifndef APPCONFIG_HPP
#define APPCONFIG_HPP

#include <cstdint>
#include <iostream>
#include <map>
#include <string>
#include <sstream>

#include "DependencyConfig.hpp"

namespace LogUtils {
    enum LogLevel {
        DEBUG = 0,
        INFO = 1,
        WARN = 2,
        CERROR = 3,
        SETUP = 4
    };

    static std::string DEBUG_LOG_PREFIX = "[Debug] ";
    static std::string INFO_LOG_PREFIX = "[Info] ";
    static std::string WARN_LOG_PREFIX = "[Warning] ";
    static std::string CERROR_LOG_PREFIX = "[Error] ";
    static std::string SETUP_LOG_PREFIX = "[Setup] ";
}

namespace MetricsDefinitions {
    static std::string QUOTA_ALLOWED = "quota.allowed";
    static std::string QUOTA_REJECTED_DAILY = "quota.rejected.daily";
    static std::string QUOTA_REJECTED_MONTHLY = "quota.rejected.monthly";
    static std::string QUOTA_REJECTED_UNKNOWN = "quota.rejected.unknown";
    static std::string QUOTA_TRACKING_ERROR = "quota.tracking_error";

    static std::string CACHE_HIT_PREFIX = "cache.hit.";
    static std::string CACHE_MISS = "cache.miss";
    static std::string CACHE_TIER_ERROR = "cache.tier_error";

    static std::string BREAKER_OPENED = "breaker.opened";
    static std::string BREAKER_CLOSED = "breaker.closed";
    static std::string BREAKER_REJECTED = "breaker.rejected";

    static std::string RETRY_ATTEMPTED = "retry.attempted";
    static std::string RETRY_RECOVERED = "retry.recovered";
    static std::string RETRY_EXHAUSTED = "retry.exhausted";
    static std::string OPERATION_LATENCY = "operation.latency";

    static std::string DEAD_LETTER_ROUTED = "dlq.routed";
    static std::string DEAD_LETTER_ROUTE_FAILED = "dlq.route_failed";
}

namespace Constants {
    static constexpr auto DATE_FORMAT = "%Y-%m-%d";
    static constexpr auto MONTH_FORMAT = "%Y-%m";
    static constexpr auto TIME_FORMAT = "%Y-%m-%dT%H:%M:%S";
    static constexpr auto CONFIG_FILE_NAME = "quotaguard.config";
    static constexpr auto DAILY_COUNT_FIELD = "daily_count";
    static constexpr auto MONTHLY_COUNT_FIELD = "monthly_count";
};

enum class StoreFailurePolicy {
    FailOpen,   // Allow the operation, report the tracking error
    FailClosed  // Deny the operation, report the tracking error
};

inline std::string storeFailurePolicyToString(StoreFailurePolicy policy) {
    return policy == StoreFailurePolicy::FailOpen ? "fail_open" : "fail_closed";
}

struct QuotaConfig {
    int64_t daily_limit = 50;
    int64_t monthly_limit = 1000;
    int cache_ttl_seconds = 300;
    int counter_ttl_days = 32;
    StoreFailurePolicy store_failure_policy = StoreFailurePolicy::FailOpen;
};

struct DeadLetterConfig {
    std::string queue_key = "dead_letter";
    std::string error_log_prefix = "error_log:";
    std::string notification_channel = "error_notifications";
    int retention_days = 30;
};

// --- Configuration Struct ---
class AppConfig {
public:
    QuotaConfig quota;
    DeadLetterConfig dead_letter;

    // Cache / store configuration
    bool use_redis;
    std::string redis_host;
    int redis_port;
    std::string redis_key_prefix;
    int in_memory_cache_max_size;

    // Only process-local breaker state is supported.
    std::string breaker_scope;

    // Logging Level
    LogUtils::LogLevel log_level;

    // Metrics
    int metrics_batch_size;
    int metrics_send_interval_in_millis;

    // Per-dependency breaker/retry settings; "default" covers unknown names.
    DependencyConfig default_dependency;
    std::map<std::string, DependencyConfig> dependencies;

    AppConfig() {
        use_redis = false;
        redis_host = "localhost";
        redis_port = 6379;
        redis_key_prefix = "quotaguard:";
        in_memory_cache_max_size = 1000;
        breaker_scope = "process";
        log_level = LogUtils::LogLevel::CERROR;
        metrics_batch_size = 100;
        metrics_send_interval_in_millis = 1000;
    }

    // Returns the named dependency's settings, or the defaults renamed to it.
    DependencyConfig dependencyConfig(const std::string& name) const {
        auto it = dependencies.find(name);
        if (it != dependencies.end()) {
            return it->second;
        }
        DependencyConfig fallback = default_dependency;
        fallback.name = name;
        return fallback;
    }

    // Creates the named entry from the defaults on first access.
    DependencyConfig& mutableDependencyConfig(const std::string& name) {
        auto it = dependencies.find(name);
        if (it == dependencies.end()) {
            DependencyConfig created = default_dependency;
            created.name = name;
            it = dependencies.emplace(name, std::move(created)).first;
        }
        return it->second;
    }

    std::string to_string() const {
        std::stringstream ss;
        ss << "// --- Configuration Params Start --- //" << std::endl
            << "// --- Quota --- //" << std::endl
            << "daily_limit: " << quota.daily_limit << std::endl
            << "monthly_limit: " << quota.monthly_limit << std::endl
            << "quota_cache_ttl: " << quota.cache_ttl_seconds << std::endl
            << "counter_ttl_days: " << quota.counter_ttl_days << std::endl
            << "store_failure_policy: " << storeFailurePolicyToString(quota.store_failure_policy) << std::endl
            << "// --- Cache / Store Configuration --- //" << std::endl
            << "use_redis: " << std::boolalpha << use_redis << std::noboolalpha << std::endl
            << "redis_host: " << redis_host << std::endl
            << "redis_port: " << redis_port << std::endl
            << "redis_key_prefix: " << redis_key_prefix << std::endl
            << "in_memory_cache_max_size: " << in_memory_cache_max_size << std::endl
            << "// --- Dead Letter --- //" << std::endl
            << "dead_letter_queue_key: " << dead_letter.queue_key << std::endl
            << "error_log_retention_days: " << dead_letter.retention_days << std::endl
            << "notification_channel: " << dead_letter.notification_channel << std::endl
            << "// --- Logging & Metrics --- //" << std::endl
            << "log_level: " << static_cast<int>(log_level) << std::endl
            << "metrics_batch_size: " << metrics_batch_size << std::endl
            << "metrics_send_interval_in_millis: " << metrics_send_interval_in_millis << std::endl
            << "// --- Dependencies (breaker_scope: " << breaker_scope << ") --- //" << std::endl
            << default_dependency.to_string() << std::endl;
        for (const auto& [name, dependency] : dependencies) {
            ss << dependency.to_string() << std::endl;
        }
        ss << "// --- Configuration Params End --- //" << std::endl;
        return ss.str();
    }
};

#endif // APPCONFIG_HPP
