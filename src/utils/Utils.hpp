#ifndef UTILS_HPP
#define UTILS_HPP

#include <algorithm>
#include <chrono>
#include <cstdint>
#include <ctime>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <map>
#include <optional>
#include <set>
#include <sstream>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

#include "../config/AppConfig.hpp"

class Utils {
public:
    // Converts a string to a LogLevel enum
    static LogUtils::LogLevel stringToLogLevel(const std::string& level) {
        if (level == "DEBUG") return LogUtils::LogLevel::DEBUG;
        if (level == "INFO") return LogUtils::LogLevel::INFO;
        if (level == "WARNING" || level == "WARN") return LogUtils::LogLevel::WARN;
        if (level == "CERROR" || level == "ERROR") return LogUtils::LogLevel::CERROR;
        throw std::invalid_argument("Invalid log level: " + level);
    }

    // Helper to parse integer safely
    static std::optional<int> stringToInt(const std::string& str) {
        try {
            size_t pos;
            int val = std::stoi(str, &pos);
            if (pos == str.length()) {
                return val;
            }
        } catch (const std::invalid_argument&) {
        } catch (const std::out_of_range&) {
        }
        return std::nullopt;
    }

    static std::optional<int64_t> stringToInt64(const std::string& str) {
        try {
            size_t pos;
            long long val = std::stoll(str, &pos);
            if (pos == str.length()) {
                return static_cast<int64_t>(val);
            }
        } catch (const std::invalid_argument&) {
        } catch (const std::out_of_range&) {
        }
        return std::nullopt;
    }

    static std::optional<double> stringToDouble(const std::string& str) {
        try {
            size_t pos;
            double val = std::stod(str, &pos);
            if (pos == str.length()) {
                return val;
            }
        } catch (const std::invalid_argument&) {
        } catch (const std::out_of_range&) {
        }
        return std::nullopt;
    }

    // Helper to trim whitespace from start and end of string
    static std::string trim(const std::string& str) {
        size_t first = str.find_first_not_of(" \t\n\r");
        if (std::string::npos == first) return "";
        size_t last = str.find_last_not_of(" \t\n\r");
        return str.substr(first, (last - first + 1));
    }

    // Splits on delimiter, trimming each part and dropping empty ones.
    static std::vector<std::string> split(const std::string& str, char delimiter) {
        std::vector<std::string> parts;
        std::stringstream ss(str);
        std::string part;
        while (std::getline(ss, part, delimiter)) {
            part = trim(part);
            if (!part.empty()) {
                parts.push_back(part);
            }
        }
        return parts;
    }

    // Function to parse key-value pairs from a string (using optional version)
    static std::optional<std::map<std::string, std::string>> parseArguments(const std::vector<std::string>& args) {
        std::map<std::string, std::string> argMap;
        for (const std::string& arg : args) {
            size_t delimiterPos = arg.find('=');
            if (delimiterPos != std::string::npos && delimiterPos > 0) {
                argMap[arg.substr(0, delimiterPos)] = arg.substr(delimiterPos + 1);
            } else {
                std::cerr << "Error: Invalid argument format: '" << arg
                          << "'. Expected non-empty key=value format." << std::endl;
                return std::nullopt;
            }
        }
        return argMap;
    }

    // Reads key=value lines, skipping blanks and '#' comments.
    static std::vector<std::pair<std::string, std::string>> readConfigFile(std::istream& in) {
        std::vector<std::pair<std::string, std::string>> entries;
        std::string line;
        while (std::getline(in, line)) {
            line = trim(line);
            if (line.empty() || line[0] == '#') {
                continue;
            }
            size_t delimiterPos = line.find('=');
            if (delimiterPos != std::string::npos && delimiterPos > 0) {
                entries.emplace_back(trim(line.substr(0, delimiterPos)), trim(line.substr(delimiterPos + 1)));
            } else {
                std::cerr << "Warning: Ignoring malformed config line: '" << line << "'" << std::endl;
            }
        }
        return entries;
    }

    // Applies one top-level (non-dependency) setting. Returns false for
    // unknown keys; invalid values keep the default and print a warning.
    static bool applyConfigValue(AppConfig& config, const std::string& key, const std::string& value) {
        auto warnInvalid = [&key, &value](const char* expected) {
            std::cerr << "Warning: Invalid " << expected << " for " << key << ": '" << value
                      << "'. Keeping default." << std::endl;
        };

        if (key == "daily_limit" || key == "monthly_limit") {
            auto val = stringToInt64(value);
            if (!val || *val < 0) {
                warnInvalid("non-negative integer");
            } else if (key == "daily_limit") {
                config.quota.daily_limit = *val;
            } else {
                config.quota.monthly_limit = *val;
            }
        } else if (key == "quota_cache_ttl") {
            if (auto val = stringToInt(value); val && *val > 0) {
                config.quota.cache_ttl_seconds = *val;
            } else {
                warnInvalid("positive integer");
            }
        } else if (key == "counter_ttl_days") {
            if (auto val = stringToInt(value); val && *val > 0) {
                config.quota.counter_ttl_days = *val;
            } else {
                warnInvalid("positive integer");
            }
        } else if (key == "store_failure_policy") {
            if (value == "fail_open") {
                config.quota.store_failure_policy = StoreFailurePolicy::FailOpen;
            } else if (value == "fail_closed") {
                config.quota.store_failure_policy = StoreFailurePolicy::FailClosed;
            } else {
                warnInvalid("policy (fail_open|fail_closed)");
            }
        } else if (key == "in_memory_cache_max_size") {
            if (auto val = stringToInt(value); val && *val > 0) {
                config.in_memory_cache_max_size = *val;
            } else {
                warnInvalid("positive integer");
            }
        } else if (key == "use_redis") {
            if (auto val = stringToInt(value)) {
                config.use_redis = (*val == 1);
            } else {
                warnInvalid("integer");
            }
        } else if (key == "redis_host") {
            config.redis_host = value;
        } else if (key == "redis_port") {
            if (auto val = stringToInt(value); val && *val > 0 && *val <= 65535) {
                config.redis_port = *val;
            } else {
                warnInvalid("port");
            }
        } else if (key == "redis_key_prefix") {
            config.redis_key_prefix = value;
        } else if (key == "dead_letter_queue_key") {
            config.dead_letter.queue_key = value;
        } else if (key == "error_log_retention_days") {
            if (auto val = stringToInt(value); val && *val > 0) {
                config.dead_letter.retention_days = *val;
            } else {
                warnInvalid("positive integer");
            }
        } else if (key == "notification_channel") {
            config.dead_letter.notification_channel = value;
        } else if (key == "breaker_scope") {
            if (value != "process") {
                std::cerr << "Warning: breaker_scope '" << value
                          << "' is not supported; breaker state is process-local." << std::endl;
            }
            config.breaker_scope = "process";
        } else if (key == "log_level") {
            try {
                config.log_level = stringToLogLevel(value);
            } catch (const std::invalid_argument&) {
                warnInvalid("log level");
            }
        } else if (key == "metrics_batch_size") {
            if (auto val = stringToInt(value); val && *val > 0) {
                config.metrics_batch_size = *val;
            } else {
                warnInvalid("positive integer");
            }
        } else if (key == "metrics_send_interval") {
            if (auto val = stringToInt(value); val && *val > 0) {
                config.metrics_send_interval_in_millis = *val;
            } else {
                warnInvalid("positive integer");
            }
        } else {
            return false;
        }
        return true;
    }

    // Applies "<field>=<value>" to one dependency's settings.
    static bool applyDependencyValue(DependencyConfig& dependency, const std::string& field, const std::string& value) {
        auto warnInvalid = [&dependency, &field, &value](const char* expected) {
            std::cerr << "Warning: Invalid " << expected << " for dependency." << dependency.name << "."
                      << field << ": '" << value << "'. Keeping default." << std::endl;
        };
        auto positiveInt = [&value]() -> std::optional<int> {
            auto val = stringToInt(value);
            if (val && *val > 0) return val;
            return std::nullopt;
        };
        auto nonNegativeInt = [&value]() -> std::optional<int> {
            auto val = stringToInt(value);
            if (val && *val >= 0) return val;
            return std::nullopt;
        };

        if (field == "failure_threshold") {
            if (auto val = positiveInt()) dependency.breaker.failure_threshold = *val;
            else warnInvalid("positive integer");
        } else if (field == "success_threshold") {
            if (auto val = positiveInt()) dependency.breaker.success_threshold = *val;
            else warnInvalid("positive integer");
        } else if (field == "open_timeout_ms") {
            if (auto val = nonNegativeInt()) dependency.breaker.open_timeout = std::chrono::milliseconds(*val);
            else warnInvalid("non-negative integer");
        } else if (field == "half_open_max_calls") {
            if (auto val = nonNegativeInt()) dependency.breaker.half_open_max_calls = *val;
            else warnInvalid("non-negative integer");
        } else if (field == "max_retries") {
            if (auto val = nonNegativeInt()) dependency.retry.max_retries = *val;
            else warnInvalid("non-negative integer");
        } else if (field == "base_delay_ms") {
            if (auto val = nonNegativeInt()) dependency.retry.base_delay = std::chrono::milliseconds(*val);
            else warnInvalid("non-negative integer");
        } else if (field == "max_delay_ms") {
            if (auto val = nonNegativeInt()) dependency.retry.max_delay = std::chrono::milliseconds(*val);
            else warnInvalid("non-negative integer");
        } else if (field == "strategy") {
            if (value == "fixed") dependency.retry.strategy = RetryStrategy::Fixed;
            else if (value == "linear") dependency.retry.strategy = RetryStrategy::Linear;
            else if (value == "exponential") dependency.retry.strategy = RetryStrategy::Exponential;
            else if (value == "jittered") dependency.retry.strategy = RetryStrategy::Jittered;
            else warnInvalid("strategy (fixed|linear|exponential|jittered)");
        } else if (field == "jitter") {
            if (auto val = stringToInt(value)) dependency.retry.jitter = (*val == 1);
            else warnInvalid("integer");
        } else if (field == "quota_backoff_multiplier") {
            if (auto val = stringToDouble(value); val && *val >= 1.0) dependency.retry.quota_backoff_multiplier = *val;
            else warnInvalid("number >= 1");
        } else if (field == "retryable_error_classes") {
            std::set<ErrorClass> classes;
            for (const auto& name : split(value, ',')) {
                auto error_class = errorClassFromString(name);
                if (!error_class) {
                    warnInvalid("error class list");
                    return true;
                }
                classes.insert(*error_class);
            }
            dependency.retry.retryable_error_classes = classes;
        } else if (field.rfind("error_codes.", 0) == 0) {
            auto error_class = errorClassFromString(field.substr(std::string("error_codes.").size()));
            if (!error_class) {
                warnInvalid("error class");
                return true;
            }
            dependency.error_codes[*error_class] = split(value, ',');
        } else {
            return false;
        }
        return true;
    }

    // Applies an ordered list of settings. dependency.default.* entries are
    // applied before named dependencies so those inherit the final defaults.
    static void applySettings(AppConfig& config, const std::vector<std::pair<std::string, std::string>>& settings) {
        static const std::string DEPENDENCY_PREFIX = "dependency.";
        std::vector<std::pair<std::string, std::string>> named;

        auto applyToDependency = [](DependencyConfig& dependency, const std::string& field,
                                    const std::string& value, const std::string& key) {
            if (!applyDependencyValue(dependency, field, value)) {
                std::cerr << "Warning: Unknown dependency setting: " << key << std::endl;
            }
        };

        for (const auto& [key, value] : settings) {
            if (key.rfind(DEPENDENCY_PREFIX, 0) != 0) {
                if (key != "config" && key != "command" && key != "subject" && key != "operation" &&
                    !applyConfigValue(config, key, value)) {
                    std::cerr << "Warning: Unknown configuration key: " << key << std::endl;
                }
                continue;
            }
            std::string rest = key.substr(DEPENDENCY_PREFIX.size());
            size_t dot = rest.find('.');
            if (dot == std::string::npos || dot == 0) {
                std::cerr << "Warning: Expected dependency.<name>.<field>, got: " << key << std::endl;
                continue;
            }
            if (rest.substr(0, dot) == "default") {
                applyToDependency(config.default_dependency, rest.substr(dot + 1), value, key);
            } else {
                named.emplace_back(key, value);
            }
        }

        for (const auto& [key, value] : named) {
            std::string rest = key.substr(DEPENDENCY_PREFIX.size());
            size_t dot = rest.find('.');
            applyToDependency(config.mutableDependencyConfig(rest.substr(0, dot)), rest.substr(dot + 1), value, key);
        }
    }

    // Loads quotaguard.config (or the file named by config=) and then applies
    // the startup arguments on top of it.
    static AppConfig loadConfiguration(const std::map<std::string, std::string>& startupArguments) {
        AppConfig config;
        std::vector<std::pair<std::string, std::string>> settings;

        std::vector<std::string> config_paths;
        auto explicit_path = startupArguments.find("config");
        if (explicit_path != startupArguments.end()) {
            config_paths.push_back(explicit_path->second);
        } else {
            config_paths = {
                Constants::CONFIG_FILE_NAME,
                std::string("../") + Constants::CONFIG_FILE_NAME,
                std::string("/etc/quotaguard/") + Constants::CONFIG_FILE_NAME
            };
        }

        bool config_found = false;
        for (const auto& config_path : config_paths) {
            std::ifstream configFile(config_path);
            if (configFile.is_open()) {
                std::clog << "Reading configuration from " << config_path << "..." << std::endl;
                settings = readConfigFile(configFile);
                config_found = true;
                break;
            }
        }
        if (!config_found) {
            std::cerr << "Warning: Configuration file not found. Using defaults and command-line arguments." << std::endl;
        }

        for (const auto& argument : startupArguments) {
            settings.push_back(argument);
        }
        applySettings(config, settings);
        return config;
    }

    static std::string formatUtc(std::chrono::system_clock::time_point tp, const char* format) {
        std::time_t time = std::chrono::system_clock::to_time_t(tp);
        std::tm tm{};
        gmtime_r(&time, &tm);
        std::ostringstream oss;
        oss << std::put_time(&tm, format);
        return oss.str();
    }

    // "YYYY-MM-DD" in UTC.
    static std::string formatDate(std::chrono::system_clock::time_point tp) {
        return formatUtc(tp, Constants::DATE_FORMAT);
    }

    // "YYYY-MM" in UTC.
    static std::string formatMonth(std::chrono::system_clock::time_point tp) {
        return formatUtc(tp, Constants::MONTH_FORMAT);
    }

    // "YYYY-MM-DDTHH:MM:SS.mmmZ"
    static std::string formatIsoTimestamp(std::chrono::system_clock::time_point tp) {
        auto millis = std::chrono::duration_cast<std::chrono::milliseconds>(
            tp.time_since_epoch()).count() % 1000;
        std::ostringstream oss;
        oss << formatUtc(tp, Constants::TIME_FORMAT) << '.'
            << std::setfill('0') << std::setw(3) << millis << 'Z';
        return oss.str();
    }
};

#endif // UTILS_HPP
