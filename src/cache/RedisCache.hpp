#pragma once

#include <memory>
#include <optional>
#include <string>

#include "../interfaces/CacheInterface.hpp"
#include "../store/RedisConnection.hpp"

class ILogger;

// Shared cache tier in Redis. Every key is namespaced under key_prefix, and
// clear() only deletes keys under that prefix. Connection failures are
// logged and reported as misses / false, never thrown.
class RedisCache : public CacheInterface {
public:
    RedisCache(std::shared_ptr<RedisConnection> connection,
               std::string key_prefix,
               int default_ttl_seconds,
               std::shared_ptr<ILogger> logger);
    ~RedisCache() override = default;

    bool set(const std::string& key, const std::string& value, int ttl = 0) override;
    std::optional<std::string> get(const std::string& key) override;
    bool remove(const std::string& key) override;
    bool clear() override;
    bool exists(const std::string& key) override;

    std::optional<int> remainingTtl(const std::string& key) override;

    bool isConnected() const;

private:
    std::string prefixed(const std::string& key) const { return key_prefix_ + key; }

    std::shared_ptr<RedisConnection> connection_;
    std::string key_prefix_;
    int default_ttl_seconds_;
    std::shared_ptr<ILogger> logger_;
};
