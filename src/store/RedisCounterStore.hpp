#ifndef REDISCOUNTERSTORE_HPP
#define REDISCOUNTERSTORE_HPP

#include <memory>
#include <string>

#include "../interfaces/ICounterStore.hpp"
#include "RedisConnection.hpp"

class ILogger;

// Counter store backed by Redis hashes. The check-and-increment over all
// conditions runs as one server-side Lua script, so concurrent processes
// sharing the Redis instance never overshoot a limit.
class RedisCounterStore : public ICounterStore {
public:
    RedisCounterStore(std::shared_ptr<RedisConnection> connection,
                      std::string key_prefix,
                      std::shared_ptr<ILogger> logger);

    IncrementResult conditionalIncrement(
        const std::vector<CounterCondition>& conditions,
        const IncrementAttributes& attributes) override;

    std::optional<CounterRecord> get(const CounterKey& key) override;

    // "<prefix>usage:{<subject>}:<bucket>"; the hash tag keeps one subject's
    // buckets in the same cluster slot.
    std::string redisKey(const CounterKey& key) const;

private:
    std::shared_ptr<RedisConnection> connection_;
    std::string key_prefix_;
    std::shared_ptr<ILogger> logger_;
};

#endif // REDISCOUNTERSTORE_HPP
