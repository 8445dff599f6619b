#include "RedisCounterStore.hpp"

#include <stdexcept>

#include <hiredis/hiredis.h>

#include "../interfaces/ILogger.hpp"
#include "../models/ResilienceErrors.hpp"

namespace {

// KEYS[i]: counter hash of condition i.
// ARGV[1]: operation, ARGV[2]: timestamp, ARGV[3]: ttl seconds,
// ARGV[2+2i]: field of condition i, ARGV[3+2i]: limit of condition i.
// Returns {0} when any condition fails, otherwise {1, new values...}.
const char* CONDITIONAL_INCREMENT_SCRIPT = R"LUA(
local n = #KEYS
for i = 1, n do
    local current = tonumber(redis.call('HGET', KEYS[i], ARGV[2 + 2 * i]) or '0')
    if current >= tonumber(ARGV[3 + 2 * i]) then
        return {0}
    end
end
local result = {1}
for i = 1, n do
    local value = redis.call('HINCRBY', KEYS[i], ARGV[2 + 2 * i], 1)
    redis.call('HSET', KEYS[i], 'last_operation', ARGV[1], 'last_updated', ARGV[2])
    if tonumber(ARGV[3]) > 0 then
        redis.call('EXPIRE', KEYS[i], ARGV[3])
    end
    table.insert(result, value)
end
return result
)LUA";

const std::string LAST_OPERATION_FIELD = "last_operation";
const std::string LAST_UPDATED_FIELD = "last_updated";

} // namespace

RedisCounterStore::RedisCounterStore(std::shared_ptr<RedisConnection> connection,
                                     std::string key_prefix,
                                     std::shared_ptr<ILogger> logger)
    : connection_(std::move(connection)), key_prefix_(std::move(key_prefix)), logger_(std::move(logger)) {
    if (!connection_) {
        throw std::invalid_argument("Redis connection cannot be null for RedisCounterStore");
    }
    if (!logger_) {
        throw std::invalid_argument("Logger cannot be null for RedisCounterStore");
    }
}

std::string RedisCounterStore::redisKey(const CounterKey& key) const {
    return key_prefix_ + "usage:{" + key.subject_id + "}:" + key.bucket;
}

IncrementResult RedisCounterStore::conditionalIncrement(
    const std::vector<CounterCondition>& conditions,
    const IncrementAttributes& attributes) {
    IncrementResult result;
    if (conditions.empty()) {
        result.applied = true;
        return result;
    }

    std::vector<std::string> args{"EVAL", CONDITIONAL_INCREMENT_SCRIPT, std::to_string(conditions.size())};
    for (const auto& condition : conditions) {
        args.push_back(redisKey(condition.key));
    }
    args.push_back(attributes.operation);
    args.push_back(attributes.timestamp);
    args.push_back(std::to_string(attributes.ttl.count()));
    for (const auto& condition : conditions) {
        args.push_back(condition.field);
        args.push_back(std::to_string(condition.limit));
    }

    RedisReplyPtr reply = connection_->command(args);
    if (reply->type != REDIS_REPLY_ARRAY || reply->elements < 1 ||
        reply->element[0]->type != REDIS_REPLY_INTEGER) {
        throw StoreUnavailableError("Unexpected reply to conditional increment for " +
                                    conditions.front().key.to_string());
    }

    if (reply->element[0]->integer == 0) {
        return result;
    }

    if (reply->elements != conditions.size() + 1) {
        throw StoreUnavailableError("Conditional increment returned " +
                                    std::to_string(reply->elements - 1) + " values for " +
                                    std::to_string(conditions.size()) + " conditions");
    }
    for (size_t i = 0; i < conditions.size(); ++i) {
        result.new_values[conditions[i].field] = reply->element[i + 1]->integer;
    }
    result.applied = true;
    logger_->debug("Incremented usage counters for " + conditions.front().key.subject_id);
    return result;
}

std::optional<CounterRecord> RedisCounterStore::get(const CounterKey& key) {
    RedisReplyPtr reply = connection_->command({"HGETALL", redisKey(key)});
    if (reply->type != REDIS_REPLY_ARRAY) {
        throw StoreUnavailableError("Unexpected reply to HGETALL for " + key.to_string());
    }
    if (reply->elements == 0) {
        return std::nullopt;
    }

    CounterRecord record;
    for (size_t i = 0; i + 1 < reply->elements; i += 2) {
        std::string field(reply->element[i]->str, reply->element[i]->len);
        std::string value(reply->element[i + 1]->str, reply->element[i + 1]->len);
        if (field == LAST_OPERATION_FIELD) {
            record.last_operation = value;
        } else if (field == LAST_UPDATED_FIELD) {
            record.last_updated = value;
        } else {
            try {
                record.fields[field] = std::stoll(value);
            } catch (const std::exception&) {
                logger_->warn("Ignoring non-numeric counter field '" + field + "' in " + redisKey(key));
            }
        }
    }
    return record;
}
