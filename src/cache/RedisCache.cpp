#include <stdexcept>

#include <hiredis/hiredis.h>

#include "RedisCache.hpp"
#include "../interfaces/ILogger.hpp"
#include "../models/ResilienceErrors.hpp"

RedisCache::RedisCache(std::shared_ptr<RedisConnection> connection,
                       std::string key_prefix,
                       int default_ttl_seconds,
                       std::shared_ptr<ILogger> logger)
    : connection_(std::move(connection)),
      key_prefix_(std::move(key_prefix)),
      default_ttl_seconds_(default_ttl_seconds),
      logger_(std::move(logger)) {
    if (!connection_) {
        throw std::invalid_argument("Redis connection cannot be null for RedisCache");
    }
    if (!logger_) {
        throw std::invalid_argument("Logger cannot be null for RedisCache");
    }
}

bool RedisCache::set(const std::string& key, const std::string& value, int ttl) {
    int effective_ttl = ttl > 0 ? ttl : default_ttl_seconds_;
    try {
        RedisReplyPtr reply;
        if (effective_ttl > 0) {
            reply = connection_->command({"SETEX", prefixed(key), std::to_string(effective_ttl), value});
        } else {
            reply = connection_->command({"SET", prefixed(key), value});
        }
        return reply->type != REDIS_REPLY_ERROR;
    } catch (const StoreUnavailableError& e) {
        logger_->error("Redis cache SET failed for key " + key + ": " + e.what());
        return false;
    }
}

std::optional<std::string> RedisCache::get(const std::string& key) {
    try {
        RedisReplyPtr reply = connection_->command({"GET", prefixed(key)});
        if (reply->type == REDIS_REPLY_STRING) {
            return std::string(reply->str, reply->len);
        }
        return std::nullopt;
    } catch (const StoreUnavailableError& e) {
        logger_->error("Redis cache GET failed for key " + key + ": " + e.what());
        return std::nullopt;
    }
}

std::optional<int> RedisCache::remainingTtl(const std::string& key) {
    try {
        // -2: no such key, -1: no expiry.
        RedisReplyPtr reply = connection_->command({"TTL", prefixed(key)});
        if (reply->type == REDIS_REPLY_INTEGER && reply->integer >= 0) {
            return static_cast<int>(reply->integer);
        }
        return std::nullopt;
    } catch (const StoreUnavailableError& e) {
        logger_->error("Redis cache TTL failed for key " + key + ": " + e.what());
        return std::nullopt;
    }
}

bool RedisCache::remove(const std::string& key) {
    try {
        RedisReplyPtr reply = connection_->command({"DEL", prefixed(key)});
        return reply->type == REDIS_REPLY_INTEGER && reply->integer > 0;
    } catch (const StoreUnavailableError& e) {
        logger_->error("Redis cache DEL failed for key " + key + ": " + e.what());
        return false;
    }
}

bool RedisCache::clear() {
    // SCAN instead of KEYS/FLUSHALL: the Redis instance is shared with the
    // counter store and other tenants.
    try {
        std::string cursor = "0";
        size_t deleted = 0;
        do {
            RedisReplyPtr reply = connection_->command(
                {"SCAN", cursor, "MATCH", key_prefix_ + "*", "COUNT", "500"});
            if (reply->type != REDIS_REPLY_ARRAY || reply->elements != 2) {
                logger_->error("Unexpected SCAN reply while clearing " + key_prefix_ + "*");
                return false;
            }
            cursor.assign(reply->element[0]->str, reply->element[0]->len);
            const redisReply* keys = reply->element[1];
            if (keys->elements > 0) {
                std::vector<std::string> del{"DEL"};
                for (size_t i = 0; i < keys->elements; ++i) {
                    del.emplace_back(keys->element[i]->str, keys->element[i]->len);
                }
                connection_->command(del);
                deleted += keys->elements;
            }
        } while (cursor != "0");
        logger_->debug("Cleared " + std::to_string(deleted) + " Redis cache keys under " + key_prefix_);
        return true;
    } catch (const StoreUnavailableError& e) {
        logger_->error("Redis cache clear failed for prefix " + key_prefix_ + ": " + e.what());
        return false;
    }
}

bool RedisCache::exists(const std::string& key) {
    try {
        RedisReplyPtr reply = connection_->command({"EXISTS", prefixed(key)});
        return reply->type == REDIS_REPLY_INTEGER && reply->integer > 0;
    } catch (const StoreUnavailableError& e) {
        logger_->error("Redis cache EXISTS failed for key " + key + ": " + e.what());
        return false;
    }
}

bool RedisCache::isConnected() const {
    return connection_->isConnected();
}
