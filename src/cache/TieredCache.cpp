#include "TieredCache.hpp"

#include <stdexcept>

#include "../config/AppConfig.hpp"
#include "../interfaces/ILogger.hpp"
#include "../interfaces/IStatsDClient.hpp"

TieredCache::TieredCache(std::vector<CacheTier> tiers,
                         std::shared_ptr<ILogger> logger,
                         std::shared_ptr<IStatsDClient> statsd_client)
    : tiers_(std::move(tiers)), logger_(std::move(logger)), statsd_client_(std::move(statsd_client)) {
    if (!logger_) {
        throw std::invalid_argument("Logger cannot be null for TieredCache");
    }
    if (!statsd_client_) {
        throw std::invalid_argument("StatsDClient cannot be null for TieredCache");
    }
    for (const auto& tier : tiers_) {
        if (!tier.cache) {
            throw std::invalid_argument("Cache tier '" + tier.name + "' has no backing cache");
        }
    }
}

void TieredCache::tierFailed(const CacheTier& tier, const std::string& action, const std::exception& e) {
    logger_->warn("Cache tier '" + tier.name + "' failed on " + action + ": " + e.what());
    statsd_client_->increment(MetricsDefinitions::CACHE_TIER_ERROR);
}

std::optional<std::string> TieredCache::get(const std::string& key) {
    for (size_t i = 0; i < tiers_.size(); ++i) {
        std::optional<std::string> value;
        try {
            value = tiers_[i].cache->get(key);
        } catch (const std::exception& e) {
            tierFailed(tiers_[i], "get", e);
            continue;
        }
        if (!value) {
            continue;
        }

        statsd_client_->increment(MetricsDefinitions::CACHE_HIT_PREFIX + tiers_[i].name);
        if (i > 0) {
            backfill(i, key, *value);
        }
        return value;
    }
    statsd_client_->increment(MetricsDefinitions::CACHE_MISS);
    return std::nullopt;
}

// Outer tiers never outlive the tier the value came from. An unknown remaining
// TTL falls back to each outer tier's default.
void TieredCache::backfill(size_t source, const std::string& key, const std::string& value) {
    int ttl = 0;
    try {
        if (auto left = tiers_[source].cache->remainingTtl(key)) {
            if (*left <= 0) {
                return;
            }
            ttl = *left;
        }
    } catch (const std::exception& e) {
        tierFailed(tiers_[source], "ttl", e);
    }
    for (size_t j = 0; j < source; ++j) {
        try {
            tiers_[j].cache->set(key, value, ttl);
        } catch (const std::exception& e) {
            tierFailed(tiers_[j], "backfill", e);
        }
    }
}

std::optional<int> TieredCache::remainingTtl(const std::string& key) {
    for (const auto& tier : tiers_) {
        try {
            if (auto left = tier.cache->remainingTtl(key)) {
                return left;
            }
        } catch (const std::exception& e) {
            tierFailed(tier, "ttl", e);
        }
    }
    return std::nullopt;
}

bool TieredCache::set(const std::string& key, const std::string& value, int ttl) {
    bool stored = false;
    for (const auto& tier : tiers_) {
        try {
            stored = tier.cache->set(key, value, ttl) || stored;
        } catch (const std::exception& e) {
            tierFailed(tier, "set", e);
        }
    }
    return stored;
}

bool TieredCache::remove(const std::string& key) {
    bool removed = false;
    for (const auto& tier : tiers_) {
        try {
            removed = tier.cache->remove(key) || removed;
        } catch (const std::exception& e) {
            tierFailed(tier, "remove", e);
        }
    }
    return removed;
}

bool TieredCache::clear() {
    bool cleared = true;
    for (const auto& tier : tiers_) {
        try {
            cleared = tier.cache->clear() && cleared;
        } catch (const std::exception& e) {
            tierFailed(tier, "clear", e);
            cleared = false;
        }
    }
    return cleared;
}

bool TieredCache::exists(const std::string& key) {
    for (const auto& tier : tiers_) {
        try {
            if (tier.cache->exists(key)) {
                return true;
            }
        } catch (const std::exception& e) {
            tierFailed(tier, "exists", e);
        }
    }
    return false;
}
