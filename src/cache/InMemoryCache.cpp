#include "InMemoryCache.hpp"

#include <stdexcept>

InMemoryCache::InMemoryCache(int default_ttl_seconds, size_t max_size, std::shared_ptr<IClock> clock)
    : clock_(std::move(clock)), default_ttl_seconds_(default_ttl_seconds), max_size_(max_size) {
    if (!clock_) {
        throw std::invalid_argument("Clock cannot be null for InMemoryCache");
    }
    if (max_size_ == 0) {
        throw std::invalid_argument("InMemoryCache max_size must be positive");
    }
}

bool InMemoryCache::set(const std::string& key, const std::string& value, int ttl) {
    std::lock_guard<std::mutex> lock(mutex_);

    CacheEntry entry;
    entry.value = value;
    entry.inserted_at = clock_->now();
    entry.ttl_seconds = (ttl > 0) ? ttl : default_ttl_seconds_;

    auto lru_it = lru_map_.find(key);
    if (lru_it != lru_map_.end()) {
        lru_list_.erase(lru_it->second);
    } else {
        evictIfNeeded();
    }

    cache_[key] = entry;
    lru_list_.push_front(key);
    lru_map_[key] = lru_list_.begin();
    return true;
}

std::optional<std::string> InMemoryCache::get(const std::string& key) {
    std::lock_guard<std::mutex> lock(mutex_);

    auto cache_it = cache_.find(key);
    if (cache_it == cache_.end()) {
        ++misses_;
        return std::nullopt;
    }
    if (cache_it->second.isExpired(clock_->now())) {
        // Expired entries behave as absent and are dropped on access.
        eraseLocked(key);
        ++misses_;
        return std::nullopt;
    }

    lru_list_.splice(lru_list_.begin(), lru_list_, lru_map_[key]);
    ++hits_;
    return cache_it->second.value;
}

bool InMemoryCache::remove(const std::string& key) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (cache_.find(key) == cache_.end()) {
        return false;
    }
    eraseLocked(key);
    return true;
}

bool InMemoryCache::clear() {
    std::lock_guard<std::mutex> lock(mutex_);
    cache_.clear();
    lru_list_.clear();
    lru_map_.clear();
    return true;
}

bool InMemoryCache::exists(const std::string& key) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = cache_.find(key);
    return it != cache_.end() && !it->second.isExpired(clock_->now());
}

std::optional<int> InMemoryCache::remainingTtl(const std::string& key) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = cache_.find(key);
    auto now = clock_->now();
    if (it == cache_.end() || it->second.isExpired(now)) {
        return std::nullopt;
    }
    auto left = it->second.inserted_at + std::chrono::seconds(it->second.ttl_seconds) - now;
    return static_cast<int>(std::chrono::duration_cast<std::chrono::seconds>(left).count());
}

CacheStats InMemoryCache::stats() const {
    std::lock_guard<std::mutex> lock(mutex_);
    CacheStats stats;
    stats.size = cache_.size();
    stats.max_size = max_size_;
    stats.hits = hits_;
    stats.misses = misses_;
    stats.evictions = evictions_;
    return stats;
}

// Caller holds mutex_.
void InMemoryCache::eraseLocked(const std::string& key) {
    auto lru_it = lru_map_.find(key);
    if (lru_it != lru_map_.end()) {
        lru_list_.erase(lru_it->second);
        lru_map_.erase(lru_it);
    }
    cache_.erase(key);
}

// Caller holds mutex_.
void InMemoryCache::removeExpired() {
    auto now = clock_->now();
    for (auto it = cache_.begin(); it != cache_.end(); ) {
        if (it->second.isExpired(now)) {
            auto lru_it = lru_map_.find(it->first);
            if (lru_it != lru_map_.end()) {
                lru_list_.erase(lru_it->second);
                lru_map_.erase(lru_it);
            }
            it = cache_.erase(it);
        } else {
            ++it;
        }
    }
}

// Caller holds mutex_. Makes room for one new key: expired entries go first,
// then least recently accessed ones.
void InMemoryCache::evictIfNeeded() {
    if (cache_.size() < max_size_) {
        return;
    }
    removeExpired();
    while (cache_.size() >= max_size_ && !lru_list_.empty()) {
        std::string oldest_key = lru_list_.back();
        lru_list_.pop_back();
        lru_map_.erase(oldest_key);
        cache_.erase(oldest_key);
        ++evictions_;
    }
}
