#ifndef INMEMORYCACHE_HPP
#define INMEMORYCACHE_HPP

#include <chrono>
#include <cstdint>
#include <list>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>

#include "../interfaces/CacheInterface.hpp"
#include "../interfaces/IClock.hpp"

struct CacheEntry {
    std::string value;
    std::chrono::steady_clock::time_point inserted_at;
    int ttl_seconds = 0;

    bool isExpired(std::chrono::steady_clock::time_point now) const {
        return now - inserted_at > std::chrono::seconds(ttl_seconds);
    }
};

struct CacheStats {
    size_t size = 0;
    size_t max_size = 0;
    uint64_t hits = 0;
    uint64_t misses = 0;
    uint64_t evictions = 0;
};

// Bounded in-process cache tier. Entries expire after their TTL and, when the
// cache is full, the least recently accessed entry is evicted (a get counts as
// an access, not only a set).
class InMemoryCache : public CacheInterface {
private:
    std::unordered_map<std::string, CacheEntry> cache_;
    std::list<std::string> lru_list_;   // front = most recently accessed
    std::unordered_map<std::string, std::list<std::string>::iterator> lru_map_;

    std::shared_ptr<IClock> clock_;
    mutable std::mutex mutex_;
    const int default_ttl_seconds_;
    const size_t max_size_;
    uint64_t hits_ = 0;
    uint64_t misses_ = 0;
    uint64_t evictions_ = 0;

    void eraseLocked(const std::string& key);
    void removeExpired();
    void evictIfNeeded();

public:
    explicit InMemoryCache(int default_ttl_seconds = 300,
                           size_t max_size = 1000,
                           std::shared_ptr<IClock> clock = std::make_shared<SystemClock>());

    ~InMemoryCache() override = default;

    bool set(const std::string& key, const std::string& value, int ttl = 0) override;
    std::optional<std::string> get(const std::string& key) override;
    bool remove(const std::string& key) override;
    bool clear() override;
    bool exists(const std::string& key) override;
    std::optional<int> remainingTtl(const std::string& key) override;

    CacheStats stats() const;
};

#endif // INMEMORYCACHE_HPP
