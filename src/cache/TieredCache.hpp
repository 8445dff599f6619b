#ifndef TIEREDCACHE_HPP
#define TIEREDCACHE_HPP

#include <exception>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "../interfaces/CacheInterface.hpp"

class ILogger;
class IStatsDClient;

struct CacheTier {
    std::string name;
    std::shared_ptr<CacheInterface> cache;
};

// Ordered chain of cache tiers, fastest first. A hit in an inner tier is
// copied into every outer tier it missed, with the inner entry's remaining TTL. A tier that throws is treated as a
// miss for that tier only.
class TieredCache : public CacheInterface {
public:
    TieredCache(std::vector<CacheTier> tiers,
                std::shared_ptr<ILogger> logger,
                std::shared_ptr<IStatsDClient> statsd_client);

    bool set(const std::string& key, const std::string& value, int ttl = 0) override;
    std::optional<std::string> get(const std::string& key) override;
    bool remove(const std::string& key) override;
    bool clear() override;
    bool exists(const std::string& key) override;
    std::optional<int> remainingTtl(const std::string& key) override;

    size_t tierCount() const { return tiers_.size(); }

private:
    void backfill(size_t source, const std::string& key, const std::string& value);
    void tierFailed(const CacheTier& tier, const std::string& action, const std::exception& e);

    std::vector<CacheTier> tiers_;
    std::shared_ptr<ILogger> logger_;
    std::shared_ptr<IStatsDClient> statsd_client_;
};

#endif // TIEREDCACHE_HPP
