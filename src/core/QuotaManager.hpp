#ifndef QUOTAMANAGER_HPP
#define QUOTAMANAGER_HPP

#include <array>
#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <string>

#include "../config/AppConfig.hpp"
#include "../interfaces/CacheInterface.hpp"
#include "../interfaces/IClock.hpp"
#include "../interfaces/ICounterStore.hpp"
#include "../interfaces/ILogger.hpp"
#include "../interfaces/IStatsDClient.hpp"
#include "../models/QuotaInfo.hpp"
#include "../models/UsageRecord.hpp"

// Per-subject daily and monthly admission control.
//
// The counter store's conditional increment is the only arbiter of whether
// an operation is admitted; caches are read-through conveniences for
// checkFast() and never decide an increment. The daily count lives on the
// day bucket (YYYY-MM-DD) and the monthly count on the month bucket
// (YYYY-MM), both incremented in one conditional write.
class QuotaManager {
public:
    // cache may be null (no caching).
    QuotaManager(std::shared_ptr<ICounterStore> store,
                 std::shared_ptr<CacheInterface> cache,
                 QuotaConfig config,
                 std::shared_ptr<ILogger> logger,
                 std::shared_ptr<IStatsDClient> statsd_client,
                 std::shared_ptr<IClock> clock = std::make_shared<SystemClock>());

    // Read-only check; may be stale by up to cache_ttl_seconds.
    QuotaInfo checkFast(const std::string& subject_id);

    // Admits and records one operation, or rejects without mutating.
    QuotaInfo checkAndIncrement(const std::string& subject_id, const std::string& operation);

    // Authoritative usage read (bypasses the caches). Throws
    // StoreUnavailableError when the counter store cannot be reached.
    UsageStats getUsageStats(const std::string& subject_id);

    // Drops the current bucket's cached entry for one subject, or every
    // cached entry when subject_id is empty.
    bool clearCache(const std::optional<std::string>& subject_id = std::nullopt);

    static std::string cacheKey(const std::string& subject_id, const std::string& bucket_date);

    const QuotaConfig& config() const { return config_; }

private:
    struct Buckets {
        std::string day;
        std::string month;
        std::string timestamp;
    };

    Buckets currentBuckets();
    UsageRecord readUsage(const std::string& subject_id, const Buckets& buckets);
    QuotaInfo evaluate(const UsageRecord& usage, bool cached) const;
    QuotaInfo storeFailure(const std::string& subject_id, const Buckets& buckets, const std::string& message);
    std::optional<UsageRecord> readCache(const std::string& key);
    // A write-back is dropped when the key was invalidated after epoch was
    // taken, so a read that raced an increment never re-caches stale counts.
    uint64_t cacheEpoch(const std::string& key);
    void writeCache(const std::string& key, const UsageRecord& usage, uint64_t epoch);
    void invalidate(const std::string& key);
    size_t stripeOf(const std::string& key) const;

    std::shared_ptr<ICounterStore> store_;
    std::shared_ptr<CacheInterface> cache_;
    QuotaConfig config_;
    std::shared_ptr<ILogger> logger_;
    std::shared_ptr<IStatsDClient> statsd_client_;
    std::shared_ptr<IClock> clock_;

    static constexpr size_t CACHE_STRIPES = 64;
    std::array<std::mutex, CACHE_STRIPES> cache_locks_;
    std::array<uint64_t, CACHE_STRIPES> cache_epochs_{};
};

#endif // QUOTAMANAGER_HPP
