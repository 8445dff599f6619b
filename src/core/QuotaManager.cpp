#include "QuotaManager.hpp"

#include <algorithm>
#include <functional>
#include <stdexcept>

#include "../models/ResilienceErrors.hpp"
#include "../utils/Utils.hpp"

QuotaManager::QuotaManager(std::shared_ptr<ICounterStore> store,
                           std::shared_ptr<CacheInterface> cache,
                           QuotaConfig config,
                           std::shared_ptr<ILogger> logger,
                           std::shared_ptr<IStatsDClient> statsd_client,
                           std::shared_ptr<IClock> clock)
    : store_(std::move(store)),
      cache_(std::move(cache)),
      config_(config),
      logger_(std::move(logger)),
      statsd_client_(std::move(statsd_client)),
      clock_(std::move(clock)) {
    if (!store_) {
        throw std::invalid_argument("Counter store cannot be null for QuotaManager");
    }
    if (!logger_) {
        throw std::invalid_argument("Logger cannot be null for QuotaManager");
    }
    if (!statsd_client_) {
        throw std::invalid_argument("StatsDClient cannot be null for QuotaManager");
    }
    if (!clock_) {
        throw std::invalid_argument("Clock cannot be null for QuotaManager");
    }
    if (config_.daily_limit < 0 || config_.monthly_limit < 0) {
        throw std::invalid_argument("Quota limits must be non-negative");
    }
}

std::string QuotaManager::cacheKey(const std::string& subject_id, const std::string& bucket_date) {
    return "quota:" + subject_id + ":" + bucket_date;
}

QuotaManager::Buckets QuotaManager::currentBuckets() {
    auto now = clock_->wallNow();
    return Buckets{Utils::formatDate(now), Utils::formatMonth(now), Utils::formatIsoTimestamp(now)};
}

UsageRecord QuotaManager::readUsage(const std::string& subject_id, const Buckets& buckets) {
    auto day_record = store_->get(CounterKey{subject_id, buckets.day});
    auto month_record = store_->get(CounterKey{subject_id, buckets.month});

    UsageRecord usage;
    usage.subject_id = subject_id;
    usage.bucket_date = buckets.day;
    if (day_record) {
        usage.daily_count = day_record->valueOf(Constants::DAILY_COUNT_FIELD);
        usage.last_operation = day_record->last_operation;
        usage.last_updated = day_record->last_updated;
    }
    if (month_record) {
        usage.monthly_count = month_record->valueOf(Constants::MONTHLY_COUNT_FIELD);
        if (usage.last_updated.empty()) {
            usage.last_operation = month_record->last_operation;
            usage.last_updated = month_record->last_updated;
        }
    }
    return usage;
}

QuotaInfo QuotaManager::evaluate(const UsageRecord& usage, bool cached) const {
    QuotaInfo info;
    info.subject_id = usage.subject_id;
    info.bucket_date = usage.bucket_date;
    info.daily_used = usage.daily_count;
    info.daily_limit = config_.daily_limit;
    info.monthly_used = usage.monthly_count;
    info.monthly_limit = config_.monthly_limit;
    info.cached = cached;

    if (usage.daily_count >= config_.daily_limit) {
        info.exceeded = QuotaLimit::Daily;
    } else if (usage.monthly_count >= config_.monthly_limit) {
        info.exceeded = QuotaLimit::Monthly;
    }
    info.allowed = info.exceeded == QuotaLimit::None;
    return info;
}

QuotaInfo QuotaManager::storeFailure(const std::string& subject_id, const Buckets& buckets,
                                     const std::string& message) {
    QuotaInfo info;
    info.subject_id = subject_id;
    info.bucket_date = buckets.day;
    info.daily_limit = config_.daily_limit;
    info.monthly_limit = config_.monthly_limit;
    info.tracking_error = message;
    info.allowed = config_.store_failure_policy == StoreFailurePolicy::FailOpen;
    info.exceeded = info.allowed ? QuotaLimit::None : QuotaLimit::Unknown;

    logger_->error("Quota tracking failed for " + subject_id + " (" +
                   storeFailurePolicyToString(config_.store_failure_policy) + "): " + message);
    statsd_client_->increment(MetricsDefinitions::QUOTA_TRACKING_ERROR);
    return info;
}

std::optional<UsageRecord> QuotaManager::readCache(const std::string& key) {
    if (!cache_) {
        return std::nullopt;
    }
    auto cached = cache_->get(key);
    if (!cached) {
        return std::nullopt;
    }
    try {
        return UsageRecord::fromJson(json::parse(*cached));
    } catch (const json::exception& e) {
        logger_->warn("Discarding malformed cached usage for " + key + ": " + e.what());
        cache_->remove(key);
        return std::nullopt;
    }
}

size_t QuotaManager::stripeOf(const std::string& key) const {
    return std::hash<std::string>{}(key) % CACHE_STRIPES;
}

uint64_t QuotaManager::cacheEpoch(const std::string& key) {
    size_t stripe = stripeOf(key);
    std::lock_guard<std::mutex> lock(cache_locks_[stripe]);
    return cache_epochs_[stripe];
}

void QuotaManager::writeCache(const std::string& key, const UsageRecord& usage, uint64_t epoch) {
    if (!cache_) {
        return;
    }
    size_t stripe = stripeOf(key);
    std::lock_guard<std::mutex> lock(cache_locks_[stripe]);
    if (cache_epochs_[stripe] != epoch) {
        logger_->debug("Skipping cache write for " + key + ": invalidated during read");
        return;
    }
    if (!cache_->set(key, usage.toJson().dump(), config_.cache_ttl_seconds)) {
        logger_->debug("Could not cache usage for " + key);
    }
}

void QuotaManager::invalidate(const std::string& key) {
    if (!cache_) {
        return;
    }
    size_t stripe = stripeOf(key);
    std::lock_guard<std::mutex> lock(cache_locks_[stripe]);
    ++cache_epochs_[stripe];
    cache_->remove(key);
}

QuotaInfo QuotaManager::checkFast(const std::string& subject_id) {
    if (subject_id.empty()) {
        throw std::invalid_argument("subject_id cannot be empty");
    }
    Buckets buckets = currentBuckets();
    const std::string key = cacheKey(subject_id, buckets.day);

    if (auto cached = readCache(key)) {
        return evaluate(*cached, true);
    }

    const uint64_t epoch = cacheEpoch(key);
    UsageRecord usage;
    try {
        usage = readUsage(subject_id, buckets);
    } catch (const StoreUnavailableError& e) {
        return storeFailure(subject_id, buckets, e.what());
    }
    writeCache(key, usage, epoch);
    return evaluate(usage, false);
}

QuotaInfo QuotaManager::checkAndIncrement(const std::string& subject_id, const std::string& operation) {
    if (subject_id.empty()) {
        throw std::invalid_argument("subject_id cannot be empty");
    }
    Buckets buckets = currentBuckets();
    const std::string key = cacheKey(subject_id, buckets.day);

    std::vector<CounterCondition> conditions{
        {CounterKey{subject_id, buckets.day}, Constants::DAILY_COUNT_FIELD, config_.daily_limit},
        {CounterKey{subject_id, buckets.month}, Constants::MONTHLY_COUNT_FIELD, config_.monthly_limit}};
    IncrementAttributes attributes;
    attributes.operation = operation;
    attributes.timestamp = buckets.timestamp;
    attributes.ttl = std::chrono::hours(24) * config_.counter_ttl_days;

    IncrementResult result;
    try {
        result = store_->conditionalIncrement(conditions, attributes);
    } catch (const StoreUnavailableError& e) {
        return storeFailure(subject_id, buckets, e.what());
    }

    if (result.applied) {
        invalidate(key);

        QuotaInfo info;
        info.allowed = true;
        info.atomic = true;
        info.subject_id = subject_id;
        info.bucket_date = buckets.day;
        info.daily_used = result.new_values[Constants::DAILY_COUNT_FIELD];
        info.daily_limit = config_.daily_limit;
        info.monthly_used = result.new_values[Constants::MONTHLY_COUNT_FIELD];
        info.monthly_limit = config_.monthly_limit;
        statsd_client_->increment(MetricsDefinitions::QUOTA_ALLOWED);
        logger_->debug("Admitted " + operation + " for " + subject_id + ": " + info.to_string());
        return info;
    }

    // Rejected: find out which limit from the store itself, never from cache.
    QuotaInfo info;
    try {
        const uint64_t epoch = cacheEpoch(key);
        UsageRecord usage = readUsage(subject_id, buckets);
        info = evaluate(usage, false);
        if (info.exceeded == QuotaLimit::None) {
            // The counts moved between the rejected write and this read.
            info.exceeded = QuotaLimit::Unknown;
        }
        writeCache(key, usage, epoch);
    } catch (const StoreUnavailableError& e) {
        info = QuotaInfo{};
        info.subject_id = subject_id;
        info.bucket_date = buckets.day;
        info.daily_limit = config_.daily_limit;
        info.monthly_limit = config_.monthly_limit;
        info.exceeded = QuotaLimit::Unknown;
        info.tracking_error = std::string("Could not read usage after rejection: ") + e.what();
        logger_->error("Quota rejection for " + subject_id + " could not be attributed: " + e.what());
        statsd_client_->increment(MetricsDefinitions::QUOTA_TRACKING_ERROR);
    }
    info.allowed = false;
    info.atomic = true;

    switch (info.exceeded) {
        case QuotaLimit::Monthly:
            statsd_client_->increment(MetricsDefinitions::QUOTA_REJECTED_MONTHLY);
            break;
        case QuotaLimit::Daily:
            statsd_client_->increment(MetricsDefinitions::QUOTA_REJECTED_DAILY);
            break;
        default:
            statsd_client_->increment(MetricsDefinitions::QUOTA_REJECTED_UNKNOWN);
            break;
    }
    logger_->info("Rejected " + operation + " for " + subject_id + ": " +
                  quotaLimitToString(info.exceeded) + " limit reached");
    return info;
}

UsageStats QuotaManager::getUsageStats(const std::string& subject_id) {
    if (subject_id.empty()) {
        throw std::invalid_argument("subject_id cannot be empty");
    }
    Buckets buckets = currentBuckets();
    UsageRecord usage = readUsage(subject_id, buckets);

    UsageStats stats;
    stats.subject_id = subject_id;
    stats.bucket_date = buckets.day;
    stats.daily = WindowUsage{usage.daily_count, config_.daily_limit};
    stats.monthly = WindowUsage{usage.monthly_count, config_.monthly_limit};
    stats.last_operation = usage.last_operation;
    stats.last_updated = usage.last_updated;
    stats.status = usageStatusFor(std::max(stats.daily.percent(), stats.monthly.percent()));
    return stats;
}

bool QuotaManager::clearCache(const std::optional<std::string>& subject_id) {
    if (!cache_) {
        return true;
    }
    if (subject_id && !subject_id->empty()) {
        invalidate(cacheKey(*subject_id, currentBuckets().day));
        logger_->info("Cleared cached quota for " + *subject_id);
        return true;
    }
    bool cleared = cache_->clear();
    logger_->info(std::string("Cleared all cached quota entries") + (cleared ? "" : " (some tiers failed)"));
    return cleared;
}
