#include "InMemoryCounterStore.hpp"

#include <stdexcept>

InMemoryCounterStore::InMemoryCounterStore(std::shared_ptr<IClock> clock)
    : clock_(std::move(clock)) {
    if (!clock_) {
        throw std::invalid_argument("Clock cannot be null for InMemoryCounterStore");
    }
}

InMemoryCounterStore::StoredRecord* InMemoryCounterStore::findLive(
    const CounterKey& key, std::chrono::steady_clock::time_point now) {
    auto it = records_.find(key);
    if (it == records_.end()) {
        return nullptr;
    }
    if (it->second.has_expiry && it->second.expires_at <= now) {
        records_.erase(it);
        return nullptr;
    }
    return &it->second;
}

IncrementResult InMemoryCounterStore::conditionalIncrement(
    const std::vector<CounterCondition>& conditions,
    const IncrementAttributes& attributes) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto now = clock_->now();

    IncrementResult result;
    for (const auto& condition : conditions) {
        const StoredRecord* stored = findLive(condition.key, now);
        int64_t current = stored ? stored->record.valueOf(condition.field) : 0;
        if (current >= condition.limit) {
            return result;
        }
    }

    for (const auto& condition : conditions) {
        StoredRecord& stored = records_[condition.key];
        int64_t updated = ++stored.record.fields[condition.field];
        stored.record.last_operation = attributes.operation;
        stored.record.last_updated = attributes.timestamp;
        if (attributes.ttl.count() > 0) {
            stored.expires_at = now + attributes.ttl;
            stored.has_expiry = true;
        }
        result.new_values[condition.field] = updated;
    }
    result.applied = true;
    return result;
}

std::optional<CounterRecord> InMemoryCounterStore::get(const CounterKey& key) {
    std::lock_guard<std::mutex> lock(mutex_);
    const StoredRecord* stored = findLive(key, clock_->now());
    if (!stored) {
        return std::nullopt;
    }
    return stored->record;
}

size_t InMemoryCounterStore::size() {
    std::lock_guard<std::mutex> lock(mutex_);
    return records_.size();
}
