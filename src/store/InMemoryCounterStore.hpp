#ifndef INMEMORYCOUNTERSTORE_HPP
#define INMEMORYCOUNTERSTORE_HPP

#include <chrono>
#include <map>
#include <memory>
#include <mutex>

#include "../interfaces/IClock.hpp"
#include "../interfaces/ICounterStore.hpp"

// Process-local counter store. One mutex makes every conditional increment
// atomic; records expire after the TTL passed with their last increment.
class InMemoryCounterStore : public ICounterStore {
public:
    explicit InMemoryCounterStore(std::shared_ptr<IClock> clock = std::make_shared<SystemClock>());

    IncrementResult conditionalIncrement(
        const std::vector<CounterCondition>& conditions,
        const IncrementAttributes& attributes) override;

    std::optional<CounterRecord> get(const CounterKey& key) override;

    size_t size();

private:
    struct StoredRecord {
        CounterRecord record;
        std::chrono::steady_clock::time_point expires_at;
        bool has_expiry = false;
    };

    // Caller holds mutex_.
    StoredRecord* findLive(const CounterKey& key, std::chrono::steady_clock::time_point now);

    std::shared_ptr<IClock> clock_;
    std::map<CounterKey, StoredRecord> records_;
    std::mutex mutex_;
};

#endif // INMEMORYCOUNTERSTORE_HPP
