#ifndef ICOUNTERSTORE_HPP
#define ICOUNTERSTORE_HPP

#include <chrono>
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <vector>

// (subject, time-bucket) key of one usage counter record.
struct CounterKey {
    std::string subject_id;
    std::string bucket;   // "YYYY-MM-DD" for day buckets, "YYYY-MM" for month buckets

    std::string to_string() const { return subject_id + "#" + bucket; }

    bool operator<(const CounterKey& other) const {
        return subject_id < other.subject_id ||
               (subject_id == other.subject_id && bucket < other.bucket);
    }

    bool operator==(const CounterKey& other) const {
        return subject_id == other.subject_id && bucket == other.bucket;
    }
};

// "increment field under key iff its current value < limit".
struct CounterCondition {
    CounterKey key;
    std::string field;
    int64_t limit = 0;
};

struct CounterRecord {
    std::map<std::string, int64_t> fields;
    std::string last_operation;
    std::string last_updated;

    int64_t valueOf(const std::string& field) const {
        auto it = fields.find(field);
        return it == fields.end() ? 0 : it->second;
    }
};

struct IncrementAttributes {
    std::string operation;
    std::string timestamp;            // ISO-8601 UTC
    std::chrono::seconds ttl{0};      // Record expiry owned by the store
};

struct IncrementResult {
    bool applied = false;
    std::map<std::string, int64_t> new_values;   // Post-increment values keyed by field
};

// Durable counter store contract. conditionalIncrement applies to every
// condition or to none: all fields are incremented by one iff every current
// value (missing counts as 0) is below its limit. Field names must be unique
// across the conditions of one call. Implementations throw
// StoreUnavailableError when the store cannot be reached.
class ICounterStore {
public:
    virtual ~ICounterStore() = default;

    virtual IncrementResult conditionalIncrement(
        const std::vector<CounterCondition>& conditions,
        const IncrementAttributes& attributes) = 0;

    virtual std::optional<CounterRecord> get(const CounterKey& key) = 0;
};

#endif // ICOUNTERSTORE_HPP
