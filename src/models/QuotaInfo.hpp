#ifndef QUOTAINFO_HPP
#define QUOTAINFO_HPP

#include <cstdint>
#include <optional>
#include <sstream>
#include <string>

#include <nlohmann/json.hpp>

#include "ResilienceErrors.hpp"

using json = nlohmann::json;

// Answer to an admission check.
struct QuotaInfo {
    bool allowed = false;
    QuotaLimit exceeded = QuotaLimit::None;
    std::string subject_id;
    std::string bucket_date;
    int64_t daily_used = 0;
    int64_t daily_limit = 0;
    int64_t monthly_used = 0;
    int64_t monthly_limit = 0;
    bool cached = false;   // Served from a cache tier
    bool atomic = false;   // Result of a conditional increment
    // Set when the counter store could not be consulted; allowed then
    // reflects the configured store failure policy.
    std::optional<std::string> tracking_error;

    int64_t dailyRemaining() const { return daily_limit > daily_used ? daily_limit - daily_used : 0; }
    int64_t monthlyRemaining() const { return monthly_limit > monthly_used ? monthly_limit - monthly_used : 0; }

    json toJson() const {
        json j;
        j["allowed"] = allowed;
        j["exceeded"] = quotaLimitToString(exceeded);
        j["subject_id"] = subject_id;
        j["bucket_date"] = bucket_date;
        j["daily"] = {{"used", daily_used}, {"limit", daily_limit}, {"remaining", dailyRemaining()}};
        j["monthly"] = {{"used", monthly_used}, {"limit", monthly_limit}, {"remaining", monthlyRemaining()}};
        j["cached"] = cached;
        j["atomic"] = atomic;
        j["tracking_error"] = tracking_error ? json(*tracking_error) : json(nullptr);
        return j;
    }

    std::string to_string() const {
        std::ostringstream oss;
        oss << "QuotaInfo { subject: " << subject_id
            << ", allowed: " << std::boolalpha << allowed
            << ", exceeded: " << quotaLimitToString(exceeded)
            << ", daily: " << daily_used << "/" << daily_limit
            << ", monthly: " << monthly_used << "/" << monthly_limit
            << ", cached: " << cached;
        if (tracking_error) {
            oss << ", tracking_error: " << *tracking_error;
        }
        oss << " }";
        return oss.str();
    }
};

enum class UsageStatus {
    Ok,
    Moderate,
    Warning,
    Critical,
    Exceeded
};

inline std::string usageStatusToString(UsageStatus status) {
    switch (status) {
        case UsageStatus::Ok: return "OK";
        case UsageStatus::Moderate: return "MODERATE";
        case UsageStatus::Warning: return "WARNING";
        case UsageStatus::Critical: return "CRITICAL";
        case UsageStatus::Exceeded: return "EXCEEDED";
    }
    return "OK";
}

// Thresholds apply to the higher of the two usage percentages.
inline UsageStatus usageStatusFor(double percent) {
    if (percent >= 100.0) return UsageStatus::Exceeded;
    if (percent >= 90.0) return UsageStatus::Critical;
    if (percent >= 75.0) return UsageStatus::Warning;
    if (percent >= 50.0) return UsageStatus::Moderate;
    return UsageStatus::Ok;
}

struct WindowUsage {
    int64_t used = 0;
    int64_t limit = 0;

    int64_t remaining() const { return limit > used ? limit - used : 0; }

    // A zero limit means nothing is allowed, so any window with limit 0 is full.
    double percent() const {
        if (limit <= 0) return 100.0;
        return 100.0 * static_cast<double>(used) / static_cast<double>(limit);
    }

    json toJson() const {
        return json{{"used", used}, {"limit", limit}, {"remaining", remaining()}, {"percent", percent()}};
    }
};

struct UsageStats {
    std::string subject_id;
    std::string bucket_date;
    WindowUsage daily;
    WindowUsage monthly;
    std::string last_operation;
    std::string last_updated;
    UsageStatus status = UsageStatus::Ok;

    json toJson() const {
        return json{
            {"subject_id", subject_id},
            {"bucket_date", bucket_date},
            {"daily", daily.toJson()},
            {"monthly", monthly.toJson()},
            {"last_operation", last_operation},
            {"last_updated", last_updated},
            {"status", usageStatusToString(status)}
        };
    }
};

#endif // QUOTAINFO_HPP
