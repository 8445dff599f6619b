#ifndef USAGERECORD_HPP
#define USAGERECORD_HPP

#include <cstdint>
#include <sstream>
#include <string>

#include <nlohmann/json.hpp>

using json = nlohmann::json;

// One subject's consumption as seen from one day bucket. monthly_count is
// the count of the month bucket the day belongs to.
class UsageRecord {
public:
    std::string subject_id;
    std::string bucket_date;
    int64_t daily_count = 0;
    int64_t monthly_count = 0;
    std::string last_operation;
    std::string last_updated;

    json toJson() const {
        return json{
            {"subject_id", subject_id},
            {"bucket_date", bucket_date},
            {"daily_count", daily_count},
            {"monthly_count", monthly_count},
            {"last_operation", last_operation},
            {"last_updated", last_updated}
        };
    }

    // Throws json::exception on malformed input.
    static UsageRecord fromJson(const json& j) {
        UsageRecord record;
        record.subject_id = j.at("subject_id").get<std::string>();
        record.bucket_date = j.at("bucket_date").get<std::string>();
        record.daily_count = j.at("daily_count").get<int64_t>();
        record.monthly_count = j.at("monthly_count").get<int64_t>();
        record.last_operation = j.value("last_operation", "");
        record.last_updated = j.value("last_updated", "");
        return record;
    }

    std::string to_string() const {
        std::ostringstream oss;
        oss << "UsageRecord {"
            << " subject: " << subject_id
            << ", date: " << bucket_date
            << ", daily: " << daily_count
            << ", monthly: " << monthly_count
            << ", last_operation: " << (last_operation.empty() ? "-" : last_operation)
            << " }";
        return oss.str();
    }
};

#endif // USAGERECORD_HPP
