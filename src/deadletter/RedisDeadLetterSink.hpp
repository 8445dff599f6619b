#ifndef REDISDEADLETTERSINK_HPP
#define REDISDEADLETTERSINK_HPP

#include <memory>
#include <string>

#include "../config/AppConfig.hpp"
#include "../interfaces/IDeadLetterSink.hpp"
#include "../store/RedisConnection.hpp"

class ILogger;

// Queue is a Redis list (LPUSH), the error log is one key per record with
// the retention window as TTL, notifications go out on a pub/sub channel.
class RedisDeadLetterSink : public IDeadLetterSink {
public:
    RedisDeadLetterSink(std::shared_ptr<RedisConnection> connection,
                        std::string key_prefix,
                        DeadLetterConfig config,
                        std::shared_ptr<ILogger> logger);

    void enqueue(const FailureRecord& record) override;
    void persist(const FailureRecord& record) override;
    void notify(const FailureRecord& record) override;

private:
    std::shared_ptr<RedisConnection> connection_;
    std::string key_prefix_;
    DeadLetterConfig config_;
    std::shared_ptr<ILogger> logger_;
};

#endif // REDISDEADLETTERSINK_HPP
