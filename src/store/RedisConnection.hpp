#pragma once

#include <memory>
#include <mutex>
#include <string>
#include <vector>

struct redisContext;
struct redisReply;
class ILogger;

struct RedisReplyDeleter {
    void operator()(redisReply* reply) const;
};

using RedisReplyPtr = std::unique_ptr<redisReply, RedisReplyDeleter>;

// Single synchronous hiredis connection shared by the Redis-backed cache,
// counter store and dead-letter sink. Commands are serialized on one mutex.
// A dropped connection is re-established once per command. Only reads and
// DEL are sent again on the new connection: any other write whose reply was
// lost may already have been applied, so it fails with StoreUnavailableError.
class RedisConnection {
public:
    RedisConnection(std::string host, int port, std::shared_ptr<ILogger> logger);
    ~RedisConnection();

    RedisConnection(const RedisConnection&) = delete;
    RedisConnection& operator=(const RedisConnection&) = delete;

    // Runs one command. Throws StoreUnavailableError when Redis cannot be
    // reached or replies with an error.
    RedisReplyPtr command(const std::vector<std::string>& args);

    bool isConnected() const;

    // True for commands that are harmless to run twice.
    static bool safeToResend(const std::string& command);

private:
    bool connect();
    void disconnect();
    RedisReplyPtr send(const std::vector<std::string>& args);

    std::string host_;
    int port_;
    std::shared_ptr<ILogger> logger_;
    redisContext* context_;
    mutable std::mutex mutex_;
};
