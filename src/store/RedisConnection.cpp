#include "RedisConnection.hpp"

#include <algorithm>
#include <cctype>
#include <set>
#include <stdexcept>

#include <hiredis/hiredis.h>

#include "../interfaces/ILogger.hpp"
#include "../models/ResilienceErrors.hpp"

void RedisReplyDeleter::operator()(redisReply* reply) const {
    if (reply) {
        freeReplyObject(reply);
    }
}

RedisConnection::RedisConnection(std::string host, int port, std::shared_ptr<ILogger> logger)
    : host_(std::move(host)), port_(port), logger_(std::move(logger)), context_(nullptr) {
    std::lock_guard<std::mutex> lock(mutex_);
    connect();
}

RedisConnection::~RedisConnection() {
    disconnect();
}

bool RedisConnection::connect() {
    context_ = redisConnect(host_.c_str(), port_);
    if (context_ == nullptr || context_->err) {
        std::string error_msg;
        if (context_) {
            error_msg = "Redis connection error: " + std::string(context_->errstr);
            redisFree(context_);
            context_ = nullptr;
        } else {
            error_msg = "Redis connection error: can't allocate redis context";
        }
        logger_->error(error_msg + " (" + host_ + ":" + std::to_string(port_) + ")");
        return false;
    }
    logger_->debug("Connected to Redis at " + host_ + ":" + std::to_string(port_));
    return true;
}

void RedisConnection::disconnect() {
    if (context_) {
        redisFree(context_);
        context_ = nullptr;
    }
}

RedisReplyPtr RedisConnection::send(const std::vector<std::string>& args) {
    std::vector<const char*> argv;
    std::vector<size_t> argvlen;
    argv.reserve(args.size());
    argvlen.reserve(args.size());
    for (const auto& arg : args) {
        argv.push_back(arg.data());
        argvlen.push_back(arg.size());
    }
    return RedisReplyPtr(static_cast<redisReply*>(
        redisCommandArgv(context_, static_cast<int>(argv.size()), argv.data(), argvlen.data())));
}

RedisReplyPtr RedisConnection::command(const std::vector<std::string>& args) {
    if (args.empty()) {
        throw std::invalid_argument("Redis command cannot be empty");
    }

    std::lock_guard<std::mutex> lock(mutex_);
    if (!context_ && !connect()) {
        throw StoreUnavailableError("Redis not connected. Cannot run " + args.front());
    }

    RedisReplyPtr reply = send(args);
    if (!reply) {
        // The context is unusable after an I/O error; reconnect, and retry
        // once when the command is a read.
        logger_->warn("Redis " + args.front() + " failed (" +
                      std::string(context_->errstr) + "), reconnecting");
        disconnect();
        bool reconnected = connect();
        if (!safeToResend(args.front())) {
            throw StoreUnavailableError("Redis " + args.front() +
                                        " outcome unknown after connection loss; not resent");
        }
        if (!reconnected) {
            throw StoreUnavailableError("Redis unreachable while running " + args.front());
        }
        reply = send(args);
        if (!reply) {
            disconnect();
            throw StoreUnavailableError("Redis " + args.front() + " failed after reconnect");
        }
    }

    if (reply->type == REDIS_REPLY_ERROR) {
        throw StoreUnavailableError("Redis " + args.front() + " error: " +
                                    std::string(reply->str, reply->len));
    }
    return reply;
}

bool RedisConnection::isConnected() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return context_ != nullptr;
}

bool RedisConnection::safeToResend(const std::string& command) {
    static const std::set<std::string> READ_ONLY = {"GET", "HGETALL", "EXISTS", "SCAN", "TTL", "PING", "DEL"};
    std::string upper = command;
    std::transform(upper.begin(), upper.end(), upper.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    return READ_ONLY.count(upper) > 0;
}
