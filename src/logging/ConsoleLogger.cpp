#include <chrono>
#include <ctime>
#include <iomanip>
#include <iostream>
#include <mutex>
#include <string>

#include "ConsoleLogger.hpp"

std::shared_ptr<ConsoleLogger> ConsoleLogger::instance = nullptr;
std::once_flag ConsoleLogger::init_flag;

std::shared_ptr<ConsoleLogger> ConsoleLogger::getInstance(LogUtils::LogLevel logLevel) {
    std::call_once(init_flag, [logLevel]() {
        instance.reset(new ConsoleLogger(logLevel));
    });
    return instance;
}

void ConsoleLogger::write(std::ostream& out, const std::string& prefix, const std::string& message) {
    auto now = std::chrono::system_clock::now();
    std::time_t now_c = std::chrono::system_clock::to_time_t(now);
    auto millis = std::chrono::duration_cast<std::chrono::milliseconds>(
        now.time_since_epoch()).count() % 1000;
    std::tm tm{};
    gmtime_r(&now_c, &tm);

    std::lock_guard<std::mutex> lock(cout_mutex_);
    out << std::put_time(&tm, Constants::TIME_FORMAT) << '.'
        << std::setfill('0') << std::setw(3) << millis << "Z "
        << prefix << message << std::endl;
}

void ConsoleLogger::info(const std::string& message) {
    if (logLevel <= LogUtils::LogLevel::INFO) {
        write(std::clog, LogUtils::INFO_LOG_PREFIX, message);
    }
}

void ConsoleLogger::debug(const std::string& message) {
    if (logLevel <= LogUtils::LogLevel::DEBUG) {
        write(std::clog, LogUtils::DEBUG_LOG_PREFIX, message);
    }
}

void ConsoleLogger::warn(const std::string& message) {
    if (logLevel <= LogUtils::LogLevel::WARN) {
        write(std::clog, LogUtils::WARN_LOG_PREFIX, message);
    }
}

void ConsoleLogger::error(const std::string& message) {
    if (logLevel <= LogUtils::LogLevel::CERROR) {
        write(std::cerr, LogUtils::CERROR_LOG_PREFIX, message);
    }
}

void ConsoleLogger::setup(const std::string& message) {
    write(std::clog, LogUtils::SETUP_LOG_PREFIX, message);
}
