#ifndef FAILUREROUTER_HPP
#define FAILUREROUTER_HPP

#include <atomic>
#include <cstdint>
#include <map>
#include <memory>
#include <string>

#include "../interfaces/IClock.hpp"
#include "../interfaces/IDeadLetterSink.hpp"
#include "../interfaces/ILogger.hpp"
#include "../interfaces/IStatsDClient.hpp"
#include "../models/ErrorTypes.hpp"
#include "../models/FailureRecord.hpp"

struct FailureContext {
    std::string subject_id;
    std::string dependency;
    std::string operation;
    int attempts = 0;
    std::map<std::string, std::string> details;
};

// Turns one definitive failure into a FailureRecord and hands it to the
// dead-letter sink: enqueue, persist, and notify for High/Critical only.
// Sink errors are logged and counted; they never replace the caller's error.
class FailureRouter {
public:
    FailureRouter(std::shared_ptr<IDeadLetterSink> sink,
                  std::shared_ptr<ILogger> logger,
                  std::shared_ptr<IStatsDClient> statsd_client,
                  std::shared_ptr<IClock> clock = std::make_shared<SystemClock>());

    FailureRecord route(const OperationError& error, ErrorSeverity severity, const FailureContext& context);

    FailureRecord buildRecord(const OperationError& error, ErrorSeverity severity, const FailureContext& context);

    static bool requiresNotification(ErrorSeverity severity) {
        return severity == ErrorSeverity::High || severity == ErrorSeverity::Critical;
    }

private:
    std::string nextErrorId(const std::string& dependency);

    std::shared_ptr<IDeadLetterSink> sink_;
    std::shared_ptr<ILogger> logger_;
    std::shared_ptr<IStatsDClient> statsd_client_;
    std::shared_ptr<IClock> clock_;
    std::atomic<uint64_t> sequence_{0};
};

#endif // FAILUREROUTER_HPP
