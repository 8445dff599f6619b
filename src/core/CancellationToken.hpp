#ifndef CANCELLATIONTOKEN_HPP
#define CANCELLATIONTOKEN_HPP

#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <map>
#include <mutex>
#include <optional>

// Caller-owned cancel flag plus optional deadline. Shared by reference with
// the retry loop for the duration of one call.
class CancellationToken {
public:
    using Callback = std::function<void()>;

    CancellationToken() = default;
    explicit CancellationToken(std::chrono::milliseconds timeout);
    explicit CancellationToken(std::chrono::steady_clock::time_point deadline);

    CancellationToken(const CancellationToken&) = delete;
    CancellationToken& operator=(const CancellationToken&) = delete;

    // Wakes every waiter and runs subscribed callbacks once.
    void cancel();

    // True after cancel() or once the deadline has passed.
    bool isCancelled() const;
    bool wasExplicitlyCancelled() const;

    std::optional<std::chrono::steady_clock::time_point> deadline() const { return deadline_; }

    // Time left before the deadline; nullopt when there is no deadline.
    std::optional<std::chrono::milliseconds> remaining() const;

    // Sleeps for d, returning early on cancel(). Returns true iff the full
    // duration elapsed and the token is still live.
    bool waitFor(std::chrono::milliseconds d);

    // Callback runs on the cancelling thread; if already cancelled it runs now.
    uint64_t subscribe(Callback callback);
    void unsubscribe(uint64_t id);

private:
    std::optional<std::chrono::steady_clock::time_point> deadline_;
    mutable std::mutex mutex_;
    std::condition_variable cv_;
    bool cancelled_ = false;
    uint64_t next_id_ = 1;
    std::map<uint64_t, Callback> callbacks_;
};

#endif // CANCELLATIONTOKEN_HPP
