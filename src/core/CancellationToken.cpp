#include "CancellationToken.hpp"

#include <vector>

CancellationToken::CancellationToken(std::chrono::milliseconds timeout)
    : deadline_(std::chrono::steady_clock::now() + timeout) {}

CancellationToken::CancellationToken(std::chrono::steady_clock::time_point deadline)
    : deadline_(deadline) {}

void CancellationToken::cancel() {
    std::vector<Callback> to_run;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (cancelled_) {
            return;
        }
        cancelled_ = true;
        for (auto& [id, callback] : callbacks_) {
            to_run.push_back(std::move(callback));
        }
        callbacks_.clear();
    }
    cv_.notify_all();
    for (auto& callback : to_run) {
        callback();
    }
}

bool CancellationToken::wasExplicitlyCancelled() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return cancelled_;
}

bool CancellationToken::isCancelled() const {
    if (wasExplicitlyCancelled()) {
        return true;
    }
    return deadline_ && std::chrono::steady_clock::now() >= *deadline_;
}

std::optional<std::chrono::milliseconds> CancellationToken::remaining() const {
    if (!deadline_) {
        return std::nullopt;
    }
    auto left = std::chrono::duration_cast<std::chrono::milliseconds>(
        *deadline_ - std::chrono::steady_clock::now());
    return left.count() > 0 ? left : std::chrono::milliseconds(0);
}

bool CancellationToken::waitFor(std::chrono::milliseconds d) {
    auto until = std::chrono::steady_clock::now() + d;
    bool cut_by_deadline = false;
    if (deadline_ && *deadline_ < until) {
        until = *deadline_;
        cut_by_deadline = true;
    }

    std::unique_lock<std::mutex> lock(mutex_);
    bool cancelled = cv_.wait_until(lock, until, [this] { return cancelled_; });
    return !cancelled && !cut_by_deadline;
}

uint64_t CancellationToken::subscribe(Callback callback) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!cancelled_) {
            uint64_t id = next_id_++;
            callbacks_.emplace(id, std::move(callback));
            return id;
        }
    }
    callback();
    return 0;
}

void CancellationToken::unsubscribe(uint64_t id) {
    std::lock_guard<std::mutex> lock(mutex_);
    callbacks_.erase(id);
}
