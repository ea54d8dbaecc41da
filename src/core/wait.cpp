#include <rtvoice/core/wait.hpp>

#include <algorithm>
#include <thread>

namespace rtvoice::core {

void CancellationToken::cancel() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        cancelled_ = true;
    }
    cv_.notify_all();
}

void CancellationToken::reset() {
    std::lock_guard<std::mutex> lock(mutex_);
    cancelled_ = false;
}

bool CancellationToken::sleepFor(std::chrono::milliseconds duration) const {
    std::unique_lock<std::mutex> lock(mutex_);
    return cv_.wait_for(lock, duration, [this]() { return cancelled_.load(); });
}

const char* waitStatusName(WaitStatus status) {
    switch (status) {
        case WaitStatus::Satisfied: return "satisfied";
        case WaitStatus::TimedOut:  return "timed out";
        case WaitStatus::Cancelled: return "cancelled";
    }
    return "unknown";
}

WaitStatus waitUntil(const std::function<bool()>& predicate,
                     const WaitOptions& options,
                     const CancellationToken* token) {
    using Clock = std::chrono::steady_clock;
    const auto start = Clock::now();

    while (true) {
        if (token && token->isCancelled()) {
            return WaitStatus::Cancelled;
        }
        if (predicate()) {
            return WaitStatus::Satisfied;
        }

        auto interval = options.poll_interval;
        if (options.timeout) {
            auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(Clock::now() - start);
            if (elapsed >= *options.timeout) {
                return WaitStatus::TimedOut;
            }
            interval = std::min(interval, *options.timeout - elapsed);
        }

        if (token) {
            token->sleepFor(interval);
        } else {
            std::this_thread::sleep_for(interval);
        }
    }
}

} // namespace rtvoice::core
