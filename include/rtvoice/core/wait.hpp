#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <functional>
#include <mutex>
#include <optional>

namespace rtvoice::core {

// Cancellation flag shared between the thread that waits and the thread
// that wants it to stop waiting.
class CancellationToken {
public:
    void cancel();
    void reset();
    bool isCancelled() const noexcept { return cancelled_.load(); }

    // Sleep up to `duration`, returning early when cancelled.
    // Returns true if the token was cancelled.
    bool sleepFor(std::chrono::milliseconds duration) const;

private:
    std::atomic<bool> cancelled_{false};
    mutable std::mutex mutex_;
    mutable std::condition_variable cv_;
};

enum class WaitStatus {
    Satisfied,
    TimedOut,
    Cancelled
};

const char* waitStatusName(WaitStatus status);

struct WaitOptions {
    std::chrono::milliseconds poll_interval{100};
    // nullopt: no deadline, only the predicate or the token end the wait
    std::optional<std::chrono::milliseconds> timeout;
};

// Cooperative wait: evaluates `predicate` every poll_interval until it holds,
// the timeout elapses, or `token` is cancelled.
WaitStatus waitUntil(const std::function<bool()>& predicate,
                     const WaitOptions& options = {},
                     const CancellationToken* token = nullptr);

} // namespace rtvoice::core
