#pragma once

#include <algorithm>
#include <cstdint>
#include <functional>
#include <mutex>
#include <utility>
#include <vector>

namespace rtvoice::core {

using ListenerId = std::uint64_t;

// Event emitter sederhana untuk callback-style events.
// Listener dipanggil di thread yang memanggil emit(), di luar lock,
// sehingga listener boleh connect/disconnect listener lain.
template<typename... Args>
class EventEmitter {
public:
    using Callback = std::function<void(Args...)>;

    EventEmitter() = default;

    EventEmitter(const EventEmitter&) = delete;
    EventEmitter& operator=(const EventEmitter&) = delete;

    ListenerId connect(Callback callback) {
        std::lock_guard<std::mutex> lock(mutex_);
        ListenerId id = next_id_++;
        listeners_.emplace_back(id, std::move(callback));
        return id;
    }

    void disconnect(ListenerId id) {
        std::lock_guard<std::mutex> lock(mutex_);
        listeners_.erase(
            std::remove_if(listeners_.begin(), listeners_.end(),
                [id](const auto& entry) { return entry.first == id; }),
            listeners_.end());
    }

    void clear() {
        std::lock_guard<std::mutex> lock(mutex_);
        listeners_.clear();
    }

    std::size_t listenerCount() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return listeners_.size();
    }

    void emit(Args... args) const {
        std::vector<std::pair<ListenerId, Callback>> snapshot;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            snapshot = listeners_;
        }
        for (const auto& [id, callback] : snapshot) {
            callback(args...);
        }
    }

    // Shorthand: emitter(callback)
    ListenerId operator()(Callback callback) {
        return connect(std::move(callback));
    }

private:
    std::vector<std::pair<ListenerId, Callback>> listeners_;
    mutable std::mutex mutex_;
    ListenerId next_id_ = 1;
};

} // namespace rtvoice::core
