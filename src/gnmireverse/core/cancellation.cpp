#include "gnmireverse/core/cancellation.h"

namespace gnmireverse {
namespace core {

bool CancellationScope::Cancel(const std::string& reason) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (cancelled_.load(std::memory_order_relaxed)) {
        return false;
    }
    reason_ = reason.empty() ? std::string("context canceled") : reason;
    cancelled_.store(true, std::memory_order_release);

    for (auto& entry : callbacks_) {
        entry.second();
    }
    callbacks_.clear();
    cv_.notify_all();
    return true;
}

std::string CancellationScope::Reason() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return reason_;
}

CancellationScope::CallbackId CancellationScope::AddCallback(Callback callback) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!cancelled_.load(std::memory_order_relaxed)) {
            CallbackId id = next_id_++;
            callbacks_.emplace(id, std::move(callback));
            return id;
        }
    }
    // Already cancelled, reason_ no longer changes
    callback();
    return 0;
}

void CancellationScope::RemoveCallback(CallbackId id) {
    std::lock_guard<std::mutex> lock(mutex_);
    callbacks_.erase(id);
}

bool CancellationScope::WaitFor(std::chrono::milliseconds timeout) const {
    std::unique_lock<std::mutex> lock(mutex_);
    return cv_.wait_for(lock, timeout, [this] {
        return cancelled_.load(std::memory_order_relaxed);
    });
}

}  // namespace core
}  // namespace gnmireverse
