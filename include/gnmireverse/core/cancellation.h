#ifndef GNMIREVERSE_CORE_CANCELLATION_H_
#define GNMIREVERSE_CORE_CANCELLATION_H_

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <map>
#include <mutex>
#include <string>

namespace gnmireverse {
namespace core {

/**
 * @brief Shared cancellation signal for the sessions of one retry iteration
 * 
 * Cancellation is one-shot: the first Cancel() records the reason and runs
 * every registered callback, later calls are no-ops. Callbacks run while the
 * scope's lock is held, so once RemoveCallback() returns the callback is
 * guaranteed not to be running. A callback must not call back into the scope.
 */
class CancellationScope {
public:
    using Callback = std::function<void()>;
    using CallbackId = uint64_t;

    CancellationScope() = default;

    // Non-copyable
    CancellationScope(const CancellationScope&) = delete;
    CancellationScope& operator=(const CancellationScope&) = delete;

    /**
     * @brief Cancel the scope
     * @return true if this call performed the cancellation
     */
    bool Cancel(const std::string& reason);

    bool IsCancelled() const { return cancelled_.load(std::memory_order_acquire); }

    /**
     * @brief Reason passed to the first Cancel(), empty while not cancelled
     */
    std::string Reason() const;

    /**
     * @brief Register a callback run on cancellation
     * 
     * If the scope is already cancelled the callback runs immediately and
     * 0 is returned.
     */
    CallbackId AddCallback(Callback callback);

    void RemoveCallback(CallbackId id);

    /**
     * @brief Block until cancelled or until the timeout expires
     * @return true if the scope is cancelled
     */
    bool WaitFor(std::chrono::milliseconds timeout) const;

private:
    mutable std::mutex mutex_;
    mutable std::condition_variable cv_;
    std::atomic<bool> cancelled_{false};
    std::string reason_;
    std::map<CallbackId, Callback> callbacks_;
    CallbackId next_id_ = 1;
};

/**
 * @brief RAII registration of a cancellation callback
 */
class ScopedCancelCallback {
public:
    ScopedCancelCallback(CancellationScope& scope, CancellationScope::Callback callback)
        : scope_(scope), id_(scope.AddCallback(std::move(callback))) {}

    ~ScopedCancelCallback() {
        if (id_ != 0) {
            scope_.RemoveCallback(id_);
        }
    }

    ScopedCancelCallback(const ScopedCancelCallback&) = delete;
    ScopedCancelCallback& operator=(const ScopedCancelCallback&) = delete;

private:
    CancellationScope& scope_;
    CancellationScope::CallbackId id_;
};

} // namespace core
} // namespace gnmireverse

#endif // GNMIREVERSE_CORE_CANCELLATION_H_
