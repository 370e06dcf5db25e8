#ifndef GNMIREVERSE_CORE_CHANNEL_H_
#define GNMIREVERSE_CORE_CHANNEL_H_

#include <condition_variable>
#include <cstdint>
#include <memory>
#include <mutex>
#include <utility>

#include "gnmireverse/core/cancellation.h"
#include "gnmireverse/core/result.h"

namespace gnmireverse {
namespace core {

/**
 * @brief Unbuffered hand-off channel between one producer and one consumer
 * 
 * Send() returns only once Receive() has taken the value, so the producer is
 * paused for as long as the consumer is busy. Both operations give up as soon
 * as the bound CancellationScope is cancelled; a value still waiting in the
 * channel at that point is dropped. When a value is ready and the scope is
 * cancelled, Receive() reports the cancellation.
 * 
 * A channel belongs to exactly one retry iteration and is never reused.
 */
template<typename T>
class HandoffChannel {
public:
    explicit HandoffChannel(std::shared_ptr<CancellationScope> scope)
        : scope_(std::move(scope))
        , wake_(*scope_, [this]() {
            std::lock_guard<std::mutex> lock(mutex_);
            cv_.notify_all();
        }) {}

    // Non-copyable
    HandoffChannel(const HandoffChannel&) = delete;
    HandoffChannel& operator=(const HandoffChannel&) = delete;

    /**
     * @brief Hand a value to the consumer, blocking until it is taken
     * @return error with Error::Code::CANCELLED if the scope was cancelled first
     */
    Result<void> Send(T value) {
        {
            std::unique_lock<std::mutex> lock(mutex_);
            cv_.wait(lock, [this] { return !has_value_ || scope_->IsCancelled(); });
            if (!scope_->IsCancelled()) {
                slot_ = std::move(value);
                has_value_ = true;
                const uint64_t ticket = ++sent_;
                cv_.notify_all();

                cv_.wait(lock, [this, ticket] {
                    return received_ >= ticket || scope_->IsCancelled();
                });
                if (received_ >= ticket) {
                    return Result<void>();
                }
                // Cancelled before the consumer took it
                has_value_ = false;
                slot_ = T();
                cv_.notify_all();
            }
        }
        return Result<void>::from_error(CancellationError(scope_->Reason()));
    }

    /**
     * @brief Take the next value, blocking until one is sent
     * @return error with Error::Code::CANCELLED if the scope was cancelled
     */
    Result<T> Receive() {
        {
            std::unique_lock<std::mutex> lock(mutex_);
            cv_.wait(lock, [this] { return has_value_ || scope_->IsCancelled(); });
            if (!scope_->IsCancelled()) {
                T value = std::move(slot_);
                slot_ = T();
                has_value_ = false;
                ++received_;
                cv_.notify_all();
                return Result<T>(std::move(value));
            }
        }
        return Result<T>::from_error(CancellationError(scope_->Reason()));
    }

    /**
     * @brief Number of values handed over so far
     */
    uint64_t delivered() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return received_;
    }

private:
    std::shared_ptr<CancellationScope> scope_;
    mutable std::mutex mutex_;
    std::condition_variable cv_;
    T slot_{};
    bool has_value_ = false;
    uint64_t sent_ = 0;
    uint64_t received_ = 0;
    // Declared last: unregistered before the mutex it locks goes away
    ScopedCancelCallback wake_;
};

} // namespace core
} // namespace gnmireverse

#endif // GNMIREVERSE_CORE_CHANNEL_H_
