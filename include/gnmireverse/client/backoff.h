#ifndef GNMIREVERSE_CLIENT_BACKOFF_H_
#define GNMIREVERSE_CLIENT_BACKOFF_H_

#include <chrono>
#include <cstdint>

namespace gnmireverse {
namespace client {

/**
 * @brief Decides how long the bridge waits before the next retry iteration
 */
class BackoffPolicy {
public:
    virtual ~BackoffPolicy() = default;

    /**
     * @param failures consecutive failed iterations so far, starting at 1
     */
    virtual std::chrono::milliseconds NextDelay(uint64_t failures) = 0;
};

/**
 * @brief Restart immediately
 */
class NoBackoff : public BackoffPolicy {
public:
    std::chrono::milliseconds NextDelay(uint64_t) override {
        return std::chrono::milliseconds(0);
    }
};

class FixedBackoff : public BackoffPolicy {
public:
    explicit FixedBackoff(std::chrono::milliseconds delay) : delay_(delay) {}

    std::chrono::milliseconds NextDelay(uint64_t) override { return delay_; }

private:
    std::chrono::milliseconds delay_;
};

} // namespace client
} // namespace gnmireverse

#endif // GNMIREVERSE_CLIENT_BACKOFF_H_
