#ifndef GNMIREVERSE_CLIENT_BRIDGE_H_
#define GNMIREVERSE_CLIENT_BRIDGE_H_

#include <atomic>
#include <cstdint>
#include <memory>
#include <string>
#include <grpcpp/channel.h>

#include "gnmireverse/client/backoff.h"
#include "gnmireverse/client/session.h"
#include "gnmireverse/client/subscriber.h"
#include "gnmireverse/core/cancellation.h"
#include "gnmireverse/core/result.h"

namespace gnmireverse {
namespace client {

enum class BridgeState {
    IDLE,        // Run() not called yet
    RUNNING,     // Both sessions active
    RESTARTING,  // Between iterations
    STOPPED      // Run() returned
};

const char* StateName(BridgeState state);

/**
 * @brief Options for the bridge orchestrator
 */
struct BridgeOptions {
    std::shared_ptr<BackoffPolicy> backoff;   // nullptr: NoBackoff
    uint64_t max_iterations = 0;              // 0: retry forever
};

struct BridgeStats {
    uint64_t iterations = 0;      // Iterations attempted
    uint64_t failures = 0;        // Iterations ended by a session error
    uint64_t forwarded = 0;       // Updates handed from subscriber to publisher
    int active_sessions = 0;      // 0 or 2 outside of transitions
};

/**
 * @brief Supervises the subscribe/publish session pair
 * 
 * Each iteration gets a fresh cancellation scope, a fresh hand-off channel
 * and a fresh pair of sessions, each on its own thread. The first session to
 * exit cancels the scope, the other one unwinds, both are joined, and the
 * next iteration starts after the backoff delay.
 */
class Bridge {
public:
    explicit Bridge(std::shared_ptr<SessionFactory> factory, BridgeOptions options = BridgeOptions());
    ~Bridge();

    // Non-copyable
    Bridge(const Bridge&) = delete;
    Bridge& operator=(const Bridge&) = delete;

    /**
     * @brief Retry iterations until Stop() or max_iterations
     */
    void Run();

    /**
     * @brief Run a single iteration
     * @return the error of the session that ended the iteration
     */
    core::Result<void> RunOnce();

    /**
     * @brief Cancel the running iteration and make Run() return. Thread-safe.
     */
    void Stop();

    bool stopped() const { return stop_.IsCancelled(); }
    BridgeState state() const { return state_.load(); }
    BridgeStats stats() const;

private:
    core::Result<void> RunGuarded(Session& session, core::CancellationScope& scope,
                                  UpdateChannel& channel);
    void SetState(BridgeState state);

    std::shared_ptr<SessionFactory> factory_;
    std::shared_ptr<BackoffPolicy> backoff_;
    uint64_t max_iterations_;

    core::CancellationScope stop_;
    std::atomic<BridgeState> state_{BridgeState::IDLE};
    std::atomic<uint64_t> iterations_{0};
    std::atomic<uint64_t> failures_{0};
    std::atomic<uint64_t> forwarded_{0};
    std::atomic<int> active_sessions_{0};
};

/**
 * @brief Session factory backed by the two long-lived gRPC channels
 */
class GrpcSessionFactory : public SessionFactory {
public:
    GrpcSessionFactory(std::shared_ptr<grpc::ChannelInterface> target_channel,
                       std::shared_ptr<grpc::ChannelInterface> collector_channel,
                       SubscribeOptions options);

    std::unique_ptr<Session> CreateSubscriber() override;
    std::unique_ptr<Session> CreatePublisher() override;

private:
    std::shared_ptr<grpc::ChannelInterface> target_channel_;
    std::shared_ptr<grpc::ChannelInterface> collector_channel_;
    SubscribeOptions options_;
};

} // namespace client
} // namespace gnmireverse

#endif // GNMIREVERSE_CLIENT_BRIDGE_H_
