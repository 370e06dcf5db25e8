#include "gnmireverse/client/bridge.h"
#include "gnmireverse/client/publisher.h"
#include "gnmireverse/common/logger.h"
#include "gnmireverse/core/error.h"

#include <exception>
#include <mutex>
#include <system_error>
#include <thread>

namespace gnmireverse {
namespace client {

namespace {

/**
 * @brief First error reported by either session of an iteration
 */
struct IterationOutcome {
    std::mutex mutex;
    bool decided = false;
    std::string error;
    core::Error::Code code = core::Error::Code::UNKNOWN;

    void Record(const std::string& message, core::Error::Code c) {
        std::lock_guard<std::mutex> lock(mutex);
        if (!decided) {
            decided = true;
            error = message;
            code = c;
        }
    }
};

} // namespace

const char* StateName(BridgeState state) {
    switch (state) {
        case BridgeState::IDLE: return "idle";
        case BridgeState::RUNNING: return "running";
        case BridgeState::RESTARTING: return "restarting";
        case BridgeState::STOPPED: return "stopped";
    }
    return "unknown";
}

Bridge::Bridge(std::shared_ptr<SessionFactory> factory, BridgeOptions options)
    : factory_(std::move(factory))
    , backoff_(options.backoff ? std::move(options.backoff) : std::make_shared<NoBackoff>())
    , max_iterations_(options.max_iterations) {}

Bridge::~Bridge() {
    Stop();
}

BridgeStats Bridge::stats() const {
    BridgeStats stats;
    stats.iterations = iterations_.load();
    stats.failures = failures_.load();
    stats.forwarded = forwarded_.load();
    stats.active_sessions = active_sessions_.load();
    return stats;
}

void Bridge::Stop() {
    if (stop_.Cancel("bridge stopped")) {
        GNMIREVERSE_INFO("stopping bridge");
    }
}

core::Result<void> Bridge::RunGuarded(Session& session, core::CancellationScope& scope,
                                      UpdateChannel& channel) {
    try {
        auto result = session.Run(scope, channel);
        if (result.ok()) {
            return core::Result<void>::error(session.name() + " session ended unexpectedly",
                                             core::Error::Code::STREAM);
        }
        return result;
    } catch (const std::exception& e) {
        return core::Result<void>::error(session.name() + " session failed: " + e.what(),
                                         core::Error::Code::INTERNAL);
    }
}

void Bridge::SetState(BridgeState state) {
    BridgeState previous = state_.exchange(state);
    if (previous != state) {
        GNMIREVERSE_DEBUG("bridge state {} -> {}", StateName(previous), StateName(state));
    }
}

core::Result<void> Bridge::RunOnce() {
    auto scope = std::make_shared<core::CancellationScope>();
    UpdateChannel channel(scope);
    core::ScopedCancelCallback stop_link(stop_, [scope]() { scope->Cancel("bridge stopped"); });

    const uint64_t iteration = ++iterations_;
    GNMIREVERSE_DEBUG("starting iteration {}", iteration);

    std::unique_ptr<Session> subscriber = factory_->CreateSubscriber();
    std::unique_ptr<Session> publisher = factory_->CreatePublisher();
    if (!subscriber || !publisher) {
        SetState(BridgeState::RESTARTING);
        if (!stop_.IsCancelled()) {
            failures_.fetch_add(1);
        }
        return core::Result<void>::error("session factory returned no session",
                                         core::Error::Code::INTERNAL);
    }
    SetState(BridgeState::RUNNING);

    IterationOutcome outcome;
    auto run = [this, &scope, &channel, &outcome](Session* session) {
        auto result = RunGuarded(*session, *scope, channel);
        outcome.Record(result.error(), result.code());
        if (result.code() == core::Error::Code::CANCELLED) {
            GNMIREVERSE_DEBUG("{} session cancelled: {}", session->name(), result.error());
        }
        scope->Cancel(result.error());
        active_sessions_.fetch_sub(1);
    };

    // A session whose thread never started is taken out of the count here
    active_sessions_.fetch_add(2);
    std::thread subscribe_thread;
    std::thread publish_thread;
    try {
        subscribe_thread = std::thread(run, subscriber.get());
        publish_thread = std::thread(run, publisher.get());
    } catch (const std::system_error& e) {
        active_sessions_.fetch_sub(subscribe_thread.joinable() ? 1 : 2);
        outcome.Record(std::string("failed to start session thread: ") + e.what(),
                       core::Error::Code::INTERNAL);
        scope->Cancel(e.what());
    }

    if (subscribe_thread.joinable()) {
        subscribe_thread.join();
    }
    if (publish_thread.joinable()) {
        publish_thread.join();
    }
    forwarded_.fetch_add(channel.delivered());
    GNMIREVERSE_DEBUG("iteration {} forwarded {} update(s)", iteration, channel.delivered());
    SetState(BridgeState::RESTARTING);

    if (!stop_.IsCancelled()) {
        failures_.fetch_add(1);
    }
    return core::Result<void>::error(outcome.error, outcome.code);
}

void Bridge::Run() {
    uint64_t consecutive_failures = 0;
    while (!stop_.IsCancelled()) {
        auto result = RunOnce();
        if (stop_.IsCancelled()) {
            break;
        }
        if (!result.ok()) {
            GNMIREVERSE_ERROR("encountered error, retrying: [{}] {}",
                              core::CodeName(result.code()), result.error());
        }
        ++consecutive_failures;

        if (max_iterations_ != 0 && iterations_.load() >= max_iterations_) {
            GNMIREVERSE_INFO("reached {} iteration(s), not retrying", max_iterations_);
            break;
        }

        auto delay = backoff_->NextDelay(consecutive_failures);
        if (delay.count() > 0 && stop_.WaitFor(delay)) {
            break;
        }
    }
    SetState(BridgeState::STOPPED);
}

GrpcSessionFactory::GrpcSessionFactory(std::shared_ptr<grpc::ChannelInterface> target_channel,
                                       std::shared_ptr<grpc::ChannelInterface> collector_channel,
                                       SubscribeOptions options)
    : target_channel_(std::move(target_channel))
    , collector_channel_(std::move(collector_channel))
    , options_(std::move(options)) {}

std::unique_ptr<Session> GrpcSessionFactory::CreateSubscriber() {
    return std::make_unique<Subscriber>(target_channel_, options_);
}

std::unique_ptr<Session> GrpcSessionFactory::CreatePublisher() {
    return std::make_unique<Publisher>(collector_channel_);
}

} // namespace client
} // namespace gnmireverse
