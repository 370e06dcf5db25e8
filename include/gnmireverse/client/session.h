#ifndef GNMIREVERSE_CLIENT_SESSION_H_
#define GNMIREVERSE_CLIENT_SESSION_H_

#include <memory>
#include <string>
#include <grpcpp/support/status.h>

#include "gnmireverse/core/cancellation.h"
#include "gnmireverse/core/channel.h"
#include "gnmireverse/core/result.h"
#include "proto/gen/gnmi.pb.h"

namespace gnmireverse {
namespace client {

/**
 * @brief A telemetry update exactly as received from the target
 */
using UpdatePtr = std::unique_ptr<gnmi::SubscribeResponse>;

/**
 * @brief Channel carrying updates from the subscribe to the publish session
 */
using UpdateChannel = core::HandoffChannel<UpdatePtr>;

/**
 * @brief Render a gRPC status as "code = <name> desc = <message>"
 */
std::string FormatStatus(const grpc::Status& status);

/**
 * @brief One side of the bridge, alive for a single retry iteration
 */
class Session {
public:
    virtual ~Session() = default;

    /**
     * @brief Run until the stream fails or the scope is cancelled
     * 
     * Never returns success in normal operation. A cancellation observed
     * through the scope is reported with Error::Code::CANCELLED.
     */
    virtual core::Result<void> Run(core::CancellationScope& scope, UpdateChannel& channel) = 0;

    virtual std::string name() const = 0;
};

/**
 * @brief Creates the session pair for each retry iteration
 */
class SessionFactory {
public:
    virtual ~SessionFactory() = default;

    virtual std::unique_ptr<Session> CreateSubscriber() = 0;
    virtual std::unique_ptr<Session> CreatePublisher() = 0;
};

} // namespace client
} // namespace gnmireverse

#endif // GNMIREVERSE_CLIENT_SESSION_H_
