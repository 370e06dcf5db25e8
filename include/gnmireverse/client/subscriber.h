#ifndef GNMIREVERSE_CLIENT_SUBSCRIBER_H_
#define GNMIREVERSE_CLIENT_SUBSCRIBER_H_

#include <memory>
#include <string>
#include <vector>
#include <grpcpp/channel.h>

#include "gnmireverse/client/session.h"
#include "gnmireverse/path/path.h"
#include "proto/gen/gnmi.grpc.pb.h"

namespace gnmireverse {
namespace client {

/**
 * @brief What to subscribe to and how to authenticate with the target
 */
struct SubscribeOptions {
    std::string target_value;           // Target field of the request prefix
    std::vector<path::Path> paths;      // One subscription per path, in order
    std::string username;               // Metadata is sent only when non-empty
    std::string password;
};

/**
 * @brief Build the single SubscribeRequest sent when a session opens
 * 
 * Every path becomes one TARGET_DEFINED subscription, leaving the sampling
 * cadence to the target.
 */
gnmi::SubscribeRequest BuildSubscribeRequest(const std::string& target_value,
                                             const std::vector<path::Path>& paths);

/**
 * @brief Subscribe session: pulls updates from the target into the channel
 */
class Subscriber : public Session {
public:
    Subscriber(std::shared_ptr<grpc::ChannelInterface> target_channel, SubscribeOptions options);

    core::Result<void> Run(core::CancellationScope& scope, UpdateChannel& channel) override;

    std::string name() const override { return "subscribe"; }

private:
    std::unique_ptr<gnmi::gNMI::Stub> stub_;
    SubscribeOptions options_;
};

} // namespace client
} // namespace gnmireverse

#endif // GNMIREVERSE_CLIENT_SUBSCRIBER_H_
