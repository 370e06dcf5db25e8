#ifndef GNMIREVERSE_CLIENT_PUBLISHER_H_
#define GNMIREVERSE_CLIENT_PUBLISHER_H_

#include <memory>
#include <string>
#include <grpcpp/channel.h>

#include "gnmireverse/client/session.h"
#include "proto/gen/gnmireverse.grpc.pb.h"

namespace gnmireverse {
namespace client {

/**
 * @brief Publish session: streams updates from the channel to the collector
 * 
 * The collector's response is never read; from this side Publish is a sink.
 */
class Publisher : public Session {
public:
    explicit Publisher(std::shared_ptr<grpc::ChannelInterface> collector_channel);

    core::Result<void> Run(core::CancellationScope& scope, UpdateChannel& channel) override;

    std::string name() const override { return "publish"; }

private:
    std::unique_ptr<gnmireverse::gNMIReverse::Stub> stub_;
};

} // namespace client
} // namespace gnmireverse

#endif // GNMIREVERSE_CLIENT_PUBLISHER_H_
