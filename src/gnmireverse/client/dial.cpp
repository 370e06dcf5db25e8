#include "gnmireverse/client/dial.h"
#include "gnmireverse/common/logger.h"
#include "gnmireverse/core/error.h"

#include <grpcpp/create_channel.h>

namespace gnmireverse {
namespace client {

std::shared_ptr<grpc::Channel> Dial(const std::string& address,
                                    std::shared_ptr<grpc::ChannelCredentials> credentials,
                                    const DialOptions& options) {
    if (address.empty()) {
        throw core::DialError("error dialing \"\": empty address");
    }
    if (!credentials) {
        throw core::DialError("error dialing \"" + address + "\": no transport credentials");
    }
    // TODO: bind to options.source_addr and dial inside options.vrf once the
    // network namespace support lands
    if (!options.vrf.empty()) {
        GNMIREVERSE_WARN("VRF \"{}\" is not supported yet, dialing {} in the default namespace",
                         options.vrf, address);
    }
    if (!options.source_addr.empty()) {
        GNMIREVERSE_WARN("source address {} is not supported yet, dialing {} from the default source",
                         options.source_addr, address);
    }

    auto channel = grpc::CreateChannel(address, credentials);
    if (!channel) {
        throw core::DialError("error dialing \"" + address + "\"");
    }

    if (options.timeout.count() > 0) {
        auto deadline = std::chrono::system_clock::now() + options.timeout;
        if (!channel->WaitForConnected(deadline)) {
            throw core::DialError("error dialing \"" + address + "\": not connected after " +
                                  std::to_string(options.timeout.count()) + "ms");
        }
    }
    GNMIREVERSE_DEBUG("dialed {}", address);
    return channel;
}

} // namespace client
} // namespace gnmireverse
