#ifndef GNMIREVERSE_CLIENT_DIAL_H_
#define GNMIREVERSE_CLIENT_DIAL_H_

#include <chrono>
#include <memory>
#include <string>
#include <grpcpp/channel.h>
#include <grpcpp/security/credentials.h>

namespace gnmireverse {
namespace client {

/**
 * @brief Options for creating a long-lived connection
 */
struct DialOptions {
    std::chrono::milliseconds timeout{0};   // 0: connect lazily on first call
    std::string vrf;                        // Not applied yet
    std::string source_addr;                // Not applied yet
};

/**
 * @brief Create a gRPC channel to the given address
 * 
 * The channel is shared by every retry iteration; only the streams on top of
 * it are re-established.
 * @throws core::DialError if the address is empty, or if a positive timeout
 *         elapses before the channel is ready
 */
std::shared_ptr<grpc::Channel> Dial(const std::string& address,
                                    std::shared_ptr<grpc::ChannelCredentials> credentials,
                                    const DialOptions& options = DialOptions());

} // namespace client
} // namespace gnmireverse

#endif // GNMIREVERSE_CLIENT_DIAL_H_
