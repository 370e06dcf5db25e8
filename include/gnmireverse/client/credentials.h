#ifndef GNMIREVERSE_CLIENT_CREDENTIALS_H_
#define GNMIREVERSE_CLIENT_CREDENTIALS_H_

#include <memory>
#include <string>
#include <grpcpp/security/credentials.h>

#include "gnmireverse/core/config.h"

namespace gnmireverse {
namespace client {

/**
 * @brief Transport security for the collector connection
 * 
 * Holds PEM data that has already been read and checked, so turning it into
 * gRPC channel credentials cannot fail on bad input.
 */
struct TransportCredentials {
    enum class Security {
        INSECURE,        // Plaintext
        TLS,             // TLS, server verified against root_certs or the system store
        TLS_SKIP_VERIFY  // TLS, any server certificate accepted (insecure)
    };

    Security security = Security::INSECURE;
    std::string root_certs_pem;     // Empty: system trust store
    std::string cert_chain_pem;     // Client identity, optional
    std::string private_key_pem;

    bool has_client_identity() const { return !cert_chain_pem.empty(); }

    std::shared_ptr<grpc::ChannelCredentials> ToChannelCredentials() const;

    /**
     * @brief Short description for the startup log, never includes key material
     */
    std::string Describe() const;
};

/**
 * @brief Build collector credentials from the TLS flags
 * 
 * Reads and parses the referenced files only; no network I/O.
 * @throws core::ConfigError on unreadable or malformed files, or a client
 *         certificate without a key
 */
TransportCredentials BuildCredentials(const core::TlsConfig& tls);

} // namespace client
} // namespace gnmireverse

#endif // GNMIREVERSE_CLIENT_CREDENTIALS_H_
