#pragma once

#include <chrono>
#include <string>
#include <vector>

#include "gnmireverse/path/path.h"

namespace gnmireverse {
namespace core {

/**
 * @brief TLS settings for the collector connection
 */
struct TlsConfig {
    bool enabled = true;        // Use TLS towards the collector
    bool skip_verify = false;   // Accept any server certificate (insecure)
    std::string cert_file;      // Client certificate (PEM)
    std::string key_file;       // Client private key (PEM)
    std::string ca_file;        // Trusted roots (PEM), empty for the system store
};

/**
 * @brief Collector address in the form [<vrf-name>/]address:port
 */
struct CollectorAddress {
    std::string vrf;            // Network namespace, accepted but not applied
    std::string address;        // gRPC dial target

    /**
     * @throws ConfigError if the address is empty or structurally invalid
     */
    static CollectorAddress Parse(const std::string& text);

    std::string ToString() const;
};

/**
 * @brief Validated configuration of one bridge process
 */
struct BridgeConfig {
    std::string target_addr = "127.0.0.1:6030";
    CollectorAddress collector;
    std::string target_value;               // Target field of the subscribe prefix
    std::vector<path::Path> paths;          // Operator order, duplicates kept
    std::string username;
    std::string password;
    std::string source_addr;                // Accepted but not applied
    TlsConfig collector_tls;
    std::chrono::milliseconds retry_delay{0};   // Delay between retry iterations
    std::chrono::milliseconds dial_timeout{0};  // 0 dials lazily
    std::string log_level = "info";

    /**
     * @throws ConfigError describing the first invalid field
     */
    void Validate() const;
};

} // namespace core
} // namespace gnmireverse
