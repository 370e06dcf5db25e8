#ifndef GNMIREVERSE_CLIENT_FLAGS_H_
#define GNMIREVERSE_CLIENT_FLAGS_H_

#include <string>
#include <vector>

#include "gnmireverse/core/config.h"

namespace gnmireverse {
namespace client {

struct ParsedFlags {
    core::BridgeConfig config;
    bool help = false;
};

/**
 * @brief Parse the command line into a validated BridgeConfig
 * 
 * Flags may be written -name value, --name value, -name=value or
 * --name=value; boolean flags also accept the bare form. -subscribe may be
 * repeated and keeps the order given.
 * @throws core::ConfigError on unknown flags, missing or malformed values,
 *         or an invalid resulting configuration
 */
ParsedFlags ParseFlags(const std::vector<std::string>& args);

std::string Usage(const std::string& program);

} // namespace client
} // namespace gnmireverse

#endif // GNMIREVERSE_CLIENT_FLAGS_H_
