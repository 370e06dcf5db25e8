#include "gnmireverse/core/config.h"
#include "gnmireverse/core/error.h"

#include <arpa/inet.h>
#include <netinet/in.h>
#include <cctype>

namespace gnmireverse {
namespace core {

namespace {

bool IsIpLiteral(const std::string& text) {
    in_addr v4;
    in6_addr v6;
    return inet_pton(AF_INET, text.c_str(), &v4) == 1 ||
           inet_pton(AF_INET6, text.c_str(), &v6) == 1;
}

bool IsPort(const std::string& text) {
    if (text.empty() || text.size() > 5) {
        return false;
    }
    for (char c : text) {
        if (!std::isdigit(static_cast<unsigned char>(c))) {
            return false;
        }
    }
    int port = std::stoi(text);
    return port >= 1 && port <= 65535;
}

// "scheme:" followed by '/', e.g. dns:///host:port or unix:///path
bool HasScheme(const std::string& address) {
    auto colon = address.find(':');
    if (colon == std::string::npos || colon == 0) {
        return false;
    }
    for (size_t i = 0; i < colon; ++i) {
        if (!std::isalpha(static_cast<unsigned char>(address[i]))) {
            return false;
        }
    }
    return colon + 1 < address.size() && address[colon + 1] == '/';
}

void ValidateHostPort(const std::string& address) {
    std::string host;
    std::string port;
    if (!address.empty() && address[0] == '[') {
        auto close = address.find(']');
        if (close == std::string::npos || close + 1 >= address.size() || address[close + 1] != ':') {
            throw ConfigError("invalid collector address \"" + address + "\": expected [host]:port");
        }
        host = address.substr(1, close - 1);
        port = address.substr(close + 2);
    } else {
        auto colon = address.rfind(':');
        if (colon == std::string::npos) {
            throw ConfigError("invalid collector address \"" + address + "\": missing port");
        }
        host = address.substr(0, colon);
        port = address.substr(colon + 1);
    }
    if (host.empty()) {
        throw ConfigError("invalid collector address \"" + address + "\": missing host");
    }
    if (!IsPort(port)) {
        throw ConfigError("invalid collector address \"" + address + "\": bad port \"" + port + "\"");
    }
}

} // namespace

CollectorAddress CollectorAddress::Parse(const std::string& text) {
    if (text.empty()) {
        throw ConfigError("collector address is required");
    }

    CollectorAddress result;
    auto slash = text.find('/');
    if (slash != std::string::npos && text.substr(0, slash).find(':') == std::string::npos) {
        result.vrf = text.substr(0, slash);
        result.address = text.substr(slash + 1);
        if (result.vrf.empty()) {
            throw ConfigError("invalid collector address \"" + text + "\": empty VRF name");
        }
    } else {
        result.address = text;
    }

    if (result.address.empty()) {
        throw ConfigError("invalid collector address \"" + text + "\": empty address");
    }
    if (!HasScheme(result.address)) {
        ValidateHostPort(result.address);
    }
    return result;
}

std::string CollectorAddress::ToString() const {
    return vrf.empty() ? address : vrf + "/" + address;
}

void BridgeConfig::Validate() const {
    if (target_addr.empty()) {
        throw ConfigError("target address is required");
    }
    if (collector.address.empty()) {
        throw ConfigError("collector address is required");
    }
    if (!source_addr.empty() && !IsIpLiteral(source_addr)) {
        throw ConfigError("invalid source address \"" + source_addr + "\": expected an IP address");
    }
    if (retry_delay.count() < 0) {
        throw ConfigError("retry delay must not be negative");
    }
    if (dial_timeout.count() < 0) {
        throw ConfigError("dial timeout must not be negative");
    }
}

} // namespace core
} // namespace gnmireverse
