#include "gnmireverse/client/flags.h"
#include "gnmireverse/common/logger.h"
#include "gnmireverse/core/error.h"

#include <sstream>
#include <stdexcept>

namespace gnmireverse {
namespace client {

namespace {

bool IsBoolFlag(const std::string& name) {
    return name == "collector_tls" || name == "collector_tls_skipverify" ||
           name == "help" || name == "h";
}

bool ParseBool(const std::string& name, const std::string& value) {
    if (value == "true" || value == "1" || value == "t" || value == "TRUE" || value == "True") {
        return true;
    }
    if (value == "false" || value == "0" || value == "f" || value == "FALSE" || value == "False") {
        return false;
    }
    throw core::ConfigError("invalid boolean value \"" + value + "\" for flag -" + name);
}

std::chrono::milliseconds ParseMillis(const std::string& name, const std::string& value) {
    try {
        size_t consumed = 0;
        long long ms = std::stoll(value, &consumed);
        if (consumed != value.size() || ms < 0) {
            throw std::invalid_argument(value);
        }
        return std::chrono::milliseconds(ms);
    } catch (const std::logic_error&) {
        throw core::ConfigError("invalid value \"" + value + "\" for flag -" + name +
                                ": expected milliseconds");
    }
}

} // namespace

ParsedFlags ParseFlags(const std::vector<std::string>& args) {
    ParsedFlags parsed;
    core::BridgeConfig& config = parsed.config;
    std::string collector_addr;

    for (size_t i = 0; i < args.size(); ++i) {
        const std::string& arg = args[i];
        if (arg.size() < 2 || arg[0] != '-') {
            throw core::ConfigError("unexpected argument: " + arg);
        }
        std::string name = arg.substr(arg[1] == '-' ? 2 : 1);
        std::string value;
        bool has_value = false;
        auto eq = name.find('=');
        if (eq != std::string::npos) {
            value = name.substr(eq + 1);
            name = name.substr(0, eq);
            has_value = true;
        }
        if (name.empty()) {
            throw core::ConfigError("bad flag syntax: " + arg);
        }

        if (IsBoolFlag(name)) {
            bool flag = has_value ? ParseBool(name, value) : true;
            if (name == "collector_tls") {
                config.collector_tls.enabled = flag;
            } else if (name == "collector_tls_skipverify") {
                config.collector_tls.skip_verify = flag;
            } else {
                parsed.help = flag;
            }
            continue;
        }

        if (!has_value) {
            if (i + 1 >= args.size()) {
                throw core::ConfigError("flag needs an argument: -" + name);
            }
            value = args[++i];
        }

        if (name == "target_addr") {
            config.target_addr = value;
        } else if (name == "collector_addr") {
            collector_addr = value;
        } else if (name == "target_value") {
            config.target_value = value;
        } else if (name == "subscribe") {
            config.paths.push_back(path::ParsePath(value));
        } else if (name == "username") {
            config.username = value;
        } else if (name == "password") {
            config.password = value;
        } else if (name == "source_addr") {
            config.source_addr = value;
        } else if (name == "collector_certfile") {
            config.collector_tls.cert_file = value;
        } else if (name == "collector_keyfile") {
            config.collector_tls.key_file = value;
        } else if (name == "collector_cafile") {
            config.collector_tls.ca_file = value;
        } else if (name == "retry_delay") {
            config.retry_delay = ParseMillis(name, value);
        } else if (name == "dial_timeout") {
            config.dial_timeout = ParseMillis(name, value);
        } else if (name == "log_level") {
            common::Logger::ParseLevel(value);
            config.log_level = value;
        } else {
            throw core::ConfigError("flag provided but not defined: -" + name);
        }
    }

    if (parsed.help) {
        return parsed;
    }
    config.collector = core::CollectorAddress::Parse(collector_addr);
    config.Validate();
    return parsed;
}

std::string Usage(const std::string& program) {
    std::ostringstream out;
    out << "Usage: " << program << " [OPTIONS]\n"
        << "Options:\n"
        << "  -target_addr ADDR            address of the gNMI target (default: 127.0.0.1:6030)\n"
        << "  -collector_addr ADDR         address of collector in the form of [<vrf-name>/]address:port\n"
        << "  -target_value VALUE          value to use in the target field of the Subscribe\n"
        << "  -subscribe PATH              path to subscribe to, can be repeated\n"
        << "  -username NAME               username to authenticate with target\n"
        << "  -password PASSWORD           password to authenticate with target\n"
        << "  -source_addr ADDR            addr to use as source in connection to collector\n"
        << "  -collector_certfile FILE     TLS certificate file to authenticate with collector\n"
        << "  -collector_keyfile FILE      TLS key file to authenticate with collector\n"
        << "  -collector_cafile FILE       TLS CA file to verify collector (empty: host's root CA set)\n"
        << "  -collector_tls[=BOOL]        use TLS in connection with collector (default: true)\n"
        << "  -collector_tls_skipverify    don't verify collector's certificate (insecure)\n"
        << "  -retry_delay MS              delay between retries in milliseconds (default: 0)\n"
        << "  -dial_timeout MS             fail startup if not connected within MS (default: 0, lazy)\n"
        << "  -log_level LEVEL             trace, debug, info, warning, error, critical, off (default: info)\n"
        << "  -help, -h                    show this help message\n";
    return out.str();
}

} // namespace client
} // namespace gnmireverse
