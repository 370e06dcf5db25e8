#include <memory>
#include <string>
#include <iostream>
#include <csignal>
#include <thread>
#include <atomic>
#include <chrono>
#include <vector>
#include "gnmireverse/common/logger.h"
#include "gnmireverse/core/config.h"
#include "gnmireverse/core/error.h"
#include "gnmireverse/client/bridge.h"
#include "gnmireverse/client/credentials.h"
#include "gnmireverse/client/dial.h"
#include "gnmireverse/client/flags.h"
#include <grpcpp/security/credentials.h>

// Global flag for shutdown
std::atomic<bool> g_running(true);

void SignalHandler(int signal) {
    if (signal == SIGINT || signal == SIGTERM) {
        g_running.store(false);
    }
}

namespace gnmireverse {

class ReverseClient {
public:
    explicit ReverseClient(core::BridgeConfig config) : config_(std::move(config)) {}

    /**
     * @throws core::ConfigError or core::DialError; both are fatal
     */
    void Start() {
        GNMIREVERSE_INFO("target {}, collector {}, subscribing to [{}]",
                         config_.target_addr, config_.collector.ToString(),
                         path::JoinPaths(config_.paths));

        client::TransportCredentials collector_creds = client::BuildCredentials(config_.collector_tls);
        GNMIREVERSE_INFO("collector transport: {}", collector_creds.Describe());

        client::DialOptions collector_opts;
        collector_opts.timeout = config_.dial_timeout;
        collector_opts.vrf = config_.collector.vrf;
        collector_opts.source_addr = config_.source_addr;
        auto collector_channel = client::Dial(config_.collector.address,
                                              collector_creds.ToChannelCredentials(),
                                              collector_opts);

        client::DialOptions target_opts;
        target_opts.timeout = config_.dial_timeout;
        auto target_channel = client::Dial(config_.target_addr,
                                           grpc::InsecureChannelCredentials(), target_opts);

        client::SubscribeOptions subscribe;
        subscribe.target_value = config_.target_value;
        subscribe.paths = config_.paths;
        subscribe.username = config_.username;
        subscribe.password = config_.password;

        client::BridgeOptions bridge_opts;
        if (config_.retry_delay.count() > 0) {
            bridge_opts.backoff = std::make_shared<client::FixedBackoff>(config_.retry_delay);
        }
        bridge_ = std::make_unique<client::Bridge>(
            std::make_shared<client::GrpcSessionFactory>(target_channel, collector_channel,
                                                         std::move(subscribe)),
            bridge_opts);

        bridge_thread_ = std::thread([this]() { bridge_->Run(); });
    }

    ~ReverseClient() { Stop(); }

    void Stop() {
        if (!bridge_thread_.joinable()) {
            return;
        }
        bridge_->Stop();
        bridge_thread_.join();
        GNMIREVERSE_INFO("gnmireverse client stopped");
    }

    void Wait() {
        while (g_running.load() && bridge_->state() != client::BridgeState::STOPPED) {
            std::this_thread::sleep_for(std::chrono::milliseconds(100));
        }
        Stop();
    }

private:
    core::BridgeConfig config_;
    std::unique_ptr<client::Bridge> bridge_;
    std::thread bridge_thread_;
};

} // namespace gnmireverse

int main(int argc, char* argv[]) {
    std::signal(SIGINT, SignalHandler);
    std::signal(SIGTERM, SignalHandler);

    gnmireverse::common::Logger::Init();

    std::vector<std::string> args(argv + 1, argv + argc);
    gnmireverse::client::ParsedFlags flags;
    try {
        flags = gnmireverse::client::ParseFlags(args);
    } catch (const gnmireverse::core::ConfigError& e) {
        std::cerr << e.what() << std::endl;
        std::cerr << gnmireverse::client::Usage(argv[0]);
        return 2;
    }
    if (flags.help) {
        std::cout << gnmireverse::client::Usage(argv[0]);
        return 0;
    }
    gnmireverse::common::Logger::SetLevel(
        gnmireverse::common::Logger::ParseLevel(flags.config.log_level));

    try {
        gnmireverse::ReverseClient client(std::move(flags.config));
        client.Start();
        client.Wait();
        return 0;
    } catch (const gnmireverse::core::Error& e) {
        GNMIREVERSE_CRITICAL("{}", e.what());
        return 1;
    } catch (const std::exception& e) {
        GNMIREVERSE_CRITICAL("Fatal error: {}", e.what());
        return 1;
    }
}
