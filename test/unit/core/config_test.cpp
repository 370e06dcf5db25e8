#include <gtest/gtest.h>
#include "gnmireverse/core/config.h"
#include "gnmireverse/core/error.h"
#include <string>

namespace gnmireverse {
namespace core {
namespace {

TEST(BridgeConfigTest, DefaultConstruction) {
    BridgeConfig config;
    EXPECT_EQ(config.target_addr, "127.0.0.1:6030");
    EXPECT_EQ(config.collector.address, "");
    EXPECT_EQ(config.target_value, "");
    EXPECT_TRUE(config.paths.empty());
    EXPECT_EQ(config.username, "");
    EXPECT_EQ(config.password, "");
    EXPECT_TRUE(config.collector_tls.enabled);
    EXPECT_FALSE(config.collector_tls.skip_verify);
    EXPECT_EQ(config.retry_delay.count(), 0);
    EXPECT_EQ(config.dial_timeout.count(), 0);
    EXPECT_EQ(config.log_level, "info");
}

TEST(BridgeConfigTest, ValidateRequiresCollector) {
    BridgeConfig config;
    EXPECT_THROW(config.Validate(), ConfigError);

    config.collector = CollectorAddress::Parse("10.0.0.1:6000");
    EXPECT_NO_THROW(config.Validate());
}

TEST(BridgeConfigTest, ValidateRequiresTarget) {
    BridgeConfig config;
    config.collector = CollectorAddress::Parse("10.0.0.1:6000");
    config.target_addr = "";
    EXPECT_THROW(config.Validate(), ConfigError);
}

TEST(BridgeConfigTest, ValidateSourceAddress) {
    BridgeConfig config;
    config.collector = CollectorAddress::Parse("10.0.0.1:6000");

    config.source_addr = "192.0.2.10";
    EXPECT_NO_THROW(config.Validate());

    config.source_addr = "2001:db8::1";
    EXPECT_NO_THROW(config.Validate());

    config.source_addr = "not-an-ip";
    EXPECT_THROW(config.Validate(), ConfigError);
}

TEST(BridgeConfigTest, ValidateRejectsNegativeDurations) {
    BridgeConfig config;
    config.collector = CollectorAddress::Parse("10.0.0.1:6000");

    config.retry_delay = std::chrono::milliseconds(-1);
    EXPECT_THROW(config.Validate(), ConfigError);

    config.retry_delay = std::chrono::milliseconds(0);
    config.dial_timeout = std::chrono::milliseconds(-5);
    EXPECT_THROW(config.Validate(), ConfigError);
}

TEST(CollectorAddressTest, PlainHostPort) {
    auto addr = CollectorAddress::Parse("collector.example.com:6000");
    EXPECT_EQ(addr.vrf, "");
    EXPECT_EQ(addr.address, "collector.example.com:6000");
    EXPECT_EQ(addr.ToString(), "collector.example.com:6000");
}

TEST(CollectorAddressTest, WithVrf) {
    auto addr = CollectorAddress::Parse("mgmt/10.0.0.1:6000");
    EXPECT_EQ(addr.vrf, "mgmt");
    EXPECT_EQ(addr.address, "10.0.0.1:6000");
    EXPECT_EQ(addr.ToString(), "mgmt/10.0.0.1:6000");
}

TEST(CollectorAddressTest, BracketedIpv6) {
    auto addr = CollectorAddress::Parse("[2001:db8::1]:6000");
    EXPECT_EQ(addr.vrf, "");
    EXPECT_EQ(addr.address, "[2001:db8::1]:6000");

    auto with_vrf = CollectorAddress::Parse("default/[::1]:6000");
    EXPECT_EQ(with_vrf.vrf, "default");
    EXPECT_EQ(with_vrf.address, "[::1]:6000");
}

TEST(CollectorAddressTest, SchemeTargetsPassThrough) {
    auto dns = CollectorAddress::Parse("dns:///collector:6000");
    EXPECT_EQ(dns.vrf, "");
    EXPECT_EQ(dns.address, "dns:///collector:6000");

    auto unix_socket = CollectorAddress::Parse("unix:///var/run/collector.sock");
    EXPECT_EQ(unix_socket.vrf, "");
    EXPECT_EQ(unix_socket.address, "unix:///var/run/collector.sock");
}

TEST(CollectorAddressTest, InvalidAddresses) {
    EXPECT_THROW(CollectorAddress::Parse(""), ConfigError);
    EXPECT_THROW(CollectorAddress::Parse("/10.0.0.1:6000"), ConfigError);
    EXPECT_THROW(CollectorAddress::Parse("mgmt/"), ConfigError);
    EXPECT_THROW(CollectorAddress::Parse("10.0.0.1"), ConfigError);
    EXPECT_THROW(CollectorAddress::Parse(":6000"), ConfigError);
    EXPECT_THROW(CollectorAddress::Parse("host:port"), ConfigError);
    EXPECT_THROW(CollectorAddress::Parse("host:70000"), ConfigError);
    EXPECT_THROW(CollectorAddress::Parse("[::1]6000"), ConfigError);
}

TEST(TlsConfigTest, Defaults) {
    TlsConfig tls;
    EXPECT_TRUE(tls.enabled);
    EXPECT_FALSE(tls.skip_verify);
    EXPECT_EQ(tls.cert_file, "");
    EXPECT_EQ(tls.key_file, "");
    EXPECT_EQ(tls.ca_file, "");
}

} // namespace
} // namespace core
} // namespace gnmireverse
