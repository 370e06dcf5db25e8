#include <gtest/gtest.h>
#include <chrono>
#include <memory>
#include <thread>
#include <vector>

#include <grpcpp/grpcpp.h>

#include "gnmireverse/client/bridge.h"
#include "gnmireverse/client/dial.h"
#include "gnmireverse/core/error.h"
#include "gnmireverse/path/path.h"
#include "test_util/fake_gnmi.h"

using namespace gnmireverse;
using namespace gnmireverse::client;
using testutil::FakeCollector;
using testutil::FakeTarget;
using testutil::TestServer;
using testutil::WaitForCondition;

namespace {

std::vector<gnmi::SubscribeResponse> MakeScript(int count) {
    std::vector<gnmi::SubscribeResponse> script;
    for (int i = 0; i < count; ++i) {
        script.push_back(testutil::MakeUpdate(i, "in-octets", 1000 + i));
    }
    return script;
}

// Every Publish call must carry a prefix of the updates the target sent on
// one Subscribe call, which always starts at timestamp 0.
void ExpectPrefixPerCall(const std::vector<std::vector<gnmi::SubscribeResponse>>& calls) {
    for (size_t c = 0; c < calls.size(); ++c) {
        for (size_t i = 0; i < calls[c].size(); ++i) {
            EXPECT_EQ(calls[c][i].update().timestamp(), static_cast<int64_t>(i))
                << "publish call " << c << " message " << i;
        }
    }
}

} // namespace

class BridgeIntegrationTest : public ::testing::Test {
protected:
    void SetUp() override {
        target_ = std::make_unique<FakeTarget>();
        collector_ = std::make_unique<FakeCollector>();
    }

    void TearDown() override {
        StopBridge();
        if (target_) {
            target_->Shutdown();
        }
        target_server_.reset();
        collector_server_.reset();
    }

    void StartServers() {
        target_server_ = std::make_unique<TestServer>(target_.get());
        collector_server_ = std::make_unique<TestServer>(collector_.get());
        ASSERT_TRUE(target_server_->started());
        ASSERT_TRUE(collector_server_->started());
    }

    std::shared_ptr<GrpcSessionFactory> MakeFactory(SubscribeOptions options) {
        auto target_channel = Dial(target_server_->address(), grpc::InsecureChannelCredentials());
        auto collector_channel = Dial(collector_server_->address(), grpc::InsecureChannelCredentials());
        return std::make_shared<GrpcSessionFactory>(target_channel, collector_channel, std::move(options));
    }

    void StartBridge(std::shared_ptr<SessionFactory> factory, BridgeOptions options = BridgeOptions()) {
        bridge_ = std::make_unique<Bridge>(std::move(factory), std::move(options));
        runner_ = std::thread([this]() { bridge_->Run(); });
    }

    void StopBridge() {
        if (bridge_) {
            bridge_->Stop();
        }
        if (runner_.joinable()) {
            runner_.join();
        }
    }

    std::unique_ptr<FakeTarget> target_;
    std::unique_ptr<FakeCollector> collector_;
    std::unique_ptr<TestServer> target_server_;
    std::unique_ptr<TestServer> collector_server_;
    std::unique_ptr<Bridge> bridge_;
    std::thread runner_;
};

TEST_F(BridgeIntegrationTest, ForwardsUpdatesUnmodifiedAndInOrder) {
    auto script = MakeScript(50);
    target_->SetScript(script, FakeTarget::AfterScript::HOLD);
    StartServers();

    SubscribeOptions options;
    options.target_value = "switch1";
    options.paths = {path::ParsePath("/interfaces/interface/state/counters")};
    StartBridge(MakeFactory(options));

    ASSERT_TRUE(WaitForCondition([this]() { return collector_->all_received().size() >= 50; }));

    auto received = collector_->all_received();
    ASSERT_EQ(received.size(), 50u);
    for (size_t i = 0; i < received.size(); ++i) {
        EXPECT_EQ(received[i].SerializeAsString(), script[i].SerializeAsString()) << "message " << i;
    }

    auto calls = target_->calls();
    ASSERT_EQ(calls.size(), 1u);
    const auto& list = calls[0].request.subscribe();
    EXPECT_EQ(list.prefix().target(), "switch1");
    ASSERT_EQ(list.subscription_size(), 1);
    EXPECT_EQ(list.subscription(0).mode(), gnmi::SubscriptionMode::TARGET_DEFINED);
    EXPECT_EQ(list.subscription(0).path().elem_size(), 4);
    EXPECT_EQ(list.subscription(0).path().elem(3).name(), "counters");

    auto start = std::chrono::steady_clock::now();
    StopBridge();
    EXPECT_LT(std::chrono::steady_clock::now() - start, std::chrono::seconds(5));
    EXPECT_EQ(bridge_->state(), BridgeState::STOPPED);
    EXPECT_EQ(bridge_->stats().failures, 0u);
}

TEST_F(BridgeIntegrationTest, SendsCredentialsAsMetadata) {
    target_->SetScript({}, FakeTarget::AfterScript::HOLD);
    StartServers();

    SubscribeOptions options;
    options.paths = {path::ParsePath("/system")};
    options.username = "admin";
    options.password = "secret";
    StartBridge(MakeFactory(options));

    ASSERT_TRUE(WaitForCondition([this]() { return target_->call_count() >= 1; }));
    auto call = target_->calls()[0];
    EXPECT_TRUE(call.has_username);
    EXPECT_EQ(call.username, "admin");
    EXPECT_EQ(call.password, "secret");
}

TEST_F(BridgeIntegrationTest, NoMetadataWithoutUsername) {
    target_->SetScript({}, FakeTarget::AfterScript::HOLD);
    StartServers();

    SubscribeOptions options;
    options.paths = {path::ParsePath("/system")};
    options.password = "ignored";
    StartBridge(MakeFactory(options));

    ASSERT_TRUE(WaitForCondition([this]() { return target_->call_count() >= 1; }));
    auto call = target_->calls()[0];
    EXPECT_FALSE(call.has_username);
    EXPECT_EQ(call.password, "");
}

TEST_F(BridgeIntegrationTest, RestartsWhenTargetClosesStream) {
    target_->SetScript(MakeScript(3), FakeTarget::AfterScript::CLOSE);
    StartServers();

    SubscribeOptions options;
    options.paths = {path::ParsePath("/interfaces")};
    BridgeOptions bridge_options;
    bridge_options.max_iterations = 3;
    bridge_ = std::make_unique<Bridge>(MakeFactory(options), bridge_options);

    bridge_->Run();

    EXPECT_EQ(target_->call_count(), 3u);
    auto stats = bridge_->stats();
    EXPECT_EQ(stats.iterations, 3u);
    EXPECT_EQ(stats.failures, 3u);
    EXPECT_EQ(stats.active_sessions, 0);
    EXPECT_LE(collector_->call_count(), 3u);
    ExpectPrefixPerCall(collector_->received());
}

TEST_F(BridgeIntegrationTest, RestartsWhenCollectorFails) {
    target_->SetScript({}, FakeTarget::AfterScript::STREAM);
    target_->SetStreamInterval(std::chrono::milliseconds(5));
    collector_->FailFirstCallAfter(5);
    StartServers();

    SubscribeOptions options;
    options.paths = {path::ParsePath("/interfaces")};
    StartBridge(MakeFactory(options));

    ASSERT_TRUE(WaitForCondition([this]() {
        auto calls = collector_->received();
        return calls.size() >= 2 && calls.back().size() >= 10;
    }));

    EXPECT_GE(target_->call_count(), 2u);
    EXPECT_GE(bridge_->stats().failures, 1u);
    EXPECT_EQ(collector_->received()[0].size(), 5u);
    ExpectPrefixPerCall(collector_->received());
}

TEST_F(BridgeIntegrationTest, UnreachableTargetEndsIteration) {
    StartServers();
    auto target_channel = Dial("127.0.0.1:1", grpc::InsecureChannelCredentials());
    auto collector_channel = Dial(collector_server_->address(), grpc::InsecureChannelCredentials());
    SubscribeOptions options;
    options.paths = {path::ParsePath("/system")};
    Bridge bridge(std::make_shared<GrpcSessionFactory>(target_channel, collector_channel, options));

    auto result = bridge.RunOnce();
    ASSERT_FALSE(result.ok());
    EXPECT_EQ(result.code(), core::Error::Code::STREAM);
    EXPECT_EQ(bridge.stats().active_sessions, 0);
}

TEST(DialTest, EmptyAddress) {
    EXPECT_THROW(Dial("", grpc::InsecureChannelCredentials()), core::DialError);
}

TEST(DialTest, TimeoutExpires) {
    DialOptions options;
    options.timeout = std::chrono::milliseconds(200);
    auto start = std::chrono::steady_clock::now();
    EXPECT_THROW(Dial("127.0.0.1:1", grpc::InsecureChannelCredentials(), options), core::DialError);
    EXPECT_LT(std::chrono::steady_clock::now() - start, std::chrono::seconds(5));
}

TEST(DialTest, LazyDialNeverFails) {
    auto channel = Dial("127.0.0.1:1", grpc::InsecureChannelCredentials());
    EXPECT_NE(channel, nullptr);
}

TEST(DialTest, ConnectsWithinTimeout) {
    FakeCollector collector;
    TestServer server(&collector);
    ASSERT_TRUE(server.started());

    DialOptions options;
    options.timeout = std::chrono::seconds(5);
    options.vrf = "mgmt";
    auto channel = Dial(server.address(), grpc::InsecureChannelCredentials(), options);
    ASSERT_NE(channel, nullptr);
    EXPECT_EQ(channel->GetState(false), GRPC_CHANNEL_READY);
}
