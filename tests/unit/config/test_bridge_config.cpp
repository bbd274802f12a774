/**
 * @file test_bridge_config.cpp
 * @brief Unit tests for configuration defaults, backoff and validation
 */

#include <gtest/gtest.h>

#include <kcenon/deck_bridge/config/bridge_config.h>

#include <chrono>

namespace kcenon::deck_bridge::test {

using namespace std::chrono_literals;

class BridgeConfigDefaultsTest : public ::testing::Test {};

TEST_F(BridgeConfigDefaultsTest, DiscoveryDefaults) {
    discovery_config cfg;
    EXPECT_EQ(cfg.mdns_hostname, "steamdeck.local");
    EXPECT_EQ(cfg.mdns_timeout, 2000ms);
    EXPECT_EQ(cfg.probe_timeout, 1000ms);
    EXPECT_EQ(cfg.port, 22);
    EXPECT_EQ(cfg.max_workers, 50u);
    EXPECT_EQ(cfg.first_host, 1u);
    EXPECT_EQ(cfg.last_host, 254u);
}

TEST_F(BridgeConfigDefaultsTest, ConnectionDefaults) {
    connection_config cfg;
    EXPECT_EQ(cfg.default_username, "deck");
    EXPECT_EQ(cfg.connect_timeout, 15000ms);
    EXPECT_EQ(cfg.keepalive_interval, 30000ms);
    EXPECT_EQ(cfg.reconnect.max_attempts, 3u);
    EXPECT_EQ(cfg.reconnect.initial_delay, 2000ms);
    EXPECT_EQ(cfg.secret_service, "DeckBridge");
}

TEST_F(BridgeConfigDefaultsTest, TransferDefaults) {
    transfer_config cfg;
    EXPECT_EQ(cfg.chunk_size, 256u * 1024u);
    EXPECT_EQ(cfg.rate_window_size, 10u);
    EXPECT_TRUE(validate(cfg));
}

class ReconnectPolicyTest : public ::testing::Test {};

TEST_F(ReconnectPolicyTest, ExponentialDelays) {
    reconnect_policy policy;

    EXPECT_EQ(policy.delay_for_attempt(0), 0ms);
    EXPECT_EQ(policy.delay_for_attempt(1), 2000ms);
    EXPECT_EQ(policy.delay_for_attempt(2), 4000ms);
    EXPECT_EQ(policy.delay_for_attempt(3), 8000ms);
}

TEST_F(ReconnectPolicyTest, CappedAtMaxDelay) {
    reconnect_policy policy;
    policy.max_delay = 5000ms;

    EXPECT_EQ(policy.delay_for_attempt(3), 5000ms);
    EXPECT_EQ(policy.delay_for_attempt(10), 5000ms);
}

TEST_F(ReconnectPolicyTest, DelaysNeverDecrease) {
    reconnect_policy policy;
    policy.initial_delay = 100ms;
    policy.backoff_multiplier = 1.5;

    auto previous = policy.delay_for_attempt(1);
    for (std::size_t attempt = 2; attempt <= 10; ++attempt) {
        auto delay = policy.delay_for_attempt(attempt);
        EXPECT_GE(delay, previous);
        previous = delay;
    }
}

class ConfigValidationTest : public ::testing::Test {};

TEST_F(ConfigValidationTest, RejectsBadDiscovery) {
    discovery_config cfg;
    cfg.max_workers = 0;
    auto r = validate(cfg);
    ASSERT_FALSE(r);
    EXPECT_EQ(r.error().code, error_code::invalid_configuration);

    cfg = discovery_config{};
    cfg.first_host = 200;
    cfg.last_host = 100;
    EXPECT_FALSE(validate(cfg));

    cfg = discovery_config{};
    cfg.mdns_hostname.clear();
    EXPECT_FALSE(validate(cfg));
}

TEST_F(ConfigValidationTest, RejectsBadConnection) {
    connection_config cfg;
    cfg.default_username.clear();
    EXPECT_FALSE(validate(cfg));

    cfg = connection_config{};
    cfg.reconnect.max_delay = 1000ms;
    EXPECT_FALSE(validate(cfg));

    cfg = connection_config{};
    cfg.reconnect.backoff_multiplier = 0.5;
    EXPECT_FALSE(validate(cfg));
}

TEST_F(ConfigValidationTest, RejectsBadTransfer) {
    transfer_config cfg;
    cfg.chunk_size = 100;
    EXPECT_FALSE(validate(cfg));

    cfg = transfer_config{};
    cfg.rate_window_size = 1;
    EXPECT_FALSE(validate(cfg));
}

class BridgeConfigBuilderTest : public ::testing::Test {};

TEST_F(BridgeConfigBuilderTest, BuildsWithOverrides) {
    auto cfg = bridge_config::builder()
                   .with_chunk_size(512 * 1024)
                   .with_keepalive_interval(15s)
                   .with_ssh_port(2222)
                   .with_username("gamer")
                   .with_host_range(10, 20)
                   .build();

    ASSERT_TRUE(cfg);
    EXPECT_EQ(cfg.value().transfer.chunk_size, 512u * 1024u);
    EXPECT_EQ(cfg.value().connection.keepalive_interval, 15000ms);
    EXPECT_EQ(cfg.value().connection.port, 2222);
    EXPECT_EQ(cfg.value().discovery.port, 2222);
    EXPECT_EQ(cfg.value().connection.default_username, "gamer");
    EXPECT_EQ(cfg.value().discovery.first_host, 10u);
    EXPECT_EQ(cfg.value().remote_start_path, "/home/deck");
}

TEST_F(BridgeConfigBuilderTest, RejectsFirstInvalidField) {
    auto cfg = bridge_config::builder().with_scan_workers(1000).build();
    ASSERT_FALSE(cfg);
    EXPECT_EQ(cfg.error().code, error_code::invalid_configuration);
    EXPECT_NE(cfg.error().message.find("scan workers"), std::string::npos);
}

TEST_F(BridgeConfigBuilderTest, RemoteStartPathMustBeAbsoluteAndSafe) {
    EXPECT_FALSE(bridge_config::builder().with_remote_start_path("home/deck").build());
    EXPECT_FALSE(bridge_config::builder().with_remote_start_path("/home/../etc").build());
    EXPECT_TRUE(bridge_config::builder().with_remote_start_path("/run/media").build());
}

TEST_F(BridgeConfigBuilderTest, ReusedBuilderKeepsItsOwnCopy) {
    bridge_config::builder builder;
    builder.with_username("gamer").with_chunk_size(128 * 1024);

    auto first = builder.build();
    auto second = builder.with_chunk_size(256 * 1024).build();

    ASSERT_TRUE(first);
    ASSERT_TRUE(second);
    EXPECT_EQ(first.value().transfer.chunk_size, 128u * 1024u);
    EXPECT_EQ(second.value().transfer.chunk_size, 256u * 1024u);
    EXPECT_EQ(second.value().connection.default_username, "gamer");
}

}  // namespace kcenon::deck_bridge::test
