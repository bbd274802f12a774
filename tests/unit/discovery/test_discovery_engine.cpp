/**
 * @file test_discovery_engine.cpp
 * @brief Unit tests for discovery_engine with a scripted network
 */

#include <gtest/gtest.h>

#include <kcenon/deck_bridge/discovery/discovery_engine.h>

#include <algorithm>
#include <atomic>
#include <chrono>
#include <map>
#include <mutex>
#include <set>
#include <string>
#include <thread>
#include <vector>

namespace kcenon::deck_bridge::test {

using namespace std::chrono_literals;

/**
 * @brief network_prober answering from a fixed table
 *
 * Addresses in responders answer after their latency; every other address
 * stays silent for silent_delay and then fails with timeout.
 */
class scripted_prober : public network_prober {
public:
    std::optional<std::string> local_address = std::string("192.168.1.10");
    std::map<std::string, std::chrono::milliseconds> responders;
    std::map<std::string, std::string> names;
    std::optional<std::string> mdns_address;
    std::chrono::milliseconds mdns_delay{0};
    std::chrono::milliseconds silent_delay{5};
    std::chrono::milliseconds ptr_delay{0};

    auto resolve_host(const std::string& /*name*/, std::chrono::milliseconds timeout)
        -> result<std::string> override {
        std::this_thread::sleep_for(std::min(mdns_delay, timeout));
        if (!mdns_address || mdns_delay > timeout) {
            return unexpected{error{error_code::host_unreachable, "no mDNS answer"}};
        }
        return *mdns_address;
    }

    auto probe_port(const std::string& address,
                    uint16_t port,
                    std::chrono::milliseconds /*timeout*/,
                    const std::atomic<bool>& cancel) -> result<probe_latency> override {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            probed_.emplace_back(address, port);
        }
        auto now = ++in_flight_;
        auto seen = peak_.load();
        while (now > seen && !peak_.compare_exchange_weak(seen, now)) {
        }

        auto it = responders.find(address);
        auto wait = it != responders.end() ? it->second : silent_delay;
        auto deadline = std::chrono::steady_clock::now() + wait;
        bool cancelled = false;
        while (std::chrono::steady_clock::now() < deadline) {
            if (cancel) {
                cancelled = true;
                break;
            }
            std::this_thread::sleep_for(1ms);
        }
        --in_flight_;

        if (cancelled) {
            return unexpected{error{error_code::cancelled}};
        }
        if (it == responders.end()) {
            return unexpected{error{error_code::timeout, "silent"}};
        }
        return probe_latency(it->second);
    }

    auto local_ipv4_address() -> result<std::string> override {
        if (!local_address) {
            return unexpected{error{error_code::no_network, "no interface"}};
        }
        return *local_address;
    }

    auto reverse_lookup(const std::string& address, std::chrono::milliseconds timeout)
        -> std::optional<std::string> override {
        std::this_thread::sleep_for(std::min(ptr_delay, timeout));
        if (ptr_delay > timeout) {
            return std::nullopt;
        }
        auto it = names.find(address);
        if (it == names.end()) {
            return std::nullopt;
        }
        return it->second;
    }

    auto probed() const -> std::vector<std::pair<std::string, uint16_t>> {
        std::lock_guard<std::mutex> lock(mutex_);
        return probed_;
    }

    auto peak_in_flight() const -> int { return peak_.load(); }

private:
    mutable std::mutex mutex_;
    std::vector<std::pair<std::string, uint16_t>> probed_;
    std::atomic<int> in_flight_{0};
    std::atomic<int> peak_{0};
};

class DiscoveryEngineTest : public ::testing::Test {
protected:
    void SetUp() override {
        prober_ = std::make_shared<scripted_prober>();
        config_.first_host = 1;
        config_.last_host = 50;
        config_.mdns_timeout = 500ms;
    }

    auto make_engine() -> discovery_engine {
        auto engine = discovery_engine::builder().with_config(config_).with_prober(prober_).build();
        EXPECT_TRUE(engine);
        return std::move(engine).value();
    }

    auto record_events(discovery_engine& engine) -> void {
        (void)engine.subscribe([this](const discovery_event& e) {
            std::lock_guard<std::mutex> lock(events_mutex_);
            events_.push_back(e);
        });
    }

    auto recorded() -> std::vector<discovery_event> {
        std::lock_guard<std::mutex> lock(events_mutex_);
        return events_;
    }

    std::shared_ptr<scripted_prober> prober_;
    discovery_config config_;
    std::mutex events_mutex_;
    std::vector<discovery_event> events_;
};

TEST_F(DiscoveryEngineTest, BuilderRejectsInvalidConfig) {
    config_.max_workers = 0;
    auto engine = discovery_engine::builder().with_config(config_).with_prober(prober_).build();
    ASSERT_FALSE(engine);
    EXPECT_EQ(engine.error().code, error_code::invalid_configuration);
}

TEST_F(DiscoveryEngineTest, FindsSingleResponderAmongSilentHosts) {
    prober_->responders["192.168.1.42"] = 12ms;
    auto engine = make_engine();
    record_events(engine);

    auto run = engine.discover();
    ASSERT_TRUE(run);
    ASSERT_TRUE(run.value()->wait_until_finished(5s));
    ASSERT_TRUE(engine.wait_for_events(2s));

    auto found = run.value()->devices();
    ASSERT_EQ(found.size(), 1u);
    EXPECT_EQ(found[0].address, "192.168.1.42");
    EXPECT_EQ(found[0].host, "192.168.1.42");
    EXPECT_EQ(found[0].via, discovery_source::scan);
    EXPECT_GE(found[0].response_time.count(), 12.0);

    auto outcome = run.value()->outcome();
    ASSERT_TRUE(outcome.has_value());
    ASSERT_TRUE(outcome->has_value());
    EXPECT_EQ(outcome->value().device_count, 1u);
    EXPECT_FALSE(outcome->value().cancelled);
    EXPECT_FALSE(outcome->value().timed_out);

    auto events = recorded();
    ASSERT_EQ(events.size(), 2u);
    EXPECT_EQ(events[0].type, discovery_event_type::device_found);
    EXPECT_EQ(events[1].type, discovery_event_type::discovery_complete);
    EXPECT_EQ(events[1].device_count, 1u);
}

TEST_F(DiscoveryEngineTest, FirstDeviceArrivesWithinProbeTimeout) {
    config_ = discovery_config{};
    config_.first_host = 1;
    config_.last_host = 50;
    prober_->responders["192.168.1.42"] = 12ms;
    prober_->silent_delay = config_.probe_timeout;
    prober_->mdns_delay = config_.mdns_timeout;
    auto engine = make_engine();

    auto start = std::chrono::steady_clock::now();
    auto run = engine.discover();
    ASSERT_TRUE(run);

    auto first = run.value()->next(5s);
    auto waited = std::chrono::steady_clock::now() - start;
    ASSERT_TRUE(first.has_value());
    EXPECT_EQ(first->address, "192.168.1.42");
    EXPECT_LT(waited, config_.probe_timeout);

    run.value()->cancel();
    EXPECT_TRUE(run.value()->wait_until_finished(5s));
}

TEST_F(DiscoveryEngineTest, SlowReverseLookupDoesNotDelayDevice) {
    config_.probe_timeout = 200ms;
    prober_->responders["192.168.1.42"] = 1ms;
    prober_->names["192.168.1.42"] = "deck-two";
    prober_->ptr_delay = 5s;
    auto engine = make_engine();
    record_events(engine);

    auto start = std::chrono::steady_clock::now();
    auto run = engine.discover();
    ASSERT_TRUE(run);

    auto first = run.value()->next(2s);
    ASSERT_TRUE(first.has_value());
    EXPECT_LT(std::chrono::steady_clock::now() - start, config_.probe_timeout);
    EXPECT_EQ(first->host, "192.168.1.42");

    // The lookup gives up at the probe timeout, so the run still ends.
    ASSERT_TRUE(run.value()->wait_until_finished(2s));
    ASSERT_TRUE(engine.wait_for_events(2s));

    auto found = run.value()->devices();
    ASSERT_EQ(found.size(), 1u);
    EXPECT_EQ(found[0].host, "192.168.1.42");

    auto events = recorded();
    EXPECT_TRUE(std::none_of(events.begin(), events.end(), [](const discovery_event& e) {
        return e.type == discovery_event_type::device_updated;
    }));
}

TEST_F(DiscoveryEngineTest, PtrNameRenamesDeviceAfterEmission) {
    prober_->responders["192.168.1.42"] = 1ms;
    prober_->names["192.168.1.42"] = "deck-two";
    prober_->ptr_delay = 100ms;
    auto engine = make_engine();
    record_events(engine);

    auto run = engine.discover();
    ASSERT_TRUE(run);

    auto first = run.value()->next(2s);
    ASSERT_TRUE(first.has_value());
    EXPECT_EQ(first->host, "192.168.1.42");

    ASSERT_TRUE(run.value()->wait_until_finished(5s));
    ASSERT_TRUE(engine.wait_for_events(2s));

    auto found = run.value()->devices();
    ASSERT_EQ(found.size(), 1u);
    EXPECT_EQ(found[0].host, "deck-two");
    EXPECT_EQ(found[0].via, discovery_source::scan);

    auto events = recorded();
    ASSERT_EQ(events.size(), 3u);
    EXPECT_EQ(events[0].type, discovery_event_type::device_found);
    EXPECT_EQ(events[1].type, discovery_event_type::device_updated);
    ASSERT_TRUE(events[1].found.has_value());
    EXPECT_EQ(events[1].found->host, "deck-two");
    EXPECT_EQ(events[2].type, discovery_event_type::discovery_complete);
    EXPECT_EQ(events[2].device_count, 1u);
}

TEST_F(DiscoveryEngineTest, ProbesEveryHostOnConfiguredPortOnly) {
    config_.port = 2222;
    auto engine = make_engine();

    auto run = engine.discover();
    ASSERT_TRUE(run);
    ASSERT_TRUE(run.value()->wait_until_finished(5s));

    auto probed = prober_->probed();
    ASSERT_EQ(probed.size(), 50u);
    std::set<std::string> addresses;
    for (const auto& [address, port] : probed) {
        EXPECT_EQ(port, 2222);
        addresses.insert(address);
    }
    EXPECT_EQ(addresses.size(), 50u);
    EXPECT_TRUE(addresses.contains("192.168.1.1"));
    EXPECT_TRUE(addresses.contains("192.168.1.50"));
    EXPECT_FALSE(addresses.contains("192.168.1.51"));
}

TEST_F(DiscoveryEngineTest, WorkersBoundConcurrency) {
    config_.max_workers = 8;
    config_.last_host = 40;
    prober_->silent_delay = 10ms;
    auto engine = make_engine();

    auto run = engine.discover();
    ASSERT_TRUE(run);
    ASSERT_TRUE(run.value()->wait_until_finished(5s));

    EXPECT_LE(prober_->peak_in_flight(), 8);
    EXPECT_GE(prober_->peak_in_flight(), 1);
}

TEST_F(DiscoveryEngineTest, MdnsAndScanHitReportedOnce) {
    prober_->mdns_address = "192.168.1.42";
    prober_->mdns_delay = 200ms;
    prober_->responders["192.168.1.42"] = 1ms;
    auto engine = make_engine();
    record_events(engine);

    auto run = engine.discover();
    ASSERT_TRUE(run);

    // The scan hit is not held back for the slower mDNS answer.
    auto first = run.value()->next(150ms);
    ASSERT_TRUE(first.has_value());
    EXPECT_EQ(first->via, discovery_source::scan);

    ASSERT_TRUE(run.value()->wait_until_finished(5s));
    ASSERT_TRUE(engine.wait_for_events(2s));

    auto found = run.value()->devices();
    ASSERT_EQ(found.size(), 1u);
    EXPECT_EQ(found[0].address, "192.168.1.42");
    EXPECT_EQ(found[0].via, discovery_source::mdns);
    EXPECT_EQ(found[0].host, "steamdeck.local");

    auto events = recorded();
    auto count = [&events](discovery_event_type type) {
        return std::count_if(events.begin(), events.end(),
                             [type](const discovery_event& e) { return e.type == type; });
    };
    EXPECT_EQ(count(discovery_event_type::device_found), 1);
    EXPECT_EQ(count(discovery_event_type::device_updated), 1);
    ASSERT_FALSE(events.empty());
    EXPECT_EQ(events.back().type, discovery_event_type::discovery_complete);
    EXPECT_EQ(events.back().device_count, 1u);
}

TEST_F(DiscoveryEngineTest, LaterPtrNameNeverReplacesMdnsName) {
    prober_->mdns_address = "192.168.1.42";
    prober_->mdns_delay = 30ms;
    prober_->responders["192.168.1.42"] = 1ms;
    prober_->names["192.168.1.42"] = "deck-two";
    prober_->ptr_delay = 100ms;
    auto engine = make_engine();

    auto run = engine.discover();
    ASSERT_TRUE(run);
    ASSERT_TRUE(run.value()->wait_until_finished(5s));

    auto found = run.value()->devices();
    ASSERT_EQ(found.size(), 1u);
    EXPECT_EQ(found[0].host, "steamdeck.local");
    EXPECT_EQ(found[0].via, discovery_source::mdns);
}

TEST_F(DiscoveryEngineTest, MdnsAndScanFindDifferentDevices) {
    prober_->mdns_address = "192.168.1.7";
    prober_->responders["192.168.1.42"] = 1ms;
    prober_->names["192.168.1.42"] = "deck-two";
    auto engine = make_engine();

    auto run = engine.discover();
    ASSERT_TRUE(run);
    ASSERT_TRUE(run.value()->wait_until_finished(5s));

    auto found = run.value()->devices();
    ASSERT_EQ(found.size(), 2u);
    std::map<std::string, device> by_address;
    for (const auto& d : found) {
        by_address[d.address] = d;
    }
    ASSERT_TRUE(by_address.contains("192.168.1.7"));
    ASSERT_TRUE(by_address.contains("192.168.1.42"));
    EXPECT_EQ(by_address["192.168.1.7"].via, discovery_source::mdns);
    EXPECT_EQ(by_address["192.168.1.42"].host, "deck-two");
    EXPECT_EQ(by_address["192.168.1.42"].via, discovery_source::scan);
}

TEST_F(DiscoveryEngineTest, NoNetworkIsDistinctFromEmptyResult) {
    prober_->local_address.reset();
    auto engine = make_engine();
    record_events(engine);

    auto run = engine.discover();
    ASSERT_TRUE(run);
    ASSERT_TRUE(run.value()->wait_until_finished(5s));
    ASSERT_TRUE(engine.wait_for_events(2s));

    auto outcome = run.value()->outcome();
    ASSERT_TRUE(outcome.has_value());
    ASSERT_FALSE(outcome->has_value());
    EXPECT_EQ(outcome->error().code, error_code::no_network);
    EXPECT_TRUE(prober_->probed().empty());

    auto events = recorded();
    ASSERT_FALSE(events.empty());
    EXPECT_EQ(events.back().type, discovery_event_type::discovery_error);
}

TEST_F(DiscoveryEngineTest, EmptySubnetCompletesWithZeroDevices) {
    auto engine = make_engine();

    auto run = engine.discover();
    ASSERT_TRUE(run);
    ASSERT_TRUE(run.value()->wait_until_finished(5s));

    auto outcome = run.value()->outcome();
    ASSERT_TRUE(outcome.has_value());
    ASSERT_TRUE(outcome->has_value());
    EXPECT_EQ(outcome->value().device_count, 0u);
}

TEST_F(DiscoveryEngineTest, CancelStopsOutstandingProbes) {
    config_.last_host = 254;
    prober_->silent_delay = 5s;
    auto engine = make_engine();
    record_events(engine);

    auto start = std::chrono::steady_clock::now();
    auto run = engine.discover();
    ASSERT_TRUE(run);
    std::this_thread::sleep_for(50ms);
    run.value()->cancel();

    ASSERT_TRUE(run.value()->wait_until_finished(2s));
    EXPECT_LT(std::chrono::steady_clock::now() - start, 3s);

    auto outcome = run.value()->outcome();
    ASSERT_TRUE(outcome.has_value());
    ASSERT_TRUE(outcome->has_value());
    EXPECT_TRUE(outcome->value().cancelled);

    ASSERT_TRUE(engine.wait_for_events(2s));
    auto events = recorded();
    ASSERT_FALSE(events.empty());
    EXPECT_EQ(events.back().type, discovery_event_type::discovery_complete);
    EXPECT_TRUE(events.back().cancelled);
}

TEST_F(DiscoveryEngineTest, TimeoutHintEndsRun) {
    prober_->silent_delay = 5s;
    auto engine = make_engine();

    auto run = engine.discover(100ms);
    ASSERT_TRUE(run);
    ASSERT_TRUE(run.value()->wait_until_finished(3s));

    auto outcome = run.value()->outcome();
    ASSERT_TRUE(outcome.has_value());
    ASSERT_TRUE(outcome->has_value());
    EXPECT_TRUE(outcome->value().timed_out);
    EXPECT_FALSE(outcome->value().cancelled);
}

TEST_F(DiscoveryEngineTest, SecondRunRejectedWhileActive) {
    prober_->silent_delay = 300ms;
    auto engine = make_engine();

    auto first = engine.discover();
    ASSERT_TRUE(first);
    EXPECT_TRUE(engine.is_running());

    auto second = engine.discover();
    ASSERT_FALSE(second);
    EXPECT_EQ(second.error().code, error_code::invalid_state_transition);

    ASSERT_TRUE(first.value()->wait_until_finished(5s));
    EXPECT_FALSE(engine.is_running());

    auto third = engine.discover();
    ASSERT_TRUE(third);
    third.value()->cancel();
    EXPECT_TRUE(third.value()->wait_until_finished(5s));
}

TEST_F(DiscoveryEngineTest, NextHandsOutDevicesThenEnds) {
    prober_->responders["192.168.1.3"] = 1ms;
    prober_->responders["192.168.1.4"] = 1ms;
    auto engine = make_engine();

    auto run = engine.discover();
    ASSERT_TRUE(run);

    std::set<std::string> seen;
    while (true) {
        auto d = run.value()->next(2s);
        if (!d) {
            break;
        }
        seen.insert(d->address);
    }
    EXPECT_TRUE(run.value()->is_finished());
    EXPECT_EQ(seen, (std::set<std::string>{"192.168.1.3", "192.168.1.4"}));
}

class SubnetBaseTest : public ::testing::Test {};

TEST_F(SubnetBaseTest, DropsLastOctet) {
    EXPECT_EQ(subnet_base("192.168.1.10"), "192.168.1");
    EXPECT_EQ(subnet_base("10.0.0.1"), "10.0.0");
}

TEST_F(SubnetBaseTest, RejectsNonIpv4) {
    EXPECT_FALSE(subnet_base("steamdeck.local").has_value());
    EXPECT_FALSE(subnet_base("").has_value());
    EXPECT_FALSE(subnet_base("::1").has_value());
}

}  // namespace kcenon::deck_bridge::test
