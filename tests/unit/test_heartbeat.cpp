#include <gtest/gtest.h>
#include <stdexcept>
#include <thread>
#include "heartbeat.hpp"
#include "test_helpers.hpp"

namespace {

using deskmcp::AgentRegistry;
using deskmcp::AgentStatus;
using deskmcp::HeartbeatMonitor;
using deskmcp::LivenessConfig;
using deskmcp::RpcReply;
using deskmcp::StatusBroadcaster;
using deskmcp::StatusChange;
using deskmcp::test::CapturingSink;
using deskmcp::test::FakeClock;
using deskmcp::test::FakeTransport;
using deskmcp::test::echoing_agent;
using deskmcp::test::make_instance;

LivenessConfig quiet_config() {
    LivenessConfig cfg;
    cfg.ping_agents = false;
    return cfg;
}

TEST(ComputeStatusTest, DecaysWithElapsedTime) {
    LivenessConfig cfg;
    EXPECT_EQ(HeartbeatMonitor::compute_status(0.0, AgentStatus::Online, cfg), AgentStatus::Online);
    EXPECT_EQ(HeartbeatMonitor::compute_status(9.9, AgentStatus::Online, cfg), AgentStatus::Online);
    EXPECT_EQ(HeartbeatMonitor::compute_status(10.0, AgentStatus::Online, cfg), AgentStatus::Busy);
    EXPECT_EQ(HeartbeatMonitor::compute_status(59.0, AgentStatus::Busy, cfg), AgentStatus::Busy);
    EXPECT_EQ(HeartbeatMonitor::compute_status(60.0, AgentStatus::Busy, cfg), AgentStatus::Offline);
}

TEST(ComputeStatusTest, ErrorPersistsUntilOffline) {
    LivenessConfig cfg;
    EXPECT_EQ(HeartbeatMonitor::compute_status(1.0, AgentStatus::Error, cfg), AgentStatus::Error);
    EXPECT_EQ(HeartbeatMonitor::compute_status(30.0, AgentStatus::Error, cfg), AgentStatus::Error);
    EXPECT_EQ(HeartbeatMonitor::compute_status(61.0, AgentStatus::Error, cfg), AgentStatus::Offline);
}

TEST(ComputeStatusTest, OfflineIsNotRevivedByTimeAlone) {
    LivenessConfig cfg;
    EXPECT_EQ(HeartbeatMonitor::compute_status(0.5, AgentStatus::Offline, cfg), AgentStatus::Offline);
}

class HeartbeatTest : public ::testing::Test {
protected:
    FakeClock clock{1000.0};
    AgentRegistry registry{":memory:"};
    FakeTransport transport;
    CapturingSink events;
    StatusBroadcaster broadcaster{&events};
    std::vector<StatusChange> changes;

    void SetUp() override {
        broadcaster.subscribe([this](const StatusChange& c) { changes.push_back(c); });
    }
};

TEST_F(HeartbeatTest, SilentInstanceGoesOfflineWithOneNotificationPerTransition) {
    HeartbeatMonitor monitor(registry, transport, broadcaster, quiet_config(), clock.clock());
    registry.upsert(make_instance("FileAgent", "A", "http://a", {"search_file"}, AgentStatus::Online, 1000.0));

    EXPECT_EQ(monitor.tick(), 1);  // first sighting
    EXPECT_EQ(monitor.tick(), 0);

    clock.advance(15.0);
    EXPECT_EQ(monitor.tick(), 1);
    EXPECT_EQ(registry.get("A")->status, AgentStatus::Busy);
    EXPECT_EQ(monitor.tick(), 0);

    clock.advance(50.0);
    EXPECT_EQ(monitor.tick(), 1);
    EXPECT_EQ(registry.get("A")->status, AgentStatus::Offline);
    for (int i = 0; i < 5; i++) {
        clock.advance(3.0);
        EXPECT_EQ(monitor.tick(), 0);
    }

    ASSERT_EQ(changes.size(), 3u);
    EXPECT_FALSE(changes[0].from.has_value());
    EXPECT_EQ(changes[0].to, AgentStatus::Online);
    EXPECT_EQ(*changes[1].from, AgentStatus::Online);
    EXPECT_EQ(changes[1].to, AgentStatus::Busy);
    EXPECT_EQ(*changes[2].from, AgentStatus::Busy);
    EXPECT_EQ(changes[2].to, AgentStatus::Offline);
    EXPECT_EQ(events.of_type("broadcast").size(), 3u);
}

TEST_F(HeartbeatTest, SuccessfulPingKeepsInstanceOnlineAndRecordsLoad) {
    LivenessConfig cfg;
    HeartbeatMonitor monitor(registry, transport, broadcaster, cfg, clock.clock());
    registry.upsert(make_instance("FileAgent", "A", "http://a", {"search_file"}, AgentStatus::Online, 1000.0));
    transport.on("http://a", [](const std::string& method, const nlohmann::json&) {
        EXPECT_EQ(method, "Ping");
        return RpcReply::success({{"status", "ok"}, {"cpu_usage", 23.0}});
    });

    clock.advance(120.0);
    monitor.tick();
    auto a = registry.get("A");
    EXPECT_EQ(a->status, AgentStatus::Online);
    EXPECT_DOUBLE_EQ(a->last_seen, 1120.0);
    EXPECT_DOUBLE_EQ(a->cpu_usage, 23.0);
}

TEST_F(HeartbeatTest, PingRevivesOfflineInstance) {
    LivenessConfig cfg;
    HeartbeatMonitor monitor(registry, transport, broadcaster, cfg, clock.clock());
    registry.upsert(make_instance("FileAgent", "A", "http://a", {"search_file"}, AgentStatus::Online, 1000.0));

    clock.advance(70.0);
    monitor.tick();
    EXPECT_EQ(registry.get("A")->status, AgentStatus::Offline);

    transport.on("http://a", echoing_agent("A"));
    clock.advance(3.0);
    EXPECT_EQ(monitor.tick(), 1);
    EXPECT_EQ(registry.get("A")->status, AgentStatus::Online);
    EXPECT_EQ(changes.back().to, AgentStatus::Online);
}

TEST_F(HeartbeatTest, FailingInstanceDoesNotAbortSweep) {
    LivenessConfig cfg;
    HeartbeatMonitor monitor(registry, transport, broadcaster, cfg, clock.clock());
    registry.upsert(make_instance("BadAgent", "A", "http://a", {"x"}, AgentStatus::Online, 1000.0));
    registry.upsert(make_instance("GoodAgent", "B", "http://b", {"x"}, AgentStatus::Online, 1000.0));
    transport.on("http://a", [](const std::string&, const nlohmann::json&) -> RpcReply {
        throw std::runtime_error("handler exploded");
    });
    transport.on("http://b", echoing_agent("B"));

    clock.advance(30.0);
    EXPECT_NO_THROW(monitor.tick());
    EXPECT_DOUBLE_EQ(registry.get("B")->last_seen, 1030.0);
    EXPECT_TRUE(broadcaster.last_broadcast("B").has_value());
}

TEST_F(HeartbeatTest, ThrowingListenerDoesNotBreakNotification) {
    HeartbeatMonitor monitor(registry, transport, broadcaster, quiet_config(), clock.clock());
    broadcaster.subscribe([](const StatusChange&) { throw std::runtime_error("listener bug"); });
    registry.upsert(make_instance("FileAgent", "A", "http://a", {"x"}, AgentStatus::Online, 1000.0));

    EXPECT_EQ(monitor.tick(), 1);
    EXPECT_EQ(changes.size(), 1u);
}

TEST_F(HeartbeatTest, ErrorStatusIsKeptUntilDecay) {
    HeartbeatMonitor monitor(registry, transport, broadcaster, quiet_config(), clock.clock());
    registry.upsert(make_instance("FileAgent", "A", "http://a", {"x"}, AgentStatus::Error, 1000.0));

    clock.advance(20.0);
    monitor.tick();
    EXPECT_EQ(registry.get("A")->status, AgentStatus::Error);

    clock.advance(50.0);
    monitor.tick();
    EXPECT_EQ(registry.get("A")->status, AgentStatus::Offline);
}

TEST_F(HeartbeatTest, CallLandingMidSweepIsNotOverwritten) {
    registry.upsert(make_instance("FileAgent", "A", "http://a", {"x"}, AgentStatus::Online, 900.0));
    bool refreshed = false;
    // a dispatch refreshes A right as the sweep reads the clock for it
    auto clock_with_call = [&]() {
        if (!refreshed) {
            refreshed = true;
            registry.touch("A", 1000.0);
        }
        return 1000.0;
    };
    HeartbeatMonitor monitor(registry, transport, broadcaster, quiet_config(), clock_with_call);

    monitor.tick();
    ASSERT_TRUE(refreshed);
    auto a = registry.get("A");
    EXPECT_EQ(a->status, AgentStatus::Online);
    EXPECT_DOUBLE_EQ(a->last_seen, 1000.0);
    ASSERT_EQ(changes.size(), 1u);
    EXPECT_EQ(changes[0].to, AgentStatus::Online);
}

TEST_F(HeartbeatTest, RemovedInstancesAreForgotten) {
    HeartbeatMonitor monitor(registry, transport, broadcaster, quiet_config(), clock.clock());
    registry.upsert(make_instance("FileAgent", "A", "http://a", {"x"}, AgentStatus::Online, 1000.0));
    monitor.tick();
    ASSERT_TRUE(broadcaster.last_broadcast("A").has_value());

    registry.remove("A");
    monitor.tick();
    EXPECT_FALSE(broadcaster.last_broadcast("A").has_value());
}

TEST_F(HeartbeatTest, BackgroundLoopStartsAndStops) {
    LivenessConfig cfg = quiet_config();
    cfg.tick_interval_ms = 10;
    HeartbeatMonitor monitor(registry, transport, broadcaster, cfg, clock.clock());
    registry.upsert(make_instance("FileAgent", "A", "http://a", {"x"}, AgentStatus::Online, 1000.0));

    monitor.start();
    EXPECT_TRUE(monitor.running());
    for (int i = 0; i < 200 && !broadcaster.last_broadcast("A"); i++) {
        std::this_thread::sleep_for(std::chrono::milliseconds(5));
    }
    monitor.stop();
    EXPECT_FALSE(monitor.running());
    EXPECT_TRUE(broadcaster.last_broadcast("A").has_value());
}

} // namespace
