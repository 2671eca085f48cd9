#include <gtest/gtest.h>
#include <fstream>
#include "config.hpp"
#include "test_helpers.hpp"

namespace {

using deskmcp::Config;
using deskmcp::test::TempDir;

TEST(ConfigTest, DefaultsMatchDocumentedValues) {
    Config c = Config::make_default();
    EXPECT_EQ(c.server.host, "127.0.0.1");
    EXPECT_EQ(c.server.port, 18790);
    EXPECT_EQ(c.server.path, "/rpc");
    EXPECT_EQ(c.liveness.tick_interval_ms, 3000);
    EXPECT_DOUBLE_EQ(c.liveness.busy_after_s, 10.0);
    EXPECT_DOUBLE_EQ(c.liveness.offline_after_s, 60.0);
    EXPECT_TRUE(c.liveness.ping_agents);
    EXPECT_TRUE(c.events.enabled);
    EXPECT_EQ(c.agent.register_attempts, 5);
}

TEST(ConfigTest, SaveAndLoadPreservesSettings) {
    TempDir dir;
    Config c;
    c.workspace = dir.path();
    c.server.port = 19000;
    c.server.api_key = "secret";
    c.registry.db_path = ":memory:";
    c.liveness.offline_after_s = 30.0;
    c.liveness.ping_agents = false;
    c.agent.server_url = "http://10.0.0.2:19000";
    c.save(dir.file("cfg/config.json"));

    Config loaded = Config::load(dir.file("cfg/config.json"));
    EXPECT_EQ(loaded.workspace, dir.path());
    EXPECT_EQ(loaded.server.port, 19000);
    EXPECT_EQ(loaded.server.api_key, "secret");
    EXPECT_EQ(loaded.registry_db_path(), ":memory:");
    EXPECT_DOUBLE_EQ(loaded.liveness.offline_after_s, 30.0);
    EXPECT_FALSE(loaded.liveness.ping_agents);
    EXPECT_EQ(loaded.agent.server_url, "http://10.0.0.2:19000");
}

TEST(ConfigTest, MissingOrBrokenFileFallsBackToDefaults) {
    TempDir dir;
    EXPECT_EQ(Config::load(dir.file("absent.json")).server.port, 18790);

    std::ofstream(dir.file("broken.json")) << "{ not json";
    EXPECT_EQ(Config::load(dir.file("broken.json")).server.port, 18790);
}

TEST(ConfigTest, RegistryPathDefaultsIntoWorkspace) {
    Config c;
    c.workspace = "/tmp/deskmcp_ws";
    EXPECT_EQ(c.registry_db_path(), "/tmp/deskmcp_ws/registry/agents.db");
    EXPECT_EQ(c.events_dir(), "/tmp/deskmcp_ws/events");
}

TEST(ConfigTest, BusyWindowIsClampedToOfflineWindow) {
    nlohmann::json j = {{"liveness", {{"busy_after_s", 90.0}, {"offline_after_s", 60.0}, {"tick_interval_ms", 0}}}};
    Config c = Config::from_json(j);
    EXPECT_DOUBLE_EQ(c.liveness.busy_after_s, 60.0);
    EXPECT_EQ(c.liveness.tick_interval_ms, 3000);
}

TEST(ParseUrlTest, SplitsHostPortAndPath) {
    auto u = deskmcp::parse_url("http://192.168.1.5:9001/agents/");
    EXPECT_EQ(u.scheme, "http");
    EXPECT_EQ(u.host, "192.168.1.5");
    EXPECT_EQ(u.port, 9001);
    EXPECT_EQ(u.path, "/agents");

    auto bare = deskmcp::parse_url("localhost");
    EXPECT_EQ(bare.host, "localhost");
    EXPECT_EQ(bare.port, 80);
}

} // namespace
