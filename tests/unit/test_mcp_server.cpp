#include <gtest/gtest.h>
#include <set>
#include <thread>
#include <vector>
#include "mcp_server.hpp"
#include "test_helpers.hpp"

namespace {

using deskmcp::AgentRegistry;
using deskmcp::AgentStatus;
using deskmcp::Config;
using deskmcp::McpServer;
using deskmcp::RpcEndpoint;
using deskmcp::test::CapturingSink;
using deskmcp::test::FakeClock;
using deskmcp::test::FakeLoadMetric;
using deskmcp::test::FakeTransport;
using deskmcp::test::echoing_agent;

Config test_config() {
    Config cfg;
    cfg.registry.db_path = ":memory:";
    cfg.liveness.ping_agents = false;
    return cfg;
}

nlohmann::json file_agent_info(const std::string& service) {
    return {
        {"name", "FileAgent"},
        {"service", service},
        {"tools", {
            {{"name", "search_file"}, {"description", "Search for files"}},
            {{"name", "FileAgent.read_file"}, {"description", "Read a file"}}
        }}
    };
}

class McpServerTest : public ::testing::Test {
protected:
    FakeClock clock{1000.0};
    FakeTransport transport;
    FakeLoadMetric load;
    CapturingSink events;
    McpServer server{test_config(), std::make_unique<AgentRegistry>(":memory:"),
                     transport, load, clock.clock(), &events};

    std::string register_at(const std::string& service) {
        auto reply = server.agent_register(file_agent_info(service));
        EXPECT_TRUE(reply["success"].get<bool>()) << reply.dump();
        return reply.value("instance_id", "");
    }
};

TEST_F(McpServerTest, PingReportsService) {
    auto j = server.ping();
    EXPECT_EQ(j["status"], "ok");
    EXPECT_EQ(j["service"], "DeskMCP Master Agent");
    EXPECT_DOUBLE_EQ(j["timestamp"].get<double>(), 1000.0);
}

TEST_F(McpServerTest, RegisterAssignsDistinctInstanceIds) {
    std::string a = register_at("http://a");
    std::string b = register_at("http://b");
    EXPECT_FALSE(a.empty());
    EXPECT_NE(a, b);
    EXPECT_EQ(a.rfind("FileAgent_", 0), 0u);

    auto instances = server.registry().get_by_logical_name("FileAgent");
    ASSERT_EQ(instances.size(), 2u);
    std::set<std::string> ids{instances[0].instance_id, instances[1].instance_id};
    EXPECT_EQ(ids, (std::set<std::string>{a, b}));
    EXPECT_TRUE(instances[0].declares("read_file"));
}

TEST_F(McpServerTest, RegisterWithMissingFieldsNeverMutatesRegistry) {
    for (const char* field : {"name", "service", "tools"}) {
        auto info = file_agent_info("http://a");
        info.erase(field);
        auto reply = server.agent_register(info);
        EXPECT_FALSE(reply["success"].get<bool>()) << field;
        EXPECT_EQ(reply["error_type"], "malformed_request");
        EXPECT_EQ(reply["field"], field);
        EXPECT_FALSE(reply.contains("instance_id"));
    }
    auto reply = server.agent_register("not an object");
    EXPECT_FALSE(reply["success"].get<bool>());
    EXPECT_EQ(server.registry().size(), 0u);
}

TEST_F(McpServerTest, RegisterAcceptsEncodedInfo) {
    auto reply = server.agent_register({{"agent_info_json", file_agent_info("http://a").dump()}});
    EXPECT_TRUE(reply["success"].get<bool>()) << reply.dump();

    auto bad = server.agent_register({{"agent_info_json", "{broken"}});
    EXPECT_FALSE(bad["success"].get<bool>());
    EXPECT_EQ(server.registry().size(), 1u);
}

TEST_F(McpServerTest, ReRegistrationAtSameAddressReplacesInstance) {
    std::string first = register_at("http://a");
    clock.advance(5.0);
    auto reply = server.agent_register(file_agent_info("http://a"));
    ASSERT_TRUE(reply["success"].get<bool>());
    EXPECT_EQ(reply["replaced"], first);
    EXPECT_EQ(server.registry().size(), 1u);
    EXPECT_FALSE(server.registry().contains(first));
}

TEST_F(McpServerTest, ConcurrentRegistrationsAtOneAddressLeaveOneInstance) {
    std::vector<std::thread> threads;
    for (int i = 0; i < 8; i++) {
        threads.emplace_back([this]() { server.agent_register(file_agent_info("http://a")); });
    }
    for (auto& t : threads) t.join();
    EXPECT_EQ(server.registry().size(), 1u);
}

TEST_F(McpServerTest, UnregisterTwiceIsNotFoundNotCrash) {
    std::string id = register_at("http://a");
    auto first = server.agent_unregister({{"identifier", id}});
    EXPECT_TRUE(first["success"].get<bool>());

    auto second = server.agent_unregister({{"identifier", id}});
    EXPECT_FALSE(second["success"].get<bool>());
    EXPECT_EQ(second["error_type"], "not_found");

    auto missing = server.agent_unregister(nlohmann::json::object());
    EXPECT_EQ(missing["error_type"], "malformed_request");
}

TEST_F(McpServerTest, UnregisterByLogicalNameRemovesAllInstances) {
    register_at("http://a");
    register_at("http://b");
    auto reply = server.agent_unregister({{"name", "FileAgent"}});
    ASSERT_TRUE(reply["success"].get<bool>());
    EXPECT_EQ(reply["removed"].size(), 2u);
    EXPECT_EQ(server.registry().size(), 0u);
}

TEST_F(McpServerTest, ToolsListQualifiesAgentTools) {
    register_at("http://a");
    auto j = server.tools_list();
    std::set<std::string> names;
    for (auto& t : j["tools"]) names.insert(t["name"].get<std::string>());
    EXPECT_EQ(names, (std::set<std::string>{"echo", "server_time", "FileAgent.search_file", "FileAgent.read_file"}));
    EXPECT_EQ(j["total"], 4);
}

TEST_F(McpServerTest, ToolsCallRoutesToRegisteredAgent) {
    std::string id = register_at("http://a");
    transport.on("http://a", echoing_agent("A"));

    auto reply = server.tools_call({{"tool_name", "FileAgent.search_file"}, {"parameters", {{"pattern", "*.log"}}}});
    ASSERT_TRUE(reply["success"].get<bool>()) << reply.dump();
    EXPECT_EQ(reply["result"]["served_by"], "A");
    EXPECT_EQ(reply["result"]["parameters"]["pattern"], "*.log");
    EXPECT_EQ(reply["instance_id"], id);
    EXPECT_FALSE(reply.contains("error"));
}

TEST_F(McpServerTest, ToolsCallAcceptsParametersAsJsonString) {
    auto reply = server.tools_call({{"tool_name", "echo"}, {"parameters_json", R"({"message":"hello"})"}});
    ASSERT_TRUE(reply["success"].get<bool>()) << reply.dump();
    EXPECT_EQ(reply["result"]["echo"], "hello");

    auto bad = server.tools_call({{"tool_name", "echo"}, {"parameters_json", "{nope"}});
    EXPECT_FALSE(bad["success"].get<bool>());
    EXPECT_EQ(bad["error_type"], "malformed_request");

    auto no_name = server.tools_call({{"parameters", nlohmann::json::object()}});
    EXPECT_EQ(no_name["error_type"], "malformed_request");
}

TEST_F(McpServerTest, FailoverShowsUpInAgentsList) {
    std::string a = register_at("http://a");
    std::string b = register_at("http://b");
    load.set(a, 10.0);
    load.set(b, 90.0);
    transport.on("http://b", echoing_agent("B"));

    auto reply = server.tools_call({{"tool_name", "FileAgent.search_file"}, {"parameters", nlohmann::json::object()}});
    ASSERT_TRUE(reply["success"].get<bool>()) << reply.dump();
    EXPECT_EQ(reply["instance_id"], b);
    EXPECT_TRUE(reply["failover"].get<bool>());

    auto list = server.agents_list();
    ASSERT_EQ(list["total"], 2);
    for (auto& agent : list["agents"]) {
        if (agent["instance_id"] == a) {
            EXPECT_FALSE(agent["is_alive"].get<bool>());
            EXPECT_EQ(agent["status"], "offline");
        } else {
            EXPECT_TRUE(agent["is_alive"].get<bool>());
        }
        EXPECT_EQ(agent["tools_count"], 2);
    }
}

TEST_F(McpServerTest, UnknownAgentCallIsNotFound) {
    register_at("http://a");
    auto reply = server.tools_call({{"tool_name", "UnknownAgent.do_thing"}, {"parameters", nlohmann::json::object()}});
    EXPECT_FALSE(reply["success"].get<bool>());
    EXPECT_EQ(reply["error_type"], "not_found");
    EXPECT_NE(reply["error"].get<std::string>().find("not found"), std::string::npos);
    EXPECT_FALSE(reply.contains("result"));
    EXPECT_EQ(server.registry().size(), 1u);
}

TEST_F(McpServerTest, StatusUpdatesAndQueries) {
    std::string id = register_at("http://a");

    clock.advance(30.0);
    auto upd = server.update_agent_status({{"instance_id", id}, {"status", "error"}, {"cpu_usage", 77.0}});
    ASSERT_TRUE(upd["success"].get<bool>()) << upd.dump();

    auto st = server.get_agent_status({{"instance_id", id}});
    EXPECT_EQ(st["status"], "error");
    EXPECT_FALSE(st["is_alive"].get<bool>());
    EXPECT_DOUBLE_EQ(st["last_seen"].get<double>(), 1030.0);
    EXPECT_DOUBLE_EQ(st["cpu_usage"].get<double>(), 77.0);

    server.update_agent_status({{"instance_id", id}, {"status", "online"}});
    EXPECT_EQ(server.get_agent_status({{"instance_id", id}})["status"], "online");

    auto invalid = server.update_agent_status({{"instance_id", id}, {"status", "sleepy"}});
    EXPECT_EQ(invalid["error_type"], "malformed_request");
    auto unknown = server.update_agent_status({{"instance_id", "ghost"}, {"status", "online"}});
    EXPECT_EQ(unknown["error_type"], "not_found");
    auto missing = server.get_agent_status({{"instance_id", "ghost"}});
    EXPECT_EQ(missing["error_type"], "not_found");
}

TEST_F(McpServerTest, LivenessTickMarksSilentAgentOffline) {
    std::string id = register_at("http://a");
    clock.advance(61.0);
    server.heartbeat().tick();

    auto st = server.get_agent_status({{"instance_id", id}});
    EXPECT_EQ(st["status"], "offline");
    EXPECT_FALSE(events.of_type("broadcast").empty());
}

TEST_F(McpServerTest, BindExposesWireMethods) {
    RpcEndpoint endpoint("127.0.0.1", 0, "/rpc", deskmcp::kMasterInterface);
    server.bind(endpoint);
    for (const char* m : {"Ping", "ToolsList", "ToolsCall", "AgentRegister", "AgentUnregister",
                          "AgentsList", "GetAgentStatus", "UpdateAgentStatus"}) {
        EXPECT_TRUE(endpoint.has_method(m)) << m;
    }

    nlohmann::json reply;
    EXPECT_EQ(endpoint.invoke("Ping", nlohmann::json::object(), reply), 200);
    EXPECT_EQ(reply["status"], "ok");
    EXPECT_EQ(endpoint.invoke("Shutdown", nlohmann::json::object(), reply), 404);
    EXPECT_FALSE(reply["success"].get<bool>());
}

} // namespace
