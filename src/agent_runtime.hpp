#pragma once
#include "agent_types.hpp"
#include "config.hpp"
#include "load_metric.hpp"
#include "mcp_client.hpp"
#include "tool_registry.hpp"
#include "rpc/http_endpoint.hpp"
#include "rpc/transport.hpp"
#include <atomic>
#include <condition_variable>
#include <mutex>
#include <string>
#include <thread>

namespace deskmcp {

// What every capability agent runs on: serves its ToolRegistry as
// ToolsCall/Ping on its own endpoint, registers with the MCP server at
// startup, heartbeats, and re-registers when the server has forgotten it.
//
// Register tools before start().
class AgentRuntime {
public:
    AgentRuntime(std::string name, AgentConfig cfg, RpcTransport& transport,
                 std::string host = "127.0.0.1", int port = 0);
    ~AgentRuntime();

    AgentRuntime(const AgentRuntime&) = delete;
    AgentRuntime& operator=(const AgentRuntime&) = delete;

    ToolRegistry& tools() { return tools_; }
    const std::string& name() const { return name_; }

    // Starts the endpoint, registers (with retries) and starts heartbeating.
    // Returns false only if the endpoint could not bind; a server that is
    // not up yet is retried from the heartbeat loop.
    bool start();
    // Unregisters and shuts the endpoint down.
    void stop();
    bool running() const { return running_; }

    // Status announced with each heartbeat; error stays until changed.
    void set_reported_status(AgentStatus s) { reported_status_ = s; }

    std::string instance_id() const;
    bool registered() const { return !instance_id().empty(); }
    AgentAddress address() const;

    nlohmann::json registration_info();
    bool register_with_server(int attempts);
    bool send_heartbeat();

    // Method bodies, also callable in-process.
    nlohmann::json handle_tools_call(const nlohmann::json& params);
    nlohmann::json handle_ping();

private:
    std::string name_;
    AgentConfig cfg_;
    McpClient client_;
    ToolRegistry tools_;
    RpcEndpoint endpoint_;
    ProcessCpuSampler cpu_;
    std::atomic<AgentStatus> reported_status_{AgentStatus::Online};

    mutable std::mutex id_mutex_;
    std::string instance_id_;

    std::atomic<bool> running_{false};
    std::thread thread_;
    std::mutex wait_mutex_;
    std::condition_variable wake_;

    void run_loop();
    // false when stop() interrupted the wait
    bool wait_for(std::chrono::milliseconds d);
    void set_instance_id(const std::string& id);
};

} // namespace deskmcp
