#pragma once
#include "agent_types.hpp"
#include "call_result.hpp"
#include "rpc/transport.hpp"
#include <chrono>
#include <optional>
#include <string>
#include <nlohmann/json.hpp>

namespace deskmcp {

// Typed calls against the MCP server's RPC surface. Used by agents to
// register and heartbeat, and by the CLI. Transport failures come back as
// failure envelopes, never as exceptions.
class McpClient {
public:
    McpClient(RpcTransport& transport, AgentAddress server,
              std::chrono::milliseconds timeout = std::chrono::milliseconds(10000))
        : transport_(transport), server_(std::move(server)), timeout_(timeout) {}

    nlohmann::json ping();
    nlohmann::json list_tools();
    nlohmann::json call_tool(const std::string& tool_name, const nlohmann::json& parameters);
    nlohmann::json register_agent(const nlohmann::json& info);
    nlohmann::json unregister_agent(const std::string& identifier);
    nlohmann::json list_agents();
    nlohmann::json agent_status(const std::string& instance_id);
    nlohmann::json update_status(const std::string& instance_id, AgentStatus status,
                                 std::optional<double> cpu_usage = std::nullopt);

    const AgentAddress& server() const { return server_; }

    // Builds the server address from a base URL and object path.
    static AgentAddress server_address(const std::string& url, const std::string& path = "/rpc");

private:
    RpcTransport& transport_;
    AgentAddress server_;
    std::chrono::milliseconds timeout_;

    nlohmann::json request(const std::string& method, const nlohmann::json& params);
};

// True when a reply is a failure caused by the server being out of reach.
bool is_unreachable_reply(const nlohmann::json& reply);

} // namespace deskmcp
