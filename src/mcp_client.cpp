#include "mcp_client.hpp"

namespace deskmcp {

AgentAddress McpClient::server_address(const std::string& url, const std::string& path) {
    AgentAddress addr;
    addr.service = url;
    while (!addr.service.empty() && addr.service.back() == '/') addr.service.pop_back();
    addr.path = path.empty() ? "/rpc" : path;
    addr.interface = kMasterInterface;
    return addr;
}

nlohmann::json McpClient::request(const std::string& method, const nlohmann::json& params) {
    RpcReply reply = transport_.call(server_, method, params, timeout_);
    if (reply.ok()) {
        if (reply.body.is_object()) return reply.body;
        return CallResult::fail(ErrorKind::Application,
                                "Malformed " + method + " reply from " + server_.service + ": " + reply.body.dump()).to_json();
    }

    if (reply.endpoint_down()) {
        return CallResult::fail(ErrorKind::Unreachable,
                                "MCP server unreachable at " + server_.service + ": " + reply.error).to_json();
    }
    // the server answered but rejected the envelope; keep its typed body if any
    if (reply.body.is_object() && reply.body.contains("error")) return reply.body;
    return CallResult::fail(ErrorKind::Application, "Remote error: " + reply.error).to_json();
}

nlohmann::json McpClient::ping() {
    return request("Ping", nlohmann::json::object());
}

nlohmann::json McpClient::list_tools() {
    return request("ToolsList", nlohmann::json::object());
}

nlohmann::json McpClient::call_tool(const std::string& tool_name, const nlohmann::json& parameters) {
    return request("ToolsCall", {{"tool_name", tool_name}, {"parameters", parameters}});
}

nlohmann::json McpClient::register_agent(const nlohmann::json& info) {
    return request("AgentRegister", info);
}

nlohmann::json McpClient::unregister_agent(const std::string& identifier) {
    return request("AgentUnregister", {{"identifier", identifier}});
}

nlohmann::json McpClient::list_agents() {
    return request("AgentsList", nlohmann::json::object());
}

nlohmann::json McpClient::agent_status(const std::string& instance_id) {
    return request("GetAgentStatus", {{"instance_id", instance_id}});
}

nlohmann::json McpClient::update_status(const std::string& instance_id, AgentStatus status,
                                        std::optional<double> cpu_usage) {
    nlohmann::json params = {{"instance_id", instance_id}, {"status", status_to_string(status)}};
    if (cpu_usage) params["cpu_usage"] = *cpu_usage;
    return request("UpdateAgentStatus", params);
}

bool is_unreachable_reply(const nlohmann::json& reply) {
    if (!reply.is_object() || !reply.contains("error_type")) return false;
    return reply["error_type"] == "unreachable" || reply["error_type"] == "failover_exhausted";
}

} // namespace deskmcp
