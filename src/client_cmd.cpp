#include "commands.hpp"
#include "config.hpp"
#include "mcp_client.hpp"
#include "rpc/http_client.hpp"
#include <iomanip>
#include <iostream>

namespace deskmcp {

static McpClient make_client(HttpRpcClient& transport, const Config& cfg) {
    return McpClient(transport, McpClient::server_address(cfg.agent.server_url, cfg.agent.server_path),
                     std::chrono::milliseconds(cfg.server.call_timeout_ms + 1000));
}

static bool report_failure(const nlohmann::json& reply) {
    if (reply.is_object() && reply.contains("success") && reply["success"] == false) {
        std::cerr << "Error";
        if (reply.contains("error_type")) std::cerr << " (" << reply["error_type"].get<std::string>() << ")";
        std::cerr << ": " << (reply.contains("error") && reply["error"].is_string()
                                  ? reply["error"].get<std::string>() : reply.dump()) << "\n";
        return true;
    }
    return false;
}

int cmd_call(const std::string& tool_name, const std::string& params_json) {
    Config cfg = Config::load(default_config_path());

    nlohmann::json params = nlohmann::json::object();
    if (!params_json.empty()) {
        try {
            params = nlohmann::json::parse(params_json);
        } catch (const std::exception& e) {
            std::cerr << "Invalid JSON parameters: " << e.what() << "\n";
            return 1;
        }
    }

    HttpRpcClient transport(cfg.server.api_key);
    McpClient client = make_client(transport, cfg);
    nlohmann::json reply = client.call_tool(tool_name, params);
    if (report_failure(reply)) return 1;

    std::cout << (reply.contains("result") ? reply["result"] : nlohmann::json::object()).dump(2) << "\n";
    if (reply.contains("instance_id")) {
        std::cerr << "(served by " << reply["instance_id"].get<std::string>()
                  << (reply.value("failover", false) ? ", after failover" : "") << ")\n";
    }
    return 0;
}

int cmd_tools() {
    Config cfg = Config::load(default_config_path());
    HttpRpcClient transport(cfg.server.api_key);
    McpClient client = make_client(transport, cfg);

    nlohmann::json reply = client.list_tools();
    if (report_failure(reply)) return 1;

    nlohmann::json tools = reply.contains("tools") ? reply["tools"] : nlohmann::json::array();
    for (auto& t : tools) {
        std::cout << "  " << std::left << std::setw(32) << t.value("name", "")
                  << t.value("description", "");
        if (t.value("permission", "normal") == "sensitive") std::cout << " [sensitive]";
        std::cout << "\n";
    }
    std::cout << reply.value("total", static_cast<int>(tools.size())) << " tool(s)\n";
    return 0;
}

int cmd_agents() {
    Config cfg = Config::load(default_config_path());
    HttpRpcClient transport(cfg.server.api_key);
    McpClient client = make_client(transport, cfg);

    nlohmann::json reply = client.list_agents();
    if (report_failure(reply)) return 1;

    nlohmann::json agents = reply.contains("agents") ? reply["agents"] : nlohmann::json::array();
    if (agents.empty()) {
        std::cout << "No agents registered.\n";
        return 0;
    }
    for (auto& a : agents) {
        std::cout << "  " << std::left << std::setw(40) << a.value("instance_id", "")
                  << std::setw(9) << a.value("status", "")
                  << a.value("tools_count", 0) << " tools  "
                  << a.value("service", "") << a.value("path", "") << "\n";
    }
    std::cout << agents.size() << " instance(s)\n";
    return 0;
}

} // namespace deskmcp
