#include "commands.hpp"
#include "config.hpp"
#include "mcp_client.hpp"
#include "rpc/http_client.hpp"
#include <iostream>

namespace deskmcp {

static int print_instance_status(McpClient& client, const std::string& instance_id) {
    nlohmann::json reply = client.agent_status(instance_id);
    if (!reply.value("success", false)) {
        std::cerr << "Error: " << reply.value("error", std::string("unknown error")) << "\n";
        return 1;
    }
    std::cout << "Instance     : " << reply.value("instance_id", "") << "\n";
    std::cout << "Agent        : " << reply.value("name", "") << "\n";
    std::cout << "Status       : " << reply.value("status", "") << "\n";
    std::cout << "Last seen    : " << std::fixed << reply.value("last_seen", 0.0) << "\n";
    double cpu = reply.value("cpu_usage", -1.0);
    if (cpu >= 0.0) std::cout << "CPU usage    : " << cpu << "%\n";
    else std::cout << "CPU usage    : (not reported)\n";
    return 0;
}

int cmd_status(const std::string& instance_id) {
    std::string cfg_path = default_config_path();
    Config cfg = Config::load(cfg_path);

    HttpRpcClient transport(cfg.server.api_key);
    McpClient client(transport, McpClient::server_address(cfg.agent.server_url, cfg.agent.server_path),
                     std::chrono::milliseconds(cfg.agent.call_timeout_ms));

    if (!instance_id.empty()) return print_instance_status(client, instance_id);

    std::cout << "=== deskmcp status ===\n";
    std::cout << "Config path  : " << cfg_path << "\n";
    std::cout << "Workspace    : " << cfg.workspace_path() << "\n";
    std::cout << "Listen       : " << cfg.server.host << ":" << cfg.server.port << cfg.server.path << "\n";
    std::cout << "Registry DB  : " << cfg.registry_db_path() << "\n";
    std::cout << "Events       : " << (cfg.events.enabled ? cfg.events_dir() : "(disabled)") << "\n";
    std::cout << "Liveness     : tick " << cfg.liveness.tick_interval_ms << "ms, busy after "
              << cfg.liveness.busy_after_s << "s, offline after " << cfg.liveness.offline_after_s << "s"
              << (cfg.liveness.ping_agents ? "" : ", pings off") << "\n";
    if (!cfg.server.api_key.empty()) {
        std::cout << "Auth         : Bearer token enabled\n";
    }

    nlohmann::json ping = client.ping();
    if (ping.value("status", "") == "ok") {
        std::cout << "Server       : up at " << cfg.agent.server_url << " ("
                  << ping.value("agents", 0) << " registered instances)\n";
    } else {
        std::cout << "Server       : unreachable at " << cfg.agent.server_url << "\n";
    }
    return 0;
}

} // namespace deskmcp
