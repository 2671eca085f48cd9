#include "commands.hpp"
#include "config.hpp"
#include "agent_registry.hpp"
#include "event_log.hpp"
#include "load_metric.hpp"
#include "mcp_server.hpp"
#include "rpc/http_client.hpp"
#include "rpc/http_endpoint.hpp"
#include <iostream>
#include <csignal>
#include <atomic>
#include <thread>

namespace deskmcp {

static std::atomic<bool> g_running{true};

static void signal_handler(int) {
    g_running = false;
}

int cmd_server(const std::string& host, int port) {
    Config cfg = Config::load(default_config_path());
    if (!host.empty()) cfg.server.host = host;
    if (port >= 0) cfg.server.port = port;

    std::unique_ptr<AgentRegistry> registry;
    try {
        std::string db_path = cfg.registry_db_path();
        registry = std::make_unique<AgentRegistry>(db_path);
        std::cerr << "[server] Registry at " << db_path << " (" << registry->size() << " known instances)\n";
    } catch (const std::exception& e) {
        std::cerr << "[server] Cannot open registry: " << e.what() << "\n";
        return 1;
    }

    std::unique_ptr<JsonlEventLog> events;
    if (cfg.events.enabled) {
        try {
            events = std::make_unique<JsonlEventLog>(cfg.events_dir());
        } catch (const std::exception& e) {
            std::cerr << "[warn] Event log disabled: " << e.what() << "\n";
        }
    }

    // outbound calls to agents carry the same bearer token the server expects
    HttpRpcClient transport(cfg.server.api_key);
    ReportedLoadMetric load_metric;
    McpServer server(cfg, std::move(registry), transport, load_metric, system_clock(), events.get());

    RpcEndpoint endpoint(cfg.server.host, cfg.server.port, cfg.server.path, kMasterInterface, cfg.server.api_key);
    server.bind(endpoint);
    if (!endpoint.start()) {
        std::cerr << "[server] Failed to listen on " << cfg.server.host << ":" << cfg.server.port << "\n";
        return 1;
    }
    server.start_liveness();

    std::signal(SIGINT, signal_handler);
    std::signal(SIGTERM, signal_handler);

    std::cerr << "[server] " << kMasterServiceName << " ready at " << endpoint.base_url()
              << cfg.server.path << ". Ctrl+C to quit.\n";

    while (g_running) {
        std::this_thread::sleep_for(std::chrono::milliseconds(200));
    }

    std::cerr << "[server] Shutting down...\n";
    server.stop_liveness();
    endpoint.stop();
    std::cerr << "[server] Done.\n";
    return 0;
}

} // namespace deskmcp
