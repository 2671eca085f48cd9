#pragma once
#include "agent_registry.hpp"
#include "config.hpp"
#include "dispatcher.hpp"
#include "event_log.hpp"
#include "heartbeat.hpp"
#include "load_metric.hpp"
#include "status_broadcaster.hpp"
#include "tool_catalog.hpp"
#include "tool_registry.hpp"
#include "rpc/http_endpoint.hpp"
#include "rpc/transport.hpp"
#include <atomic>
#include <memory>
#include <string>

namespace deskmcp {

// The externally visible service: registry, catalog, dispatcher and liveness
// loop composed behind the RPC surface. Every handler answers with an
// envelope; nothing it does escapes as an exception.
class McpServer {
public:
    McpServer(const Config& cfg, std::unique_ptr<AgentRegistry> registry,
              RpcTransport& transport, LoadMetricProvider& load_metric,
              Clock clock = system_clock(), EventSink* events = nullptr);
    ~McpServer();

    McpServer(const McpServer&) = delete;
    McpServer& operator=(const McpServer&) = delete;

    // RPC methods
    nlohmann::json ping();
    nlohmann::json tools_list();
    nlohmann::json tools_call(const nlohmann::json& params);
    nlohmann::json agent_register(const nlohmann::json& params);
    nlohmann::json agent_unregister(const nlohmann::json& params);
    nlohmann::json agents_list();
    nlohmann::json get_agent_status(const nlohmann::json& params);
    nlohmann::json update_agent_status(const nlohmann::json& params);

    // Exposes the methods above on an endpoint under their wire names.
    void bind(RpcEndpoint& endpoint);

    void start_liveness() { heartbeat_.start(); }
    void stop_liveness() { heartbeat_.stop(); }

    AgentRegistry& registry() { return *registry_; }
    ToolRegistry& local_tools() { return local_tools_; }
    ToolCatalog& catalog() { return catalog_; }
    Dispatcher& dispatcher() { return dispatcher_; }
    StatusBroadcaster& broadcaster() { return broadcaster_; }
    HeartbeatMonitor& heartbeat() { return heartbeat_; }

private:
    Config cfg_;
    Clock clock_;
    std::unique_ptr<AgentRegistry> registry_;
    ToolRegistry local_tools_;
    ToolCatalog catalog_;
    StatusBroadcaster broadcaster_;
    Dispatcher dispatcher_;
    HeartbeatMonitor heartbeat_;
    std::atomic<uint64_t> sequence_{0};

    std::string generate_instance_id(const std::string& logical_name);
    nlohmann::json agent_json(const AgentRegistration& reg) const;
};

} // namespace deskmcp
