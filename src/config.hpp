#pragma once
#include <string>
#include <nlohmann/json.hpp>
#include "utils.hpp"

namespace deskmcp {

struct ServerConfig {
    std::string host = "127.0.0.1";
    int port = 18790;
    std::string path = "/rpc";
    std::string api_key;          // Optional Bearer token auth
    int call_timeout_ms = 10000;  // per outbound ToolsCall
};

struct RegistryConfig {
    std::string db_path;          // empty = <workspace>/registry/agents.db
};

struct LivenessConfig {
    int tick_interval_ms = 3000;
    double busy_after_s = 10.0;
    double offline_after_s = 60.0;
    int ping_timeout_ms = 1000;
    bool ping_agents = true;
};

struct EventsConfig {
    bool enabled = true;
};

// Settings used by processes built on AgentRuntime.
struct AgentConfig {
    std::string server_url = "http://127.0.0.1:18790";
    std::string server_path = "/rpc";
    int register_attempts = 5;
    int retry_interval_ms = 2000;
    int heartbeat_interval_s = 15;
    int call_timeout_ms = 5000;
};

struct Config {
    std::string workspace = "~/.deskmcp/workspace";

    ServerConfig server;
    RegistryConfig registry;
    LivenessConfig liveness;
    EventsConfig events;
    AgentConfig agent;

    std::string workspace_path() const {
        return expand_path(workspace);
    }

    std::string registry_db_path() const;
    std::string events_dir() const {
        return workspace_path() + "/events";
    }

    static Config make_default();
    static Config load(const std::string& path);
    void save(const std::string& path) const;
    nlohmann::json to_json() const;
    static Config from_json(const nlohmann::json& j);
};

} // namespace deskmcp
