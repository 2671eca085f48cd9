#include "config.hpp"
#include <fstream>
#include <iostream>

namespace deskmcp {

std::string Config::registry_db_path() const {
    if (!registry.db_path.empty()) {
        // ":memory:" is passed through untouched to SQLite
        return registry.db_path == ":memory:" ? registry.db_path : expand_path(registry.db_path);
    }
    return workspace_path() + "/registry/agents.db";
}

Config Config::make_default() {
    return Config{};
}

nlohmann::json Config::to_json() const {
    nlohmann::json j;
    j["workspace"] = workspace;

    auto& s = j["server"];
    s["host"] = server.host;
    s["port"] = server.port;
    s["path"] = server.path;
    if (!server.api_key.empty()) s["api_key"] = server.api_key;
    s["call_timeout_ms"] = server.call_timeout_ms;

    if (!registry.db_path.empty()) j["registry"]["db_path"] = registry.db_path;

    auto& l = j["liveness"];
    l["tick_interval_ms"] = liveness.tick_interval_ms;
    l["busy_after_s"] = liveness.busy_after_s;
    l["offline_after_s"] = liveness.offline_after_s;
    l["ping_timeout_ms"] = liveness.ping_timeout_ms;
    l["ping_agents"] = liveness.ping_agents;

    j["events"]["enabled"] = events.enabled;

    auto& a = j["agent"];
    a["server_url"] = agent.server_url;
    a["server_path"] = agent.server_path;
    a["register_attempts"] = agent.register_attempts;
    a["retry_interval_ms"] = agent.retry_interval_ms;
    a["heartbeat_interval_s"] = agent.heartbeat_interval_s;
    a["call_timeout_ms"] = agent.call_timeout_ms;

    return j;
}

Config Config::from_json(const nlohmann::json& j) {
    Config c;
    c.workspace = j.value("workspace", c.workspace);

    if (j.contains("server") && j["server"].is_object()) {
        auto& s = j["server"];
        c.server.host = s.value("host", c.server.host);
        c.server.port = s.value("port", c.server.port);
        c.server.path = s.value("path", c.server.path);
        c.server.api_key = s.value("api_key", "");
        c.server.call_timeout_ms = s.value("call_timeout_ms", c.server.call_timeout_ms);
    }

    if (j.contains("registry") && j["registry"].is_object()) {
        c.registry.db_path = j["registry"].value("db_path", "");
    }

    if (j.contains("liveness") && j["liveness"].is_object()) {
        auto& l = j["liveness"];
        c.liveness.tick_interval_ms = l.value("tick_interval_ms", c.liveness.tick_interval_ms);
        c.liveness.busy_after_s = l.value("busy_after_s", c.liveness.busy_after_s);
        c.liveness.offline_after_s = l.value("offline_after_s", c.liveness.offline_after_s);
        c.liveness.ping_timeout_ms = l.value("ping_timeout_ms", c.liveness.ping_timeout_ms);
        c.liveness.ping_agents = l.value("ping_agents", c.liveness.ping_agents);
    }

    if (j.contains("events") && j["events"].is_object()) {
        c.events.enabled = j["events"].value("enabled", c.events.enabled);
    }

    if (j.contains("agent") && j["agent"].is_object()) {
        auto& a = j["agent"];
        c.agent.server_url = a.value("server_url", c.agent.server_url);
        c.agent.server_path = a.value("server_path", c.agent.server_path);
        c.agent.register_attempts = a.value("register_attempts", c.agent.register_attempts);
        c.agent.retry_interval_ms = a.value("retry_interval_ms", c.agent.retry_interval_ms);
        c.agent.heartbeat_interval_s = a.value("heartbeat_interval_s", c.agent.heartbeat_interval_s);
        c.agent.call_timeout_ms = a.value("call_timeout_ms", c.agent.call_timeout_ms);
    }

    // busy window must sit inside the offline window
    if (c.liveness.busy_after_s > c.liveness.offline_after_s) {
        std::cerr << "[config] Warning: busy_after_s > offline_after_s, clamping\n";
        c.liveness.busy_after_s = c.liveness.offline_after_s;
    }
    if (c.liveness.tick_interval_ms <= 0) c.liveness.tick_interval_ms = 3000;

    return c;
}

Config Config::load(const std::string& path) {
    std::ifstream f(path);
    if (!f) {
        std::cerr << "[warn] Config not found at " << path << ", using defaults\n";
        return make_default();
    }
    try {
        nlohmann::json j = nlohmann::json::parse(f);
        return from_json(j);
    } catch (const std::exception& e) {
        std::cerr << "[warn] Failed to parse config: " << e.what() << ", using defaults\n";
        return make_default();
    }
}

void Config::save(const std::string& path) const {
    fs::create_directories(fs::path(path).parent_path());
    std::ofstream f(path);
    f << to_json().dump(2) << std::endl;
}

} // namespace deskmcp
