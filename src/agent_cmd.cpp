#include "commands.hpp"
#include "agent_runtime.hpp"
#include "config.hpp"
#include "rpc/http_client.hpp"
#include <algorithm>
#include <iostream>
#include <csignal>
#include <atomic>
#include <thread>

namespace deskmcp {

static std::atomic<bool> g_agent_running{true};

static void agent_signal_handler(int) {
    g_agent_running = false;
}

static void register_echo_tools(ToolRegistry& tools, const std::string& agent_name) {
    tools.register_tool("echo", "Echo a message back, tagged with the serving agent",
        {{"type", "object"},
         {"properties", {{"message", {{"type", "string"}}}}},
         {"required", {"message"}}},
        [agent_name](const nlohmann::json& args) -> nlohmann::json {
            if (!args.contains("message")) throw std::invalid_argument("Missing required parameter: message");
            return {{"echo", args["message"]}, {"agent", agent_name}, {"timestamp", epoch_seconds()}};
        });

    tools.register_tool("reverse", "Reverse a string",
        {{"type", "object"},
         {"properties", {{"text", {{"type", "string"}}}}},
         {"required", {"text"}}},
        [](const nlohmann::json& args) -> nlohmann::json {
            if (!args.contains("text") || !args["text"].is_string()) {
                throw std::invalid_argument("Parameter 'text' must be a string");
            }
            std::string s = args["text"].get<std::string>();
            std::reverse(s.begin(), s.end());
            return {{"text", s}};
        });

    tools.register_tool("sum", "Add a list of numbers",
        {{"type", "object"},
         {"properties", {{"values", {{"type", "array"}, {"items", {{"type", "number"}}}}}}},
         {"required", {"values"}}},
        [](const nlohmann::json& args) -> nlohmann::json {
            if (!args.contains("values") || !args["values"].is_array()) {
                throw std::invalid_argument("Parameter 'values' must be an array of numbers");
            }
            double total = 0.0;
            for (auto& v : args["values"]) {
                if (!v.is_number()) throw std::invalid_argument("Parameter 'values' must be an array of numbers");
                total += v.get<double>();
            }
            return {{"sum", total}};
        });
}

int cmd_agent(const std::string& name, const std::string& host, int port, const std::string& server_url) {
    Config cfg = Config::load(default_config_path());
    if (!server_url.empty()) cfg.agent.server_url = server_url;

    if (name.empty() || name.find('.') != std::string::npos) {
        std::cerr << "Agent name must be non-empty and must not contain '.'\n";
        return 1;
    }

    HttpRpcClient transport(cfg.server.api_key);
    AgentRuntime runtime(name, cfg.agent, transport, host, port);
    register_echo_tools(runtime.tools(), name);

    if (!runtime.start()) return 1;

    std::signal(SIGINT, agent_signal_handler);
    std::signal(SIGTERM, agent_signal_handler);

    std::cerr << "[agent:" << name << "] Ready, server " << cfg.agent.server_url << ". Ctrl+C to quit.\n";
    while (g_agent_running) {
        std::this_thread::sleep_for(std::chrono::milliseconds(200));
    }

    runtime.stop();
    return 0;
}

} // namespace deskmcp
