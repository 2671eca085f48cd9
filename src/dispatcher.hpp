#pragma once
#include "agent_registry.hpp"
#include "call_result.hpp"
#include "event_log.hpp"
#include "load_metric.hpp"
#include "tool_catalog.hpp"
#include "rpc/transport.hpp"
#include <chrono>
#include <string>
#include <vector>

namespace deskmcp {

// Routes a qualified tool call ("Agent.tool") to one live instance of the
// agent, balancing on load and failing over once when the chosen instance
// cannot be reached. Unqualified names run against the local tool table.
//
// Holds no mutable state of its own; concurrent dispatches only share the
// registry.
class Dispatcher {
public:
    Dispatcher(AgentRegistry& registry, ToolCatalog& catalog, RpcTransport& transport,
               LoadMetricProvider& load_metric, Clock clock,
               std::chrono::milliseconds call_timeout = std::chrono::milliseconds(10000),
               EventSink* events = nullptr);

    CallResult dispatch(const std::string& tool_name, const nlohmann::json& parameters);

    // Live candidates ordered best-first: lowest load, then instance_id.
    std::vector<AgentRegistration> rank(std::vector<AgentRegistration> candidates);

private:
    AgentRegistry& registry_;
    ToolCatalog& catalog_;
    RpcTransport& transport_;
    LoadMetricProvider& load_metric_;
    Clock clock_;
    std::chrono::milliseconds call_timeout_;
    EventSink* events_;

    CallResult dispatch_local(const std::string& tool_name, const nlohmann::json& parameters);
    CallResult dispatch_remote(const std::string& agent, const std::string& tool,
                               const nlohmann::json& parameters);

    struct Attempt {
        bool endpoint_down = false;
        std::string transport_error;
        CallResult result;
    };
    Attempt call_instance(const AgentRegistration& instance, const std::string& tool,
                          const nlohmann::json& parameters);
    void mark_offline(const AgentRegistration& instance, const std::string& why);
    void emit(const std::string& type, nlohmann::json event);
};

} // namespace deskmcp
