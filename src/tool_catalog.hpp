#pragma once
#include "agent_registry.hpp"
#include "tool_registry.hpp"
#include "utils.hpp"
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

namespace deskmcp {

struct CatalogEntry {
    std::string name;    // qualified for agent tools, bare for local ones
    std::string agent;   // empty for local tools
    ToolDescriptor descriptor;

    nlohmann::json to_json() const;
};

// Union of the server's local tools and every registered agent's declared
// tools. Registration, not reachability, decides what is listed.
class ToolCatalog {
public:
    ToolCatalog(ToolRegistry& local, const AgentRegistry& registry)
        : local_(local), registry_(registry) {}

    std::vector<CatalogEntry> list() const;
    nlohmann::json to_json() const;

    ToolRegistry& local() { return local_; }
    const ToolRegistry& local() const { return local_; }

    static std::string qualify(const std::string& agent, const std::string& tool) {
        return agent + "." + tool;
    }

private:
    ToolRegistry& local_;
    const AgentRegistry& registry_;
};

// echo and server_time
void register_builtin_tools(ToolRegistry& reg, Clock clock);

} // namespace deskmcp
