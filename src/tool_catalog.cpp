#include "tool_catalog.hpp"
#include <algorithm>
#include <set>

namespace deskmcp {

nlohmann::json CatalogEntry::to_json() const {
    nlohmann::json j = descriptor.to_json();
    j["name"] = name;
    j["agent"] = agent;
    return j;
}

std::vector<CatalogEntry> ToolCatalog::list() const {
    std::vector<CatalogEntry> out;
    std::set<std::string> seen;

    for (auto& d : local_.descriptors()) {
        if (!seen.insert(d.name).second) continue;
        out.push_back({d.name, "", d});
    }

    // Oldest registration first so a logical name's listing is stable while
    // newer instances come and go.
    auto regs = registry_.list_all();
    std::stable_sort(regs.begin(), regs.end(), [](const AgentRegistration& a, const AgentRegistration& b) {
        return a.registered_at < b.registered_at;
    });

    for (auto& reg : regs) {
        for (auto& tool : reg.tools) {
            std::string qualified = qualify(reg.logical_name, tool.name);
            if (!seen.insert(qualified).second) continue;
            out.push_back({qualified, reg.logical_name, tool});
        }
    }
    return out;
}

nlohmann::json ToolCatalog::to_json() const {
    auto entries = list();
    nlohmann::json tools = nlohmann::json::array();
    for (auto& e : entries) tools.push_back(e.to_json());
    return {
        {"success", true},
        {"tools", tools},
        {"total", entries.size()}
    };
}

void register_builtin_tools(ToolRegistry& reg, Clock clock) {
    reg.register_tool(
        "echo", "Echo back the provided message",
        nlohmann::json::parse(R"JSON({
            "type": "object",
            "properties": {
                "message": {"type": "string", "description": "The message to echo"}
            },
            "required": ["message"]
        })JSON"),
        [clock](const nlohmann::json& args) -> nlohmann::json {
            if (!args.contains("message")) throw std::invalid_argument("Missing parameter: message");
            return {{"echo", args["message"]}, {"timestamp", clock()}};
        });

    reg.register_tool(
        "server_time", "Current server time in seconds since epoch",
        {{"type", "object"}, {"properties", nlohmann::json::object()}},
        [clock](const nlohmann::json&) -> nlohmann::json {
            return {{"timestamp", clock()}};
        });
}

} // namespace deskmcp
