#pragma once
#include "agent_types.hpp"
#include <string>
#include <map>
#include <vector>
#include <functional>
#include <mutex>
#include <nlohmann/json.hpp>
#include <stdexcept>

namespace deskmcp {

// A tool body. Returns the result payload; throws to report a failure.
using ToolFunction = std::function<nlohmann::json(const nlohmann::json&)>;

struct ToolDef {
    ToolDescriptor descriptor;
    ToolFunction func;
};

class UnknownToolError : public std::runtime_error {
public:
    explicit UnknownToolError(const std::string& name)
        : std::runtime_error("Unknown tool: " + name) {}
};

// Tools implemented in-process: the server's built-ins, or the tool set an
// AgentRuntime serves.
class ToolRegistry {
public:
    void register_tool(ToolDef def) {
        std::lock_guard<std::mutex> lock(mutex_);
        std::string name = def.descriptor.name;
        tools_[name] = std::move(def);
    }

    void register_tool(const std::string& name, const std::string& description,
                       nlohmann::json parameters, ToolFunction func,
                       Permission permission = Permission::Normal) {
        ToolDef def;
        def.descriptor.name = name;
        def.descriptor.description = description;
        def.descriptor.parameters = std::move(parameters);
        def.descriptor.permission = permission;
        def.func = std::move(func);
        register_tool(std::move(def));
    }

    bool remove(const std::string& name) {
        std::lock_guard<std::mutex> lock(mutex_);
        return tools_.erase(name) > 0;
    }

    bool has(const std::string& name) const {
        std::lock_guard<std::mutex> lock(mutex_);
        return tools_.count(name) > 0;
    }

    nlohmann::json execute(const std::string& name, const nlohmann::json& args) const {
        ToolFunction func;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            auto it = tools_.find(name);
            if (it == tools_.end()) throw UnknownToolError(name);
            func = it->second.func;
        }
        return func(args);
    }

    std::vector<ToolDescriptor> descriptors() const {
        std::lock_guard<std::mutex> lock(mutex_);
        std::vector<ToolDescriptor> out;
        for (auto& [_, def] : tools_) out.push_back(def.descriptor);
        return out;
    }

    size_t size() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return tools_.size();
    }

private:
    mutable std::mutex mutex_;
    std::map<std::string, ToolDef> tools_;
};

} // namespace deskmcp
