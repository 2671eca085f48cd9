#include "mcp_server.hpp"
#include <algorithm>
#include <iostream>

namespace deskmcp {

static nlohmann::json failure(ErrorKind kind, const std::string& message) {
    return CallResult::fail(kind, message).to_json();
}

static std::string string_field(const nlohmann::json& params, std::initializer_list<const char*> keys) {
    if (params.is_string()) return params.get<std::string>();
    if (!params.is_object()) return "";
    for (auto* k : keys) {
        if (params.contains(k) && params[k].is_string()) return params[k].get<std::string>();
    }
    return "";
}

McpServer::McpServer(const Config& cfg, std::unique_ptr<AgentRegistry> registry,
                     RpcTransport& transport, LoadMetricProvider& load_metric,
                     Clock clock, EventSink* events)
    : cfg_(cfg)
    , clock_(std::move(clock))
    , registry_(std::move(registry))
    , catalog_(local_tools_, *registry_)
    , broadcaster_(events)
    , dispatcher_(*registry_, catalog_, transport, load_metric, clock_,
                  std::chrono::milliseconds(cfg.server.call_timeout_ms), events)
    , heartbeat_(*registry_, transport, broadcaster_, cfg.liveness, clock_) {
    register_builtin_tools(local_tools_, clock_);
}

McpServer::~McpServer() {
    heartbeat_.stop();
}

std::string McpServer::generate_instance_id(const std::string& logical_name) {
    std::string id;
    do {
        id = logical_name + "_" + std::to_string(epoch_millis()) + "_" + std::to_string(++sequence_);
    } while (registry_->contains(id));
    return id;
}

nlohmann::json McpServer::agent_json(const AgentRegistration& reg) const {
    return {
        {"name", reg.logical_name},
        {"instance_id", reg.instance_id},
        {"service", reg.address.service},
        {"path", reg.address.path},
        {"interface", reg.address.interface},
        {"tools", reg.tools_json()},
        {"tools_count", reg.tools.size()},
        {"status", status_to_string(reg.status)},
        {"last_seen", reg.last_seen},
        {"cpu_usage", reg.cpu_usage},
        {"registered_at", reg.registered_at},
        {"is_alive", is_live(reg.status)}
    };
}

nlohmann::json McpServer::ping() {
    return {
        {"status", "ok"},
        {"timestamp", clock_()},
        {"service", kMasterServiceName},
        {"agents", registry_->size()}
    };
}

nlohmann::json McpServer::tools_list() {
    try {
        return catalog_.to_json();
    } catch (const std::exception& e) {
        std::cerr << "[server] ToolsList failed: " << e.what() << "\n";
        return failure(ErrorKind::Internal, e.what());
    }
}

nlohmann::json McpServer::tools_call(const nlohmann::json& params) {
    try {
        std::string tool_name = string_field(params, {"tool_name", "name"});
        if (tool_name.empty()) {
            return failure(ErrorKind::MalformedRequest, "Missing required field: tool_name");
        }

        nlohmann::json parameters = nlohmann::json::object();
        const nlohmann::json* raw = nullptr;
        if (params.contains("parameters")) raw = &params["parameters"];
        else if (params.contains("parameters_json")) raw = &params["parameters_json"];

        if (raw && raw->is_string()) {
            try {
                parameters = nlohmann::json::parse(raw->get<std::string>());
            } catch (const std::exception& e) {
                return failure(ErrorKind::MalformedRequest, std::string("Invalid JSON parameters: ") + e.what());
            }
        } else if (raw && !raw->is_null()) {
            parameters = *raw;
        }

        std::cerr << "[server] ToolsCall " << tool_name << "\n";
        CallResult result = dispatcher_.dispatch(tool_name, parameters);
        if (!result.success) {
            std::cerr << "[server] ToolsCall " << tool_name << " failed ("
                      << error_kind_to_string(result.kind) << "): " << result.error << "\n";
        }
        return result.to_json();
    } catch (const std::exception& e) {
        std::cerr << "[server] ToolsCall error: " << e.what() << "\n";
        return failure(ErrorKind::Internal, e.what());
    }
}

nlohmann::json McpServer::agent_register(const nlohmann::json& params) {
    AgentRegistration reg;
    try {
        nlohmann::json info = params;
        if (params.is_object() && params.contains("agent_info_json") && params["agent_info_json"].is_string()) {
            info = nlohmann::json::parse(params["agent_info_json"].get<std::string>());
        }
        reg = normalize_registration(info);
    } catch (const RegistrationError& e) {
        nlohmann::json j = failure(ErrorKind::MalformedRequest, e.what());
        if (!e.field().empty()) j["field"] = e.field();
        return j;
    } catch (const std::exception& e) {
        return failure(ErrorKind::MalformedRequest, std::string("Invalid agent info: ") + e.what());
    }

    try {
        double now = clock_();
        reg.instance_id = generate_instance_id(reg.logical_name);
        reg.status = AgentStatus::Online;
        reg.last_seen = now;
        reg.registered_at = now;

        // A restarted agent re-registering at the same endpoint supersedes its old entry.
        auto replaced_ids = registry_->replace_at_address(reg);
        std::string replaced = replaced_ids.empty() ? "" : replaced_ids.front();
        broadcaster_.observe(reg.instance_id, reg.logical_name, AgentStatus::Online, now);

        std::cerr << "[server] Agent registered: " << reg.logical_name << " as " << reg.instance_id
                  << " (" << reg.tools.size() << " tools) at " << reg.address.service << reg.address.path << "\n";
        if (!replaced.empty()) std::cerr << "[server]   replaces " << replaced << "\n";

        nlohmann::json j = {
            {"success", true},
            {"message", "Agent '" + reg.logical_name + "' registered successfully"},
            {"instance_id", reg.instance_id}
        };
        if (!replaced.empty()) j["replaced"] = replaced;
        return j;
    } catch (const std::exception& e) {
        std::cerr << "[server] AgentRegister error: " << e.what() << "\n";
        return failure(ErrorKind::Internal, e.what());
    }
}

nlohmann::json McpServer::agent_unregister(const nlohmann::json& params) {
    try {
        std::string id = string_field(params, {"identifier", "instance_id", "name", "agent_name"});
        if (id.empty()) {
            return failure(ErrorKind::MalformedRequest, "Missing required field: identifier");
        }

        std::vector<std::string> removed;
        if (registry_->remove(id)) {
            removed.push_back(id);
        } else {
            for (auto& reg : registry_->get_by_logical_name(id)) {
                if (registry_->remove(reg.instance_id)) removed.push_back(reg.instance_id);
            }
        }

        if (removed.empty()) {
            return failure(ErrorKind::NotFound, "Agent '" + id + "' not found");
        }
        std::cerr << "[server] Agent unregistered: " << id << " (" << removed.size() << " instance(s))\n";
        return {
            {"success", true},
            {"message", "Agent '" + id + "' unregistered successfully"},
            {"removed", removed}
        };
    } catch (const std::exception& e) {
        std::cerr << "[server] AgentUnregister error: " << e.what() << "\n";
        return failure(ErrorKind::Internal, e.what());
    }
}

nlohmann::json McpServer::agents_list() {
    try {
        auto regs = registry_->list_all();
        std::sort(regs.begin(), regs.end(), [](const AgentRegistration& a, const AgentRegistration& b) {
            if (a.logical_name != b.logical_name) return a.logical_name < b.logical_name;
            return a.registered_at < b.registered_at;
        });
        nlohmann::json agents = nlohmann::json::array();
        for (auto& reg : regs) agents.push_back(agent_json(reg));
        return {{"success", true}, {"agents", agents}, {"total", regs.size()}};
    } catch (const std::exception& e) {
        std::cerr << "[server] AgentsList error: " << e.what() << "\n";
        return failure(ErrorKind::Internal, e.what());
    }
}

nlohmann::json McpServer::get_agent_status(const nlohmann::json& params) {
    try {
        std::string id = string_field(params, {"instance_id", "identifier"});
        if (id.empty()) return failure(ErrorKind::MalformedRequest, "Missing required field: instance_id");

        auto reg = registry_->get(id);
        if (!reg) return failure(ErrorKind::NotFound, "Instance '" + id + "' not found");

        return {
            {"success", true},
            {"instance_id", reg->instance_id},
            {"name", reg->logical_name},
            {"status", status_to_string(reg->status)},
            {"is_alive", is_live(reg->status)},
            {"last_seen", reg->last_seen},
            {"cpu_usage", reg->cpu_usage}
        };
    } catch (const std::exception& e) {
        return failure(ErrorKind::Internal, e.what());
    }
}

nlohmann::json McpServer::update_agent_status(const nlohmann::json& params) {
    try {
        std::string id = string_field(params, {"instance_id"});
        if (id.empty()) return failure(ErrorKind::MalformedRequest, "Missing required field: instance_id");
        std::string status_str = params.is_object() ? string_field(params, {"status"}) : "";
        if (status_str.empty()) return failure(ErrorKind::MalformedRequest, "Missing required field: status");
        auto status = parse_status(status_str);
        if (!status) {
            return failure(ErrorKind::MalformedRequest,
                           "Invalid status '" + status_str + "': expected online, busy, offline or error");
        }

        auto reg = registry_->get(id);
        if (!reg) return failure(ErrorKind::NotFound, "Instance '" + id + "' not found");

        double now = clock_();
        // an agent announcing itself offline is not activity
        if (*status != AgentStatus::Offline) registry_->touch(id, now);
        registry_->set_status(id, *status);
        if (params.contains("cpu_usage") && params["cpu_usage"].is_number()) {
            registry_->set_cpu_usage(id, params["cpu_usage"].get<double>());
        }
        broadcaster_.observe(id, reg->logical_name, *status, now);

        return {
            {"success", true},
            {"message", "Status of '" + id + "' set to " + status_to_string(*status)}
        };
    } catch (const std::exception& e) {
        std::cerr << "[server] UpdateAgentStatus error: " << e.what() << "\n";
        return failure(ErrorKind::Internal, e.what());
    }
}

void McpServer::bind(RpcEndpoint& endpoint) {
    endpoint.add_method("Ping", [this](const nlohmann::json&) { return ping(); });
    endpoint.add_method("ToolsList", [this](const nlohmann::json&) { return tools_list(); });
    endpoint.add_method("ToolsCall", [this](const nlohmann::json& p) { return tools_call(p); });
    endpoint.add_method("AgentRegister", [this](const nlohmann::json& p) { return agent_register(p); });
    endpoint.add_method("AgentUnregister", [this](const nlohmann::json& p) { return agent_unregister(p); });
    endpoint.add_method("AgentsList", [this](const nlohmann::json&) { return agents_list(); });
    endpoint.add_method("GetAgentStatus", [this](const nlohmann::json& p) { return get_agent_status(p); });
    endpoint.add_method("UpdateAgentStatus", [this](const nlohmann::json& p) { return update_agent_status(p); });
}

} // namespace deskmcp
