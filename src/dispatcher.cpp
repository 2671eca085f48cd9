#include "dispatcher.hpp"
#include <algorithm>
#include <iostream>

namespace deskmcp {

Dispatcher::Dispatcher(AgentRegistry& registry, ToolCatalog& catalog, RpcTransport& transport,
                       LoadMetricProvider& load_metric, Clock clock,
                       std::chrono::milliseconds call_timeout, EventSink* events)
    : registry_(registry), catalog_(catalog), transport_(transport)
    , load_metric_(load_metric), clock_(std::move(clock))
    , call_timeout_(call_timeout), events_(events) {}

void Dispatcher::emit(const std::string& type, nlohmann::json event) {
    if (!events_) return;
    try {
        events_->emit(type, std::move(event));
    } catch (const std::exception& e) {
        std::cerr << "[dispatch] Event sink error: " << e.what() << "\n";
    }
}

CallResult Dispatcher::dispatch(const std::string& tool_name, const nlohmann::json& parameters) {
    if (tool_name.empty()) {
        return CallResult::fail(ErrorKind::MalformedRequest, "Missing required field: tool_name");
    }
    if (!parameters.is_null() && !parameters.is_object()) {
        return CallResult::fail(ErrorKind::MalformedRequest, "Parameters must be a JSON object");
    }
    const nlohmann::json& params = parameters.is_null() ? nlohmann::json::object() : parameters;

    auto dot = tool_name.find('.');
    if (dot == std::string::npos) {
        return dispatch_local(tool_name, params);
    }

    std::string agent = tool_name.substr(0, dot);
    std::string tool = tool_name.substr(dot + 1);
    if (agent.empty() || tool.empty()) {
        return CallResult::fail(ErrorKind::MalformedRequest,
                                "Invalid tool name '" + tool_name + "': expected <agent>.<tool>");
    }
    return dispatch_remote(agent, tool, params);
}

CallResult Dispatcher::dispatch_local(const std::string& tool_name, const nlohmann::json& parameters) {
    if (!catalog_.local().has(tool_name)) {
        return CallResult::fail(ErrorKind::NotFound, "Tool '" + tool_name + "' not found");
    }
    try {
        return CallResult::ok(catalog_.local().execute(tool_name, parameters));
    } catch (const UnknownToolError&) {
        // removed between has() and execute()
        return CallResult::fail(ErrorKind::NotFound, "Tool '" + tool_name + "' not found");
    } catch (const std::exception& e) {
        std::cerr << "[dispatch] Local tool " << tool_name << " failed: " << e.what() << "\n";
        return CallResult::fail(ErrorKind::Application, e.what());
    }
}

std::vector<AgentRegistration> Dispatcher::rank(std::vector<AgentRegistration> candidates) {
    if (candidates.size() < 2) return candidates;

    std::vector<std::pair<double, AgentRegistration>> scored;
    scored.reserve(candidates.size());
    for (auto& c : candidates) {
        double load = kNeutralLoad;
        try {
            load = load_metric_.sample(c).value_or(kNeutralLoad);
        } catch (const std::exception& e) {
            std::cerr << "[dispatch] Load sample failed for " << c.instance_id << ": " << e.what() << "\n";
        }
        scored.emplace_back(load, std::move(c));
    }
    std::sort(scored.begin(), scored.end(), [](const auto& a, const auto& b) {
        if (a.first != b.first) return a.first < b.first;
        return a.second.instance_id < b.second.instance_id;
    });

    std::vector<AgentRegistration> out;
    out.reserve(scored.size());
    for (auto& s : scored) out.push_back(std::move(s.second));
    return out;
}

CallResult Dispatcher::dispatch_remote(const std::string& agent, const std::string& tool,
                                       const nlohmann::json& parameters) {
    std::string qualified = ToolCatalog::qualify(agent, tool);

    auto instances = registry_.get_by_logical_name(agent);
    if (instances.empty()) {
        return CallResult::fail(ErrorKind::NotFound, "Agent '" + agent + "' not found");
    }

    std::vector<AgentRegistration> declaring;
    for (auto& inst : instances) {
        if (inst.declares(tool)) declaring.push_back(inst);
    }
    if (declaring.empty()) {
        return CallResult::fail(ErrorKind::NotFound, "Tool '" + qualified + "' not found");
    }

    std::vector<AgentRegistration> live;
    for (auto& inst : declaring) {
        if (is_live(inst.status)) live.push_back(inst);
    }
    if (live.empty()) {
        return CallResult::fail(ErrorKind::Unreachable,
                                "Agent '" + agent + "' is offline (" + std::to_string(declaring.size()) +
                                " instance(s) registered, none live)");
    }

    auto ranked = rank(std::move(live));

    Attempt first = call_instance(ranked[0], tool, parameters);
    if (!first.endpoint_down) return first.result;

    mark_offline(ranked[0], first.transport_error);
    if (ranked.size() < 2) {
        return CallResult::fail(ErrorKind::FailoverExhausted,
                                "Agent '" + agent + "' unreachable (" + first.transport_error +
                                "); no alternate instance available, failover exhausted");
    }

    std::cerr << "[dispatch] Failing over " << qualified << " from " << ranked[0].instance_id
              << " to " << ranked[1].instance_id << "\n";
    Attempt second = call_instance(ranked[1], tool, parameters);
    if (!second.endpoint_down) {
        second.result.failover = true;
        return second.result;
    }

    mark_offline(ranked[1], second.transport_error);
    CallResult r = CallResult::fail(ErrorKind::FailoverExhausted,
                                    "Agent '" + agent + "' unreachable on " + ranked[0].instance_id +
                                    " and " + ranked[1].instance_id + " (" + second.transport_error +
                                    "), failover exhausted");
    r.failover = true;
    return r;
}

Dispatcher::Attempt Dispatcher::call_instance(const AgentRegistration& instance, const std::string& tool,
                                              const nlohmann::json& parameters) {
    emit("schedule", {
        {"agent", instance.logical_name},
        {"instance_id", instance.instance_id},
        {"tool", tool},
        {"parameters", parameters}
    });

    auto started = clock_();
    RpcReply reply = transport_.call(instance.address, "ToolsCall",
                                     {{"tool_name", tool}, {"parameters", parameters}},
                                     call_timeout_);

    Attempt attempt;
    if (reply.endpoint_down()) {
        attempt.endpoint_down = true;
        attempt.transport_error = reply.error.empty() ? transport_status_to_string(reply.status) : reply.error;
        emit("execution", {
            {"agent", instance.logical_name},
            {"instance_id", instance.instance_id},
            {"tool", tool},
            {"status", "unreachable"},
            {"error", attempt.transport_error}
        });
        return attempt;
    }

    // a rejected envelope may come from whatever now listens at that address
    if (reply.ok()) {
        try {
            registry_.touch(instance.instance_id, clock_());
        } catch (const std::exception& e) {
            std::cerr << "[dispatch] Could not refresh " << instance.instance_id << ": " << e.what() << "\n";
        }
    }

    if (reply.status == TransportStatus::RemoteError) {
        attempt.result = CallResult::fail(ErrorKind::Application, "Remote error: " + reply.error);
    } else if (!reply.body.is_object() || !reply.body.contains("success")) {
        attempt.result = CallResult::ok(reply.body);
    } else if (reply.body["success"].is_boolean() && reply.body["success"].get<bool>()) {
        attempt.result = CallResult::ok(reply.body.contains("result") ? reply.body["result"] : nlohmann::json::object());
    } else {
        std::string error;
        if (reply.body.contains("error") && reply.body["error"].is_string()) {
            error = reply.body["error"].get<std::string>();
        } else if (reply.body.contains("error") && !reply.body["error"].is_null()) {
            error = reply.body["error"].dump();
        } else {
            error = "Tool '" + tool + "' on " + instance.logical_name + " reported failure";
        }
        attempt.result = CallResult::fail(ErrorKind::Application, error);
    }
    attempt.result.instance_id = instance.instance_id;

    emit("execution", {
        {"agent", instance.logical_name},
        {"instance_id", instance.instance_id},
        {"tool", tool},
        {"status", attempt.result.success ? "success" : "error"},
        {"elapsed_s", clock_() - started}
    });
    return attempt;
}

void Dispatcher::mark_offline(const AgentRegistration& instance, const std::string& why) {
    std::cerr << "[dispatch] " << instance.instance_id << " unreachable, marking offline: " << why << "\n";
    try {
        registry_.set_status(instance.instance_id, AgentStatus::Offline);
    } catch (const std::exception& e) {
        std::cerr << "[dispatch] Could not mark " << instance.instance_id << " offline: " << e.what() << "\n";
    }
}

} // namespace deskmcp
