#include "agent_types.hpp"
#include <set>

namespace deskmcp {

std::string status_to_string(AgentStatus s) {
    switch (s) {
        case AgentStatus::Online:  return "online";
        case AgentStatus::Busy:    return "busy";
        case AgentStatus::Offline: return "offline";
        case AgentStatus::Error:   return "error";
    }
    return "error";
}

std::optional<AgentStatus> parse_status(const std::string& s) {
    if (s == "online")  return AgentStatus::Online;
    if (s == "busy")    return AgentStatus::Busy;
    if (s == "offline") return AgentStatus::Offline;
    if (s == "error")   return AgentStatus::Error;
    return std::nullopt;
}

nlohmann::json ToolDescriptor::to_json() const {
    return {
        {"name", name},
        {"description", description},
        {"parameters", parameters},
        {"permission", permission == Permission::Sensitive ? "sensitive" : "normal"},
        {"examples", examples}
    };
}

ToolDescriptor ToolDescriptor::from_json(const nlohmann::json& j) {
    ToolDescriptor td;
    td.name = j.value("name", "");
    td.description = j.value("description", "");
    if (j.contains("parameters") && !j["parameters"].is_null()) {
        td.parameters = j["parameters"];
    } else if (j.contains("inputSchema")) {
        td.parameters = j["inputSchema"];
    }
    std::string perm = j.value("permission", j.value("permission_level", "normal"));
    td.permission = (perm == "sensitive") ? Permission::Sensitive : Permission::Normal;
    if (j.contains("examples") && j["examples"].is_array()) {
        td.examples = j["examples"];
    }
    return td;
}

bool AgentRegistration::declares(const std::string& tool) const {
    for (auto& t : tools) {
        if (t.name == tool) return true;
    }
    return false;
}

nlohmann::json AgentRegistration::tools_json() const {
    nlohmann::json arr = nlohmann::json::array();
    for (auto& t : tools) arr.push_back(t.to_json());
    return arr;
}

std::string bare_tool_name(const std::string& declared) {
    auto dot = declared.rfind('.');
    if (dot == std::string::npos) return declared;
    return declared.substr(dot + 1);
}

static std::string first_string(const nlohmann::json& j, std::initializer_list<const char*> keys) {
    for (auto* k : keys) {
        if (j.contains(k) && j[k].is_string()) {
            std::string v = j[k].get<std::string>();
            if (!v.empty()) return v;
        }
    }
    return "";
}

AgentRegistration normalize_registration(const nlohmann::json& info) {
    if (!info.is_object()) {
        throw RegistrationError("", "Registration must be a JSON object");
    }

    AgentRegistration reg;
    reg.logical_name = first_string(info, {"name", "agent_name"});
    if (reg.logical_name.empty()) {
        throw RegistrationError("name", "Missing required field: name or agent_name");
    }
    if (reg.logical_name.find('.') != std::string::npos) {
        throw RegistrationError("name", "Invalid agent name '" + reg.logical_name + "': must not contain '.'");
    }

    reg.address.service = first_string(info, {"service", "bus_name"});
    if (reg.address.service.empty()) {
        throw RegistrationError("service", "Missing required field: service or bus_name");
    }
    std::string path = first_string(info, {"path", "object_path"});
    if (!path.empty()) reg.address.path = path;
    reg.address.interface = first_string(info, {"interface"});
    if (reg.address.interface.empty()) reg.address.interface = "deskmcp." + reg.logical_name;

    if (!info.contains("tools")) {
        throw RegistrationError("tools", "Missing required field: tools");
    }
    if (!info["tools"].is_array()) {
        throw RegistrationError("tools", "Field 'tools' must be an array");
    }

    std::set<std::string> seen;
    size_t index = 0;
    for (auto& t : info["tools"]) {
        if (!t.is_object()) {
            throw RegistrationError("tools", "tools[" + std::to_string(index) + "] must be an object");
        }
        ToolDescriptor td = ToolDescriptor::from_json(t);
        td.name = bare_tool_name(td.name);
        if (td.name.empty()) {
            throw RegistrationError("tools", "tools[" + std::to_string(index) + "] is missing 'name'");
        }
        if (!seen.insert(td.name).second) {
            throw RegistrationError("tools", "Duplicate tool name '" + td.name + "'");
        }
        reg.tools.push_back(std::move(td));
        index++;
    }

    if (info.contains("cpu_usage") && info["cpu_usage"].is_number()) {
        reg.cpu_usage = info["cpu_usage"].get<double>();
    }
    return reg;
}

} // namespace deskmcp
