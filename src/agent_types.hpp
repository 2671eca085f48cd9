#pragma once
#include <string>
#include <vector>
#include <optional>
#include <stdexcept>
#include <nlohmann/json.hpp>

namespace deskmcp {

constexpr const char* kMasterServiceName = "DeskMCP Master Agent";
constexpr const char* kMasterInterface = "deskmcp.MasterAgent";

enum class AgentStatus {
    Online,
    Busy,
    Offline,
    Error
};

std::string status_to_string(AgentStatus s);
std::optional<AgentStatus> parse_status(const std::string& s);

inline bool is_live(AgentStatus s) {
    return s == AgentStatus::Online || s == AgentStatus::Busy;
}

enum class Permission {
    Normal,
    Sensitive
};

// Where an instance can be reached: service (base URL), object path, interface.
struct AgentAddress {
    std::string service;
    std::string path = "/rpc";
    std::string interface;

    bool same_endpoint(const AgentAddress& o) const {
        return service == o.service && path == o.path;
    }
};

struct ToolDescriptor {
    std::string name;
    std::string description;
    nlohmann::json parameters = nlohmann::json::object();
    Permission permission = Permission::Normal;
    nlohmann::json examples = nlohmann::json::array();

    nlohmann::json to_json() const;
    static ToolDescriptor from_json(const nlohmann::json& j);
};

struct AgentRegistration {
    std::string logical_name;
    std::string instance_id;
    AgentAddress address;
    std::vector<ToolDescriptor> tools;
    AgentStatus status = AgentStatus::Online;
    double last_seen = 0.0;
    double cpu_usage = -1.0;      // < 0 = never sampled
    double registered_at = 0.0;

    bool declares(const std::string& tool) const;
    nlohmann::json tools_json() const;
};

// Thrown at the registration boundary; what() names the offending field.
class RegistrationError : public std::invalid_argument {
public:
    RegistrationError(const std::string& field, const std::string& message)
        : std::invalid_argument(message), field_(field) {}
    const std::string& field() const { return field_; }
private:
    std::string field_;
};

// Turns the loose AgentRegister payload (name|agent_name, service|bus_name,
// path|object_path) into the canonical struct. instance_id, status and
// timestamps are left for the caller to fill in.
AgentRegistration normalize_registration(const nlohmann::json& info);

// "file_agent.search_file" -> "search_file"
std::string bare_tool_name(const std::string& declared);

} // namespace deskmcp
