#include "agent_runtime.hpp"
#include <iostream>

namespace deskmcp {

static bool succeeded(const nlohmann::json& reply) {
    return reply.is_object() && reply.contains("success") && reply["success"].is_boolean()
        && reply["success"].get<bool>();
}

static bool has_error_type(const nlohmann::json& reply, const char* type) {
    return reply.is_object() && reply.contains("error_type") && reply["error_type"] == type;
}

AgentRuntime::AgentRuntime(std::string name, AgentConfig cfg, RpcTransport& transport,
                           std::string host, int port)
    : name_(std::move(name))
    , cfg_(cfg)
    , client_(transport, McpClient::server_address(cfg.server_url, cfg.server_path),
              std::chrono::milliseconds(cfg.call_timeout_ms))
    , endpoint_(std::move(host), port, "/rpc", "deskmcp." + name_) {
    endpoint_.add_method("ToolsCall", [this](const nlohmann::json& p) { return handle_tools_call(p); });
    endpoint_.add_method("Ping", [this](const nlohmann::json&) { return handle_ping(); });
}

AgentRuntime::~AgentRuntime() {
    stop();
}

std::string AgentRuntime::instance_id() const {
    std::lock_guard<std::mutex> lock(id_mutex_);
    return instance_id_;
}

void AgentRuntime::set_instance_id(const std::string& id) {
    std::lock_guard<std::mutex> lock(id_mutex_);
    instance_id_ = id;
}

AgentAddress AgentRuntime::address() const {
    AgentAddress addr;
    addr.service = endpoint_.base_url();
    addr.path = endpoint_.path();
    addr.interface = endpoint_.interface();
    return addr;
}

nlohmann::json AgentRuntime::registration_info() {
    nlohmann::json tools = nlohmann::json::array();
    for (auto& d : tools_.descriptors()) tools.push_back(d.to_json());

    auto addr = address();
    return {
        {"name", name_},
        {"service", addr.service},
        {"path", addr.path},
        {"interface", addr.interface},
        {"tools", tools},
        {"cpu_usage", cpu_.sample()}
    };
}

bool AgentRuntime::register_with_server(int attempts) {
    for (int i = 1; i <= attempts; i++) {
        nlohmann::json reply = client_.register_agent(registration_info());
        if (succeeded(reply) && reply.contains("instance_id") && reply["instance_id"].is_string()) {
            set_instance_id(reply["instance_id"].get<std::string>());
            std::cerr << "[agent:" << name_ << "] Registered as " << instance_id() << "\n";
            return true;
        }

        std::string err = reply.is_object() && reply.contains("error") && reply["error"].is_string()
            ? reply["error"].get<std::string>() : reply.dump();
        std::cerr << "[agent:" << name_ << "] Registration attempt " << i << "/" << attempts
                  << " failed: " << err << "\n";

        // the server rejected the payload itself; retrying cannot help
        if (has_error_type(reply, "malformed_request")) return false;
        if (i < attempts && !wait_for(std::chrono::milliseconds(cfg_.retry_interval_ms))) break;
    }
    return false;
}

bool AgentRuntime::send_heartbeat() {
    std::string id = instance_id();
    if (id.empty()) return register_with_server(1);

    nlohmann::json reply = client_.update_status(id, reported_status_, cpu_.sample());
    if (succeeded(reply)) return true;

    if (has_error_type(reply, "not_found")) {
        std::cerr << "[agent:" << name_ << "] Server no longer knows " << id << ", re-registering\n";
        set_instance_id("");
        return register_with_server(1);
    }
    std::cerr << "[agent:" << name_ << "] Heartbeat failed: "
              << (reply.is_object() && reply.contains("error") ? reply["error"].dump() : reply.dump()) << "\n";
    return false;
}

nlohmann::json AgentRuntime::handle_tools_call(const nlohmann::json& params) {
    if (!params.is_object() || !params.contains("tool_name") || !params["tool_name"].is_string()) {
        return {{"success", false}, {"error", "Missing required field: tool_name"}};
    }
    std::string tool = bare_tool_name(params["tool_name"].get<std::string>());

    nlohmann::json args = nlohmann::json::object();
    try {
        if (params.contains("parameters") && params["parameters"].is_object()) {
            args = params["parameters"];
        } else if (params.contains("parameters_json") && params["parameters_json"].is_string()) {
            args = nlohmann::json::parse(params["parameters_json"].get<std::string>());
        }
    } catch (const std::exception& e) {
        return {{"success", false}, {"error", std::string("Invalid JSON parameters: ") + e.what()}};
    }

    try {
        nlohmann::json result = tools_.execute(tool, args);
        return {{"success", true}, {"result", result}};
    } catch (const UnknownToolError& e) {
        return {{"success", false}, {"error", e.what()}};
    } catch (const std::exception& e) {
        std::cerr << "[agent:" << name_ << "] Tool " << tool << " failed: " << e.what() << "\n";
        return {{"success", false}, {"error", e.what()}};
    }
}

nlohmann::json AgentRuntime::handle_ping() {
    return {
        {"status", "ok"},
        {"timestamp", epoch_seconds()},
        {"service", name_},
        {"instance_id", instance_id()},
        {"cpu_usage", cpu_.sample()}
    };
}

bool AgentRuntime::wait_for(std::chrono::milliseconds d) {
    std::unique_lock<std::mutex> lock(wait_mutex_);
    wake_.wait_for(lock, d, [this]() { return !running_; });
    return running_;
}

bool AgentRuntime::start() {
    if (running_) return true;
    if (!endpoint_.start()) {
        std::cerr << "[agent:" << name_ << "] Failed to start endpoint\n";
        return false;
    }
    running_ = true;
    std::cerr << "[agent:" << name_ << "] Serving " << tools_.size() << " tools at "
              << endpoint_.base_url() << endpoint_.path() << "\n";

    if (!register_with_server(cfg_.register_attempts)) {
        std::cerr << "[agent:" << name_ << "] Not registered yet, will retry every "
                  << cfg_.heartbeat_interval_s << "s\n";
    }
    thread_ = std::thread([this]() { run_loop(); });
    return true;
}

void AgentRuntime::run_loop() {
    while (wait_for(std::chrono::seconds(cfg_.heartbeat_interval_s))) {
        try {
            send_heartbeat();
        } catch (const std::exception& e) {
            std::cerr << "[agent:" << name_ << "] Heartbeat error: " << e.what() << "\n";
        }
    }
}

void AgentRuntime::stop() {
    if (!running_.exchange(false)) return;
    { std::lock_guard<std::mutex> lock(wait_mutex_); }
    wake_.notify_all();
    if (thread_.joinable()) thread_.join();

    std::string id = instance_id();
    if (!id.empty()) {
        nlohmann::json reply = client_.unregister_agent(id);
        if (!succeeded(reply)) {
            std::cerr << "[agent:" << name_ << "] Unregister failed: "
                      << (reply.is_object() && reply.contains("error") ? reply["error"].dump() : reply.dump()) << "\n";
        }
        set_instance_id("");
    }
    endpoint_.stop();
    std::cerr << "[agent:" << name_ << "] Stopped\n";
}

} // namespace deskmcp
