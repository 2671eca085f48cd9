#pragma once
#include <atomic>
#include <filesystem>
#include <functional>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "agent_types.hpp"
#include "event_log.hpp"
#include "load_metric.hpp"
#include "utils.hpp"
#include "rpc/transport.hpp"

namespace deskmcp::test {

// In-memory transport: each service URL maps to a handler standing in for
// the remote endpoint. Services without a handler are unreachable.
class FakeTransport : public RpcTransport {
public:
    using Handler = std::function<RpcReply(const std::string& method, const nlohmann::json& params)>;

    struct Call {
        std::string service;
        std::string method;
        nlohmann::json params;
    };

    void on(const std::string& service, Handler h) {
        std::lock_guard<std::mutex> lock(mutex_);
        handlers_[service] = std::move(h);
    }

    void unreachable(const std::string& service) {
        std::lock_guard<std::mutex> lock(mutex_);
        handlers_.erase(service);
    }

    RpcReply call(const AgentAddress& address, const std::string& method,
                  const nlohmann::json& params, std::chrono::milliseconds) override {
        Handler h;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            calls_.push_back({address.service, method, params});
            auto it = handlers_.find(address.service);
            if (it == handlers_.end()) {
                return RpcReply::failure(TransportStatus::Unreachable, "connection refused");
            }
            h = it->second;
        }
        return h(method, params);
    }

    std::vector<Call> calls() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return calls_;
    }

    int count(const std::string& service, const std::string& method) const {
        std::lock_guard<std::mutex> lock(mutex_);
        int n = 0;
        for (auto& c : calls_) {
            if (c.service == service && c.method == method) n++;
        }
        return n;
    }

    void clear_calls() {
        std::lock_guard<std::mutex> lock(mutex_);
        calls_.clear();
    }

private:
    mutable std::mutex mutex_;
    std::map<std::string, Handler> handlers_;
    std::vector<Call> calls_;
};

// A remote agent that answers ToolsCall by echoing the tool name and its
// parameters, and Ping with "ok".
inline FakeTransport::Handler echoing_agent(const std::string& label) {
    return [label](const std::string& method, const nlohmann::json& params) {
        if (method == "Ping") {
            return RpcReply::success({{"status", "ok"}, {"service", label}});
        }
        return RpcReply::success({
            {"success", true},
            {"result", {{"served_by", label},
                        {"tool", params.value("tool_name", "")},
                        {"parameters", params.contains("parameters") ? params["parameters"] : nlohmann::json::object()}}}
        });
    };
}

class FakeClock {
public:
    explicit FakeClock(double start = 1000.0) : now_(start) {}

    double now() const { return now_; }
    void advance(double seconds) { now_ = now_ + seconds; }
    Clock clock() { return [this] { return now_.load(); }; }

private:
    std::atomic<double> now_;
};

class FakeLoadMetric : public LoadMetricProvider {
public:
    void set(const std::string& instance_id, double load) { loads_[instance_id] = load; }

    std::optional<double> sample(const AgentRegistration& instance) override {
        auto it = loads_.find(instance.instance_id);
        if (it == loads_.end()) return std::nullopt;
        return it->second;
    }

private:
    std::map<std::string, double> loads_;
};

class CapturingSink : public EventSink {
public:
    void emit(const std::string& type, nlohmann::json event) override {
        std::lock_guard<std::mutex> lock(mutex_);
        event["type"] = type;
        events_.push_back(std::move(event));
    }

    std::vector<nlohmann::json> of_type(const std::string& type) const {
        std::lock_guard<std::mutex> lock(mutex_);
        std::vector<nlohmann::json> out;
        for (auto& e : events_) {
            if (e["type"] == type) out.push_back(e);
        }
        return out;
    }

private:
    mutable std::mutex mutex_;
    std::vector<nlohmann::json> events_;
};

class TempDir {
public:
    TempDir() {
        static std::atomic<int> counter{0};
        path_ = std::filesystem::temp_directory_path() /
                ("deskmcp_test_" + std::to_string(epoch_millis()) + "_" + std::to_string(counter++));
        std::filesystem::create_directories(path_);
    }
    ~TempDir() {
        std::error_code ec;
        std::filesystem::remove_all(path_, ec);
    }

    TempDir(const TempDir&) = delete;
    TempDir& operator=(const TempDir&) = delete;

    std::string path() const { return path_.string(); }
    std::string file(const std::string& name) const { return (path_ / name).string(); }

private:
    std::filesystem::path path_;
};

inline ToolDescriptor make_tool(const std::string& name, const std::string& description = "") {
    ToolDescriptor t;
    t.name = name;
    t.description = description.empty() ? name : description;
    return t;
}

inline AgentRegistration make_instance(const std::string& logical_name, const std::string& instance_id,
                                       const std::string& service, std::vector<std::string> tools,
                                       AgentStatus status = AgentStatus::Online, double last_seen = 1000.0) {
    AgentRegistration reg;
    reg.logical_name = logical_name;
    reg.instance_id = instance_id;
    reg.address.service = service;
    reg.address.interface = "deskmcp." + logical_name;
    for (auto& t : tools) reg.tools.push_back(make_tool(t));
    reg.status = status;
    reg.last_seen = last_seen;
    reg.registered_at = last_seen;
    return reg;
}

} // namespace deskmcp::test
