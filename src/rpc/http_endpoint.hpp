#pragma once
#include <httplib.h>
#include <nlohmann/json.hpp>
#include <functional>
#include <map>
#include <string>
#include <thread>

namespace deskmcp {

using RpcMethod = std::function<nlohmann::json(const nlohmann::json& params)>;

// Hosts one remote object: a set of named methods behind POST <path>.
// Both the MCP server and every agent expose themselves through one of these.
// Register methods before start().
class RpcEndpoint {
public:
    RpcEndpoint(std::string host, int port, std::string path,
                std::string interface, std::string api_key = "");
    ~RpcEndpoint();

    RpcEndpoint(const RpcEndpoint&) = delete;
    RpcEndpoint& operator=(const RpcEndpoint&) = delete;

    void add_method(const std::string& name, RpcMethod method);
    bool has_method(const std::string& name) const { return methods_.count(name) > 0; }

    // In-process invocation with the same error mapping as the HTTP route.
    // Returns the HTTP status the route would have answered with.
    int invoke(const std::string& method, const nlohmann::json& params, nlohmann::json& reply) const;

    // Binds (port 0 picks a free one) and serves on a background thread.
    bool start();
    void stop();

    int port() const { return port_; }
    const std::string& host() const { return host_; }
    const std::string& path() const { return path_; }
    const std::string& interface() const { return interface_; }
    std::string base_url() const { return "http://" + host_ + ":" + std::to_string(port_); }

private:
    std::string host_;
    int port_;
    std::string path_;
    std::string interface_;
    std::string api_key_;
    std::map<std::string, RpcMethod> methods_;
    httplib::Server server_;
    std::thread thread_;

    void handle(const httplib::Request& req, httplib::Response& res) const;
    bool check_auth(const httplib::Request& req, httplib::Response& res) const;
};

} // namespace deskmcp
