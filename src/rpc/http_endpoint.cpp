#include "http_endpoint.hpp"
#include <chrono>
#include <iostream>

namespace deskmcp {

static nlohmann::json error_body(const std::string& message, const std::string& type) {
    return {{"success", false}, {"error", message}, {"error_type", type}, {"retryable", false}};
}

RpcEndpoint::RpcEndpoint(std::string host, int port, std::string path,
                         std::string interface, std::string api_key)
    : host_(std::move(host)), port_(port), path_(std::move(path))
    , interface_(std::move(interface)), api_key_(std::move(api_key)) {
    if (path_.empty()) path_ = "/rpc";
}

RpcEndpoint::~RpcEndpoint() {
    stop();
}

void RpcEndpoint::add_method(const std::string& name, RpcMethod method) {
    methods_[name] = std::move(method);
}

int RpcEndpoint::invoke(const std::string& method, const nlohmann::json& params, nlohmann::json& reply) const {
    auto it = methods_.find(method);
    if (it == methods_.end()) {
        reply = error_body("Unknown method: " + method, "not_found");
        return 404;
    }
    try {
        reply = it->second(params.is_null() ? nlohmann::json::object() : params);
        return 200;
    } catch (const std::exception& e) {
        std::cerr << "[rpc] " << method << " failed: " << e.what() << "\n";
        reply = error_body(e.what(), "internal");
        return 500;
    }
}

bool RpcEndpoint::check_auth(const httplib::Request& req, httplib::Response& res) const {
    if (api_key_.empty()) return true;

    auto auth = req.get_header_value("Authorization");
    if (auth != "Bearer " + api_key_) {
        res.status = 401;
        res.set_content(error_body("unauthorized", "malformed_request").dump(), "application/json");
        return false;
    }
    return true;
}

void RpcEndpoint::handle(const httplib::Request& req, httplib::Response& res) const {
    if (!check_auth(req, res)) return;

    nlohmann::json envelope;
    try {
        envelope = nlohmann::json::parse(req.body);
    } catch (const std::exception& e) {
        res.status = 400;
        res.set_content(error_body(std::string("invalid JSON in request body: ") + e.what(),
                                   "malformed_request").dump(), "application/json");
        return;
    }

    if (!envelope.is_object() || !envelope.contains("method") || !envelope["method"].is_string()) {
        res.status = 400;
        res.set_content(error_body("Missing required field: method", "malformed_request").dump(),
                        "application/json");
        return;
    }

    if (envelope.contains("interface") && envelope["interface"].is_string()) {
        std::string iface = envelope["interface"].get<std::string>();
        if (!iface.empty() && iface != interface_) {
            res.status = 404;
            res.set_content(error_body("No such interface: " + iface, "not_found").dump(), "application/json");
            return;
        }
    }

    nlohmann::json params = envelope.contains("params") ? envelope["params"] : nlohmann::json::object();
    nlohmann::json reply;
    res.status = invoke(envelope["method"].get<std::string>(), params, reply);
    res.set_content(reply.dump(), "application/json");
}

bool RpcEndpoint::start() {
    server_.Get("/health", [this](const httplib::Request&, httplib::Response& res) {
        nlohmann::json j = {{"status", "ok"}, {"interface", interface_}};
        res.set_content(j.dump(), "application/json");
    });

    server_.set_exception_handler([](const httplib::Request&, httplib::Response& res, std::exception_ptr ep) {
        std::string msg = "unknown error";
        try { if (ep) std::rethrow_exception(ep); }
        catch (const std::exception& e) { msg = e.what(); }
        catch (...) { msg = "non-std exception"; }
        std::cerr << "[rpc] Unhandled exception: " << msg << "\n";
        res.status = 500;
        res.set_content(error_body(msg, "internal").dump(), "application/json");
    });

    server_.Post(path_, [this](const httplib::Request& req, httplib::Response& res) {
        handle(req, res);
    });

    if (port_ == 0) {
        port_ = server_.bind_to_any_port(host_);
        if (port_ <= 0) {
            std::cerr << "[rpc] Failed to bind " << host_ << " to any port\n";
            return false;
        }
    } else if (!server_.bind_to_port(host_, port_)) {
        std::cerr << "[rpc] Failed to bind " << host_ << ":" << port_ << "\n";
        return false;
    }

    thread_ = std::thread([this]() {
        std::cerr << "[rpc] " << interface_ << " listening on " << host_ << ":" << port_ << path_ << "\n";
        server_.listen_after_bind();
    });

    for (int i = 0; i < 200 && !server_.is_running(); ++i) {
        std::this_thread::sleep_for(std::chrono::milliseconds(10));
    }
    return server_.is_running();
}

void RpcEndpoint::stop() {
    server_.stop();
    if (thread_.joinable()) thread_.join();
}

} // namespace deskmcp
