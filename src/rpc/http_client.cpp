#include "http_client.hpp"
#include "../utils.hpp"
#include <httplib.h>
#include <iostream>

namespace deskmcp {

std::string transport_status_to_string(TransportStatus s) {
    switch (s) {
        case TransportStatus::Ok:          return "ok";
        case TransportStatus::Unreachable: return "unreachable";
        case TransportStatus::Timeout:     return "timeout";
        case TransportStatus::RemoteError: return "remote_error";
    }
    return "unreachable";
}

RpcReply HttpRpcClient::call(const AgentAddress& address, const std::string& method,
                             const nlohmann::json& params, std::chrono::milliseconds timeout) {
    UrlParts url;
    try {
        url = parse_url(address.service);
    } catch (const std::exception& e) {
        return RpcReply::failure(TransportStatus::Unreachable,
                                 "Invalid service address '" + address.service + "': " + e.what());
    }
    if (url.scheme != "http") {
        return RpcReply::failure(TransportStatus::Unreachable, "Unsupported scheme: " + url.scheme);
    }

    httplib::Client cli(url.host, url.port);
    auto secs = static_cast<time_t>(timeout.count() / 1000);
    auto usecs = static_cast<time_t>((timeout.count() % 1000) * 1000);
    cli.set_connection_timeout(secs, usecs);
    cli.set_read_timeout(secs, usecs);
    cli.set_write_timeout(secs, usecs);
    if (!api_key_.empty()) cli.set_bearer_token_auth(api_key_);

    nlohmann::json envelope = {
        {"method", method},
        {"params", params.is_null() ? nlohmann::json::object() : params}
    };
    if (!address.interface.empty()) envelope["interface"] = address.interface;

    std::string path = url.path + (address.path.empty() ? "/rpc" : address.path);
    auto res = cli.Post(path, envelope.dump(), "application/json");
    if (!res) {
        auto err = res.error();
        auto status = (err == httplib::Error::Read) ? TransportStatus::Timeout : TransportStatus::Unreachable;
        return RpcReply::failure(status, method + " to " + address.service + path + ": " + httplib::to_string(err));
    }

    nlohmann::json body;
    try {
        body = nlohmann::json::parse(res->body);
    } catch (const std::exception& e) {
        return RpcReply::failure(TransportStatus::RemoteError,
                                 "Unparsable reply from " + address.service + ": " + e.what());
    }

    if (res->status != 200) {
        std::string msg;
        if (body.is_object() && body.contains("error") && body["error"].is_string()) {
            msg = body["error"].get<std::string>();
        }
        if (msg.empty()) msg = "HTTP " + std::to_string(res->status);
        RpcReply r = RpcReply::failure(TransportStatus::RemoteError, msg);
        r.body = std::move(body);
        return r;
    }
    return RpcReply::success(std::move(body));
}

} // namespace deskmcp
