#pragma once
#include "../agent_types.hpp"
#include <string>
#include <chrono>
#include <nlohmann/json.hpp>

namespace deskmcp {

enum class TransportStatus {
    Ok,           // the endpoint answered; body holds the method's reply
    Unreachable,  // connection refused, reset, DNS failure, ...
    Timeout,      // no answer within the deadline
    RemoteError   // the endpoint answered but rejected the envelope itself
};

std::string transport_status_to_string(TransportStatus s);

struct RpcReply {
    TransportStatus status = TransportStatus::Unreachable;
    nlohmann::json body;
    std::string error;

    bool ok() const { return status == TransportStatus::Ok; }
    // Unreachable and timed-out endpoints are handled alike by failover.
    bool endpoint_down() const {
        return status == TransportStatus::Unreachable || status == TransportStatus::Timeout;
    }

    static RpcReply success(nlohmann::json body) {
        RpcReply r;
        r.status = TransportStatus::Ok;
        r.body = std::move(body);
        return r;
    }
    static RpcReply failure(TransportStatus status, std::string error) {
        RpcReply r;
        r.status = status;
        r.error = std::move(error);
        return r;
    }
};

// Calls a named method on a remote object. Implementations never throw for
// transport problems; they report them through RpcReply::status.
class RpcTransport {
public:
    virtual ~RpcTransport() = default;
    virtual RpcReply call(const AgentAddress& address, const std::string& method,
                          const nlohmann::json& params, std::chrono::milliseconds timeout) = 0;
};

} // namespace deskmcp
