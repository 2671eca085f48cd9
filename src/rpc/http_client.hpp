#pragma once
#include "transport.hpp"
#include <string>

namespace deskmcp {

// JSON-over-HTTP transport. Each call POSTs
// {"method": M, "params": P, "interface": I} to service + path.
class HttpRpcClient : public RpcTransport {
public:
    HttpRpcClient() = default;
    explicit HttpRpcClient(std::string api_key) : api_key_(std::move(api_key)) {}

    RpcReply call(const AgentAddress& address, const std::string& method,
                  const nlohmann::json& params, std::chrono::milliseconds timeout) override;

private:
    std::string api_key_;
};

} // namespace deskmcp
