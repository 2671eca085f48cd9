#include "call_result.hpp"

namespace deskmcp {

std::string error_kind_to_string(ErrorKind k) {
    switch (k) {
        case ErrorKind::None:              return "none";
        case ErrorKind::MalformedRequest:  return "malformed_request";
        case ErrorKind::NotFound:          return "not_found";
        case ErrorKind::Unreachable:       return "unreachable";
        case ErrorKind::FailoverExhausted: return "failover_exhausted";
        case ErrorKind::Application:       return "application";
        case ErrorKind::Internal:          return "internal";
    }
    return "internal";
}

bool is_retryable(ErrorKind k) {
    return k == ErrorKind::Unreachable || k == ErrorKind::FailoverExhausted;
}

CallResult CallResult::ok(nlohmann::json result) {
    CallResult r;
    r.success = true;
    // a null result would leave the envelope with neither field set
    r.result = result.is_null() ? nlohmann::json::object() : std::move(result);
    return r;
}

CallResult CallResult::fail(ErrorKind kind, std::string error) {
    CallResult r;
    r.success = false;
    r.kind = kind;
    r.error = error.empty() ? "unspecified error" : std::move(error);
    return r;
}

nlohmann::json CallResult::to_json() const {
    nlohmann::json j;
    j["success"] = success;
    if (success) {
        j["result"] = result;
    } else {
        j["error"] = error;
        j["error_type"] = error_kind_to_string(kind);
        j["retryable"] = is_retryable(kind);
    }
    if (!instance_id.empty()) j["instance_id"] = instance_id;
    if (failover) j["failover"] = true;
    return j;
}

} // namespace deskmcp
