#pragma once
#include <string>
#include <nlohmann/json.hpp>

namespace deskmcp {

enum class ErrorKind {
    None,
    MalformedRequest,
    NotFound,
    Unreachable,        // transient; one failover already attempted or possible
    FailoverExhausted,  // unreachable and no alternate instance left
    Application,        // the tool itself reported failure
    Internal
};

std::string error_kind_to_string(ErrorKind k);
bool is_retryable(ErrorKind k);

// Response half of the call envelope. Exactly one of result / error is
// populated; the factories are the only way to build one.
struct CallResult {
    bool success = false;
    nlohmann::json result;
    std::string error;
    ErrorKind kind = ErrorKind::None;

    std::string instance_id;   // serving instance, remote calls only
    bool failover = false;

    static CallResult ok(nlohmann::json result);
    static CallResult fail(ErrorKind kind, std::string error);

    nlohmann::json to_json() const;
};

} // namespace deskmcp
