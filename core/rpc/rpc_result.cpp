#include "rpc_result.hpp"

#include <utility>

namespace toolproxy {
namespace rpc {

const char *error_kind_to_string(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::NONE:
            return "NONE";
        case ErrorKind::SPAWN:
            return "SPAWN";
        case ErrorKind::HANDSHAKE:
            return "HANDSHAKE";
        case ErrorKind::PROTOCOL:
            return "PROTOCOL";
        case ErrorKind::REMOTE:
            return "REMOTE";
        case ErrorKind::TIMEOUT:
            return "TIMEOUT";
        case ErrorKind::RESTART:
            return "RESTART";
        case ErrorKind::IO:
            return "IO";
        case ErrorKind::UNAVAILABLE:
            return "UNAVAILABLE";
    }
    return "UNKNOWN";
}

RpcResult RpcResult::ok(nlohmann::json value) {
    RpcResult result;
    result.success = true;
    result.value = std::move(value);
    return result;
}

RpcResult RpcResult::failure(ErrorKind kind, std::string message) {
    RpcResult result;
    result.success = false;
    result.error_kind = kind;
    result.error_message = std::move(message);
    return result;
}

RpcResult RpcResult::remote(nlohmann::json error) {
    RpcResult result;
    result.success = false;
    result.error_kind = ErrorKind::REMOTE;
    if (error.is_object() && error.contains("message") && error["message"].is_string()) {
        result.error_message = "Server returned error: " + error["message"].get<std::string>();
        if (error.contains("code") && error["code"].is_number_integer()) {
            result.error_message += " (code " + std::to_string(error["code"].get<int64_t>()) + ")";
        }
    } else {
        result.error_message = "Server returned error: " + error.dump();
    }
    result.remote_error = std::move(error);
    return result;
}

}  // namespace rpc
}  // namespace toolproxy
