#pragma once

#include <nlohmann/json.hpp>
#include <string>

namespace toolproxy {
namespace rpc {

// Failure taxonomy surfaced to callers
enum class ErrorKind {
    NONE,
    SPAWN,        // server process could not be started
    HANDSHAKE,    // initialize failed or timed out
    PROTOCOL,     // malformed or unexpected message shape
    REMOTE,       // response carried an error object
    TIMEOUT,      // deadline elapsed waiting for the response
    RESTART,      // request was in flight when its generation was retired
    IO,           // writing to the server failed
    UNAVAILABLE   // restart budget exhausted or client shut down
};

const char *error_kind_to_string(ErrorKind kind);

// Result of a single RPC - status and either the result payload or an error
struct RpcResult {
    bool success = false;
    ErrorKind error_kind = ErrorKind::NONE;
    std::string error_message;
    nlohmann::json value;         // "result" member on success
    nlohmann::json remote_error;  // "error" member when error_kind == REMOTE

    static RpcResult ok(nlohmann::json value);
    static RpcResult failure(ErrorKind kind, std::string message);
    static RpcResult remote(nlohmann::json error);
};

}  // namespace rpc
}  // namespace toolproxy
