#pragma once

#include <chrono>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <vector>

#include "json_rpc.hpp"
#include "rpc_result.hpp"

namespace toolproxy {
namespace rpc {

// Supervisor lifecycle of one tool server connection
enum class ConnectionState {
    STOPPED,     // no process; next use spawns one
    STARTING,    // spawned, handshake in progress
    READY,       // handshake complete, accepting calls
    DEGRADED,    // fault detected (timeout, stream failure); restart pending
    RESTARTING   // tearing down the old generation
};

const char *state_to_string(ConnectionState state);

// Interface for ToolClient to enable mocking
class IToolClient {
public:
    virtual ~IToolClient() = default;

    // Lifecycle
    virtual RpcResult start() = 0;
    virtual void shutdown() = 0;
    virtual bool is_available() const = 0;
    virtual ConnectionState state() const = 0;

    // Tool operations (blocking, synchronous). nullopt timeout uses the configured default.
    virtual RpcResult call_tool(const std::string &name, const nlohmann::json &arguments,
                                std::optional<std::chrono::milliseconds> timeout) = 0;
    virtual RpcResult list_tools(std::vector<ToolDescriptor> &tools) = 0;

    virtual const std::string &name() const = 0;
};

}  // namespace rpc
}  // namespace toolproxy
