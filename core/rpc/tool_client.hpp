#pragma once

#include <sys/types.h>

#include <chrono>
#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include "i_tool_client.hpp"
#include "pending_table.hpp"
#include "restart_tracker.hpp"
#include "rpc_channel.hpp"
#include "server_config.hpp"

namespace toolproxy {
namespace rpc {

constexpr const char *kClientName = "toolproxy";
constexpr const char *kClientVersion = "0.1.0";

/**
 * @brief Supervised client for one MCP tool server subprocess
 *
 * Drives the connection state machine:
 *
 *   STOPPED -> STARTING -> READY -> DEGRADED -> RESTARTING -> STARTING ...
 *                  \                                  \
 *                   -> STOPPED (spawn/handshake)       -> STOPPED (budget exhausted)
 *
 * The first call spawns the server lazily. A timed-out call restarts the whole
 * connection (a hang usually means a wedged server), which fails every other call
 * still pending on that generation with RESTART. A dead server (reader EOF, failed
 * write, or exit noticed before a send) fails pending calls immediately and is
 * replaced on the next call.
 *
 * Restarts are serialized by the lifecycle mutex and keyed by the generation the
 * failing caller observed, so simultaneous failures produce one restart.
 *
 * Thread Safety: all public methods may be called from any thread.
 */
class ToolClient : public IToolClient {
public:
    explicit ToolClient(const ServerConfig &config);
    ~ToolClient() override;

    ToolClient(const ToolClient &) = delete;
    ToolClient &operator=(const ToolClient &) = delete;

    // Spawn and handshake now instead of on first use. Also closes an open circuit breaker.
    RpcResult start() override;

    // Terminate the server and fail in-flight calls with UNAVAILABLE
    void shutdown() override;

    bool is_available() const override { return state() == ConnectionState::READY; }
    ConnectionState state() const override;

    RpcResult call_tool(const std::string &name, const nlohmann::json &arguments,
                        std::optional<std::chrono::milliseconds> timeout = std::nullopt) override;
    RpcResult list_tools(std::vector<ToolDescriptor> &tools) override;

    // Generic request on the supervised connection
    RpcResult send(const std::string &method, const nlohmann::json &params,
                   std::optional<std::chrono::milliseconds> timeout = std::nullopt);

    const std::string &name() const override { return config_.name; }

    // Diagnostics
    uint64_t generation() const;
    int restart_count() const;
    pid_t server_pid() const;
    nlohmann::json server_info() const;
    // Highest request id written on the current generation, 0 before the first spawn
    int64_t last_request_id();
    RestartTracker::Snapshot restart_snapshot() const { return restarts_.snapshot(); }
    size_t pending_count() const { return pending_.size(); }

private:
    ServerConfig config_;
    std::string tag_;
    PendingTable pending_;
    RestartTracker restarts_;

    // Serializes start/restart/shutdown; guards channel_ and shut_down_
    std::mutex lifecycle_mutex_;
    std::shared_ptr<RpcChannel> channel_;
    bool shut_down_ = false;

    // Guards the fields below. Lock order: lifecycle_mutex_ before state_mutex_.
    mutable std::mutex state_mutex_;
    ConnectionState state_ = ConnectionState::STOPPED;
    uint64_t generation_ = 0;
    int restart_count_ = 0;
    pid_t server_pid_ = -1;
    nlohmann::json server_info_;  // serverInfo from the last handshake

    // Returns the Ready channel, starting or restarting as needed
    std::shared_ptr<RpcChannel> ensure_ready(RpcResult &error);

    RpcResult start_locked();
    RpcResult restart_locked(const std::string &reason);
    void teardown_locked();

    // Called by a channel's reader or writer when its generation can no longer serve calls
    void on_generation_dead(uint64_t generation, const std::string &reason);

    // Restart after a timed-out call unless another caller already did
    void recover_after_timeout(uint64_t generation, RpcResult &result);

    void set_state(ConnectionState state);
};

}  // namespace rpc
}  // namespace toolproxy
