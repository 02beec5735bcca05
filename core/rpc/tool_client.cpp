#include "tool_client.hpp"

#include <thread>
#include <utility>

#include "logging/logger.hpp"

namespace toolproxy {
namespace rpc {

const char *state_to_string(ConnectionState state) {
    switch (state) {
        case ConnectionState::STOPPED:
            return "STOPPED";
        case ConnectionState::STARTING:
            return "STARTING";
        case ConnectionState::READY:
            return "READY";
        case ConnectionState::DEGRADED:
            return "DEGRADED";
        case ConnectionState::RESTARTING:
            return "RESTARTING";
    }
    return "UNKNOWN";
}

ToolClient::ToolClient(const ServerConfig &config)
    : config_(config), tag_("[ToolClient:" + config.name + "]"), restarts_(config.restart_policy) {}

ToolClient::~ToolClient() { shutdown(); }

ConnectionState ToolClient::state() const {
    std::lock_guard<std::mutex> lock(state_mutex_);
    return state_;
}

uint64_t ToolClient::generation() const {
    std::lock_guard<std::mutex> lock(state_mutex_);
    return generation_;
}

int ToolClient::restart_count() const {
    std::lock_guard<std::mutex> lock(state_mutex_);
    return restart_count_;
}

pid_t ToolClient::server_pid() const {
    std::lock_guard<std::mutex> lock(state_mutex_);
    return server_pid_;
}

nlohmann::json ToolClient::server_info() const {
    std::lock_guard<std::mutex> lock(state_mutex_);
    return server_info_;
}

int64_t ToolClient::last_request_id() {
    std::lock_guard<std::mutex> lock(lifecycle_mutex_);
    return channel_ ? channel_->last_request_id() : 0;
}

void ToolClient::set_state(ConnectionState state) {
    ConnectionState previous;
    {
        std::lock_guard<std::mutex> lock(state_mutex_);
        previous = state_;
        state_ = state;
    }
    if (previous != state) {
        LOG_DEBUG(tag_ << " " << state_to_string(previous) << " -> " << state_to_string(state));
    }
}

RpcResult ToolClient::start() {
    std::lock_guard<std::mutex> lock(lifecycle_mutex_);
    shut_down_ = false;
    restarts_.reset();

    if (state() == ConnectionState::READY && channel_ && channel_->alive()) {
        return RpcResult::ok(server_info());
    }

    if (channel_) {
        pending_.retire_through(generation(), RpcResult::failure(ErrorKind::RESTART, "Server restarted by operator"));
        teardown_locked();
    }
    return start_locked();
}

void ToolClient::shutdown() {
    std::lock_guard<std::mutex> lock(lifecycle_mutex_);
    if (shut_down_ && !channel_) {
        return;
    }
    shut_down_ = true;

    if (channel_) {
        LOG_INFO(tag_ << " Shutting down");
    }
    pending_.retire_through(generation(), RpcResult::failure(ErrorKind::UNAVAILABLE, "Client shut down"));
    teardown_locked();
    set_state(ConnectionState::STOPPED);
}

RpcResult ToolClient::call_tool(const std::string &name, const nlohmann::json &arguments,
                                std::optional<std::chrono::milliseconds> timeout) {
    return send(jsonrpc::kMethodToolsCall, jsonrpc::make_tool_call_params(name, arguments), timeout);
}

RpcResult ToolClient::list_tools(std::vector<ToolDescriptor> &tools) {
    RpcResult result = send(jsonrpc::kMethodToolsList, nlohmann::json::object());
    if (!result.success) {
        return result;
    }

    std::string error;
    if (!decode_tool_list(result.value, tools, error)) {
        LOG_ERROR(tag_ << " " << error);
        return RpcResult::failure(ErrorKind::PROTOCOL, error);
    }
    return result;
}

RpcResult ToolClient::send(const std::string &method, const nlohmann::json &params,
                           std::optional<std::chrono::milliseconds> timeout) {
    int timeout_ms = config_.timeout_ms;
    if (timeout && timeout->count() > 0) {
        timeout_ms = static_cast<int>(timeout->count());
    }

    RpcResult error;
    std::shared_ptr<RpcChannel> channel = ensure_ready(error);
    if (!channel) {
        return error;
    }

    RpcResult result = channel->send(method, params, timeout_ms);
    if (!result.success && result.error_kind == ErrorKind::TIMEOUT) {
        recover_after_timeout(channel->generation(), result);
    }
    return result;
}

std::shared_ptr<RpcChannel> ToolClient::ensure_ready(RpcResult &error) {
    std::lock_guard<std::mutex> lock(lifecycle_mutex_);

    if (shut_down_) {
        error = RpcResult::failure(ErrorKind::UNAVAILABLE, "Client for '" + config_.name + "' is shut down");
        return nullptr;
    }

    ConnectionState current = state();
    if (current == ConnectionState::READY && channel_) {
        if (channel_->alive()) {
            return channel_;
        }
        // Exit noticed before the send; the reader may not have reported it yet
        LOG_WARN(tag_ << " Server process exited, restarting before send");
        on_generation_dead(channel_->generation(), "process exited");
        current = state();
    }

    RpcResult result;
    if (current == ConnectionState::DEGRADED) {
        result = restart_locked("connection degraded");
    } else {
        if (restarts_.is_circuit_open()) {
            error = RpcResult::failure(ErrorKind::UNAVAILABLE,
                                       "Restart budget for '" + config_.name + "' exhausted; call start() to retry");
            return nullptr;
        }
        result = start_locked();
    }

    if (!result.success) {
        error = result;
        return nullptr;
    }
    return channel_;
}

RpcResult ToolClient::start_locked() {
    set_state(ConnectionState::STARTING);

    uint64_t generation;
    {
        std::lock_guard<std::mutex> lock(state_mutex_);
        generation = ++generation_;
        server_pid_ = -1;
    }

    LOG_INFO(tag_ << " Starting server (generation " << generation << ")");

    auto process = std::make_unique<ServerProcess>(config_.name, config_.command, config_.args, config_.env,
                                                   config_.shutdown_grace_ms);
    if (!process->spawn()) {
        std::string why = process->last_error();
        set_state(ConnectionState::STOPPED);
        return RpcResult::failure(ErrorKind::SPAWN, "Failed to spawn server '" + config_.name + "': " + why);
    }
    pid_t pid = process->pid();

    channel_ = std::make_shared<RpcChannel>(generation, std::move(process), pending_,
                                            [this](uint64_t dead_generation, const std::string &reason) {
                                                on_generation_dead(dead_generation, reason);
                                            });
    channel_->start();

    // Handshake: initialize request, then the initialized notification
    RpcResult init = channel_->send(jsonrpc::kMethodInitialize,
                                    jsonrpc::make_initialize_params(kClientName, kClientVersion),
                                    config_.handshake_timeout_ms);
    std::string why;
    if (!init.success) {
        why = init.error_message;
    } else if (!channel_->notify(jsonrpc::kMethodInitialized, nlohmann::json::object(), why)) {
        init.success = false;
    }

    if (!init.success) {
        LOG_ERROR(tag_ << " Handshake failed: " << why);
        pending_.retire_through(generation, RpcResult::failure(ErrorKind::RESTART, "Handshake failed"));
        teardown_locked();
        restarts_.record_failure();
        set_state(ConnectionState::STOPPED);
        return RpcResult::failure(ErrorKind::HANDSHAKE, "Handshake with '" + config_.name + "' failed: " + why);
    }

    nlohmann::json info = nlohmann::json::object();
    if (init.value.is_object() && init.value.contains("serverInfo") && init.value["serverInfo"].is_object()) {
        info = init.value["serverInfo"];
    }
    {
        std::lock_guard<std::mutex> lock(state_mutex_);
        server_info_ = info;
        server_pid_ = pid;
        state_ = ConnectionState::READY;
    }
    restarts_.record_ready();

    LOG_INFO(tag_ << " Ready (generation " << generation << ", PID=" << pid << ", server "
                  << info.value("name", std::string("unknown")) << " " << info.value("version", std::string("?"))
                  << ")");
    return RpcResult::ok(init.value);
}

RpcResult ToolClient::restart_locked(const std::string &reason) {
    uint64_t old_generation;
    {
        std::lock_guard<std::mutex> lock(state_mutex_);
        state_ = ConnectionState::RESTARTING;
        old_generation = generation_;
        restart_count_++;
    }

    LOG_WARN(tag_ << " Restarting server (generation " << old_generation << "): " << reason);

    // Retire first: anything the old reader resolves from here on is stale
    size_t failed = pending_.retire_through(
        old_generation, RpcResult::failure(ErrorKind::RESTART, "Server restarted: " + reason));
    if (failed > 0) {
        LOG_WARN(tag_ << " Failed " << failed << " in-flight request(s) of generation " << old_generation);
    }

    teardown_locked();

    std::optional<int> backoff_ms = restarts_.record_failure();
    if (!backoff_ms) {
        set_state(ConnectionState::STOPPED);
        return RpcResult::failure(ErrorKind::UNAVAILABLE,
                                  "Restart budget for '" + config_.name + "' exhausted; call start() to retry");
    }
    if (*backoff_ms > 0) {
        std::this_thread::sleep_for(std::chrono::milliseconds(*backoff_ms));
    }

    return start_locked();
}

void ToolClient::teardown_locked() {
    if (!channel_) {
        return;
    }
    std::shared_ptr<RpcChannel> channel = std::move(channel_);
    channel_.reset();
    channel->close();
    {
        std::lock_guard<std::mutex> lock(state_mutex_);
        server_pid_ = -1;
    }
}

void ToolClient::on_generation_dead(uint64_t generation, const std::string &reason) {
    {
        std::lock_guard<std::mutex> lock(state_mutex_);
        if (generation != generation_) {
            return;  // stale report from a retired generation
        }
        if (state_ == ConnectionState::READY) {
            state_ = ConnectionState::DEGRADED;
        } else if (state_ != ConnectionState::STARTING) {
            return;
        }
    }

    LOG_WARN(tag_ << " Generation " << generation << " lost: " << reason);
    pending_.retire_through(generation, RpcResult::failure(ErrorKind::RESTART, "Server connection lost: " + reason));
}

void ToolClient::recover_after_timeout(uint64_t generation, RpcResult &result) {
    std::lock_guard<std::mutex> lock(lifecycle_mutex_);
    if (shut_down_) {
        return;
    }

    {
        std::lock_guard<std::mutex> state_lock(state_mutex_);
        if (generation != generation_) {
            return;  // someone already restarted
        }
        if (state_ != ConnectionState::READY && state_ != ConnectionState::DEGRADED) {
            return;
        }
        state_ = ConnectionState::DEGRADED;
    }

    RpcResult restarted = restart_locked("request timed out");
    if (!restarted.success) {
        LOG_ERROR(tag_ << " Restart after timeout failed: " << restarted.error_message);
        result.error_message += " (restart failed: " + restarted.error_message + ")";
    }
}

}  // namespace rpc
}  // namespace toolproxy
