#pragma once

#include <sys/types.h>

#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include "line_stdio_client.hpp"

namespace toolproxy {
namespace rpc {

// ServerProcess manages the lifecycle of one tool server child process
// Responsibilities:
// - Spawn process with redirected stdin/stdout (stderr is inherited untouched)
// - Monitor process health
// - Clean/forced shutdown
class ServerProcess {
public:
    ServerProcess(const std::string &server_name, const std::string &command,
                  const std::vector<std::string> &args = {}, const std::map<std::string, std::string> &env = {},
                  int shutdown_grace_ms = 2000);
    ~ServerProcess();

    ServerProcess(const ServerProcess &) = delete;
    ServerProcess &operator=(const ServerProcess &) = delete;

    // Spawn the server process
    // Returns true on success, false on failure (sets error_)
    bool spawn();

    // Check if process is still running (reaps it if it has exited)
    bool is_running();

    // Shutdown sequence: EOF -> wait(grace) -> SIGTERM -> wait -> SIGKILL
    void shutdown();

    // Send SIGKILL without waiting (used by tests and for wedged children)
    void kill_now();

    LineStdioClient &client() { return client_; }

    const std::string &server_name() const { return server_name_; }
    pid_t pid() const;

    // Exit status once reaped; nullopt while running or never spawned
    std::optional<int> exit_status() const;

    const std::string &last_error() const { return error_; }

    // Resolve `command` against PATH (taken from `env` when it overrides PATH).
    // Commands containing '/' are returned as-is when they exist.
    static std::optional<std::string> resolve_executable(const std::string &command,
                                                         const std::map<std::string, std::string> &env);

private:
    std::string server_name_;
    std::string command_;
    std::vector<std::string> args_;
    std::map<std::string, std::string> env_;
    int shutdown_grace_ms_;
    std::string error_;

    LineStdioClient client_;

    mutable std::mutex mutex_;  // guards pid_ and exit_status_
    pid_t pid_;
    std::optional<int> exit_status_;

    bool reap(bool block);
    bool wait_for_exit(int timeout_ms);
    void send_signal(int sig);
    std::vector<std::string> build_environment() const;
};

}  // namespace rpc
}  // namespace toolproxy
