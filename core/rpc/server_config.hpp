#pragma once

#include <map>
#include <string>
#include <vector>

namespace toolproxy {
namespace rpc {

struct RestartPolicyConfig {
    bool enabled = true;                           // Enforce the budget; false restarts immediately, without limit
    int max_attempts = 3;                          // Consecutive restart attempts before the circuit opens
    std::vector<int> backoff_ms{100, 1000, 5000};  // Delay before each attempt (ms)
    int success_reset_ms = 1000;                   // Healthy uptime required before attempts reset
};

struct ServerConfig {
    std::string name;                           // e.g., "opensearch"
    std::string command;                        // Executable (absolute, relative, or resolved on PATH)
    std::vector<std::string> args;              // Command-line arguments
    std::map<std::string, std::string> env;     // Overrides on top of the inherited environment
    int timeout_ms = 30000;                     // Default per-call deadline
    int handshake_timeout_ms = 60000;           // Deadline for the initialize request
    int shutdown_grace_ms = 2000;               // Wait after stdin EOF before escalating to signals
    RestartPolicyConfig restart_policy;
};

}  // namespace rpc
}  // namespace toolproxy
