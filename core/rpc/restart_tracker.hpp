#pragma once

#include <chrono>
#include <cstdint>
#include <mutex>
#include <optional>

#include "server_config.hpp"

namespace toolproxy {
namespace rpc {

// RestartTracker enforces the restart budget of one tool server:
// per-attempt backoff and a circuit breaker after max_attempts consecutive failures.
// A generation that stays Ready for success_reset_ms earns a fresh budget.
class RestartTracker {
public:
    // Immutable snapshot for diagnostics and tests
    struct Snapshot {
        bool limits_enabled = false;
        int attempt_count = 0;
        int max_attempts = 0;
        bool circuit_open = false;
        int total_failures = 0;
        std::optional<int64_t> ready_for_ms;  // nullopt when not Ready
    };

    explicit RestartTracker(const RestartPolicyConfig &policy);

    // Record that a generation reached Ready (starts the stability window)
    void record_ready();

    // Record a failed generation (crash, hang, failed handshake).
    // Returns the backoff to apply before the next attempt, or nullopt if the circuit is now open.
    std::optional<int> record_failure();

    bool is_circuit_open() const;
    int attempt_count() const;

    // Close the circuit and forget previous attempts (explicit operator restart)
    void reset();

    Snapshot snapshot() const;

private:
    RestartPolicyConfig policy_;

    mutable std::mutex mutex_;
    int attempt_count_ = 0;
    int total_failures_ = 0;
    bool circuit_open_ = false;
    // Set by record_ready; reset to {} when the generation fails.
    std::chrono::steady_clock::time_point ready_since_;
};

}  // namespace rpc
}  // namespace toolproxy
