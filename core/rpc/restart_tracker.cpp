#include "restart_tracker.hpp"

#include "logging/logger.hpp"

namespace toolproxy {
namespace rpc {

RestartTracker::RestartTracker(const RestartPolicyConfig &policy) : policy_(policy) {}

void RestartTracker::record_ready() {
    std::lock_guard<std::mutex> lock(mutex_);
    ready_since_ = std::chrono::steady_clock::now();
}

std::optional<int> RestartTracker::record_failure() {
    std::lock_guard<std::mutex> lock(mutex_);
    total_failures_++;

    const auto now = std::chrono::steady_clock::now();
    if (ready_since_ != std::chrono::steady_clock::time_point{} && attempt_count_ > 0) {
        const auto stable_for = std::chrono::duration_cast<std::chrono::milliseconds>(now - ready_since_).count();
        if (stable_for >= policy_.success_reset_ms) {
            LOG_INFO("[RestartTracker] Server was stable for " << stable_for << "ms (after " << attempt_count_
                                                               << " restart attempts), resetting budget");
            attempt_count_ = 0;
        }
    }
    // Failure ends the current stability window
    ready_since_ = std::chrono::steady_clock::time_point{};

    if (!policy_.enabled) {
        return 0;
    }

    attempt_count_++;

    if (attempt_count_ > policy_.max_attempts) {
        circuit_open_ = true;
        LOG_ERROR("[RestartTracker] Circuit breaker open, exceeded " << policy_.max_attempts << " restart attempts");
        return std::nullopt;
    }

    int backoff_ms = 0;
    if (!policy_.backoff_ms.empty()) {
        size_t attempt_index = static_cast<size_t>(attempt_count_ - 1);
        if (attempt_index >= policy_.backoff_ms.size()) {
            attempt_index = policy_.backoff_ms.size() - 1;
        }
        backoff_ms = policy_.backoff_ms[attempt_index];
    }

    LOG_WARN("[RestartTracker] Restart attempt " << attempt_count_ << "/" << policy_.max_attempts << ", retry in "
                                                 << backoff_ms << "ms");
    return backoff_ms;
}

bool RestartTracker::is_circuit_open() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return circuit_open_;
}

int RestartTracker::attempt_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return attempt_count_;
}

void RestartTracker::reset() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (attempt_count_ > 0 || circuit_open_) {
        LOG_INFO("[RestartTracker] Budget reset (was " << attempt_count_ << " attempts"
                                                       << (circuit_open_ ? ", circuit open" : "") << ")");
    }
    attempt_count_ = 0;
    circuit_open_ = false;
    ready_since_ = std::chrono::steady_clock::time_point{};
}

RestartTracker::Snapshot RestartTracker::snapshot() const {
    std::lock_guard<std::mutex> lock(mutex_);

    Snapshot snap;
    snap.limits_enabled = policy_.enabled;
    snap.attempt_count = attempt_count_;
    snap.max_attempts = policy_.max_attempts;
    snap.circuit_open = circuit_open_;
    snap.total_failures = total_failures_;

    if (ready_since_ == std::chrono::steady_clock::time_point{}) {
        snap.ready_for_ms = std::nullopt;
    } else {
        snap.ready_for_ms =
            std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - ready_since_)
                .count();
    }
    return snap;
}

}  // namespace rpc
}  // namespace toolproxy
