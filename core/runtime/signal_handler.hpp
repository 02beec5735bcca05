#pragma once

#include <atomic>

namespace toolproxy {
namespace runtime {

// Records SIGINT/SIGTERM so a running command can stop between steps.
// A second signal while shutdown is already requested restores the default
// action and re-raises, so a wedged shutdown can still be interrupted.
class SignalHandler {
public:
    static void install();
    static bool is_shutdown_requested();

    // Clear the request (tests)
    static void reset();

private:
    static void handle_signal(int signal);
    static std::atomic<bool> shutdown_requested_;
};

}  // namespace runtime
}  // namespace toolproxy
