#pragma once

#include <atomic>
#include <chrono>
#include <cstdint>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <nlohmann/json.hpp>
#include <string>
#include <thread>

#include "pending_table.hpp"
#include "rpc_result.hpp"
#include "server_process.hpp"

namespace toolproxy {
namespace rpc {

/**
 * @brief One spawn-to-teardown lifetime ("generation") of a tool server connection
 *
 * Owns the ServerProcess and its reader thread. send() is safe from any number of
 * threads: id allocation, waiter registration and the write happen as one unit under
 * the write mutex, so ids on the wire are strictly increasing and lines never
 * interleave. The reader is the only consumer of stdout.
 *
 * When the reader sees EOF or an I/O error it reports the generation as dead through
 * the callback (unless close() asked it to stop) and exits; reader_exited() becomes
 * ready at that point.
 */
class RpcChannel {
public:
    using DeadCallback = std::function<void(uint64_t generation, const std::string &reason)>;

    RpcChannel(uint64_t generation, std::unique_ptr<ServerProcess> process, PendingTable &pending,
               DeadCallback on_dead);
    ~RpcChannel();

    RpcChannel(const RpcChannel &) = delete;
    RpcChannel &operator=(const RpcChannel &) = delete;

    // Start the reader. The process must already be spawned.
    void start();

    // Send a request and block until its response, a local failure, or timeout_ms.
    RpcResult send(const std::string &method, const nlohmann::json &params, int timeout_ms);

    // Send a notification (no id, no response)
    bool notify(const std::string &method, const nlohmann::json &params, std::string &error);

    // Stop accepting writes, shut the server down, and wait for the reader to exit. Idempotent.
    void close();

    // Reader still running and process still alive
    bool alive();

    uint64_t generation() const { return generation_; }
    int64_t last_request_id() const;
    size_t malformed_line_count() const { return malformed_lines_.load(std::memory_order_relaxed); }
    std::chrono::steady_clock::time_point started_at() const { return started_at_; }
    std::shared_future<void> reader_exited() const { return reader_exited_; }

    ServerProcess &process() { return *process_; }

private:
    const uint64_t generation_;
    std::unique_ptr<ServerProcess> process_;
    PendingTable &pending_;
    DeadCallback on_dead_;
    std::string tag_;

    mutable std::mutex write_mutex_;  // guards next_id_, writable_ and the stdin side
    int64_t next_id_ = 1;
    bool writable_ = true;

    std::thread reader_;
    std::atomic<bool> stop_{false};
    std::promise<void> reader_done_;
    std::shared_future<void> reader_exited_;
    std::atomic<size_t> malformed_lines_{0};

    std::mutex close_mutex_;
    bool closed_ = false;

    std::chrono::steady_clock::time_point started_at_;

    void reader_loop();
    void handle_line(const std::string &line);
};

}  // namespace rpc
}  // namespace toolproxy
