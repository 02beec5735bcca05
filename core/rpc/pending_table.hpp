#pragma once

#include <chrono>
#include <cstdint>
#include <future>
#include <map>
#include <memory>
#include <mutex>
#include <utility>

#include "rpc_result.hpp"

namespace toolproxy {
namespace rpc {

// Per-request completion handle. The caller keeps the future; the table keeps the Waiter
// until someone takes it out, so whoever takes it is the only one who may resolve it.
struct Waiter {
    Waiter(uint64_t generation, int64_t id, std::chrono::steady_clock::time_point deadline)
        : generation(generation), id(id), deadline(deadline) {}

    const uint64_t generation;
    const int64_t id;
    const std::chrono::steady_clock::time_point deadline;

    std::future<RpcResult> future() { return promise_.get_future(); }
    void resolve(RpcResult result) { promise_.set_value(std::move(result)); }

private:
    std::promise<RpcResult> promise_;
};

using WaiterPtr = std::shared_ptr<Waiter>;

/**
 * @brief Thread-safe table of in-flight requests keyed by (generation, id)
 *
 * Mutated by one reader per generation and any number of callers. Retiring a
 * generation fails all of its waiters and makes later inserts and lookups for it
 * fail, so a response that arrives after a restart can never resolve a waiter of
 * the new generation.
 *
 * Waiters are always resolved outside the table lock.
 */
class PendingTable {
public:
    PendingTable() = default;

    PendingTable(const PendingTable &) = delete;
    PendingTable &operator=(const PendingTable &) = delete;

    // Register a waiter. Returns false if its generation is retired or the key is taken.
    bool insert(const WaiterPtr &waiter);

    // Remove and return the waiter for (generation, id); nullptr if absent or retired
    WaiterPtr take(uint64_t generation, int64_t id);

    // Retire every generation up to and including `generation`; fail their waiters
    // with `reason`. Returns the number of waiters failed. Idempotent.
    size_t retire_through(uint64_t generation, const RpcResult &reason);

    bool is_retired(uint64_t generation) const;

    size_t size() const;
    size_t size(uint64_t generation) const;

private:
    using Key = std::pair<uint64_t, int64_t>;

    mutable std::mutex mutex_;
    std::map<Key, WaiterPtr> waiters_;
    uint64_t retired_through_ = 0;  // generations are numbered from 1
};

}  // namespace rpc
}  // namespace toolproxy
