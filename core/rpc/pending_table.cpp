#include "pending_table.hpp"

#include <iterator>
#include <vector>

namespace toolproxy {
namespace rpc {

bool PendingTable::insert(const WaiterPtr &waiter) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (waiter->generation <= retired_through_) {
        return false;
    }
    return waiters_.emplace(Key{waiter->generation, waiter->id}, waiter).second;
}

WaiterPtr PendingTable::take(uint64_t generation, int64_t id) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (generation <= retired_through_) {
        return nullptr;
    }
    auto it = waiters_.find(Key{generation, id});
    if (it == waiters_.end()) {
        return nullptr;
    }
    WaiterPtr waiter = std::move(it->second);
    waiters_.erase(it);
    return waiter;
}

size_t PendingTable::retire_through(uint64_t generation, const RpcResult &reason) {
    std::vector<WaiterPtr> failed;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (generation > retired_through_) {
            retired_through_ = generation;
        }
        // Keys sort by generation first, so retired waiters form a prefix
        auto end = waiters_.upper_bound(Key{retired_through_, INT64_MAX});
        for (auto it = waiters_.begin(); it != end; ++it) {
            failed.push_back(std::move(it->second));
        }
        waiters_.erase(waiters_.begin(), end);
    }

    for (auto &waiter : failed) {
        waiter->resolve(reason);
    }
    return failed.size();
}

bool PendingTable::is_retired(uint64_t generation) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return generation <= retired_through_;
}

size_t PendingTable::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return waiters_.size();
}

size_t PendingTable::size(uint64_t generation) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto begin = waiters_.lower_bound(Key{generation, INT64_MIN});
    auto end = waiters_.upper_bound(Key{generation, INT64_MAX});
    return static_cast<size_t>(std::distance(begin, end));
}

}  // namespace rpc
}  // namespace toolproxy
