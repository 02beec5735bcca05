#pragma once

#include <map>
#include <memory>
#include <shared_mutex>
#include <string>
#include <vector>

#include "i_tool_client.hpp"

namespace toolproxy {
namespace rpc {

/**
 * @brief Thread-safe registry of tool clients by server name
 *
 * Lookups take a shared lock and hand out shared_ptr copies, so a client stays
 * alive for the duration of a call even if it is removed concurrently.
 * Names iterate in sorted order.
 */
class ToolClientRegistry {
public:
    ToolClientRegistry() = default;

    ToolClientRegistry(const ToolClientRegistry &) = delete;
    ToolClientRegistry &operator=(const ToolClientRegistry &) = delete;

    // Add or replace the client registered under `name`
    void add(const std::string &name, std::shared_ptr<IToolClient> client);

    // Returns false if no client had that name
    bool remove(const std::string &name);

    // nullptr if not found
    std::shared_ptr<IToolClient> get(const std::string &name) const;

    std::vector<std::string> names() const;
    bool contains(const std::string &name) const;
    size_t size() const;

    // Shut every client down, then empty the registry
    void shutdown_all();

private:
    mutable std::shared_mutex mutex_;
    std::map<std::string, std::shared_ptr<IToolClient>> clients_;
};

}  // namespace rpc
}  // namespace toolproxy
