#include "tool_client_registry.hpp"

#include <mutex>

#include "logging/logger.hpp"

namespace toolproxy {
namespace rpc {

void ToolClientRegistry::add(const std::string &name, std::shared_ptr<IToolClient> client) {
    std::unique_lock<std::shared_mutex> lock(mutex_);
    clients_[name] = std::move(client);
}

bool ToolClientRegistry::remove(const std::string &name) {
    std::unique_lock<std::shared_mutex> lock(mutex_);
    return clients_.erase(name) > 0;
}

std::shared_ptr<IToolClient> ToolClientRegistry::get(const std::string &name) const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    auto it = clients_.find(name);
    if (it != clients_.end()) {
        return it->second;
    }
    return nullptr;
}

std::vector<std::string> ToolClientRegistry::names() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    std::vector<std::string> names;
    names.reserve(clients_.size());
    for (const auto &[name, client] : clients_) {
        names.push_back(name);
    }
    return names;
}

bool ToolClientRegistry::contains(const std::string &name) const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return clients_.find(name) != clients_.end();
}

size_t ToolClientRegistry::size() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return clients_.size();
}

void ToolClientRegistry::shutdown_all() {
    std::map<std::string, std::shared_ptr<IToolClient>> clients;
    {
        std::unique_lock<std::shared_mutex> lock(mutex_);
        clients.swap(clients_);
    }

    // Outside the lock: shutdown waits for each server to exit
    for (const auto &[name, client] : clients) {
        LOG_DEBUG("[Registry] Shutting down '" << name << "'");
        client->shutdown();
    }
}

}  // namespace rpc
}  // namespace toolproxy
