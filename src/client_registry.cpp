/**
 * @file client_registry.cpp
 * @brief Client registry implementation
 * @version 1.0
 * @date 2026-10-19
 */

#include "../include/pattern/client_registry.hpp"

namespace canlink {

    bool ClientRegistry::add(std::shared_ptr<ClientConnection> client) {
        if (!client) {
            return false;
        }
        std::lock_guard<std::mutex> lock(mutex_);
        return clients_.emplace(client->get_id(), std::move(client)).second;
    }

    bool ClientRegistry::remove(std::uint64_t id) {
        std::lock_guard<std::mutex> lock(mutex_);
        return clients_.erase(id) > 0;
    }

    bool ClientRegistry::contains(std::uint64_t id) const {
        std::lock_guard<std::mutex> lock(mutex_);
        return clients_.count(id) > 0;
    }

    std::vector<std::shared_ptr<ClientConnection> > ClientRegistry::snapshot() const {
        std::lock_guard<std::mutex> lock(mutex_);
        std::vector<std::shared_ptr<ClientConnection> > out;
        out.reserve(clients_.size());
        for (const auto& entry : clients_) {
            out.push_back(entry.second);
        }
        return out;
    }

    std::size_t ClientRegistry::size() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return clients_.size();
    }

} // namespace canlink
