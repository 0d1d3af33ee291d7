/**
 * @file client_registry.hpp
 * @brief Shared set of live client connections
 * @version 1.0
 * @date 2026-10-19
 *
 * Entries are keyed by client id. Ids are handed out in increasing order, so
 * iteration follows insertion order. Readers take a snapshot under the lock
 * and iterate it without holding the lock.
 *
 * @copyright Copyright (c) 2026
 */

#pragma once

#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <vector>

#include "client_connection.hpp"

namespace canlink {

    class ClientRegistry {
        private:
            mutable std::mutex mutex_;
            std::map<std::uint64_t, std::shared_ptr<ClientConnection> > clients_;

        public:
            ClientRegistry() = default;
            ClientRegistry(const ClientRegistry&) = delete;
            ClientRegistry& operator=(const ClientRegistry&) = delete;

            /**
             * @brief Register a connection
             * @return bool False if a connection with the same id is already present
             */
            bool add(std::shared_ptr<ClientConnection> client);

            /**
             * @brief Remove a connection by id
             * @return bool True if it was present
             */
            bool remove(std::uint64_t id);

            bool contains(std::uint64_t id) const;

            /**
             * @brief Copy of the current entries in insertion order
             */
            std::vector<std::shared_ptr<ClientConnection> > snapshot() const;

            std::size_t size() const;
            bool empty() const { return size() == 0; }
    };

} // namespace canlink
