/**
 * @file tcp_listener.hpp
 * @brief Listening TCP socket for one gateway endpoint
 * @version 1.0
 * @date 2026-10-19
 */

#pragma once

#include <cstdint>
#include <memory>
#include <string>

#include "real_tcp_stream.hpp"

namespace canlink {

    /**
     * @brief Non-blocking IPv4 listening socket
     *
     * The descriptor is meant to be polled (see GatewayServer::accept_loop());
     * accept() never blocks.
     */
    class TcpListener {
        private:
            std::string host_;
            std::uint16_t port_;
            int fd_ = -1;

        public:
            /**
             * @brief Create, bind and listen
             * @param host IPv4 address to bind (e.g., "127.0.0.1", "0.0.0.0")
             * @param port TCP port, 0 for an ephemeral port
             * @param backlog listen() backlog
             * @throws DeviceException (DCONFIG_ERROR) if the address is invalid or
             *         the socket cannot be created
             * @throws DeviceException (DBIND_ERROR) if bind or listen fails
             */
            TcpListener(const std::string& host, std::uint16_t port, int backlog = 16);

            ~TcpListener();

            TcpListener(const TcpListener&) = delete;
            TcpListener& operator=(const TcpListener&) = delete;

            /**
             * @brief Accept one pending connection
             * @param write_timeout_ms Send timeout for the accepted stream
             * @return std::unique_ptr<RealTcpStream> Accepted stream, or nullptr if
             *         no connection is pending
             * @throws DeviceException (DREAD_ERROR) on accept failure other than
             *         EAGAIN / ECONNABORTED / EINTR
             */
            std::unique_ptr<RealTcpStream> accept(int write_timeout_ms);

            /**
             * @brief Get the port actually bound (resolves port 0)
             */
            std::uint16_t get_bound_port() const;

            const std::string& get_host() const { return host_; }
            int get_fd() const { return fd_; }
            bool is_open() const { return fd_ >= 0; }

            void close();
    };

} // namespace canlink
