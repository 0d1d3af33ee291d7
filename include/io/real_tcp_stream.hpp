/**
 * @file real_tcp_stream.hpp
 * @brief Accepted TCP socket implementation of ITcpStream
 * @version 1.0
 * @date 2026-10-19
 */

#pragma once

#include <atomic>
#include <string>

#include "tcp_stream.hpp"

namespace canlink {

    /**
     * @brief Accepted TCP socket
     *
     * Takes ownership of the descriptor. Writes use MSG_NOSIGNAL so a closed
     * peer yields EPIPE instead of SIGPIPE; SO_SNDTIMEO bounds a blocked write.
     */
    class RealTcpStream : public ITcpStream {
        private:
            std::atomic<int> fd_;
            std::string peer_address_;

        public:
            /**
             * @brief Wrap an accepted socket
             * @param fd Connected socket descriptor (ownership transferred)
             * @param peer_address Remote address
             * @param write_timeout_ms Send timeout in milliseconds (0 = none)
             * @throws DeviceException if the send timeout cannot be set
             */
            RealTcpStream(int fd, const std::string& peer_address, int write_timeout_ms);

            ~RealTcpStream() override;

            RealTcpStream(const RealTcpStream&) = delete;
            RealTcpStream& operator=(const RealTcpStream&) = delete;

            // ITcpStream implementation
            ssize_t read(void* data, std::size_t len) override;
            ssize_t write(const void* data, std::size_t len) override;
            void shutdown() override;
            void close() override;
            bool is_open() const override { return fd_.load() >= 0; }
            std::string get_peer_address() const override { return peer_address_; }
            int get_fd() const override { return fd_.load(); }
    };

} // namespace canlink
