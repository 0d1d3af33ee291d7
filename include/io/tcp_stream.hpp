/**
 * @file tcp_stream.hpp
 * @brief Abstract interface for a connected client byte stream
 * @version 1.0
 * @date 2026-10-19
 *
 * Provides abstraction for TCP stream operations to enable dependency injection
 * and mock-based testing. Framing and decoding remain in ClientConnection.
 */

#pragma once

#include <cstddef>
#include <string>
#include <sys/types.h>

namespace canlink {

    /**
     * @brief Abstract interface for a connected client stream
     *
     * Implementations:
     * - RealTcpStream: Accepted TCP socket
     * - MockTcpStream: Queue-based simulation for testing
     */
    class ITcpStream {
        public:
            virtual ~ITcpStream() = default;

            /**
             * @brief Read available bytes, blocking until at least one arrives
             * @param data Destination buffer
             * @param len Buffer capacity
             * @return ssize_t Bytes read, 0 when the peer closed (or after shutdown()),
             *         -1 on error (sets errno)
             */
            virtual ssize_t read(void* data, std::size_t len) = 0;

            /**
             * @brief Write the whole buffer
             * @param data Source buffer
             * @param len Number of bytes to write
             * @return ssize_t len on success, fewer bytes on a partial write,
             *         -1 on error (sets errno)
             */
            virtual ssize_t write(const void* data, std::size_t len) = 0;

            /**
             * @brief Shut the stream down in both directions
             *
             * A read() blocked in another thread returns 0. The handle stays
             * allocated until close().
             */
            virtual void shutdown() = 0;

            /**
             * @brief Release the handle
             */
            virtual void close() = 0;

            virtual bool is_open() const = 0;

            /**
             * @brief Get the remote address
             * @return std::string Dotted IPv4 address (e.g., "127.0.0.1")
             */
            virtual std::string get_peer_address() const = 0;

            /**
             * @brief Get the file descriptor
             * @return int Socket FD, or -1 if not open
             */
            virtual int get_fd() const = 0;
    };

} // namespace canlink
