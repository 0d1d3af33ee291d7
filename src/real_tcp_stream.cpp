/**
 * @file real_tcp_stream.cpp
 * @brief Accepted TCP socket implementation
 * @version 1.0
 * @date 2026-10-19
 */

#include <cerrno>
#include <cstdint>
#include <cstring>
#include <sys/socket.h>
#include <sys/time.h>
#include <unistd.h>

#include "../include/io/real_tcp_stream.hpp"
#include "../include/exception/canlink_exception.hpp"

namespace canlink {

    // ===================================================================
    // Constructor / Destructor
    // ===================================================================

    RealTcpStream::RealTcpStream(int fd, const std::string& peer_address, int write_timeout_ms)
        : fd_(fd), peer_address_(peer_address) {
        if (write_timeout_ms > 0) {
            struct timeval tv;
            tv.tv_sec = write_timeout_ms / 1000;
            tv.tv_usec = (write_timeout_ms % 1000) * 1000;
            if (::setsockopt(fd, SOL_SOCKET, SO_SNDTIMEO, &tv, sizeof(tv)) < 0) {
                int saved_errno = errno;
                ::close(fd);
                fd_.store(-1);
                throw DeviceException(
                    Status::DCONFIG_ERROR,
                    "RealTcpStream: Failed to set send timeout: " +
                    std::string(std::strerror(saved_errno))
                );
            }
        }
    }

    RealTcpStream::~RealTcpStream() {
        close();
    }

    // ===================================================================
    // ITcpStream Implementation
    // ===================================================================

    ssize_t RealTcpStream::read(void* data, std::size_t len) {
        int fd = fd_.load();
        if (fd < 0) {
            errno = ENOTCONN;
            return -1;
        }

        ssize_t bytes;
        do {
            bytes = ::recv(fd, data, len, 0);
        } while (bytes < 0 && errno == EINTR);
        return bytes;  // 0 on orderly close, -1 on error
    }

    ssize_t RealTcpStream::write(const void* data, std::size_t len) {
        int fd = fd_.load();
        if (fd < 0) {
            errno = ENOTCONN;
            return -1;
        }

        const auto* bytes = static_cast<const std::uint8_t*>(data);
        std::size_t total = 0;
        while (total < len) {
            ssize_t n = ::send(fd, bytes + total, len - total, MSG_NOSIGNAL);
            if (n < 0) {
                if (errno == EINTR) {
                    continue;
                }
                // EAGAIN here means SO_SNDTIMEO expired
                return total > 0 ? static_cast<ssize_t>(total) : -1;
            }
            total += static_cast<std::size_t>(n);
        }
        return static_cast<ssize_t>(total);
    }

    void RealTcpStream::shutdown() {
        int fd = fd_.load();
        if (fd >= 0) {
            ::shutdown(fd, SHUT_RDWR);
        }
    }

    void RealTcpStream::close() {
        int fd = fd_.exchange(-1);
        if (fd >= 0) {
            ::close(fd);
        }
    }

} // namespace canlink
