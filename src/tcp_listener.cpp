/**
 * @file tcp_listener.cpp
 * @brief Listening TCP socket implementation
 * @version 1.0
 * @date 2026-10-19
 */

#include <arpa/inet.h>
#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <netinet/in.h>
#include <sys/socket.h>
#include <unistd.h>

#include "../include/io/tcp_listener.hpp"
#include "../include/exception/canlink_exception.hpp"

namespace canlink {

    TcpListener::TcpListener(const std::string& host, std::uint16_t port, int backlog)
        : host_(host), port_(port) {
        struct sockaddr_in addr;
        std::memset(&addr, 0, sizeof(addr));
        addr.sin_family = AF_INET;
        addr.sin_port = htons(port_);
        if (::inet_pton(AF_INET, host_.c_str(), &addr.sin_addr) != 1) {
            throw DeviceException(Status::DCONFIG_ERROR,
                "TcpListener: Invalid IPv4 address '" + host_ + "'");
        }

        fd_ = ::socket(AF_INET, SOCK_STREAM | SOCK_NONBLOCK | SOCK_CLOEXEC, 0);
        if (fd_ < 0) {
            throw DeviceException(Status::DCONFIG_ERROR,
                "TcpListener: Failed to create socket: " + std::string(std::strerror(errno)));
        }

        int reuse = 1;
        if (::setsockopt(fd_, SOL_SOCKET, SO_REUSEADDR, &reuse, sizeof(reuse)) < 0) {
            int saved_errno = errno;
            ::close(fd_);
            fd_ = -1;
            throw DeviceException(Status::DCONFIG_ERROR,
                "TcpListener: Failed to set SO_REUSEADDR: " +
                std::string(std::strerror(saved_errno)));
        }

        if (::bind(fd_, reinterpret_cast<struct sockaddr*>(&addr), sizeof(addr)) < 0 ||
            ::listen(fd_, backlog) < 0) {
            int saved_errno = errno;
            ::close(fd_);
            fd_ = -1;
            throw DeviceException(Status::DBIND_ERROR,
                "TcpListener: Failed to listen on " + host_ + ":" + std::to_string(port_) +
                ": " + std::string(std::strerror(saved_errno)));
        }
    }

    TcpListener::~TcpListener() {
        close();
    }

    std::unique_ptr<RealTcpStream> TcpListener::accept(int write_timeout_ms) {
        if (fd_ < 0) {
            throw DeviceException(Status::DNOT_OPEN, "TcpListener::accept");
        }

        struct sockaddr_in peer;
        socklen_t peer_len = sizeof(peer);
        int client_fd = ::accept4(fd_, reinterpret_cast<struct sockaddr*>(&peer), &peer_len,
                SOCK_CLOEXEC);
        if (client_fd < 0) {
            if (errno == EAGAIN || errno == EWOULDBLOCK || errno == ECONNABORTED ||
                errno == EINTR) {
                return nullptr;
            }
            throw DeviceException(Status::DREAD_ERROR,
                "TcpListener::accept: " + std::string(std::strerror(errno)));
        }

        char address[INET_ADDRSTRLEN] = {0};
        ::inet_ntop(AF_INET, &peer.sin_addr, address, sizeof(address));
        return std::make_unique<RealTcpStream>(client_fd, std::string(address),
            write_timeout_ms);
    }

    std::uint16_t TcpListener::get_bound_port() const {
        if (fd_ < 0) {
            return 0;
        }
        struct sockaddr_in addr;
        socklen_t len = sizeof(addr);
        if (::getsockname(fd_, reinterpret_cast<struct sockaddr*>(&addr), &len) < 0) {
            return 0;
        }
        return ntohs(addr.sin_port);
    }

    void TcpListener::close() {
        if (fd_ >= 0) {
            ::close(fd_);
            fd_ = -1;
        }
    }

} // namespace canlink
