/**
 * @file socketcan_transport.cpp
 * @brief SocketCAN bus transport implementation
 * @version 1.0
 * @date 2026-10-19
 */

#include <cerrno>
#include <chrono>
#include <cstdio>
#include <cstring>
#include <iostream>
#include <stdexcept>
#include <sys/uio.h>

#include "../include/io/socketcan_transport.hpp"
#include "../include/interface/socketcan_helpers.hpp"

namespace canlink {

    // ===================================================================
    // Constructor / Destructor
    // ===================================================================

    SocketCANTransport::SocketCANTransport(const std::string& interface, int timeout_ms,
        bool receive_own_frames)
        : interface_name_(interface), timeout_ms_(timeout_ms),
        receive_own_frames_(receive_own_frames) {
        open_socket();
        set_timeout();
    }

    SocketCANTransport::~SocketCANTransport() {
        close();
    }

    // ===================================================================
    // IBusTransport Implementation
    // ===================================================================

    Status SocketCANTransport::send_frame(const Frame& frame) {
        if (!is_open_.load() || fd_ < 0) {
            return Status::DNOT_OPEN;
        }

        struct canfd_frame cf;
        try {
            cf = SocketCANHelper::to_socketcan(frame);
        } catch (const ProtocolException& e) {
            std::cerr << "[BUS] Conversion error: " << e.what() << std::endl;
            return e.status();
        }

        std::size_t mtu = SocketCANHelper::mtu_for(frame);
        ssize_t bytes;
        {
            std::lock_guard<std::mutex> lock(write_mutex_);
            bytes = ::write(fd_, &cf, mtu);
        }
        if (bytes != static_cast<ssize_t>(mtu)) {
            if (bytes < 0) {
                std::cerr << "[BUS] Socket write error: " << std::strerror(errno) << std::endl;
            } else {
                std::cerr << "[BUS] Partial write: " << bytes << " bytes" << std::endl;
            }
            return Status::BUS_SEND_ERROR;
        }
        return Status::SUCCESS;
    }

    void SocketCANTransport::set_receive_handler(ReceiveHandler handler) {
        // Blocks while a delivery is in progress
        std::lock_guard<std::mutex> lock(handler_mutex_);
        handler_ = std::move(handler);
    }

    void SocketCANTransport::start() {
        if (!is_open_.load()) {
            throw_error(Status::DNOT_OPEN, "SocketCANTransport::start");
        }
        bool expected = false;
        if (!running_.compare_exchange_strong(expected, true)) {
            throw std::logic_error("SocketCANTransport is already running");
        }
        rx_thread_ = std::thread(&SocketCANTransport::receive_loop, this);
    }

    void SocketCANTransport::stop() {
        running_.store(false);
        if (rx_thread_.joinable()) {
            rx_thread_.join();
        }
    }

    void SocketCANTransport::close() {
        stop();
        if (is_open_.exchange(false) && fd_ >= 0) {
            ::close(fd_);
            fd_ = -1;
        }
    }

    // ===================================================================
    // Private Methods
    // ===================================================================

    void SocketCANTransport::open_socket() {
        fd_ = ::socket(PF_CAN, SOCK_RAW, CAN_RAW);
        if (fd_ < 0) {
            throw DeviceException(
                Status::DCONFIG_ERROR,
                "SocketCANTransport::open_socket: Failed to create socket: " +
                std::string(std::strerror(errno))
            );
        }

        auto fail = [this](Status status, const std::string& what) {
                int saved_errno = errno;
                ::close(fd_);
                fd_ = -1;
                throw DeviceException(status, "SocketCANTransport::open_socket: " + what + ": " +
                    std::string(std::strerror(saved_errno)));
            };

        // Enable CAN FD frames
        int enable = 1;
        if (::setsockopt(fd_, SOL_CAN_RAW, CAN_RAW_FD_FRAMES, &enable, sizeof(enable)) < 0) {
            fail(Status::DCONFIG_ERROR, "Failed to enable CAN FD frames");
        }

        int own = receive_own_frames_ ? 1 : 0;
        if (::setsockopt(fd_, SOL_CAN_RAW, CAN_RAW_RECV_OWN_MSGS, &own, sizeof(own)) < 0) {
            fail(Status::DCONFIG_ERROR, "Failed to set CAN_RAW_RECV_OWN_MSGS");
        }

        // Get interface index
        struct ifreq ifr;
        std::memset(&ifr, 0, sizeof(ifr));
        std::strncpy(ifr.ifr_name, interface_name_.c_str(), IFNAMSIZ - 1);
        ifr.ifr_name[IFNAMSIZ - 1] = '\0';

        if (::ioctl(fd_, SIOCGIFINDEX, &ifr) < 0) {
            fail(Status::DNOT_FOUND, "Interface '" + interface_name_ + "' not found");
        }

        struct sockaddr_can addr;
        std::memset(&addr, 0, sizeof(addr));
        addr.can_family = AF_CAN;
        addr.can_ifindex = ifr.ifr_ifindex;

        if (::bind(fd_, reinterpret_cast<struct sockaddr*>(&addr), sizeof(addr)) < 0) {
            fail(Status::DCONFIG_ERROR, "Failed to bind to '" + interface_name_ + "'");
        }

        is_open_.store(true);
        std::fprintf(stdout, "[BUS] CAN socket opened and bound to %s (CAN FD enabled).\n",
            interface_name_.c_str());
    }

    void SocketCANTransport::set_timeout() {
        struct timeval tv;
        tv.tv_sec = timeout_ms_ / 1000;
        tv.tv_usec = (timeout_ms_ % 1000) * 1000;

        if (::setsockopt(fd_, SOL_SOCKET, SO_RCVTIMEO, &tv, sizeof(tv)) < 0) {
            int saved_errno = errno;
            ::close(fd_);
            fd_ = -1;
            is_open_.store(false);
            throw DeviceException(
                Status::DCONFIG_ERROR,
                "SocketCANTransport::set_timeout: Failed to set timeout: " +
                std::string(std::strerror(saved_errno))
            );
        }
    }

    void SocketCANTransport::receive_loop() {
        struct canfd_frame cf;
        struct iovec iov;
        struct msghdr msg;
        struct sockaddr_can addr;

        while (running_.load()) {
            iov.iov_base = &cf;
            iov.iov_len = sizeof(cf);
            std::memset(&msg, 0, sizeof(msg));
            msg.msg_name = &addr;
            msg.msg_namelen = sizeof(addr);
            msg.msg_iov = &iov;
            msg.msg_iovlen = 1;

            ssize_t bytes = ::recvmsg(fd_, &msg, 0);
            if (bytes < 0) {
                if (errno == EAGAIN || errno == EWOULDBLOCK || errno == EINTR) {
                    // Timeout - continue to check running_ flag
                    continue;
                }
                std::cerr << "[BUS] Socket read error: " << std::strerror(errno) << std::endl;
                std::this_thread::sleep_for(std::chrono::milliseconds(timeout_ms_));
                continue;
            }

            auto timestamp = static_cast<std::uint64_t>(
                std::chrono::duration_cast<std::chrono::nanoseconds>(
                    std::chrono::system_clock::now().time_since_epoch()).count());
            Direction direction = (msg.msg_flags & MSG_CONFIRM) ? Direction::TX : Direction::RX;

            try {
                Frame frame = SocketCANHelper::from_socketcan(cf, static_cast<std::size_t>(bytes));
                std::lock_guard<std::mutex> lock(handler_mutex_);
                if (handler_) {
                    handler_(frame, direction, timestamp);
                }
            } catch (const ProtocolException& e) {
                if (e.status() != Status::WBAD_TYPE) {
                    std::cerr << "[BUS] Conversion error: " << e.what() << std::endl;
                }
            }
            catch (const std::exception& e) {
                std::cerr << "[BUS] Receive handler error: " << e.what() << std::endl;
            }
        }
    }

} // namespace canlink
