/**
 * @file socketcan_transport.hpp
 * @brief Bus transport over a Linux SocketCAN raw socket
 * @version 1.0
 * @date 2026-10-19
 */

#pragma once

#include <atomic>
#include <mutex>
#include <string>
#include <thread>

#include <sys/socket.h>
#include <sys/ioctl.h>
#include <net/if.h>
#include <linux/can.h>
#include <linux/can/raw.h>
#include <unistd.h>

#include "bus_transport.hpp"
#include "../exception/canlink_exception.hpp"

namespace canlink {

    /**
     * @brief SocketCAN implementation of IBusTransport
     *
     * Opens a CAN_RAW socket bound to one interface with CAN FD frames enabled.
     * With receive_own_frames set, frames written by this socket are looped
     * back and reported with Direction::TX (MSG_CONFIRM), so both directions
     * reach the fan-out.
     *
     * The receive thread blocks in recvmsg() with SO_RCVTIMEO set to
     * read_timeout_ms, which bounds how long stop() waits.
     */
    class SocketCANTransport : public IBusTransport {
        private:
            std::string interface_name_;
            int timeout_ms_;
            bool receive_own_frames_;
            int fd_ = -1;
            std::atomic<bool> is_open_{false};

            std::atomic<bool> running_{false};
            std::thread rx_thread_;

            std::mutex handler_mutex_;  // Held while the handler runs
            ReceiveHandler handler_;

            std::mutex write_mutex_;

        public:
            /**
             * @brief Construct and open the CAN socket
             * @param interface Interface name (e.g., "can0", "vcan0")
             * @param timeout_ms Receive timeout in milliseconds
             * @param receive_own_frames Loop back own transmissions as TX frames
             * @throws DeviceException if socket creation, option setup or binding fails
             */
            SocketCANTransport(const std::string& interface, int timeout_ms,
                bool receive_own_frames = true);

            /**
             * @brief Destructor - stops the receive thread and closes the socket
             */
            ~SocketCANTransport() override;

            SocketCANTransport(const SocketCANTransport&) = delete;
            SocketCANTransport& operator=(const SocketCANTransport&) = delete;

            // IBusTransport implementation
            Status send_frame(const Frame& frame) override;
            void set_receive_handler(ReceiveHandler handler) override;
            void start() override;
            void stop() override;
            bool is_open() const override { return is_open_.load(); }
            std::string get_channel_name() const override { return interface_name_; }

            int get_fd() const { return fd_; }

            /**
             * @brief Close the socket (stops the receive thread first)
             */
            void close();

        private:
            /**
             * @brief Open, configure and bind the CAN socket
             * @throws DeviceException on failure
             */
            void open_socket();

            /**
             * @brief Set receive timeout on socket
             * @throws DeviceException on failure
             */
            void set_timeout();

            /**
             * @brief Receive loop (runs in rx_thread_)
             */
            void receive_loop();
    };

} // namespace canlink
