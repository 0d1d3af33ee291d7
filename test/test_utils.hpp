/**
 * @file test_utils.hpp
 * @brief Test utility functions for creating mocked components
 * @version 1.0
 * @date 2026-10-19
 *
 * Provides helpers to build gateways on a mock bus, open loopback client
 * sockets and wait for asynchronous conditions.
 */

#pragma once

#include "../include/pattern/gateway_server.hpp"
#include "../include/pattern/gateway_config.hpp"
#include "../include/pattern/bus_adapter.hpp"
#include "mocks/mock_bus_transport.hpp"
#include "mocks/mock_tcp_stream.hpp"
#include <arpa/inet.h>
#include <cerrno>
#include <chrono>
#include <cstring>
#include <functional>
#include <memory>
#include <net/if.h>
#include <netinet/in.h>
#include <sys/socket.h>
#include <sys/time.h>
#include <thread>
#include <unistd.h>
#include <vector>

namespace canlink {
    namespace test {

        /**
         * @brief Check if the vcan0 interface exists
         */
        inline bool vcan0_exists() {
            return ::if_nametoindex("vcan0") != 0;
        }

        /**
         * @brief Poll a condition until it holds or the timeout expires
         * @return bool Final value of the condition
         */
        inline bool wait_for(const std::function<bool()>& condition,
            std::chrono::milliseconds timeout = std::chrono::milliseconds(2000)) {
            auto deadline = std::chrono::steady_clock::now() + timeout;
            while (std::chrono::steady_clock::now() < deadline) {
                if (condition()) {
                    return true;
                }
                std::this_thread::sleep_for(std::chrono::milliseconds(5));
            }
            return condition();
        }

        /**
         * @brief Gateway configuration on ephemeral loopback ports
         *
         * Endpoint 0 is structured, endpoint 1 is compact. No peer rules.
         *
         * Example:
         * @code
         * auto config = make_loopback_config();
         * auto gateway = create_gateway_with_mock(config, &mock);
         * gateway->start();
         * int fd = connect_loopback(gateway->get_bound_port(1));
         * @endcode
         */
        inline GatewayConfig make_loopback_config() {
            GatewayConfig config = GatewayConfig::create_default();
            config.endpoints = {
                {"127.0.0.1", 0, Protocol::STRUCTURED},
                {"127.0.0.1", 0, Protocol::COMPACT}
            };
            config.peer_rules.clear();
            config.accept_poll_timeout_ms = 20;
            config.client_write_timeout_ms = 500;
            return config;
        }

        /**
         * @brief Create a GatewayServer on a MockBusTransport
         * @param config Gateway configuration
         * @param mock_out Receives a non-owning pointer to the mock
         */
        inline std::unique_ptr<GatewayServer> create_gateway_with_mock(
            const GatewayConfig& config, MockBusTransport** mock_out) {
            auto mock = std::make_unique<MockBusTransport>(config.bus_interface);
            *mock_out = mock.get();
            auto adapter = std::make_unique<BusAdapter>(std::move(mock), config.rx_queue_capacity);
            return std::make_unique<GatewayServer>(config, std::move(adapter));
        }

        /**
         * @brief Connect a blocking client socket to 127.0.0.1:port
         * @return int Socket FD (1 s receive timeout), -1 on failure
         */
        inline int connect_loopback(std::uint16_t port) {
            int fd = ::socket(AF_INET, SOCK_STREAM, 0);
            if (fd < 0) {
                return -1;
            }
            struct timeval tv;
            tv.tv_sec = 1;
            tv.tv_usec = 0;
            ::setsockopt(fd, SOL_SOCKET, SO_RCVTIMEO, &tv, sizeof(tv));

            struct sockaddr_in addr;
            std::memset(&addr, 0, sizeof(addr));
            addr.sin_family = AF_INET;
            addr.sin_port = htons(port);
            addr.sin_addr.s_addr = htonl(INADDR_LOOPBACK);
            if (::connect(fd, reinterpret_cast<struct sockaddr*>(&addr), sizeof(addr)) < 0) {
                ::close(fd);
                return -1;
            }
            return fd;
        }

        inline bool send_all(int fd, const std::vector<std::uint8_t>& bytes) {
            std::size_t sent = 0;
            while (sent < bytes.size()) {
                ssize_t n = ::send(fd, bytes.data() + sent, bytes.size() - sent, MSG_NOSIGNAL);
                if (n <= 0) {
                    return false;
                }
                sent += static_cast<std::size_t>(n);
            }
            return true;
        }

        /**
         * @brief Receive exactly n bytes (or fewer on timeout/close)
         */
        inline std::vector<std::uint8_t> recv_exact(int fd, std::size_t n) {
            std::vector<std::uint8_t> out(n);
            std::size_t got = 0;
            while (got < n) {
                ssize_t r = ::recv(fd, out.data() + got, n - got, 0);
                if (r <= 0) {
                    break;
                }
                got += static_cast<std::size_t>(r);
            }
            out.resize(got);
            return out;
        }

        /**
         * @brief Check whether the peer closed the socket (recv returns 0)
         */
        inline bool peer_closed(int fd) {
            std::uint8_t byte;
            ssize_t r = ::recv(fd, &byte, 1, 0);
            return r == 0 || (r < 0 && errno == ECONNRESET);
        }

    } // namespace test
} // namespace canlink
