/**
 * @file test_gateway_server.cpp
 * @brief Gateway tests over loopback TCP with a mock bus
 * @version 1.0
 * @date 2026-10-19
 *
 * Every test binds ephemeral ports on 127.0.0.1, so no fixed port or CAN
 * interface is needed.
 */

#include <catch2/catch_test_macros.hpp>
#include <mutex>
#include <unistd.h>
#include <vector>

#include "../include/pattern/gateway_server.hpp"
#include "../include/codec/structured_codec.hpp"
#include "../include/exception/canlink_exception.hpp"
#include "test_utils.hpp"

using namespace canlink;
using namespace canlink::test;

namespace {

    constexpr std::size_t STRUCTURED_ENDPOINT = 0;
    constexpr std::size_t COMPACT_ENDPOINT = 1;

    /**
     * @brief Thread-safe event recorder
     */
    class EventLog {
        public:
            EventCallback callback() {
                return [this](const GatewayEvent& event) {
                           std::lock_guard<std::mutex> lock(mutex_);
                           events_.push_back(event);
                };
            }

            std::size_t count(EventKind kind) const {
                std::lock_guard<std::mutex> lock(mutex_);
                std::size_t n = 0;
                for (const auto& e : events_) {
                    if (e.kind == kind) ++n;
                }
                return n;
            }

            std::vector<GatewayEvent> of(EventKind kind) const {
                std::lock_guard<std::mutex> lock(mutex_);
                std::vector<GatewayEvent> out;
                for (const auto& e : events_) {
                    if (e.kind == kind) out.push_back(e);
                }
                return out;
            }

        private:
            mutable std::mutex mutex_;
            std::vector<GatewayEvent> events_;
    };

    /**
     * @brief Running gateway on a mock bus plus the client sockets opened against it
     */
    struct GatewayFixture {
        MockBusTransport* mock = nullptr;
        EventLog log;
        std::unique_ptr<GatewayServer> gateway;
        std::vector<int> fds;

        explicit GatewayFixture(GatewayConfig config = make_loopback_config()) {
            gateway = create_gateway_with_mock(config, &mock);
            gateway->set_event_callback(log.callback());
            gateway->start();
        }

        ~GatewayFixture() {
            gateway->stop();
            for (int fd : fds) {
                if (fd >= 0) ::close(fd);
            }
        }

        /**
         * @brief Connect to endpoint i and wait until the gateway registered the client
         */
        int connect(std::size_t endpoint) {
            std::size_t before = gateway->get_client_count();
            int fd = connect_loopback(gateway->get_bound_port(endpoint));
            REQUIRE(fd >= 0);
            fds.push_back(fd);
            REQUIRE(wait_for([&]() { return gateway->get_client_count() == before + 1; }));
            return fd;
        }
    };

    std::vector<std::uint8_t> structured_record(const std::string& text) {
        std::vector<std::uint8_t> out;
        auto prefix = int_to_bytes_be<std::uint32_t>(static_cast<std::uint32_t>(text.size()));
        out.insert(out.end(), prefix.begin(), prefix.end());
        out.insert(out.end(), text.begin(), text.end());
        return out;
    }

} // namespace

TEST_CASE("GatewayServer - Construction", "[gateway]") {
    SECTION("Null adapter throws") {
        REQUIRE_THROWS_AS(GatewayServer(make_loopback_config(), nullptr), std::invalid_argument);
    }

    SECTION("Invalid config throws") {
        auto config = make_loopback_config();
        config.endpoints.clear();
        MockBusTransport* mock = nullptr;
        REQUIRE_THROWS_AS(create_gateway_with_mock(config, &mock), std::invalid_argument);
    }

    SECTION("Ephemeral ports are resolved") {
        MockBusTransport* mock = nullptr;
        auto gateway = create_gateway_with_mock(make_loopback_config(), &mock);
        REQUIRE(gateway->get_endpoint_count() == 2);
        REQUIRE(gateway->get_bound_port(0) != 0);
        REQUIRE(gateway->get_bound_port(1) != 0);
        REQUIRE(gateway->get_bound_port(0) != gateway->get_bound_port(1));
        REQUIRE_THROWS_AS(gateway->get_bound_port(2), std::out_of_range);
    }

    SECTION("Port already in use throws") {
        MockBusTransport* mock_a = nullptr;
        auto first = create_gateway_with_mock(make_loopback_config(), &mock_a);

        auto config = make_loopback_config();
        config.endpoints = {{"127.0.0.1", first->get_bound_port(0), Protocol::COMPACT}};
        MockBusTransport* mock_b = nullptr;
        REQUIRE_THROWS_AS(create_gateway_with_mock(config, &mock_b), DeviceException);
    }

    SECTION("Invalid listen address throws") {
        auto config = make_loopback_config();
        config.endpoints = {{"not-an-address", 0, Protocol::COMPACT}};
        MockBusTransport* mock = nullptr;
        REQUIRE_THROWS_AS(create_gateway_with_mock(config, &mock), DeviceException);
    }
}

TEST_CASE("GatewayServer - Lifecycle", "[gateway]") {
    GatewayFixture f;
    REQUIRE(f.gateway->is_running());
    REQUIRE(f.gateway->get_bus_adapter().is_running());
    REQUIRE_THROWS_AS(f.gateway->start(), std::logic_error);

    int fd = f.connect(COMPACT_ENDPOINT);
    REQUIRE(f.log.count(EventKind::CLIENT_CONNECTED) == 1);

    f.gateway->stop();
    REQUIRE_FALSE(f.gateway->is_running());
    REQUIRE(f.gateway->get_client_count() == 0);
    REQUIRE(peer_closed(fd));

    auto disconnected = f.log.of(EventKind::CLIENT_DISCONNECTED);
    REQUIRE(disconnected.size() == 1);
    REQUIRE(disconnected[0].detail.find("gateway stopping") != std::string::npos);

    // Second stop is a no-op
    f.gateway->stop();
}

TEST_CASE("GatewayServer - Client to bus", "[gateway][tx]") {
    GatewayFixture f;

    SECTION("Compact client frame reaches the bus") {
        int fd = f.connect(COMPACT_ENDPOINT);
        REQUIRE(send_all(fd, {0x00, 0x00, 0x01, 0x23, 0x02, 0x0A, 0x14}));

        REQUIRE(wait_for([&]() { return f.mock->get_tx_count() == 1; }));
        REQUIRE(f.mock->get_tx_history()[0] == Frame(0x123, {10, 20}));

        auto stats = f.gateway->get_statistics();
        REQUIRE(stats.client_rx_frames == 1);
        REQUIRE(stats.bus_tx_frames == 1);
    }

    SECTION("Structured client frame reaches the bus") {
        int fd = f.connect(STRUCTURED_ENDPOINT);
        REQUIRE(send_all(fd, structured_record(R"({"type":"can","id":291,"data":[10,20]})")));

        REQUIRE(wait_for([&]() { return f.mock->get_tx_count() == 1; }));
        REQUIRE(f.mock->get_tx_history()[0] == Frame(0x123, {10, 20}));
    }

    SECTION("Frames from one client keep their order") {
        int fd = f.connect(COMPACT_ENDPOINT);
        std::vector<std::uint8_t> bytes;
        for (std::uint8_t i = 0; i < 50; ++i) {
            std::vector<std::uint8_t> one = {0x00, 0x00, 0x00, i, 0x01, i};
            bytes.insert(bytes.end(), one.begin(), one.end());
        }
        REQUIRE(send_all(fd, bytes));

        REQUIRE(wait_for([&]() { return f.mock->get_tx_count() == 50; }));
        auto sent = f.mock->get_tx_history();
        for (std::uint32_t i = 0; i < 50; ++i) {
            REQUIRE(sent[i].id == i);
        }
    }

    SECTION("Oversized structured payload is truncated and reported") {
        int fd = f.connect(STRUCTURED_ENDPOINT);
        std::string data = "[";
        for (int i = 0; i < 100; ++i) {
            data += (i ? "," : "") + std::to_string(i % 256);
        }
        data += "]";
        REQUIRE(send_all(fd, structured_record(R"({"type":"can","id":5,"data":)" + data + "}")));

        REQUIRE(wait_for([&]() { return f.mock->get_tx_count() == 1; }));
        auto sent = f.mock->get_tx_history()[0];
        REQUIRE(sent.payload.size() == 64);
        REQUIRE(sent.length_code == 15);
        REQUIRE(f.log.count(EventKind::PAYLOAD_TRUNCATED) == 1);
        REQUIRE(f.gateway->get_statistics().truncated_frames == 1);
    }

    SECTION("Bus refusal is reported and the client stays connected") {
        f.mock->set_send_status(Status::BUS_SEND_ERROR);
        int fd = f.connect(COMPACT_ENDPOINT);
        REQUIRE(send_all(fd, {0x00, 0x00, 0x00, 0x01, 0x00}));

        REQUIRE(wait_for([&]() { return f.log.count(EventKind::BUS_SEND_FAILURE) == 1; }));
        REQUIRE(f.log.of(EventKind::BUS_SEND_FAILURE)[0].status == Status::BUS_SEND_ERROR);
        REQUIRE(f.gateway->get_statistics().bus_tx_errors == 1);
        REQUIRE(f.gateway->get_client_count() == 1);

        // Next frame goes through once the bus accepts again
        f.mock->set_send_status(Status::SUCCESS);
        REQUIRE(send_all(fd, {0x00, 0x00, 0x00, 0x02, 0x00}));
        REQUIRE(wait_for([&]() { return f.mock->get_tx_count() == 1; }));
        REQUIRE(f.mock->get_tx_history()[0].id == 2);
    }

    SECTION("Client-to-bus callback sees accepted frames") {
        std::mutex mutex;
        std::vector<std::uint64_t> seen;
        f.gateway->stop();
        f.gateway->set_client_to_bus_callback([&](std::uint64_t id, const Frame&) {
                std::lock_guard<std::mutex> lock(mutex);
                seen.push_back(id);
            });
        f.gateway->start();

        int fd = f.connect(COMPACT_ENDPOINT);
        REQUIRE(send_all(fd, {0x00, 0x00, 0x00, 0x07, 0x00}));
        REQUIRE(wait_for([&]() {
                std::lock_guard<std::mutex> lock(mutex);
                return seen.size() == 1;
            }));
    }
}

TEST_CASE("GatewayServer - Bus to clients", "[gateway][rx]") {
    GatewayFixture f;

    SECTION("Every client gets the compact encoding") {
        int a = f.connect(COMPACT_ENDPOINT);
        int b = f.connect(COMPACT_ENDPOINT);
        int c = f.connect(STRUCTURED_ENDPOINT);

        REQUIRE(f.mock->deliver(Frame(0x999, {1, 2, 3})));

        std::vector<std::uint8_t> expected = {0x00, 0x00, 0x09, 0x99, 0x03, 0x01, 0x02, 0x03};
        REQUIRE(recv_exact(a, expected.size()) == expected);
        REQUIRE(recv_exact(b, expected.size()) == expected);
        REQUIRE(recv_exact(c, expected.size()) == expected);

        REQUIRE(wait_for([&]() { return f.gateway->get_statistics().client_tx_frames == 3; }));
        REQUIRE(f.gateway->get_statistics().bus_rx_frames == 1);
    }

    SECTION("Bus frames keep their order") {
        int fd = f.connect(COMPACT_ENDPOINT);
        for (std::uint32_t id = 1; id <= 20; ++id) {
            REQUIRE(f.mock->deliver(Frame(id, {0x00})));
        }
        auto bytes = recv_exact(fd, 20 * 6);
        REQUIRE(bytes.size() == 20 * 6);
        for (std::size_t i = 0; i < 20; ++i) {
            REQUIRE(bytes[i * 6 + 3] == i + 1);
        }
    }

    SECTION("Own frames observed on the bus are fanned out too") {
        int fd = f.connect(COMPACT_ENDPOINT);
        REQUIRE(f.mock->deliver(Frame(0x55, {0xAA}), Direction::TX));
        REQUIRE(recv_exact(fd, 6) == std::vector<std::uint8_t>{0x00, 0x00, 0x00, 0x55, 0x01, 0xAA});
    }

    SECTION("No clients: frame is consumed") {
        REQUIRE(f.mock->deliver(Frame(0x1, {0x00})));
        REQUIRE(wait_for([&]() { return f.gateway->get_statistics().bus_rx_frames == 1; }));
        REQUIRE(f.gateway->get_statistics().client_tx_frames == 0);
    }
}

TEST_CASE("GatewayServer - Client isolation", "[gateway][isolation]") {
    GatewayFixture f;
    int bad = f.connect(COMPACT_ENDPOINT);
    int good = f.connect(COMPACT_ENDPOINT);

    SECTION("Invalid input closes only the offending client") {
        REQUIRE(send_all(bad, {0x00, 0x00, 0x00, 0x01, 200}));

        REQUIRE(peer_closed(bad));
        REQUIRE(wait_for([&]() { return f.gateway->get_client_count() == 1; }));
        REQUIRE(f.log.count(EventKind::DECODE_INVALID) == 1);
        REQUIRE(f.gateway->get_statistics().decode_errors == 1);

        REQUIRE(f.mock->deliver(Frame(0x999, {1, 2, 3})));
        REQUIRE(recv_exact(good, 8) ==
            std::vector<std::uint8_t>{0x00, 0x00, 0x09, 0x99, 0x03, 0x01, 0x02, 0x03});

        // The healthy client can still send
        REQUIRE(send_all(good, {0x00, 0x00, 0x00, 0x02, 0x00}));
        REQUIRE(wait_for([&]() { return f.mock->get_tx_count() == 1; }));
    }

    SECTION("Peer disconnect removes the client") {
        ::close(bad);
        f.fds[0] = -1;

        REQUIRE(wait_for([&]() { return f.gateway->get_client_count() == 1; }));
        REQUIRE(wait_for([&]() {
                return f.log.count(EventKind::CLIENT_DISCONNECTED) == 1;
            }));

        REQUIRE(f.mock->deliver(Frame(0x10, {0x01})));
        REQUIRE(recv_exact(good, 6).size() == 6);
    }
}

TEST_CASE("GatewayServer - Write failure closes only that client", "[gateway][isolation][rx]") {
    GatewayFixture f;
    int a = f.connect(COMPACT_ENDPOINT);
    int b = f.connect(COMPACT_ENDPOINT);

    // The gateway owns the stream from here on; configure it before handing it over
    auto failing = std::make_unique<MockTcpStream>("10.0.0.9");
    failing->set_simulate_write_error(true);
    f.gateway->add_client(std::move(failing), COMPACT_ENDPOINT);
    REQUIRE(f.gateway->get_client_count() == 3);

    std::vector<std::uint8_t> first = {0x00, 0x00, 0x09, 0x99, 0x03, 0x01, 0x02, 0x03};
    REQUIRE(f.mock->deliver(Frame(0x999, {1, 2, 3})));

    REQUIRE(recv_exact(a, first.size()) == first);
    REQUIRE(recv_exact(b, first.size()) == first);
    REQUIRE(wait_for([&]() { return f.gateway->get_client_count() == 2; }));
    REQUIRE(wait_for([&]() {
            return f.log.count(EventKind::CLIENT_DISCONNECTED) == 1;
        }));
    REQUIRE(f.log.count(EventKind::CLIENT_WRITE_FAILURE) == 1);
    REQUIRE(f.log.of(EventKind::CLIENT_DISCONNECTED)[0].detail.find("10.0.0.9") !=
        std::string::npos);

    // Later frames still reach the remaining clients
    std::vector<std::uint8_t> second = {0x00, 0x00, 0x00, 0x42, 0x01, 0x07};
    REQUIRE(f.mock->deliver(Frame(0x42, {0x07})));
    REQUIRE(recv_exact(a, second.size()) == second);
    REQUIRE(recv_exact(b, second.size()) == second);

    REQUIRE(wait_for([&]() { return f.gateway->get_statistics().client_tx_frames == 4; }));
    REQUIRE(f.log.count(EventKind::CLIENT_WRITE_FAILURE) == 1);
    REQUIRE(f.gateway->get_statistics().client_write_errors == 1);
}

TEST_CASE("GatewayServer - add_client preconditions", "[gateway]") {
    MockBusTransport* mock = nullptr;
    auto gateway = create_gateway_with_mock(make_loopback_config(), &mock);

    REQUIRE_THROWS_AS(gateway->add_client(std::make_unique<MockTcpStream>(), COMPACT_ENDPOINT),
        std::logic_error);

    gateway->start();
    REQUIRE_THROWS_AS(gateway->add_client(nullptr, COMPACT_ENDPOINT), std::invalid_argument);
    REQUIRE_THROWS_AS(gateway->add_client(std::make_unique<MockTcpStream>(), 5),
        std::out_of_range);
    REQUIRE(gateway->get_client_count() == 0);
    gateway->stop();
}

TEST_CASE("GatewayServer - Peer rules override the endpoint protocol", "[gateway][routing]") {
    auto config = make_loopback_config();
    config.peer_rules = {{"127.0.0.", Protocol::COMPACT}};
    GatewayFixture f(config);

    // Compact bytes on the structured endpoint are accepted for this peer
    int fd = f.connect(STRUCTURED_ENDPOINT);
    REQUIRE(send_all(fd, {0x00, 0x00, 0x01, 0x23, 0x02, 0x0A, 0x14}));
    REQUIRE(wait_for([&]() { return f.mock->get_tx_count() == 1; }));
    REQUIRE(f.mock->get_tx_history()[0] == Frame(0x123, {10, 20}));

    auto connected = f.log.of(EventKind::CLIENT_CONNECTED);
    REQUIRE(connected.size() == 1);
    REQUIRE(connected[0].detail.find("(compact)") != std::string::npos);
}

TEST_CASE("GatewayServer - Test frame at startup", "[gateway][tx]") {
    auto config = make_loopback_config();
    config.send_test_frame = true;
    GatewayFixture f(config);

    REQUIRE(f.mock->get_tx_count() == 1);
    REQUIRE(f.mock->get_tx_history()[0].id == BusAdapter::TEST_FRAME_ID);
    REQUIRE(f.mock->get_tx_history()[0].payload.size() == 8);
}

TEST_CASE("GatewayServer - Statistics", "[gateway][stats]") {
    GatewayFixture f;
    f.connect(COMPACT_ENDPOINT);

    auto stats = f.gateway->get_statistics();
    REQUIRE(stats.clients_accepted == 1);
    REQUIRE(stats.clients_active == 1);
    REQUIRE(stats.to_string().find("Gateway Statistics") != std::string::npos);

    f.gateway->reset_statistics();
    stats = f.gateway->get_statistics();
    REQUIRE(stats.clients_accepted == 0);
    REQUIRE(stats.clients_active == 1);
}
