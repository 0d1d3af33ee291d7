/**
 * @file test_bus_adapter.cpp
 * @brief Unit tests for BusAdapter using MockBusTransport
 * @version 1.0
 * @date 2026-10-19
 */

#include <catch2/catch_test_macros.hpp>
#include <chrono>
#include <thread>
#include <vector>

#include "../include/pattern/bus_adapter.hpp"
#include "../include/exception/canlink_exception.hpp"
#include "mocks/mock_bus_transport.hpp"

using namespace canlink;
using namespace canlink::test;
using namespace std::chrono_literals;

namespace {
    struct AdapterHarness {
        MockBusTransport* mock = nullptr;
        std::unique_ptr<BusAdapter> adapter;

        explicit AdapterHarness(std::size_t capacity = 8) {
            auto transport = std::make_unique<MockBusTransport>("mock0");
            mock = transport.get();
            adapter = std::make_unique<BusAdapter>(std::move(transport), capacity);
        }
    };
}

TEST_CASE("BusAdapter - Construction", "[bus]") {
    REQUIRE_THROWS_AS(BusAdapter(nullptr, 8), std::invalid_argument);
    REQUIRE_THROWS_AS(BusAdapter(std::make_unique<MockBusTransport>(), 0),
        std::invalid_argument);

    AdapterHarness h;
    REQUIRE(h.adapter->get_channel_name() == "mock0");
    REQUIRE_FALSE(h.adapter->is_running());
}

TEST_CASE("BusAdapter - Lifecycle", "[bus]") {
    AdapterHarness h;

    h.adapter->start();
    REQUIRE(h.adapter->is_running());
    REQUIRE(h.mock->is_started());
    REQUIRE(h.mock->has_handler());

    h.adapter->stop();
    REQUIRE_FALSE(h.adapter->is_running());
    REQUIRE_FALSE(h.mock->is_started());
    REQUIRE_FALSE(h.mock->has_handler());

    SECTION("Restart after stop") {
        h.adapter->start();
        REQUIRE(h.mock->deliver(Frame(0x1, {0x01})));
        REQUIRE(h.adapter->wait_received(100ms).has_value());
    }

    SECTION("Transport start failure leaves the adapter stopped") {
        h.mock->set_fail_start(true);
        REQUIRE_THROWS(h.adapter->start());
        REQUIRE_FALSE(h.adapter->is_running());
        REQUIRE_FALSE(h.mock->has_handler());
    }

    SECTION("Closed transport cannot be started") {
        h.mock->set_open(false);
        try {
            h.adapter->start();
            FAIL("Expected BusException");
        } catch (const BusException& e) {
            REQUIRE(e.status() == Status::BUS_NOT_STARTED);
        }
        REQUIRE_FALSE(h.adapter->is_running());
        REQUIRE_FALSE(h.mock->is_started());
    }
}

TEST_CASE("BusAdapter - Forwarding to the bus", "[bus][tx]") {
    AdapterHarness h;
    h.adapter->start();

    SECTION("Frame is handed to the transport unchanged") {
        Frame frame(0x123, {0x0A, 0x14});
        auto result = h.adapter->forward(frame);
        REQUIRE(result);
        REQUIRE(h.mock->get_tx_history().size() == 1);
        REQUIRE(h.mock->get_tx_history()[0] == frame);
        REQUIRE(h.adapter->frames_forwarded() == 1);
    }

    SECTION("Transport failure is returned, not retried") {
        h.mock->set_send_status(Status::BUS_SEND_ERROR);
        auto result = h.adapter->forward(Frame(0x1, {0x01}));
        REQUIRE_FALSE(result);
        REQUIRE(result.error() == Status::BUS_SEND_ERROR);
        REQUIRE(h.mock->get_tx_count() == 0);
        REQUIRE(h.adapter->forward_errors() == 1);
    }

    SECTION("Closed transport reports not started") {
        h.mock->set_open(false);
        auto result = h.adapter->forward(Frame(0x1, {0x01}));
        REQUIRE_FALSE(result);
        REQUIRE(result.error() == Status::BUS_NOT_STARTED);
    }

    SECTION("Test frame") {
        REQUIRE(h.adapter->send_test_frame());
        auto sent = h.mock->get_tx_history();
        REQUIRE(sent.size() == 1);
        REQUIRE(sent[0] == Frame(BusAdapter::TEST_FRAME_ID,
                {0x01, 0x02, 0x03, 0x04, 0x05, 0x06, 0x07, 0x08}));
    }
}

TEST_CASE("BusAdapter - Receiving from the bus", "[bus][rx]") {
    AdapterHarness h(3);

    SECTION("Frames are not delivered before start") {
        REQUIRE_FALSE(h.mock->deliver(Frame(0x1, {0x00})));
        REQUIRE(h.adapter->queued() == 0);
    }

    SECTION("Frames are queued in order with direction and timestamp") {
        h.adapter->start();
        h.mock->deliver(Frame(0x10, {0x01}), Direction::RX, 1000);
        h.mock->deliver(Frame(0x11, {0x02}), Direction::TX, 2000);

        auto first = h.adapter->wait_received(100ms);
        auto second = h.adapter->wait_received(100ms);
        REQUIRE(first.has_value());
        REQUIRE(second.has_value());
        REQUIRE(first->frame.id == 0x10);
        REQUIRE(first->direction == Direction::RX);
        REQUIRE(first->timestamp_ns == 1000);
        REQUIRE(second->frame.id == 0x11);
        REQUIRE(second->direction == Direction::TX);
        REQUIRE(h.adapter->frames_received() == 2);
    }

    SECTION("Overflow drops the oldest frame and reports it") {
        std::vector<std::uint64_t> overflows;
        h.adapter->set_overflow_callback([&overflows](std::uint64_t total) {
                overflows.push_back(total);
            });
        h.adapter->start();

        for (std::uint32_t id = 1; id <= 5; ++id) {
            h.mock->deliver(Frame(id, {0x00}));
        }

        REQUIRE(overflows == std::vector<std::uint64_t>{1, 2});
        REQUIRE(h.adapter->frames_dropped() == 2);
        REQUIRE(h.adapter->wait_received(10ms)->frame.id == 3);
        REQUIRE(h.adapter->wait_received(10ms)->frame.id == 4);
        REQUIRE(h.adapter->wait_received(10ms)->frame.id == 5);
    }

    SECTION("stop() wakes a waiting consumer") {
        h.adapter->start();
        std::thread stopper([&h]() {
                std::this_thread::sleep_for(20ms);
                h.adapter->stop();
            });
        auto start = std::chrono::steady_clock::now();
        REQUIRE_FALSE(h.adapter->wait_received(5000ms).has_value());
        stopper.join();
        REQUIRE(std::chrono::steady_clock::now() - start < 4000ms);
    }
}
