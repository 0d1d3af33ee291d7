/**
 * @file test_socketcan_helpers.cpp
 * @brief Unit tests for SocketCAN conversion helpers
 * @version 1.0
 * @date 2026-10-19
 */

#include <catch2/catch_test_macros.hpp>
#include <cstring>
#include <linux/can.h>
#include <vector>

#include "../include/interface/socketcan_helpers.hpp"
#include "../include/exception/canlink_exception.hpp"

using namespace canlink;

namespace {
    struct canfd_frame blank_frame() {
        struct canfd_frame cf;
        std::memset(&cf, 0, sizeof(cf));
        return cf;
    }

    std::vector<std::uint8_t> sequence(std::size_t count) {
        std::vector<std::uint8_t> data(count);
        for (std::size_t i = 0; i < count; ++i) {
            data[i] = static_cast<std::uint8_t>(i + 1);
        }
        return data;
    }
}

TEST_CASE("SocketCANHelper::requires_fd", "[socketcan][conversion]") {
    auto nine = sequence(9);
    auto twelve = sequence(12);
    REQUIRE_FALSE(SocketCANHelper::requires_fd(Frame(0x123, {0x01, 0x02})));
    REQUIRE(SocketCANHelper::requires_fd(Frame(0x123, nine)));
    REQUIRE(SocketCANHelper::requires_fd(Frame(0x123, {0x01}, flag_bit(FrameFlag::FDF))));

    REQUIRE(SocketCANHelper::mtu_for(Frame(0x123, {0x01})) == CAN_MTU);
    REQUIRE(SocketCANHelper::mtu_for(Frame(0x123, twelve)) == CANFD_MTU);
}

TEST_CASE("SocketCANHelper::to_socketcan - Classic frames", "[socketcan][conversion]") {
    SECTION("Standard ID data frame") {
        auto cf = SocketCANHelper::to_socketcan(Frame(0x123, {0x11, 0x22, 0x33}));

        REQUIRE((cf.can_id & CAN_EFF_FLAG) == 0);
        REQUIRE((cf.can_id & CAN_RTR_FLAG) == 0);
        REQUIRE((cf.can_id & CAN_SFF_MASK) == 0x123);
        REQUIRE(cf.len == 3);
        REQUIRE(cf.data[0] == 0x11);
        REQUIRE(cf.data[1] == 0x22);
        REQUIRE(cf.data[2] == 0x33);
    }

    SECTION("Identifier above 11 bits is sent extended") {
        auto cf = SocketCANHelper::to_socketcan(Frame(0x12345678, {0xAA}));
        REQUIRE((cf.can_id & CAN_EFF_FLAG) != 0);
        REQUIRE((cf.can_id & CAN_EFF_MASK) == 0x12345678);
    }

    SECTION("IDE flag forces extended even for small identifiers") {
        auto cf = SocketCANHelper::to_socketcan(
            Frame(0x10, {0xAA}, flag_bit(FrameFlag::IDE)));
        REQUIRE((cf.can_id & CAN_EFF_FLAG) != 0);
        REQUIRE((cf.can_id & CAN_EFF_MASK) == 0x10);
    }

    SECTION("Remote frame") {
        Frame frame;
        frame.id = 0x7FF;
        frame.flags = flag_bit(FrameFlag::RTR);
        auto cf = SocketCANHelper::to_socketcan(frame);
        REQUIRE((cf.can_id & CAN_RTR_FLAG) != 0);
        REQUIRE((cf.can_id & CAN_SFF_MASK) == 0x7FF);
        REQUIRE(cf.len == 0);
    }

    SECTION("Identifier wider than 29 bits is rejected") {
        Frame frame(0x1, {0x00});
        frame.id = 0x20000000;
        try {
            SocketCANHelper::to_socketcan(frame);
            FAIL("Expected ProtocolException");
        } catch (const ProtocolException& e) {
            REQUIRE(e.status() == Status::WBAD_ID);
        }
    }
}

TEST_CASE("SocketCANHelper::to_socketcan - CAN FD frames", "[socketcan][conversion][fd]") {
    SECTION("Payload that fills a bucket exactly") {
        auto data = sequence(20);
        auto cf = SocketCANHelper::to_socketcan(Frame(0x200, data));
        REQUIRE(cf.len == 20);
        REQUIRE(std::memcmp(cf.data, data.data(), data.size()) == 0);
    }

    SECTION("Payload between buckets is zero padded") {
        auto data = sequence(9);
        auto cf = SocketCANHelper::to_socketcan(Frame(0x200, data));
        REQUIRE(cf.len == 12);
        REQUIRE(cf.data[8] == 9);
        REQUIRE(cf.data[9] == 0);
        REQUIRE(cf.data[10] == 0);
        REQUIRE(cf.data[11] == 0);
    }

    SECTION("BRS and ESI map to canfd flags") {
        std::uint32_t flags = flag_bit(FrameFlag::FDF) | flag_bit(FrameFlag::BRS) |
                              flag_bit(FrameFlag::ESI);
        auto cf = SocketCANHelper::to_socketcan(Frame(0x200, {0x01}, flags));
        REQUIRE(cf.len == 1);
        REQUIRE((cf.flags & CANFD_BRS) != 0);
        REQUIRE((cf.flags & CANFD_ESI) != 0);
    }

    SECTION("RTR is ignored for FD frames") {
        std::uint32_t flags = flag_bit(FrameFlag::FDF) | flag_bit(FrameFlag::RTR);
        auto cf = SocketCANHelper::to_socketcan(Frame(0x200, {0x01}, flags));
        REQUIRE((cf.can_id & CAN_RTR_FLAG) == 0);
    }

    SECTION("Length code too small for the payload is rejected") {
        auto data = sequence(16);
        Frame frame(0x200, data);
        frame.length_code = 9;  // 12 bytes
        try {
            SocketCANHelper::to_socketcan(frame);
            FAIL("Expected ProtocolException");
        } catch (const ProtocolException& e) {
            REQUIRE(e.status() == Status::WBAD_DLC);
        }
    }
}

TEST_CASE("SocketCANHelper::from_socketcan - Classic frames", "[socketcan][conversion]") {
    auto cf = blank_frame();

    SECTION("Standard data frame") {
        cf.can_id = 0x321;
        cf.len = 2;
        cf.data[0] = 0x0A;
        cf.data[1] = 0x14;

        Frame frame = SocketCANHelper::from_socketcan(cf, CAN_MTU);
        REQUIRE(frame == Frame(0x321, {0x0A, 0x14}));
        REQUIRE(frame.flags == 0);
    }

    SECTION("Extended data frame sets IDE") {
        cf.can_id = 0x1ABCDE | CAN_EFF_FLAG;
        cf.len = 1;
        cf.data[0] = 0xFF;

        Frame frame = SocketCANHelper::from_socketcan(cf, CAN_MTU);
        REQUIRE(frame.id == 0x1ABCDE);
        REQUIRE(has_flag(frame.flags, FrameFlag::IDE));
    }

    SECTION("Remote frame carries no payload") {
        cf.can_id = 0x55 | CAN_RTR_FLAG;
        cf.len = 4;

        Frame frame = SocketCANHelper::from_socketcan(cf, CAN_MTU);
        REQUIRE(frame.id == 0x55);
        REQUIRE(has_flag(frame.flags, FrameFlag::RTR));
        REQUIRE(frame.payload.empty());
        REQUIRE(frame.length_code == 0);
    }

    SECTION("Error frames are rejected") {
        cf.can_id = CAN_ERR_FLAG | 0x04;
        try {
            SocketCANHelper::from_socketcan(cf, CAN_MTU);
            FAIL("Expected ProtocolException");
        } catch (const ProtocolException& e) {
            REQUIRE(e.status() == Status::WBAD_TYPE);
        }
    }

    SECTION("Unexpected read size is rejected") {
        cf.can_id = 0x1;
        try {
            SocketCANHelper::from_socketcan(cf, 10);
            FAIL("Expected ProtocolException");
        } catch (const ProtocolException& e) {
            REQUIRE(e.status() == Status::WBAD_LENGTH);
        }
    }

    SECTION("Classic length above 8 is rejected") {
        cf.can_id = 0x1;
        cf.len = 12;
        try {
            SocketCANHelper::from_socketcan(cf, CAN_MTU);
            FAIL("Expected ProtocolException");
        } catch (const ProtocolException& e) {
            REQUIRE(e.status() == Status::WBAD_DLC);
        }
    }
}

TEST_CASE("SocketCANHelper::from_socketcan - CAN FD frames", "[socketcan][conversion][fd]") {
    auto cf = blank_frame();
    cf.can_id = 0x300;
    cf.len = 12;
    cf.flags = CANFD_BRS;
    for (std::uint8_t i = 0; i < 12; ++i) {
        cf.data[i] = static_cast<std::uint8_t>(0xA0 + i);
    }

    Frame frame = SocketCANHelper::from_socketcan(cf, CANFD_MTU);
    REQUIRE(frame.id == 0x300);
    REQUIRE(frame.payload.size() == 12);
    REQUIRE(frame.length_code == 9);
    REQUIRE(frame.payload[11] == 0xAB);
    REQUIRE(has_flag(frame.flags, FrameFlag::FDF));
    REQUIRE(has_flag(frame.flags, FrameFlag::BRS));
    REQUIRE_FALSE(has_flag(frame.flags, FrameFlag::ESI));

    SECTION("RTR bit has no meaning on FD frames") {
        cf.can_id |= CAN_RTR_FLAG;
        Frame fd = SocketCANHelper::from_socketcan(cf, CANFD_MTU);
        REQUIRE_FALSE(has_flag(fd.flags, FrameFlag::RTR));
        REQUIRE(fd.payload.size() == 12);
    }

    SECTION("Converted back it yields the same canfd_frame") {
        auto round = SocketCANHelper::to_socketcan(frame);
        REQUIRE(round.can_id == cf.can_id);
        REQUIRE(round.len == cf.len);
        REQUIRE((round.flags & CANFD_BRS) != 0);
        REQUIRE(std::memcmp(round.data, cf.data, cf.len) == 0);
    }
}
