/**
 * @file socketcan_helpers.cpp
 * @brief SocketCAN conversion utilities implementation
 * @version 1.0
 * @date 2026-10-19
 */

#include <algorithm>
#include <cstring>  // For memset

#include "../include/interface/socketcan_helpers.hpp"

namespace canlink {

    bool SocketCANHelper::requires_fd(const Frame& frame) {
        return frame.payload.size() > Limits::CLASSIC_PAYLOAD ||
               has_flag(frame.flags, FrameFlag::FDF);
    }

    // === to_socketcan() Implementation ===

    struct canfd_frame SocketCANHelper::to_socketcan(const Frame& frame) {
        struct canfd_frame cf;
        std::memset(&cf, 0, sizeof(cf));  // Zero-initialize (also pads FD payload)

        if (frame.id > CAN_EFF_MASK) {
            throw ProtocolException(Status::WBAD_ID,
                "to_socketcan: id exceeds 29 bits: " + std::to_string(frame.id));
        }
        if (frame.payload.size() > Limits::MAX_PAYLOAD) {
            throw ProtocolException(Status::WBAD_LENGTH,
                "to_socketcan: payload of " + std::to_string(frame.payload.size()) + " bytes");
        }

        bool is_extended = has_flag(frame.flags, FrameFlag::IDE) ||
                           frame.id > Limits::MAX_CAN_ID_STD;
        bool is_fd = requires_fd(frame);

        cf.can_id = is_extended ? (frame.id & CAN_EFF_MASK) | CAN_EFF_FLAG
                                : (frame.id & CAN_SFF_MASK);

        if (is_fd) {
            std::uint32_t padded = decode_length(frame.length_code);
            if (padded < frame.payload.size()) {
                throw ProtocolException(Status::WBAD_DLC,
                    "to_socketcan: DLC " + std::to_string(frame.length_code) +
                    " cannot hold " + std::to_string(frame.payload.size()) + " bytes");
            }
            cf.len = static_cast<std::uint8_t>(padded);
            if (has_flag(frame.flags, FrameFlag::BRS)) cf.flags |= CANFD_BRS;
            if (has_flag(frame.flags, FrameFlag::ESI)) cf.flags |= CANFD_ESI;
        } else {
            cf.len = static_cast<std::uint8_t>(frame.payload.size());
            if (has_flag(frame.flags, FrameFlag::RTR)) {
                cf.can_id |= CAN_RTR_FLAG;
            }
        }

        std::copy(frame.payload.begin(), frame.payload.end(), cf.data);
        return cf;
    }

    // === from_socketcan() Implementation ===

    Frame SocketCANHelper::from_socketcan(const struct canfd_frame& cf, std::size_t nbytes) {
        if (nbytes != CAN_MTU && nbytes != CANFD_MTU) {
            throw ProtocolException(Status::WBAD_LENGTH,
                "from_socketcan: unexpected read size " + std::to_string(nbytes));
        }
        if (cf.can_id & CAN_ERR_FLAG) {
            throw ProtocolException(Status::WBAD_TYPE, "from_socketcan: error frame");
        }

        bool is_fd = (nbytes == CANFD_MTU);
        bool is_extended = (cf.can_id & CAN_EFF_FLAG) != 0;
        bool is_remote = !is_fd && (cf.can_id & CAN_RTR_FLAG) != 0;

        std::size_t max_len = is_fd ? Limits::MAX_PAYLOAD : Limits::CLASSIC_PAYLOAD;
        if (cf.len > max_len) {
            throw ProtocolException(Status::WBAD_DLC,
                "from_socketcan: len must be 0-" + std::to_string(max_len) +
                ", got " + std::to_string(cf.len));
        }

        Frame frame;
        frame.id = is_extended ? (cf.can_id & CAN_EFF_MASK) : (cf.can_id & CAN_SFF_MASK);
        if (is_extended) frame.flags |= flag_bit(FrameFlag::IDE);
        if (is_remote) frame.flags |= flag_bit(FrameFlag::RTR);
        if (is_fd) {
            frame.flags |= flag_bit(FrameFlag::FDF);
            if (cf.flags & CANFD_BRS) frame.flags |= flag_bit(FrameFlag::BRS);
            if (cf.flags & CANFD_ESI) frame.flags |= flag_bit(FrameFlag::ESI);
        }

        // Remote frames carry no data; len is only the requested size
        std::size_t len = is_remote ? 0 : cf.len;
        assign_payload(frame, span<const std::uint8_t>(cf.data, len));
        return frame;
    }

} // namespace canlink
