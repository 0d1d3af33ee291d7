/**
 * @file frame.cpp
 * @brief Frame model and DLC mapping implementation
 * @version 1.0
 * @date 2026-10-19
 */

#include <array>
#include <iomanip>
#include <sstream>

#include "../include/frame/frame.hpp"
#include "../include/exception/canlink_exception.hpp"

namespace canlink {

    namespace {
        // Payload size for DLC 9..15
        constexpr std::array<std::uint32_t, 7> EXTENDED_SIZES = {12, 16, 20, 24, 32, 48, 64};
    }

    // === Constructors ===

    Frame::Frame(std::uint32_t frame_id, span<const std::uint8_t> data, std::uint32_t frame_flags)
        : id(frame_id), flags(frame_flags) {
        if (data.size() > Limits::MAX_PAYLOAD) {
            throw ProtocolException(Status::WBAD_LENGTH,
                "Frame: payload of " + std::to_string(data.size()) + " bytes");
        }
        assign_payload(*this, data);
    }

    Frame::Frame(std::uint32_t frame_id, std::initializer_list<std::uint8_t> data,
        std::uint32_t frame_flags)
        : Frame(frame_id, span<const std::uint8_t>(data.begin(), data.size()), frame_flags) {
    }

    std::string Frame::to_string() const {
        std::ostringstream oss;
        oss << "ID=0x" << std::hex << std::uppercase << id
            << std::dec << " DLC=" << static_cast<int>(length_code)
            << " FLAGS=0x" << std::hex << flags
            << " DATA=[";
        for (std::size_t i = 0; i < payload.size(); ++i) {
            if (i > 0) oss << " ";
            oss << std::setw(2) << std::setfill('0') << static_cast<int>(payload[i]);
        }
        oss << "]";
        return oss.str();
    }

    // === Length Mapping ===

    std::uint32_t decode_length(std::uint8_t code) {
        if (code <= Limits::CLASSIC_PAYLOAD) {
            return code;
        }
        if (code > Limits::MAX_LENGTH_CODE) {
            throw ProtocolException(Status::WBAD_DLC,
                "decode_length: DLC must be 0-15, got " + std::to_string(code));
        }
        return EXTENDED_SIZES[code - 9];
    }

    std::uint8_t encode_length(std::uint32_t payload_len) {
        if (payload_len <= Limits::CLASSIC_PAYLOAD) {
            return static_cast<std::uint8_t>(payload_len);
        }
        for (std::size_t i = 0; i < EXTENDED_SIZES.size(); ++i) {
            if (payload_len <= EXTENDED_SIZES[i]) {
                return static_cast<std::uint8_t>(9 + i);
            }
        }
        return Limits::MAX_LENGTH_CODE;
    }

    std::size_t assign_payload(Frame& frame, span<const std::uint8_t> data) {
        std::size_t kept = std::min(data.size(), Limits::MAX_PAYLOAD);
        frame.payload.assign(data.begin(), data.begin() + kept);
        frame.length_code = encode_length(static_cast<std::uint32_t>(kept));
        return data.size() - kept;
    }

} // namespace canlink
