/**
 * @file compact_codec.cpp
 * @brief Compact binary wire codec implementation
 * @version 1.0
 * @date 2026-10-19
 */

#include "../include/codec/compact_codec.hpp"
#include "../include/exception/canlink_exception.hpp"

namespace canlink {

    Result<DecodeOutcome> CompactCodec::try_decode(span<const std::uint8_t> buffer) const {
        if (buffer.size() < CompactLayout::HEADER_SIZE) {
            return Result<DecodeOutcome>::error(Status::WINCOMPLETE, "compact header");
        }

        std::size_t len = buffer[CompactLayout::LEN];
        if (len > Limits::MAX_PAYLOAD) {
            return Result<DecodeOutcome>::error(Status::WBAD_LENGTH,
                "compact length " + std::to_string(len));
        }

        std::size_t total = CompactLayout::frame_size(len);
        if (buffer.size() < total) {
            return Result<DecodeOutcome>::error(Status::WINCOMPLETE, "compact payload");
        }

        DecodeOutcome outcome;
        Frame frame;
        frame.id = bytes_to_int_be<std::uint32_t>(buffer.subspan(CompactLayout::ID, 4));
        assign_payload(frame, buffer.subspan(CompactLayout::DATA, len));
        outcome.frame = std::move(frame);
        outcome.consumed = total;
        return Result<DecodeOutcome>::success(std::move(outcome));
    }

    std::vector<std::uint8_t> CompactCodec::encode(const Frame& frame) const {
        if (frame.payload.size() > Limits::MAX_PAYLOAD) {
            throw ProtocolException(Status::WBAD_LENGTH,
                "CompactCodec::encode: payload of " + std::to_string(frame.payload.size()) +
                " bytes");
        }

        std::vector<std::uint8_t> out;
        out.reserve(CompactLayout::frame_size(frame.payload.size()));

        auto id_bytes = int_to_bytes_be<std::uint32_t>(frame.id);
        out.insert(out.end(), id_bytes.begin(), id_bytes.end());
        out.push_back(static_cast<std::uint8_t>(frame.payload.size()));
        out.insert(out.end(), frame.payload.begin(), frame.payload.end());
        return out;
    }

} // namespace canlink
