/**
 * @file frame.hpp
 * @brief Canonical in-memory bus frame and DLC length mapping
 * @version 1.0
 * @date 2026-10-19
 *
 * A Frame is what crosses every boundary of the gateway: codecs produce and
 * consume it, the bus adapter hands it to the transport and the fan-out path
 * encodes it back for TCP clients.
 *
 * DLC mapping (CAN FD):
 * ```
 * code : 0..8  9   10  11  12  13  14  15
 * bytes: 0..8  12  16  20  24  32  48  64
 * ```
 *
 * @copyright Copyright (c) 2026
 */

#pragma once

#include <cstdint>
#include <cstddef>
#include <initializer_list>
#include <string>
#include <vector>

#include "../enums/protocol.hpp"

namespace canlink {

    /**
     * @brief Bus frame value type
     *
     * Invariant for frames built by the codecs or assign_payload():
     * length_code == encode_length(payload.size()).
     */
    struct Frame {
        std::uint32_t id = 0;                 ///< 11-bit or 29-bit identifier (not range checked)
        std::uint32_t flags = 0;              ///< Opaque FrameFlag bitmask
        std::uint8_t length_code = 0;         ///< DLC (0-15)
        std::vector<std::uint8_t> payload;    ///< 0-64 data bytes

        Frame() = default;

        /**
         * @brief Build a frame from id and payload
         *
         * Input that may exceed 64 bytes goes through assign_payload(), which
         * truncates and reports the dropped count.
         *
         * @param id CAN identifier
         * @param data Payload bytes (at most 64)
         * @param flags FrameFlag bitmask
         * @throws ProtocolException (WBAD_LENGTH) if data is longer than 64 bytes
         */
        Frame(std::uint32_t id, span<const std::uint8_t> data, std::uint32_t flags = 0);

        Frame(std::uint32_t id, std::initializer_list<std::uint8_t> data,
            std::uint32_t flags = 0);

        bool operator==(const Frame& other) const {
            return id == other.id && flags == other.flags &&
                   length_code == other.length_code && payload == other.payload;
        }

        bool operator!=(const Frame& other) const { return !(*this == other); }

        /**
         * @brief Get human-readable frame string
         * @return std::string e.g. "ID=0x123 DLC=2 FLAGS=0x0 DATA=[0A 14]"
         */
        std::string to_string() const;
    };

    /**
     * @brief Map a length code to its payload size in bytes
     * @param code DLC in 0..15
     * @return std::uint32_t Payload size
     * @throws ProtocolException (WBAD_DLC) for codes above 15
     */
    std::uint32_t decode_length(std::uint8_t code);

    /**
     * @brief Map a payload size to the smallest length code that holds it
     *
     * 0..8 map to themselves, larger sizes round up to the next bucket.
     * Sizes above 64 map to 15; callers that copy such payloads must
     * truncate them (see assign_payload()).
     *
     * @param payload_len Payload size in bytes
     * @return std::uint8_t DLC in 0..15
     */
    std::uint8_t encode_length(std::uint32_t payload_len);

    /**
     * @brief Copy payload bytes into a frame, truncating to 64 bytes
     *
     * Sets frame.payload and frame.length_code consistently.
     *
     * @param frame Frame to update
     * @param data Source bytes
     * @return std::size_t Number of bytes dropped by truncation (0 if none)
     */
    std::size_t assign_payload(Frame& frame, span<const std::uint8_t> data);

} // namespace canlink
