/**
 * @file compact_codec.hpp
 * @brief Compact binary wire codec
 * @version 1.0
 * @date 2026-10-19
 *
 * Wire layout:
 * ```
 * [ID(4, big-endian)][LEN(1)][DATA(LEN)]
 * ```
 * LEN is the raw byte count (0-64), not a DLC. Flags are not carried.
 *
 * @copyright Copyright (c) 2026
 */

#pragma once

#include "wire_codec.hpp"

namespace canlink {

    class CompactCodec : public IWireCodec {
        public:
            CompactCodec() = default;

            Result<DecodeOutcome> try_decode(span<const std::uint8_t> buffer) const override;

            /**
             * @brief Encode a frame as [id][len][data]
             * @throws ProtocolException (WBAD_LENGTH) if the payload exceeds 64 bytes
             */
            std::vector<std::uint8_t> encode(const Frame& frame) const override;

            Protocol protocol() const override { return Protocol::COMPACT; }
            std::string name() const override { return "compact"; }
    };

} // namespace canlink
