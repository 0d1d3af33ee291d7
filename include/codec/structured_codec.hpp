/**
 * @file structured_codec.hpp
 * @brief Length-prefixed JSON wire codec
 * @version 1.0
 * @date 2026-10-19
 *
 * Wire layout:
 * ```
 * [N(4, big-endian)][JSON record(N)]
 * ```
 * Record shape: {"type":"can","id":291,"data":[10,20],"flags":0}
 *
 * - "data" and "flags" are optional
 *
 * - records whose "type" is not "can" are consumed and skipped
 *
 * @copyright Copyright (c) 2026
 */

#pragma once

#include <nlohmann/json.hpp>

#include "wire_codec.hpp"

namespace canlink {

    class StructuredCodec : public IWireCodec {
        private:
            std::size_t max_message_bytes_;

        public:
            /**
             * @brief Construct codec
             * @param max_message_bytes Largest accepted record length N
             */
            explicit StructuredCodec(std::size_t max_message_bytes = 65536)
                : max_message_bytes_(max_message_bytes) {}

            Result<DecodeOutcome> try_decode(span<const std::uint8_t> buffer) const override;
            std::vector<std::uint8_t> encode(const Frame& frame) const override;

            Protocol protocol() const override { return Protocol::STRUCTURED; }
            std::string name() const override { return "structured"; }

            std::size_t max_message_bytes() const { return max_message_bytes_; }

            /**
             * @brief Convert a JSON record into a frame
             * @param record Parsed record
             * @param outcome Receives the frame (if type is "can") and truncated_bytes
             * @return Status SUCCESS, WBAD_FORMAT, WBAD_ID or WBAD_DATA
             */
            static Status record_to_frame(const nlohmann::json& record, DecodeOutcome& outcome);

            /**
             * @brief Convert a frame into a JSON record
             */
            static nlohmann::json frame_to_record(const Frame& frame);
    };

} // namespace canlink
