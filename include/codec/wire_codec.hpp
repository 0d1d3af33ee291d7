/**
 * @file wire_codec.hpp
 * @brief Abstract interface for TCP wire encodings
 * @version 1.0
 * @date 2026-10-19
 *
 * A codec turns the front of a client's receive buffer into at most one Frame
 * per call, and a Frame back into wire bytes. Codecs are stateless, so a single
 * instance can be shared between connections.
 *
 * @copyright Copyright (c) 2026
 */

#pragma once

#include <cstdint>
#include <cstddef>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "../enums/protocol.hpp"
#include "../frame/frame.hpp"
#include "../template/result.hpp"

namespace canlink {

    /**
     * @brief Outcome of one successful decode step
     *
     * - frame set, consumed > 0: a frame was decoded
     *
     * - frame empty, consumed > 0: a message was consumed and skipped
     *
     * truncated_bytes is non-zero when the source carried more than 64 data
     * bytes and the payload was cut.
     */
    struct DecodeOutcome {
        std::optional<Frame> frame;
        std::size_t consumed = 0;
        std::size_t truncated_bytes = 0;
    };

    /**
     * @brief Abstract interface for a client wire protocol
     *
     * Implementations:
     * - CompactCodec: [u32 BE id][u8 len][data]
     * - StructuredCodec: [u32 BE N][N bytes JSON record]
     */
    class IWireCodec {
        public:
            virtual ~IWireCodec() = default;

            /**
             * @brief Try to decode one message from the front of a buffer
             * @param buffer Bytes received so far (not modified)
             * @return Result<DecodeOutcome> Outcome on success;
             *         Status::WINCOMPLETE when more input is needed (nothing consumed);
             *         any other status when the stream is invalid
             */
            virtual Result<DecodeOutcome> try_decode(span<const std::uint8_t> buffer) const = 0;

            /**
             * @brief Encode a frame to wire bytes
             * @param frame Frame to encode
             * @return std::vector<std::uint8_t> Complete wire message
             * @throws ProtocolException if the frame cannot be represented
             */
            virtual std::vector<std::uint8_t> encode(const Frame& frame) const = 0;

            virtual Protocol protocol() const = 0;

            virtual std::string name() const = 0;
    };

    /**
     * @brief Create the codec for a protocol
     * @param protocol Client protocol
     * @param max_structured_message_bytes Upper bound on a structured record length
     * @return std::shared_ptr<const IWireCodec> Shared, stateless codec
     */
    std::shared_ptr<const IWireCodec> make_codec(Protocol protocol,
        std::size_t max_structured_message_bytes = 65536);

} // namespace canlink
