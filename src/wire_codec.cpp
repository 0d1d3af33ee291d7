/**
 * @file wire_codec.cpp
 * @brief Codec factory
 * @version 1.0
 * @date 2026-10-19
 */

#include "../include/codec/compact_codec.hpp"
#include "../include/codec/structured_codec.hpp"

namespace canlink {

    std::shared_ptr<const IWireCodec> make_codec(Protocol protocol,
        std::size_t max_structured_message_bytes) {
        switch (protocol) {
        case Protocol::COMPACT:
            return std::make_shared<CompactCodec>();
        case Protocol::STRUCTURED:
        default:
            return std::make_shared<StructuredCodec>(max_structured_message_bytes);
        }
    }

} // namespace canlink
