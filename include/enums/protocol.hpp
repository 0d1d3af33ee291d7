/**
 * @file protocol.hpp
 * @brief Protocol definitions and helper functions for the TCP-to-CAN gateway.
 * @version 1.0
 * @date 2026-10-19
 *
 * Wire protocol constants, frame flag bits, the client protocol variants and
 * the byte manipulation helpers shared by the codecs.
 *
 * @copyright Copyright (c) 2026
 *
 */


#pragma once

#include <cstdint>
#include <cstddef>
#include <type_traits>
#include <string>
#include <algorithm>
#include <array>
#include <cctype>
#include <boost/core/span.hpp>
using namespace boost;

/**
 * @namespace canlink
 * @brief Namespace containing all TCP-to-CAN gateway functionality.
 */
namespace canlink {

    // === Frame Size Constants ===

    /**
     * @brief Size limits shared by the frame model and the codecs.
     */
    struct Limits {
        static constexpr std::size_t MAX_PAYLOAD = 64;       ///< CAN FD maximum payload
        static constexpr std::size_t CLASSIC_PAYLOAD = 8;    ///< Classic CAN maximum payload
        static constexpr std::uint8_t MAX_LENGTH_CODE = 15;  ///< Largest DLC
        static constexpr std::uint32_t MAX_CAN_ID_STD = 0x7FF;
        static constexpr std::uint32_t MAX_CAN_ID_EXT = 0x1FFFFFFF;
    };

    /**
     * @brief Compact wire layout: [ID(4, big-endian)][LEN(1)][DATA(LEN)]
     */
    struct CompactLayout {
        static constexpr std::size_t ID = 0;
        static constexpr std::size_t LEN = 4;
        static constexpr std::size_t DATA = 5;
        static constexpr std::size_t HEADER_SIZE = 5;

        static constexpr std::size_t frame_size(std::size_t len) {
            return HEADER_SIZE + len;
        }
    };

    /**
     * @brief Structured wire layout: [N(4, big-endian)][JSON record(N)]
     */
    struct StructuredLayout {
        static constexpr std::size_t LENGTH = 0;
        static constexpr std::size_t PAYLOAD = 4;
        static constexpr std::size_t PREFIX_SIZE = 4;

        static constexpr const char* KEY_TYPE = "type";
        static constexpr const char* KEY_ID = "id";
        static constexpr const char* KEY_DATA = "data";
        static constexpr const char* KEY_FLAGS = "flags";
        static constexpr const char* FRAME_TYPE = "can";   ///< Tag of a frame record
    };

    // === Frame Flags ===

    /**
     * @brief Frame flag bits carried in Frame::flags.
     *
     * The gateway passes flags through untouched; the SocketCAN transport
     * interprets these bits when mapping to can_frame/canfd_frame.
     * @note Bit positions follow the virtual bus middleware's frame flags:
     *
     * - IDE: extended (29-bit) identifier
     *
     * - RTR: remote transmission request
     *
     * - FDF: CAN FD frame
     *
     * - BRS: bit rate switch (CAN FD)
     *
     * - ESI: error state indicator (CAN FD)
     */
    enum class FrameFlag : std::uint32_t {
        RTR = 1u << 4,
        IDE = 1u << 9,
        FDF = 1u << 12,
        BRS = 1u << 13,
        ESI = 1u << 14
    };

    constexpr bool has_flag(std::uint32_t flags, FrameFlag flag) {
        return (flags & static_cast<std::uint32_t>(flag)) != 0;
    }

    constexpr std::uint32_t flag_bit(FrameFlag flag) {
        return static_cast<std::uint32_t>(flag);
    }

    // === Gateway Enums ===

    /**
     * @brief Wire protocol spoken by a TCP client.
     * @note Available protocols are:
     *
     * - COMPACT: 5-byte binary header followed by the payload
     *
     * - STRUCTURED: 4-byte big-endian length prefix followed by a JSON record
     *
     * The protocol of a client is fixed when the connection is accepted.
     */
    enum class Protocol : std::uint8_t {
        COMPACT = 0x00,
        STRUCTURED = 0x01
    };
    static constexpr Protocol DEFAULT_PROTOCOL = Protocol::STRUCTURED;

    /**
     * @brief Direction of a frame as reported by the bus transport.
     * @note TX is a frame this participant sent (looped back), RX a frame
     * originated elsewhere on the bus.
     */
    enum class Direction : std::uint8_t {
        TX = 0x01,
        RX = 0x02
    };

    /**
     * @brief Lifecycle state of one client connection.
     */
    enum class ConnectionState : std::uint8_t {
        READING = 0x00,
        CLOSING = 0x01,
        CLOSED = 0x02
    };

    // === Enum Helper Functions ===

    template<typename EnumType> constexpr std::uint8_t to_byte(EnumType value) {
        return static_cast<std::uint8_t>(
            static_cast<std::underlying_type_t<EnumType> >(value));
    }

    inline std::string to_string(Protocol protocol) {
        switch (protocol) {
        case Protocol::COMPACT:    return "compact";
        case Protocol::STRUCTURED: return "structured";
        default:                   return "unknown";
        }
    }

    inline std::string to_string(Direction direction) {
        return direction == Direction::TX ? "TX" : "RX";
    }

    inline std::string to_string(ConnectionState state) {
        switch (state) {
        case ConnectionState::READING: return "READING";
        case ConnectionState::CLOSING: return "CLOSING";
        case ConnectionState::CLOSED:  return "CLOSED";
        default:                       return "UNKNOWN";
        }
    }

    /**
     * @brief Parse a protocol name (case-insensitive).
     * @param name "compact"/"binary" or "structured"/"json"
     * @param use_default Set to true when the name is not recognised
     * @return Protocol The parsed protocol, or DEFAULT_PROTOCOL
     */
    inline Protocol protocol_from_string(std::string name, bool& use_default) {
        std::transform(name.begin(), name.end(), name.begin(),
            [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
        use_default = false;
        if (name == "compact" || name == "binary" || name == "raw") {
            return Protocol::COMPACT;
        }
        if (name == "structured" || name == "json") {
            return Protocol::STRUCTURED;
        }
        use_default = true;
        return DEFAULT_PROTOCOL;
    }

    // === Byte Manipulation Helpers ===

    /**
     * @brief Converts an unsigned integer to a big-endian byte array.
     * The most significant byte is written at index 0.
     * @example
     * @code
     * auto bytes = int_to_bytes_be<uint32_t, 4>(0x7FF); // bytes = {0x00, 0x00, 0x07, 0xFF}
     * @endcode
     */
    template<typename T, std::size_t N = sizeof(T)>
    constexpr std::array<std::uint8_t, N> int_to_bytes_be(T value) {
        static_assert(std::is_unsigned<T>::value, "T must be an unsigned integer type");
        static_assert(N > 0 && N <= sizeof(T), "N must be between 1 and sizeof(T)");
        std::array<std::uint8_t, N> bytes = {};
        for (std::size_t i = 0; i < N; ++i) {
            bytes[N - 1 - i] = static_cast<std::uint8_t>(value & 0xFF);
            value = static_cast<T>(value >> 8);
        }
        return bytes;
    }

    /**
     * @brief Converts a big-endian byte sequence to an unsigned integer.
     * @example
     * @code
     * // bytes = {0x00, 0x00, 0x07, 0xFF}
     * auto value = bytes_to_int_be<uint32_t>(bytes); // value = 0x7FF
     * @endcode
     */
    template<typename T>
    constexpr T bytes_to_int_be(span<const std::uint8_t> bytes) {
        static_assert(std::is_unsigned<T>::value, "T must be an unsigned integer type");
        T value = 0;
        for (std::size_t i = 0; i < bytes.size() && i < sizeof(T); ++i) {
            value = static_cast<T>((value << 8) | (static_cast<T>(bytes[i]) & 0xFF));
        }
        return value;
    }

} // namespace canlink
