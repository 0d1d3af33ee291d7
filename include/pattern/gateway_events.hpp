/**
 * @file gateway_events.hpp
 * @brief Structured gateway event reports and the default console sink
 * @version 1.0
 * @date 2026-10-19
 *
 * Every runtime condition worth reporting (client lifecycle, decode errors,
 * truncation, bus and write failures, queue overflow) is turned into a
 * GatewayEvent and handed to one sink. The default sink prints tagged lines
 * the same way the forwarding loops log.
 *
 * @copyright Copyright (c) 2026
 */

#pragma once

#include <cstdint>
#include <functional>
#include <string>

#include "../enums/error.hpp"

namespace canlink {

    /**
     * @brief Kind of a gateway event
     */
    enum class EventKind : std::uint8_t {
        CLIENT_CONNECTED,
        CLIENT_DISCONNECTED,
        DECODE_INVALID,        ///< Unrecoverable input; the client is closed
        PAYLOAD_TRUNCATED,     ///< More than 64 data bytes; frame forwarded truncated
        BUS_SEND_FAILURE,      ///< Transport refused a frame; connection kept
        CLIENT_WRITE_FAILURE,  ///< Fan-out write failed; the client is closed
        BUS_QUEUE_OVERFLOW     ///< Oldest bus frame dropped from the hand-off queue
    };

    std::string to_string(EventKind kind);

    /**
     * @brief One reported event
     *
     * client_id is 0 for events not tied to a client.
     */
    struct GatewayEvent {
        EventKind kind;
        std::uint64_t client_id = 0;
        Status status = Status::SUCCESS;
        std::string detail;

        /**
         * @brief True for warnings and failures (rendered on stderr)
         */
        bool is_failure() const {
            return kind != EventKind::CLIENT_CONNECTED && kind != EventKind::CLIENT_DISCONNECTED;
        }

        std::string to_string() const;
    };

    using EventCallback = std::function<void(const GatewayEvent&)>;

    /**
     * @brief Default sink: "[CLIENT]" / "[CODEC]" / "[BUS]" tagged console lines
     */
    void log_event(const GatewayEvent& event);

} // namespace canlink
