/**
 * @file socketcan_helpers.hpp
 * @brief SocketCAN conversion utilities for gateway frames
 * @version 1.0
 * @date 2026-10-19
 *
 * Provides bidirectional conversion between canlink::Frame and the Linux
 * SocketCAN struct canfd_frame (which also carries classic can_frame data).
 *
 * Conversion Rules:
 * - IDE flag or id > 0x7FF -> CAN_EFF_FLAG (29-bit id)
 * - RTR flag <-> CAN_RTR_FLAG (classic frames only)
 * - Payload > 8 bytes or FDF flag -> CAN FD frame (CANFD_MTU), payload padded
 *   with zeros up to decode_length(length_code)
 * - BRS / ESI flags <-> CANFD_BRS / CANFD_ESI
 *
 * @copyright Copyright (c) 2026
 */

#pragma once

#include <cstddef>
#include <linux/can.h>
#include <linux/can/raw.h>

#include "../frame/frame.hpp"
#include "../exception/canlink_exception.hpp"

namespace canlink {
    /**
     * @brief Static utility class for SocketCAN conversions
     *
     * All methods are static - no instances required.
     */
    class SocketCANHelper {
        public:
            /**
             * @brief Check whether a frame must travel as a CAN FD frame
             * @param frame Gateway frame
             * @return bool True if payload > 8 bytes or the FDF flag is set
             */
            static bool requires_fd(const Frame& frame);

            /**
             * @brief Number of bytes to write for a frame (CAN_MTU or CANFD_MTU)
             */
            static std::size_t mtu_for(const Frame& frame) {
                return requires_fd(frame) ? CANFD_MTU : CAN_MTU;
            }

            /**
             * @brief Convert Frame to SocketCAN canfd_frame
             *
             * For classic frames only the first CAN_MTU bytes are meaningful
             * (struct can_frame shares the layout).
             *
             * @param frame Gateway frame to convert
             * @return struct canfd_frame Linux SocketCAN frame
             * @throws ProtocolException (WBAD_ID) if id exceeds 29 bits
             * @throws ProtocolException (WBAD_LENGTH) if payload exceeds 64 bytes
             * @throws ProtocolException (WBAD_DLC) if length_code cannot hold the payload
             */
            static struct canfd_frame to_socketcan(const Frame& frame);

            /**
             * @brief Convert SocketCAN frame to Frame
             * @param cf Received frame
             * @param nbytes Bytes read from the socket (CAN_MTU or CANFD_MTU)
             * @return Frame Gateway frame with IDE/RTR/FDF/BRS/ESI flags set
             * @throws ProtocolException (WBAD_TYPE) for error frames
             * @throws ProtocolException (WBAD_LENGTH) for an unexpected read size
             * @throws ProtocolException (WBAD_DLC) if len exceeds the frame type maximum
             */
            static Frame from_socketcan(const struct canfd_frame& cf, std::size_t nbytes);

        private:
            // No instances allowed
            SocketCANHelper() = delete;
            ~SocketCANHelper() = delete;
            SocketCANHelper(const SocketCANHelper&) = delete;
            SocketCANHelper& operator=(const SocketCANHelper&) = delete;
    };

} // namespace canlink
