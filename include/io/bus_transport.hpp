/**
 * @file bus_transport.hpp
 * @brief Abstract interface for the shared bus transport
 * @version 1.0
 * @date 2026-10-19
 *
 * The transport is the gateway's only view of the bus. It accepts frames to
 * send and reports every frame it observes (own transmissions included)
 * through an asynchronous receive handler called from its own thread.
 */

#pragma once

#include <cstdint>
#include <functional>
#include <string>

#include "../enums/error.hpp"
#include "../enums/protocol.hpp"
#include "../frame/frame.hpp"

namespace canlink {

    /**
     * @brief Abstract interface for bus I/O
     *
     * Implementations:
     * - SocketCANTransport: Linux raw CAN socket (CAN FD capable)
     * - MockBusTransport: Records sent frames, injects received ones (tests)
     */
    class IBusTransport {
        public:
            /**
             * @brief Receive handler signature
             *
             * Arguments: frame, direction (TX for own frames), timestamp in ns.
             * Called from the transport's receive thread.
             */
            using ReceiveHandler = std::function<void(const Frame&, Direction, std::uint64_t)>;

            virtual ~IBusTransport() = default;

            /**
             * @brief Send a frame to the bus
             * @param frame Frame to send (copied by the transport before returning)
             * @return Status SUCCESS or the failure status
             */
            virtual Status send_frame(const Frame& frame) = 0;

            /**
             * @brief Install or clear (nullptr) the receive handler
             *
             * Once this returns, the previous handler is not running and will
             * not be called again.
             */
            virtual void set_receive_handler(ReceiveHandler handler) = 0;

            /**
             * @brief Start delivering received frames
             */
            virtual void start() = 0;

            /**
             * @brief Stop delivering received frames. Blocks until delivery has stopped.
             */
            virtual void stop() = 0;

            virtual bool is_open() const = 0;

            /**
             * @brief Get the bus channel name
             * @return std::string e.g. "vcan0"
             */
            virtual std::string get_channel_name() const = 0;
    };

} // namespace canlink
