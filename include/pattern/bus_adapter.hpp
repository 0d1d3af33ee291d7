/**
 * @file bus_adapter.hpp
 * @brief Boundary between the gateway and the bus transport
 * @version 1.0
 * @date 2026-10-19
 *
 * Outbound frames go straight to IBusTransport::send_frame(). Inbound frames
 * arrive on the transport's thread and are parked in a bounded queue; the
 * gateway's fan-out thread drains it with wait_received(), so the transport
 * callback never waits on client I/O.
 *
 * @copyright Copyright (c) 2026
 */

#pragma once

#include <atomic>
#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <optional>

#include "../io/bus_transport.hpp"
#include "../template/bounded_queue.hpp"
#include "../template/result.hpp"

namespace canlink {

    /**
     * @brief A frame observed on the bus
     */
    struct ReceivedFrame {
        Frame frame;
        Direction direction = Direction::RX;
        std::uint64_t timestamp_ns = 0;
    };

    class BusAdapter {
        public:
            /// Called with the cumulative drop count each time the queue overflows
            using OverflowCallback = std::function<void(std::uint64_t)>;

            /// Connectivity frame sent by send_test_frame()
            static constexpr std::uint32_t TEST_FRAME_ID = 0x123;

            /**
             * @brief Constructor with dependency injection
             * @param transport Bus transport (real or mock)
             * @param queue_capacity Hand-off queue capacity
             * @throws std::invalid_argument if transport is null or capacity is 0
             */
            BusAdapter(std::unique_ptr<IBusTransport> transport, std::size_t queue_capacity);

            /**
             * @brief Destructor - stops the transport and clears its receive handler
             */
            ~BusAdapter();

            BusAdapter(const BusAdapter&) = delete;
            BusAdapter& operator=(const BusAdapter&) = delete;

            /**
             * @brief Install the receive handler and start the transport
             * @throws BusException (BUS_NOT_STARTED) if the transport is not open
             */
            void start();

            /**
             * @brief Stop the transport, clear its handler and wake wait_received()
             */
            void stop();

            bool is_running() const { return running_.load(); }

            /**
             * @brief Send a frame to the bus (no retry)
             * @return Result<void> Failure carries the transport's status
             */
            Result<void> forward(const Frame& frame);

            /**
             * @brief Transport callback: queue a received frame
             *
             * Never blocks on consumers. When the queue is full the oldest frame
             * is dropped and the overflow callback runs.
             */
            void on_receive(const Frame& frame, Direction direction, std::uint64_t timestamp_ns);

            /**
             * @brief Wait for the next received frame
             * @return std::optional<ReceivedFrame> Frame, or nullopt on timeout or stop()
             */
            std::optional<ReceivedFrame> wait_received(std::chrono::milliseconds timeout);

            /**
             * @brief Send the connectivity frame (id 0x123, data 01..08)
             */
            Result<void> send_test_frame();

            void set_overflow_callback(OverflowCallback callback) {
                overflow_callback_ = std::move(callback);
            }

            IBusTransport& get_transport() { return *transport_; }
            std::string get_channel_name() const { return transport_->get_channel_name(); }

            std::uint64_t frames_forwarded() const { return tx_frames_.load(); }
            std::uint64_t forward_errors() const { return tx_errors_.load(); }
            std::uint64_t frames_received() const { return rx_frames_.load(); }
            std::uint64_t frames_dropped() const { return queue_.drop_count(); }
            std::size_t queued() const { return queue_.size(); }

        private:
            std::unique_ptr<IBusTransport> transport_;
            BoundedQueue<ReceivedFrame> queue_;
            std::atomic<bool> running_{false};

            std::atomic<std::uint64_t> tx_frames_{0};
            std::atomic<std::uint64_t> tx_errors_{0};
            std::atomic<std::uint64_t> rx_frames_{0};

            OverflowCallback overflow_callback_;
    };

} // namespace canlink
