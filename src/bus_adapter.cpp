/**
 * @file bus_adapter.cpp
 * @brief Bus adapter implementation
 * @version 1.0
 * @date 2026-10-19
 */

#include <stdexcept>

#include "../include/pattern/bus_adapter.hpp"
#include "../include/exception/canlink_exception.hpp"

namespace canlink {

    // === Constructor / Destructor ===

    BusAdapter::BusAdapter(std::unique_ptr<IBusTransport> transport, std::size_t queue_capacity)
        : transport_(std::move(transport)), queue_(queue_capacity) {
        if (!transport_) {
            throw std::invalid_argument("BusAdapter: transport cannot be null");
        }
    }

    BusAdapter::~BusAdapter() {
        stop();
        // Handler captures this; make sure it can no longer run
        transport_->set_receive_handler(nullptr);
    }

    // === Lifecycle ===

    void BusAdapter::start() {
        if (!transport_->is_open()) {
            throw_error(Status::BUS_NOT_STARTED,
                "BusAdapter::start: " + transport_->get_channel_name() + " is not open");
        }
        bool expected = false;
        if (!running_.compare_exchange_strong(expected, true)) {
            return;
        }
        queue_.reopen();
        transport_->set_receive_handler(
            [this](const Frame& frame, Direction direction, std::uint64_t timestamp_ns) {
                on_receive(frame, direction, timestamp_ns);
            });
        try {
            transport_->start();
        } catch (...) {
            transport_->set_receive_handler(nullptr);
            running_.store(false);
            throw;
        }
    }

    void BusAdapter::stop() {
        if (!running_.exchange(false)) {
            return;
        }
        transport_->stop();
        transport_->set_receive_handler(nullptr);
        queue_.close();
    }

    // === Outbound ===

    Result<void> BusAdapter::forward(const Frame& frame) {
        if (!transport_->is_open()) {
            tx_errors_.fetch_add(1, std::memory_order_relaxed);
            return Result<void>::error(Status::BUS_NOT_STARTED, "BusAdapter::forward");
        }

        Status status = transport_->send_frame(frame);
        if (status != Status::SUCCESS) {
            tx_errors_.fetch_add(1, std::memory_order_relaxed);
            return Result<void>::error(status, "BusAdapter::forward");
        }
        tx_frames_.fetch_add(1, std::memory_order_relaxed);
        return Result<void>::success();
    }

    Result<void> BusAdapter::send_test_frame() {
        Frame frame(TEST_FRAME_ID, {0x01, 0x02, 0x03, 0x04, 0x05, 0x06, 0x07, 0x08});
        auto result = forward(frame);
        if (!result) {
            return Result<void>::error(result, "BusAdapter::send_test_frame");
        }
        return result;
    }

    // === Inbound ===

    void BusAdapter::on_receive(const Frame& frame, Direction direction,
        std::uint64_t timestamp_ns) {
        rx_frames_.fetch_add(1, std::memory_order_relaxed);
        ReceivedFrame item;
        item.frame = frame;
        item.direction = direction;
        item.timestamp_ns = timestamp_ns;
        if (queue_.push(std::move(item)) == PushResult::DROPPED_OLDEST && overflow_callback_) {
            overflow_callback_(queue_.drop_count());
        }
    }

    std::optional<ReceivedFrame> BusAdapter::wait_received(std::chrono::milliseconds timeout) {
        return queue_.wait_pop(timeout);
    }

} // namespace canlink
