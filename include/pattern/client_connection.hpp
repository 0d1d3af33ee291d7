/**
 * @file client_connection.hpp
 * @brief One TCP client: stream framing, decode loop and serialized writes
 * @version 1.0
 * @date 2026-10-19
 *
 * Lifecycle:
 * @code{.cpp}
 *   READING ──(peer close | read error | invalid input | close())──► CLOSING ──► CLOSED
 * @endcode
 *
 * In READING the reader thread blocks on the stream, appends each chunk to the
 * read buffer and decodes as many complete messages as the buffer holds. Every
 * decoded frame goes to the frame handler immediately and in arrival order.
 *
 * Leaving READING runs the close handler exactly once (the gateway uses it to
 * remove the client from its registry), then closes the stream under the write
 * mutex, so a concurrent send() either completes before the close or is refused.
 *
 * @copyright Copyright (c) 2026
 */

#pragma once

#include <atomic>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

#include "gateway_events.hpp"
#include "../codec/wire_codec.hpp"
#include "../io/tcp_stream.hpp"

namespace canlink {

    class ClientConnection {
        public:
            /// Called with (client id, frame) for each decoded frame
            using FrameHandler = std::function<void(std::uint64_t, const Frame&)>;
            /// Called with the client id when the connection leaves READING
            using CloseHandler = std::function<void(std::uint64_t)>;

            static constexpr std::size_t READ_CHUNK_SIZE = 4096;

            /**
             * @brief Construct a connection in READING state
             * @param id Gateway-unique client id
             * @param protocol Protocol fixed for the lifetime of the connection
             * @param stream Connected stream (ownership transferred)
             * @param codec Codec for protocol
             * @throws std::invalid_argument if stream or codec is null
             */
            ClientConnection(std::uint64_t id, Protocol protocol,
                std::unique_ptr<ITcpStream> stream,
                std::shared_ptr<const IWireCodec> codec);

            /**
             * @brief Destructor - closes the connection and joins the reader thread
             */
            ~ClientConnection();

            ClientConnection(const ClientConnection&) = delete;
            ClientConnection& operator=(const ClientConnection&) = delete;

            // Handlers must be set before start()/run()
            void set_frame_handler(FrameHandler handler) { frame_handler_ = std::move(handler); }
            void set_close_handler(CloseHandler handler) { close_handler_ = std::move(handler); }
            void set_event_callback(EventCallback callback) { event_callback_ = std::move(callback); }

            /**
             * @brief Spawn the reader thread running run()
             * @throws std::logic_error if already started
             */
            void start();

            /**
             * @brief Reader loop: read, decode, forward until the connection closes
             *
             * Runs on the caller's thread. Returns once the connection is CLOSED.
             */
            void run();

            /**
             * @brief Join the reader thread if it was started
             */
            void join();

            /**
             * @brief Send bytes to the client (serialized with other writers)
             * @param bytes Complete wire message
             * @return Status SUCCESS; DCLOSED if the connection is not READING;
             *         DWRITE_ERROR on a failed or partial write (the connection is
             *         then closed and CLIENT_WRITE_FAILURE reported)
             */
            Status send(const std::vector<std::uint8_t>& bytes);

            /**
             * @brief Request close from outside the reader thread
             *
             * Moves READING to CLOSING and shuts the stream down so a blocked
             * read returns. No-op when already closing.
             *
             * @param reason Reported in the CLIENT_DISCONNECTED event
             */
            void close(const std::string& reason);

            std::uint64_t get_id() const { return id_; }
            Protocol get_protocol() const { return protocol_; }
            ConnectionState get_state() const { return state_.load(); }
            bool is_reading() const { return state_.load() == ConnectionState::READING; }
            bool is_finished() const { return finished_.load(); }
            const std::string& get_peer_address() const { return peer_address_; }

            std::uint64_t frames_decoded() const { return frames_decoded_.load(); }
            std::uint64_t messages_skipped() const { return messages_skipped_.load(); }

        private:
            std::uint64_t id_;
            Protocol protocol_;
            std::unique_ptr<ITcpStream> stream_;
            std::shared_ptr<const IWireCodec> codec_;
            std::string peer_address_;

            std::atomic<ConnectionState> state_{ConnectionState::READING};
            std::atomic<bool> finished_{false};
            std::vector<std::uint8_t> read_buffer_;  // Reader thread only

            std::mutex write_mutex_;
            std::mutex reason_mutex_;
            std::string close_reason_;

            std::thread reader_thread_;

            std::atomic<std::uint64_t> frames_decoded_{0};
            std::atomic<std::uint64_t> messages_skipped_{0};

            FrameHandler frame_handler_;
            CloseHandler close_handler_;
            EventCallback event_callback_;

            /**
             * @brief Decode and dispatch every complete message in the buffer
             * @return bool False if the input is invalid and the client must be closed
             */
            bool process_buffer();

            /**
             * @brief Record the first close reason and leave READING
             */
            void begin_close(const std::string& reason);

            /**
             * @brief CLOSING -> CLOSED: close handler, stream close, disconnect event
             */
            void finish();

            void report(EventKind kind, Status status, const std::string& detail);
    };

} // namespace canlink
