/**
 * @file client_connection.cpp
 * @brief Client connection implementation
 * @version 1.0
 * @date 2026-10-19
 */

#include <cerrno>
#include <cstring>
#include <stdexcept>

#include "../include/pattern/client_connection.hpp"

namespace canlink {

    // === Constructor / Destructor ===

    ClientConnection::ClientConnection(std::uint64_t id, Protocol protocol,
        std::unique_ptr<ITcpStream> stream, std::shared_ptr<const IWireCodec> codec)
        : id_(id), protocol_(protocol), stream_(std::move(stream)), codec_(std::move(codec)) {
        if (!stream_) {
            throw std::invalid_argument("ClientConnection: stream cannot be null");
        }
        if (!codec_) {
            throw std::invalid_argument("ClientConnection: codec cannot be null");
        }
        peer_address_ = stream_->get_peer_address();
        read_buffer_.reserve(READ_CHUNK_SIZE);
    }

    ClientConnection::~ClientConnection() {
        if (reader_thread_.joinable()) {
            close("connection destroyed");
            if (reader_thread_.get_id() == std::this_thread::get_id()) {
                reader_thread_.detach();
            } else {
                reader_thread_.join();
            }
        }
    }

    // === Lifecycle ===

    void ClientConnection::start() {
        if (reader_thread_.joinable() || finished_.load()) {
            throw std::logic_error("ClientConnection already started");
        }
        reader_thread_ = std::thread(&ClientConnection::run, this);
    }

    void ClientConnection::join() {
        if (reader_thread_.joinable()) {
            reader_thread_.join();
        }
    }

    void ClientConnection::run() {
        if (finished_.load()) {
            return;
        }
        std::uint8_t chunk[READ_CHUNK_SIZE];

        while (state_.load() == ConnectionState::READING) {
            ssize_t n = stream_->read(chunk, sizeof(chunk));
            if (n == 0) {
                begin_close("peer closed connection");
                break;
            }
            if (n < 0) {
                begin_close("read error: " + std::string(std::strerror(errno)));
                break;
            }
            if (state_.load() != ConnectionState::READING) {
                // close() raced with this read; drop the input
                break;
            }

            read_buffer_.insert(read_buffer_.end(), chunk, chunk + n);

            try {
                if (!process_buffer()) {
                    break;
                }
            } catch (const std::exception& e) {
                report(EventKind::DECODE_INVALID, Status::UNKNOWN, e.what());
                begin_close(std::string("frame handler error: ") + e.what());
                break;
            }
        }

        finish();
    }

    bool ClientConnection::process_buffer() {
        std::size_t offset = 0;
        bool valid = true;

        while (offset < read_buffer_.size()) {
            if (state_.load() != ConnectionState::READING) {
                // Closed while dispatching; the rest of the buffer is dropped
                break;
            }
            span<const std::uint8_t> pending(read_buffer_.data() + offset,
                read_buffer_.size() - offset);
            auto result = codec_->try_decode(pending);

            if (!result) {
                if (result.error() == Status::WINCOMPLETE) {
                    break;  // Wait for more input
                }
                report(EventKind::DECODE_INVALID, result.error(), result.describe());
                begin_close("invalid " + codec_->name() + " input");
                valid = false;
                break;
            }

            const DecodeOutcome& outcome = result.value();
            offset += outcome.consumed;

            if (!outcome.frame) {
                messages_skipped_.fetch_add(1);
                continue;
            }
            if (outcome.truncated_bytes > 0) {
                report(EventKind::PAYLOAD_TRUNCATED, Status::WPAYLOAD_TRUNCATED,
                    "dropped " + std::to_string(outcome.truncated_bytes) + " bytes, forwarded " +
                    outcome.frame->to_string());
            }

            frames_decoded_.fetch_add(1);
            if (frame_handler_) {
                frame_handler_(id_, *outcome.frame);
            }
        }

        if (offset > 0) {
            read_buffer_.erase(read_buffer_.begin(),
                read_buffer_.begin() + static_cast<std::ptrdiff_t>(offset));
        }
        return valid;
    }

    // === Writes ===

    Status ClientConnection::send(const std::vector<std::uint8_t>& bytes) {
        {
            std::lock_guard<std::mutex> lock(write_mutex_);
            if (state_.load() != ConnectionState::READING) {
                return Status::DCLOSED;
            }

            ssize_t written = stream_->write(bytes.data(), bytes.size());
            if (written == static_cast<ssize_t>(bytes.size())) {
                return Status::SUCCESS;
            }

            std::string detail = written < 0
                ? "write error: " + std::string(std::strerror(errno))
                : "partial write: " + std::to_string(written) + " of " +
                std::to_string(bytes.size()) + " bytes";
            report(EventKind::CLIENT_WRITE_FAILURE, Status::DWRITE_ERROR, detail);
        }

        close("write failure");
        return Status::DWRITE_ERROR;
    }

    // === Closing ===

    void ClientConnection::close(const std::string& reason) {
        if (state_.load() != ConnectionState::READING) {
            return;
        }
        begin_close(reason);

        // finish() closes the stream under the same mutex
        std::lock_guard<std::mutex> lock(write_mutex_);
        if (state_.load() != ConnectionState::CLOSED) {
            stream_->shutdown();
        }
    }

    void ClientConnection::begin_close(const std::string& reason) {
        {
            std::lock_guard<std::mutex> lock(reason_mutex_);
            if (close_reason_.empty()) {
                close_reason_ = reason;
            }
        }
        ConnectionState expected = ConnectionState::READING;
        state_.compare_exchange_strong(expected, ConnectionState::CLOSING);
    }

    void ClientConnection::finish() {
        // Registry removal first so fan-out never sees a half-closed client
        if (close_handler_) {
            close_handler_(id_);
        }

        {
            std::lock_guard<std::mutex> lock(write_mutex_);
            stream_->close();
            state_.store(ConnectionState::CLOSED);
        }

        std::string reason;
        {
            std::lock_guard<std::mutex> lock(reason_mutex_);
            reason = close_reason_;
        }
        report(EventKind::CLIENT_DISCONNECTED, Status::SUCCESS,
            peer_address_ + " (" + reason + ")");
        finished_.store(true);
    }

    void ClientConnection::report(EventKind kind, Status status, const std::string& detail) {
        if (event_callback_) {
            GatewayEvent event;
            event.kind = kind;
            event.client_id = id_;
            event.status = status;
            event.detail = detail;
            event_callback_(event);
        }
    }

} // namespace canlink
