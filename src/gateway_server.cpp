/**
 * @file gateway_server.cpp
 * @brief Gateway server implementation
 * @version 1.0
 * @date 2026-10-19
 */

#include <cerrno>
#include <cstdio>
#include <cstring>
#include <iostream>
#include <poll.h>
#include <stdexcept>

#include "../include/pattern/gateway_server.hpp"
#include "../include/io/socketcan_transport.hpp"
#include "../include/exception/canlink_exception.hpp"

namespace canlink {

    // === Constructor / Factory / Destructor ===

    GatewayServer::GatewayServer(const GatewayConfig& config, std::unique_ptr<BusAdapter> adapter)
        : config_(config), adapter_(std::move(adapter)) {
        config_.validate();
        if (!adapter_) {
            throw std::invalid_argument("GatewayServer: bus adapter cannot be null");
        }

        compact_codec_ = make_codec(Protocol::COMPACT);
        structured_codec_ = make_codec(Protocol::STRUCTURED, config_.max_structured_message_bytes);
        event_callback_ = log_event;

        adapter_->set_overflow_callback([this](std::uint64_t dropped_total) {
                GatewayEvent event;
                event.kind = EventKind::BUS_QUEUE_OVERFLOW;
                event.status = Status::BUS_QUEUE_OVERFLOW;
                event.detail = "dropped oldest bus frame (" + std::to_string(dropped_total) +
                    " total)";
                report(event);
            });

        for (const auto& endpoint : config_.endpoints) {
            listeners_.push_back(std::make_unique<TcpListener>(endpoint.host, endpoint.port));
            std::fprintf(stdout, "[CLIENT] Listening on %s:%u (%s)\n", endpoint.host.c_str(),
                static_cast<unsigned>(listeners_.back()->get_bound_port()),
                to_string(endpoint.protocol).c_str());
        }
    }

    std::unique_ptr<GatewayServer> GatewayServer::create(const GatewayConfig& config) {
        config.validate();
        auto transport = std::make_unique<SocketCANTransport>(config.bus_interface,
                static_cast<int>(config.bus_read_timeout_ms), config.receive_own_frames);
        auto adapter = std::make_unique<BusAdapter>(std::move(transport),
                config.rx_queue_capacity);
        return std::make_unique<GatewayServer>(config, std::move(adapter));
    }

    GatewayServer::~GatewayServer() {
        stop();
        for (auto& listener : listeners_) {
            listener->close();
        }
    }

    // === Lifecycle ===

    void GatewayServer::start() {
        bool expected = false;
        if (!running_.compare_exchange_strong(expected, true)) {
            throw std::logic_error("Gateway is already running");
        }

        try {
            adapter_->start();
        } catch (...) {
            running_.store(false);
            throw;
        }

        if (config_.send_test_frame) {
            auto result = adapter_->send_test_frame();
            if (result) {
                std::fprintf(stdout, "[BUS] Test frame sent on %s\n",
                    adapter_->get_channel_name().c_str());
            } else {
                GatewayEvent event;
                event.kind = EventKind::BUS_SEND_FAILURE;
                event.status = result.error();
                event.detail = "test frame: " + result.describe();
                report(event);
            }
        }

        accept_thread_ = std::thread(&GatewayServer::accept_loop, this);
        fanout_thread_ = std::thread(&GatewayServer::fanout_loop, this);
    }

    void GatewayServer::stop() {
        if (!running_.exchange(false)) {
            return; // Already stopped
        }

        // Wakes the fan-out thread
        adapter_->stop();

        if (accept_thread_.joinable()) {
            accept_thread_.join();
        }
        if (fanout_thread_.joinable()) {
            fanout_thread_.join();
        }

        for (const auto& client : registry_.snapshot()) {
            client->close("gateway stopping");
        }
        reap_connections(true);
    }

    // === Accepting ===

    void GatewayServer::accept_loop() {
        std::vector<struct pollfd> fds(listeners_.size());
        for (std::size_t i = 0; i < listeners_.size(); ++i) {
            fds[i].fd = listeners_[i]->get_fd();
            fds[i].events = POLLIN;
        }

        while (running_.load()) {
            reap_connections(false);

            for (auto& pfd : fds) {
                pfd.revents = 0;
            }
            int ret = ::poll(fds.data(), fds.size(), static_cast<int>(config_.accept_poll_timeout_ms));
            if (ret < 0) {
                if (errno != EINTR) {
                    std::cerr << "[CLIENT] poll() error: " << std::strerror(errno) << std::endl;
                }
                continue;
            }
            if (ret == 0) {
                // Timeout - continue to check running_ flag
                continue;
            }

            for (std::size_t i = 0; i < fds.size(); ++i) {
                if (!(fds[i].revents & POLLIN)) {
                    continue;
                }
                try {
                    while (auto stream = listeners_[i]->accept(
                                static_cast<int>(config_.client_write_timeout_ms))) {
                        add_client(std::move(stream), i);
                    }
                } catch (const DeviceException& e) {
                    std::cerr << "[CLIENT] Accept error: " << e.what() << std::endl;
                }
                catch (const std::exception& e) {
                    std::cerr << "[CLIENT] Client setup error: " << e.what() << std::endl;
                }
            }
        }
    }

    std::uint64_t GatewayServer::add_client(std::unique_ptr<ITcpStream> stream,
        std::size_t endpoint_index) {
        if (!stream) {
            throw std::invalid_argument("GatewayServer::add_client: stream cannot be null");
        }
        const EndpointConfig& endpoint = config_.endpoints.at(endpoint_index);
        if (!running_.load()) {
            throw std::logic_error("GatewayServer::add_client: gateway is not running");
        }

        std::string peer = stream->get_peer_address();
        Protocol protocol = config_.route_protocol(peer, endpoint.protocol);
        std::uint64_t id = next_client_id_.fetch_add(1);

        auto codec = protocol == Protocol::COMPACT ? compact_codec_ : structured_codec_;
        auto client = std::make_shared<ClientConnection>(id, protocol, std::move(stream), codec);

        client->set_frame_handler([this](std::uint64_t client_id, const Frame& frame) {
                on_client_frame(client_id, frame);
            });
        client->set_close_handler([this](std::uint64_t client_id) {
                if (registry_.remove(client_id)) {
                    stats_.clients_active.fetch_sub(1, std::memory_order_relaxed);
                }
            });
        client->set_event_callback([this](const GatewayEvent& event) {
                report(event);
            });

        registry_.add(client);
        stats_.clients_accepted.fetch_add(1, std::memory_order_relaxed);
        stats_.clients_active.fetch_add(1, std::memory_order_relaxed);
        {
            std::lock_guard<std::mutex> lock(connections_mutex_);
            connections_.push_back(client);
        }

        GatewayEvent event;
        event.kind = EventKind::CLIENT_CONNECTED;
        event.client_id = id;
        event.detail = peer + " on " + endpoint.host + ":" + std::to_string(endpoint.port) +
            " (" + to_string(protocol) + ")";
        report(event);

        try {
            client->start();
        } catch (...) {
            if (registry_.remove(id)) {
                stats_.clients_active.fetch_sub(1, std::memory_order_relaxed);
            }
            throw;
        }
        return id;
    }

    void GatewayServer::reap_connections(bool all) {
        std::vector<std::shared_ptr<ClientConnection> > done;
        {
            std::lock_guard<std::mutex> lock(connections_mutex_);
            auto it = connections_.begin();
            while (it != connections_.end()) {
                if (all || (*it)->is_finished()) {
                    done.push_back(*it);
                    it = connections_.erase(it);
                } else {
                    ++it;
                }
            }
        }
        for (auto& client : done) {
            client->join();
        }
    }

    // === Client -> Bus ===

    void GatewayServer::on_client_frame(std::uint64_t client_id, const Frame& frame) {
        stats_.client_rx_frames.fetch_add(1, std::memory_order_relaxed);

        auto result = adapter_->forward(frame);
        if (!result) {
            stats_.bus_tx_errors.fetch_add(1, std::memory_order_relaxed);
            GatewayEvent event;
            event.kind = EventKind::BUS_SEND_FAILURE;
            event.client_id = client_id;
            event.status = result.error();
            event.detail = frame.to_string() + " " + result.describe();
            report(event);
            return;
        }

        stats_.bus_tx_frames.fetch_add(1, std::memory_order_relaxed);
        if (client_to_bus_callback_) {
            client_to_bus_callback_(client_id, frame);
        }
    }

    // === Bus -> Clients ===

    void GatewayServer::fanout_loop() {
        auto timeout = std::chrono::milliseconds(config_.accept_poll_timeout_ms);
        while (running_.load()) {
            auto received = adapter_->wait_received(timeout);
            if (!received) {
                continue;
            }
            broadcast(received->frame);
        }
    }

    std::size_t GatewayServer::broadcast(const Frame& frame) {
        std::vector<std::uint8_t> bytes;
        try {
            bytes = compact_codec_->encode(frame);
        } catch (const ProtocolException& e) {
            std::cerr << "[BUS] Cannot encode frame for clients: " << e.what() << std::endl;
            return 0;
        }

        stats_.bus_rx_frames.fetch_add(1, std::memory_order_relaxed);

        std::size_t delivered = 0;
        for (const auto& client : registry_.snapshot()) {
            if (!client->is_reading()) {
                continue;
            }
            // A failed write closes only that client (reported by the connection)
            if (client->send(bytes) == Status::SUCCESS) {
                ++delivered;
            }
        }
        stats_.client_tx_frames.fetch_add(delivered, std::memory_order_relaxed);

        if (bus_to_client_callback_) {
            bus_to_client_callback_(frame, delivered);
        }
        return delivered;
    }

    // === Queries ===

    std::uint16_t GatewayServer::get_bound_port(std::size_t i) const {
        return listeners_.at(i)->get_bound_port();
    }

    GatewayStatisticsSnapshot GatewayServer::get_statistics() const {
        GatewayStatisticsSnapshot snapshot;

        snapshot.clients_accepted = stats_.clients_accepted.load(std::memory_order_relaxed);
        snapshot.clients_active = stats_.clients_active.load(std::memory_order_relaxed);
        snapshot.client_rx_frames = stats_.client_rx_frames.load(std::memory_order_relaxed);
        snapshot.bus_tx_frames = stats_.bus_tx_frames.load(std::memory_order_relaxed);
        snapshot.bus_tx_errors = stats_.bus_tx_errors.load(std::memory_order_relaxed);
        snapshot.bus_rx_frames = stats_.bus_rx_frames.load(std::memory_order_relaxed);
        snapshot.client_tx_frames = stats_.client_tx_frames.load(std::memory_order_relaxed);
        snapshot.client_write_errors = stats_.client_write_errors.load(std::memory_order_relaxed);
        snapshot.decode_errors = stats_.decode_errors.load(std::memory_order_relaxed);
        snapshot.truncated_frames = stats_.truncated_frames.load(std::memory_order_relaxed);
        snapshot.queue_overflows = stats_.queue_overflows.load(std::memory_order_relaxed);

        return snapshot;
    }

    // === Events ===

    void GatewayServer::report(const GatewayEvent& event) {
        switch (event.kind) {
        case EventKind::DECODE_INVALID:
            stats_.decode_errors.fetch_add(1, std::memory_order_relaxed);
            break;
        case EventKind::PAYLOAD_TRUNCATED:
            stats_.truncated_frames.fetch_add(1, std::memory_order_relaxed);
            break;
        case EventKind::CLIENT_WRITE_FAILURE:
            stats_.client_write_errors.fetch_add(1, std::memory_order_relaxed);
            break;
        case EventKind::BUS_QUEUE_OVERFLOW:
            stats_.queue_overflows.fetch_add(1, std::memory_order_relaxed);
            break;
        default:
            break;
        }

        if (event_callback_) {
            event_callback_(event);
        }
    }

} // namespace canlink
