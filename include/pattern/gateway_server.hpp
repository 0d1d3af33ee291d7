/**
 * @file gateway_server.hpp
 * @brief TCP-to-CAN gateway: listeners, client routing and bus fan-out
 * @version 1.0
 * @date 2026-10-19
 *
 * Accepts TCP clients on every configured endpoint, fixes each client's wire
 * protocol at accept time, forwards decoded frames to the bus and fans every
 * bus frame out to all live clients.
 *
 * @copyright Copyright (c) 2026
 */

#pragma once

#include <string>
#include <memory>
#include <atomic>
#include <thread>
#include <mutex>
#include <sstream>
#include <iomanip>
#include <functional>
#include <vector>

#include "gateway_config.hpp"
#include "gateway_events.hpp"
#include "client_connection.hpp"
#include "client_registry.hpp"
#include "bus_adapter.hpp"
#include "../codec/compact_codec.hpp"
#include "../io/tcp_listener.hpp"

namespace canlink {

    /**
     * @brief Non-atomic snapshot of gateway statistics
     */
    struct GatewayStatisticsSnapshot {
        uint64_t clients_accepted = 0;
        uint64_t clients_active = 0;
        uint64_t client_rx_frames = 0;
        uint64_t bus_tx_frames = 0;
        uint64_t bus_tx_errors = 0;
        uint64_t bus_rx_frames = 0;
        uint64_t client_tx_frames = 0;
        uint64_t client_write_errors = 0;
        uint64_t decode_errors = 0;
        uint64_t truncated_frames = 0;
        uint64_t queue_overflows = 0;

        /**
         * @brief Get human-readable statistics string
         * @return std::string Formatted statistics
         */
        std::string to_string() const {
            std::ostringstream oss;
            oss << "Gateway Statistics:\n"
                << "  Clients:       " << std::setw(10) << clients_active << " active, "
                << clients_accepted << " accepted\n"
                << "  Client RX:     " << std::setw(10) << client_rx_frames << " frames\n"
                << "  Bus TX:        " << std::setw(10) << bus_tx_frames << " frames\n"
                << "  Bus RX:        " << std::setw(10) << bus_rx_frames << " frames\n"
                << "  Client TX:     " << std::setw(10) << client_tx_frames << " writes\n"
                << "  Bus TX Errors: " << std::setw(10) << bus_tx_errors << "\n"
                << "  Write Errors:  " << std::setw(10) << client_write_errors << "\n"
                << "  Decode Errors: " << std::setw(10) << decode_errors << "\n"
                << "  Truncated:     " << std::setw(10) << truncated_frames << "\n"
                << "  Overflows:     " << std::setw(10) << queue_overflows;
            return oss.str();
        }
    };

    /**
     * @brief Gateway counters
     *
     * All counters are atomic for thread-safe updates.
     * Use GatewayServer::get_statistics() to get a non-atomic snapshot.
     */
    struct GatewayStatistics {
        std::atomic<uint64_t> clients_accepted{0};     ///< Connections accepted
        std::atomic<uint64_t> clients_active{0};       ///< Connections in the registry
        std::atomic<uint64_t> client_rx_frames{0};     ///< Frames decoded from clients
        std::atomic<uint64_t> bus_tx_frames{0};        ///< Frames accepted by the transport
        std::atomic<uint64_t> bus_tx_errors{0};        ///< Frames refused by the transport
        std::atomic<uint64_t> bus_rx_frames{0};        ///< Bus frames fanned out
        std::atomic<uint64_t> client_tx_frames{0};     ///< Successful client writes
        std::atomic<uint64_t> client_write_errors{0};  ///< Failed client writes
        std::atomic<uint64_t> decode_errors{0};        ///< Clients closed for invalid input
        std::atomic<uint64_t> truncated_frames{0};     ///< Frames cut to 64 bytes
        std::atomic<uint64_t> queue_overflows{0};      ///< Bus frames dropped before fan-out

        /**
         * @brief Reset all counters except clients_active
         */
        void reset() {
            clients_accepted.store(0, std::memory_order_relaxed);
            client_rx_frames.store(0, std::memory_order_relaxed);
            bus_tx_frames.store(0, std::memory_order_relaxed);
            bus_tx_errors.store(0, std::memory_order_relaxed);
            bus_rx_frames.store(0, std::memory_order_relaxed);
            client_tx_frames.store(0, std::memory_order_relaxed);
            client_write_errors.store(0, std::memory_order_relaxed);
            decode_errors.store(0, std::memory_order_relaxed);
            truncated_frames.store(0, std::memory_order_relaxed);
            queue_overflows.store(0, std::memory_order_relaxed);
        }
    };

    /**
     * @brief TCP-to-CAN gateway server
     *
     * ## Architecture
     *
     * @code{.cpp}
     * ┌────────────────────────────────────────────────────────────┐
     * │                      GatewayServer                         │
     * │                                                            │
     * │  Accept thread        Reader thread (1 per client)         │
     * │  ┌──────────────┐     ┌──────────────────────────────┐     │
     * │  │ poll()       │     │ read -> decode -> forward()  │───► bus
     * │  │ accept/route │     └──────────────────────────────┘     │
     * │  │ reap closed  │                                          │
     * │  └──────────────┘     Fan-out thread                       │
     * │                       ┌──────────────────────────────┐     │
     * │  bus ──► BusAdapter ─►│ wait_received -> broadcast() │───► clients
     * │     (bounded queue)   └──────────────────────────────┘     │
     * └────────────────────────────────────────────────────────────┘
     * @endcode
     *
     * ## Thread Safety
     *
     * - The registry is the only structure shared by accept, reader and
     *   fan-out threads; broadcast() iterates a snapshot taken under its lock.
     * - Statistics are relaxed atomics.
     * - Callbacks must be installed before start(); they are invoked from
     *   reader, fan-out and transport threads.
     *
     * ## Fan-out
     *
     * Bus frames are always encoded with the compact codec and written to every
     * live client, whatever protocol it speaks.
     */
    class GatewayServer {
        public:
            /// (client id, frame) after a client frame was accepted by the bus
            using ClientToBusCallback = std::function<void(std::uint64_t, const Frame&)>;
            /// (frame, number of clients written) after a bus frame was fanned out
            using BusToClientCallback = std::function<void(const Frame&, std::size_t)>;

            /**
             * @brief Constructor with dependency injection
             *
             * Validates the configuration and binds every endpoint.
             *
             * @param config Gateway configuration
             * @param adapter Bus adapter (owning a real or mock transport)
             * @throws std::invalid_argument if config is invalid or adapter is null
             * @throws DeviceException if an endpoint cannot be bound
             */
            GatewayServer(const GatewayConfig& config, std::unique_ptr<BusAdapter> adapter);

            /**
             * @brief Factory method to create a gateway on a SocketCAN interface
             * @param config Gateway configuration
             * @return std::unique_ptr<GatewayServer> Configured gateway ready to start
             * @throws DeviceException if the bus interface or an endpoint is unavailable
             * @throws std::invalid_argument if config is invalid
             */
            static std::unique_ptr<GatewayServer> create(const GatewayConfig& config);

            /**
             * @brief Destructor - stops all threads and closes every socket
             */
            ~GatewayServer();

            GatewayServer(const GatewayServer&) = delete;
            GatewayServer& operator=(const GatewayServer&) = delete;

            /**
             * @brief Start the bus adapter, accept thread and fan-out thread
             * @throws std::logic_error if already running
             */
            void start();

            /**
             * @brief Stop accepting, close every client and join all threads
             */
            void stop();

            bool is_running() const { return running_.load(); }

            /**
             * @brief Encode a frame once (compact) and write it to every live client
             * @param frame Bus frame
             * @return std::size_t Number of clients the frame was written to
             */
            std::size_t broadcast(const Frame& frame);

            /**
             * @brief Adopt a connected stream as if it was accepted on endpoint i
             *
             * The protocol is routed from the endpoint default and the peer rules,
             * then the client is registered and its reader thread started. The
             * accept loop hands every accepted socket to this method.
             *
             * @param stream Connected stream (ownership transferred)
             * @param endpoint Index of the configured endpoint
             * @return std::uint64_t Id assigned to the client
             * @throws std::invalid_argument if stream is null
             * @throws std::out_of_range if endpoint is not configured
             * @throws std::logic_error if the gateway is not running
             */
            std::uint64_t add_client(std::unique_ptr<ITcpStream> stream, std::size_t endpoint);

            /**
             * @brief Port bound for endpoint i (resolves port 0)
             * @throws std::out_of_range if i is not a configured endpoint
             */
            std::uint16_t get_bound_port(std::size_t i) const;

            std::size_t get_endpoint_count() const { return listeners_.size(); }
            std::size_t get_client_count() const { return registry_.size(); }
            const GatewayConfig& get_config() const { return config_; }
            BusAdapter& get_bus_adapter() { return *adapter_; }

            /**
             * @brief Get statistics snapshot
             */
            GatewayStatisticsSnapshot get_statistics() const;

            void reset_statistics() { stats_.reset(); }

            /**
             * @brief Set the event sink (default: log_event)
             */
            void set_event_callback(EventCallback callback) {
                event_callback_ = std::move(callback);
            }

            void set_client_to_bus_callback(ClientToBusCallback callback) {
                client_to_bus_callback_ = std::move(callback);
            }

            void set_bus_to_client_callback(BusToClientCallback callback) {
                bus_to_client_callback_ = std::move(callback);
            }

        private:
            // === Configuration ===
            GatewayConfig config_;

            // === Bus ===
            std::unique_ptr<BusAdapter> adapter_;

            // === Clients ===
            std::vector<std::unique_ptr<TcpListener> > listeners_;
            ClientRegistry registry_;
            std::atomic<std::uint64_t> next_client_id_{1};
            std::shared_ptr<const IWireCodec> compact_codec_;
            std::shared_ptr<const IWireCodec> structured_codec_;

            // Every started connection until its reader thread is joined
            std::mutex connections_mutex_;
            std::vector<std::shared_ptr<ClientConnection> > connections_;

            // === Statistics ===
            GatewayStatistics stats_;

            // === Threading ===
            std::atomic<bool> running_{false};
            std::thread accept_thread_;
            std::thread fanout_thread_;

            // === Callbacks ===
            EventCallback event_callback_;
            ClientToBusCallback client_to_bus_callback_;
            BusToClientCallback bus_to_client_callback_;

            /**
             * @brief Accept loop (runs in accept_thread_)
             *
             * Polls every listener with accept_poll_timeout_ms, accepts pending
             * connections and joins connections that have finished.
             */
            void accept_loop();

            /**
             * @brief Fan-out loop (runs in fanout_thread_)
             */
            void fanout_loop();

            /**
             * @brief Frame decoded from a client: forward to the bus
             */
            void on_client_frame(std::uint64_t client_id, const Frame& frame);

            /**
             * @brief Join and drop connections whose reader thread has exited
             * @param all Join every connection (used by stop())
             */
            void reap_connections(bool all);

            /**
             * @brief Update counters and pass the event to the sink
             */
            void report(const GatewayEvent& event);
    };

} // namespace canlink
