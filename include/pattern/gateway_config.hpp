/**
 * @file gateway_config.hpp
 * @brief Configuration structure for the TCP-to-CAN gateway
 * @version 1.0
 * @date 2026-10-19
 *
 * Supports multiple configuration sources:
 * 1. JSON file parsing (config/gateway_config.json) - Recommended
 * 2. Environment variables (CANLINK_*)
 * 3. Programmatic defaults
 * 4. Direct construction
 *
 * Priority: Environment variables > JSON file > Defaults
 *
 * @copyright Copyright (c) 2026
 */

#pragma once

#include <string>
#include <cstdint>
#include <optional>
#include <map>
#include <vector>

#include <nlohmann/json.hpp>

#include "../enums/protocol.hpp"

namespace canlink {

    /**
     * @brief One listening endpoint and the protocol its clients speak by default
     */
    struct EndpointConfig {
        std::string host;
        std::uint16_t port = 0;
        Protocol protocol = DEFAULT_PROTOCOL;

        bool operator==(const EndpointConfig& other) const {
            return host == other.host && port == other.port && protocol == other.protocol;
        }
    };

    /**
     * @brief Peer routing rule: clients whose address starts with prefix use protocol
     */
    struct PeerRule {
        std::string prefix;
        Protocol protocol = DEFAULT_PROTOCOL;

        bool operator==(const PeerRule& other) const {
            return prefix == other.prefix && protocol == other.protocol;
        }
    };

    /**
     * @brief Configuration for the gateway
     *
     * Environment Variables:
     *
     * - CANLINK_ENDPOINTS: "host:port:protocol,..." (default:
     *   "127.0.0.1:5000:structured,127.0.0.1:5001:compact")
     *
     * - CANLINK_PEER_RULES: "prefix=protocol,..." (default: "192.0.2.=compact")
     *
     * - CANLINK_BUS_INTERFACE: SocketCAN interface name (default: "vcan0")
     *
     * - CANLINK_BUS_READ_TIMEOUT: Bus receive timeout in ms (default: 100)
     *
     * - CANLINK_RECEIVE_OWN_FRAMES: Loop back own frames (true/false, default: true)
     *
     * - CANLINK_RX_QUEUE_CAPACITY: Bus-to-client hand-off queue size (default: 256)
     *
     * - CANLINK_ACCEPT_POLL_TIMEOUT: Accept loop poll timeout in ms (default: 100)
     *
     * - CANLINK_CLIENT_WRITE_TIMEOUT: Client send timeout in ms (default: 1000)
     *
     * - CANLINK_MAX_STRUCTURED_BYTES: Largest structured record (default: 65536)
     *
     * - CANLINK_SEND_TEST_FRAME: Send a connectivity frame at startup (default: false)
     */
    struct GatewayConfig {
        // === Network Configuration ===
        std::vector<EndpointConfig> endpoints;
        std::vector<PeerRule> peer_rules;

        // === Bus ===
        std::string bus_interface = "vcan0";
        std::uint32_t bus_read_timeout_ms = 100;
        bool receive_own_frames = true;
        std::uint32_t rx_queue_capacity = 256;

        // === Client Handling ===
        std::uint32_t accept_poll_timeout_ms = 100;
        std::uint32_t client_write_timeout_ms = 1000;
        std::uint32_t max_structured_message_bytes = 65536;

        // === Startup ===
        bool send_test_frame = false;

        /**
         * @brief Pick the protocol for a new client
         * @param peer_address Remote IPv4 address
         * @param endpoint_default Protocol of the endpoint that accepted it
         * @return Protocol of the first peer rule whose prefix matches, else endpoint_default
         */
        Protocol route_protocol(const std::string& peer_address, Protocol endpoint_default) const;

        /**
         * @brief Validate configuration
         * @throws std::invalid_argument if config is invalid
         */
        void validate() const;

        /**
         * @brief Create default configuration
         * @return GatewayConfig with sensible defaults
         */
        static GatewayConfig create_default();

        /**
         * @brief Load configuration from JSON file
         * @param filepath Path to JSON file (e.g., gateway_config.json)
         * @param use_defaults If true, merge with defaults; if false, only use JSON values
         * @return GatewayConfig loaded from JSON file
         * @throws std::runtime_error if file cannot be read or parsed
         */
        static GatewayConfig from_file(const std::string& filepath, bool use_defaults = true);

        /**
         * @brief Load configuration from JSON object
         * @param j JSON object containing gateway_config
         * @param use_defaults If true, start from create_default()
         * @return GatewayConfig loaded from JSON
         * @throws std::invalid_argument if a value is malformed
         * @throws nlohmann::json::exception if a value has the wrong JSON type
         */
        static GatewayConfig from_json(const nlohmann::json& j, bool use_defaults = true);

        /**
         * @brief Load configuration with priority: env vars > JSON file > defaults
         * @param config_file_path Optional path to JSON config file
         * @return GatewayConfig with merged settings
         */
        static GatewayConfig load(const std::optional<std::string>& config_file_path = std::nullopt);

        /**
         * @brief Parse "host:port[:protocol],..." into endpoints
         * @throws std::invalid_argument on malformed entries
         */
        static std::vector<EndpointConfig> parse_endpoints(const std::string& text);

        /**
         * @brief Parse "prefix=protocol,..." into peer rules
         * @throws std::invalid_argument on malformed entries
         */
        static std::vector<PeerRule> parse_peer_rules(const std::string& text);

        private:
            /**
             * @brief Apply configuration from key-value map
             * @param config Configuration to update
             * @param vars Key-value pairs (CANLINK_* keys)
             */
            static void apply_config_map(GatewayConfig& config,
                const std::map<std::string, std::string>& vars);
    };

} // namespace canlink
