/**
 * @file gateway_config.cpp
 * @brief Configuration structure implementation
 * @version 1.0
 * @date 2026-10-19
 */

#include <cstdlib>
#include <fstream>
#include <sstream>
#include <algorithm>
#include <set>
#include <stdexcept>

#include <nlohmann/json.hpp>

#include "../include/pattern/gateway_config.hpp"

using json = nlohmann::json;

namespace canlink {

    namespace {

        // Keys understood by apply_config_map(), also read from the environment
        const char* const CONFIG_KEYS[] = {
            "CANLINK_ENDPOINTS",
            "CANLINK_PEER_RULES",
            "CANLINK_BUS_INTERFACE",
            "CANLINK_BUS_READ_TIMEOUT",
            "CANLINK_RECEIVE_OWN_FRAMES",
            "CANLINK_RX_QUEUE_CAPACITY",
            "CANLINK_ACCEPT_POLL_TIMEOUT",
            "CANLINK_CLIENT_WRITE_TIMEOUT",
            "CANLINK_MAX_STRUCTURED_BYTES",
            "CANLINK_SEND_TEST_FRAME"
        };

        constexpr std::uint32_t MAX_TIMEOUT_MS = 60000;
        constexpr std::uint32_t MIN_STRUCTURED_BYTES = 64;
        constexpr std::uint32_t MAX_STRUCTURED_BYTES = 16u * 1024u * 1024u;

        std::vector<std::string> split(const std::string& text, char sep) {
            std::vector<std::string> parts;
            std::stringstream ss(text);
            std::string item;
            while (std::getline(ss, item, sep)) {
                parts.push_back(item);
            }
            return parts;
        }

        std::string trim(const std::string& s) {
            auto begin = s.find_first_not_of(" \t");
            if (begin == std::string::npos) return "";
            auto end = s.find_last_not_of(" \t");
            return s.substr(begin, end - begin + 1);
        }

        Protocol parse_protocol(const std::string& name) {
            bool use_default = false;
            Protocol protocol = protocol_from_string(trim(name), use_default);
            if (use_default) {
                throw std::invalid_argument("Invalid protocol: " + name);
            }
            return protocol;
        }

        std::uint32_t parse_u32(const std::string& key, const std::string& value) {
            try {
                std::size_t pos = 0;
                unsigned long parsed = std::stoul(value, &pos, 0);  // Support hex (0x...)
                if (pos != value.size() || parsed > 0xFFFFFFFFul) {
                    throw std::out_of_range(value);
                }
                return static_cast<std::uint32_t>(parsed);
            } catch (const std::logic_error&) {
                throw std::invalid_argument("Invalid value for " + key + ": " + value);
            }
        }

        bool parse_bool(const std::string& value) {
            std::string v = value;
            std::transform(v.begin(), v.end(), v.begin(), ::tolower);
            return v == "true" || v == "1" || v == "yes";
        }

    } // namespace

    // === Routing ===

    Protocol GatewayConfig::route_protocol(const std::string& peer_address,
        Protocol endpoint_default) const {
        for (const auto& rule : peer_rules) {
            if (peer_address.compare(0, rule.prefix.size(), rule.prefix) == 0) {
                return rule.protocol;
            }
        }
        return endpoint_default;
    }

    // === Configuration Validation ===

    void GatewayConfig::validate() const {
        if (endpoints.empty()) {
            throw std::invalid_argument("At least one listening endpoint is required");
        }

        std::set<std::string> seen;
        for (const auto& ep : endpoints) {
            if (ep.host.empty()) {
                throw std::invalid_argument("Endpoint host cannot be empty");
            }
            std::string key = ep.host + ":" + std::to_string(ep.port);
            // Port 0 endpoints get distinct ephemeral ports
            if (ep.port != 0 && !seen.insert(key).second) {
                throw std::invalid_argument("Duplicate endpoint " + key);
            }
        }

        for (const auto& rule : peer_rules) {
            if (rule.prefix.empty()) {
                throw std::invalid_argument("Peer rule prefix cannot be empty");
            }
        }

        if (bus_interface.empty()) {
            throw std::invalid_argument("Bus interface name cannot be empty");
        }

        // Validate timeouts
        if (bus_read_timeout_ms == 0 || bus_read_timeout_ms > MAX_TIMEOUT_MS) {
            throw std::invalid_argument("Bus read timeout must be 1-60000ms");
        }
        if (accept_poll_timeout_ms == 0 || accept_poll_timeout_ms > MAX_TIMEOUT_MS) {
            throw std::invalid_argument("Accept poll timeout must be 1-60000ms");
        }
        if (client_write_timeout_ms == 0 || client_write_timeout_ms > MAX_TIMEOUT_MS) {
            throw std::invalid_argument("Client write timeout must be 1-60000ms");
        }

        if (rx_queue_capacity == 0) {
            throw std::invalid_argument("RX queue capacity must be > 0");
        }
        if (max_structured_message_bytes < MIN_STRUCTURED_BYTES ||
            max_structured_message_bytes > MAX_STRUCTURED_BYTES) {
            throw std::invalid_argument("Structured message limit must be 64 bytes to 16 MiB");
        }
    }

    // === Factory Methods ===

    GatewayConfig GatewayConfig::create_default() {
        GatewayConfig config;
        config.endpoints = {
            {"127.0.0.1", 5000, Protocol::STRUCTURED},
            {"127.0.0.1", 5001, Protocol::COMPACT}
        };
        config.peer_rules = {
            {"192.0.2.", Protocol::COMPACT}
        };
        config.bus_interface = "vcan0";
        config.bus_read_timeout_ms = 100;
        config.receive_own_frames = true;
        config.rx_queue_capacity = 256;
        config.accept_poll_timeout_ms = 100;
        config.client_write_timeout_ms = 1000;
        config.max_structured_message_bytes = 65536;
        config.send_test_frame = false;
        return config;
    }

    // === List Parsing ===

    std::vector<EndpointConfig> GatewayConfig::parse_endpoints(const std::string& text) {
        std::vector<EndpointConfig> endpoints;
        for (const auto& entry : split(text, ',')) {
            std::string item = trim(entry);
            if (item.empty()) continue;

            auto fields = split(item, ':');
            if (fields.size() < 2 || fields.size() > 3) {
                throw std::invalid_argument("Invalid endpoint '" + item +
                    "' (expected host:port[:protocol])");
            }

            EndpointConfig ep;
            ep.host = trim(fields[0]);
            std::uint32_t port = parse_u32("endpoint port", trim(fields[1]));
            if (port > 65535) {
                throw std::invalid_argument("Endpoint port out of range: " + fields[1]);
            }
            ep.port = static_cast<std::uint16_t>(port);
            ep.protocol = fields.size() == 3 ? parse_protocol(fields[2]) : DEFAULT_PROTOCOL;
            endpoints.push_back(ep);
        }
        return endpoints;
    }

    std::vector<PeerRule> GatewayConfig::parse_peer_rules(const std::string& text) {
        std::vector<PeerRule> rules;
        for (const auto& entry : split(text, ',')) {
            std::string item = trim(entry);
            if (item.empty()) continue;

            auto eq = item.find('=');
            if (eq == std::string::npos) {
                throw std::invalid_argument("Invalid peer rule '" + item +
                    "' (expected prefix=protocol)");
            }
            rules.push_back({trim(item.substr(0, eq)), parse_protocol(item.substr(eq + 1))});
        }
        return rules;
    }

    // === JSON File Parsing ===

    GatewayConfig GatewayConfig::from_json(const json& j, bool use_defaults) {
        GatewayConfig config = use_defaults ? create_default() : GatewayConfig{};

        // Convert JSON to string map to reuse apply_config_map logic
        std::map<std::string, std::string> config_map;

        if (j.contains("gateway_config")) {
            const auto& gc = j["gateway_config"];

            if (gc.contains("endpoints")) {
                std::string text;
                for (const auto& ep : gc["endpoints"]) {
                    if (!text.empty()) text += ",";
                    text += ep["host"].get<std::string>() + ":" +
                        std::to_string(ep["port"].get<std::uint32_t>()) + ":" +
                        ep.value("protocol", to_string(DEFAULT_PROTOCOL));
                }
                config_map["CANLINK_ENDPOINTS"] = text;
            }
            if (gc.contains("peer_rules")) {
                std::string text;
                for (const auto& rule : gc["peer_rules"]) {
                    if (!text.empty()) text += ",";
                    text += rule["prefix"].get<std::string>() + "=" +
                        rule["protocol"].get<std::string>();
                }
                config_map["CANLINK_PEER_RULES"] = text;
            }
            if (gc.contains("bus_interface")) {
                config_map["CANLINK_BUS_INTERFACE"] = gc["bus_interface"].get<std::string>();
            }
            if (gc.contains("bus_read_timeout_ms")) {
                config_map["CANLINK_BUS_READ_TIMEOUT"] =
                    std::to_string(gc["bus_read_timeout_ms"].get<std::uint32_t>());
            }
            if (gc.contains("receive_own_frames")) {
                config_map["CANLINK_RECEIVE_OWN_FRAMES"] =
                    gc["receive_own_frames"].get<bool>() ? "true" : "false";
            }
            if (gc.contains("rx_queue_capacity")) {
                config_map["CANLINK_RX_QUEUE_CAPACITY"] =
                    std::to_string(gc["rx_queue_capacity"].get<std::uint32_t>());
            }
            if (gc.contains("accept_poll_timeout_ms")) {
                config_map["CANLINK_ACCEPT_POLL_TIMEOUT"] =
                    std::to_string(gc["accept_poll_timeout_ms"].get<std::uint32_t>());
            }
            if (gc.contains("client_write_timeout_ms")) {
                config_map["CANLINK_CLIENT_WRITE_TIMEOUT"] =
                    std::to_string(gc["client_write_timeout_ms"].get<std::uint32_t>());
            }
            if (gc.contains("max_structured_message_bytes")) {
                config_map["CANLINK_MAX_STRUCTURED_BYTES"] =
                    std::to_string(gc["max_structured_message_bytes"].get<std::uint32_t>());
            }
            if (gc.contains("send_test_frame")) {
                config_map["CANLINK_SEND_TEST_FRAME"] =
                    gc["send_test_frame"].get<bool>() ? "true" : "false";
            }
        }

        // Reuse existing parsing logic
        apply_config_map(config, config_map);

        return config;
    }

    // === Configuration Application ===

    void GatewayConfig::apply_config_map(GatewayConfig& config,
        const std::map<std::string, std::string>& vars) {
        auto get_val = [&vars](const std::string& key) -> std::optional<std::string> {
                auto it = vars.find(key);
                if (it != vars.end()) {
                    return it->second;
                }
                return std::nullopt;
            };

        // Apply lists
        if (auto val = get_val("CANLINK_ENDPOINTS")) {
            config.endpoints = parse_endpoints(*val);
        }
        if (auto val = get_val("CANLINK_PEER_RULES")) {
            config.peer_rules = parse_peer_rules(*val);
        }

        // Apply bus settings
        if (auto val = get_val("CANLINK_BUS_INTERFACE")) {
            config.bus_interface = *val;
        }
        if (auto val = get_val("CANLINK_BUS_READ_TIMEOUT")) {
            config.bus_read_timeout_ms = parse_u32("CANLINK_BUS_READ_TIMEOUT", *val);
        }
        if (auto val = get_val("CANLINK_RECEIVE_OWN_FRAMES")) {
            config.receive_own_frames = parse_bool(*val);
        }
        if (auto val = get_val("CANLINK_RX_QUEUE_CAPACITY")) {
            config.rx_queue_capacity = parse_u32("CANLINK_RX_QUEUE_CAPACITY", *val);
        }

        // Apply client handling
        if (auto val = get_val("CANLINK_ACCEPT_POLL_TIMEOUT")) {
            config.accept_poll_timeout_ms = parse_u32("CANLINK_ACCEPT_POLL_TIMEOUT", *val);
        }
        if (auto val = get_val("CANLINK_CLIENT_WRITE_TIMEOUT")) {
            config.client_write_timeout_ms = parse_u32("CANLINK_CLIENT_WRITE_TIMEOUT", *val);
        }
        if (auto val = get_val("CANLINK_MAX_STRUCTURED_BYTES")) {
            config.max_structured_message_bytes =
                parse_u32("CANLINK_MAX_STRUCTURED_BYTES", *val);
        }

        if (auto val = get_val("CANLINK_SEND_TEST_FRAME")) {
            config.send_test_frame = parse_bool(*val);
        }
    }

    // === Load Methods ===

    GatewayConfig GatewayConfig::from_file(const std::string& filepath, bool use_defaults) {
        std::ifstream file(filepath);
        if (!file.is_open()) {
            throw std::runtime_error("Cannot open JSON config file: " + filepath);
        }

        try {
            json j;
            file >> j;
            return from_json(j, use_defaults);
        } catch (const json::exception& e) {
            throw std::runtime_error("JSON parse error in " + filepath + ": " + e.what());
        }
    }

    GatewayConfig GatewayConfig::load(const std::optional<std::string>& config_file_path) {
        // Start with defaults
        GatewayConfig config = create_default();

        // Apply JSON config file if provided and readable
        if (config_file_path.has_value()) {
            std::ifstream probe(*config_file_path);
            if (probe.is_open()) {
                config = from_file(*config_file_path);
            }
        }

        // Apply environment variables (highest priority)
        std::map<std::string, std::string> env_vars;
        for (const char* key : CONFIG_KEYS) {
            if (const char* val = std::getenv(key)) {
                env_vars[key] = val;
            }
        }

        if (!env_vars.empty()) {
            apply_config_map(config, env_vars);
        }

        return config;
    }

} // namespace canlink
