/**
 * @file script_utils.hpp
 * @brief Shared utilities for the canlink command-line tools
 * @version 1.0
 * @date 2026-10-19
 *
 * @copyright Copyright (c) 2026
 *
 */

#pragma once

#include "../include/canlink.hpp"
#include <string>
#include <iostream>
#include <algorithm>
#include <chrono>
#include <cctype>
#include <ctime>
#include <optional>
#include <sstream>
#include <iomanip>
#include <vector>
#include <getopt.h>

namespace canlink {

// === Common Utility Functions ===

/**
 * @brief Format CAN data bytes as hex string
 * @param data Pointer to data bytes
 * @param len Number of data bytes
 * @return std::string Formatted hex string (e.g., "DE AD BE EF")
 */
    inline std::string format_can_data(const uint8_t* data, std::size_t len) {
        std::ostringstream oss;
        oss << std::hex << std::uppercase << std::setfill('0');
        for (std::size_t i = 0; i < len; ++i) {
            oss << std::setw(2) << static_cast<int>(data[i]);
            if (i + 1 < len) oss << " ";
        }
        return oss.str();
    }

/**
 * @brief Get current timestamp as formatted string
 * @return std::string Timestamp in format "HH:MM:SS.mmm"
 */
    inline std::string get_timestamp() {
        auto now = std::chrono::system_clock::now();
        auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
            now.time_since_epoch()) % 1000;
        auto timer = std::chrono::system_clock::to_time_t(now);
        std::tm bt = *std::localtime(&timer);

        std::ostringstream oss;
        oss << std::put_time(&bt, "%H:%M:%S");
        oss << '.' << std::setfill('0') << std::setw(3) << ms.count();
        return oss.str();
    }

// === Command-Line Argument Parsing ===

/**
 * @brief Program configuration structure
 */
    struct ScriptConfig {
        // Gateway-specific configuration
        std::optional<std::string> config_file;
        std::optional<std::string> bus_interface;
        bool send_test_frame = false;
        bool dump_frames = false;

        // Probe-specific configuration
        std::string host = "127.0.0.1";
        std::uint16_t port = 5001;
        std::uint32_t frame_id = 0x123;
        std::vector<std::uint8_t> frame_data = {0xDE, 0xAD, 0xBE, 0xEF};
        std::uint32_t listen_seconds = 3;
    };

/**
 * @brief Script type enumeration for help display
 */
    enum class ScriptType {
        GATEWAY,
        PROBE
    };

/**
 * @brief Display help message for script usage
 * @param program_name The name of the program (argv[0])
 * @param script_type The type of script (gateway or probe)
 */
    inline void display_help(const std::string& program_name, ScriptType script_type) {
        std::cout << "Usage: " << program_name << " [OPTIONS]\n\n";
        std::cout << "Options:\n";

        if (script_type == ScriptType::GATEWAY) {
            std::cout << "  -c <file>       JSON configuration file (gateway_config section)\n";
            std::cout << "  -i <interface>  SocketCAN interface (overrides configuration)\n";
            std::cout << "  -t              Send the connectivity test frame at startup\n";
            std::cout << "  -v              Dump every forwarded frame\n";
        } else {
            std::cout << "  -H <host>       Gateway host (default: 127.0.0.1)\n";
            std::cout << "  -p <port>       Compact endpoint port (default: 5001)\n";
            std::cout << "  -i <id>         CAN ID in hex or decimal (default: 0x123)\n";
            std::cout << "  -j <data>       Data as hex string, up to 64 bytes (default: DEADBEEF)\n";
            std::cout << "  -w <seconds>    Time to print received frames (default: 3)\n";
        }

        std::cout << "  -h              Display this help message\n";
        std::cout << "\n";

        switch (script_type) {
        case ScriptType::GATEWAY:
            std::cout << "Runs the TCP-to-CAN gateway. Environment variables (CANLINK_*)\n";
            std::cout << "override the configuration file.\n";
            std::cout << "\n";
            std::cout << "Examples:\n";
            std::cout << "  " << program_name << " -c config/gateway_config.json\n";
            std::cout << "  CANLINK_BUS_INTERFACE=can0 " << program_name << "\n";
            break;
        case ScriptType::PROBE:
            std::cout << "Sends one frame to a compact gateway endpoint and prints the\n";
            std::cout << "frames fanned out by the gateway.\n";
            std::cout << "\n";
            std::cout << "Examples:\n";
            std::cout << "  " << program_name << " -i 0x123 -j \"0A 14\"\n";
            std::cout << "  " << program_name << " -p 5001 -i 0x18FF50E5 -j DEADBEEF -w 10\n";
            break;
        }
    }

/**
 * @brief Parse hex or decimal integer from string
 * @param value_str String representation of integer (supports 0x prefix for hex)
 * @return std::uint32_t Parsed integer value
 * @throws std::invalid_argument if string is not a valid integer
 */
    inline std::uint32_t parse_uint32(const std::string& value_str) {
        unsigned long value;
        std::size_t pos = 0;

        // Check if hex format (0x prefix)
        if (value_str.size() >= 2 && value_str[0] == '0' &&
            (value_str[1] == 'x' || value_str[1] == 'X')) {
            value = std::stoul(value_str, &pos, 16);
        } else {
            value = std::stoul(value_str, &pos, 10);
        }

        if (pos != value_str.size() || value > 0xFFFFFFFFul) {
            throw std::invalid_argument("Invalid integer format: " + value_str);
        }

        return static_cast<std::uint32_t>(value);
    }

/**
 * @brief Parse hex string to binary data
 * @param hex_str Hex string (e.g., "DEADBEEF" or "DE AD BE EF")
 * @return std::vector<std::uint8_t> Binary data
 * @throws std::invalid_argument if string contains invalid hex characters
 */
    inline std::vector<std::uint8_t> parse_hex_data(const std::string& hex_str) {
        std::vector<std::uint8_t> data;
        std::string clean_str;

        // Remove spaces and other separators
        for (char c : hex_str) {
            if (std::isxdigit(static_cast<unsigned char>(c))) {
                clean_str += c;
            } else if (c != ' ' && c != ':' && c != '-') {
                throw std::invalid_argument("Invalid hex character in data string");
            }
        }

        if (clean_str.size() % 2 != 0) {
            throw std::invalid_argument("Hex data string must have even number of digits");
        }

        for (size_t i = 0; i < clean_str.size(); i += 2) {
            data.push_back(static_cast<uint8_t>(std::stoul(clean_str.substr(i, 2), nullptr, 16)));
        }

        if (data.size() > Limits::MAX_PAYLOAD) {
            throw std::invalid_argument("CAN data cannot exceed 64 bytes");
        }

        return data;
    }

/**
 * @brief Parse command-line arguments
 * @param argc Argument count
 * @param argv Argument values
 * @param script_type The type of script (gateway or probe)
 * @return ScriptConfig Parsed configuration
 * @throws std::invalid_argument if arguments are invalid
 */
    inline ScriptConfig parse_arguments(int argc, char* argv[], ScriptType script_type) {
        ScriptConfig config;
        int opt;

        const char* optstring = script_type == ScriptType::GATEWAY ? "hc:i:tv" : "hH:p:i:j:w:";

        while ((opt = getopt(argc, argv, optstring)) != -1) {
            switch (opt) {
            case 'h':
                display_help(argv[0], script_type);
                std::exit(0);

            case 'c':
                config.config_file = std::string(optarg);
                break;

            case 'i':
                if (script_type == ScriptType::GATEWAY) {
                    config.bus_interface = std::string(optarg);
                } else {
                    try {
                        config.frame_id = parse_uint32(optarg);
                    } catch (const std::logic_error&) {
                        std::cerr << "Invalid CAN ID: " << optarg << "\n";
                        std::cerr << "Use decimal or hex (0x...) format\n";
                        throw std::invalid_argument("Invalid CAN ID: " + std::string(optarg));
                    }
                }
                break;

            case 't':
                config.send_test_frame = true;
                break;

            case 'v':
                config.dump_frames = true;
                break;

            case 'H':
                config.host = optarg;
                break;

            case 'p': {
                std::uint32_t port = parse_uint32(optarg);
                if (port == 0 || port > 65535) {
                    throw std::invalid_argument("Invalid port: " + std::string(optarg));
                }
                config.port = static_cast<std::uint16_t>(port);
                break;
            }

            case 'j':
                config.frame_data = parse_hex_data(optarg);
                break;

            case 'w':
                config.listen_seconds = parse_uint32(optarg);
                break;

            default:
                display_help(argv[0], script_type);
                throw std::invalid_argument("Unknown option");
            }
        }

        return config;
    }

} // namespace canlink
