#include "../include/canlink.hpp"
#include "script_utils.hpp"
#include <iostream>
#include <iomanip>
#include <csignal>
#include <chrono>
#include <thread>
#include <atomic>

using namespace canlink;

// Set by the signal handler, polled by the main loop
std::atomic<bool> g_stop_requested{false};

// Signal handler for graceful shutdown
void signal_handler(int signal) {
    if (signal == SIGINT || signal == SIGTERM) {
        g_stop_requested.store(true);
    }
}

// === Callback Functions ===

/**
 * @brief Callback for client to bus frame forwarding
 * @param client_id Gateway client id
 * @param frame The frame accepted by the bus
 */
void client_to_bus_callback(std::uint64_t client_id, const Frame& frame) {
    std::cout << "[" << get_timestamp() << "] TCP→CAN: client=" << client_id
              << " ID=0x" << std::hex << std::uppercase << std::setfill('0')
              << std::setw(has_flag(frame.flags, FrameFlag::IDE) ? 8 : 3) << frame.id
              << std::dec << " LEN=" << frame.payload.size()
              << " DATA=[" << format_can_data(frame.payload.data(), frame.payload.size()) << "]"
              << std::endl;
}

/**
 * @brief Callback for bus to client fan-out
 * @param frame The frame observed on the bus
 * @param delivered Number of clients the frame was written to
 */
void bus_to_client_callback(const Frame& frame, std::size_t delivered) {
    std::cout << "[" << get_timestamp() << "] CAN→TCP: "
              << "ID=0x" << std::hex << std::uppercase << std::setfill('0')
              << std::setw(has_flag(frame.flags, FrameFlag::IDE) ? 8 : 3) << frame.id
              << std::dec << " LEN=" << frame.payload.size()
              << " DATA=[" << format_can_data(frame.payload.data(), frame.payload.size()) << "]"
              << " → " << delivered << " client(s)"
              << std::endl;
}

// === Main Program ===

int main(int argc, char* argv[]) {
    std::cout << "=== canlink TCP-to-CAN Gateway ===\n\n";

    try {
        ScriptConfig args = parse_arguments(argc, argv, ScriptType::GATEWAY);

        // A trailing positional argument is accepted as the configuration file
        if (!args.config_file && optind < argc) {
            args.config_file = std::string(argv[optind]);
        }

        // Environment > file > defaults
        GatewayConfig config = GatewayConfig::load(args.config_file);
        if (args.bus_interface) {
            config.bus_interface = *args.bus_interface;
        }
        if (args.send_test_frame) {
            config.send_test_frame = true;
        }
        config.validate();
        std::cout << "[CONFIG] Configuration validated successfully.\n\n";

        std::cout << "Configuration:\n";
        std::cout << "  Bus Interface:       " << config.bus_interface << "\n";
        for (const auto& endpoint : config.endpoints) {
            std::cout << "  Endpoint:            " << endpoint.host << ":" << endpoint.port
                      << " (" << to_string(endpoint.protocol) << ")\n";
        }
        for (const auto& rule : config.peer_rules) {
            std::cout << "  Peer Rule:           " << rule.prefix << "* -> "
                      << to_string(rule.protocol) << "\n";
        }
        std::cout << "  RX Queue Capacity:   " << config.rx_queue_capacity << " frames\n";
        std::cout << "  Write Timeout:       " << config.client_write_timeout_ms << " ms\n\n";

        std::cout << "[GATEWAY] Creating gateway...\n";
        auto gateway_ptr = GatewayServer::create(config);
        GatewayServer& gateway = *gateway_ptr;
        std::cout << "[GATEWAY] Bus interface " << gateway.get_bus_adapter().get_channel_name()
                  << " opened successfully\n";

        std::signal(SIGINT, signal_handler);
        std::signal(SIGTERM, signal_handler);
        std::cout << "[GATEWAY] Signal handler installed (Ctrl+C to stop)\n\n";

        if (args.dump_frames) {
            std::cout << "[GATEWAY] Installing frame dump callbacks...\n";
            gateway.set_client_to_bus_callback(client_to_bus_callback);
            gateway.set_bus_to_client_callback(bus_to_client_callback);
            std::cout << "[GATEWAY] Frame dump callbacks installed.\n\n";
        }

        std::cout << "[GATEWAY] Starting threads...\n";
        gateway.start();
        std::cout << "[GATEWAY] Gateway is running.\n";
        std::cout << "[GATEWAY] Status: " << (gateway.is_running() ? "RUNNING" : "STOPPED") <<
            "\n\n";

        std::cout << "=== Gateway Active ===\n";
        std::cout << "Test commands (run in another terminal):\n";
        std::cout << "  # Send a frame on the bus (fanned out to every client):\n";
        std::cout << "  cansend " << config.bus_interface << " 123#DEADBEEF\n\n";
        std::cout << "  # Monitor frames forwarded by clients:\n";
        std::cout << "  candump " << config.bus_interface << "\n\n";
        std::cout << "Press Ctrl+C to stop and show statistics.\n";
        std::cout << "========================================\n\n";

        // Main loop - print statistics every 10 seconds
        auto last_stats_time = std::chrono::steady_clock::now();
        while (gateway.is_running() && !g_stop_requested.load()) {
            std::this_thread::sleep_for(std::chrono::milliseconds(200));

            auto now = std::chrono::steady_clock::now();
            auto elapsed = std::chrono::duration_cast<std::chrono::seconds>(now -
                last_stats_time).count();

            if (elapsed >= 10) {
                std::cout << "\n--- Statistics (10s update) ---\n";
                std::cout << gateway.get_statistics().to_string() << "\n";
                std::cout << "------------------------------\n\n";
                last_stats_time = now;
            }
        }

        std::cout << "\n\n[SIGNAL] Shutting down gracefully...\n";
        gateway.stop();
        std::cout << "[GATEWAY] Gateway stopped.\n\n";
        std::cout << gateway.get_statistics().to_string() << "\n";

    } catch (const DeviceException& e) {
        std::cerr << "\n[ERROR] Device error: " << e.what() << "\n";
        std::cerr << "  Status code: " << static_cast<int>(e.status()) << "\n";
        std::cerr << "\nTroubleshooting:\n";
        std::cerr << "  - Check the SocketCAN interface (default: vcan0)\n";
        std::cerr << "  - Check that no other process listens on the configured ports\n";
        std::cerr <<
            "  - For vcan0: sudo modprobe vcan && sudo ip link add dev vcan0 type vcan && sudo ip link set up vcan0\n";
        return 1;
    }
    catch (const std::invalid_argument& e) {
        std::cerr << "\n[ERROR] Configuration error: " << e.what() << "\n";
        return 1;
    }
    catch (const std::exception& e) {
        std::cerr << "\n[ERROR] Unexpected error: " << e.what() << "\n";
        return 1;
    }

    std::cout << "\n[MAIN] Exiting.\n";
    return 0;
}
