#include "../include/canlink.hpp"
#include "script_utils.hpp"
#include <iostream>
#include <iomanip>
#include <chrono>
#include <thread>
#include <cerrno>
#include <cstring>
#include <arpa/inet.h>
#include <netinet/in.h>
#include <sys/socket.h>
#include <unistd.h>

using namespace canlink;

/**
 * @brief Connect to a gateway endpoint
 * @return int Connected socket FD
 * @throws DeviceException if the connection fails
 */
static int connect_to(const std::string& host, std::uint16_t port) {
    struct sockaddr_in addr;
    std::memset(&addr, 0, sizeof(addr));
    addr.sin_family = AF_INET;
    addr.sin_port = htons(port);
    if (::inet_pton(AF_INET, host.c_str(), &addr.sin_addr) != 1) {
        throw DeviceException(Status::DCONFIG_ERROR, "Invalid host address: " + host);
    }

    int fd = ::socket(AF_INET, SOCK_STREAM | SOCK_CLOEXEC, 0);
    if (fd < 0) {
        throw DeviceException(Status::DNOT_OPEN,
                  "Failed to create socket: " + std::string(std::strerror(errno)));
    }
    if (::connect(fd, reinterpret_cast<struct sockaddr*>(&addr), sizeof(addr)) < 0) {
        int err = errno;
        ::close(fd);
        throw DeviceException(Status::DNOT_FOUND,
                  "Failed to connect to " + host + ":" + std::to_string(port) + ": " +
                  std::strerror(err));
    }
    return fd;
}

int main(int argc, char* argv[]) {
    std::cout << "=== canlink Frame Probe ===\n\n";

    try {
        ScriptConfig config = parse_arguments(argc, argv, ScriptType::PROBE);

        std::cout << "Configuration:\n";
        std::cout << "  Gateway:             " << config.host << ":" << config.port << "\n";
        std::cout << "  CAN ID:              0x" << std::hex << std::uppercase
                  << config.frame_id << std::dec << "\n";
        std::cout << "  Data:                [" << format_can_data(config.frame_data.data(),
            config.frame_data.size()) << "]\n";
        std::cout << "  Listen:              " << config.listen_seconds << " s\n\n";

        auto codec = make_codec(Protocol::COMPACT);
        RealTcpStream stream(connect_to(config.host, config.port), config.host, 1000);
        std::cout << "[PROBE] Connected to " << config.host << ":" << config.port << "\n";

        Frame frame(config.frame_id, span<const std::uint8_t>(config.frame_data.data(),
            config.frame_data.size()));
        auto bytes = codec->encode(frame);
        ssize_t written = stream.write(bytes.data(), bytes.size());
        if (written != static_cast<ssize_t>(bytes.size())) {
            throw DeviceException(Status::DWRITE_ERROR, "Failed to send frame");
        }
        std::cout << "[" << get_timestamp() << "] TX " << frame.to_string() << "\n";

        // Stop the reader after the listen period
        std::thread timer([&stream, &config]() {
                std::this_thread::sleep_for(std::chrono::seconds(config.listen_seconds));
                stream.shutdown();
            });

        std::vector<std::uint8_t> buffer;
        std::uint8_t chunk[ClientConnection::READ_CHUNK_SIZE];
        std::size_t received = 0;
        bool valid = true;
        while (valid) {
            ssize_t n = stream.read(chunk, sizeof(chunk));
            if (n <= 0) {
                break;
            }
            buffer.insert(buffer.end(), chunk, chunk + n);

            std::size_t offset = 0;
            while (offset < buffer.size()) {
                auto result = codec->try_decode(span<const std::uint8_t>(
                    buffer.data() + offset, buffer.size() - offset));
                if (!result) {
                    if (result.error() != Status::WINCOMPLETE) {
                        std::cerr << "[PROBE] Invalid data from gateway: " << result.describe()
                                  << "\n";
                        valid = false;
                    }
                    break;
                }
                offset += result.value().consumed;
                if (result.value().frame) {
                    ++received;
                    std::cout << "[" << get_timestamp() << "] RX "
                              << result.value().frame->to_string() << "\n";
                }
            }
            buffer.erase(buffer.begin(), buffer.begin() + static_cast<std::ptrdiff_t>(offset));
        }

        timer.join();
        stream.close();
        std::cout << "\n[PROBE] Received " << received << " frame(s).\n";

    } catch (const DeviceException& e) {
        std::cerr << "\n[ERROR] Device error: " << e.what() << "\n";
        std::cerr << "  Status code: " << static_cast<int>(e.status()) << "\n";
        std::cerr << "\nTroubleshooting:\n";
        std::cerr << "  - Check that the gateway is running\n";
        std::cerr << "  - Check that the port is a compact endpoint (default: 5001)\n";
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
