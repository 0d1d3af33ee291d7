/**
 * @file gateway_events.cpp
 * @brief Gateway event rendering
 * @version 1.0
 * @date 2026-10-19
 */

#include <iostream>
#include <sstream>

#include "../include/pattern/gateway_events.hpp"

namespace canlink {

    std::string to_string(EventKind kind) {
        switch (kind) {
        case EventKind::CLIENT_CONNECTED:     return "CLIENT_CONNECTED";
        case EventKind::CLIENT_DISCONNECTED:  return "CLIENT_DISCONNECTED";
        case EventKind::DECODE_INVALID:       return "DECODE_INVALID";
        case EventKind::PAYLOAD_TRUNCATED:    return "PAYLOAD_TRUNCATED";
        case EventKind::BUS_SEND_FAILURE:     return "BUS_SEND_FAILURE";
        case EventKind::CLIENT_WRITE_FAILURE: return "CLIENT_WRITE_FAILURE";
        case EventKind::BUS_QUEUE_OVERFLOW:   return "BUS_QUEUE_OVERFLOW";
        default:                              return "UNKNOWN";
        }
    }

    namespace {

        const char* tag_for(EventKind kind) {
            switch (kind) {
            case EventKind::DECODE_INVALID:
            case EventKind::PAYLOAD_TRUNCATED:
                return "[CODEC]";
            case EventKind::BUS_SEND_FAILURE:
            case EventKind::BUS_QUEUE_OVERFLOW:
                return "[BUS]";
            default:
                return "[CLIENT]";
            }
        }

    } // namespace

    std::string GatewayEvent::to_string() const {
        std::ostringstream oss;
        oss << tag_for(kind) << " " << canlink::to_string(kind);
        if (client_id != 0) {
            oss << " client=" << client_id;
        }
        if (status != Status::SUCCESS) {
            oss << " status=" << status_message(status);
        }
        if (!detail.empty()) {
            oss << ": " << detail;
        }
        return oss.str();
    }

    void log_event(const GatewayEvent& event) {
        if (event.is_failure()) {
            std::cerr << event.to_string() << std::endl;
        } else {
            std::cout << event.to_string() << std::endl;
        }
    }

} // namespace canlink
