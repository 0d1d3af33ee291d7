/**
 * @file canlink.hpp
 * @brief Header file to facilitate the inclusion of the canlink gateway library
 * @version 1.0
 * @date 2026-10-19
 *
 * @copyright Copyright (c) 2026
 *
 */

#pragma once

// Include the protocol enums and status codes
#include "enums/protocol.hpp"
#include "enums/error.hpp"
// Include exception hierarchy and result type
#include "exception/canlink_exception.hpp"
#include "template/result.hpp"
#include "template/bounded_queue.hpp"
// Include the frame model
#include "frame/frame.hpp"
// Include the wire codecs
#include "codec/wire_codec.hpp"
#include "codec/compact_codec.hpp"
#include "codec/structured_codec.hpp"
// Include the I/O abstractions
#include "io/tcp_stream.hpp"
#include "io/real_tcp_stream.hpp"
#include "io/tcp_listener.hpp"
#include "io/bus_transport.hpp"
#include "io/socketcan_transport.hpp"
#include "interface/socketcan_helpers.hpp"
// Include the gateway configuration
#include "pattern/gateway_config.hpp"
#include "pattern/gateway_events.hpp"
// Include the gateway components
#include "pattern/client_connection.hpp"
#include "pattern/client_registry.hpp"
#include "pattern/bus_adapter.hpp"
#include "pattern/gateway_server.hpp"
