/**
 * @file error.hpp
 * @brief Status codes for the canlink gateway, usable as std::error_code.
 * @version 1.0
 * @date 2026-10-19
 *
 * @copyright Copyright (c) 2026
 */

#pragma once
#include <string>
#include <system_error>
#include <type_traits>

namespace canlink {

/**
 * @enum Status
 * @brief Enumeration of status codes for gateway operations.
 * These codes can be converted to std::error_code for integration with
 * standard error handling mechanisms.
 * @note SUCCESS (0) indicates no error.
 * If it starts with 'W' it concerns wire data (codecs).
 * If it starts with 'D' it is a device/socket related error.
 * If it starts with 'BUS' it concerns the bus transport.
 * @see std::error_code
 */
    enum class Status : int {
        SUCCESS = 0,            /**< No error */
        WINCOMPLETE = 1,        /**< Not enough buffered bytes (not an error) */
        WBAD_LENGTH = 2,        /**< Bad length field */
        WBAD_FORMAT = 3,        /**< Malformed structured record */
        WBAD_TYPE = 4,          /**< Bad record type */
        WBAD_ID = 5,            /**< Bad CAN ID */
        WBAD_DATA = 6,          /**< Bad data element */
        WBAD_DLC = 7,           /**< Bad length code */
        WPAYLOAD_TRUNCATED = 8, /**< Payload longer than 64 bytes, truncated */
        DNOT_FOUND = 10,        /**< Interface or host not found */
        DNOT_OPEN = 11,         /**< Socket not open */
        DREAD_ERROR = 12,       /**< Socket read error */
        DWRITE_ERROR = 13,      /**< Socket write error */
        DCONFIG_ERROR = 14,     /**< Socket configuration error */
        DBIND_ERROR = 15,       /**< Cannot bind listening endpoint */
        DCLOSED = 16,           /**< Peer closed the connection */
        BUS_SEND_ERROR = 17,    /**< Transport rejected a frame */
        BUS_QUEUE_OVERFLOW = 18, /**< Receive hand-off queue saturated */
        BUS_NOT_STARTED = 19,   /**< Transport not started */
        UNKNOWN = 255           /**< Unknown error */
    };

/**
 * @class CanlinkErrorCategory
 * @brief Custom error category for gateway status codes.
 */
    class CanlinkErrorCategory : public std::error_category {
        public:
            const char*name() const noexcept override {
                return "canlink::Status";
            }

            std::string message(int ev) const override {
                switch (static_cast<Status>(ev)) {
                case Status::SUCCESS:
                    return "Success";
                case Status::WINCOMPLETE:
                    return "Incomplete frame";
                case Status::WBAD_LENGTH:
                    return "Bad length";
                case Status::WBAD_FORMAT:
                    return "Bad format";
                case Status::WBAD_TYPE:
                    return "Bad record type";
                case Status::WBAD_ID:
                    return "Bad CAN ID";
                case Status::WBAD_DATA:
                    return "Bad data";
                case Status::WBAD_DLC:
                    return "Bad DLC";
                case Status::WPAYLOAD_TRUNCATED:
                    return "Payload truncated";
                case Status::DNOT_FOUND:
                    return "Device not found";
                case Status::DNOT_OPEN:
                    return "Device not open";
                case Status::DREAD_ERROR:
                    return "Device read error";
                case Status::DWRITE_ERROR:
                    return "Device write error";
                case Status::DCONFIG_ERROR:
                    return "Device configuration error";
                case Status::DBIND_ERROR:
                    return "Bind error";
                case Status::DCLOSED:
                    return "Connection closed";
                case Status::BUS_SEND_ERROR:
                    return "Bus send error";
                case Status::BUS_QUEUE_OVERFLOW:
                    return "Bus receive queue overflow";
                case Status::BUS_NOT_STARTED:
                    return "Bus transport not started";
                case Status::UNKNOWN:
                    return "Unknown error";
                default:
                    return "Unrecognized error";
                }
            }
    };

// Get the error category instance
    inline const std::error_category &canlink_category() {
        static CanlinkErrorCategory instance;
        return instance;
    }

// Make error_code from Status
    inline std::error_code make_error_code(Status e) {
        return {static_cast<int>(e), canlink_category()};
    }

/**
 * @brief Human readable text for a status code.
 */
    inline std::string status_message(Status status) {
        return canlink_category().message(static_cast<int>(status));
    }

} // namespace canlink

// Register the enum for use with std::error_code
namespace std {
    template<> struct is_error_code_enum<canlink::Status> : true_type {};
} // namespace std
