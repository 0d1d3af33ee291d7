/**
 * @file canlink_exception.hpp
 * @brief Exception hierarchy for the canlink gateway
 * @version 1.0
 * @date 2026-10-19
 *
 * @copyright Copyright (c) 2026
 *
 */

#pragma once

#include <stdexcept>
#include <string>
#include "../enums/error.hpp"

namespace canlink {

    /**
     * @class CanlinkException
     * @brief Base exception class for all gateway errors
     *
     * This exception stores the original Status code for programmatic error handling
     * while providing a descriptive error message via what().
     */
    class CanlinkException : public std::runtime_error {
        protected:
            Status status_;     ///< Original error status code
            std::string context_; ///< Operation context (function name, etc.)

        public:
            /**
             * @brief Construct exception with status code and context
             * @param status The error status code
             * @param context Description of where the error occurred
             */
            CanlinkException(Status status, const std::string& context)
                : std::runtime_error(format_message(status, context)),
                status_(status),
                context_(context) {}

            /**
             * @brief Get the status code
             * @return Status code associated with this exception
             */
            Status status() const noexcept { return status_; }

            /**
             * @brief Get the operation context
             * @return Context string describing where error occurred
             */
            const std::string& context() const noexcept { return context_; }

        private:
            static std::string format_message(Status status, const std::string& context) {
                return "[" + status_message(status) + "] in " + context;
            }
    };

    // === Derived Exception Classes ===

    /**
     * @class ProtocolException
     * @brief Exception for frame and wire format violations
     *
     * Corresponds to W* status codes.
     */
    class ProtocolException : public CanlinkException {
        public:
            using CanlinkException::CanlinkException;
    };

    /**
     * @class DeviceException
     * @brief Exception for socket I/O and configuration errors
     *
     * Used for TCP listener/stream and SocketCAN failures.
     * Corresponds to D* status codes.
     */
    class DeviceException : public CanlinkException {
        public:
            using CanlinkException::CanlinkException;
    };

    /**
     * @class BusException
     * @brief Exception for bus transport errors
     *
     * Corresponds to BUS_* status codes.
     */
    class BusException : public CanlinkException {
        public:
            using CanlinkException::CanlinkException;
    };

    // === Exception Factory Helpers ===

    /**
     * @brief Throw appropriate exception based on status code
     * @param status The error status code
     * @param context Description of where the error occurred
     * @throws ProtocolException for W* codes
     * @throws DeviceException for D* codes
     * @throws BusException for BUS_* codes
     * @throws CanlinkException for other codes
     */
    inline void throw_error(Status status, const std::string& context) {
        switch (status) {
        case Status::WINCOMPLETE:
        case Status::WBAD_LENGTH:
        case Status::WBAD_FORMAT:
        case Status::WBAD_TYPE:
        case Status::WBAD_ID:
        case Status::WBAD_DATA:
        case Status::WBAD_DLC:
        case Status::WPAYLOAD_TRUNCATED:
            throw ProtocolException(status, context);

        case Status::DNOT_FOUND:
        case Status::DNOT_OPEN:
        case Status::DREAD_ERROR:
        case Status::DWRITE_ERROR:
        case Status::DCONFIG_ERROR:
        case Status::DBIND_ERROR:
        case Status::DCLOSED:
            throw DeviceException(status, context);

        case Status::BUS_SEND_ERROR:
        case Status::BUS_QUEUE_OVERFLOW:
        case Status::BUS_NOT_STARTED:
            throw BusException(status, context);

        default:
            throw CanlinkException(status, context);
        }
    }

} // namespace canlink
