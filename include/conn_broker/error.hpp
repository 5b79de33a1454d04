#pragma once
#include <string>

namespace conn_broker {
    /**
     * @brief Represents an error reported by the pool or one of its workers.
     */
    struct Error {
        /** @brief Enumeration of error codes. */
        enum class Code {
            Busy,             /**< No idle connection and queueing disallowed. */
            Overloaded,       /**< Overload controller is shedding requests. */
            CheckoutTimeout,  /**< Waiter expired before being served. */
            Cancelled,        /**< Pending checkout withdrawn by its caller. */
            InvalidHandle,    /**< Checkin with a stale or foreign lock. */
            AlreadyCheckedIn, /**< Handle was already returned to the pool. */
            ConnectionLost,   /**< Worker failed while the holder was out. */
            CheckoutExpired,  /**< Hold deadline passed, holder reclaimed. */
            Shutdown,         /**< Pool has been stopped. */
            InvalidConfiguration, /**< Rejected pool configuration. */
            InternalError,    /**< Unexpected failure (timer error, etc.). */
        };

        /** @brief The error code. */
        Code code;
        /** @brief A descriptive error message. */
        std::string message;
    };

    /// @brief Convert an error code to string for logging or diagnostics
    inline const char* to_string(Error::Code code) {
        switch (code) {
            case Error::Code::Busy:
                return "Busy";
            case Error::Code::Overloaded:
                return "Overloaded";
            case Error::Code::CheckoutTimeout:
                return "CheckoutTimeout";
            case Error::Code::Cancelled:
                return "Cancelled";
            case Error::Code::InvalidHandle:
                return "InvalidHandle";
            case Error::Code::AlreadyCheckedIn:
                return "AlreadyCheckedIn";
            case Error::Code::ConnectionLost:
                return "ConnectionLost";
            case Error::Code::CheckoutExpired:
                return "CheckoutExpired";
            case Error::Code::Shutdown:
                return "Shutdown";
            case Error::Code::InvalidConfiguration:
                return "InvalidConfiguration";
            case Error::Code::InternalError:
                return "InternalError";
        }
        return "Unknown";
    }
}  // namespace conn_broker
