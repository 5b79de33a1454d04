#pragma once

#include <utility>  // boost 1.74 awaitable.hpp uses std::exchange without including it
#include <boost/asio/any_io_executor.hpp>
#include <boost/asio/awaitable.hpp>
#include <boost/system/error_code.hpp>
#include <functional>
#include <memory>

namespace conn_broker {

    /**
     * @brief One physical connection to the backing service.
     *
     * Adapters implement the wire-level setup (handshake, auth, TLS). The
     * pool never calls these directly: the owning ConnectionWorker connects,
     * pings and disconnects, and callers use the connection while they hold
     * a checkout.
     */
    class Connection {
       public:
        virtual ~Connection() = default;

        /// @brief Establish the connection, including adapter-specific setup.
        virtual boost::asio::awaitable<boost::system::error_code>
        connect() = 0;

        /// @brief Cheap liveness probe used by the idle sweep.
        virtual boost::asio::awaitable<boost::system::error_code> ping() = 0;

        /// @brief Drop the connection (best-effort, never throws).
        virtual void disconnect() noexcept = 0;

        virtual bool is_connected() const noexcept = 0;
    };

    /// @brief Creates the connection a worker owns, on the given executor.
    using ConnectionFactory = std::function<std::unique_ptr<Connection>(
        boost::asio::any_io_executor)>;

}  // namespace conn_broker
