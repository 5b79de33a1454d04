#pragma once

#include <utility>  // boost 1.74 awaitable.hpp uses std::exchange without including it
#include <boost/asio/any_io_executor.hpp>
#include <boost/asio/awaitable.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/system/error_code.hpp>
#include <chrono>
#include <string>

#include "conn_broker/connection/connection.hpp"

namespace conn_broker {

    /** @brief host:port of a TCP backend. */
    struct TcpEndpoint {
        std::string host;
        std::string port;
    };

    /**
     * @brief Plain TCP connection adapter.
     *
     * Resolves and connects on connect(); ping() detects a peer that closed
     * the socket without consuming any pending bytes. Protocol handshakes
     * belong in adapters built on top of socket().
     */
    class TcpConnection : public Connection {
       public:
        using tcp = boost::asio::ip::tcp;

        TcpConnection(boost::asio::any_io_executor ex, TcpEndpoint endpoint,
                      std::chrono::milliseconds connect_timeout =
                          std::chrono::milliseconds(5000));

        TcpConnection(const TcpConnection&) = delete;
        TcpConnection& operator=(const TcpConnection&) = delete;

        ~TcpConnection() noexcept override { disconnect(); }

        boost::asio::awaitable<boost::system::error_code> connect() override;
        boost::asio::awaitable<boost::system::error_code> ping() override;
        void disconnect() noexcept override;
        bool is_connected() const noexcept override {
            return m_socket.is_open();
        }

        /// @brief Underlying socket, for the caller holding the checkout.
        tcp::socket& socket() noexcept { return m_socket; }

        TcpEndpoint const& endpoint() const noexcept { return m_endpoint; }

        /// @brief Factory binding an endpoint, for ConnectionPool::start.
        static ConnectionFactory factory(TcpEndpoint endpoint,
                                         std::chrono::milliseconds
                                             connect_timeout =
                                                 std::chrono::milliseconds(
                                                     5000));

       private:
        boost::asio::any_io_executor m_ex;
        TcpEndpoint m_endpoint;
        std::chrono::milliseconds m_connect_timeout;
        tcp::socket m_socket;
    };

}  // namespace conn_broker
