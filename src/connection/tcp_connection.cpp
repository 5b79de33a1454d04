#include "conn_broker/connection/tcp_connection.hpp"

#include <boost/asio/connect.hpp>
#include <boost/asio/error.hpp>
#include <boost/asio/redirect_error.hpp>
#include <boost/asio/steady_timer.hpp>
#include <boost/asio/use_awaitable.hpp>
#include <memory>
#include <utility>

namespace conn_broker {

    TcpConnection::TcpConnection(boost::asio::any_io_executor ex,
                                 TcpEndpoint endpoint,
                                 std::chrono::milliseconds connect_timeout)
        : m_ex(std::move(ex)),
          m_endpoint(std::move(endpoint)),
          m_connect_timeout(connect_timeout),
          m_socket(m_ex) {
        if (m_endpoint.host.empty()) m_endpoint.host = "localhost";
    }

    boost::asio::awaitable<boost::system::error_code> TcpConnection::connect() {
        boost::system::error_code ec;

        if (m_socket.is_open()) co_return ec;

        tcp::resolver resolver(m_ex);
        auto results = co_await resolver.async_resolve(
            m_endpoint.host, m_endpoint.port,
            boost::asio::redirect_error(boost::asio::use_awaitable, ec));
        if (ec) co_return ec;

        // The watchdog closes the socket, which aborts the pending connect.
        auto done = std::make_shared<bool>(false);
        auto timed_out = std::make_shared<bool>(false);
        boost::asio::steady_timer watchdog(m_ex);
        watchdog.expires_after(m_connect_timeout);
        watchdog.async_wait(
            [this, done, timed_out](boost::system::error_code wait_ec) {
                if (wait_ec || *done) return;
                *timed_out = true;
                boost::system::error_code ignored;
                m_socket.close(ignored);
            });

        co_await boost::asio::async_connect(
            m_socket, results,
            boost::asio::redirect_error(boost::asio::use_awaitable, ec));
        *done = true;
        watchdog.cancel();

        if (*timed_out) ec = make_error_code(boost::asio::error::timed_out);
        if (ec) disconnect();
        co_return ec;
    }

    boost::asio::awaitable<boost::system::error_code> TcpConnection::ping() {
        boost::system::error_code ec;
        if (!m_socket.is_open()) {
            co_return make_error_code(boost::asio::error::not_connected);
        }

        // Peek one byte without blocking: would_block means the peer is
        // quiet but alive, eof means it hung up.
        m_socket.non_blocking(true, ec);
        if (ec) co_return ec;

        char probe = 0;
        m_socket.receive(boost::asio::buffer(&probe, 1),
                         tcp::socket::message_peek, ec);

        boost::system::error_code restore_ec;
        m_socket.non_blocking(false, restore_ec);

        if (ec == boost::asio::error::would_block) ec.clear();
        co_return ec;
    }

    void TcpConnection::disconnect() noexcept {
        if (!m_socket.is_open()) return;

        boost::system::error_code ec;
        m_socket.shutdown(tcp::socket::shutdown_both, ec);
        m_socket.close(ec);
    }

    ConnectionFactory TcpConnection::factory(
        TcpEndpoint endpoint, std::chrono::milliseconds connect_timeout) {
        return [endpoint = std::move(endpoint),
                connect_timeout](boost::asio::any_io_executor ex)
                   -> std::unique_ptr<Connection> {
            return std::make_unique<TcpConnection>(std::move(ex), endpoint,
                                                   connect_timeout);
        };
    }

}  // namespace conn_broker
