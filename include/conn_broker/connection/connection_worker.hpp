#pragma once

#include <atomic>
#include <utility>  // boost 1.74 awaitable.hpp uses std::exchange without including it
#include <boost/asio/any_io_executor.hpp>
#include <boost/asio/awaitable.hpp>
#include <boost/asio/steady_timer.hpp>
#include <boost/asio/strand.hpp>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <optional>

#include "conn_broker/connection/connection.hpp"
#include "conn_broker/connection/connection_pool_types.hpp"
#include "conn_broker/connection/restart_policy.hpp"
#include "conn_broker/error.hpp"
#include "conn_broker/result.hpp"

namespace conn_broker {

    class ConnectionWorker;

    /**
     * @brief What a worker sees of the pool: readiness and failure
     * boundaries, plus the checkin used to return a holder after a ping.
     */
    class WorkerCoordinator {
       public:
        virtual ~WorkerCoordinator() = default;

        /// @brief The worker's connection is usable; the pool creates a new
        /// holder for it.
        /// @return The holder id, or Shutdown when the pool is stopped.
        virtual Result<HolderId> announce_ready(
            std::shared_ptr<ConnectionWorker> worker) = 0;

        /// @brief The connection behind `holder` died. Unknown or already
        /// purged holders are ignored.
        virtual void announce_failed(HolderId holder, Error reason) = 0;

        virtual Result<void> checkin(const Transfer& transfer) = 0;
    };

    /**
     * Owns one Connection and reports its readiness to the coordinator.
     *
     * Lifecycle (run loop, on the worker's strand):
     * 1. connect()
     * 2. announce_ready(), park until report_failure() or stop()
     * 3. disconnect, ask the RestartPolicy for a delay, wait, goto 1
     *
     * The worker never pools anything itself; the coordinator never
     * connects. A stopped worker (stop() or policy exhausted) stays stopped.
     */
    class ConnectionWorker
        : public std::enable_shared_from_this<ConnectionWorker> {
       public:
        using executor_type = boost::asio::any_io_executor;

        ConnectionWorker(executor_type ex, std::size_t index,
                         ConnectionFactory const& factory,
                         std::shared_ptr<RestartPolicy> policy,
                         std::weak_ptr<WorkerCoordinator> coordinator);

        ConnectionWorker(const ConnectionWorker&) = delete;
        ConnectionWorker& operator=(const ConnectionWorker&) = delete;

        /// @brief Spawn the run loop. Idempotent.
        void start();

        /// @brief End the run loop and disconnect. Thread-safe.
        void stop();

        /// @brief The connection behind `holder` is unusable. Thread-safe;
        /// stale holder ids are ignored.
        void report_failure(HolderId holder, Error reason);

        /// @brief Ping the connection for the coordinator's idle sweep, then
        /// check the holder back in (or report failure).
        void ping(Transfer transfer);

        Connection* connection() const noexcept { return connection_.get(); }

        std::size_t index() const noexcept { return index_; }

        /// @brief Successful connects so far (the first one included).
        std::uint64_t connect_count() const noexcept {
            return connect_count_.load(std::memory_order_relaxed);
        }

        bool running() const noexcept {
            return running_.load(std::memory_order_acquire);
        }

       private:
        // Spawn entry points; `self` keeps the worker alive while they run.
        static boost::asio::awaitable<void> run_owned(
            std::shared_ptr<ConnectionWorker> self);
        static boost::asio::awaitable<void> ping_owned(
            std::shared_ptr<ConnectionWorker> self, Transfer transfer);

        boost::asio::awaitable<void> run();
        boost::asio::awaitable<void> ping_on_strand(Transfer transfer);
        void fail_on_strand(HolderId holder, Error reason);

        boost::asio::strand<executor_type> strand_;
        std::size_t index_;
        std::unique_ptr<Connection> connection_;
        std::shared_ptr<RestartPolicy> policy_;
        std::weak_ptr<WorkerCoordinator> coordinator_;

        // Strand-only state
        boost::asio::steady_timer wake_;
        std::optional<HolderId> holder_;
        bool stopped_{false};

        std::atomic<bool> running_{false};
        std::atomic<std::uint64_t> connect_count_{0};
    };

}  // namespace conn_broker
