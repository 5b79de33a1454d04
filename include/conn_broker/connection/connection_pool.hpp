#pragma once

#include <atomic>
#include <utility>  // boost 1.74 awaitable.hpp uses std::exchange without including it
#include <boost/asio/any_io_executor.hpp>
#include <boost/asio/awaitable.hpp>
#include <boost/asio/steady_timer.hpp>
#include <boost/asio/strand.hpp>
#include <chrono>
#include <cstdint>
#include <deque>
#include <list>
#include <memory>
#include <mutex>
#include <optional>
#include <unordered_map>
#include <vector>

#include "conn_broker/config.hpp"
#include "conn_broker/connection/connection.hpp"
#include "conn_broker/connection/connection_pool_types.hpp"
#include "conn_broker/connection/connection_worker.hpp"
#include "conn_broker/connection/restart_policy.hpp"
#include "conn_broker/error.hpp"
#include "conn_broker/overload_controller.hpp"
#include "conn_broker/result.hpp"

namespace conn_broker {

    /**
     * Pool coordinator: multiplexes callers over a fixed set of worker
     * connections.
     *
     * SAFETY:
     * - All public methods are thread-safe and can be called from any thread
     * - One mutex guards all state; every event below runs entirely under it
     * - Waiter and deadline timers live on the pool strand, wakeups are
     *   posted there, so a wakeup can never overtake the wait it targets
     *
     * INVARIANTS:
     * 1. Ready  => the queue holds only idle holders (at least one)
     * 2. Busy   => the queue holds only waiters (possibly none)
     * 3. A holder is in exactly one place: idle, checked out or pinging
     * 4. checked out + idle + pinging == connected <= pool_size
     * 5. A checkin is accepted only with the holder's current lock
     * 6. Every waiter gets exactly one outcome
     *
     * ERRORS (checkout):
     * - Busy: queueing disabled and nothing idle
     * - Overloaded: shed by the overload controller (on entry or from queue)
     * - CheckoutTimeout / Cancelled: waiter expired or cancelled
     * - Shutdown: pool stopped
     *
     * LIFECYCLE:
     * 1. start(): validates configuration, spawns pool_size workers
     * 2. Workers announce holders, callers checkout() / checkin()
     * 3. stop(): fails waiters, revokes handles, stops workers
     */
    class ConnectionPool : public WorkerCoordinator,
                           public std::enable_shared_from_this<ConnectionPool> {
       public:
        using executor_type = boost::asio::any_io_executor;
        using clock_type = std::chrono::steady_clock;

        /**
         * Caller side of a checkout. Move-only; destroying a handle that is
         * still valid checks it in.
         */
        class CheckoutHandle {
           public:
            CheckoutHandle() = default;

            CheckoutHandle(CheckoutHandle&& other) noexcept {
                move_from(std::move(other));
            }

            CheckoutHandle& operator=(CheckoutHandle&& other) noexcept {
                if (this != &other) {
                    reset();
                    move_from(std::move(other));
                }
                return *this;
            }

            CheckoutHandle(CheckoutHandle const&) = delete;
            CheckoutHandle& operator=(CheckoutHandle const&) = delete;

            ~CheckoutHandle() { reset(); }

            Connection* operator->() const noexcept { return get(); }

            Connection& operator*() const { return *get(); }

            /// @brief The connection, or nullptr once checked in or revoked
            Connection* get() const noexcept {
                if (!state_ ||
                    state_->phase.load(std::memory_order_acquire) !=
                        Phase::Active)
                    return nullptr;
                return transfer_.ref;
            }

            /// @brief Downcast to the adapter type, nullptr if inert or not a T
            template <typename T>
            T* as() const noexcept {
                return dynamic_cast<T*>(get());
            }

            explicit operator bool() const noexcept { return get() != nullptr; }

            Transfer const& transfer() const noexcept { return transfer_; }

            HolderId holder_id() const noexcept { return transfer_.holder; }

            Lock lock() const noexcept { return transfer_.lock; }

            /// @brief Ok while the handle owns its holder, otherwise the
            /// reason it does not.
            Result<void> status() const;

            /// @brief The caller found the connection dead. Checkin will purge
            /// the holder and restart its worker instead of queueing it.
            void mark_broken() noexcept { broken_ = true; }

            bool broken() const noexcept { return broken_; }

           private:
            friend class ConnectionPool;

            enum class Phase : std::uint8_t {
                Active,
                CheckedIn,
                Lost,
                Expired,
                Shutdown
            };

            /// @brief Shared with the pool, which flips it under its lock
            struct State {
                std::atomic<Phase> phase{Phase::Active};
            };

            CheckoutHandle(std::weak_ptr<ConnectionPool> pool,
                           std::shared_ptr<State> state, Transfer transfer)
                : pool_(std::move(pool)),
                  state_(std::move(state)),
                  transfer_(transfer) {}

            /// @brief Check in if still active, then drop everything
            void reset() noexcept;

            void move_from(CheckoutHandle&& other) noexcept {
                pool_ = std::move(other.pool_);
                state_ = std::move(other.state_);
                transfer_ = other.transfer_;
                broken_ = other.broken_;
                other.transfer_ = Transfer{};
                other.broken_ = false;
            }

            std::weak_ptr<ConnectionPool> pool_;
            std::shared_ptr<State> state_;
            Transfer transfer_{};
            bool broken_{false};
        };

        /// @brief Validate `cfg`, create the pool and start its workers.
        /// @param policy Restart policy shared by the workers; defaults to a
        /// BackoffRestartPolicy built from cfg.backoff.
        static Result<std::shared_ptr<ConnectionPool>> start(
            executor_type ex, ConnectionFactory factory, PoolConfiguration cfg,
            std::shared_ptr<RestartPolicy> policy = nullptr);

       private:
        struct PrivateTag {
            explicit PrivateTag() = default;
        };

       public:
        /// @brief Use start(); public only for std::make_shared.
        ConnectionPool(PrivateTag, executor_type ex, PoolConfiguration cfg);

        ~ConnectionPool() override;

        ConnectionPool(const ConnectionPool&) = delete;
        ConnectionPool& operator=(const ConnectionPool&) = delete;

        /// @brief Obtain exclusive use of a connection.
        /// @note Completes at once when Ready; otherwise queues (FIFO) until
        /// served, timed out, cancelled, shed or shut down.
        boost::asio::awaitable<Result<CheckoutHandle>> checkout(
            CheckoutOptions opts = {});

        /// @brief Return the handle's holder. The handle becomes inert.
        Result<void> checkin(CheckoutHandle& handle);

        /// @brief Protocol-level checkin with the {holder, lock} pair.
        Result<void> checkin(const Transfer& transfer) override;

        /// @brief Allocate a ticket to pass in CheckoutOptions::ticket.
        Ticket new_ticket() noexcept {
            return next_ticket_.fetch_add(1, std::memory_order_relaxed);
        }

        /// @brief Cancel the pending checkout registered with `ticket`.
        /// @return true if a waiting checkout was cancelled by this call
        bool cancel(Ticket ticket);

        /// @brief Fail all waiters, revoke all handles, stop the workers.
        /// Idempotent.
        void stop();

        Result<HolderId> announce_ready(
            std::shared_ptr<ConnectionWorker> worker) override;

        void announce_failed(HolderId holder, Error reason) override;

        PoolStats stats() const;

        PoolMetrics const& metrics() const noexcept { return metrics_; }

        PoolConfiguration const& config() const noexcept { return cfg_; }

        std::vector<std::shared_ptr<ConnectionWorker>> workers() const;

       private:
        using HandleState = CheckoutHandle::State;
        using HandlePhase = CheckoutHandle::Phase;

        enum class Place : std::uint8_t { Idle, CheckedOut, Pinging };

        struct Holder {
            HolderId id{0};
            std::weak_ptr<ConnectionWorker> worker;
            Connection* conn{nullptr};
            Place place{Place::Idle};
            Lock lock{0};       ///< Current checkout, 0 while pool-owned
            Lock last_lock{0};  ///< Most recent lock checked in
            clock_type::time_point checkin_time{};
            std::optional<clock_type::time_point> deadline;
            std::shared_ptr<boost::asio::steady_timer> deadline_timer;
            std::shared_ptr<HandleState> owner;
        };

        struct Waiter {
            enum class Outcome : std::uint8_t {
                Pending,
                Served,
                TimedOut,
                Cancelled,
                Dropped,
                Shutdown
            };

            explicit Waiter(boost::asio::strand<executor_type> const& strand)
                : timer(strand) {}

            std::uint64_t seq{0};
            Ticket ticket{0};
            clock_type::time_point enqueued_at{};
            clock_type::time_point expires_at{};
            std::optional<std::chrono::milliseconds> hold_timeout;
            boost::asio::steady_timer timer;

            Outcome outcome{Outcome::Pending};
            bool queued{false};
            std::list<std::shared_ptr<Waiter>>::iterator pos;

            // Set together with Outcome::Served
            std::optional<Transfer> transfer;
            std::shared_ptr<HandleState> handle_state;
        };

        using CheckoutSlot =
            std::shared_ptr<std::optional<Result<CheckoutHandle>>>;
        static boost::asio::awaitable<void> checkout_into_(
            std::shared_ptr<ConnectionPool> self, CheckoutOptions opts,
            CheckoutSlot out);
        boost::asio::awaitable<Result<CheckoutHandle>> checkout_on_strand_(
            CheckoutOptions opts);

        Result<void> checkin_locked_(const Transfer& transfer,
                                     HandleState const* state, bool broken,
                                     std::shared_ptr<ConnectionWorker>& failed);

        /// @brief Give `h` a fresh lock and hand it to a new owner
        Transfer hand_out_locked_(Holder& h, std::shared_ptr<HandleState> owner,
                                  std::optional<std::chrono::milliseconds> hold,
                                  clock_type::time_point now);

        /// @brief `h` is back with the pool: serve the oldest live waiter or
        /// queue it as idle
        void make_available_locked_(Holder& h, clock_type::time_point now);

        void finish_waiter_locked_(std::shared_ptr<Waiter> const& w,
                                   Waiter::Outcome outcome);

        void unqueue_waiter_locked_(Waiter& w);

        void clear_deadline_locked_(Holder& h);

        void purge_holder_locked_(
            std::unordered_map<HolderId, Holder>::iterator it);

        void reclaim_(HolderId id, Lock lock);

        void schedule_idle_sweep_();

        void idle_sweep_();

        void publish_gauges_locked_();

        void check_invariants_locked_() const;

        executor_type ex_;
        boost::asio::strand<executor_type> strand_;
        PoolConfiguration cfg_;
        PoolMetrics metrics_;

        mutable std::mutex mu_;
        PoolStatus status_{PoolStatus::Busy};
        std::unordered_map<HolderId, Holder> holders_;
        std::deque<HolderId> idle_;  ///< Oldest checkin first
        std::list<std::shared_ptr<Waiter>> waiters_;  ///< Oldest first
        std::size_t checked_out_{0};
        std::size_t pinging_{0};
        OverloadController overload_;
        bool shutting_down_{false};

        HolderId next_holder_{1};
        Lock next_lock_{1};
        std::uint64_t next_seq_{1};
        std::atomic<Ticket> next_ticket_{1};

        std::vector<std::shared_ptr<ConnectionWorker>> workers_;
        std::shared_ptr<boost::asio::steady_timer> idle_timer_;
    };

    using PoolHandle = std::shared_ptr<ConnectionPool>;
    using CheckoutHandle = ConnectionPool::CheckoutHandle;

}  // namespace conn_broker
