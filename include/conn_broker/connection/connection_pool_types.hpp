#pragma once

#include <atomic>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <optional>

namespace conn_broker {

    class Connection;

    /// @brief Identity of one holder; a reconnect yields a new id.
    using HolderId = std::uint64_t;

    /// @brief Identity of one checkout of a holder. 0 means "owned by the
    /// pool".
    using Lock = std::uint64_t;

    /// @brief Identity of a pending checkout, used to cancel it.
    using Ticket = std::uint64_t;

    /// @brief Pool state: which kind of entry the queue holds.
    enum class PoolStatus {
        Ready,  ///< Queue holds idle holders
        Busy    ///< Queue holds waiting callers (possibly none)
    };

    inline const char* to_string(PoolStatus s) {
        switch (s) {
            case PoolStatus::Ready:
                return "Ready";
            case PoolStatus::Busy:
                return "Busy";
        }
        return "Unknown";
    }

    /**
     * @brief Ownership-transfer message for one holder.
     *
     * Produced by the pool when it hands a holder to a caller (or to its
     * worker for an idle ping) and sent back on checkin. The receiver must
     * not touch `ref` before it owns the transfer, and the sender loses
     * access once the pool has recorded `lock`.
     */
    struct Transfer {
        HolderId holder{0};
        Lock lock{0};
        Connection* ref{nullptr};
        /// Time the holder last went back to the pool.
        std::chrono::steady_clock::time_point checkin_time{};
    };

    /**
     * @brief Per-call checkout options. Unset fields fall back to the pool
     * configuration.
     */
    struct CheckoutOptions {
        /// Queue when busy (true) or fail fast with Busy (false).
        std::optional<bool> queue;
        /// Maximum time spent waiting in the queue.
        std::optional<std::chrono::milliseconds> timeout;
        /// Maximum time the caller may keep the holder before the pool
        /// reclaims it. Unset means no limit.
        std::optional<std::chrono::milliseconds> hold_timeout;
        /// Ticket from ConnectionPool::new_ticket() for cancel().
        std::optional<Ticket> ticket;
    };

    /// @brief Metrics for monitoring pool behavior
    struct PoolMetrics {
        // Gauges (current state)
        std::atomic<std::size_t> connected{0};    ///< Holders alive
        std::atomic<std::size_t> idle{0};         ///< Holders in the queue
        std::atomic<std::size_t> checked_out{0};  ///< Holders out to callers
        std::atomic<std::size_t> waiting{0};      ///< Waiters in the queue

        // Counters (cumulative)
        std::atomic<std::uint64_t> checkout_immediate{0};  ///< Served at once
        std::atomic<std::uint64_t> checkout_queued{0};     ///< Enqueued
        std::atomic<std::uint64_t> checkout_served_from_queue{0};
        std::atomic<std::uint64_t> checkout_busy{0};        ///< Busy errors
        std::atomic<std::uint64_t> checkout_overloaded{0};  ///< Shed on entry
        std::atomic<std::uint64_t> checkout_timeout{0};     ///< Waiter expired
        std::atomic<std::uint64_t> checkout_cancelled{0};
        std::atomic<std::uint64_t> checkout_shutdown{0};
        std::atomic<std::uint64_t> waiters_dropped{0};  ///< Shed from queue

        std::atomic<std::uint64_t> checkin_ok{0};
        std::atomic<std::uint64_t> checkin_invalid{0};  ///< Stale lock
        std::atomic<std::uint64_t> checkin_duplicate{0};

        std::atomic<std::uint64_t> holders_ready{0};     ///< announce_ready
        std::atomic<std::uint64_t> holders_lost{0};      ///< announce_failed
        std::atomic<std::uint64_t> holders_reclaimed{0};  ///< Hold deadline
        std::atomic<std::uint64_t> idle_pings{0};
    };

    /// @brief Consistent snapshot of the pool, taken under its lock.
    struct PoolStats {
        PoolStatus status{PoolStatus::Busy};
        std::size_t pool_size{0};
        std::size_t connected{0};    ///< Holders alive (idle + out + pinging)
        std::size_t idle{0};         ///< Holders in the queue
        std::size_t waiting{0};      ///< Waiters in the queue
        std::size_t checked_out{0};  ///< Holders owned by callers
        std::size_t pinging{0};      ///< Holders lent to workers for a ping
        bool dropping{false};        ///< Overload controller shedding
        bool shutting_down{false};
    };

}  // namespace conn_broker
