#pragma once
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <string>

#include "conn_broker/result.hpp"

namespace conn_broker {

    /** @brief How a worker spaces out reconnect attempts. */
    enum class BackoffType : std::uint8_t {
        Stop,           /**< Never reconnect after a failure. */
        Exponential,    /**< Double the delay each attempt, up to the max. */
        Random,         /**< Uniform random delay between min and max. */
        RandomExponential /**< Exponential growth with random jitter. */
    };

    inline const char* to_string(BackoffType t) {
        switch (t) {
            case BackoffType::Stop:
                return "stop";
            case BackoffType::Exponential:
                return "exp";
            case BackoffType::Random:
                return "rand";
            case BackoffType::RandomExponential:
                return "rand_exp";
        }
        return "unknown";
    }

    /**
     * @brief Thresholds of the controlled-delay overload controller.
     */
    struct OverloadConfiguration {
        /** @brief Acceptable queue wait; sustained waits above it are
         * congestion. */
        std::chrono::milliseconds target{50};

        /** @brief Window over which the minimum wait must stay above target
         * before requests are shed. */
        std::chrono::milliseconds interval{1000};
    };

    /**
     * @brief Restart policy parameters for connection workers.
     */
    struct BackoffConfiguration {
        BackoffType type{BackoffType::RandomExponential};
        std::chrono::milliseconds min{1000};
        std::chrono::milliseconds max{30000};
    };

    /// @brief Upper bound accepted for PoolConfiguration::pool_size.
    inline constexpr std::size_t kMaxPoolSize = 4096;

    /**
     * @brief Configuration for a connection pool.
     */
    struct PoolConfiguration {
        /** @brief Name used in log lines. */
        std::string name{"conn_broker"};

        /** @brief Number of connection workers started with the pool. */
        std::size_t pool_size{1};

        /** @brief Whether checkouts queue when the pool is busy, or fail fast.
         */
        bool queue{true};

        /** @brief Default maximum time a checkout waits in the queue. */
        std::chrono::milliseconds timeout{15000};

        /** @brief Queue wait thresholds (queue_target / queue_interval). */
        OverloadConfiguration overload{};

        /** @brief Period of the idle ping sweep, zero disables it. */
        std::chrono::milliseconds idle_interval{1000};

        /** @brief Reconnect backoff of the default restart policy. */
        BackoffConfiguration backoff{};

        /// @brief Check the configuration for values the pool cannot run with.
        Result<void> validate() const;
    };

}  // namespace conn_broker
