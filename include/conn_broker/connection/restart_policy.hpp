#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <mutex>
#include <optional>
#include <random>

#include "conn_broker/config.hpp"

namespace conn_broker {

    /**
     * @brief Decides how long a worker waits before reconnecting.
     *
     * Supervision is not the pool's business: workers ask their policy after
     * every failed or lost connection, and stop for good on nullopt.
     */
    class RestartPolicy {
       public:
        virtual ~RestartPolicy() = default;

        /// @param attempt Failures since the last successful connect,
        /// starting at 0.
        virtual std::optional<std::chrono::milliseconds> next_delay(
            std::size_t attempt) = 0;
    };

    /**
     * @brief Backoff between BackoffConfiguration::min and ::max.
     */
    class BackoffRestartPolicy : public RestartPolicy {
       public:
        explicit BackoffRestartPolicy(BackoffConfiguration cfg,
                                      std::uint32_t seed = std::random_device{}());

        std::optional<std::chrono::milliseconds> next_delay(
            std::size_t attempt) override;

       private:
        std::chrono::milliseconds exponential(std::size_t attempt) const;
        std::chrono::milliseconds uniform(std::chrono::milliseconds lo,
                                          std::chrono::milliseconds hi);

        BackoffConfiguration cfg_;
        std::mutex mu_;
        std::mt19937 rng_;
    };

}  // namespace conn_broker
