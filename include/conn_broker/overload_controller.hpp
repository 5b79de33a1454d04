#pragma once

#include <chrono>
#include <cstddef>
#include <optional>

#include "conn_broker/config.hpp"

namespace conn_broker {

    /**
     * Controlled-delay (CoDel) overload detector for the checkout queue.
     *
     * Fed with the queue wait of every served checkout (zero for immediate
     * service). Samples are folded into a minimum per interval-long window.
     * Congestion starts once a window's minimum is above target and ends as
     * soon as the minimum falls below it; once congestion has lasted a full
     * interval the controller is "dropping":
     * - admit() rejects every request that would have to queue
     * - drop_due() fires at the interval boundary, then at
     *   interval / sqrt(n) spacing, telling the pool to shed the oldest waiter
     *
     * Not thread-safe: owned and driven by the pool under its lock. Time is
     * passed in so the phases can be driven deterministically.
     */
    class OverloadController {
       public:
        using clock_type = std::chrono::steady_clock;
        using time_point = clock_type::time_point;
        using duration = clock_type::duration;

        explicit OverloadController(OverloadConfiguration cfg = {}) noexcept
            : cfg_(cfg) {}

        /// @brief Record one queue wait sample.
        void record(duration delay, time_point now);

        /// @brief Whether a request that must queue may be enqueued.
        bool admit(time_point now);

        /// @brief Whether the next dequeue should drop instead of serve.
        bool drop_due(time_point now);

        bool dropping() const noexcept { return dropping_; }

        /// @brief True while the window minimum stays above target (before or
        /// during dropping).
        bool congested() const noexcept { return above_since_.has_value(); }

        /// @brief Minimum sample of the current window, if any.
        std::optional<duration> window_min() const noexcept {
            return window_min_;
        }

        std::size_t drop_count() const noexcept { return count_; }

        OverloadConfiguration const& config() const noexcept { return cfg_; }

        void reset() noexcept;

       private:
        void roll_window(time_point now);
        void update_phase(time_point now);
        time_point control_law(time_point t) const;

        OverloadConfiguration cfg_;

        time_point window_start_{};
        std::optional<duration> window_min_;

        std::optional<time_point> above_since_;
        bool dropping_{false};
        std::size_t count_{0};
        time_point drop_next_{};
    };

}  // namespace conn_broker
