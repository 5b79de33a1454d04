#include "conn_broker/overload_controller.hpp"

#include <cmath>

namespace conn_broker {

    void OverloadController::record(duration delay, time_point now) {
        roll_window(now);
        if (!window_min_ || delay < *window_min_) window_min_ = delay;

        if (*window_min_ < cfg_.target) {
            // Minimum fell back under target: congestion is over.
            above_since_.reset();
            dropping_ = false;
            count_ = 0;
            return;
        }

        if (!above_since_) above_since_ = now;
    }

    bool OverloadController::admit(time_point now) {
        update_phase(now);
        return !dropping_;
    }

    bool OverloadController::drop_due(time_point now) {
        update_phase(now);
        if (!dropping_ || now < drop_next_) return false;

        ++count_;
        drop_next_ = control_law(now);
        return true;
    }

    void OverloadController::reset() noexcept {
        window_start_ = {};
        window_min_.reset();
        above_since_.reset();
        dropping_ = false;
        count_ = 0;
        drop_next_ = {};
    }

    void OverloadController::roll_window(time_point now) {
        if (window_start_ == time_point{} ||
            now - window_start_ >= cfg_.interval) {
            window_start_ = now;
            window_min_.reset();
        }
    }

    void OverloadController::update_phase(time_point now) {
        if (dropping_ || !above_since_) return;
        if (now - *above_since_ < cfg_.interval) return;

        dropping_ = true;
        count_ = 0;
        drop_next_ = now;
    }

    OverloadController::time_point OverloadController::control_law(
        time_point t) const {
        const double n = static_cast<double>(count_ == 0 ? 1 : count_);
        const auto step = std::chrono::duration_cast<duration>(
            std::chrono::duration<double, duration::period>(
                static_cast<double>(
                    std::chrono::duration_cast<duration>(cfg_.interval)
                        .count()) /
                std::sqrt(n)));
        return t + step;
    }

}  // namespace conn_broker
