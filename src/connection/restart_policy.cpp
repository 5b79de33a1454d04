#include "conn_broker/connection/restart_policy.hpp"

#include <algorithm>

namespace conn_broker {

    BackoffRestartPolicy::BackoffRestartPolicy(BackoffConfiguration cfg,
                                               std::uint32_t seed)
        : cfg_(cfg), rng_(seed) {
        if (cfg_.max < cfg_.min) cfg_.max = cfg_.min;
    }

    std::optional<std::chrono::milliseconds> BackoffRestartPolicy::next_delay(
        std::size_t attempt) {
        switch (cfg_.type) {
            case BackoffType::Stop:
                return std::nullopt;
            case BackoffType::Exponential:
                return exponential(attempt);
            case BackoffType::Random:
                return uniform(cfg_.min, cfg_.max);
            case BackoffType::RandomExponential: {
                // Jitter within [previous step, current step].
                auto hi = exponential(attempt);
                auto lo = attempt == 0 ? cfg_.min : exponential(attempt - 1);
                return uniform(lo, hi);
            }
        }
        return std::nullopt;
    }

    std::chrono::milliseconds BackoffRestartPolicy::exponential(
        std::size_t attempt) const {
        auto delay = std::max(cfg_.min, std::chrono::milliseconds(1));
        for (std::size_t i = 0; i < attempt && delay < cfg_.max; ++i) {
            delay *= 2;
        }
        return std::min(delay, cfg_.max);
    }

    std::chrono::milliseconds BackoffRestartPolicy::uniform(
        std::chrono::milliseconds lo, std::chrono::milliseconds hi) {
        if (hi <= lo) return lo;
        std::uniform_int_distribution<std::chrono::milliseconds::rep> dist(
            lo.count(), hi.count());
        std::lock_guard<std::mutex> lk(mu_);
        return std::chrono::milliseconds(dist(rng_));
    }

}  // namespace conn_broker
