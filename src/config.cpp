#include "conn_broker/config.hpp"

#include <cstdint>
#include <stdexcept>
#include <string>

#include "conn_broker/config_json.hpp"

namespace conn_broker {

    Result<void> PoolConfiguration::validate() const {
        if (pool_size == 0 || pool_size > kMaxPoolSize) {
            return Result<void>::err(
                Error::Code::InvalidConfiguration,
                "pool_size must be in [1, " + std::to_string(kMaxPoolSize) +
                    "]");
        }
        if (timeout.count() <= 0) {
            return Result<void>::err(Error::Code::InvalidConfiguration,
                                     "timeout must be positive");
        }
        if (overload.target.count() <= 0 || overload.interval.count() <= 0) {
            return Result<void>::err(
                Error::Code::InvalidConfiguration,
                "queue_target and queue_interval must be positive");
        }
        if (idle_interval.count() < 0) {
            return Result<void>::err(Error::Code::InvalidConfiguration,
                                     "idle_interval must not be negative");
        }
        if (backoff.min.count() < 0 || backoff.min > backoff.max) {
            return Result<void>::err(
                Error::Code::InvalidConfiguration,
                "backoff_min must be in [0, backoff_max]");
        }
        return Result<void>::ok();
    }

    namespace {

        void read_ms(const nlohmann::json& j, const char* key,
                     std::chrono::milliseconds& out) {
            if (auto it = j.find(key); it != j.end()) {
                out = std::chrono::milliseconds(it->get<std::int64_t>());
            }
        }

    }  // namespace

    void from_json(const nlohmann::json& j, BackoffType& out) {
        const auto s = j.get<std::string>();
        if (s == "stop") {
            out = BackoffType::Stop;
        } else if (s == "exp") {
            out = BackoffType::Exponential;
        } else if (s == "rand") {
            out = BackoffType::Random;
        } else if (s == "rand_exp") {
            out = BackoffType::RandomExponential;
        } else {
            throw std::invalid_argument("unknown backoff_type '" + s + "'");
        }
    }

    void from_json(const nlohmann::json& j, PoolConfiguration& out) {
        if (auto it = j.find("name"); it != j.end()) it->get_to(out.name);
        if (auto it = j.find("pool_size"); it != j.end()) {
            // Read signed: a negative value must not wrap into a huge size.
            const auto n = it->get<std::int64_t>();
            if (n <= 0) {
                throw std::invalid_argument("pool_size must be positive, got " +
                                            std::to_string(n));
            }
            out.pool_size = static_cast<std::size_t>(n);
        }
        if (auto it = j.find("queue"); it != j.end()) it->get_to(out.queue);
        read_ms(j, "timeout", out.timeout);
        read_ms(j, "queue_target", out.overload.target);
        read_ms(j, "queue_interval", out.overload.interval);
        read_ms(j, "idle_interval", out.idle_interval);
        if (auto it = j.find("backoff_type"); it != j.end())
            it->get_to(out.backoff.type);
        read_ms(j, "backoff_min", out.backoff.min);
        read_ms(j, "backoff_max", out.backoff.max);
    }

    void to_json(nlohmann::json& j, const PoolConfiguration& cfg) {
        j = nlohmann::json{
            {"name", cfg.name},
            {"pool_size", cfg.pool_size},
            {"queue", cfg.queue},
            {"timeout", cfg.timeout.count()},
            {"queue_target", cfg.overload.target.count()},
            {"queue_interval", cfg.overload.interval.count()},
            {"idle_interval", cfg.idle_interval.count()},
            {"backoff_type", to_string(cfg.backoff.type)},
            {"backoff_min", cfg.backoff.min.count()},
            {"backoff_max", cfg.backoff.max.count()},
        };
    }

    Result<PoolConfiguration> load_pool_configuration(std::string_view text) {
        PoolConfiguration cfg;
        try {
            auto j = nlohmann::json::parse(text.begin(), text.end());
            if (!j.is_object()) {
                return Result<PoolConfiguration>::err(
                    Error::Code::InvalidConfiguration,
                    "pool configuration must be a JSON object");
            }
            j.get_to(cfg);
        } catch (const nlohmann::json::exception& e) {
            return Result<PoolConfiguration>::err(
                Error::Code::InvalidConfiguration,
                std::string("invalid pool configuration: ") + e.what());
        } catch (const std::invalid_argument& e) {
            return Result<PoolConfiguration>::err(
                Error::Code::InvalidConfiguration,
                std::string("invalid pool configuration: ") + e.what());
        }

        auto valid = cfg.validate();
        if (valid.has_error()) {
            return Result<PoolConfiguration>::err(valid.error());
        }
        return Result<PoolConfiguration>::ok(std::move(cfg));
    }

}  // namespace conn_broker
