#pragma once

#include <nlohmann/json.hpp>
#include <string_view>

#include "conn_broker/config.hpp"
#include "conn_broker/result.hpp"

namespace conn_broker {

    // ADL hooks so `j.get_to(cfg)` works. Durations are integer milliseconds,
    // unknown keys are ignored and missing keys keep their defaults.
    void from_json(const nlohmann::json& j, BackoffType& out);
    void from_json(const nlohmann::json& j, PoolConfiguration& out);
    void to_json(nlohmann::json& j, const PoolConfiguration& cfg);

    /// @brief Parse and validate a pool configuration from JSON text.
    /// @return InvalidConfiguration on malformed JSON, wrong types or values
    /// rejected by PoolConfiguration::validate().
    Result<PoolConfiguration> load_pool_configuration(std::string_view text);

}  // namespace conn_broker
