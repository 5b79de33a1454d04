#pragma once

#include <spdlog/logger.h>

#include <memory>

namespace conn_broker::log {

    /// @brief Library-wide logger ("conn_broker"), created on first use with
    /// a colour stdout sink at warn level.
    std::shared_ptr<spdlog::logger> logger();

    /// @brief Adjust the library log level (e.g. debug while diagnosing
    /// queueing or ownership problems).
    void set_level(spdlog::level::level_enum level);

    /// @brief Route library logs to a caller-provided logger instead.
    void set_logger(std::shared_ptr<spdlog::logger> logger);

}  // namespace conn_broker::log
