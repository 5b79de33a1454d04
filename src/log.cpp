#include "conn_broker/log.hpp"

#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

#include <mutex>
#include <utility>

namespace conn_broker::log {

    namespace {

        std::mutex g_mu;

        std::shared_ptr<spdlog::logger>& storage() {
            static std::shared_ptr<spdlog::logger> instance = [] {
                auto existing = spdlog::get("conn_broker");
                if (existing) return existing;
                auto l = spdlog::stdout_color_mt("conn_broker");
                l->set_pattern("%Y-%m-%d %H:%M:%S.%e [%n] [%^%l%$] %v");
                l->set_level(spdlog::level::warn);
                return l;
            }();
            return instance;
        }

    }  // namespace

    std::shared_ptr<spdlog::logger> logger() {
        std::lock_guard<std::mutex> lk(g_mu);
        return storage();
    }

    void set_level(spdlog::level::level_enum level) {
        std::lock_guard<std::mutex> lk(g_mu);
        storage()->set_level(level);
    }

    void set_logger(std::shared_ptr<spdlog::logger> logger) {
        if (!logger) return;
        std::lock_guard<std::mutex> lk(g_mu);
        storage() = std::move(logger);
    }

}  // namespace conn_broker::log
