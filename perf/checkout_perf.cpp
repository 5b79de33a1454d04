#include <gtest/gtest.h>

#include <algorithm>
#include <atomic>
#include <boost/asio/co_spawn.hpp>
#include <boost/asio/detached.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/steady_timer.hpp>
#include <boost/asio/this_coro.hpp>
#include <boost/asio/use_awaitable.hpp>
#include <chrono>
#include <iomanip>
#include <iostream>
#include <mutex>
#include <thread>
#include <vector>

#include "conn_broker/connection/connection_pool.hpp"
#include "support/fake_connection.hpp"

namespace net = boost::asio;
using namespace conn_broker;
using namespace std::chrono_literals;

static void print_result(const char* label, int iters,
                         std::chrono::nanoseconds total,
                         std::chrono::nanoseconds min,
                         std::chrono::nanoseconds max) {
    const double total_ms =
        std::chrono::duration<double, std::milli>(total).count();
    const double avg_us =
        std::chrono::duration<double, std::micro>(total).count() / iters;
    const double min_us =
        std::chrono::duration<double, std::micro>(min).count();
    const double max_ms =
        std::chrono::duration<double, std::milli>(max).count();

    std::cout << "\n[ PERF ] " << label << "\n"
              << "        iters=" << iters << " total_ms=" << std::fixed
              << std::setprecision(2) << total_ms << " avg_us=" << std::fixed
              << std::setprecision(2) << avg_us << " min_us=" << std::fixed
              << std::setprecision(2) << min_us << " max_ms=" << std::fixed
              << std::setprecision(2) << max_ms << "\n";
}

struct PerfRun {
    std::atomic<int> finished{0};
    std::atomic<int> ok{0};
    std::atomic<int> errors{0};
    std::mutex mu;
    std::chrono::nanoseconds total{0};
    std::chrono::nanoseconds min{std::chrono::nanoseconds::max()};
    std::chrono::nanoseconds max{0};

    void sample(std::chrono::nanoseconds d) {
        std::lock_guard<std::mutex> lk(mu);
        total += d;
        min = std::min(min, d);
        max = std::max(max, d);
    }
};

static net::awaitable<void> checkout_cycles(PoolHandle pool, int rounds,
                                            std::chrono::microseconds hold,
                                            PerfRun& run) {
    net::steady_timer pause(co_await net::this_coro::executor);
    for (int r = 0; r < rounds; ++r) {
        const auto t0 = std::chrono::steady_clock::now();
        auto res = co_await pool->checkout();
        run.sample(std::chrono::steady_clock::now() - t0);
        if (!res) {
            ++run.errors;
            continue;
        }
        auto h = std::move(res).value();
        if (hold.count() > 0) {
            pause.expires_after(hold);
            co_await pause.async_wait(net::use_awaitable);
        }
        if (pool->checkin(h)) {
            ++run.ok;
        } else {
            ++run.errors;
        }
    }
    ++run.finished;
}

// `callers` coroutines each do `rounds` checkout / hold / checkin cycles on
// `threads` io threads against a pool of `pool_size` fake connections.
static void run_contention(const char* label, std::size_t pool_size,
                           int callers, int rounds, int threads,
                           std::chrono::microseconds hold) {
    net::io_context ioc(threads);
    auto backend = std::make_shared<test_support::FakeBackend>();

    PoolConfiguration cfg;
    cfg.name = "perf";
    cfg.pool_size = pool_size;
    cfg.idle_interval = 0ms;
    cfg.timeout = 30000ms;
    // Keep the overload controller out of the measurement.
    cfg.overload.target = 60000ms;
    cfg.overload.interval = 600000ms;

    auto started = ConnectionPool::start(
        ioc.get_executor(), test_support::fake_factory(backend), cfg);
    ASSERT_TRUE(started);
    auto pool = std::move(started).value();

    PerfRun run;
    for (int c = 0; c < callers; ++c) {
        net::co_spawn(ioc, checkout_cycles(pool, rounds, hold, run),
                      net::detached);
    }

    const auto wall0 = std::chrono::steady_clock::now();
    std::vector<std::thread> pool_threads;
    for (int t = 0; t < threads; ++t) {
        pool_threads.emplace_back([&ioc] { ioc.run(); });
    }
    while (run.finished.load() < callers &&
           std::chrono::steady_clock::now() - wall0 < 60s) {
        std::this_thread::sleep_for(1ms);
    }
    const auto wall = std::chrono::steady_clock::now() - wall0;

    pool->stop();
    ioc.stop();
    for (auto& t : pool_threads) t.join();

    print_result(label, callers * rounds, run.total, run.min, run.max);
    std::cout << "        wall_ms="
              << std::chrono::duration<double, std::milli>(wall).count()
              << " served_from_queue="
              << pool->metrics().checkout_served_from_queue.load()
              << " immediate=" << pool->metrics().checkout_immediate.load()
              << "\n";

    EXPECT_EQ(run.finished.load(), callers);
    EXPECT_EQ(run.ok.load(), callers * rounds);
    EXPECT_EQ(run.errors.load(), 0);
}

TEST(CheckoutPerf, UncontendedSingleCaller) {
    run_contention("uncontended: 1 caller, pool 4", 4, 1, 20000, 1, 0us);
}

TEST(CheckoutPerf, ContendedManyCallers) {
    run_contention("contended: 64 callers, pool 4, 4 threads", 4, 64, 200, 4,
                   100us);
}

TEST(CheckoutPerf, HeavilyQueued) {
    run_contention("queued: 256 callers, pool 2, 2 threads", 2, 256, 20, 2,
                   50us);
}
