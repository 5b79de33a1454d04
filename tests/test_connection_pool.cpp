
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
#include <limits>
#include <memory>
#include <mutex>
#include <optional>
#include <set>
#include <spdlog/logger.h>
#include <spdlog/sinks/base_sink.h>
#include <stdexcept>
#include <thread>
#include <vector>

#include "conn_broker/config.hpp"
#include "conn_broker/log.hpp"
#include "conn_broker/connection/connection_pool.hpp"
#include "support/fake_connection.hpp"

using namespace conn_broker;
using namespace std::chrono_literals;
using conn_broker::test_support::FakeBackend;

namespace {

    using Slot = std::shared_ptr<std::optional<Result<CheckoutHandle>>>;

    boost::asio::awaitable<void> checkout_into(PoolHandle pool,
                                               CheckoutOptions opts, Slot slot) {
        slot->emplace(co_await pool->checkout(opts));
    }

    /// Shared bookkeeping of the concurrent exclusivity test.
    struct ExclusivityTally {
        std::mutex mu;
        std::set<Connection*> in_use;
        std::size_t max_in_use = 0;
        std::atomic<int> violations{0};
        std::atomic<int> failures{0};
        std::atomic<int> finished{0};
    };

    boost::asio::awaitable<void> exclusive_caller(
        PoolHandle pool, int rounds, std::shared_ptr<ExclusivityTally> tally) {
        boost::asio::steady_timer pause(
            co_await boost::asio::this_coro::executor);
        for (int r = 0; r < rounds; ++r) {
            auto res = co_await pool->checkout();
            if (!res) {
                ++tally->failures;
                continue;
            }
            auto h = std::move(res).value();
            {
                std::lock_guard<std::mutex> lk(tally->mu);
                if (!tally->in_use.insert(h.get()).second) ++tally->violations;
                tally->max_in_use =
                    std::max(tally->max_in_use, tally->in_use.size());
            }
            pause.expires_after(1ms);
            co_await pause.async_wait(boost::asio::use_awaitable);
            {
                std::lock_guard<std::mutex> lk(tally->mu);
                tally->in_use.erase(h.get());
            }
            if (!pool->checkin(h)) ++tally->failures;
        }
        ++tally->finished;
    }

    class ThrowingSink : public spdlog::sinks::base_sink<std::mutex> {
       protected:
        void sink_it_(const spdlog::details::log_msg&) override {
            throw std::runtime_error("sink unavailable");
        }
        void flush_() override {}
    };

    class ConnectionPoolTest : public ::testing::Test {
       protected:
        void TearDown() override {
            for (auto& p : pools_) p->stop();
            run_for(50ms);
            pools_.clear();
        }

        /// Single worker, no idle sweep, fast restarts, overload control
        /// far out of reach.
        PoolConfiguration cfg(std::size_t size = 1) {
            PoolConfiguration c;
            c.name = "test";
            c.pool_size = size;
            c.idle_interval = 0ms;
            c.timeout = 5000ms;
            c.overload.target = 10000ms;
            c.overload.interval = 60000ms;
            c.backoff.type = BackoffType::Exponential;
            c.backoff.min = 1ms;
            c.backoff.max = 5ms;
            return c;
        }

        PoolHandle start(PoolConfiguration c) {
            auto r = ConnectionPool::start(
                io_.get_executor(), conn_broker::test_support::fake_factory(backend_),
                c);
            EXPECT_TRUE(r) << (r ? "" : r.error().message);
            if (!r) return nullptr;
            auto pool = std::move(r).value();
            pools_.push_back(pool);
            EXPECT_TRUE(run_until(
                [&] { return pool->stats().connected == c.pool_size; }));
            return pool;
        }

        template <typename Pred>
        bool run_until(Pred pred, std::chrono::milliseconds limit = 3000ms) {
            const auto deadline = std::chrono::steady_clock::now() + limit;
            while (!pred()) {
                if (std::chrono::steady_clock::now() >= deadline) return false;
                if (io_.stopped()) io_.restart();
                io_.run_one_for(5ms);
            }
            return true;
        }

        void run_for(std::chrono::milliseconds d) {
            if (io_.stopped()) io_.restart();
            io_.run_for(d);
        }

        Slot spawn_checkout(PoolHandle const& pool, CheckoutOptions opts = {}) {
            auto slot = std::make_shared<std::optional<Result<CheckoutHandle>>>();
            boost::asio::co_spawn(io_, checkout_into(pool, opts, slot),
                                  boost::asio::detached);
            return slot;
        }

        bool done(Slot const& slot) { return run_until([&] { return slot->has_value(); }); }

        CheckoutHandle checkout_now(PoolHandle const& pool,
                                    CheckoutOptions opts = {}) {
            auto slot = spawn_checkout(pool, opts);
            if (!done(slot)) {
                ADD_FAILURE() << "checkout did not complete";
                return CheckoutHandle{};
            }
            if (!**slot) {
                ADD_FAILURE() << "checkout failed: " << (*slot)->error().message;
                return CheckoutHandle{};
            }
            return std::move(**slot).value();
        }

        static std::shared_ptr<ConnectionWorker> worker_of(
            PoolHandle const& pool, Connection* conn) {
            for (auto& w : pool->workers()) {
                if (w->connection() == conn) return w;
            }
            return nullptr;
        }

        boost::asio::io_context io_;
        std::shared_ptr<FakeBackend> backend_ = std::make_shared<FakeBackend>();
        std::vector<PoolHandle> pools_;
    };

    TEST_F(ConnectionPoolTest, StartAnnouncesEveryWorker) {
        auto pool = start(cfg(3));
        ASSERT_TRUE(pool);

        auto s = pool->stats();
        EXPECT_EQ(s.status, PoolStatus::Ready);
        EXPECT_EQ(s.connected, 3u);
        EXPECT_EQ(s.idle, 3u);
        EXPECT_EQ(s.waiting, 0u);
        EXPECT_EQ(s.checked_out, 0u);
        EXPECT_EQ(pool->metrics().holders_ready.load(), 3u);
        EXPECT_EQ(backend_->connects.load(), 3);
    }

    TEST_F(ConnectionPoolTest, StartRejectsInvalidConfiguration) {
        auto c = cfg();
        c.pool_size = 0;
        auto r = ConnectionPool::start(
            io_.get_executor(), conn_broker::test_support::fake_factory(backend_), c);
        ASSERT_FALSE(r);
        EXPECT_EQ(r.code(), Error::Code::InvalidConfiguration);

        auto r2 = ConnectionPool::start(io_.get_executor(), ConnectionFactory{},
                                        cfg());
        ASSERT_FALSE(r2);
        EXPECT_EQ(r2.code(), Error::Code::InvalidConfiguration);
    }

    TEST_F(ConnectionPoolTest, StartRejectsOversizedPoolWithoutThrowing) {
        for (std::size_t size :
             {kMaxPoolSize + 1, std::numeric_limits<std::size_t>::max()}) {
            auto c = cfg();
            c.pool_size = size;
            Result<PoolHandle> r = Result<PoolHandle>::err(
                Error::Code::InternalError, "not started");
            EXPECT_NO_THROW(r = ConnectionPool::start(
                                io_.get_executor(),
                                conn_broker::test_support::fake_factory(backend_),
                                c));
            ASSERT_FALSE(r);
            EXPECT_EQ(r.code(), Error::Code::InvalidConfiguration);
        }
        run_for(20ms);
        EXPECT_EQ(backend_->connects.load(), 0);
    }

    TEST_F(ConnectionPoolTest, CheckoutAndCheckinRoundTrip) {
        auto pool = start(cfg());
        ASSERT_TRUE(pool);

        auto h = checkout_now(pool);
        ASSERT_TRUE(h);
        EXPECT_NE(h.get(), nullptr);
        EXPECT_NE(h.lock(), 0u);
        EXPECT_EQ(pool->stats().status, PoolStatus::Busy);
        EXPECT_EQ(pool->stats().checked_out, 1u);

        EXPECT_TRUE(pool->checkin(h));
        EXPECT_EQ(h.get(), nullptr);
        EXPECT_FALSE(h);

        auto s = pool->stats();
        EXPECT_EQ(s.status, PoolStatus::Ready);
        EXPECT_EQ(s.idle, 1u);
        EXPECT_EQ(s.checked_out, 0u);
        EXPECT_EQ(pool->metrics().checkout_immediate.load(), 1u);
        EXPECT_EQ(pool->metrics().checkin_ok.load(), 1u);
    }

    TEST_F(ConnectionPoolTest, QueuedCheckoutIsServedOnCheckin) {
        auto pool = start(cfg());
        ASSERT_TRUE(pool);

        auto first = checkout_now(pool);
        ASSERT_TRUE(first);
        Connection* conn = first.get();

        auto second = spawn_checkout(pool);
        ASSERT_TRUE(run_until([&] { return pool->stats().waiting == 1; }));
        EXPECT_FALSE(second->has_value());
        EXPECT_EQ(pool->stats().status, PoolStatus::Busy);

        ASSERT_TRUE(pool->checkin(first));
        ASSERT_TRUE(done(second));
        ASSERT_TRUE(**second);

        auto& h = (*second)->value();
        EXPECT_EQ(h.get(), conn);
        EXPECT_NE(h.lock(), first.lock());

        auto s = pool->stats();
        EXPECT_EQ(s.status, PoolStatus::Busy);
        EXPECT_EQ(s.waiting, 0u);
        EXPECT_EQ(s.idle, 0u);
        EXPECT_EQ(s.checked_out, 1u);
        EXPECT_EQ(pool->metrics().checkout_served_from_queue.load(), 1u);
    }

    TEST_F(ConnectionPoolTest, BusyWithoutQueueingLeavesStateAlone) {
        auto pool = start(cfg());
        ASSERT_TRUE(pool);

        auto held = checkout_now(pool);
        ASSERT_TRUE(held);
        auto before = pool->stats();

        CheckoutOptions opts;
        opts.queue = false;
        auto slot = spawn_checkout(pool, opts);
        ASSERT_TRUE(done(slot));
        ASSERT_FALSE(**slot);
        EXPECT_EQ((*slot)->code(), Error::Code::Busy);

        auto after = pool->stats();
        EXPECT_EQ(after.status, before.status);
        EXPECT_EQ(after.waiting, before.waiting);
        EXPECT_EQ(after.checked_out, before.checked_out);
        EXPECT_EQ(pool->metrics().checkout_busy.load(), 1u);
    }

    TEST_F(ConnectionPoolTest, TimedOutWaiterLeavesQueue) {
        auto pool = start(cfg());
        ASSERT_TRUE(pool);

        auto held = checkout_now(pool);
        ASSERT_TRUE(held);

        CheckoutOptions opts;
        opts.timeout = 50ms;
        const auto t0 = std::chrono::steady_clock::now();
        auto slot = spawn_checkout(pool, opts);
        ASSERT_TRUE(run_until([&] { return pool->stats().waiting == 1; }));

        ASSERT_TRUE(done(slot));
        EXPECT_GE(std::chrono::steady_clock::now() - t0, 50ms);
        ASSERT_FALSE(**slot);
        EXPECT_EQ((*slot)->code(), Error::Code::CheckoutTimeout);
        EXPECT_EQ(pool->stats().waiting, 0u);

        // The expired waiter is not matched by a later checkin.
        ASSERT_TRUE(pool->checkin(held));
        auto s = pool->stats();
        EXPECT_EQ(s.status, PoolStatus::Ready);
        EXPECT_EQ(s.idle, 1u);
        EXPECT_EQ(pool->metrics().checkout_timeout.load(), 1u);
        EXPECT_EQ(pool->metrics().checkout_served_from_queue.load(), 0u);
    }

    TEST_F(ConnectionPoolTest, SustainedQueueDelayShedsCheckouts) {
        auto c = cfg();
        c.overload.target = 5ms;
        c.overload.interval = 20ms;
        auto pool = start(c);
        ASSERT_TRUE(pool);

        auto a = checkout_now(pool);
        ASSERT_TRUE(a);

        // B waits well above target.
        auto b_slot = spawn_checkout(pool);
        ASSERT_TRUE(run_until([&] { return pool->stats().waiting == 1; }));
        run_for(40ms);
        ASSERT_TRUE(pool->checkin(a));
        ASSERT_TRUE(done(b_slot));
        ASSERT_TRUE(**b_slot);
        auto b = std::move(**b_slot).value();

        // Still congested a full interval later: queueing callers are shed.
        run_for(30ms);
        auto c_slot = spawn_checkout(pool);
        auto d_slot = spawn_checkout(pool);
        ASSERT_TRUE(done(c_slot));
        ASSERT_TRUE(done(d_slot));
        EXPECT_EQ((*c_slot)->code(), Error::Code::Overloaded);
        EXPECT_EQ((*d_slot)->code(), Error::Code::Overloaded);
        EXPECT_TRUE(pool->stats().dropping);
        EXPECT_EQ(pool->stats().waiting, 0u);
        EXPECT_EQ(pool->metrics().checkout_overloaded.load(), 2u);

        // An immediate checkout samples zero wait and ends the episode.
        ASSERT_TRUE(pool->checkin(b));
        auto e = checkout_now(pool);
        ASSERT_TRUE(e);
        EXPECT_FALSE(pool->stats().dropping);

        auto f_slot = spawn_checkout(pool);
        ASSERT_TRUE(run_until([&] { return pool->stats().waiting == 1; }));
        ASSERT_TRUE(pool->checkin(e));
        ASSERT_TRUE(done(f_slot));
        EXPECT_TRUE(**f_slot);
    }

    TEST_F(ConnectionPoolTest, WorkerFailureRevokesCheckedOutHandle) {
        auto c = cfg(2);
        c.backoff.min = 200ms;
        c.backoff.max = 200ms;
        auto pool = start(c);
        ASSERT_TRUE(pool);

        auto h = checkout_now(pool);
        ASSERT_TRUE(h);
        auto worker = worker_of(pool, h.get());
        ASSERT_TRUE(worker);

        worker->report_failure(h.holder_id(),
                               Error{Error::Code::ConnectionLost, "reset by peer"});
        ASSERT_TRUE(run_until([&] { return pool->stats().connected == 1; }));

        EXPECT_EQ(h.get(), nullptr);
        EXPECT_EQ(h.status().code(), Error::Code::ConnectionLost);
        EXPECT_EQ(pool->checkin(h).code(), Error::Code::ConnectionLost);

        auto s = pool->stats();
        EXPECT_EQ(s.checked_out, 0u);
        EXPECT_EQ(s.idle, 1u);
        EXPECT_EQ(pool->metrics().holders_lost.load(), 1u);

        // The restart policy brings a fresh holder back.
        ASSERT_TRUE(run_until([&] { return pool->stats().connected == 2; }));
        EXPECT_EQ(pool->metrics().holders_ready.load(), 3u);
        EXPECT_EQ(worker->connect_count(), 2u);
    }

    TEST_F(ConnectionPoolTest, ReconnectedHolderGoesToQueuedWaiter) {
        auto pool = start(cfg());
        ASSERT_TRUE(pool);

        auto h = checkout_now(pool);
        ASSERT_TRUE(h);
        const HolderId old_id = h.holder_id();
        auto worker = worker_of(pool, h.get());
        ASSERT_TRUE(worker);

        auto slot = spawn_checkout(pool);
        ASSERT_TRUE(run_until([&] { return pool->stats().waiting == 1; }));

        worker->report_failure(old_id,
                               Error{Error::Code::ConnectionLost, "reset by peer"});
        ASSERT_TRUE(done(slot));
        ASSERT_TRUE(**slot);
        auto served = std::move(**slot).value();
        EXPECT_NE(served.holder_id(), old_id);
        EXPECT_EQ(h.status().code(), Error::Code::ConnectionLost);

        // Handed straight over: never idle, the pool stays busy.
        auto s = pool->stats();
        EXPECT_EQ(s.status, PoolStatus::Busy);
        EXPECT_EQ(s.idle, 0u);
        EXPECT_EQ(s.checked_out, 1u);
        EXPECT_EQ(s.waiting, 0u);
        EXPECT_EQ(pool->metrics().checkout_served_from_queue.load(), 1u);
        EXPECT_EQ(worker->connect_count(), 2u);
    }

    TEST_F(ConnectionPoolTest, QueuedWaiterIsShedOnceDroppingStarts) {
        auto c = cfg(2);
        c.overload.target = 5ms;
        c.overload.interval = 20ms;
        auto pool = start(c);
        ASSERT_TRUE(pool);

        auto a = checkout_now(pool);
        auto b = checkout_now(pool);
        ASSERT_TRUE(a);
        ASSERT_TRUE(b);

        // First waiter is served after a wait well above target, which
        // starts congestion.
        auto first = spawn_checkout(pool);
        ASSERT_TRUE(run_until([&] { return pool->stats().waiting == 1; }));
        run_for(40ms);
        ASSERT_TRUE(pool->checkin(a));
        ASSERT_TRUE(done(first));
        ASSERT_TRUE(**first);

        // Both queue before the controller starts dropping.
        auto shed = spawn_checkout(pool);
        ASSERT_TRUE(run_until([&] { return pool->stats().waiting == 1; }));
        auto kept = spawn_checkout(pool);
        ASSERT_TRUE(run_until([&] { return pool->stats().waiting == 2; }));
        EXPECT_FALSE(pool->stats().dropping);

        // A full interval later the next checkin sheds the oldest waiter and
        // serves the one behind it.
        run_for(30ms);
        ASSERT_TRUE(pool->checkin(b));
        ASSERT_TRUE(done(shed));
        ASSERT_TRUE(done(kept));
        EXPECT_EQ((*shed)->code(), Error::Code::Overloaded);
        EXPECT_TRUE(**kept);

        EXPECT_EQ(pool->metrics().waiters_dropped.load(), 1u);
        auto s = pool->stats();
        EXPECT_EQ(s.waiting, 0u);
        EXPECT_EQ(s.checked_out, 2u);
        EXPECT_TRUE(s.dropping);
    }

    TEST_F(ConnectionPoolTest, StaleFailureReportIsIgnored) {
        auto pool = start(cfg());
        ASSERT_TRUE(pool);

        auto h = checkout_now(pool);
        ASSERT_TRUE(h);
        auto worker = worker_of(pool, h.get());
        ASSERT_TRUE(worker);

        worker->report_failure(h.holder_id() + 100,
                               Error{Error::Code::ConnectionLost, "stale"});
        run_for(20ms);
        EXPECT_NE(h.get(), nullptr);
        EXPECT_EQ(pool->stats().connected, 1u);
    }

    TEST_F(ConnectionPoolTest, WaitersAreServedInArrivalOrder) {
        auto pool = start(cfg());
        ASSERT_TRUE(pool);

        auto held = checkout_now(pool);
        ASSERT_TRUE(held);

        std::vector<Slot> slots;
        for (std::size_t i = 1; i <= 3; ++i) {
            slots.push_back(spawn_checkout(pool));
            ASSERT_TRUE(run_until([&] { return pool->stats().waiting == i; }));
        }

        ASSERT_TRUE(pool->checkin(held));
        for (std::size_t i = 0; i < slots.size(); ++i) {
            ASSERT_TRUE(done(slots[i]));
            ASSERT_TRUE(**slots[i]);
            for (std::size_t j = i + 1; j < slots.size(); ++j) {
                EXPECT_FALSE(slots[j]->has_value()) << "waiter " << j
                                                    << " overtook " << i;
            }
            auto h = std::move(**slots[i]).value();
            ASSERT_TRUE(pool->checkin(h));
        }
        EXPECT_EQ(pool->stats().status, PoolStatus::Ready);
    }

    TEST_F(ConnectionPoolTest, StaleLockIsRejected) {
        auto pool = start(cfg());
        ASSERT_TRUE(pool);

        auto h1 = checkout_now(pool);
        ASSERT_TRUE(h1);
        const Transfer stale = h1.transfer();
        ASSERT_TRUE(pool->checkin(h1));

        auto h2 = checkout_now(pool);
        ASSERT_TRUE(h2);
        ASSERT_TRUE(pool->checkin(h2));

        auto h3 = checkout_now(pool);
        ASSERT_TRUE(h3);

        auto r = pool->checkin(stale);
        ASSERT_FALSE(r);
        EXPECT_EQ(r.code(), Error::Code::InvalidHandle);

        Transfer forged = h3.transfer();
        forged.lock += 1000;
        EXPECT_EQ(pool->checkin(forged).code(), Error::Code::InvalidHandle);

        Transfer unknown = h3.transfer();
        unknown.holder += 1000;
        EXPECT_EQ(pool->checkin(unknown).code(), Error::Code::InvalidHandle);

        // The rightful owner is untouched.
        EXPECT_NE(h3.get(), nullptr);
        EXPECT_EQ(pool->stats().checked_out, 1u);
        EXPECT_EQ(pool->metrics().checkin_invalid.load(), 3u);
        EXPECT_TRUE(pool->checkin(h3));
    }

    TEST_F(ConnectionPoolTest, RepeatedCheckinIsAlreadyCheckedIn) {
        auto pool = start(cfg());
        ASSERT_TRUE(pool);

        auto h = checkout_now(pool);
        ASSERT_TRUE(h);
        const Transfer t = h.transfer();

        ASSERT_TRUE(pool->checkin(h));
        EXPECT_EQ(pool->checkin(h).code(), Error::Code::AlreadyCheckedIn);
        EXPECT_EQ(pool->checkin(t).code(), Error::Code::AlreadyCheckedIn);
        EXPECT_EQ(pool->metrics().checkin_duplicate.load(), 2u);
        EXPECT_EQ(pool->stats().idle, 1u);
    }

    TEST_F(ConnectionPoolTest, ProtocolCheckinReturnsHolder) {
        auto pool = start(cfg());
        ASSERT_TRUE(pool);

        auto h = checkout_now(pool);
        ASSERT_TRUE(h);

        ASSERT_TRUE(pool->checkin(h.transfer()));
        EXPECT_EQ(pool->stats().status, PoolStatus::Ready);
        // The handle learns about it and does not check in again.
        EXPECT_EQ(h.get(), nullptr);
        EXPECT_EQ(h.status().code(), Error::Code::AlreadyCheckedIn);
    }

    TEST_F(ConnectionPoolTest, DestroyedHandleChecksIn) {
        auto pool = start(cfg());
        ASSERT_TRUE(pool);
        {
            auto h = checkout_now(pool);
            ASSERT_TRUE(h);
            EXPECT_EQ(pool->stats().checked_out, 1u);
        }
        auto s = pool->stats();
        EXPECT_EQ(s.status, PoolStatus::Ready);
        EXPECT_EQ(s.checked_out, 0u);
        EXPECT_EQ(s.idle, 1u);
    }

    TEST_F(ConnectionPoolTest, DestroyedHandleChecksInWhenLoggingFails) {
        auto pool = start(cfg());
        ASSERT_TRUE(pool);
        auto h = checkout_now(pool);
        ASSERT_TRUE(h);
        auto next = spawn_checkout(pool);
        ASSERT_TRUE(run_until([&] { return pool->stats().waiting == 1; }));

        auto previous = log::logger();
        auto throwing = std::make_shared<spdlog::logger>(
            "conn_broker_throwing", std::make_shared<ThrowingSink>());
        throwing->set_level(spdlog::level::trace);
        log::set_logger(throwing);

        EXPECT_NO_THROW(h = CheckoutHandle{});
        log::set_logger(previous);

        ASSERT_TRUE(done(next));
        EXPECT_TRUE(**next);
        EXPECT_EQ(pool->stats().checked_out, 1u);
        EXPECT_EQ(pool->stats().waiting, 0u);
    }

    TEST_F(ConnectionPoolTest, HandleMoveSemantics) {
        auto pool = start(cfg());
        ASSERT_TRUE(pool);

        auto h1 = checkout_now(pool);
        ASSERT_TRUE(h1);
        Connection* conn = h1.get();

        CheckoutHandle h2 = std::move(h1);
        EXPECT_EQ(h2.get(), conn);
        EXPECT_EQ(h1.get(), nullptr);
        EXPECT_EQ(pool->stats().checked_out, 1u);

        CheckoutHandle h3;
        h3 = std::move(h2);
        EXPECT_EQ(h3.get(), conn);
        EXPECT_EQ(h2.get(), nullptr);
        EXPECT_EQ(pool->stats().checked_out, 1u);

        h3 = CheckoutHandle{};
        EXPECT_EQ(pool->stats().checked_out, 0u);
        EXPECT_EQ(pool->stats().idle, 1u);
    }

    TEST_F(ConnectionPoolTest, CancelIsIdempotent) {
        auto pool = start(cfg());
        ASSERT_TRUE(pool);

        auto held = checkout_now(pool);
        ASSERT_TRUE(held);

        CheckoutOptions opts;
        opts.ticket = pool->new_ticket();
        auto slot = spawn_checkout(pool, opts);
        ASSERT_TRUE(run_until([&] { return pool->stats().waiting == 1; }));

        EXPECT_TRUE(pool->cancel(*opts.ticket));
        EXPECT_FALSE(pool->cancel(*opts.ticket));
        EXPECT_FALSE(pool->cancel(pool->new_ticket()));

        ASSERT_TRUE(done(slot));
        EXPECT_EQ((*slot)->code(), Error::Code::Cancelled);
        EXPECT_EQ(pool->stats().waiting, 0u);
        EXPECT_FALSE(pool->cancel(*opts.ticket));

        ASSERT_TRUE(pool->checkin(held));
        EXPECT_EQ(pool->stats().status, PoolStatus::Ready);
    }

    TEST_F(ConnectionPoolTest, HoldDeadlineReclaimsForNextWaiter) {
        auto pool = start(cfg());
        ASSERT_TRUE(pool);

        CheckoutOptions opts;
        opts.hold_timeout = 30ms;
        auto h = checkout_now(pool, opts);
        ASSERT_TRUE(h);
        Connection* conn = h.get();

        auto next = spawn_checkout(pool);
        ASSERT_TRUE(done(next));
        ASSERT_TRUE(**next);
        EXPECT_EQ((*next)->value().get(), conn);

        EXPECT_EQ(h.get(), nullptr);
        EXPECT_EQ(h.status().code(), Error::Code::CheckoutExpired);
        EXPECT_EQ(pool->checkin(h).code(), Error::Code::CheckoutExpired);
        EXPECT_EQ(pool->metrics().holders_reclaimed.load(), 1u);
        EXPECT_EQ(pool->stats().checked_out, 1u);
    }

    TEST_F(ConnectionPoolTest, CheckinBeforeDeadlineDisarmsReclaim) {
        auto pool = start(cfg());
        ASSERT_TRUE(pool);

        CheckoutOptions opts;
        opts.hold_timeout = 20ms;
        auto h = checkout_now(pool, opts);
        ASSERT_TRUE(h);
        ASSERT_TRUE(pool->checkin(h));

        auto again = checkout_now(pool);
        ASSERT_TRUE(again);
        run_for(60ms);
        EXPECT_NE(again.get(), nullptr);
        EXPECT_EQ(pool->metrics().holders_reclaimed.load(), 0u);
    }

    TEST_F(ConnectionPoolTest, StopFailsWaitersAndRevokesHandles) {
        auto pool = start(cfg());
        ASSERT_TRUE(pool);

        auto held = checkout_now(pool);
        ASSERT_TRUE(held);
        auto slot = spawn_checkout(pool);
        ASSERT_TRUE(run_until([&] { return pool->stats().waiting == 1; }));

        pool->stop();
        ASSERT_TRUE(done(slot));
        EXPECT_EQ((*slot)->code(), Error::Code::Shutdown);

        EXPECT_EQ(held.get(), nullptr);
        EXPECT_EQ(pool->checkin(held).code(), Error::Code::Shutdown);

        auto late = spawn_checkout(pool);
        ASSERT_TRUE(done(late));
        EXPECT_EQ((*late)->code(), Error::Code::Shutdown);

        auto s = pool->stats();
        EXPECT_TRUE(s.shutting_down);
        EXPECT_EQ(s.connected, 0u);
        EXPECT_EQ(s.waiting, 0u);

        // Workers wind down and are not re-admitted.
        run_for(30ms);
        EXPECT_EQ(pool->stats().connected, 0u);
    }

    TEST_F(ConnectionPoolTest, IdleSweepPingsThroughWorkers) {
        auto c = cfg(2);
        c.idle_interval = 20ms;
        auto pool = start(c);
        ASSERT_TRUE(pool);

        ASSERT_TRUE(run_until([&] { return backend_->pings.load() >= 4; }));
        ASSERT_TRUE(run_until([&] { return pool->stats().idle == 2; }));
        EXPECT_EQ(pool->stats().connected, 2u);
        EXPECT_GE(pool->metrics().idle_pings.load(), 4u);
        EXPECT_EQ(pool->metrics().holders_lost.load(), 0u);
    }

    TEST_F(ConnectionPoolTest, FailedIdlePingReplacesHolder) {
        auto c = cfg();
        c.idle_interval = 20ms;
        auto pool = start(c);
        ASSERT_TRUE(pool);

        backend_->fail_ping = true;
        ASSERT_TRUE(run_until(
            [&] { return pool->metrics().holders_lost.load() >= 1; }));
        backend_->fail_ping = false;

        ASSERT_TRUE(run_until([&] {
            return pool->metrics().holders_ready.load() >= 2 &&
                   pool->stats().connected == 1;
        }));
        EXPECT_GE(backend_->connects.load(), 2);
    }

    TEST_F(ConnectionPoolTest, BrokenHandleRestartsWorker) {
        auto pool = start(cfg());
        ASSERT_TRUE(pool);

        auto h = checkout_now(pool);
        ASSERT_TRUE(h);
        const HolderId old_id = h.holder_id();
        h.mark_broken();
        ASSERT_TRUE(pool->checkin(h));
        EXPECT_EQ(pool->stats().connected, 0u);

        ASSERT_TRUE(run_until([&] { return pool->stats().connected == 1; }));
        auto again = checkout_now(pool);
        ASSERT_TRUE(again);
        EXPECT_NE(again.holder_id(), old_id);
        EXPECT_EQ(backend_->connects.load(), 2);
    }

    TEST_F(ConnectionPoolTest, ConcurrentCallersNeverShareAConnection) {
        constexpr std::size_t kPoolSize = 3;
        constexpr int kCallers = 24;
        constexpr int kRounds = 20;

        auto pool = start(cfg(kPoolSize));
        ASSERT_TRUE(pool);

        auto tally = std::make_shared<ExclusivityTally>();

        for (int i = 0; i < kCallers; ++i) {
            boost::asio::co_spawn(io_, exclusive_caller(pool, kRounds, tally),
                                  boost::asio::detached);
        }

        std::vector<std::thread> threads;
        for (int t = 0; t < 4; ++t) {
            threads.emplace_back([this] { io_.run(); });
        }
        const auto deadline = std::chrono::steady_clock::now() + 20s;
        while (tally->finished.load() < kCallers &&
               std::chrono::steady_clock::now() < deadline) {
            std::this_thread::sleep_for(5ms);
        }
        io_.stop();
        for (auto& t : threads) t.join();

        EXPECT_EQ(tally->finished.load(), kCallers);
        EXPECT_EQ(tally->violations.load(), 0);
        EXPECT_EQ(tally->failures.load(), 0);
        EXPECT_LE(tally->max_in_use, kPoolSize);

        auto s = pool->stats();
        EXPECT_EQ(s.checked_out, 0u);
        EXPECT_EQ(s.idle, kPoolSize);
        EXPECT_EQ(s.status, PoolStatus::Ready);
    }

}  // namespace
