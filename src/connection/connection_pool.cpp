#include "conn_broker/connection/connection_pool.hpp"

#include <algorithm>
#include <boost/asio/co_spawn.hpp>
#include <boost/asio/post.hpp>
#include <boost/asio/redirect_error.hpp>
#include <boost/asio/use_awaitable.hpp>
#include <cassert>
#include <exception>
#include <stdexcept>
#include <utility>

#include "conn_broker/log.hpp"

namespace conn_broker {

    namespace {

        using clock_type = std::chrono::steady_clock;

        /// @brief now + timeout without overflowing for "forever" timeouts
        clock_type::time_point deadline_after(clock_type::time_point now,
                                              std::chrono::milliseconds timeout) {
            const auto left = clock_type::time_point::max() - now;
            if (std::chrono::duration_cast<std::chrono::milliseconds>(left) <=
                timeout) {
                return clock_type::time_point::max();
            }
            return now + timeout;
        }

    }  // namespace

    // ---------------------------------------------------------------------
    // CheckoutHandle

    Result<void> ConnectionPool::CheckoutHandle::status() const {
        if (!state_) {
            return Result<void>::err(Error::Code::InvalidHandle,
                                     "empty checkout handle");
        }
        switch (state_->phase.load(std::memory_order_acquire)) {
            case Phase::Active:
                return Result<void>::ok();
            case Phase::CheckedIn:
                return Result<void>::err(Error::Code::AlreadyCheckedIn,
                                         "handle already checked in");
            case Phase::Lost:
                return Result<void>::err(Error::Code::ConnectionLost,
                                         "connection lost while checked out");
            case Phase::Expired:
                return Result<void>::err(Error::Code::CheckoutExpired,
                                         "hold deadline exceeded, reclaimed");
            case Phase::Shutdown:
                return Result<void>::err(Error::Code::Shutdown,
                                         "pool is shut down");
        }
        return Result<void>::err(Error::Code::InternalError,
                                 "unknown handle phase");
    }

    void ConnectionPool::CheckoutHandle::reset() noexcept {
        if (!state_) return;

        if (state_->phase.load(std::memory_order_acquire) == Phase::Active) {
            if (auto pool = pool_.lock()) {
                try {
                    log::logger()->trace("[{}] implicit checkin of holder {}",
                                         pool->cfg_.name, transfer_.holder);
                    auto res = pool->checkin(*this);
                    if (res.has_error()) {
                        log::logger()->warn(
                            "[{}] implicit checkin of holder {} failed: {}",
                            pool->cfg_.name, transfer_.holder,
                            res.error().message);
                    }
                } catch (const std::exception& e) {
                    // Called from destructors: nothing may escape.
                    log::logger()->error(
                        "[{}] implicit checkin of holder {} threw: {}",
                        pool->cfg_.name, transfer_.holder, e.what());
                }
            }
        }

        pool_.reset();
        state_.reset();
        transfer_ = Transfer{};
        broken_ = false;
    }

    // ---------------------------------------------------------------------
    // Lifecycle

    ConnectionPool::ConnectionPool(PrivateTag, executor_type ex,
                                   PoolConfiguration cfg)
        : ex_(std::move(ex)),
          strand_(boost::asio::make_strand(ex_)),
          cfg_(std::move(cfg)),
          overload_(cfg_.overload) {}

    ConnectionPool::~ConnectionPool() { stop(); }

    Result<std::shared_ptr<ConnectionPool>> ConnectionPool::start(
        executor_type ex, ConnectionFactory factory, PoolConfiguration cfg,
        std::shared_ptr<RestartPolicy> policy) {
        using R = Result<std::shared_ptr<ConnectionPool>>;

        auto valid = cfg.validate();
        if (valid.has_error()) return R::err(valid.error());
        if (!factory) {
            return R::err(Error::Code::InvalidConfiguration,
                          "connection factory is empty");
        }
        if (!policy) {
            policy = std::make_shared<BackoffRestartPolicy>(cfg.backoff);
        }

        auto pool =
            std::make_shared<ConnectionPool>(PrivateTag{}, ex, std::move(cfg));

        std::vector<std::shared_ptr<ConnectionWorker>> workers;
        workers.reserve(pool->cfg_.pool_size);
        try {
            for (std::size_t i = 0; i < pool->cfg_.pool_size; ++i) {
                workers.push_back(std::make_shared<ConnectionWorker>(
                    ex, i, factory, policy, pool));
            }
        } catch (const std::invalid_argument& e) {
            return R::err(Error::Code::InvalidConfiguration, e.what());
        }

        {
            std::lock_guard<std::mutex> lk(pool->mu_);
            pool->workers_ = workers;
        }

        if (pool->cfg_.idle_interval.count() > 0) {
            pool->idle_timer_ =
                std::make_shared<boost::asio::steady_timer>(pool->strand_);
            pool->schedule_idle_sweep_();
        }

        for (auto& w : workers) w->start();

        log::logger()->info("[{}] started with {} worker(s)", pool->cfg_.name,
                            pool->cfg_.pool_size);
        return R::ok(std::move(pool));
    }

    void ConnectionPool::stop() {
        std::vector<std::shared_ptr<ConnectionWorker>> workers;
        {
            std::lock_guard<std::mutex> lk(mu_);
            if (shutting_down_) return;
            shutting_down_ = true;

            while (!waiters_.empty()) {
                auto w = waiters_.front();
                finish_waiter_locked_(w, Waiter::Outcome::Shutdown);
            }

            for (auto& [id, h] : holders_) {
                clear_deadline_locked_(h);
                if (h.owner) {
                    h.owner->phase.store(HandlePhase::Shutdown,
                                         std::memory_order_release);
                    h.owner.reset();
                }
            }
            holders_.clear();
            idle_.clear();
            checked_out_ = 0;
            pinging_ = 0;
            status_ = PoolStatus::Busy;
            overload_.reset();
            publish_gauges_locked_();

            if (idle_timer_) {
                boost::asio::post(strand_,
                                  [t = idle_timer_] { t->cancel(); });
            }
            workers.swap(workers_);
        }

        for (auto& w : workers) w->stop();

        log::logger()->info("[{}] stopped", cfg_.name);
    }

    // ---------------------------------------------------------------------
    // Checkout

    boost::asio::awaitable<Result<ConnectionPool::CheckoutHandle>>
    ConnectionPool::checkout(CheckoutOptions opts) {
        // The queueing path runs on the pool strand; the result comes back
        // through `out` because co_spawn needs a default-constructible value.
        auto out = std::make_shared<std::optional<Result<CheckoutHandle>>>();
        co_await boost::asio::co_spawn(
            strand_, checkout_into_(shared_from_this(), opts, out),
            boost::asio::use_awaitable);

        if (!*out) {
            co_return Result<CheckoutHandle>::err(Error::Code::InternalError,
                                                  "checkout produced no result");
        }
        co_return std::move(**out);
    }

    boost::asio::awaitable<void> ConnectionPool::checkout_into_(
        std::shared_ptr<ConnectionPool> self, CheckoutOptions opts,
        CheckoutSlot out) {
        out->emplace(co_await self->checkout_on_strand_(opts));
    }

    boost::asio::awaitable<Result<ConnectionPool::CheckoutHandle>>
    ConnectionPool::checkout_on_strand_(CheckoutOptions opts) {
        using R = Result<CheckoutHandle>;

        const bool queue = opts.queue.value_or(cfg_.queue);
        const auto timeout = opts.timeout.value_or(cfg_.timeout);

        std::shared_ptr<Waiter> w;
        {
            std::lock_guard<std::mutex> lk(mu_);

            if (shutting_down_) {
                metrics_.checkout_shutdown.fetch_add(1,
                                                     std::memory_order_relaxed);
                co_return R::err(Error::Code::Shutdown, "pool is shut down");
            }

            const auto now = clock_type::now();

            if (status_ == PoolStatus::Ready) {
                auto& h = holders_.at(idle_.front());
                idle_.pop_front();
                if (idle_.empty()) status_ = PoolStatus::Busy;

                overload_.record(clock_type::duration::zero(), now);

                auto st = std::make_shared<HandleState>();
                auto t = hand_out_locked_(h, st, opts.hold_timeout, now);
                metrics_.checkout_immediate.fetch_add(
                    1, std::memory_order_relaxed);
                publish_gauges_locked_();
                check_invariants_locked_();
                co_return R::ok(
                    CheckoutHandle(weak_from_this(), std::move(st), t));
            }

            if (!queue) {
                metrics_.checkout_busy.fetch_add(1, std::memory_order_relaxed);
                co_return R::err(Error::Code::Busy,
                                 "no idle connection and queueing disabled");
            }

            if (!overload_.admit(now)) {
                metrics_.checkout_overloaded.fetch_add(
                    1, std::memory_order_relaxed);
                log::logger()->debug("[{}] checkout shed: queue overloaded",
                                     cfg_.name);
                co_return R::err(Error::Code::Overloaded,
                                 "queue wait above target, request shed");
            }

            w = std::make_shared<Waiter>(strand_);
            w->seq = next_seq_++;
            w->ticket = opts.ticket.value_or(0);
            w->enqueued_at = now;
            w->expires_at = deadline_after(now, timeout);
            w->hold_timeout = opts.hold_timeout;
            w->timer.expires_at(w->expires_at);
            w->pos = waiters_.insert(waiters_.end(), w);
            w->queued = true;

            metrics_.checkout_queued.fetch_add(1, std::memory_order_relaxed);
            publish_gauges_locked_();
            check_invariants_locked_();
        }

        Waiter::Outcome outcome = Waiter::Outcome::Pending;
        for (;;) {
            boost::system::error_code ec;
            co_await w->timer.async_wait(
                boost::asio::redirect_error(boost::asio::use_awaitable, ec));

            std::lock_guard<std::mutex> lk(mu_);
            if (w->outcome == Waiter::Outcome::Pending &&
                clock_type::now() >= w->expires_at) {
                finish_waiter_locked_(w, Waiter::Outcome::TimedOut);
            }
            if (w->outcome != Waiter::Outcome::Pending) {
                outcome = w->outcome;
                break;
            }
        }

        switch (outcome) {
            case Waiter::Outcome::Served:
                co_return R::ok(CheckoutHandle(
                    weak_from_this(), std::move(w->handle_state), *w->transfer));
            case Waiter::Outcome::TimedOut:
                co_return R::err(Error::Code::CheckoutTimeout,
                                 "timed out waiting for a connection");
            case Waiter::Outcome::Cancelled:
                co_return R::err(Error::Code::Cancelled, "checkout cancelled");
            case Waiter::Outcome::Dropped:
                co_return R::err(Error::Code::Overloaded,
                                 "dropped from queue by overload control");
            case Waiter::Outcome::Shutdown:
                co_return R::err(Error::Code::Shutdown, "pool is shut down");
            case Waiter::Outcome::Pending:
                break;
        }
        co_return R::err(Error::Code::InternalError,
                         "waiter woke without an outcome");
    }

    bool ConnectionPool::cancel(Ticket ticket) {
        if (ticket == 0) return false;

        std::lock_guard<std::mutex> lk(mu_);
        auto it = std::find_if(waiters_.begin(), waiters_.end(),
                               [ticket](std::shared_ptr<Waiter> const& w) {
                                   return w->ticket == ticket;
                               });
        if (it == waiters_.end()) return false;

        auto w = *it;
        finish_waiter_locked_(w, Waiter::Outcome::Cancelled);
        check_invariants_locked_();
        return true;
    }

    // ---------------------------------------------------------------------
    // Checkin

    Result<void> ConnectionPool::checkin(CheckoutHandle& handle) {
        if (!handle.state_) {
            return Result<void>::err(Error::Code::InvalidHandle,
                                     "empty checkout handle");
        }
        if (handle.pool_.lock().get() != this) {
            metrics_.checkin_invalid.fetch_add(1, std::memory_order_relaxed);
            return Result<void>::err(Error::Code::InvalidHandle,
                                     "handle belongs to another pool");
        }

        std::shared_ptr<ConnectionWorker> failed;
        Result<void> res = Result<void>::ok();
        {
            std::lock_guard<std::mutex> lk(mu_);
            res = checkin_locked_(handle.transfer_, handle.state_.get(),
                                  handle.broken_, failed);
        }
        if (failed) {
            failed->report_failure(
                handle.transfer_.holder,
                Error{Error::Code::ConnectionLost,
                      "connection marked broken by its caller"});
        }
        return res;
    }

    Result<void> ConnectionPool::checkin(const Transfer& transfer) {
        std::shared_ptr<ConnectionWorker> failed;
        std::lock_guard<std::mutex> lk(mu_);
        return checkin_locked_(transfer, nullptr, false, failed);
    }

    Result<void> ConnectionPool::checkin_locked_(
        const Transfer& transfer, HandleState const* state, bool broken,
        std::shared_ptr<ConnectionWorker>& failed) {
        // A revoked handle reports why it was revoked.
        if (state) {
            switch (state->phase.load(std::memory_order_acquire)) {
                case HandlePhase::Active:
                    break;
                case HandlePhase::CheckedIn:
                    metrics_.checkin_duplicate.fetch_add(
                        1, std::memory_order_relaxed);
                    log::logger()->warn("[{}] holder {} checked in twice",
                                        cfg_.name, transfer.holder);
                    return Result<void>::err(Error::Code::AlreadyCheckedIn,
                                             "handle already checked in");
                case HandlePhase::Lost:
                    return Result<void>::err(
                        Error::Code::ConnectionLost,
                        "connection lost while checked out");
                case HandlePhase::Expired:
                    return Result<void>::err(
                        Error::Code::CheckoutExpired,
                        "hold deadline exceeded, holder was reclaimed");
                case HandlePhase::Shutdown:
                    return Result<void>::err(Error::Code::Shutdown,
                                             "pool is shut down");
            }
        }

        if (shutting_down_) {
            return Result<void>::err(Error::Code::Shutdown,
                                     "pool is shut down");
        }

        auto it = holders_.find(transfer.holder);
        if (it == holders_.end()) {
            metrics_.checkin_invalid.fetch_add(1, std::memory_order_relaxed);
            log::logger()->warn("[{}] checkin of unknown holder {} (lock {})",
                                cfg_.name, transfer.holder, transfer.lock);
            return Result<void>::err(Error::Code::InvalidHandle,
                                     "unknown holder");
        }

        Holder& h = it->second;
        if (transfer.lock == 0 || h.lock != transfer.lock) {
            if (transfer.lock != 0 && transfer.lock == h.last_lock) {
                metrics_.checkin_duplicate.fetch_add(
                    1, std::memory_order_relaxed);
                log::logger()->warn("[{}] holder {} lock {} checked in twice",
                                    cfg_.name, h.id, transfer.lock);
                return Result<void>::err(Error::Code::AlreadyCheckedIn,
                                         "holder already checked in");
            }
            metrics_.checkin_invalid.fetch_add(1, std::memory_order_relaxed);
            log::logger()->error(
                "[{}] ownership violation: checkin of holder {} with lock {}, "
                "current lock is {}",
                cfg_.name, h.id, transfer.lock, h.lock);
            return Result<void>::err(Error::Code::InvalidHandle,
                                     "stale or foreign lock");
        }

        const auto now = clock_type::now();
        if (h.place == Place::CheckedOut) {
            --checked_out_;
        } else if (h.place == Place::Pinging) {
            --pinging_;
        }
        h.last_lock = h.lock;
        h.lock = 0;
        clear_deadline_locked_(h);
        if (h.owner) {
            h.owner->phase.store(HandlePhase::CheckedIn,
                                 std::memory_order_release);
            h.owner.reset();
        }
        metrics_.checkin_ok.fetch_add(1, std::memory_order_relaxed);

        if (broken) {
            failed = h.worker.lock();
            log::logger()->warn("[{}] holder {} checked in broken, purging",
                                cfg_.name, h.id);
            purge_holder_locked_(it);
        } else {
            make_available_locked_(h, now);
        }

        publish_gauges_locked_();
        check_invariants_locked_();
        return Result<void>::ok();
    }

    // ---------------------------------------------------------------------
    // Worker boundary

    Result<HolderId> ConnectionPool::announce_ready(
        std::shared_ptr<ConnectionWorker> worker) {
        if (!worker || !worker->connection()) {
            return Result<HolderId>::err(Error::Code::InternalError,
                                         "worker without a connection");
        }

        std::lock_guard<std::mutex> lk(mu_);
        if (shutting_down_) {
            return Result<HolderId>::err(Error::Code::Shutdown,
                                         "pool is shut down");
        }

        const auto now = clock_type::now();
        const HolderId id = next_holder_++;
        Holder& h = holders_.emplace(id, Holder{}).first->second;
        h.id = id;
        h.worker = worker;
        h.conn = worker->connection();
        h.checkin_time = now;

        metrics_.holders_ready.fetch_add(1, std::memory_order_relaxed);
        log::logger()->debug("[{}] worker {} ready as holder {}", cfg_.name,
                             worker->index(), id);

        make_available_locked_(h, now);
        publish_gauges_locked_();
        check_invariants_locked_();
        return Result<HolderId>::ok(id);
    }

    void ConnectionPool::announce_failed(HolderId holder, Error reason) {
        std::lock_guard<std::mutex> lk(mu_);
        auto it = holders_.find(holder);
        if (it == holders_.end()) {
            log::logger()->debug("[{}] failure of unknown holder {} ignored",
                                 cfg_.name, holder);
            return;
        }

        Holder& h = it->second;
        switch (h.place) {
            case Place::Idle: {
                auto pos = std::find(idle_.begin(), idle_.end(), holder);
                if (pos != idle_.end()) idle_.erase(pos);
                if (idle_.empty() && status_ == PoolStatus::Ready) {
                    status_ = PoolStatus::Busy;
                }
                break;
            }
            case Place::CheckedOut:
                --checked_out_;
                clear_deadline_locked_(h);
                if (h.owner) {
                    h.owner->phase.store(HandlePhase::Lost,
                                         std::memory_order_release);
                    h.owner.reset();
                }
                break;
            case Place::Pinging:
                --pinging_;
                break;
        }

        log::logger()->warn("[{}] holder {} lost: {}", cfg_.name, holder,
                            reason.message);
        purge_holder_locked_(it);
        publish_gauges_locked_();
        check_invariants_locked_();
    }

    // ---------------------------------------------------------------------
    // Internals (all *_locked_ run under mu_)

    Transfer ConnectionPool::hand_out_locked_(
        Holder& h, std::shared_ptr<HandleState> owner,
        std::optional<std::chrono::milliseconds> hold,
        clock_type::time_point now) {
        h.lock = next_lock_++;
        h.place = Place::CheckedOut;
        h.owner = std::move(owner);
        ++checked_out_;

        if (hold) {
            h.deadline = deadline_after(now, *hold);
            auto timer =
                std::make_shared<boost::asio::steady_timer>(strand_, *h.deadline);
            h.deadline_timer = timer;
            std::weak_ptr<ConnectionPool> weak = weak_from_this();
            boost::asio::post(strand_, [timer, weak, id = h.id,
                                        lock = h.lock] {
                timer->async_wait([weak, id, lock](boost::system::error_code ec) {
                    if (ec) return;
                    if (auto self = weak.lock()) self->reclaim_(id, lock);
                });
            });
        }

        return Transfer{h.id, h.lock, h.conn, h.checkin_time};
    }

    void ConnectionPool::make_available_locked_(Holder& h,
                                                clock_type::time_point now) {
        h.lock = 0;
        h.owner.reset();
        clear_deadline_locked_(h);

        while (status_ == PoolStatus::Busy && !waiters_.empty()) {
            auto w = waiters_.front();

            if (now >= w->expires_at) {
                finish_waiter_locked_(w, Waiter::Outcome::TimedOut);
                continue;
            }
            if (overload_.drop_due(now)) {
                log::logger()->debug(
                    "[{}] dropping waiter {} (queued {} ms)", cfg_.name,
                    w->seq,
                    std::chrono::duration_cast<std::chrono::milliseconds>(
                        now - w->enqueued_at)
                        .count());
                finish_waiter_locked_(w, Waiter::Outcome::Dropped);
                continue;
            }

            overload_.record(now - w->enqueued_at, now);

            auto st = std::make_shared<HandleState>();
            w->transfer = hand_out_locked_(h, st, w->hold_timeout, now);
            w->handle_state = std::move(st);
            metrics_.checkout_served_from_queue.fetch_add(
                1, std::memory_order_relaxed);
            finish_waiter_locked_(w, Waiter::Outcome::Served);
            return;
        }

        h.place = Place::Idle;
        h.checkin_time = now;
        idle_.push_back(h.id);
        status_ = PoolStatus::Ready;
    }

    void ConnectionPool::finish_waiter_locked_(std::shared_ptr<Waiter> const& w,
                                               Waiter::Outcome outcome) {
        if (w->outcome != Waiter::Outcome::Pending) return;

        unqueue_waiter_locked_(*w);
        w->outcome = outcome;

        switch (outcome) {
            case Waiter::Outcome::TimedOut:
                metrics_.checkout_timeout.fetch_add(1,
                                                    std::memory_order_relaxed);
                break;
            case Waiter::Outcome::Cancelled:
                metrics_.checkout_cancelled.fetch_add(
                    1, std::memory_order_relaxed);
                break;
            case Waiter::Outcome::Dropped:
                metrics_.waiters_dropped.fetch_add(1,
                                                   std::memory_order_relaxed);
                break;
            case Waiter::Outcome::Shutdown:
                metrics_.checkout_shutdown.fetch_add(
                    1, std::memory_order_relaxed);
                break;
            case Waiter::Outcome::Served:
            case Waiter::Outcome::Pending:
                break;
        }

        // Wake the waiting coroutine. Posted to the strand so it lands after
        // the async_wait that coroutine started.
        boost::asio::post(strand_, [w] { w->timer.cancel(); });
    }

    void ConnectionPool::unqueue_waiter_locked_(Waiter& w) {
        if (!w.queued) return;
        waiters_.erase(w.pos);
        w.queued = false;
        publish_gauges_locked_();
    }

    void ConnectionPool::clear_deadline_locked_(Holder& h) {
        h.deadline.reset();
        if (h.deadline_timer) {
            boost::asio::post(strand_,
                              [t = std::move(h.deadline_timer)] { t->cancel(); });
            h.deadline_timer.reset();
        }
    }

    void ConnectionPool::purge_holder_locked_(
        std::unordered_map<HolderId, Holder>::iterator it) {
        holders_.erase(it);
        metrics_.holders_lost.fetch_add(1, std::memory_order_relaxed);
    }

    void ConnectionPool::reclaim_(HolderId id, Lock lock) {
        std::lock_guard<std::mutex> lk(mu_);
        if (shutting_down_) return;

        auto it = holders_.find(id);
        if (it == holders_.end()) return;

        Holder& h = it->second;
        if (h.place != Place::CheckedOut || h.lock != lock) return;

        log::logger()->warn("[{}] holder {} held past its deadline, reclaiming",
                            cfg_.name, id);
        metrics_.holders_reclaimed.fetch_add(1, std::memory_order_relaxed);

        --checked_out_;
        h.last_lock = h.lock;
        if (h.owner) {
            h.owner->phase.store(HandlePhase::Expired,
                                 std::memory_order_release);
        }
        h.deadline_timer.reset();
        make_available_locked_(h, clock_type::now());
        publish_gauges_locked_();
        check_invariants_locked_();
    }

    // ---------------------------------------------------------------------
    // Idle sweep

    void ConnectionPool::schedule_idle_sweep_() {
        idle_timer_->expires_after(cfg_.idle_interval);
        std::weak_ptr<ConnectionPool> weak = weak_from_this();
        idle_timer_->async_wait([weak](boost::system::error_code ec) {
            if (ec) return;
            auto self = weak.lock();
            if (!self) return;
            self->idle_sweep_();
            std::lock_guard<std::mutex> lk(self->mu_);
            if (!self->shutting_down_) self->schedule_idle_sweep_();
        });
    }

    void ConnectionPool::idle_sweep_() {
        std::vector<std::pair<std::shared_ptr<ConnectionWorker>, Transfer>>
            pings;
        {
            std::lock_guard<std::mutex> lk(mu_);
            if (shutting_down_ || status_ != PoolStatus::Ready) return;

            const auto now = clock_type::now();
            while (!idle_.empty()) {
                auto it = holders_.find(idle_.front());
                if (it == holders_.end()) {
                    idle_.pop_front();
                    continue;
                }
                Holder& h = it->second;
                if (now - h.checkin_time < cfg_.idle_interval) break;

                idle_.pop_front();
                auto worker = h.worker.lock();
                if (!worker) {
                    purge_holder_locked_(it);
                    continue;
                }

                h.lock = next_lock_++;
                h.place = Place::Pinging;
                ++pinging_;
                metrics_.idle_pings.fetch_add(1, std::memory_order_relaxed);
                pings.emplace_back(std::move(worker),
                                   Transfer{h.id, h.lock, h.conn, h.checkin_time});
            }
            if (idle_.empty()) status_ = PoolStatus::Busy;

            publish_gauges_locked_();
            check_invariants_locked_();
        }

        for (auto& [worker, transfer] : pings) worker->ping(transfer);
    }

    // ---------------------------------------------------------------------
    // Introspection

    PoolStats ConnectionPool::stats() const {
        std::lock_guard<std::mutex> lk(mu_);
        PoolStats s;
        s.status = status_;
        s.pool_size = cfg_.pool_size;
        s.connected = holders_.size();
        s.idle = idle_.size();
        s.waiting = waiters_.size();
        s.checked_out = checked_out_;
        s.pinging = pinging_;
        s.dropping = overload_.dropping();
        s.shutting_down = shutting_down_;
        return s;
    }

    std::vector<std::shared_ptr<ConnectionWorker>> ConnectionPool::workers()
        const {
        std::lock_guard<std::mutex> lk(mu_);
        return workers_;
    }

    void ConnectionPool::publish_gauges_locked_() {
        metrics_.connected.store(holders_.size(), std::memory_order_relaxed);
        metrics_.idle.store(idle_.size(), std::memory_order_relaxed);
        metrics_.checked_out.store(checked_out_, std::memory_order_relaxed);
        metrics_.waiting.store(waiters_.size(), std::memory_order_relaxed);
    }

    /// @brief Check internal invariants, only in debug builds
    void ConnectionPool::check_invariants_locked_() const {
#ifndef NDEBUG
        if (status_ == PoolStatus::Ready) {
            assert(!idle_.empty() && "Ready with no idle holder");
            assert(waiters_.empty() && "Ready with queued waiters");
        } else {
            assert(idle_.empty() && "Busy with idle holders");
        }

        std::size_t idle = 0, out = 0, pinging = 0;
        for (auto const& [id, h] : holders_) {
            switch (h.place) {
                case Place::Idle:
                    ++idle;
                    assert(h.lock == 0 && "idle holder carries a lock");
                    break;
                case Place::CheckedOut:
                    ++out;
                    assert(h.lock != 0 && "checked out holder without lock");
                    break;
                case Place::Pinging:
                    ++pinging;
                    break;
            }
        }
        assert(idle == idle_.size() && "idle queue drift");
        assert(out == checked_out_ && "checked_out_ drift");
        assert(pinging == pinging_ && "pinging_ drift");
        assert(holders_.size() <= cfg_.pool_size && "more holders than workers");
#else
        return;
#endif
    }

}  // namespace conn_broker
