#include "conn_broker/connection/connection_worker.hpp"

#include <boost/asio/co_spawn.hpp>
#include <boost/asio/post.hpp>
#include <boost/asio/redirect_error.hpp>
#include <boost/asio/use_awaitable.hpp>
#include <exception>
#include <stdexcept>
#include <utility>

#include "conn_broker/log.hpp"

namespace conn_broker {

    namespace {

        /// @brief Completion handler for detached worker coroutines: log what
        /// escaped instead of dropping it silently.
        auto log_escaped(std::size_t index, const char* what) {
            return [index, what](std::exception_ptr e) {
                if (!e) return;
                try {
                    std::rethrow_exception(e);
                } catch (const std::exception& ex) {
                    log::logger()->error("worker {}: {} failed: {}", index,
                                         what, ex.what());
                }
            };
        }

    }  // namespace

    ConnectionWorker::ConnectionWorker(
        executor_type ex, std::size_t index, ConnectionFactory const& factory,
        std::shared_ptr<RestartPolicy> policy,
        std::weak_ptr<WorkerCoordinator> coordinator)
        : strand_(boost::asio::make_strand(std::move(ex))),
          index_(index),
          connection_(factory ? factory(strand_) : nullptr),
          policy_(std::move(policy)),
          coordinator_(std::move(coordinator)),
          wake_(strand_) {
        if (!connection_) {
            throw std::invalid_argument(
                "ConnectionWorker: factory returned no connection");
        }
        if (!policy_) {
            throw std::invalid_argument("ConnectionWorker: null restart policy");
        }
    }

    void ConnectionWorker::start() {
        if (running_.exchange(true, std::memory_order_acq_rel)) return;
        boost::asio::co_spawn(strand_, run_owned(shared_from_this()),
                              log_escaped(index_, "run loop"));
    }

    void ConnectionWorker::stop() {
        boost::asio::post(strand_, [self = shared_from_this()] {
            self->stopped_ = true;
            self->wake_.cancel();
            // Aborts a connect or ping in flight.
            self->connection_->disconnect();
        });
    }

    void ConnectionWorker::report_failure(HolderId holder, Error reason) {
        boost::asio::post(strand_, [self = shared_from_this(), holder,
                                    reason = std::move(reason)]() mutable {
            self->fail_on_strand(holder, std::move(reason));
        });
    }

    void ConnectionWorker::ping(Transfer transfer) {
        boost::asio::co_spawn(strand_, ping_owned(shared_from_this(), transfer),
                              log_escaped(index_, "idle ping"));
    }

    boost::asio::awaitable<void> ConnectionWorker::run_owned(
        std::shared_ptr<ConnectionWorker> self) {
        co_await self->run();
    }

    boost::asio::awaitable<void> ConnectionWorker::ping_owned(
        std::shared_ptr<ConnectionWorker> self, Transfer transfer) {
        co_await self->ping_on_strand(transfer);
    }

    void ConnectionWorker::fail_on_strand(HolderId holder, Error reason) {
        if (!holder_ || *holder_ != holder) {
            log::logger()->debug("worker {}: ignoring failure of stale holder {}",
                                 index_, holder);
            return;
        }
        holder_.reset();
        log::logger()->warn("worker {}: holder {} lost: {}", index_, holder,
                            reason.message);
        if (auto coord = coordinator_.lock()) {
            coord->announce_failed(holder, std::move(reason));
        }
        wake_.cancel();
    }

    boost::asio::awaitable<void> ConnectionWorker::ping_on_strand(
        Transfer transfer) {
        auto ec = co_await connection_->ping();

        auto coord = coordinator_.lock();
        if (!coord) co_return;

        if (ec) {
            fail_on_strand(transfer.holder,
                           Error{Error::Code::ConnectionLost,
                                 "idle ping failed: " + ec.message()});
            co_return;
        }

        auto res = coord->checkin(transfer);
        if (res.has_error()) {
            // Shutdown or a failure that already purged the holder.
            log::logger()->debug("worker {}: checkin after ping rejected: {}",
                                 index_, res.error().message);
        }
    }

    boost::asio::awaitable<void> ConnectionWorker::run() {
        std::size_t attempt = 0;

        while (!stopped_) {
            auto ec = co_await connection_->connect();
            if (stopped_) break;

            if (!ec) {
                auto coord = coordinator_.lock();
                if (!coord) break;

                auto ready = coord->announce_ready(shared_from_this());
                if (ready.has_error()) {
                    log::logger()->debug("worker {}: not admitted: {}", index_,
                                         ready.error().message);
                    break;
                }
                coord.reset();

                attempt = 0;
                holder_ = ready.value();
                connect_count_.fetch_add(1, std::memory_order_relaxed);
                log::logger()->debug("worker {}: ready as holder {}", index_,
                                     *holder_);

                // Parked until fail_on_strand() or stop() cancels the timer.
                wake_.expires_at(boost::asio::steady_timer::time_point::max());
                boost::system::error_code wait_ec;
                co_await wake_.async_wait(boost::asio::redirect_error(
                    boost::asio::use_awaitable, wait_ec));
                if (stopped_) break;

                connection_->disconnect();
            } else {
                log::logger()->warn("worker {}: connect failed: {}", index_,
                                    ec.message());
            }

            auto delay = policy_->next_delay(attempt++);
            if (!delay) {
                log::logger()->warn(
                    "worker {}: restart policy gave up after {} attempt(s)",
                    index_, attempt);
                break;
            }

            wake_.expires_after(*delay);
            boost::system::error_code wait_ec;
            co_await wake_.async_wait(boost::asio::redirect_error(
                boost::asio::use_awaitable, wait_ec));
        }

        if (holder_) {
            auto holder = *holder_;
            holder_.reset();
            if (auto coord = coordinator_.lock()) {
                coord->announce_failed(
                    holder, Error{Error::Code::Shutdown, "worker stopped"});
            }
        }
        connection_->disconnect();
        running_.store(false, std::memory_order_release);
    }

}  // namespace conn_broker
