#include "accumulo/pool/connection_pool.h"

#include <algorithm>
#include <stdexcept>

#include <boost/asio/redirect_error.hpp>
#include <boost/asio/steady_timer.hpp>
#include <boost/asio/this_coro.hpp>
#include <boost/asio/use_awaitable.hpp>
#include <spdlog/spdlog.h>

#include "accumulo/error.h"
#include "accumulo/metrics/pool_metrics.h"

namespace accumulo {

// A suspended acquirer. The timer never expires on its own; cancelling it
// resumes the acquirer, which then finds either a handed connection or none
// (pool shut down).
struct ConnectionPool::Waiter {
    explicit Waiter(const boost::asio::any_io_executor& executor)
        : timer(executor, boost::asio::steady_timer::time_point::max()) {}

    boost::asio::steady_timer timer;
    Connection* connection = nullptr;
};

Connection* ConnectionLease::operator->() const {
    if (!connection_) {
        throw PoolException("Attempting to access an empty connection lease");
    }
    return connection_;
}

Connection& ConnectionLease::operator*() const {
    if (!connection_) {
        throw PoolException("Attempting to dereference an empty connection lease");
    }
    return *connection_;
}

void ConnectionLease::release() noexcept {
    if (pool_ && connection_) {
        pool_->release(connection_);
    }
    pool_ = nullptr;
    connection_ = nullptr;
}

ConnectionPool::~ConnectionPool() = default;

boost::asio::awaitable<ConnectionLease> ConnectionPool::acquire() {
    if (shut_down_) {
        throw PoolException("connection pool is shut down");
    }
    if (!idle_.empty()) {
        Connection* connection = idle_.front();
        idle_.pop_front();
        co_return make_lease(connection);
    }

    auto executor = co_await boost::asio::this_coro::executor;
    auto waiter = std::make_shared<Waiter>(executor);
    waiters_.push_back(waiter);
    if (metrics_) {
        metrics_->acquire_waited();
    }
    spdlog::debug("No idle connection, waiting ({} waiters)", waiters_.size());

    boost::system::error_code ec;
    co_await waiter->timer.async_wait(boost::asio::redirect_error(boost::asio::use_awaitable, ec));

    if (!waiter->connection) {
        throw PoolException("connection pool shut down while waiting for a connection");
    }
    co_return make_lease(waiter->connection);
}

void ConnectionPool::release(Connection* connection) {
    if (!connection) {
        return;
    }
    if (retire(connection)) {
        return;
    }
    if (std::find(idle_.begin(), idle_.end(), connection) != idle_.end()) {
        spdlog::error("Connection {} released twice, ignoring", connection->id());
        return;
    }
    if (!waiters_.empty()) {
        auto waiter = std::move(waiters_.front());
        waiters_.pop_front();
        waiter->connection = connection;
        waiter->timer.cancel();
        return;
    }
    idle_.push_back(connection);
}

void ConnectionPool::shut_down() {
    shut_down_ = true;
    auto waiters = std::exchange(waiters_, {});
    for (auto& waiter : waiters) {
        waiter->timer.cancel();
    }
}

AutoScalingConnectionPool::AutoScalingConnectionPool(std::size_t limit, ConnectionFactory factory)
    : limit_(limit), factory_(factory ? std::move(factory) : make_connection_factory()) {
    if (limit_ == 0) {
        throw std::invalid_argument("connection limit must be at least 1");
    }
}

AutoScalingConnectionPool::~AutoScalingConnectionPool() {
    teardown();
}

boost::asio::awaitable<ConnectionLease> AutoScalingConnectionPool::acquire() {
    if (!is_shut_down() && idle_count() == 0 && connections_.size() < limit_) {
        auto connection = factory_();
        if (!connection) {
            throw PoolException("connection factory returned no connection");
        }
        Connection* created = connection.get();
        connections_.push_back(std::move(connection));
        if (metrics_) {
            metrics_->connection_created();
        }
        spdlog::info("Connection pool grew to {}/{} connections", connections_.size(), limit_);
        co_return make_lease(created);
    }
    co_return co_await ConnectionPool::acquire();
}

void AutoScalingConnectionPool::teardown() {
    if (is_shut_down()) {
        return;
    }
    shut_down();

    auto idle = take_idle();
    for (Connection* connection : idle) {
        connection->close();
    }
    const std::size_t borrowed = connections_.size() - idle.size();
    if (borrowed > 0) {
        spdlog::warn("Pool teardown: {} borrowed connections will close when returned", borrowed);
    }
    spdlog::info("Connection pool torn down ({} connections)", connections_.size());
}

bool AutoScalingConnectionPool::retire(Connection* connection) {
    if (!is_shut_down()) {
        return false;
    }
    connection->close();
    return true;
}

}  // namespace accumulo
