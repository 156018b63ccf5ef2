#pragma once

#include <cstddef>
#include <deque>
#include <memory>
#include <type_traits>
#include <utility>
#include <vector>

#include <boost/asio/awaitable.hpp>

#include "accumulo/connection.h"

namespace accumulo {

namespace metrics {
class PoolMetrics;
}

class ConnectionPool;

/**
 * @brief RAII wrapper for a borrowed connection
 *
 * Returns the connection to its pool when going out of scope.
 * Non-copyable but movable. Must not outlive the pool.
 */
class ConnectionLease {
public:
    ConnectionLease() = default;

    ConnectionLease(const ConnectionLease&) = delete;
    ConnectionLease& operator=(const ConnectionLease&) = delete;

    ConnectionLease(ConnectionLease&& other) noexcept
        : pool_(std::exchange(other.pool_, nullptr))
        , connection_(std::exchange(other.connection_, nullptr)) {}

    ConnectionLease& operator=(ConnectionLease&& other) noexcept {
        if (this != &other) {
            release();
            pool_ = std::exchange(other.pool_, nullptr);
            connection_ = std::exchange(other.connection_, nullptr);
        }
        return *this;
    }

    ~ConnectionLease() { release(); }

    Connection* operator->() const;
    Connection& operator*() const;

    explicit operator bool() const noexcept { return connection_ != nullptr; }
    Connection* get() const noexcept { return connection_; }

    // Returns the connection to the pool early. Safe to call twice.
    void release() noexcept;

private:
    friend class ConnectionPool;

    ConnectionLease(ConnectionPool* pool, Connection* connection) noexcept
        : pool_(pool), connection_(connection) {}

    ConnectionPool* pool_ = nullptr;
    Connection* connection_ = nullptr;
};

/**
 * @brief FIFO queue of idle connections with cooperative acquire/release
 *
 * acquire() suspends the calling coroutine while no connection is idle; a
 * release() hands the connection straight to the longest waiting acquirer.
 * Not thread-safe: every member must be called from the same single-threaded
 * executor (one io_context thread or a strand). The pool does not own the
 * connections it queues.
 */
class ConnectionPool {
public:
    ConnectionPool() = default;
    virtual ~ConnectionPool();

    ConnectionPool(const ConnectionPool&) = delete;
    ConnectionPool& operator=(const ConnectionPool&) = delete;

    virtual boost::asio::awaitable<ConnectionLease> acquire();

    void release(Connection* connection);

    /**
     * @brief Runs fn with a borrowed connection
     *
     * fn takes a Connection& and returns an awaitable. The connection goes
     * back to the pool before the result or the error reaches the caller.
     */
    template <class F>
    auto scoped(F fn) -> std::invoke_result_t<F&, Connection&> {
        ConnectionLease lease = co_await acquire();
        co_return co_await fn(*lease);
    }

    std::size_t idle_count() const noexcept { return idle_.size(); }
    std::size_t waiter_count() const noexcept { return waiters_.size(); }

    void set_metrics(metrics::PoolMetrics* metrics) noexcept { metrics_ = metrics; }

protected:
    ConnectionLease make_lease(Connection* connection) noexcept { return ConnectionLease(this, connection); }

    // Rejects further acquires and fails every suspended acquirer with PoolException.
    void shut_down();
    bool is_shut_down() const noexcept { return shut_down_; }

    std::deque<Connection*> take_idle() noexcept { return std::exchange(idle_, {}); }

    // Called for every released connection. Returning true keeps it out of the queue.
    virtual bool retire(Connection*) { return false; }

    metrics::PoolMetrics* metrics_ = nullptr;

private:
    struct Waiter;

    std::deque<Connection*> idle_;
    std::deque<std::shared_ptr<Waiter>> waiters_;
    bool shut_down_ = false;
};

/**
 * @brief Pool that opens connections on demand up to a limit
 *
 * An acquire that finds no idle connection creates one through the factory
 * while fewer than limit exist, and only waits once the limit is reached.
 */
class AutoScalingConnectionPool : public ConnectionPool {
public:
    // An empty factory means make_connection_factory() with default params.
    explicit AutoScalingConnectionPool(std::size_t limit = 1, ConnectionFactory factory = {});
    ~AutoScalingConnectionPool() override;

    boost::asio::awaitable<ConnectionLease> acquire() override;

    /**
     * @brief Closes the pool for good
     *
     * Idle connections close immediately. Borrowed ones close when their
     * lease returns them, so an in-flight call never sees its connection
     * closed underneath it. Pending and later acquires throw PoolException.
     */
    void teardown();

    std::size_t limit() const noexcept { return limit_; }
    std::size_t created_count() const noexcept { return connections_.size(); }
    bool is_torn_down() const noexcept { return is_shut_down(); }

protected:
    bool retire(Connection* connection) override;

private:
    std::size_t limit_;
    ConnectionFactory factory_;
    // Every connection ever created, idle or borrowed.
    std::vector<std::unique_ptr<Connection>> connections_;
};

}  // namespace accumulo
