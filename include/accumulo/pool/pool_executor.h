#pragma once

#include <chrono>
#include <cstddef>
#include <exception>
#include <functional>
#include <memory>
#include <string>
#include <type_traits>
#include <utility>

#include <boost/asio/associated_executor.hpp>
#include <boost/asio/async_result.hpp>
#include <boost/asio/awaitable.hpp>
#include <boost/asio/execution.hpp>
#include <boost/asio/post.hpp>
#include <boost/asio/prefer.hpp>
#include <boost/asio/use_awaitable.hpp>
#include <prometheus/registry.h>

#include "accumulo/connection.h"
#include "accumulo/error.h"
#include "accumulo/metrics/pool_metrics.h"
#include "accumulo/pool/connection_pool.h"
#include "accumulo/proxy_client.h"

namespace accumulo {

namespace worker {
class WorkerPool;
}

struct PoolExecutorOptions {
    std::size_t connection_limit = 1;
    // 0 => connection_limit
    std::size_t max_threads = 0;
    // Empty => make_connection_factory() with default params.
    ConnectionFactory connection_factory;
    // nullptr disables metrics.
    std::shared_ptr<prometheus::Registry> metrics_registry;
    std::string name = "accumulo";
};

/**
 * @brief Runs blocking proxy calls on worker threads for a coroutine caller
 *
 * run() borrows a connection from an AutoScalingConnectionPool, executes one
 * ProxyClient method on a worker thread and resumes the caller on its own
 * executor with the result. The connection returns to the pool once the call
 * finishes, whatever the outcome; errors reach the caller unchanged.
 *
 * At most min(connection_limit, max_threads) calls run at once. run() and
 * close() must be called from the single-threaded executor that owns the
 * pool. The executor must outlive every coroutine suspended in run().
 */
class PoolExecutor {
public:
    explicit PoolExecutor(PoolExecutorOptions options = {});
    ~PoolExecutor();

    PoolExecutor(const PoolExecutor&) = delete;
    PoolExecutor& operator=(const PoolExecutor&) = delete;

    /**
     * @brief Calls (client.*entry)(args...) on a pooled connection
     *
     * Arguments are copied into the coroutine frame.
     *
     * @code
     *   bool exists = co_await executor.run(&ProxyClient::table_exists, secret, table);
     * @endcode
     */
    template <class R, class... Params, class... Args>
    boost::asio::awaitable<R> run(R (ProxyClient::*entry)(Params...), Args... args);

    // Shuts the workers down (finishing in-flight and queued calls), then
    // tears the pool down. Idempotent.
    void close();

    bool is_closed() const noexcept { return closed_; }
    std::size_t thread_count() const noexcept;
    AutoScalingConnectionPool& pool() noexcept { return pool_; }

private:
    template <class R, class Call>
    boost::asio::awaitable<R> offload(Call call);

    // False once the workers are stopping.
    bool submit(std::function<void()> task);

    void record(std::chrono::steady_clock::time_point started, bool failed);

    std::unique_ptr<metrics::PoolMetrics> metrics_;
    AutoScalingConnectionPool pool_;
    std::unique_ptr<worker::WorkerPool> workers_;
    bool closed_ = false;
};

template <class R, class Call>
boost::asio::awaitable<R> PoolExecutor::offload(Call call) {
    // The worker completes the handler on the caller's executor. The tracked
    // executor keeps the caller's io_context from running out of work while
    // the call is in flight.
    auto initiate = [this, call = std::move(call)](auto handler) mutable {
        using Handler = decltype(handler);
        auto shared = std::make_shared<Handler>(std::move(handler));
        auto home = boost::asio::prefer(boost::asio::get_associated_executor(*shared),
                                        boost::asio::execution::outstanding_work.tracked);

        auto complete = [shared, home](std::exception_ptr failure, auto... result) {
            boost::asio::post(home, [shared, failure, result...]() mutable {
                (*shared)(failure, std::move(result)...);
            });
        };

        bool accepted = submit([call, complete]() mutable {
            if constexpr (std::is_void_v<R>) {
                std::exception_ptr failure;
                try {
                    call();
                } catch (...) {
                    failure = std::current_exception();
                }
                complete(failure);
            } else {
                std::exception_ptr failure;
                R result{};
                try {
                    result = call();
                } catch (...) {
                    failure = std::current_exception();
                }
                complete(failure, std::move(result));
            }
        });
        if (!accepted) {
            auto rejected = std::make_exception_ptr(PoolException("pool executor is closed"));
            if constexpr (std::is_void_v<R>) {
                complete(rejected);
            } else {
                complete(rejected, R{});
            }
        }
    };

    if constexpr (std::is_void_v<R>) {
        co_await boost::asio::async_initiate<const boost::asio::use_awaitable_t<>&, void(std::exception_ptr)>(
            std::move(initiate), boost::asio::use_awaitable);
    } else {
        co_return co_await boost::asio::async_initiate<const boost::asio::use_awaitable_t<>&,
                                                       void(std::exception_ptr, R)>(
            std::move(initiate), boost::asio::use_awaitable);
    }
}

template <class R, class... Params, class... Args>
boost::asio::awaitable<R> PoolExecutor::run(R (ProxyClient::*entry)(Params...), Args... args) {
    if (closed_) {
        throw PoolException("pool executor is closed");
    }

    ConnectionLease lease = co_await pool_.acquire();
    ProxyClient* client = &lease->client();
    const auto started = std::chrono::steady_clock::now();
    auto call = [client, entry, args...]() -> R { return (client->*entry)(args...); };

    try {
        if constexpr (std::is_void_v<R>) {
            co_await offload<R>(std::move(call));
            record(started, false);
        } else {
            R result = co_await offload<R>(std::move(call));
            record(started, false);
            co_return result;
        }
    } catch (const NoMoreEntriesError&) {
        record(started, false);
        throw;
    } catch (const std::exception&) {
        record(started, true);
        throw;
    }
}

}  // namespace accumulo
