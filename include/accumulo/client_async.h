#pragma once

#include <exception>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include <boost/asio/awaitable.hpp>
#include <spdlog/spdlog.h>

#include "accumulo/error.h"
#include "accumulo/pool/pool_executor.h"
#include "accumulo/structs.h"

namespace accumulo {

/**
 * @brief Server-side scanner driven through a PoolExecutor
 *
 * OPEN until close(). next() yields entries until the proxy reports
 * exhaustion, then std::nullopt once; calling next() after that, or after
 * close(), throws UsageError. Closing twice throws UsageError. The scanner
 * is not closed on destruction (that needs a suspension point); use
 * scoped() or close() explicitly.
 */
class AsyncScanner {
public:
    AsyncScanner(PoolExecutor& executor, std::string resource_id);
    ~AsyncScanner();

    AsyncScanner(AsyncScanner&& other) noexcept;
    AsyncScanner& operator=(AsyncScanner&&) = delete;
    AsyncScanner(const AsyncScanner&) = delete;

    boost::asio::awaitable<std::optional<KeyValue>> next();
    boost::asio::awaitable<void> close();

    const std::string& resource_id() const noexcept { return resource_id_; }
    bool is_open() const noexcept { return executor_ != nullptr && open_; }
    bool is_exhausted() const noexcept { return exhausted_; }

private:
    void require_open(const char* operation) const;

    PoolExecutor* executor_;
    std::string resource_id_;
    bool open_ = true;
    bool exhausted_ = false;
};

/**
 * @brief Server-side batch writer driven through a PoolExecutor
 *
 * add_mutations() sends one update per call, grouped by row. The proxy
 * buffers and flushes according to the WriterOptions the writer was created
 * with; close() flushes and invalidates the id.
 */
class AsyncWriter {
public:
    AsyncWriter(PoolExecutor& executor, std::string resource_id);
    ~AsyncWriter();

    AsyncWriter(AsyncWriter&& other) noexcept;
    AsyncWriter& operator=(AsyncWriter&&) = delete;
    AsyncWriter(const AsyncWriter&) = delete;

    boost::asio::awaitable<void> add_mutations(std::vector<Mutation> mutations);
    boost::asio::awaitable<void> close();

    const std::string& resource_id() const noexcept { return resource_id_; }
    bool is_open() const noexcept { return executor_ != nullptr && open_; }

private:
    void require_open(const char* operation) const;

    PoolExecutor* executor_;
    std::string resource_id_;
    bool open_ = true;
};

/**
 * @brief Creates remote resources and runs metadata calls
 *
 * Holds no connection; the capability token is sent with every call, so one
 * connector can be shared by any number of coroutines on the executor.
 */
class AsyncConnector {
public:
    AsyncConnector(PoolExecutor& executor, std::string shared_secret);

    boost::asio::awaitable<AsyncScanner> create_scanner(std::string table, ScanOptions options = {});
    boost::asio::awaitable<AsyncScanner> create_batch_scanner(std::string table, BatchScanOptions options = {});
    boost::asio::awaitable<AsyncWriter> create_writer(std::string table, WriterOptions options = {});

    boost::asio::awaitable<void> change_user_authorizations(std::string user, AuthorizationSet auths);
    boost::asio::awaitable<AuthorizationSet> get_user_authorizations(std::string user);
    boost::asio::awaitable<void> create_table(std::string table, bool version_iterator = true,
                                              TimeType time_type = TimeType::Millis);
    boost::asio::awaitable<bool> table_exists(std::string table);

private:
    PoolExecutor* executor_;
    std::string shared_secret_;
};

class AsyncConnectionContext {
public:
    // nullptr => a PoolExecutor with default options.
    explicit AsyncConnectionContext(std::shared_ptr<PoolExecutor> executor = nullptr);

    AsyncConnector create_connector(std::string shared_secret);
    PoolExecutor& executor() noexcept { return *executor_; }

private:
    std::shared_ptr<PoolExecutor> executor_;
};

/**
 * @brief Runs fn(resource) and closes the resource on every exit path
 *
 * fn returns an awaitable<void>. A resource fn already closed is left
 * alone. When fn fails and close() fails as well,
 * the close error is logged and fn's error is the one propagated.
 */
template <class Resource, class F>
boost::asio::awaitable<void> scoped(Resource& resource, F fn) {
    std::exception_ptr failure;
    try {
        co_await fn(resource);
    } catch (...) {
        failure = std::current_exception();
    }

    if (!failure) {
        if (resource.is_open()) {
            co_await resource.close();
        }
        co_return;
    }

    try {
        if (resource.is_open()) {
            co_await resource.close();
        }
    } catch (const std::exception& e) {
        spdlog::error("Closing resource {} after a failure also failed: {}", resource.resource_id(), e.what());
    }
    std::rethrow_exception(failure);
}

}  // namespace accumulo
