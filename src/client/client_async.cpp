#include "accumulo/client_async.h"

#include <utility>

#include "accumulo/marshal.h"

namespace accumulo {

AsyncScanner::AsyncScanner(PoolExecutor& executor, std::string resource_id)
    : executor_(&executor), resource_id_(std::move(resource_id)) {}

AsyncScanner::AsyncScanner(AsyncScanner&& other) noexcept
    : executor_(std::exchange(other.executor_, nullptr)),
      resource_id_(std::move(other.resource_id_)),
      open_(other.open_),
      exhausted_(other.exhausted_) {}

AsyncScanner::~AsyncScanner() {
    if (is_open()) {
        spdlog::warn("Scanner {} destroyed without close(); the proxy keeps it until it expires", resource_id_);
    }
}

void AsyncScanner::require_open(const char* operation) const {
    if (!executor_) {
        throw UsageError(std::string(operation) + " on a moved-from scanner");
    }
    if (!open_) {
        throw UsageError(std::string(operation) + " on closed scanner " + resource_id_);
    }
}

boost::asio::awaitable<std::optional<KeyValue>> AsyncScanner::next() {
    require_open("next()");
    if (exhausted_) {
        throw UsageError("next() on exhausted scanner " + resource_id_);
    }
    try {
        auto entry = co_await executor_->run(&ProxyClient::next_entry, resource_id_);
        co_return marshal::from_wire(entry.key_value());
    } catch (const NoMoreEntriesError&) {
        exhausted_ = true;
    }
    co_return std::nullopt;
}

boost::asio::awaitable<void> AsyncScanner::close() {
    require_open("close()");
    open_ = false;
    co_await executor_->run(&ProxyClient::close_scanner, resource_id_);
}

AsyncWriter::AsyncWriter(PoolExecutor& executor, std::string resource_id)
    : executor_(&executor), resource_id_(std::move(resource_id)) {}

AsyncWriter::AsyncWriter(AsyncWriter&& other) noexcept
    : executor_(std::exchange(other.executor_, nullptr)),
      resource_id_(std::move(other.resource_id_)),
      open_(other.open_) {}

AsyncWriter::~AsyncWriter() {
    if (is_open()) {
        spdlog::warn("Writer {} destroyed without close(); buffered mutations may not be flushed", resource_id_);
    }
}

void AsyncWriter::require_open(const char* operation) const {
    if (!executor_) {
        throw UsageError(std::string(operation) + " on a moved-from writer");
    }
    if (!open_) {
        throw UsageError(std::string(operation) + " on closed writer " + resource_id_);
    }
}

boost::asio::awaitable<void> AsyncWriter::add_mutations(std::vector<Mutation> mutations) {
    require_open("add_mutations()");
    auto cells = marshal::index_mutations(mutations);
    co_await executor_->run(&ProxyClient::update, resource_id_, std::move(cells));
}

boost::asio::awaitable<void> AsyncWriter::close() {
    require_open("close()");
    open_ = false;
    co_await executor_->run(&ProxyClient::close_writer, resource_id_);
}

AsyncConnector::AsyncConnector(PoolExecutor& executor, std::string shared_secret)
    : executor_(&executor), shared_secret_(std::move(shared_secret)) {}

boost::asio::awaitable<AsyncScanner> AsyncConnector::create_scanner(std::string table, ScanOptions options) {
    auto id = co_await executor_->run(&ProxyClient::create_scanner, shared_secret_, table,
                                      marshal::to_wire(options));
    spdlog::debug("Scanner {} created on {}", id, table);
    co_return AsyncScanner(*executor_, std::move(id));
}

boost::asio::awaitable<AsyncScanner> AsyncConnector::create_batch_scanner(std::string table,
                                                                         BatchScanOptions options) {
    auto id = co_await executor_->run(&ProxyClient::create_batch_scanner, shared_secret_, table,
                                      marshal::to_wire(options));
    spdlog::debug("Batch scanner {} created on {}", id, table);
    co_return AsyncScanner(*executor_, std::move(id));
}

boost::asio::awaitable<AsyncWriter> AsyncConnector::create_writer(std::string table, WriterOptions options) {
    auto id = co_await executor_->run(&ProxyClient::create_writer, shared_secret_, table,
                                      marshal::to_wire(options));
    spdlog::debug("Writer {} created on {}", id, table);
    co_return AsyncWriter(*executor_, std::move(id));
}

boost::asio::awaitable<void> AsyncConnector::change_user_authorizations(std::string user, AuthorizationSet auths) {
    co_await executor_->run(&ProxyClient::change_user_authorizations, shared_secret_, user,
                            marshal::to_wire(auths));
}

boost::asio::awaitable<AuthorizationSet> AsyncConnector::get_user_authorizations(std::string user) {
    auto auths = co_await executor_->run(&ProxyClient::get_user_authorizations, shared_secret_, user);
    co_return marshal::authorizations_from_wire(auths);
}

boost::asio::awaitable<void> AsyncConnector::create_table(std::string table, bool version_iterator,
                                                          TimeType time_type) {
    co_await executor_->run(&ProxyClient::create_table, shared_secret_, table, version_iterator,
                            marshal::to_wire(time_type));
}

boost::asio::awaitable<bool> AsyncConnector::table_exists(std::string table) {
    co_return co_await executor_->run(&ProxyClient::table_exists, shared_secret_, table);
}

AsyncConnectionContext::AsyncConnectionContext(std::shared_ptr<PoolExecutor> executor)
    : executor_(executor ? std::move(executor) : std::make_shared<PoolExecutor>()) {}

AsyncConnector AsyncConnectionContext::create_connector(std::string shared_secret) {
    return AsyncConnector(*executor_, std::move(shared_secret));
}

}  // namespace accumulo
