#include "accumulo/connection.h"

#include <atomic>
#include <stdexcept>

#include <spdlog/spdlog.h>

#include "accumulo/error.h"
#include "accumulo/grpc_proxy_client.h"
#include "accumulo/tracing/grpc_tracing_interceptor.h"

namespace accumulo {

namespace {

std::uint64_t next_connection_id() {
    static std::atomic<std::uint64_t> counter{0};
    return ++counter;
}

std::shared_ptr<grpc::Channel> open_channel(const ConnectionParams& params) {
    auto credentials = grpc::InsecureChannelCredentials();
    if (params.enable_tracing) {
        return tracing::CreateTracedChannel(params.target(), credentials);
    }
    return grpc::CreateChannel(params.target(), credentials);
}

}  // namespace

Connection::Connection(const ConnectionParams& params)
    : channel_(open_channel(params)), id_(next_connection_id()) {
    auto deadline = std::chrono::system_clock::now() + params.connect_timeout;
    if (!channel_->WaitForConnected(deadline)) {
        spdlog::error("Connection {} to {} not ready after {} ms", id_, params.target(),
                      params.connect_timeout.count());
        throw TransportError("failed to connect to " + params.target(),
                             static_cast<int>(grpc::StatusCode::UNAVAILABLE));
    }
    client_ = std::make_unique<GrpcProxyClient>(channel_, params.call_timeout);
    spdlog::info("Connection {} opened to {}", id_, params.target());
}

Connection::Connection(std::unique_ptr<ProxyClient> client)
    : client_(std::move(client)), id_(next_connection_id()) {
    if (!client_) {
        throw std::invalid_argument("Connection requires a client");
    }
}

Connection::~Connection() {
    close();
}

ProxyClient& Connection::client() {
    if (!client_) {
        throw UsageError("connection " + std::to_string(id_) + " is closed");
    }
    return *client_;
}

void Connection::close() noexcept {
    if (!client_) {
        return;
    }
    client_.reset();
    channel_.reset();
    spdlog::debug("Connection {} closed", id_);
}

ConnectionFactory make_connection_factory(ConnectionParams params) {
    return [params = std::move(params)]() {
        return std::make_unique<Connection>(params);
    };
}

}  // namespace accumulo
