#pragma once

#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <string>

#include <grpcpp/grpcpp.h>

#include "accumulo/proxy_client.h"

namespace accumulo {

struct ConnectionParams {
    std::string hostname = "127.0.0.1";
    std::uint16_t port = 42424;
    // How long the constructor waits for the channel to become ready.
    std::chrono::milliseconds connect_timeout{5000};
    // Per-call deadline; zero means none.
    std::chrono::milliseconds call_timeout{0};
    bool enable_tracing = false;

    std::string target() const { return hostname + ":" + std::to_string(port); }
};

/**
 * @brief One blocking transport/client pair to the proxy
 *
 * Connected eagerly on construction. Closing is idempotent; the client must
 * not be used afterwards.
 */
class Connection {
public:
    // Opens a gRPC channel to params.target(); throws TransportError when it
    // is not ready within params.connect_timeout.
    explicit Connection(const ConnectionParams& params = {});

    // Wraps an already constructed client, e.g. a different transport.
    explicit Connection(std::unique_ptr<ProxyClient> client);

    ~Connection();

    Connection(const Connection&) = delete;
    Connection& operator=(const Connection&) = delete;

    // Throws UsageError once closed.
    ProxyClient& client();

    void close() noexcept;
    bool is_open() const noexcept { return client_ != nullptr; }
    std::uint64_t id() const noexcept { return id_; }

private:
    std::shared_ptr<grpc::Channel> channel_;
    std::unique_ptr<ProxyClient> client_;
    std::uint64_t id_;
};

using ConnectionFactory = std::function<std::unique_ptr<Connection>()>;

ConnectionFactory make_connection_factory(ConnectionParams params = {});

}  // namespace accumulo
