#pragma once

#include <chrono>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

#include <grpcpp/grpcpp.h>

#include "accumulo/proxy_client.h"
#include "accumulo_proxy.grpc.pb.h"

namespace accumulo {

/**
 * @brief ProxyClient over the generated blocking gRPC stub
 *
 * Status mapping:
 *   OUT_OF_RANGE                        -> NoMoreEntriesError
 *   NOT_FOUND on a table call           -> TableNotFoundError
 *   NOT_FOUND on a scanner/writer call  -> UnknownResourceError
 *   NOT_FOUND on a user call            -> SecurityError
 *   ALREADY_EXISTS                      -> TableExistsError
 *   PERMISSION_DENIED, UNAUTHENTICATED  -> SecurityError
 *   anything else                       -> TransportError
 */
class GrpcProxyClient final : public ProxyClient {
public:
    // call_timeout of zero disables the per-call deadline
    explicit GrpcProxyClient(std::shared_ptr<grpc::Channel> channel,
                             std::chrono::milliseconds call_timeout = std::chrono::milliseconds{0});

    std::string create_scanner(const std::string& login, const std::string& table,
                               const proxy::ScanOptions& options) override;
    std::string create_batch_scanner(const std::string& login, const std::string& table,
                                     const proxy::BatchScanOptions& options) override;
    std::string create_writer(const std::string& login, const std::string& table,
                              const proxy::WriterOptions& options) override;
    proxy::KeyValueAndPeek next_entry(const std::string& scanner) override;
    void close_scanner(const std::string& scanner) override;
    void update(const std::string& writer, const std::vector<proxy::RowUpdates>& cells) override;
    void close_writer(const std::string& writer) override;
    void change_user_authorizations(const std::string& login, const std::string& user,
                                    const std::vector<std::string>& authorizations) override;
    std::vector<std::string> get_user_authorizations(const std::string& login,
                                                     const std::string& user) override;
    void create_table(const std::string& login, const std::string& table,
                      bool version_iterator, proxy::TimeType time_type) override;
    bool table_exists(const std::string& login, const std::string& table) override;

private:
    void prepare(grpc::ClientContext& context) const;

    std::unique_ptr<proxy::AccumuloProxy::Stub> stub_;
    std::chrono::milliseconds call_timeout_;
};

// What a call addresses; decides how NOT_FOUND is reported.
enum class CallSubject { Table, Resource, User };

// Throws the exception matching a failed status; no-op for OK.
void throw_if_error(const grpc::Status& status, std::string_view call, CallSubject subject);

}  // namespace accumulo
