#include "accumulo/grpc_proxy_client.h"

#include <spdlog/spdlog.h>

#include "accumulo/error.h"

namespace accumulo {

using grpc::ClientContext;
using grpc::Status;
using grpc::StatusCode;

void throw_if_error(const Status& status, std::string_view call, CallSubject subject) {
    if (status.ok()) {
        return;
    }

    std::string message = std::string(call) + ": " + status.error_message();
    switch (status.error_code()) {
        case StatusCode::OUT_OF_RANGE:
            throw NoMoreEntriesError(message);
        case StatusCode::NOT_FOUND:
            if (subject == CallSubject::Table) throw TableNotFoundError(message);
            if (subject == CallSubject::Resource) throw UnknownResourceError(message);
            throw SecurityError(message);
        case StatusCode::ALREADY_EXISTS:
            throw TableExistsError(message);
        case StatusCode::PERMISSION_DENIED:
        case StatusCode::UNAUTHENTICATED:
            throw SecurityError(message);
        default:
            spdlog::error("RPC {} failed: {} - {}", call, static_cast<int>(status.error_code()),
                          status.error_message());
            throw TransportError(message, static_cast<int>(status.error_code()));
    }
}

GrpcProxyClient::GrpcProxyClient(std::shared_ptr<grpc::Channel> channel,
                                 std::chrono::milliseconds call_timeout)
    : stub_(proxy::AccumuloProxy::NewStub(std::move(channel))), call_timeout_(call_timeout) {}

void GrpcProxyClient::prepare(ClientContext& context) const {
    if (call_timeout_.count() > 0) {
        context.set_deadline(std::chrono::system_clock::now() + call_timeout_);
    }
}

std::string GrpcProxyClient::create_scanner(const std::string& login, const std::string& table,
                                            const proxy::ScanOptions& options) {
    proxy::CreateScannerRequest request;
    request.set_login(login);
    request.set_table(table);
    *request.mutable_options() = options;

    proxy::ResourceId reply;
    ClientContext context;
    prepare(context);
    throw_if_error(stub_->CreateScanner(&context, request, &reply), "CreateScanner", CallSubject::Table);
    return reply.id();
}

std::string GrpcProxyClient::create_batch_scanner(const std::string& login, const std::string& table,
                                                  const proxy::BatchScanOptions& options) {
    proxy::CreateBatchScannerRequest request;
    request.set_login(login);
    request.set_table(table);
    *request.mutable_options() = options;

    proxy::ResourceId reply;
    ClientContext context;
    prepare(context);
    throw_if_error(stub_->CreateBatchScanner(&context, request, &reply), "CreateBatchScanner",
                   CallSubject::Table);
    return reply.id();
}

std::string GrpcProxyClient::create_writer(const std::string& login, const std::string& table,
                                           const proxy::WriterOptions& options) {
    proxy::CreateWriterRequest request;
    request.set_login(login);
    request.set_table(table);
    *request.mutable_options() = options;

    proxy::ResourceId reply;
    ClientContext context;
    prepare(context);
    throw_if_error(stub_->CreateWriter(&context, request, &reply), "CreateWriter", CallSubject::Table);
    return reply.id();
}

proxy::KeyValueAndPeek GrpcProxyClient::next_entry(const std::string& scanner) {
    proxy::ResourceId request;
    request.set_id(scanner);

    proxy::KeyValueAndPeek reply;
    ClientContext context;
    prepare(context);
    throw_if_error(stub_->NextEntry(&context, request, &reply), "NextEntry", CallSubject::Resource);
    return reply;
}

void GrpcProxyClient::close_scanner(const std::string& scanner) {
    proxy::ResourceId request;
    request.set_id(scanner);

    google::protobuf::Empty reply;
    ClientContext context;
    prepare(context);
    throw_if_error(stub_->CloseScanner(&context, request, &reply), "CloseScanner", CallSubject::Resource);
}

void GrpcProxyClient::update(const std::string& writer, const std::vector<proxy::RowUpdates>& cells) {
    proxy::UpdateRequest request;
    request.set_writer(writer);
    request.mutable_cells()->Reserve(static_cast<int>(cells.size()));
    for (const auto& row : cells) {
        *request.add_cells() = row;
    }

    google::protobuf::Empty reply;
    ClientContext context;
    prepare(context);
    throw_if_error(stub_->Update(&context, request, &reply), "Update", CallSubject::Resource);
}

void GrpcProxyClient::close_writer(const std::string& writer) {
    proxy::ResourceId request;
    request.set_id(writer);

    google::protobuf::Empty reply;
    ClientContext context;
    prepare(context);
    throw_if_error(stub_->CloseWriter(&context, request, &reply), "CloseWriter", CallSubject::Resource);
}

void GrpcProxyClient::change_user_authorizations(const std::string& login, const std::string& user,
                                                 const std::vector<std::string>& authorizations) {
    proxy::ChangeUserAuthorizationsRequest request;
    request.set_login(login);
    request.set_user(user);
    for (const auto& auth : authorizations) {
        request.add_authorizations(auth);
    }

    google::protobuf::Empty reply;
    ClientContext context;
    prepare(context);
    throw_if_error(stub_->ChangeUserAuthorizations(&context, request, &reply), "ChangeUserAuthorizations",
                   CallSubject::User);
}

std::vector<std::string> GrpcProxyClient::get_user_authorizations(const std::string& login,
                                                                  const std::string& user) {
    proxy::GetUserAuthorizationsRequest request;
    request.set_login(login);
    request.set_user(user);

    proxy::AuthorizationsReply reply;
    ClientContext context;
    prepare(context);
    throw_if_error(stub_->GetUserAuthorizations(&context, request, &reply), "GetUserAuthorizations",
                   CallSubject::User);
    return {reply.authorizations().begin(), reply.authorizations().end()};
}

void GrpcProxyClient::create_table(const std::string& login, const std::string& table,
                                   bool version_iterator, proxy::TimeType time_type) {
    proxy::CreateTableRequest request;
    request.set_login(login);
    request.set_table(table);
    request.set_version_iterator(version_iterator);
    request.set_time_type(time_type);

    google::protobuf::Empty reply;
    ClientContext context;
    prepare(context);
    throw_if_error(stub_->CreateTable(&context, request, &reply), "CreateTable", CallSubject::Table);
}

bool GrpcProxyClient::table_exists(const std::string& login, const std::string& table) {
    proxy::TableExistsRequest request;
    request.set_login(login);
    request.set_table(table);

    proxy::TableExistsReply reply;
    ClientContext context;
    prepare(context);
    throw_if_error(stub_->TableExists(&context, request, &reply), "TableExists", CallSubject::Table);
    return reply.exists();
}

}  // namespace accumulo
