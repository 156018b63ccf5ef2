#include "accumulo/client_sync.h"

#include <utility>

#include <spdlog/spdlog.h>

#include "accumulo/error.h"
#include "accumulo/marshal.h"

namespace accumulo {

Scanner::iterator::iterator(Scanner* scanner) : scanner_(scanner) {
    current_ = scanner_->next();
}

Scanner::iterator& Scanner::iterator::operator++() {
    current_ = scanner_->next();
    return *this;
}

Scanner::Scanner(ProxyClient& client, std::string resource_id)
    : client_(&client), resource_id_(std::move(resource_id)) {}

Scanner::Scanner(Scanner&& other) noexcept
    : client_(std::exchange(other.client_, nullptr)),
      resource_id_(std::move(other.resource_id_)),
      open_(other.open_),
      exhausted_(other.exhausted_) {}

Scanner::~Scanner() {
    if (!is_open()) {
        return;
    }
    try {
        close();
    } catch (const std::exception& e) {
        spdlog::error("Closing scanner {} failed: {}", resource_id_, e.what());
    }
}

void Scanner::require_open(const char* operation) const {
    if (!client_) {
        throw UsageError(std::string(operation) + " on a moved-from scanner");
    }
    if (!open_) {
        throw UsageError(std::string(operation) + " on closed scanner " + resource_id_);
    }
}

std::optional<KeyValue> Scanner::next() {
    require_open("next()");
    if (exhausted_) {
        throw UsageError("next() on exhausted scanner " + resource_id_);
    }
    try {
        return marshal::from_wire(client_->next_entry(resource_id_).key_value());
    } catch (const NoMoreEntriesError&) {
        exhausted_ = true;
        return std::nullopt;
    }
}

void Scanner::close() {
    require_open("close()");
    open_ = false;
    client_->close_scanner(resource_id_);
}

Writer::Writer(ProxyClient& client, std::string resource_id)
    : client_(&client), resource_id_(std::move(resource_id)) {}

Writer::Writer(Writer&& other) noexcept
    : client_(std::exchange(other.client_, nullptr)),
      resource_id_(std::move(other.resource_id_)),
      open_(other.open_) {}

Writer::~Writer() {
    if (!is_open()) {
        return;
    }
    try {
        close();
    } catch (const std::exception& e) {
        spdlog::error("Closing writer {} failed: {}", resource_id_, e.what());
    }
}

void Writer::require_open(const char* operation) const {
    if (!client_) {
        throw UsageError(std::string(operation) + " on a moved-from writer");
    }
    if (!open_) {
        throw UsageError(std::string(operation) + " on closed writer " + resource_id_);
    }
}

void Writer::add_mutations(const std::vector<Mutation>& mutations) {
    require_open("add_mutations()");
    client_->update(resource_id_, marshal::index_mutations(mutations));
}

void Writer::close() {
    require_open("close()");
    open_ = false;
    client_->close_writer(resource_id_);
}

Connector::Connector(ProxyClient& client, std::string shared_secret)
    : client_(&client), shared_secret_(std::move(shared_secret)) {}

Scanner Connector::create_scanner(const std::string& table, const ScanOptions& options) {
    return Scanner(*client_, client_->create_scanner(shared_secret_, table, marshal::to_wire(options)));
}

Scanner Connector::create_batch_scanner(const std::string& table, const BatchScanOptions& options) {
    return Scanner(*client_, client_->create_batch_scanner(shared_secret_, table, marshal::to_wire(options)));
}

Writer Connector::create_writer(const std::string& table, const WriterOptions& options) {
    return Writer(*client_, client_->create_writer(shared_secret_, table, marshal::to_wire(options)));
}

void Connector::change_user_authorizations(const std::string& user, const AuthorizationSet& auths) {
    client_->change_user_authorizations(shared_secret_, user, marshal::to_wire(auths));
}

AuthorizationSet Connector::get_user_authorizations(const std::string& user) {
    return marshal::authorizations_from_wire(client_->get_user_authorizations(shared_secret_, user));
}

void Connector::create_table(const std::string& table, bool version_iterator, TimeType time_type) {
    client_->create_table(shared_secret_, table, version_iterator, marshal::to_wire(time_type));
}

bool Connector::table_exists(const std::string& table) {
    return client_->table_exists(shared_secret_, table);
}

ConnectionContext::ConnectionContext(std::unique_ptr<Connection> connection)
    : connection_(connection ? std::move(connection) : std::make_unique<Connection>()) {}

Connector ConnectionContext::create_connector(std::string shared_secret) {
    return Connector(connection_->client(), std::move(shared_secret));
}

}  // namespace accumulo
