#pragma once

#include <string>
#include <vector>

#include "accumulo_proxy.pb.h"

namespace accumulo {

/**
 * @brief Blocking function table of the remote proxy, one method per capability
 *
 * Arguments are already in wire form. Implementations report failures with
 * the exceptions in accumulo/error.h; exhaustion of a scanner is reported by
 * next_entry() throwing NoMoreEntriesError.
 *
 * An instance is used by one thread at a time.
 */
class ProxyClient {
public:
    virtual ~ProxyClient() = default;

    virtual std::string create_scanner(const std::string& login, const std::string& table,
                                       const proxy::ScanOptions& options) = 0;
    virtual std::string create_batch_scanner(const std::string& login, const std::string& table,
                                             const proxy::BatchScanOptions& options) = 0;
    virtual std::string create_writer(const std::string& login, const std::string& table,
                                      const proxy::WriterOptions& options) = 0;

    virtual proxy::KeyValueAndPeek next_entry(const std::string& scanner) = 0;
    virtual void close_scanner(const std::string& scanner) = 0;

    virtual void update(const std::string& writer, const std::vector<proxy::RowUpdates>& cells) = 0;
    virtual void close_writer(const std::string& writer) = 0;

    virtual void change_user_authorizations(const std::string& login, const std::string& user,
                                            const std::vector<std::string>& authorizations) = 0;
    virtual std::vector<std::string> get_user_authorizations(const std::string& login,
                                                             const std::string& user) = 0;

    virtual void create_table(const std::string& login, const std::string& table,
                              bool version_iterator, proxy::TimeType time_type) = 0;
    virtual bool table_exists(const std::string& login, const std::string& table) = 0;
};

}  // namespace accumulo
