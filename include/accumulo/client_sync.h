#pragma once

#include <cstddef>
#include <iterator>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "accumulo/connection.h"
#include "accumulo/proxy_client.h"
#include "accumulo/structs.h"

namespace accumulo {

/**
 * @brief Blocking scanner over a single connection
 *
 * Closed automatically on destruction if still open; a failure there is
 * logged. Iterating with range-for consumes the scan.
 */
class Scanner {
public:
    class iterator {
    public:
        using iterator_category = std::input_iterator_tag;
        using value_type = KeyValue;
        using difference_type = std::ptrdiff_t;
        using pointer = const KeyValue*;
        using reference = const KeyValue&;

        iterator() = default;

        reference operator*() const { return *current_; }
        pointer operator->() const { return &*current_; }
        iterator& operator++();
        void operator++(int) { ++*this; }

        friend bool operator==(const iterator& a, const iterator& b) {
            return a.current_.has_value() == b.current_.has_value();
        }

    private:
        friend class Scanner;
        explicit iterator(Scanner* scanner);

        Scanner* scanner_ = nullptr;
        std::optional<KeyValue> current_;
    };

    Scanner(ProxyClient& client, std::string resource_id);
    ~Scanner();

    Scanner(Scanner&& other) noexcept;
    Scanner& operator=(Scanner&&) = delete;
    Scanner(const Scanner&) = delete;

    // std::nullopt once the scan is exhausted; UsageError on later calls.
    std::optional<KeyValue> next();
    void close();

    iterator begin() { return iterator(this); }
    iterator end() { return iterator(); }

    const std::string& resource_id() const noexcept { return resource_id_; }
    bool is_open() const noexcept { return client_ != nullptr && open_; }

private:
    void require_open(const char* operation) const;

    ProxyClient* client_;
    std::string resource_id_;
    bool open_ = true;
    bool exhausted_ = false;
};

class Writer {
public:
    Writer(ProxyClient& client, std::string resource_id);
    ~Writer();

    Writer(Writer&& other) noexcept;
    Writer& operator=(Writer&&) = delete;
    Writer(const Writer&) = delete;

    void add_mutations(const std::vector<Mutation>& mutations);
    void close();

    const std::string& resource_id() const noexcept { return resource_id_; }
    bool is_open() const noexcept { return client_ != nullptr && open_; }

private:
    void require_open(const char* operation) const;

    ProxyClient* client_;
    std::string resource_id_;
    bool open_ = true;
};

// Blocking counterpart of AsyncConnector. Not thread-safe.
class Connector {
public:
    Connector(ProxyClient& client, std::string shared_secret);

    Scanner create_scanner(const std::string& table, const ScanOptions& options = {});
    Scanner create_batch_scanner(const std::string& table, const BatchScanOptions& options = {});
    Writer create_writer(const std::string& table, const WriterOptions& options = {});

    void change_user_authorizations(const std::string& user, const AuthorizationSet& auths);
    AuthorizationSet get_user_authorizations(const std::string& user);
    void create_table(const std::string& table, bool version_iterator = true,
                      TimeType time_type = TimeType::Millis);
    bool table_exists(const std::string& table);

private:
    ProxyClient* client_;
    std::string shared_secret_;
};

// Owns one connection; connectors it creates must not outlive it.
class ConnectionContext {
public:
    // nullptr => connect with default ConnectionParams.
    explicit ConnectionContext(std::unique_ptr<Connection> connection = nullptr);

    Connector create_connector(std::string shared_secret);
    Connection& connection() noexcept { return *connection_; }

private:
    std::unique_ptr<Connection> connection_;
};

}  // namespace accumulo
