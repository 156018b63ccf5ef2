#pragma once

#include <stdexcept>
#include <string>

namespace accumulo {

/**
 * @brief Root of every error raised by the client library
 */
class AccumuloError : public std::runtime_error {
public:
    explicit AccumuloError(const std::string& message)
        : std::runtime_error(message) {}
};

/**
 * @brief Scanner exhaustion signal
 *
 * Expected end of a scan, not a failure. Scanners translate it into
 * end-of-sequence; it only reaches callers who use ProxyClient directly.
 */
class NoMoreEntriesError : public AccumuloError {
public:
    explicit NoMoreEntriesError(const std::string& message)
        : AccumuloError(message) {}
};

class NotFoundError : public AccumuloError {
public:
    explicit NotFoundError(const std::string& message)
        : AccumuloError(message) {}
};

class TableNotFoundError : public NotFoundError {
public:
    explicit TableNotFoundError(const std::string& message)
        : NotFoundError(message) {}
};

// Scanner or writer id the proxy does not know (never issued, or already closed).
class UnknownResourceError : public NotFoundError {
public:
    explicit UnknownResourceError(const std::string& message)
        : NotFoundError(message) {}
};

class TableExistsError : public AccumuloError {
public:
    explicit TableExistsError(const std::string& message)
        : AccumuloError(message) {}
};

class SecurityError : public AccumuloError {
public:
    explicit SecurityError(const std::string& message)
        : AccumuloError(message) {}
};

/**
 * @brief Connection-level failure
 *
 * Carries the numeric gRPC status code (grpc::StatusCode) so callers
 * deciding on a retry do not need the gRPC headers.
 */
class TransportError : public AccumuloError {
public:
    TransportError(const std::string& message, int status_code)
        : AccumuloError(message), status_code_(status_code) {}

    int status_code() const noexcept { return status_code_; }

private:
    int status_code_;
};

// Caller misuse: operating on a closed resource, closing twice, ...
class UsageError : public AccumuloError {
public:
    explicit UsageError(const std::string& message)
        : AccumuloError(message) {}
};

/**
 * @brief Exception thrown when pool or executor operations fail
 */
class PoolException : public AccumuloError {
public:
    explicit PoolException(const std::string& message)
        : AccumuloError(message) {}
};

}  // namespace accumulo
