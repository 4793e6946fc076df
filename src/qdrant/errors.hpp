#pragma once

#include <stdexcept>
#include <string>
#include <utility>

namespace qdrest {

// Root of every failure the client reports.
class QdrantError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// The HTTP exchange itself could not complete (DNS, connect, TLS, timeout).
class TransportError : public QdrantError {
public:
    TransportError(const std::string& message, int code) : QdrantError(message), code_(code) {}

    // libcurl result code.
    int code() const noexcept { return code_; }

private:
    int code_;
};

// The server answered, but with a non-success HTTP status or status field.
class RequestFailedError : public QdrantError {
public:
    RequestFailedError(const std::string& message, long http_status, std::string server_status = {})
        : QdrantError(message), http_status_(http_status), server_status_(std::move(server_status)) {}

    long http_status() const noexcept { return http_status_; }
    const std::string& server_status() const noexcept { return server_status_; }

private:
    long http_status_;
    std::string server_status_;
};

// The body was not JSON, or an expected field was missing or mistyped.
// http_status() is the response status when the body itself does not parse.
// Shape errors are found after the exchange has already succeeded, and for
// those it is 0.
class DecodeError : public RequestFailedError {
public:
    explicit DecodeError(const std::string& message, long http_status = 0)
        : RequestFailedError(message, http_status) {}
};

// create_collection on a name that already exists.
class ConflictError : public QdrantError {
public:
    using QdrantError::QdrantError;
};

// delete_collection on a name that does not exist.
class NotFoundError : public QdrantError {
public:
    using QdrantError::QdrantError;
};

}  // namespace qdrest
