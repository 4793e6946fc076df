#pragma once

#include <string>
#include <vector>

namespace qdrest {

struct HttpRequest {
    std::string method = "GET";
    std::string url;
    // Raw header lines, e.g. "Content-Type: application/json".
    std::vector<std::string> headers;
    std::string body;
    long timeout_seconds = 30;
};

struct HttpResponse {
    long status = 0;
    std::string body;

    bool ok() const noexcept { return status >= 200 && status < 300; }
};

// Performs one blocking request with libcurl. Throws TransportError when the
// exchange cannot complete; any HTTP status is returned as-is.
HttpResponse perform_http_request(const HttpRequest& request);

// Percent-encodes everything outside the RFC 3986 unreserved set, so the
// result is safe as a single URL path segment ("a b/c" -> "a%20b%2Fc").
std::string escape_path_segment(const std::string& segment);

class HttpTransport {
public:
    virtual ~HttpTransport() = default;

    // Implementations must be safe to call from several threads at once.
    virtual HttpResponse send(const HttpRequest& request) = 0;
};

class CurlTransport final : public HttpTransport {
public:
    HttpResponse send(const HttpRequest& request) override;
};

}  // namespace qdrest
