#include "net/http_client.hpp"

#include <curl/curl.h>

#include <memory>
#include <string_view>

#include "qdrant/errors.hpp"

namespace qdrest {
namespace {

class CurlGlobal {
public:
    CurlGlobal() : code_(curl_global_init(CURL_GLOBAL_DEFAULT)) {}
    ~CurlGlobal() {
        if (code_ == CURLE_OK) {
            curl_global_cleanup();
        }
    }

    CURLcode code() const noexcept { return code_; }

private:
    CURLcode code_;
};

CurlGlobal& global_curl() {
    static CurlGlobal global;
    return global;
}

struct EasyDeleter {
    void operator()(CURL* curl) const { curl_easy_cleanup(curl); }
};

struct SlistDeleter {
    void operator()(curl_slist* list) const { curl_slist_free_all(list); }
};

using EasyHandle = std::unique_ptr<CURL, EasyDeleter>;
using HeaderList = std::unique_ptr<curl_slist, SlistDeleter>;

size_t write_callback(char* ptr, size_t size, size_t nmemb, void* userdata) {
    const size_t total = size * nmemb;
    auto* buffer = static_cast<std::string*>(userdata);
    buffer->append(ptr, total);
    return total;
}

}  // namespace

HttpResponse perform_http_request(const HttpRequest& request) {
    if (const CURLcode init = global_curl().code(); init != CURLE_OK) {
        throw TransportError(std::string{"curl global init failed: "} + curl_easy_strerror(init), init);
    }

    EasyHandle curl{curl_easy_init()};
    if (!curl) {
        throw TransportError("failed to initialize curl", CURLE_FAILED_INIT);
    }

    std::string response_body;
    curl_easy_setopt(curl.get(), CURLOPT_URL, request.url.c_str());
    curl_easy_setopt(curl.get(), CURLOPT_WRITEFUNCTION, write_callback);
    curl_easy_setopt(curl.get(), CURLOPT_WRITEDATA, &response_body);
    curl_easy_setopt(curl.get(), CURLOPT_CUSTOMREQUEST, request.method.c_str());
    curl_easy_setopt(curl.get(), CURLOPT_FOLLOWLOCATION, 1L);
    curl_easy_setopt(curl.get(), CURLOPT_NOSIGNAL, 1L);
    if (request.timeout_seconds > 0) {
        curl_easy_setopt(curl.get(), CURLOPT_TIMEOUT, request.timeout_seconds);
    }

    HeaderList headers;
    for (const auto& header : request.headers) {
        curl_slist* appended = curl_slist_append(headers.get(), header.c_str());
        if (appended == nullptr) {
            throw TransportError("failed to build request headers", CURLE_OUT_OF_MEMORY);
        }
        headers.release();
        headers.reset(appended);
    }
    if (headers) {
        curl_easy_setopt(curl.get(), CURLOPT_HTTPHEADER, headers.get());
    }

    if (!request.body.empty()) {
        curl_easy_setopt(curl.get(), CURLOPT_POSTFIELDS, request.body.c_str());
        curl_easy_setopt(curl.get(), CURLOPT_POSTFIELDSIZE, static_cast<long>(request.body.size()));
    } else if (request.method == "POST" || request.method == "PUT" || request.method == "PATCH") {
        curl_easy_setopt(curl.get(), CURLOPT_POSTFIELDSIZE, 0L);
    }

    const CURLcode code = curl_easy_perform(curl.get());
    if (code != CURLE_OK) {
        throw TransportError(request.method + ' ' + request.url + " failed: " + curl_easy_strerror(code), code);
    }

    long status_code = 0;
    curl_easy_getinfo(curl.get(), CURLINFO_RESPONSE_CODE, &status_code);
    return HttpResponse{status_code, std::move(response_body)};
}

std::string escape_path_segment(const std::string& segment) {
    if (const CURLcode init = global_curl().code(); init != CURLE_OK) {
        throw TransportError(std::string{"curl global init failed: "} + curl_easy_strerror(init), init);
    }

    EasyHandle curl{curl_easy_init()};
    if (!curl) {
        throw TransportError("failed to initialize curl", CURLE_FAILED_INIT);
    }
    char* escaped = curl_easy_escape(curl.get(), segment.c_str(), static_cast<int>(segment.size()));
    if (escaped == nullptr) {
        throw TransportError("failed to escape url segment '" + segment + "'", CURLE_OUT_OF_MEMORY);
    }
    std::string out{escaped};
    curl_free(escaped);
    return out;
}

HttpResponse CurlTransport::send(const HttpRequest& request) {
    return perform_http_request(request);
}

}  // namespace qdrest
