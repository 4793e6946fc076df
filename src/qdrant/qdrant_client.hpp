#pragma once

#include <cstdint>
#include <memory>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "net/http_client.hpp"
#include "qdrant/errors.hpp"
#include "qdrant/point.hpp"

namespace qdrest {

class Config;

enum class Distance { Cosine, Euclid, Dot, Manhattan };

const char* to_string(Distance distance);

struct VectorParams {
    std::uint64_t size = 0;
    Distance distance = Distance::Cosine;
    bool on_disk = true;
};

// Blocking client for the Qdrant REST API. Every operation is exactly one
// HTTP round trip (create/delete collection add one existence check first).
// Collection names and textual point ids are percent-escaped into the path.
//
// Failures are thrown as QdrantError subclasses: TransportError when the
// exchange did not complete, RequestFailedError for a non-success status,
// DecodeError for an unusable body, ConflictError/NotFoundError for the
// collection preconditions.
//
// The client keeps no per-call state, so one instance may be shared between
// threads. with_api_key() is the exception: callers must not change the key
// while other calls are in flight.
class QdrantClient {
public:
    QdrantClient();
    explicit QdrantClient(std::string base_url);
    QdrantClient(std::string base_url, std::shared_ptr<HttpTransport> transport);

    static QdrantClient from_config(const Config& config);

    QdrantClient& with_api_key(std::string api_key);
    QdrantClient& with_timeout(long timeout_seconds);

    const std::string& base_url() const noexcept { return base_url_; }
    bool has_api_key() const noexcept { return !api_key_.empty(); }

    // Collections
    // Uses GET /collections/{name}/exists; on servers that answer that route
    // with 404 it falls back to searching list_collections().
    bool collection_exists(const std::string& collection_name) const;
    void create_collection(const std::string& collection_name, std::uint64_t size) const;
    void create_collection(const std::string& collection_name, const VectorParams& params) const;
    void delete_collection(const std::string& collection_name) const;
    std::vector<std::string> list_collections() const;
    // Point count as reported by the server.
    std::uint64_t collection_info(const std::string& collection_name) const;

    // Points
    void upsert_points(const std::string& collection_name, const std::vector<Point>& points) const;
    Point get_point(const std::string& collection_name, const PointId& id) const;
    std::vector<Point> get_points(const std::string& collection_name, const std::vector<PointId>& ids) const;
    void delete_points(const std::string& collection_name, const std::vector<PointId>& ids) const;

    // Returns hits in server order. A successful response without a "result"
    // field is read as "no matches" and yields an empty vector; every other
    // failure (transport, HTTP status, non-array result) is thrown.
    std::vector<ScoredPoint> search_points(const std::string& collection_name,
                                           const std::vector<float>& vector,
                                           std::uint64_t limit,
                                           float score_threshold = 0.0f) const;

    // Raw REST layer. Each call issues one request, throws TransportError or
    // RequestFailedError when the exchange fails and DecodeError when the body
    // is not JSON, and otherwise returns the response envelope untouched
    // (null for an empty body). The typed operations above are built on these.
    nlohmann::json list_collections_api() const;
    nlohmann::json collection_info_api(const std::string& collection_name) const;
    nlohmann::json collection_exists_api(const std::string& collection_name) const;
    nlohmann::json create_collection_api(const std::string& collection_name, const nlohmann::json& params) const;
    nlohmann::json delete_collection_api(const std::string& collection_name) const;
    nlohmann::json upsert_points_api(const std::string& collection_name, const nlohmann::json& params) const;
    nlohmann::json get_point_api(const std::string& collection_name, const PointId& id) const;
    nlohmann::json get_points_api(const std::string& collection_name, const nlohmann::json& params) const;
    nlohmann::json delete_points_api(const std::string& collection_name, const nlohmann::json& params) const;
    nlohmann::json search_points_api(const std::string& collection_name, const nlohmann::json& params) const;

private:
    std::string base_url_;
    std::string api_key_;
    long timeout_seconds_ = 30;
    std::shared_ptr<HttpTransport> transport_;

    std::string collection_url(const std::string& collection_name) const;
    HttpRequest make_request(std::string method, std::string url, std::string body = {}) const;
    HttpResponse send(const HttpRequest& request) const;
    nlohmann::json call(std::string method, std::string url, const std::string& what, std::string body = {}) const;
};

}  // namespace qdrest
