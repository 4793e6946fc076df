#include "qdrant/qdrant_client.hpp"

#include <algorithm>
#include <utility>

#include "config/config.hpp"
#include "util/log.hpp"
#include "version.hpp"

namespace qdrest
{
    namespace
    {

        std::string ensure_no_trailing_slash(std::string url)
        {
            while (!url.empty() && url.back() == '/')
            {
                url.pop_back();
            }
            return url;
        }

        // Qdrant reports failures as {"status": {"error": "..."}}.
        std::string server_status_of(const std::string &body)
        {
            const auto json = nlohmann::json::parse(body, nullptr, false);
            if (json.is_discarded() || !json.is_object())
            {
                return {};
            }
            const auto it = json.find("status");
            if (it == json.end())
            {
                return {};
            }
            if (it->is_string())
            {
                return it->get<std::string>();
            }
            if (it->is_object())
            {
                if (const auto error = it->find("error"); error != it->end() && error->is_string())
                {
                    return error->get<std::string>();
                }
            }
            return {};
        }

        void require_success(const HttpResponse &response, const std::string &what)
        {
            if (response.ok())
            {
                return;
            }
            std::string status = server_status_of(response.body);
            std::string message = what + " failed with status " + std::to_string(response.status);
            if (!status.empty())
            {
                message += ": " + status;
            }
            throw RequestFailedError(message, response.status, std::move(status));
        }

        nlohmann::json parse_body(const HttpResponse &response, const std::string &what)
        {
            if (response.body.empty())
            {
                return nullptr;
            }
            try
            {
                return nlohmann::json::parse(response.body);
            }
            catch (const nlohmann::json::exception &ex)
            {
                throw DecodeError(what + ": response is not valid JSON: " + ex.what(), response.status);
            }
        }

        const nlohmann::json &require_field(const nlohmann::json &json, const char *field, const std::string &what)
        {
            if (!json.is_object())
            {
                throw DecodeError(what + ": expected a JSON object");
            }
            const auto it = json.find(field);
            if (it == json.end())
            {
                throw DecodeError(what + ": response missing '" + field + "'");
            }
            return *it;
        }

        // {"result": true}
        bool result_flag(const nlohmann::json &json, const std::string &what)
        {
            const auto &result = require_field(json, "result", what);
            if (!result.is_boolean())
            {
                throw DecodeError(what + ": 'result' is not a boolean");
            }
            return result.get<bool>();
        }

        // Element decode errors carry no request context of their own.
        template <typename Decode>
        auto decode_element(const nlohmann::json &item, const std::string &what, Decode decode)
        {
            try
            {
                return decode(item);
            }
            catch (const DecodeError &ex)
            {
                throw DecodeError(what + ": " + ex.what());
            }
        }

        std::string join_ids(const std::vector<PointId> &ids)
        {
            std::string out;
            for (const auto &id : ids)
            {
                if (!out.empty())
                {
                    out += ',';
                }
                out += id.to_string();
            }
            return out;
        }

    } // namespace

    const char *to_string(Distance distance)
    {
        switch (distance)
        {
        case Distance::Cosine:
            return "Cosine";
        case Distance::Euclid:
            return "Euclid";
        case Distance::Dot:
            return "Dot";
        case Distance::Manhattan:
            return "Manhattan";
        }
        return "Cosine";
    }

    QdrantClient::QdrantClient() : QdrantClient(kDefaultQdrantUrl) {}

    QdrantClient::QdrantClient(std::string base_url)
        : QdrantClient(std::move(base_url), std::make_shared<CurlTransport>()) {}

    QdrantClient::QdrantClient(std::string base_url, std::shared_ptr<HttpTransport> transport)
        : base_url_(ensure_no_trailing_slash(std::move(base_url))), transport_(std::move(transport))
    {
        if (!transport_)
        {
            throw std::invalid_argument("QdrantClient requires a transport");
        }
    }

    QdrantClient QdrantClient::from_config(const Config &config)
    {
        QdrantClient client(config.qdrant_url());
        client.with_timeout(config.timeout_seconds());
        if (!config.qdrant_api_key().empty())
        {
            client.with_api_key(config.qdrant_api_key());
        }
        return client;
    }

    QdrantClient &QdrantClient::with_api_key(std::string api_key)
    {
        api_key_ = std::move(api_key);
        return *this;
    }

    QdrantClient &QdrantClient::with_timeout(long timeout_seconds)
    {
        timeout_seconds_ = timeout_seconds;
        return *this;
    }

    std::string QdrantClient::collection_url(const std::string &collection_name) const
    {
        return base_url_ + "/collections/" + escape_path_segment(collection_name);
    }

    HttpRequest QdrantClient::make_request(std::string method, std::string url, std::string body) const
    {
        HttpRequest request{
            .method = std::move(method),
            .url = std::move(url),
            .headers = {"Content-Type: application/json", std::string{"User-Agent: qdrest/"} + kVersion},
            .body = std::move(body),
            .timeout_seconds = timeout_seconds_,
        };
        if (!api_key_.empty())
        {
            request.headers.push_back("api-key: " + api_key_);
        }
        return request;
    }

    HttpResponse QdrantClient::send(const HttpRequest &request) const
    {
        log::debug(request.method + ' ' + request.url);
        HttpResponse response = transport_->send(request);
        log::debug(request.method + ' ' + request.url + " -> " + std::to_string(response.status));
        return response;
    }

    nlohmann::json QdrantClient::call(std::string method, std::string url, const std::string &what, std::string body) const
    {
        const auto response = send(make_request(std::move(method), std::move(url), std::move(body)));
        require_success(response, what);
        return parse_body(response, what);
    }

    nlohmann::json QdrantClient::list_collections_api() const
    {
        return call("GET", base_url_ + "/collections", "list collections");
    }

    nlohmann::json QdrantClient::collection_info_api(const std::string &collection_name) const
    {
        return call("GET", collection_url(collection_name), "get collection info '" + collection_name + "'");
    }

    nlohmann::json QdrantClient::collection_exists_api(const std::string &collection_name) const
    {
        return call("GET",
                    collection_url(collection_name) + "/exists",
                    "check collection existence '" + collection_name + "'");
    }

    nlohmann::json QdrantClient::create_collection_api(const std::string &collection_name,
                                                       const nlohmann::json &params) const
    {
        return call("PUT", collection_url(collection_name), "create collection '" + collection_name + "'", params.dump());
    }

    nlohmann::json QdrantClient::delete_collection_api(const std::string &collection_name) const
    {
        return call("DELETE", collection_url(collection_name), "delete collection '" + collection_name + "'");
    }

    nlohmann::json QdrantClient::upsert_points_api(const std::string &collection_name,
                                                   const nlohmann::json &params) const
    {
        return call("PUT",
                    collection_url(collection_name) + "/points?wait=true",
                    "upsert points to '" + collection_name + "'",
                    params.dump());
    }

    nlohmann::json QdrantClient::get_point_api(const std::string &collection_name, const PointId &id) const
    {
        return call("GET",
                    collection_url(collection_name) + "/points/" + escape_path_segment(id.to_string()),
                    "get point " + id.to_string() + " from '" + collection_name + "'");
    }

    nlohmann::json QdrantClient::get_points_api(const std::string &collection_name, const nlohmann::json &params) const
    {
        return call("POST",
                    collection_url(collection_name) + "/points",
                    "get points from '" + collection_name + "'",
                    params.dump());
    }

    nlohmann::json QdrantClient::delete_points_api(const std::string &collection_name,
                                                   const nlohmann::json &params) const
    {
        return call("POST",
                    collection_url(collection_name) + "/points/delete?wait=true",
                    "delete points from '" + collection_name + "'",
                    params.dump());
    }

    nlohmann::json QdrantClient::search_points_api(const std::string &collection_name,
                                                   const nlohmann::json &params) const
    {
        return call("POST",
                    collection_url(collection_name) + "/points/search",
                    "search points in '" + collection_name + "'",
                    params.dump());
    }

    bool QdrantClient::collection_exists(const std::string &collection_name) const
    {
        const std::string what = "check collection existence '" + collection_name + "'";

        nlohmann::json json;
        try
        {
            json = collection_exists_api(collection_name);
        }
        catch (const RequestFailedError &ex)
        {
            if (ex.http_status() != 404)
            {
                throw;
            }
            // Servers that predate the /exists route answer it with 404.
            log::debug(what + ": /exists not available, falling back to the collection list");
            const auto names = list_collections();
            return std::find(names.begin(), names.end(), collection_name) != names.end();
        }

        const auto &exists = require_field(require_field(json, "result", what), "exists", what);
        if (!exists.is_boolean())
        {
            throw DecodeError(what + ": 'exists' is not a boolean");
        }
        return exists.get<bool>();
    }

    void QdrantClient::create_collection(const std::string &collection_name, std::uint64_t size) const
    {
        create_collection(collection_name, VectorParams{.size = size});
    }

    void QdrantClient::create_collection(const std::string &collection_name, const VectorParams &params) const
    {
        log::debug("create collection '" + collection_name + "'");

        if (collection_exists(collection_name))
        {
            const std::string message = "collection '" + collection_name + "' already exists";
            log::error(message);
            throw ConflictError(message);
        }

        nlohmann::json body;
        body["vectors"] = {
            {"size", params.size},
            {"distance", to_string(params.distance)},
            {"on_disk", params.on_disk},
        };

        const std::string what = "create collection '" + collection_name + "'";
        if (!result_flag(create_collection_api(collection_name, body), what))
        {
            throw RequestFailedError(what + ": server returned result=false", 200);
        }
    }

    void QdrantClient::delete_collection(const std::string &collection_name) const
    {
        log::debug("delete collection '" + collection_name + "'");

        if (!collection_exists(collection_name))
        {
            const std::string message = "collection '" + collection_name + "' not found";
            log::error(message);
            throw NotFoundError(message);
        }

        const std::string what = "delete collection '" + collection_name + "'";
        if (!result_flag(delete_collection_api(collection_name), what))
        {
            throw RequestFailedError(what + ": server returned result=false", 200);
        }
    }

    std::vector<std::string> QdrantClient::list_collections() const
    {
        const std::string what = "list collections";
        const auto json = list_collections_api();
        const auto &collections = require_field(require_field(json, "result", what), "collections", what);
        if (!collections.is_array())
        {
            throw DecodeError(what + ": 'collections' is not an array");
        }

        std::vector<std::string> names;
        names.reserve(collections.size());
        for (const auto &collection : collections)
        {
            const auto &name = require_field(collection, "name", what);
            if (!name.is_string())
            {
                throw DecodeError(what + ": collection name is not a string");
            }
            names.push_back(name.get<std::string>());
        }
        return names;
    }

    std::uint64_t QdrantClient::collection_info(const std::string &collection_name) const
    {
        const std::string what = "get collection info '" + collection_name + "'";
        const auto json = collection_info_api(collection_name);
        const auto &count = require_field(require_field(json, "result", what), "points_count", what);
        if (!count.is_number_unsigned())
        {
            throw DecodeError(what + ": 'points_count' is not an unsigned integer");
        }
        return count.get<std::uint64_t>();
    }

    void QdrantClient::upsert_points(const std::string &collection_name, const std::vector<Point> &points) const
    {
        log::debug("upsert " + std::to_string(points.size()) + " points to collection '" + collection_name + "'");

        nlohmann::json body;
        body["points"] = points;

        const std::string what = "upsert points to '" + collection_name + "'";
        const auto json = upsert_points_api(collection_name, body);
        const auto &status = require_field(json, "status", what);
        const std::string text = status.is_string() ? status.get<std::string>() : status.dump();
        if (text != "ok")
        {
            throw RequestFailedError(what + ": server status " + text, 200, text);
        }
    }

    Point QdrantClient::get_point(const std::string &collection_name, const PointId &id) const
    {
        const std::string what = "get point " + id.to_string() + " from '" + collection_name + "'";
        const auto json = get_point_api(collection_name, id);
        return decode_element(require_field(json, "result", what), what, point_from_json);
    }

    std::vector<Point> QdrantClient::get_points(const std::string &collection_name,
                                                const std::vector<PointId> &ids) const
    {
        log::debug("get points [" + join_ids(ids) + "] from collection '" + collection_name + "'");

        nlohmann::json body;
        body["ids"] = ids;
        body["with_payload"] = true;
        body["with_vector"] = true;

        const std::string what = "get points from '" + collection_name + "'";
        const auto json = get_points_api(collection_name, body);
        const auto &result = require_field(json, "result", what);
        if (!result.is_array())
        {
            throw DecodeError(what + ": 'result' is not an array");
        }

        std::vector<Point> points;
        points.reserve(result.size());
        for (const auto &item : result)
        {
            points.push_back(decode_element(item, what, point_from_json));
        }
        return points;
    }

    void QdrantClient::delete_points(const std::string &collection_name, const std::vector<PointId> &ids) const
    {
        log::debug("delete points [" + join_ids(ids) + "] from collection '" + collection_name + "'");

        nlohmann::json body;
        body["points"] = ids;
        delete_points_api(collection_name, body);
    }

    std::vector<ScoredPoint> QdrantClient::search_points(const std::string &collection_name,
                                                         const std::vector<float> &vector,
                                                         std::uint64_t limit,
                                                         float score_threshold) const
    {
        log::debug("search points in collection '" + collection_name + "'");

        nlohmann::json body;
        body["vector"] = vector;
        body["limit"] = limit;
        body["with_payload"] = true;
        body["with_vector"] = true;
        body["score_threshold"] = score_threshold;

        const std::string what = "search points in '" + collection_name + "'";
        const auto json = search_points_api(collection_name, body);
        if (!json.is_object())
        {
            throw DecodeError(what + ": expected a JSON object");
        }
        const auto result = json.find("result");
        if (result == json.end())
        {
            log::warn(what + ": response has no 'result', treating as no matches");
            return {};
        }
        if (!result->is_array())
        {
            throw DecodeError(what + ": 'result' is not an array");
        }

        std::vector<ScoredPoint> hits;
        hits.reserve(result->size());
        for (const auto &item : *result)
        {
            hits.push_back(decode_element(item, what, scored_point_from_json));
        }
        return hits;
    }

} // namespace qdrest
