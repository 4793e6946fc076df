#include "qdrant/point.hpp"

#include <stdexcept>

#include "qdrant/errors.hpp"

namespace qdrest {
namespace {

std::vector<float> vector_from_json(const nlohmann::json& j, const char* context) {
    if (!j.is_array()) {
        throw DecodeError(std::string{context} + ": vector is not an array");
    }
    std::vector<float> vector;
    vector.reserve(j.size());
    for (const auto& value : j) {
        if (!value.is_number()) {
            throw DecodeError(std::string{context} + ": vector element is not a number");
        }
        vector.push_back(value.get<float>());
    }
    return vector;
}

// Absent and null both mean "no payload".
std::optional<Payload> payload_from_json(const nlohmann::json& j, const char* context) {
    const auto it = j.find("payload");
    if (it == j.end() || it->is_null()) {
        return std::nullopt;
    }
    if (!it->is_object()) {
        throw DecodeError(std::string{context} + ": payload is not an object");
    }
    return *it;
}

const nlohmann::json& require_field(const nlohmann::json& j, const char* field, const char* context) {
    const auto it = j.find(field);
    if (it == j.end()) {
        throw DecodeError(std::string{context} + ": missing field '" + field + "'");
    }
    return *it;
}

}  // namespace

std::string PointId::to_string() const {
    if (is_num()) {
        return std::to_string(num());
    }
    return uuid();
}

std::ostream& operator<<(std::ostream& os, const PointId& id) {
    return os << id.to_string();
}

void to_json(nlohmann::json& j, const PointId& id) {
    if (id.is_num()) {
        j = id.num();
    } else {
        j = id.uuid();
    }
}

void to_json(nlohmann::json& j, const Point& point) {
    if (point.payload && !point.payload->is_object()) {
        throw std::invalid_argument("point " + point.id.to_string() + ": payload must be a JSON object, got " +
                                    point.payload->type_name());
    }
    j = nlohmann::json::object();
    j["id"] = point.id;
    j["vector"] = point.vector;
    if (point.payload) {
        j["payload"] = *point.payload;
    }
}

void to_json(nlohmann::json& j, const ScoredPoint& point) {
    j = nlohmann::json::object();
    j["id"] = point.id;
    if (point.vector) {
        j["vector"] = *point.vector;
    }
    if (point.payload) {
        j["payload"] = *point.payload;
    }
    j["score"] = point.score;
}

PointId point_id_from_json(const nlohmann::json& j) {
    if (j.is_number_unsigned()) {
        return PointId{j.get<std::uint64_t>()};
    }
    if (j.is_string()) {
        return PointId{j.get<std::string>()};
    }
    throw DecodeError("point id must be an unsigned integer or a string, got " + j.dump());
}

Point point_from_json(const nlohmann::json& j) {
    if (!j.is_object()) {
        throw DecodeError("point is not an object");
    }
    return Point{
        .id = point_id_from_json(require_field(j, "id", "point")),
        .vector = vector_from_json(require_field(j, "vector", "point"), "point"),
        .payload = payload_from_json(j, "point"),
    };
}

ScoredPoint scored_point_from_json(const nlohmann::json& j) {
    if (!j.is_object()) {
        throw DecodeError("scored point is not an object");
    }

    const auto& score = require_field(j, "score", "scored point");
    if (!score.is_number()) {
        throw DecodeError("scored point: score is not a number");
    }

    ScoredPoint point{
        .id = point_id_from_json(require_field(j, "id", "scored point")),
        .vector = std::nullopt,
        .payload = payload_from_json(j, "scored point"),
        .score = score.get<float>(),
    };
    if (const auto it = j.find("vector"); it != j.end() && !it->is_null()) {
        point.vector = vector_from_json(*it, "scored point");
    }
    return point;
}

}  // namespace qdrest
