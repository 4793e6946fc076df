#pragma once

#include <cstdint>
#include <optional>
#include <ostream>
#include <string>
#include <variant>
#include <vector>

#include <nlohmann/json.hpp>

namespace qdrest {

// Free-form metadata attached to a point. Must hold a JSON object: encoding
// a point whose payload is anything else throws std::invalid_argument.
using Payload = nlohmann::json;

// Point identifier: either an unsigned integer or a UUID string. On the wire
// it is a bare JSON number or string.
class PointId {
public:
    PointId(std::uint64_t num) : value_(num) {}
    PointId(std::string uuid) : value_(std::move(uuid)) {}

    bool is_num() const noexcept { return std::holds_alternative<std::uint64_t>(value_); }
    bool is_uuid() const noexcept { return std::holds_alternative<std::string>(value_); }

    // Throw std::bad_variant_access when the other alternative is held.
    std::uint64_t num() const { return std::get<std::uint64_t>(value_); }
    const std::string& uuid() const { return std::get<std::string>(value_); }

    std::string to_string() const;

    bool operator==(const PointId& other) const = default;

private:
    std::variant<std::uint64_t, std::string> value_;
};

std::ostream& operator<<(std::ostream& os, const PointId& id);

struct Point {
    PointId id;
    std::vector<float> vector;
    std::optional<Payload> payload;

    bool operator==(const Point& other) const = default;
};

// Search hit. vector/payload are present only when they were requested.
struct ScoredPoint {
    PointId id;
    std::optional<std::vector<float>> vector;
    std::optional<Payload> payload;
    float score = 0.0f;
};

// nlohmann::json hooks. The *_from_json functions throw DecodeError on any
// shape mismatch; they see only a JSON value, so its http_status() is 0.
void to_json(nlohmann::json& j, const PointId& id);
void to_json(nlohmann::json& j, const Point& point);
void to_json(nlohmann::json& j, const ScoredPoint& point);

PointId point_id_from_json(const nlohmann::json& j);
Point point_from_json(const nlohmann::json& j);
ScoredPoint scored_point_from_json(const nlohmann::json& j);

}  // namespace qdrest
