#pragma once

#include <string>

#include "util/log.hpp"

namespace qdrest {

inline constexpr const char* kDefaultQdrantUrl = "http://localhost:6333";

class Config {
public:
    // Reads QDRANT_URL, QDRANT_API_KEY, QDRANT_TIMEOUT_SECONDS and
    // QDREST_LOG_LEVEL. Throws std::runtime_error on malformed values.
    static Config load();

    const std::string& qdrant_url() const noexcept { return qdrant_url_; }
    const std::string& qdrant_api_key() const noexcept { return qdrant_api_key_; }
    long timeout_seconds() const noexcept { return timeout_seconds_; }
    log::Level log_level() const noexcept { return log_level_; }

    Config& set_qdrant_url(std::string url);

private:
    Config(std::string qdrant_url, std::string qdrant_api_key, long timeout_seconds, log::Level log_level);

    std::string qdrant_url_;
    std::string qdrant_api_key_;
    long timeout_seconds_;
    log::Level log_level_;
};

}  // namespace qdrest
