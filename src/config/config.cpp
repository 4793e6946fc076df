#include "config/config.hpp"

#include <cstdlib>
#include <stdexcept>
#include <utility>

namespace qdrest
{
    namespace
    {

        std::string env_or_default(const char *name, const char *default_value)
        {
            if (const char *value = std::getenv(name); value && *value)
            {
                return value;
            }
            return default_value;
        }

        long parse_timeout(const std::string &value)
        {
            std::size_t consumed = 0;
            long seconds = 0;
            try
            {
                seconds = std::stol(value, &consumed);
            }
            catch (const std::exception &)
            {
                throw std::runtime_error("QDRANT_TIMEOUT_SECONDS must be an integer, got '" + value + "'");
            }
            if (consumed != value.size() || seconds < 0)
            {
                throw std::runtime_error("QDRANT_TIMEOUT_SECONDS must be a non-negative integer, got '" + value + "'");
            }
            return seconds;
        }

    } // namespace

    Config::Config(std::string qdrant_url, std::string qdrant_api_key, long timeout_seconds, log::Level log_level)
        : qdrant_url_(std::move(qdrant_url)),
          qdrant_api_key_(std::move(qdrant_api_key)),
          timeout_seconds_(timeout_seconds),
          log_level_(log_level) {}

    Config Config::load()
    {
        const std::string level_name = env_or_default("QDREST_LOG_LEVEL", "info");
        const auto level = log::parse_level(level_name);
        if (!level)
        {
            throw std::runtime_error("QDREST_LOG_LEVEL must be one of debug, info, warn, error; got '" + level_name + "'");
        }

        Config config{env_or_default("QDRANT_URL", kDefaultQdrantUrl),
                      env_or_default("QDRANT_API_KEY", ""),
                      parse_timeout(env_or_default("QDRANT_TIMEOUT_SECONDS", "30")),
                      *level};
        log::debug("config loaded: qdrant_url=" + config.qdrant_url_ +
                   (config.qdrant_api_key_.empty() ? " (no api key)" : " (api key set)"));
        return config;
    }

    Config &Config::set_qdrant_url(std::string url)
    {
        qdrant_url_ = std::move(url);
        return *this;
    }

} // namespace qdrest
