#include "util/log.hpp"

#include <atomic>
#include <chrono>
#include <ctime>
#include <iomanip>
#include <iostream>
#include <mutex>
#include <sstream>
#include <string>

namespace qdrest::log {
namespace {

std::atomic<Level>& min_level() {
    static std::atomic<Level> level{Level::Info};
    return level;
}

std::mutex& log_mutex() {
    static std::mutex mutex;
    return mutex;
}

const char* to_string(Level level) {
    switch (level) {
        case Level::Debug:
            return "DEBUG";
        case Level::Info:
            return "INFO";
        case Level::Warn:
            return "WARN";
        case Level::Error:
            return "ERROR";
    }
    return "UNKNOWN";
}

// UTC, ISO-8601 with milliseconds.
std::string timestamp() {
    using clock = std::chrono::system_clock;
    const auto now = clock::now();
    const auto now_seconds = std::chrono::time_point_cast<std::chrono::seconds>(now);
    const auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(now - now_seconds).count();

    const std::time_t time_t_value = clock::to_time_t(now_seconds);
    std::tm tm_buffer{};
#if defined(_WIN32)
    gmtime_s(&tm_buffer, &time_t_value);
#else
    gmtime_r(&time_t_value, &tm_buffer);
#endif

    std::ostringstream oss;
    oss << std::put_time(&tm_buffer, "%Y-%m-%dT%H:%M:%S");
    oss << '.' << std::setw(3) << std::setfill('0') << ms << 'Z';
    return oss.str();
}

}  // namespace

void set_level(Level level) { min_level().store(level); }

Level level() { return min_level().load(); }

std::optional<Level> parse_level(std::string_view name) {
    if (name == "debug") {
        return Level::Debug;
    }
    if (name == "info") {
        return Level::Info;
    }
    if (name == "warn" || name == "warning") {
        return Level::Warn;
    }
    if (name == "error") {
        return Level::Error;
    }
    return std::nullopt;
}

void write(Level level, std::string_view message) {
    if (level < min_level().load()) {
        return;
    }
    const std::string stamp = timestamp();
    auto& stream = (level == Level::Error || level == Level::Warn) ? std::cerr : std::cout;

    std::lock_guard<std::mutex> lock(log_mutex());
    stream << '[' << stamp << "][" << to_string(level) << "] " << message << std::endl;
}

void debug(std::string_view message) { write(Level::Debug, message); }

void info(std::string_view message) { write(Level::Info, message); }

void warn(std::string_view message) { write(Level::Warn, message); }

void error(std::string_view message) { write(Level::Error, message); }

}  // namespace qdrest::log
