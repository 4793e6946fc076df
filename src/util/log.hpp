#pragma once

#include <optional>
#include <string_view>

namespace qdrest::log {

enum class Level { Debug, Info, Warn, Error };

// Lines below this level are dropped. Defaults to Info.
void set_level(Level level);
Level level();

std::optional<Level> parse_level(std::string_view name);

void write(Level level, std::string_view message);
void debug(std::string_view message);
void info(std::string_view message);
void warn(std::string_view message);
void error(std::string_view message);

}  // namespace qdrest::log
