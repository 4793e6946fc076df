#pragma once

namespace qdrest {

inline constexpr const char* kVersion = "0.1.1";

}  // namespace qdrest
