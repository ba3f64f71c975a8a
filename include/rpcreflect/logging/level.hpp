#pragma once

/// @file rpcreflect/logging/level.hpp
/// @brief Log levels

#include <string_view>

RPCREFLECT_NAMESPACE_BEGIN

namespace logging {

/// Log levels
enum class Level {
    kTrace = 0,
    kDebug = 1,
    kInfo = 2,
    kWarning = 3,
    kError = 4,
    kCritical = 5,
    kNone = 6,
};

/// @brief Converts lowercase level name ("info", "warning", ...) to a Level
/// @throws std::runtime_error on unknown name
Level LevelFromString(std::string_view level_name);

std::string_view ToString(Level level) noexcept;

}  // namespace logging

RPCREFLECT_NAMESPACE_END
