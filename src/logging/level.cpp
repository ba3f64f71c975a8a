#include <rpcreflect/logging/level.hpp>

#include <array>
#include <stdexcept>
#include <utility>

#include <fmt/format.h>
#include <fmt/ranges.h>

RPCREFLECT_NAMESPACE_BEGIN

namespace logging {

namespace {

constexpr std::array<std::pair<std::string_view, Level>, 7> kLevels{{
    {"trace", Level::kTrace},
    {"debug", Level::kDebug},
    {"info", Level::kInfo},
    {"warning", Level::kWarning},
    {"error", Level::kError},
    {"critical", Level::kCritical},
    {"none", Level::kNone},
}};

}  // namespace

Level LevelFromString(std::string_view level_name) {
    for (const auto& [name, level] : kLevels) {
        if (name == level_name) return level;
    }

    std::array<std::string_view, kLevels.size()> names{};
    for (std::size_t i = 0; i < kLevels.size(); ++i) {
        names[i] = kLevels[i].first;
    }
    throw std::runtime_error(
        fmt::format("Unknown log level '{}' (must be one of '{}')", level_name, fmt::join(names, "', '"))
    );
}

std::string_view ToString(Level level) noexcept {
    for (const auto& [name, value] : kLevels) {
        if (value == level) return name;
    }
    return "unknown";
}

}  // namespace logging

RPCREFLECT_NAMESPACE_END
