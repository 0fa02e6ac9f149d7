#pragma once

/// @file name_pattern.hpp
/// @brief Glob matching and path splitting for actor queries.

#include <string>
#include <string_view>
#include <vector>

namespace ark::scene {

/// Separator between path segments ("player/weapon/muzzle").
inline constexpr char kPathSeparator = '/';

/// Segment matching any number of hierarchy levels.
inline constexpr std::string_view kRecursiveWildcard = "**";

/// Match an actor name against a shell-style glob (`*`, `?`, `[...]`).
[[nodiscard]] bool matchName(std::string_view pattern, std::string_view name);

/// True if @p text contains a path separator.
[[nodiscard]] bool isPath(std::string_view text) noexcept;

/// Split on the path separator, dropping empty segments ("a//b/" -> {a, b}).
[[nodiscard]] std::vector<std::string> splitPath(std::string_view path);

[[nodiscard]] inline bool isRecursiveWildcard(std::string_view segment) noexcept {
    return segment == kRecursiveWildcard;
}

} // namespace ark::scene
