#pragma once

/// @file version.hpp
/// @brief Project version information and core namespace definition.

#define ARK_VERSION_MAJOR 0
#define ARK_VERSION_MINOR 3
#define ARK_VERSION_PATCH 0
#define ARK_VERSION_STRING "0.3.0"

namespace ark {

/// Project version information at compile time.
struct Version {
    static constexpr int major = ARK_VERSION_MAJOR;
    static constexpr int minor = ARK_VERSION_MINOR;
    static constexpr int patch = ARK_VERSION_PATCH;
    static constexpr const char* string = ARK_VERSION_STRING;
};

} // namespace ark
