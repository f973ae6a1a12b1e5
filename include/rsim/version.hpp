#pragma once

/// @file version.hpp
/// @brief Project version information and core namespace definition.

#define RSIM_VERSION_MAJOR 0
#define RSIM_VERSION_MINOR 1
#define RSIM_VERSION_PATCH 0
#define RSIM_VERSION_STRING "0.1.0"

namespace rsim {

/// Project version information at compile time.
struct Version {
    static constexpr int major = RSIM_VERSION_MAJOR;
    static constexpr int minor = RSIM_VERSION_MINOR;
    static constexpr int patch = RSIM_VERSION_PATCH;
    static constexpr const char* string = RSIM_VERSION_STRING;
};

} // namespace rsim
