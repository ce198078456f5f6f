#pragma once

/// @file version.hpp
/// @brief Project version information and the marshal stream format version.

#define GM_VERSION_MAJOR 0
#define GM_VERSION_MINOR 3
#define GM_VERSION_PATCH 0
#define GM_VERSION_STRING "0.3.0"

namespace gm {

/// Project version information at compile time.
struct Version {
    static constexpr int major = GM_VERSION_MAJOR;
    static constexpr int minor = GM_VERSION_MINOR;
    static constexpr int patch = GM_VERSION_PATCH;
    static constexpr const char* string = GM_VERSION_STRING;
};

/// Version of the marshal stream written by this library (major.minor).
struct FormatVersion {
    static constexpr unsigned char major = 4;
    static constexpr unsigned char minor = 8;
};

} // namespace gm
