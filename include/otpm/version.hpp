#pragma once

/// @file version.hpp
/// @brief Project version information.

#define OTPM_VERSION_MAJOR 1
#define OTPM_VERSION_MINOR 0
#define OTPM_VERSION_PATCH 0
#define OTPM_VERSION_STRING "1.0.0"

namespace otpm {

/// Library version at compile time.
struct Version {
    static constexpr int major = OTPM_VERSION_MAJOR;
    static constexpr int minor = OTPM_VERSION_MINOR;
    static constexpr int patch = OTPM_VERSION_PATCH;
    static constexpr const char* string = OTPM_VERSION_STRING;
};

} // namespace otpm
