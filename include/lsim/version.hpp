#pragma once

/// @file version.hpp
/// @brief Library version information.

#define LSIM_VERSION_MAJOR 0
#define LSIM_VERSION_MINOR 1
#define LSIM_VERSION_PATCH 0
#define LSIM_VERSION_STRING "0.1.0"

namespace lsim {

struct Version {
    static constexpr int major = LSIM_VERSION_MAJOR;
    static constexpr int minor = LSIM_VERSION_MINOR;
    static constexpr int patch = LSIM_VERSION_PATCH;
    static constexpr const char* string = LSIM_VERSION_STRING;
};

} // namespace lsim
