#pragma once

/// @file version.hpp
/// @brief Project version information and core namespace definition.

#define TABULA_VERSION_MAJOR 0
#define TABULA_VERSION_MINOR 3
#define TABULA_VERSION_PATCH 1
#define TABULA_VERSION_STRING "0.3.1"

namespace tabula {

/// Library version information at compile time.
struct Version {
    static constexpr int major = TABULA_VERSION_MAJOR;
    static constexpr int minor = TABULA_VERSION_MINOR;
    static constexpr int patch = TABULA_VERSION_PATCH;
    static constexpr const char* string = TABULA_VERSION_STRING;
};

} // namespace tabula
