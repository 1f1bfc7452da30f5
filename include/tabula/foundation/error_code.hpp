#pragma once

/// @file error_code.hpp
/// @brief Categorized error codes for the discovery subsystem.

#include <cstdint>
#include <string_view>

namespace tabula::foundation {

/// Error codes categorized by subsystem using hex ranges.
///
/// Each subsystem occupies a 256-value range (0x100), making it possible
/// to determine the error source from the code value alone.
enum class ErrorCode : uint32_t {
    // General (0x0000 - 0x00FF)
    Success = 0x0000,
    Unknown = 0x0001,
    InvalidArgument = 0x0002,
    NotFound = 0x0003,
    AlreadyExists = 0x0004,

    // Config (0x0100 - 0x01FF)
    ConfigLoadFailed = 0x0100,
    ConfigKeyNotFound = 0x0101,
    ConfigTypeMismatch = 0x0102,
    PreferenceReadFailed = 0x0103,

    // Artifact (0x0200 - 0x02FF)
    MissingSecondaryArtifact = 0x0200,
    ArtifactOpenFailed = 0x0201,
    ArtifactCorrupt = 0x0202,
    ArtifactUnsupported = 0x0203,

    // Type (0x0300 - 0x03FF)
    TypeNotFound = 0x0300,
    TypeNotInstantiable = 0x0301,
    ModuleLoadFailed = 0x0302,
    ModuleSymbolMissing = 0x0303,

    // Schema (0x0400 - 0x04FF)
    SchemaConstructionFailed = 0x0400,

    // Logger (0x0800 - 0x08FF)
    LoggerError = 0x0800,
    LoggerFlushFailed = 0x0801,
};

/// Return the subsystem name for a given error code.
constexpr std::string_view errorSubsystem(ErrorCode code) {
    auto value = static_cast<uint32_t>(code);
    auto category = value & 0xFF00;
    switch (category) {
        case 0x0000: return "General";
        case 0x0100: return "Config";
        case 0x0200: return "Artifact";
        case 0x0300: return "Type";
        case 0x0400: return "Schema";
        case 0x0800: return "Logger";
        default: return "Unknown";
    }
}

} // namespace tabula::foundation
