#pragma once

/// @file discovery_report.hpp
/// @brief Per-item outcomes collected during one discovery pass.

#include <cstddef>
#include <filesystem>
#include <string>
#include <vector>

namespace tabula::discovery {

/// Something the pass skipped and why.
struct SkippedItem {
    std::string subject;
    std::string reason;
};

/// Result-collecting record of a discovery pass.
///
/// Recoverable failures never stop the pass; they end up here instead.
struct DiscoveryReport {
    /// Locations that were enumerated, in scan order.
    std::vector<std::filesystem::path> locations;

    /// Locations that could not be opened or read.
    std::vector<SkippedItem> skippedLocations;

    std::size_t candidateCount = 0;
    std::size_t registeredEntities = 0;
    std::size_t registeredSerializers = 0;

    /// Candidates that could not be loaded, described or instantiated.
    std::vector<SkippedItem> skippedCandidates;

    /// Fallback paths without the compiled-unit suffix, or loaded types
    /// with neither capability (including abstract entities).
    std::size_t ignoredCandidates = 0;

    /// Fallback paths in which the package name was not found.
    std::size_t unmatchedPaths = 0;
};

} // namespace tabula::discovery
