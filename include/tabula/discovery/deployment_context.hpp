#pragma once

/// @file deployment_context.hpp
/// @brief DeploymentContext: where and how the deployed application lives.

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "tabula/types/type_catalog.hpp"

namespace tabula::discovery {

/// How code-unit names are enumerated from a location.
enum class EnumerationMode : uint8_t {
    Auto,       ///< Directory walk for directories, container read otherwise.
    Container,  ///< Always read the location as a packed container.
    Directory   ///< Always walk the resource roots.
};

/// Parse "auto" / "container" / "directory".
[[nodiscard]] std::optional<EnumerationMode> parseEnumerationMode(std::string_view text);

/// Description of the running deployment.
struct DeploymentContext {
    /// Namespace root of the application's own types (e.g. "shop").
    std::string packageName;

    /// Primary compiled artifact (a packed container or a build tree).
    std::filesystem::path artifactPath;

    /// Private data directory holding preferences and secondary units.
    std::filesystem::path dataDir;

    /// Roots walked by the directory fallback; empty means the location
    /// itself.
    std::vector<std::filesystem::path> resourceRoots;

    /// File suffix marking a compiled unit in the directory fallback.
    std::string unitSuffix = ".o";

    EnumerationMode mode = EnumerationMode::Auto;

    /// Type-loading facility; nullptr selects TypeCatalog::global().
    const types::TypeCatalog* catalog = nullptr;

    [[nodiscard]] const types::TypeCatalog& typeCatalog() const {
        return catalog != nullptr ? *catalog : types::TypeCatalog::global();
    }
};

} // namespace tabula::discovery
