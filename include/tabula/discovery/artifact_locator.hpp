#pragma once

/// @file artifact_locator.hpp
/// @brief Resolves every compiled-artifact location of a multi-part deployment.

#include <filesystem>
#include <string_view>
#include <vector>

#include "tabula/discovery/deployment_context.hpp"
#include "tabula/foundation/tabula_result.hpp"

namespace tabula::discovery {

/// Preference store holding the number of code units in the deployment.
inline constexpr std::string_view kMultiPartPreferences = "multidex.version";

/// Key of the code-unit counter inside kMultiPartPreferences.
inline constexpr std::string_view kCodeUnitCountKey = "dex.number";

/// Directory (under the data directory) holding extracted secondary units.
inline constexpr std::string_view kSecondaryFolder = "code_cache/secondary-dexes";

inline constexpr std::string_view kExtractedNameExt = ".classes";
inline constexpr std::string_view kExtractedSuffix = ".zip";

/// Builds the ordered Artifact Location Set: the primary artifact, then
/// every secondary unit 2..N where N is the persisted code-unit counter
/// (default 1, meaning no secondary units).
class ArtifactLocator {
public:
    explicit ArtifactLocator(const DeploymentContext& context);

    /// Resolve the location set.
    ///
    /// @return The locations, primary first; MissingSecondaryArtifact (with
    ///         the expected path as context) for the first secondary unit
    ///         not present on disk; PreferenceReadFailed when the counter
    ///         cannot be read.
    foundation::TabulaResult<std::vector<std::filesystem::path>> locate() const;

    /// `<dataDir>/code_cache/secondary-dexes`.
    [[nodiscard]] std::filesystem::path secondaryDirectory() const;

    /// `<secondaryDirectory>/<primary-file-name>.classes<sequence>.zip`.
    [[nodiscard]] std::filesystem::path secondaryArtifactPath(int sequence) const;

private:
    const DeploymentContext& context_;
};

} // namespace tabula::discovery
