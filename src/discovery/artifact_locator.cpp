#include "tabula/discovery/artifact_locator.hpp"

#include "tabula/foundation/logger.hpp"
#include "tabula/foundation/preference_store.hpp"

#include <string>
#include <system_error>

namespace fs = std::filesystem;

using tabula::foundation::ErrorCode;
using tabula::foundation::LogCategory;
using tabula::foundation::PreferenceStore;
using tabula::foundation::TabulaError;
using tabula::foundation::TabulaResult;

namespace tabula::discovery {

ArtifactLocator::ArtifactLocator(const DeploymentContext& context)
    : context_(context) {}

fs::path ArtifactLocator::secondaryDirectory() const {
    return context_.dataDir / fs::path(std::string(kSecondaryFolder));
}

fs::path ArtifactLocator::secondaryArtifactPath(int sequence) const {
    std::string fileName = context_.artifactPath.filename().string();
    fileName += kExtractedNameExt;
    fileName += std::to_string(sequence);
    fileName += kExtractedSuffix;
    return secondaryDirectory() / fileName;
}

TabulaResult<std::vector<fs::path>> ArtifactLocator::locate() const {
    using Locations = std::vector<fs::path>;

    auto prefs = PreferenceStore::open(context_.dataDir, kMultiPartPreferences);
    if (prefs.hasError()) {
        return TabulaResult<Locations>::err(prefs.error());
    }
    auto total = prefs.value().getInt(kCodeUnitCountKey, 1);
    if (total.hasError()) {
        return TabulaResult<Locations>::err(total.error());
    }

    Locations locations;
    locations.push_back(context_.artifactPath);

    for (int sequence = 2; sequence <= total.value(); ++sequence) {
        auto expected = secondaryArtifactPath(sequence);
        std::error_code ec;
        if (!fs::is_regular_file(expected, ec)) {
            return TabulaResult<Locations>::err(
                TabulaError(ErrorCode::MissingSecondaryArtifact,
                            "Missing extracted secondary artifact '" + expected.string() + "'",
                            expected));
        }
        locations.push_back(fs::absolute(expected, ec));
        if (ec) {
            locations.back() = expected;
        }
    }

    TABULA_LOG_INFO(LogCategory::Discovery,
                    "Resolved " + std::to_string(locations.size()) + " artifact location(s)");
    return TabulaResult<Locations>::ok(std::move(locations));
}

} // namespace tabula::discovery
