#include "tabula/foundation/preference_store.hpp"

#include <system_error>

namespace fs = std::filesystem;

namespace tabula::foundation {

namespace {

constexpr const char* kPreferencesFolderName = "shared_prefs";
constexpr const char* kPreferencesFileExtension = ".yaml";

} // namespace

fs::path PreferenceStore::pathFor(const fs::path& dataDir, std::string_view name) {
    return dataDir / kPreferencesFolderName /
           (std::string(name) + kPreferencesFileExtension);
}

TabulaResult<PreferenceStore> PreferenceStore::open(const fs::path& dataDir,
                                                    std::string_view name) {
    PreferenceStore store;
    store.path_ = pathFor(dataDir, name);

    std::error_code ec;
    if (dataDir.empty() || !fs::is_regular_file(store.path_, ec)) {
        return TabulaResult<PreferenceStore>::ok(std::move(store));
    }

    auto loaded = store.config_.load(store.path_);
    if (loaded.hasError()) {
        return TabulaResult<PreferenceStore>::err(
            TabulaError(ErrorCode::PreferenceReadFailed,
                        "failed to read preferences '" + std::string(name) + "': " +
                            std::string(loaded.error().message()),
                        store.path_));
    }
    return TabulaResult<PreferenceStore>::ok(std::move(store));
}

TabulaResult<int> PreferenceStore::getInt(std::string_view key, int fallback) const {
    auto value = config_.getOr<int>(key, fallback);
    if (value.hasError()) {
        return TabulaResult<int>::err(
            TabulaError(ErrorCode::PreferenceReadFailed,
                        "preference '" + std::string(key) + "' in " + path_.string() +
                            " is not an integer",
                        path_));
    }
    return value;
}

} // namespace tabula::foundation
