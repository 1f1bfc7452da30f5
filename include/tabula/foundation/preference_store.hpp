#pragma once

/// @file preference_store.hpp
/// @brief Named, file-backed key/value preferences kept in the application's
///        private data directory.

#include <filesystem>
#include <string>
#include <string_view>

#include "tabula/foundation/config_manager.hpp"
#include "tabula/foundation/tabula_result.hpp"

namespace tabula::foundation {

/// Read-only view of a named preference file.
///
/// A store called `name` lives at `<dataDir>/shared_prefs/<name>.yaml` and
/// holds flat keys such as `dex.number: 3`. A missing file is an empty
/// store, so every lookup yields its default.
class PreferenceStore {
public:
    /// Open the store `name` under @p dataDir.
    /// @return PreferenceReadFailed when the file exists but cannot be parsed.
    static TabulaResult<PreferenceStore> open(const std::filesystem::path& dataDir,
                                              std::string_view name);

    /// Path of the store `name` under @p dataDir.
    static std::filesystem::path pathFor(const std::filesystem::path& dataDir,
                                         std::string_view name);

    /// Integer value for @p key, or @p fallback when absent.
    TabulaResult<int> getInt(std::string_view key, int fallback) const;

    [[nodiscard]] bool contains(std::string_view key) const { return config_.hasKey(key); }

    [[nodiscard]] const std::filesystem::path& path() const noexcept { return path_; }

private:
    PreferenceStore() = default;

    std::filesystem::path path_;
    ConfigManager config_;
};

} // namespace tabula::foundation
