#pragma once

/// @file config_manager.hpp
/// @brief YAML-based configuration management with typed access.

#include <filesystem>
#include <string>
#include <string_view>
#include <unordered_map>

#include <yaml-cpp/yaml.h>

#include "tabula/foundation/tabula_result.hpp"

namespace tabula::foundation {

/// YAML-based configuration reader providing typed access to values.
///
/// Supports loading from a file or an in-memory document and dotted-key
/// access (e.g., "deployment.data_dir"). Sequences are leaves, so
/// `get<std::vector<std::string>>("persistence.entities")` works.
///
/// Internally flattens the YAML tree into a key-value map to avoid
/// yaml-cpp reference-semantic pitfalls.
class ConfigManager {
public:
    ConfigManager() = default;

    /// Load configuration from a YAML file.
    /// @return Success or ConfigLoadFailed error.
    TabulaResult<void> load(const std::filesystem::path& path);

    /// Load configuration from YAML text.
    TabulaResult<void> loadString(std::string_view document);

    /// Retrieve a typed value by dotted key.
    /// @return The value or ConfigKeyNotFound/ConfigTypeMismatch error.
    template <typename T>
    TabulaResult<T> get(std::string_view key) const;

    /// Retrieve a typed value, or @p fallback when the key is absent.
    /// A present key of the wrong type is still a ConfigTypeMismatch error.
    template <typename T>
    TabulaResult<T> getOr(std::string_view key, T fallback) const;

    [[nodiscard]] bool hasKey(std::string_view key) const;

    [[nodiscard]] std::size_t size() const noexcept { return entries_.size(); }

private:
    /// Flatten a YAML node recursively into the entries_ map.
    void flatten(const std::string& prefix, const YAML::Node& node);

    std::unordered_map<std::string, YAML::Node> entries_;
};

// --- Template implementations ---

template <typename T>
TabulaResult<T> ConfigManager::get(std::string_view key) const {
    auto it = entries_.find(std::string(key));
    if (it == entries_.end()) {
        return TabulaResult<T>::err(
            TabulaError(ErrorCode::ConfigKeyNotFound,
                        std::string("config key not found: ") + std::string(key)));
    }
    try {
        return TabulaResult<T>::ok(it->second.as<T>());
    } catch (const YAML::BadConversion&) {
        return TabulaResult<T>::err(
            TabulaError(ErrorCode::ConfigTypeMismatch,
                        std::string("type mismatch for key: ") + std::string(key)));
    }
}

template <typename T>
TabulaResult<T> ConfigManager::getOr(std::string_view key, T fallback) const {
    if (!hasKey(key)) {
        return TabulaResult<T>::ok(std::move(fallback));
    }
    return get<T>(key);
}

} // namespace tabula::foundation
