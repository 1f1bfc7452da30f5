#pragma once

/// @file configuration.hpp
/// @brief Configuration: the explicitly declared model, and its YAML form.

#include <filesystem>
#include <optional>
#include <string>
#include <vector>

#include "tabula/discovery/deployment_context.hpp"
#include "tabula/foundation/config_manager.hpp"
#include "tabula/foundation/tabula_result.hpp"
#include "tabula/types/type_record.hpp"

namespace tabula::discovery {

inline constexpr const char* kDefaultDatabaseName = "Application.db";
inline constexpr int kDefaultDatabaseVersion = 1;

/// Caller-owned description of the application's persistence model.
///
/// When `valid` is false the declared lists are ignored and the registry
/// is populated by discovery instead.
struct Configuration {
    DeploymentContext context;
    bool valid = false;

    std::optional<std::vector<types::TypeRecord>> entityTypes;
    std::optional<std::vector<types::TypeRecord>> serializerTypes;

    std::string databaseName = kDefaultDatabaseName;
    int databaseVersion = kDefaultDatabaseVersion;

    [[nodiscard]] bool isValid() const noexcept { return valid; }
};

/// Read a Configuration from a YAML file.
///
/// Recognized keys:
/// | Key                          | Meaning                               |
/// |------------------------------|---------------------------------------|
/// | deployment.package           | DeploymentContext::packageName        |
/// | deployment.artifact          | DeploymentContext::artifactPath       |
/// | deployment.data_dir          | DeploymentContext::dataDir            |
/// | deployment.resource_roots    | DeploymentContext::resourceRoots      |
/// | deployment.unit_suffix       | DeploymentContext::unitSuffix         |
/// | deployment.mode              | auto, container or directory          |
/// | persistence.database         | Configuration::databaseName           |
/// | persistence.version          | Configuration::databaseVersion        |
/// | persistence.entities         | names resolved through @p catalog     |
/// | persistence.serializers      | names resolved through @p catalog     |
///
/// Names that do not resolve to a type of the expected capability are
/// logged and dropped. The result is valid iff at least one entity type
/// resolved.
///
/// @param catalog  Type catalog; nullptr selects TypeCatalog::global().
foundation::TabulaResult<Configuration> readConfiguration(
    const std::filesystem::path& path, const types::TypeCatalog* catalog = nullptr);

/// Same as readConfiguration() for an already loaded ConfigManager.
foundation::TabulaResult<Configuration> parseConfiguration(
    const foundation::ConfigManager& config, const types::TypeCatalog* catalog = nullptr);

} // namespace tabula::discovery
