/// @file configuration.cpp
/// @brief YAML form of Configuration.

#include "tabula/discovery/configuration.hpp"

#include "tabula/foundation/logger.hpp"

using tabula::foundation::ConfigManager;
using tabula::foundation::ErrorCode;
using tabula::foundation::LogCategory;
using tabula::foundation::TabulaError;
using tabula::foundation::TabulaResult;

namespace tabula::discovery {

std::optional<EnumerationMode> parseEnumerationMode(std::string_view text) {
    if (text == "auto") {
        return EnumerationMode::Auto;
    }
    if (text == "container") {
        return EnumerationMode::Container;
    }
    if (text == "directory") {
        return EnumerationMode::Directory;
    }
    return std::nullopt;
}

namespace {

/// Resolve declared names to records of the wanted capability.
std::vector<types::TypeRecord> resolveTypes(const std::vector<std::string>& names,
                                            const types::TypeCatalog& catalog,
                                            types::TypeCapability wanted,
                                            std::string_view what) {
    std::vector<types::TypeRecord> records;
    records.reserve(names.size());
    for (const auto& name : names) {
        const auto* record = catalog.Find(name);
        if (record == nullptr) {
            TABULA_LOG_ERROR(LogCategory::Config,
                             "Couldn't resolve " + std::string(what) + " '" + name + "'");
            continue;
        }
        if (record->capability != wanted) {
            TABULA_LOG_ERROR(LogCategory::Config,
                             "Declared " + std::string(what) + " '" + name +
                                 "' does not have the expected capability");
            continue;
        }
        records.push_back(*record);
    }
    return records;
}

} // namespace

TabulaResult<Configuration> readConfiguration(const std::filesystem::path& path,
                                              const types::TypeCatalog* catalog) {
    ConfigManager config;
    auto loaded = config.load(path);
    if (loaded.hasError()) {
        return TabulaResult<Configuration>::err(loaded.error());
    }
    return parseConfiguration(config, catalog);
}

TabulaResult<Configuration> parseConfiguration(const ConfigManager& config,
                                               const types::TypeCatalog* catalog) {
    Configuration result;
    auto& ctx = result.context;
    ctx.catalog = catalog;

    auto package = config.getOr<std::string>("deployment.package", "");
    if (package.hasError()) {
        return TabulaResult<Configuration>::err(package.error());
    }
    auto artifact = config.getOr<std::string>("deployment.artifact", "");
    if (artifact.hasError()) {
        return TabulaResult<Configuration>::err(artifact.error());
    }
    auto dataDir = config.getOr<std::string>("deployment.data_dir", "");
    if (dataDir.hasError()) {
        return TabulaResult<Configuration>::err(dataDir.error());
    }
    auto roots = config.getOr<std::vector<std::string>>("deployment.resource_roots", {});
    if (roots.hasError()) {
        return TabulaResult<Configuration>::err(roots.error());
    }
    auto suffix = config.getOr<std::string>("deployment.unit_suffix", ctx.unitSuffix);
    if (suffix.hasError()) {
        return TabulaResult<Configuration>::err(suffix.error());
    }
    auto mode = config.getOr<std::string>("deployment.mode", "auto");
    if (mode.hasError()) {
        return TabulaResult<Configuration>::err(mode.error());
    }
    auto database = config.getOr<std::string>("persistence.database", kDefaultDatabaseName);
    if (database.hasError()) {
        return TabulaResult<Configuration>::err(database.error());
    }
    auto version = config.getOr<int>("persistence.version", kDefaultDatabaseVersion);
    if (version.hasError()) {
        return TabulaResult<Configuration>::err(version.error());
    }

    auto parsedMode = parseEnumerationMode(mode.value());
    if (!parsedMode) {
        return TabulaResult<Configuration>::err(
            TabulaError(ErrorCode::ConfigTypeMismatch,
                        "deployment.mode must be auto, container or directory, got '" +
                            mode.value() + "'"));
    }

    ctx.packageName = package.value();
    ctx.artifactPath = artifact.value();
    ctx.dataDir = dataDir.value();
    for (const auto& root : roots.value()) {
        ctx.resourceRoots.emplace_back(root);
    }
    ctx.unitSuffix = suffix.value();
    ctx.mode = *parsedMode;
    result.databaseName = database.value();
    result.databaseVersion = version.value();

    const auto& typeCatalog = ctx.typeCatalog();

    if (config.hasKey("persistence.entities")) {
        auto names = config.get<std::vector<std::string>>("persistence.entities");
        if (names.hasError()) {
            return TabulaResult<Configuration>::err(names.error());
        }
        result.entityTypes = resolveTypes(names.value(), typeCatalog,
                                          types::TypeCapability::Entity, "entity type");
    }

    if (config.hasKey("persistence.serializers")) {
        auto names = config.get<std::vector<std::string>>("persistence.serializers");
        if (names.hasError()) {
            return TabulaResult<Configuration>::err(names.error());
        }
        result.serializerTypes = resolveTypes(names.value(), typeCatalog,
                                              types::TypeCapability::Serializer, "serializer");
    }

    result.valid = result.entityTypes.has_value() && !result.entityTypes->empty();

    TABULA_LOG_INFO(LogCategory::Config,
                    std::string("Configuration read: ") +
                        (result.valid ? "declared model" : "no declared model, discovery required"));
    return TabulaResult<Configuration>::ok(std::move(result));
}

} // namespace tabula::discovery
