#include "tabula/registry/model_registry.hpp"

#include "tabula/discovery/configuration.hpp"
#include "tabula/discovery/configuration_loader.hpp"
#include "tabula/discovery/discovery_scanner.hpp"
#include "tabula/foundation/logger.hpp"
#include "tabula/registry/registry_builder.hpp"

#include <algorithm>
#include <string>
#include <utility>

using tabula::foundation::LogCategory;
using tabula::foundation::LogContext;
using tabula::foundation::LogLevel;
using tabula::foundation::Logger;
using tabula::foundation::TabulaResult;

namespace tabula::registry {

TabulaResult<ModelRegistry> ModelRegistry::build(const discovery::Configuration& configuration) {
    RegistryBuilder builder;

    auto loaded = discovery::ConfigurationLoader(builder).load(configuration);
    if (loaded.hasError()) {
        return TabulaResult<ModelRegistry>::err(loaded.error());
    }

    RegistrySource source = RegistrySource::Configuration;
    discovery::DiscoveryReport report;

    if (!loaded.value()) {
        TABULA_LOG_INFO(LogCategory::Core, "No declared model, scanning deployment");
        auto scanned = discovery::DiscoveryScanner(configuration.context).scan(builder);
        if (scanned.hasError()) {
            return TabulaResult<ModelRegistry>::err(scanned.error());
        }
        source = RegistrySource::Discovery;
        report = std::move(scanned).value();
    }

    auto registry = std::move(builder).finish(source, std::move(report),
                                              configuration.databaseName,
                                              configuration.databaseVersion);

    LogContext ctx;
    ctx.extra["source"] =
        source == RegistrySource::Configuration ? "configuration" : "discovery";
    ctx.extra["entities"] = std::to_string(registry.schemaCount());
    ctx.extra["serializers"] = std::to_string(registry.serializerCount());
    Logger::instance().logWithContext(LogLevel::Info, LogCategory::Core,
                                      "Model registry loaded", ctx);

    return TabulaResult<ModelRegistry>::ok(std::move(registry));
}

ModelRegistry& ModelRegistry::operator=(ModelRegistry&& other) noexcept {
    if (this == &other) {
        return *this;
    }
    schemas_ = std::move(other.schemas_);
    serializers_ = std::move(other.serializers_);
    source_ = other.source_;
    report_ = std::move(other.report_);
    databaseName_ = std::move(other.databaseName_);
    databaseVersion_ = other.databaseVersion_;
    // Last: the old handles may own the code of the instances dropped above.
    modules_ = std::move(other.modules_);
    return *this;
}

const schema::SchemaDescriptor* ModelRegistry::findSchema(std::type_index type) const {
    auto it = schemas_.find(type);
    return it == schemas_.end() ? nullptr : &it->second;
}

const serializer::TypeSerializer* ModelRegistry::findSerializer(std::type_index type) const {
    auto it = serializers_.find(type);
    return it == serializers_.end() ? nullptr : it->second.get();
}

std::vector<const schema::SchemaDescriptor*> ModelRegistry::schemas() const {
    std::vector<const schema::SchemaDescriptor*> result;
    result.reserve(schemas_.size());
    for (const auto& entry : schemas_) {
        result.push_back(&entry.second);
    }
    std::sort(result.begin(), result.end(),
              [](const schema::SchemaDescriptor* lhs, const schema::SchemaDescriptor* rhs) {
                  return lhs->typeName() < rhs->typeName();
              });
    return result;
}

} // namespace tabula::registry
