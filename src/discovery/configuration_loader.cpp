#include "tabula/discovery/configuration_loader.hpp"

#include "tabula/foundation/logger.hpp"

using tabula::foundation::LogCategory;
using tabula::foundation::LogContext;
using tabula::foundation::LogLevel;
using tabula::foundation::Logger;
using tabula::foundation::TabulaResult;

namespace tabula::discovery {

ConfigurationLoader::ConfigurationLoader(registry::RegistryBuilder& builder)
    : builder_(builder) {}

TabulaResult<bool> ConfigurationLoader::load(const Configuration& configuration) {
    if (!configuration.isValid()) {
        return TabulaResult<bool>::ok(false);
    }

    if (configuration.entityTypes) {
        for (const auto& record : *configuration.entityTypes) {
            auto added = builder_.registerEntity(record);
            if (added.hasError()) {
                return TabulaResult<bool>::err(added.error());
            }
        }
    }

    if (configuration.serializerTypes) {
        for (const auto& record : *configuration.serializerTypes) {
            auto added = builder_.registerSerializer(record);
            if (added.hasError()) {
                LogContext ctx;
                ctx.candidate = record.name;
                ctx.extra["reason"] = std::string(added.error().message());
                Logger::instance().logWithContext(LogLevel::Error, LogCategory::Registry,
                                                  "Couldn't instantiate TypeSerializer", ctx);
            }
        }
    }

    TABULA_LOG_INFO(LogCategory::Registry,
                    "Loaded declared model: " + std::to_string(builder_.schemaCount()) +
                        " entities, " + std::to_string(builder_.serializerCount()) +
                        " serializers");
    return TabulaResult<bool>::ok(true);
}

} // namespace tabula::discovery
