#include "tabula/registry/registry_builder.hpp"

#include <algorithm>
#include <exception>
#include <string>
#include <utility>

using tabula::foundation::ErrorCode;
using tabula::foundation::TabulaError;
using tabula::foundation::TabulaResult;

namespace tabula::registry {

RegistryBuilder::RegistryBuilder()
    : serializers_(serializer::makeBuiltinSerializers()) {}

TabulaResult<bool> RegistryBuilder::registerEntity(const types::TypeRecord& record) {
    if (schemas_.count(record.type) > 0) {
        return TabulaResult<bool>::ok(false);
    }

    auto descriptor = schema::SchemaDescriptor::create(record);
    if (descriptor.hasError()) {
        return TabulaResult<bool>::err(descriptor.error());
    }

    if (serializers_.count(record.type) > 0) {
        return TabulaResult<bool>::err(
            TabulaError(ErrorCode::SchemaConstructionFailed,
                        "Cannot describe '" + record.name +
                            "': a serializer is already registered for this type"));
    }

    retainModule(record.module);
    schemas_.emplace(record.type, std::move(descriptor).value());
    return TabulaResult<bool>::ok(true);
}

TabulaResult<void> RegistryBuilder::registerSerializer(const types::TypeRecord& record) {
    if (!record.isSerializer()) {
        return TabulaResult<void>::err(
            TabulaError(ErrorCode::TypeNotInstantiable,
                        "Type '" + record.name + "' is not a TypeSerializer"));
    }
    if (!record.serializerFactory) {
        return TabulaResult<void>::err(
            TabulaError(ErrorCode::TypeNotInstantiable,
                        "Serializer '" + record.name +
                            "' is abstract or has no default constructor"));
    }

    std::unique_ptr<serializer::TypeSerializer> instance;
    try {
        instance = record.serializerFactory();
    } catch (const std::exception& e) {
        return TabulaResult<void>::err(
            TabulaError(ErrorCode::TypeNotInstantiable,
                        "Serializer '" + record.name + "' threw during construction: " +
                            e.what()));
    }
    if (!instance) {
        return TabulaResult<void>::err(
            TabulaError(ErrorCode::TypeNotInstantiable,
                        "Serializer factory returned null for: " + record.name));
    }

    auto added = putSerializer(std::move(instance));
    if (added.hasError()) {
        return TabulaResult<void>::err(
            TabulaError(ErrorCode::InvalidArgument,
                        "Serializer '" + record.name + "': " +
                            std::string(added.error().message())));
    }
    retainModule(record.module);
    return TabulaResult<void>::ok();
}

TabulaResult<void> RegistryBuilder::putSerializer(
    std::shared_ptr<const serializer::TypeSerializer> instance) {
    if (!instance) {
        return TabulaResult<void>::err(
            TabulaError(ErrorCode::InvalidArgument, "Null serializer instance"));
    }
    auto key = instance->deserializedType();
    if (schemas_.count(key) > 0) {
        return TabulaResult<void>::err(
            TabulaError(ErrorCode::InvalidArgument,
                        std::string("value type ") + key.name() +
                            " is a registered entity type"));
    }
    serializers_[key] = std::move(instance);
    return TabulaResult<void>::ok();
}

bool RegistryBuilder::hasSchema(std::type_index type) const {
    return schemas_.count(type) > 0;
}

const serializer::TypeSerializer* RegistryBuilder::findSerializer(std::type_index type) const {
    auto it = serializers_.find(type);
    return it == serializers_.end() ? nullptr : it->second.get();
}

ModelRegistry RegistryBuilder::finish(RegistrySource source, discovery::DiscoveryReport report,
                                      std::string databaseName, int databaseVersion) && {
    ModelRegistry registry;
    registry.modules_ = std::move(modules_);
    registry.schemas_ = std::move(schemas_);
    registry.serializers_ = std::move(serializers_);
    registry.source_ = source;
    registry.report_ = std::move(report);
    registry.databaseName_ = std::move(databaseName);
    registry.databaseVersion_ = databaseVersion;
    return registry;
}

void RegistryBuilder::retainModule(const std::shared_ptr<void>& module) {
    if (!module) {
        return;
    }
    if (std::find(modules_.begin(), modules_.end(), module) == modules_.end()) {
        modules_.push_back(module);
    }
}

} // namespace tabula::registry
