#pragma once

/// @file registry_builder.hpp
/// @brief RegistryBuilder: the only writer of a ModelRegistry, used during
///        the single initialization pass.

#include <memory>
#include <string>
#include <typeindex>
#include <unordered_map>
#include <vector>

#include "tabula/discovery/discovery_report.hpp"
#include "tabula/foundation/tabula_result.hpp"
#include "tabula/registry/model_registry.hpp"
#include "tabula/schema/schema_descriptor.hpp"
#include "tabula/serializer/builtin_serializers.hpp"
#include "tabula/types/type_record.hpp"

namespace tabula::registry {

/// Append-only accumulator for the two registries.
///
/// Starts with the built-in serializers. finish() moves the contents into an
/// immutable ModelRegistry.
class RegistryBuilder {
public:
    RegistryBuilder();

    /// Describe and add an entity type.
    ///
    /// An already registered type keeps its descriptor; nothing is rebuilt.
    /// @return true if added, false if it was already present, or the
    ///         SchemaConstructionFailed error.
    foundation::TabulaResult<bool> registerEntity(const types::TypeRecord& record);

    /// Instantiate a serializer type and add it under the value type it
    /// handles, replacing any earlier serializer for that value type.
    ///
    /// @return TypeNotInstantiable when the record has no usable factory,
    ///         the factory throws or returns null; InvalidArgument when the
    ///         handled value type is a registered entity type.
    foundation::TabulaResult<void> registerSerializer(const types::TypeRecord& record);

    /// Add an existing serializer instance under its value type (last
    /// writer wins).
    ///
    /// @return InvalidArgument when @p instance is null or its value type
    ///         is a registered entity type.
    foundation::TabulaResult<void> putSerializer(
        std::shared_ptr<const serializer::TypeSerializer> instance);

    [[nodiscard]] bool hasSchema(std::type_index type) const;
    [[nodiscard]] const serializer::TypeSerializer* findSerializer(std::type_index type) const;

    [[nodiscard]] std::size_t schemaCount() const noexcept { return schemas_.size(); }
    [[nodiscard]] std::size_t serializerCount() const noexcept { return serializers_.size(); }

    /// Seal the accumulated registries.
    ModelRegistry finish(RegistrySource source, discovery::DiscoveryReport report,
                         std::string databaseName, int databaseVersion) &&;

private:
    void retainModule(const std::shared_ptr<void>& module);

    std::vector<std::shared_ptr<void>> modules_;
    std::unordered_map<std::type_index, schema::SchemaDescriptor> schemas_;
    serializer::SerializerMap serializers_;
};

} // namespace tabula::registry
