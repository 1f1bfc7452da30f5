#pragma once

/// @file model_registry.hpp
/// @brief ModelRegistry: the read-only entity and serializer registries
///        consumed by the persistence layer.

#include <cstdint>
#include <memory>
#include <string>
#include <typeindex>
#include <typeinfo>
#include <unordered_map>
#include <vector>

#include "tabula/discovery/discovery_report.hpp"
#include "tabula/foundation/tabula_result.hpp"
#include "tabula/schema/schema_descriptor.hpp"
#include "tabula/serializer/builtin_serializers.hpp"

namespace tabula::discovery {
struct Configuration;
}

namespace tabula::registry {

class RegistryBuilder;

/// How the registry was populated.
enum class RegistrySource : uint8_t {
    Configuration,  ///< Declared entity/serializer lists.
    Discovery       ///< Scan of the deployed artifacts.
};

/// Entity type -> SchemaDescriptor and value type -> TypeSerializer.
///
/// Built once at startup by build(); there are no mutators afterwards, so
/// any number of threads may read a built registry without locking.
///
/// Lifecycle:
///   Uninitialized → LoadingConfiguration → ConfigPopulated → Ready
///                                        ↘ Scanning (locate → enumerate → classify) → Ready
///
/// Example:
/// @code
///   auto registry = ModelRegistry::build(configuration);
///   if (registry.hasError()) {
///       // broken multi-part deployment or malformed declared entity
///   }
///   const auto* orders = registry.value().findSchema<shop::model::Order>();
/// @endcode
class ModelRegistry {
public:
    /// Populate both registries from @p configuration, or by discovery when
    /// the configuration is not valid.
    ///
    /// @return The registry; MissingSecondaryArtifact or
    ///         PreferenceReadFailed when the deployment is broken; the
    ///         construction error of a declared entity type unchanged.
    static foundation::TabulaResult<ModelRegistry> build(
        const discovery::Configuration& configuration);

    ModelRegistry(ModelRegistry&&) noexcept = default;
    /// Releases the replaced registry's modules after its serializers.
    ModelRegistry& operator=(ModelRegistry&& other) noexcept;
    ModelRegistry(const ModelRegistry&) = delete;
    ModelRegistry& operator=(const ModelRegistry&) = delete;

    /// Descriptor for an entity type, or nullptr when not registered.
    [[nodiscard]] const schema::SchemaDescriptor* findSchema(std::type_index type) const;

    template <typename T>
    [[nodiscard]] const schema::SchemaDescriptor* findSchema() const {
        return findSchema(std::type_index(typeid(T)));
    }

    /// Serializer for a value type, or nullptr when not registered.
    [[nodiscard]] const serializer::TypeSerializer* findSerializer(std::type_index type) const;

    template <typename T>
    [[nodiscard]] const serializer::TypeSerializer* findSerializer() const {
        return findSerializer(std::type_index(typeid(T)));
    }

    /// Every registered descriptor, ordered by type name.
    [[nodiscard]] std::vector<const schema::SchemaDescriptor*> schemas() const;

    [[nodiscard]] std::size_t schemaCount() const noexcept { return schemas_.size(); }
    [[nodiscard]] std::size_t serializerCount() const noexcept { return serializers_.size(); }

    [[nodiscard]] RegistrySource source() const noexcept { return source_; }

    /// Outcome of the discovery pass (empty when populated from configuration).
    [[nodiscard]] const discovery::DiscoveryReport& report() const noexcept { return report_; }

    [[nodiscard]] const std::string& databaseName() const noexcept { return databaseName_; }
    [[nodiscard]] int databaseVersion() const noexcept { return databaseVersion_; }

private:
    friend class RegistryBuilder;

    ModelRegistry() = default;

    // Declared first so shared modules are released after the objects
    // whose code they contain.
    std::vector<std::shared_ptr<void>> modules_;

    std::unordered_map<std::type_index, schema::SchemaDescriptor> schemas_;
    serializer::SerializerMap serializers_;
    RegistrySource source_ = RegistrySource::Configuration;
    discovery::DiscoveryReport report_;
    std::string databaseName_;
    int databaseVersion_ = 1;
};

} // namespace tabula::registry
