#pragma once

/// @file type_record.hpp
/// @brief TypeRecord: the self-description a type hands to the catalog.

#include <cstdint>
#include <functional>
#include <memory>
#include <string>
#include <string_view>
#include <type_traits>
#include <typeindex>
#include <typeinfo>

#include "tabula/schema/entity.hpp"
#include "tabula/serializer/type_serializer.hpp"

namespace tabula::types {

/// Capability a type satisfies, as seen by the classifier.
enum class TypeCapability : uint8_t {
    None,        ///< Neither an entity nor a serializer.
    Entity,      ///< Derives from schema::Entity.
    Serializer   ///< Derives from serializer::TypeSerializer.
};

/// Separator between namespace components of a qualified type name.
inline constexpr std::string_view kNamespaceSeparator = "::";

/// Creates a fresh serializer instance; may throw or return null.
using SerializerFactory = std::function<std::unique_ptr<serializer::TypeSerializer>()>;

/// Self-description of one type known to a TypeCatalog.
///
/// Looking a record up never constructs the type; the serializer factory
/// runs only when the classifier decides to register a serializer.
struct TypeRecord {
    /// Keeps the shared module that described this type loaded. Declared
    /// first so it is released after serializerFactory, whose code may
    /// live in that module.
    std::shared_ptr<void> module;

    /// Fully-qualified name, e.g. "shop::model::Order".
    std::string name;
    std::type_index type{typeid(void)};
    TypeCapability capability = TypeCapability::None;
    bool isAbstract = false;

    /// Declared table name / id column (entities only; may be empty).
    std::string tableName;
    std::string idColumn;

    /// Empty for abstract or non-default-constructible serializers.
    SerializerFactory serializerFactory;

    [[nodiscard]] bool isEntity() const noexcept {
        return capability == TypeCapability::Entity;
    }

    [[nodiscard]] bool isSerializer() const noexcept {
        return capability == TypeCapability::Serializer;
    }

    /// Name without its namespace qualification ("Order").
    [[nodiscard]] std::string_view simpleName() const noexcept {
        std::string_view view(name);
        auto pos = view.rfind(kNamespaceSeparator);
        return pos == std::string_view::npos ? view
                                             : view.substr(pos + kNamespaceSeparator.size());
    }
};

/// Build the TypeRecord for @p T from its C++ traits.
///
/// @param name  Fully-qualified name of @p T; a leading "::" is dropped.
template <typename T>
TypeRecord describeType(std::string_view name) {
    if (name.substr(0, kNamespaceSeparator.size()) == kNamespaceSeparator) {
        name.remove_prefix(kNamespaceSeparator.size());
    }

    TypeRecord record;
    record.name = std::string(name);
    record.type = std::type_index(typeid(T));
    record.isAbstract = std::is_abstract_v<T>;

    if constexpr (std::is_base_of_v<schema::Entity, T>) {
        record.capability = TypeCapability::Entity;
        record.tableName = std::string(schema::declaredTableName<T>());
        record.idColumn = std::string(schema::declaredIdColumn<T>());
    } else if constexpr (std::is_base_of_v<serializer::TypeSerializer, T>) {
        record.capability = TypeCapability::Serializer;
        if constexpr (!std::is_abstract_v<T> && std::is_default_constructible_v<T>) {
            record.serializerFactory = []() -> std::unique_ptr<serializer::TypeSerializer> {
                return std::make_unique<T>();
            };
        }
    }
    return record;
}

} // namespace tabula::types
