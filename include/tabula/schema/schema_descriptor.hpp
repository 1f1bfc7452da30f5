#pragma once

/// @file schema_descriptor.hpp
/// @brief SchemaDescriptor: the registry-level description of one entity type.

#include <string>
#include <string_view>
#include <typeindex>

#include "tabula/foundation/tabula_result.hpp"
#include "tabula/types/type_record.hpp"

namespace tabula::schema {

/// Default primary key column for entities that do not declare one.
inline constexpr std::string_view kDefaultIdColumn = "Id";

/// Describes where an entity type is stored.
///
/// Built once per entity type from its TypeRecord. Column mapping and
/// constraints are resolved by the persistence layer on top of this.
class SchemaDescriptor {
public:
    /// Build the descriptor for @p record.
    ///
    /// @return SchemaConstructionFailed when the record is not a concrete
    ///         entity, or its table / id names are not SQL identifiers.
    static foundation::TabulaResult<SchemaDescriptor> create(const types::TypeRecord& record);

    [[nodiscard]] std::type_index type() const noexcept { return type_; }
    [[nodiscard]] const std::string& typeName() const noexcept { return typeName_; }
    [[nodiscard]] const std::string& tableName() const noexcept { return tableName_; }
    [[nodiscard]] const std::string& idColumn() const noexcept { return idColumn_; }

private:
    SchemaDescriptor(std::type_index type, std::string typeName,
                     std::string tableName, std::string idColumn);

    std::type_index type_;
    std::string typeName_;
    std::string tableName_;
    std::string idColumn_;
};

/// True when @p name is usable unquoted as a table or column name.
[[nodiscard]] bool isValidIdentifier(std::string_view name) noexcept;

} // namespace tabula::schema
