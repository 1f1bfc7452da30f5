#include "tabula/schema/schema_descriptor.hpp"

#include <cctype>
#include <utility>

using tabula::foundation::ErrorCode;
using tabula::foundation::TabulaError;
using tabula::foundation::TabulaResult;

namespace tabula::schema {

bool isValidIdentifier(std::string_view name) noexcept {
    if (name.empty()) {
        return false;
    }
    auto first = static_cast<unsigned char>(name.front());
    if (!std::isalpha(first) && first != '_') {
        return false;
    }
    for (char c : name) {
        auto uc = static_cast<unsigned char>(c);
        if (!std::isalnum(uc) && uc != '_') {
            return false;
        }
    }
    return true;
}

SchemaDescriptor::SchemaDescriptor(std::type_index type, std::string typeName,
                                   std::string tableName, std::string idColumn)
    : type_(type),
      typeName_(std::move(typeName)),
      tableName_(std::move(tableName)),
      idColumn_(std::move(idColumn)) {}

TabulaResult<SchemaDescriptor> SchemaDescriptor::create(const types::TypeRecord& record) {
    auto fail = [&](const std::string& why) {
        return TabulaResult<SchemaDescriptor>::err(
            TabulaError(ErrorCode::SchemaConstructionFailed,
                        "Cannot describe '" + record.name + "': " + why));
    };

    if (!record.isEntity()) {
        return fail("type is not an entity");
    }
    if (record.isAbstract) {
        return fail("entity type is abstract");
    }

    std::string table = record.tableName.empty() ? std::string(record.simpleName())
                                                 : record.tableName;
    if (!isValidIdentifier(table)) {
        return fail("invalid table name '" + table + "'");
    }

    std::string id = record.idColumn.empty() ? std::string(kDefaultIdColumn) : record.idColumn;
    if (!isValidIdentifier(id)) {
        return fail("invalid id column '" + id + "'");
    }

    return TabulaResult<SchemaDescriptor>::ok(
        SchemaDescriptor(record.type, record.name, std::move(table), std::move(id)));
}

} // namespace tabula::schema
