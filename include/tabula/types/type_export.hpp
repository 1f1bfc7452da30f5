#pragma once

/// @file type_export.hpp
/// @brief Macros for registering types with the catalog.
///
/// Types linked into the executable use TABULA_REGISTER_TYPE to add
/// themselves to the static registry. Shared modules use
/// TABULA_MODULE_EXPORT to generate the C entry point that
/// TypeCatalog::LoadModule() looks up via dlsym/GetProcAddress.

#include "tabula/types/type_record.hpp"

#include <utility>
#include <vector>

namespace tabula::types {

class TypeCatalog;

/// Global registry of statically linked type records.
///
/// Populated at static-init time by TABULA_REGISTER_TYPE macros.
inline std::vector<TypeRecord>& StaticTypeRegistry() {
    static std::vector<TypeRecord> registry;
    return registry;
}

namespace detail {

/// RAII helper that registers a record on construction.
struct StaticTypeRegistrar {
    explicit StaticTypeRegistrar(TypeRecord record) {
        StaticTypeRegistry().push_back(std::move(record));
    }
};

}  // namespace detail
}  // namespace tabula::types

#define TABULA_CONCAT_IMPL(a, b) a##b
#define TABULA_CONCAT(a, b) TABULA_CONCAT_IMPL(a, b)

/// Register a type for static discovery.
///
/// Must be used at namespace scope with the fully-qualified type name,
/// which also becomes the catalog name:
/// @code
///   namespace shop::model { class Order : public tabula::schema::Entity { ... }; }
///   TABULA_REGISTER_TYPE(shop::model::Order);
/// @endcode
#define TABULA_REGISTER_TYPE(Type)                                                  \
    static ::tabula::types::detail::StaticTypeRegistrar                             \
    TABULA_CONCAT(tabula_static_type_registrar_, __COUNTER__)(                      \
        ::tabula::types::describeType<Type>(#Type))

/// Generate the C-linkage describe function of a shared module.
///
/// Usage (in a .cpp file compiled into a shared library):
/// @code
///   void describeShopTypes(tabula::types::TypeCatalog& catalog) {
///       catalog.Register(tabula::types::describeType<shop::Order>("shop::Order"));
///   }
///   TABULA_MODULE_EXPORT(describeShopTypes)
/// @endcode
#define TABULA_MODULE_EXPORT(DescribeFunction)                               \
    extern "C" {                                                             \
    void TabulaDescribeTypes(::tabula::types::TypeCatalog& catalog) {        \
        DescribeFunction(catalog);                                           \
    }                                                                        \
    }
