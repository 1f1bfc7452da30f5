#pragma once

/// @file type_catalog.hpp
/// @brief TypeCatalog: the deployment's type-loading facility. Maps
///        qualified type names to self-describing TypeRecords.

#include <cstddef>
#include <filesystem>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

#include "tabula/foundation/tabula_result.hpp"
#include "tabula/types/type_record.hpp"

namespace tabula::types {

/// Name-indexed catalog of every type the application can load.
///
/// Types enter the catalog in three ways:
///   - **Static**: TABULA_REGISTER_TYPE in any linked translation unit,
///     imported by RegisterStaticTypes() (global() does this on first use).
///   - **Explicit**: Register() with a record built by describeType<T>().
///   - **Module**: LoadModule() opens a shared library and calls its
///     exported `TabulaDescribeTypes(TypeCatalog&)` entry point.
///
/// Lookups are side-effect free: they never construct the type.
class TypeCatalog {
public:
    TypeCatalog();
    ~TypeCatalog();

    // Non-copyable, movable.
    TypeCatalog(const TypeCatalog&) = delete;
    TypeCatalog& operator=(const TypeCatalog&) = delete;
    TypeCatalog(TypeCatalog&&) noexcept;
    TypeCatalog& operator=(TypeCatalog&&) noexcept;

    /// Process-wide catalog pre-filled with statically registered types.
    static TypeCatalog& global();

    /// Add a record.
    /// @return AlreadyExists if a record with the same name is present,
    ///         InvalidArgument if the name is empty.
    foundation::TabulaResult<void> Register(TypeRecord record);

    /// Import every TABULA_REGISTER_TYPE record not yet present.
    /// @return Number of records added.
    std::size_t RegisterStaticTypes();

    /// Load a shared module and import the types it describes.
    ///
    /// Records already present under the same name are kept and the
    /// module's duplicates are skipped with a warning.
    ///
    /// @param path  Path to the shared library (.so, .dll, .dylib).
    /// @return Number of records added, or ModuleLoadFailed /
    ///         ModuleSymbolMissing.
    foundation::TabulaResult<std::size_t> LoadModule(const std::filesystem::path& path);

    /// Look a type up by qualified name (nullptr when unknown).
    [[nodiscard]] const TypeRecord* Find(std::string_view name) const;

    /// Look a type up by qualified name.
    /// @return The record, or TypeNotFound.
    foundation::TabulaResult<const TypeRecord*> Load(std::string_view name) const;

    [[nodiscard]] std::vector<std::string> GetAllTypeNames() const;

    [[nodiscard]] std::size_t TypeCount() const noexcept;

private:
    std::unordered_map<std::string, TypeRecord> records_;
};

}  // namespace tabula::types
