/// @file type_catalog.cpp
/// @brief TypeCatalog implementation: static, explicit and module-based
///        type registration.

#include "tabula/types/type_catalog.hpp"

#include "tabula/foundation/logger.hpp"
#include "tabula/types/type_export.hpp"

#include <algorithm>
#include <system_error>

// Platform-specific dynamic library loading.
#if defined(_WIN32)
#define WIN32_LEAN_AND_MEAN
#include <windows.h>
#else
#include <dlfcn.h>
#endif

using tabula::foundation::ErrorCode;
using tabula::foundation::LogCategory;
using tabula::foundation::TabulaError;
using tabula::foundation::TabulaResult;

namespace tabula::types {

namespace {

constexpr const char* kDescribeSymbol = "TabulaDescribeTypes";

using DescribeFunc = void (*)(TypeCatalog&);

void closeLibrary(void* handle) {
    if (handle == nullptr) {
        return;
    }
#if defined(_WIN32)
    FreeLibrary(static_cast<HMODULE>(handle));
#else
    dlclose(handle);
#endif
}

} // namespace

// ── Construction / destruction ──────────────────────────────────────────

TypeCatalog::TypeCatalog() = default;
TypeCatalog::~TypeCatalog() = default;
TypeCatalog::TypeCatalog(TypeCatalog&&) noexcept = default;
TypeCatalog& TypeCatalog::operator=(TypeCatalog&&) noexcept = default;

TypeCatalog& TypeCatalog::global() {
    static TypeCatalog catalog = [] {
        TypeCatalog c;
        c.RegisterStaticTypes();
        return c;
    }();
    return catalog;
}

// ── Registration ────────────────────────────────────────────────────────

TabulaResult<void> TypeCatalog::Register(TypeRecord record) {
    if (record.name.empty()) {
        return TabulaResult<void>::err(
            TabulaError(ErrorCode::InvalidArgument, "Type record has an empty name"));
    }
    if (records_.count(record.name) > 0) {
        return TabulaResult<void>::err(
            TabulaError(ErrorCode::AlreadyExists, "Type already registered: " + record.name));
    }
    auto name = record.name;
    records_.emplace(std::move(name), std::move(record));
    return TabulaResult<void>::ok();
}

std::size_t TypeCatalog::RegisterStaticTypes() {
    std::size_t added = 0;
    for (const auto& record : StaticTypeRegistry()) {
        if (records_.count(record.name) > 0) {
            continue;
        }
        if (Register(record).hasValue()) {
            ++added;
        }
    }
    return added;
}

// ── Shared modules ──────────────────────────────────────────────────────

TabulaResult<std::size_t> TypeCatalog::LoadModule(const std::filesystem::path& path) {
    std::error_code ec;
    if (!std::filesystem::exists(path, ec)) {
        return TabulaResult<std::size_t>::err(
            TabulaError(ErrorCode::ModuleLoadFailed, "Module file not found: " + path.string()));
    }

#if defined(_WIN32)
    void* raw = static_cast<void*>(LoadLibraryW(path.c_str()));
#else
    void* raw = dlopen(path.c_str(), RTLD_NOW | RTLD_LOCAL);
#endif

    if (raw == nullptr) {
#if defined(_WIN32)
        auto errorMsg = "LoadLibrary failed for: " + path.string();
#else
        auto errorMsg = std::string(dlerror());
#endif
        return TabulaResult<std::size_t>::err(
            TabulaError(ErrorCode::ModuleLoadFailed, std::move(errorMsg)));
    }
    std::shared_ptr<void> handle(raw, closeLibrary);

#if defined(_WIN32)
    auto describeFn = reinterpret_cast<DescribeFunc>(
        GetProcAddress(static_cast<HMODULE>(raw), kDescribeSymbol));
#else
    auto describeFn = reinterpret_cast<DescribeFunc>(dlsym(raw, kDescribeSymbol));
#endif

    if (describeFn == nullptr) {
        return TabulaResult<std::size_t>::err(
            TabulaError(ErrorCode::ModuleSymbolMissing,
                        std::string("Symbol '") + kDescribeSymbol + "' not found in: " +
                            path.string()));
    }

    // Describe into a staging catalog so every imported record can be tied
    // to the module handle before it becomes visible.
    TypeCatalog staging;
    describeFn(staging);

    std::size_t added = 0;
    for (auto& [name, record] : staging.records_) {
        if (records_.count(name) > 0) {
            TABULA_LOG_WARN(LogCategory::Catalog,
                            "Module " + path.filename().string() + " redefines type '" + name +
                                "'; keeping the existing definition");
            continue;
        }
        record.module = handle;
        records_.emplace(name, std::move(record));
        ++added;
    }

    TABULA_LOG_INFO(LogCategory::Catalog,
                    "Loaded " + std::to_string(added) + " type(s) from module " + path.string());
    return TabulaResult<std::size_t>::ok(added);
}

// ── Queries ─────────────────────────────────────────────────────────────

const TypeRecord* TypeCatalog::Find(std::string_view name) const {
    auto it = records_.find(std::string(name));
    if (it == records_.end()) {
        return nullptr;
    }
    return &it->second;
}

TabulaResult<const TypeRecord*> TypeCatalog::Load(std::string_view name) const {
    const auto* record = Find(name);
    if (record == nullptr) {
        return TabulaResult<const TypeRecord*>::err(
            TabulaError(ErrorCode::TypeNotFound, "Type not found: " + std::string(name)));
    }
    return TabulaResult<const TypeRecord*>::ok(record);
}

std::vector<std::string> TypeCatalog::GetAllTypeNames() const {
    std::vector<std::string> names;
    names.reserve(records_.size());
    for (const auto& entry : records_) {
        names.push_back(entry.first);
    }
    std::sort(names.begin(), names.end());
    return names;
}

std::size_t TypeCatalog::TypeCount() const noexcept {
    return records_.size();
}

}  // namespace tabula::types
