#pragma once

/// @file entity.hpp
/// @brief Entity capability: the base class every persisted model derives from.

#include <string_view>
#include <type_traits>

namespace tabula::schema {

/// Base class for persisted entity types.
///
/// Deriving from Entity is what gives a type the "entity" capability. A type
/// may further describe its storage by declaring
///
/// @code
///   static constexpr std::string_view kTableName = "Orders";
///   static constexpr std::string_view kIdColumn = "OrderId";
/// @endcode
///
/// Without them the table is named after the unqualified type name and the
/// id column is "Id". Row mapping and query behavior live elsewhere in the
/// persistence layer.
class Entity {
public:
    virtual ~Entity() = default;
};

namespace detail {

template <typename T, typename = void>
struct HasTableName : std::false_type {};

template <typename T>
struct HasTableName<T, std::void_t<decltype(T::kTableName)>> : std::true_type {};

template <typename T, typename = void>
struct HasIdColumn : std::false_type {};

template <typename T>
struct HasIdColumn<T, std::void_t<decltype(T::kIdColumn)>> : std::true_type {};

} // namespace detail

/// Table name declared by @p T, or an empty view.
template <typename T>
constexpr std::string_view declaredTableName() {
    if constexpr (detail::HasTableName<T>::value) {
        return std::string_view(T::kTableName);
    } else {
        return {};
    }
}

/// Id column declared by @p T, or an empty view.
template <typename T>
constexpr std::string_view declaredIdColumn() {
    if constexpr (detail::HasIdColumn<T>::value) {
        return std::string_view(T::kIdColumn);
    } else {
        return {};
    }
}

} // namespace tabula::schema
