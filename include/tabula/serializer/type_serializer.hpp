#pragma once

/// @file type_serializer.hpp
/// @brief TypeSerializer: the serializer capability, converting a value type
///        to and from the representation stored in a column.

#include <any>
#include <typeindex>
#include <typeinfo>

namespace tabula::serializer {

/// Abstract base class for value serializers.
///
/// A serializer is registered under the value type it handles
/// (deserializedType()). Registering a second serializer for the same value
/// type replaces the first.
class TypeSerializer {
public:
    virtual ~TypeSerializer() = default;

    /// The in-memory value type this serializer handles.
    [[nodiscard]] virtual std::type_index deserializedType() const = 0;

    /// The stored representation type.
    [[nodiscard]] virtual std::type_index serializedType() const = 0;

    /// Convert a value of deserializedType() into serializedType().
    /// An empty or mistyped input yields an empty std::any.
    [[nodiscard]] virtual std::any serialize(const std::any& value) const = 0;

    /// Convert a stored value back into deserializedType().
    [[nodiscard]] virtual std::any deserialize(const std::any& data) const = 0;
};

/// Typed helper implementing the std::any plumbing of TypeSerializer.
///
/// Usage:
/// @code
///   class MoneySerializer : public BasicTypeSerializer<Money, int64_t> {
///   protected:
///       int64_t toStored(const Money& m) const override { return m.cents; }
///       Money fromStored(const int64_t& c) const override { return Money{c}; }
///   };
/// @endcode
template <typename Value, typename Stored>
class BasicTypeSerializer : public TypeSerializer {
public:
    [[nodiscard]] std::type_index deserializedType() const override { return typeid(Value); }
    [[nodiscard]] std::type_index serializedType() const override { return typeid(Stored); }

    [[nodiscard]] std::any serialize(const std::any& value) const override {
        const auto* typed = std::any_cast<Value>(&value);
        if (typed == nullptr) {
            return {};
        }
        return std::any(toStored(*typed));
    }

    [[nodiscard]] std::any deserialize(const std::any& data) const override {
        const auto* typed = std::any_cast<Stored>(&data);
        if (typed == nullptr) {
            return {};
        }
        return std::any(fromStored(*typed));
    }

protected:
    virtual Stored toStored(const Value& value) const = 0;
    virtual Value fromStored(const Stored& stored) const = 0;
};

} // namespace tabula::serializer
