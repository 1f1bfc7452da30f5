#pragma once

/// @file builtin_serializers.hpp
/// @brief Default serializers for the well-known value types.

#include <chrono>
#include <cstdint>
#include <ctime>
#include <filesystem>
#include <memory>
#include <string>
#include <typeindex>
#include <unordered_map>

#include "tabula/serializer/type_serializer.hpp"

namespace tabula::serializer {

/// Value type -> serializer instance.
using SerializerMap = std::unordered_map<std::type_index, std::shared_ptr<const TypeSerializer>>;

/// Broken-down calendar time (read as UTC) <-> epoch milliseconds.
/// Sub-second precision is not representable in std::tm.
class CalendarSerializer : public BasicTypeSerializer<std::tm, int64_t> {
protected:
    int64_t toStored(const std::tm& value) const override;
    std::tm fromStored(const int64_t& stored) const override;
};

/// Instant <-> epoch milliseconds.
class TimePointSerializer
    : public BasicTypeSerializer<std::chrono::system_clock::time_point, int64_t> {
protected:
    int64_t toStored(const std::chrono::system_clock::time_point& value) const override;
    std::chrono::system_clock::time_point fromStored(const int64_t& stored) const override;
};

/// Calendar date <-> epoch milliseconds of its midnight (UTC).
class DateSerializer : public BasicTypeSerializer<std::chrono::sys_days, int64_t> {
protected:
    int64_t toStored(const std::chrono::sys_days& value) const override;
    std::chrono::sys_days fromStored(const int64_t& stored) const override;
};

/// Filesystem path <-> its native string form.
class PathSerializer : public BasicTypeSerializer<std::filesystem::path, std::string> {
protected:
    std::string toStored(const std::filesystem::path& value) const override;
    std::filesystem::path fromStored(const std::string& stored) const override;
};

/// Build the serializer mapping every registry starts from: std::tm,
/// system_clock::time_point, sys_days and std::filesystem::path.
[[nodiscard]] SerializerMap makeBuiltinSerializers();

} // namespace tabula::serializer
