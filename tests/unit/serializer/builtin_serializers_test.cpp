#include <gtest/gtest.h>

#include <any>
#include <chrono>
#include <ctime>
#include <filesystem>
#include <string>

#include "tabula/serializer/builtin_serializers.hpp"

#include "support/test_types.hpp"

using namespace tabula::serializer;
using namespace std::chrono;

namespace {

const TypeSerializer& builtin(const SerializerMap& map, std::type_index type) {
    return *map.at(type);
}

}  // namespace

TEST(BuiltinSerializersTest, CoversWellKnownValueTypes) {
    auto builtins = makeBuiltinSerializers();
    EXPECT_EQ(builtins.size(), 4u);
    EXPECT_EQ(builtins.count(typeid(std::tm)), 1u);
    EXPECT_EQ(builtins.count(typeid(system_clock::time_point)), 1u);
    EXPECT_EQ(builtins.count(typeid(sys_days)), 1u);
    EXPECT_EQ(builtins.count(typeid(std::filesystem::path)), 1u);
}

TEST(BuiltinSerializersTest, EachInstanceIsKeyedByItsValueType) {
    for (const auto& [type, serializer] : makeBuiltinSerializers()) {
        ASSERT_NE(serializer, nullptr);
        EXPECT_EQ(serializer->deserializedType(), type);
        EXPECT_TRUE(serializer->serializedType() == std::type_index(typeid(int64_t)) ||
                    serializer->serializedType() == std::type_index(typeid(std::string)));
    }
}

TEST(BuiltinSerializersTest, CalendarIsEpochMillisUtc) {
    auto builtins = makeBuiltinSerializers();
    const auto& calendar = builtin(builtins, typeid(std::tm));

    std::tm moonLanding{};
    moonLanding.tm_year = 69;
    moonLanding.tm_mon = 6;
    moonLanding.tm_mday = 20;
    moonLanding.tm_hour = 20;
    moonLanding.tm_min = 17;
    moonLanding.tm_sec = 40;

    auto stored = calendar.serialize(moonLanding);
    ASSERT_TRUE(stored.type() == typeid(int64_t));
    EXPECT_EQ(std::any_cast<int64_t>(stored), -14182940000LL);

    auto back = std::any_cast<std::tm>(calendar.deserialize(stored));
    EXPECT_EQ(back.tm_year, 69);
    EXPECT_EQ(back.tm_mon, 6);
    EXPECT_EQ(back.tm_mday, 20);
    EXPECT_EQ(back.tm_hour, 20);
    EXPECT_EQ(back.tm_min, 17);
    EXPECT_EQ(back.tm_sec, 40);
    EXPECT_EQ(back.tm_wday, 0);  // Sunday
    EXPECT_EQ(back.tm_yday, 200);
}

TEST(BuiltinSerializersTest, TimePointIsEpochMillis) {
    auto builtins = makeBuiltinSerializers();
    const auto& instant = builtin(builtins, typeid(system_clock::time_point));

    system_clock::time_point tp{milliseconds{1700000000123LL}};
    auto stored = instant.serialize(tp);
    EXPECT_EQ(std::any_cast<int64_t>(stored), 1700000000123LL);
    EXPECT_EQ(std::any_cast<system_clock::time_point>(instant.deserialize(stored)), tp);
}

TEST(BuiltinSerializersTest, DateIsMidnightMillis) {
    auto builtins = makeBuiltinSerializers();
    const auto& date = builtin(builtins, typeid(sys_days));

    sys_days day = year{1970} / January / 2;
    EXPECT_EQ(std::any_cast<int64_t>(date.serialize(day)), 86400000LL);

    // Time of day is truncated when reading back.
    auto back = std::any_cast<sys_days>(date.deserialize(int64_t{86400000LL + 3600000LL}));
    EXPECT_EQ(back, day);
}

TEST(BuiltinSerializersTest, PathIsString) {
    auto builtins = makeBuiltinSerializers();
    const auto& path = builtin(builtins, typeid(std::filesystem::path));

    auto stored = path.serialize(std::filesystem::path("/var/lib/shop/Application.db"));
    EXPECT_EQ(std::any_cast<std::string>(stored), "/var/lib/shop/Application.db");
    EXPECT_EQ(std::any_cast<std::filesystem::path>(path.deserialize(stored)),
              std::filesystem::path("/var/lib/shop/Application.db"));
}

TEST(BuiltinSerializersTest, MistypedInputYieldsEmpty) {
    auto builtins = makeBuiltinSerializers();
    const auto& path = builtin(builtins, typeid(std::filesystem::path));
    EXPECT_FALSE(path.serialize(42).has_value());
    EXPECT_FALSE(path.serialize(std::any{}).has_value());
    EXPECT_FALSE(path.deserialize(int64_t{1}).has_value());
}

TEST(BuiltinSerializersTest, FreshMapPerCall) {
    auto first = makeBuiltinSerializers();
    first.erase(typeid(std::tm));
    EXPECT_EQ(makeBuiltinSerializers().count(typeid(std::tm)), 1u);
}

TEST(BasicTypeSerializerTest, UserSerializerRoundTrip) {
    shop::MoneySerializer money;
    EXPECT_EQ(money.deserializedType(), std::type_index(typeid(shop::Money)));
    EXPECT_EQ(money.serializedType(), std::type_index(typeid(std::int64_t)));
    EXPECT_EQ(std::any_cast<std::int64_t>(money.serialize(shop::Money{1250})), 1250);
    EXPECT_EQ(std::any_cast<shop::Money>(money.deserialize(std::int64_t{99})).cents, 99);
}
