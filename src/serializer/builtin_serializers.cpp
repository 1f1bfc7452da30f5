#include "tabula/serializer/builtin_serializers.hpp"

namespace tabula::serializer {

using namespace std::chrono;

// ---------------------------------------------------------------------------
// CalendarSerializer
// ---------------------------------------------------------------------------

int64_t CalendarSerializer::toStored(const std::tm& value) const {
    // year/month arithmetic normalizes an out-of-range tm_mon, the day
    // offset normalizes tm_mday.
    auto ym = year{value.tm_year + 1900} / January + months{value.tm_mon};
    auto tp = sys_days{ym / 1} + days{value.tm_mday - 1} + hours{value.tm_hour} +
              minutes{value.tm_min} + seconds{value.tm_sec};
    return duration_cast<milliseconds>(tp.time_since_epoch()).count();
}

std::tm CalendarSerializer::fromStored(const int64_t& stored) const {
    sys_time<milliseconds> tp{milliseconds{stored}};
    auto dayPoint = floor<days>(tp);
    year_month_day ymd{dayPoint};
    hh_mm_ss<milliseconds> hms{tp - dayPoint};

    std::tm result{};
    result.tm_year = static_cast<int>(ymd.year()) - 1900;
    result.tm_mon = static_cast<int>(static_cast<unsigned>(ymd.month())) - 1;
    result.tm_mday = static_cast<int>(static_cast<unsigned>(ymd.day()));
    result.tm_hour = static_cast<int>(hms.hours().count());
    result.tm_min = static_cast<int>(hms.minutes().count());
    result.tm_sec = static_cast<int>(hms.seconds().count());
    result.tm_wday = static_cast<int>(weekday{dayPoint}.c_encoding());
    result.tm_yday = static_cast<int>((dayPoint - sys_days{ymd.year() / January / 1}).count());
    result.tm_isdst = 0;
    return result;
}

// ---------------------------------------------------------------------------
// TimePointSerializer
// ---------------------------------------------------------------------------

int64_t TimePointSerializer::toStored(const system_clock::time_point& value) const {
    return duration_cast<milliseconds>(value.time_since_epoch()).count();
}

system_clock::time_point TimePointSerializer::fromStored(const int64_t& stored) const {
    return system_clock::time_point{duration_cast<system_clock::duration>(milliseconds{stored})};
}

// ---------------------------------------------------------------------------
// DateSerializer
// ---------------------------------------------------------------------------

int64_t DateSerializer::toStored(const sys_days& value) const {
    return duration_cast<milliseconds>(value.time_since_epoch()).count();
}

sys_days DateSerializer::fromStored(const int64_t& stored) const {
    return floor<days>(sys_time<milliseconds>{milliseconds{stored}});
}

// ---------------------------------------------------------------------------
// PathSerializer
// ---------------------------------------------------------------------------

std::string PathSerializer::toStored(const std::filesystem::path& value) const {
    return value.string();
}

std::filesystem::path PathSerializer::fromStored(const std::string& stored) const {
    return std::filesystem::path(stored);
}

// ---------------------------------------------------------------------------
// Built-in set
// ---------------------------------------------------------------------------

SerializerMap makeBuiltinSerializers() {
    SerializerMap builtins;
    auto add = [&builtins](std::shared_ptr<const TypeSerializer> serializer) {
        auto key = serializer->deserializedType();
        builtins[key] = std::move(serializer);
    };
    add(std::make_shared<CalendarSerializer>());
    add(std::make_shared<TimePointSerializer>());
    add(std::make_shared<DateSerializer>());
    add(std::make_shared<PathSerializer>());
    return builtins;
}

} // namespace tabula::serializer
