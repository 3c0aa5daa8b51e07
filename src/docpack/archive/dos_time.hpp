#pragma once

#include <cstdint>
#include <ctime>

namespace DocPack
{
// MS-DOS packed timestamp as stored in zip headers, 2-second resolution
struct DosDateTime {
    // bits 15-11 hour, 10-5 minute, 4-0 second/2
    std::uint16_t time = 0;
    // bits 15-9 year-1980, 8-5 month, 4-0 day
    std::uint16_t date = 0x0021;

    constexpr static std::int32_t kMinYear = 1980;
    constexpr static std::int32_t kMaxYear = 2107;

    // years before 1980 map to the epoch, years after 2107 clamp to the last representable second
    static DosDateTime FromTm(const std::tm& tm);
    static DosDateTime FromUnixTime(std::time_t t, bool utc = false);

    constexpr std::uint32_t Packed() const {
        return (static_cast<std::uint32_t>(date) << 16) | time;
    }

    constexpr bool operator==(const DosDateTime& other) const {
        return time == other.time && date == other.date;
    }
    constexpr bool operator!=(const DosDateTime& other) const {
        return !(*this == other);
    }
};

// 1980-01-01 00:00:00
inline constexpr DosDateTime kDosEpoch { 0x0000, 0x0021 };
} // namespace DocPack
