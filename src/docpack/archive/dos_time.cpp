#include "dos_time.hpp"

#include <algorithm>

namespace DocPack
{
DosDateTime DosDateTime::FromTm(const std::tm& tm) {
    auto year = tm.tm_year + 1900;
    if (year < kMinYear) return kDosEpoch;
    if (year > kMaxYear) {
        DosDateTime last;
        last.date = static_cast<std::uint16_t>(((kMaxYear - kMinYear) << 9) | (12 << 5) | 31);
        last.time = static_cast<std::uint16_t>((23 << 11) | (59 << 5) | (58 >> 1));
        return last;
    }
    // out of range fields are clamped so they never spill into the neighbouring bits,
    // leap seconds are folded into 58
    auto month = std::clamp(tm.tm_mon, 0, 11) + 1;
    auto day   = std::clamp(tm.tm_mday, 1, 31);
    auto hour  = std::clamp(tm.tm_hour, 0, 23);
    auto min   = std::clamp(tm.tm_min, 0, 59);
    auto sec   = std::clamp(tm.tm_sec, 0, 59);
    DosDateTime ret;
    ret.date = static_cast<std::uint16_t>(((year - kMinYear) << 9) | (month << 5) | day);
    ret.time = static_cast<std::uint16_t>((hour << 11) | (min << 5) | (sec >> 1));
    return ret;
}

DosDateTime DosDateTime::FromUnixTime(std::time_t t, bool utc) {
    struct tm timeNow {};
#ifdef _WIN32
    if (utc)
        ::gmtime_s(&timeNow, &t);
    else
        ::localtime_s(&timeNow, &t);
#else
    if (utc)
        ::gmtime_r(&t, &timeNow);
    else
        ::localtime_r(&t, &timeNow);
#endif
    return FromTm(timeNow);
}
} // namespace DocPack
