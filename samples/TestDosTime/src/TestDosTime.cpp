#include "docpack/archive/dos_time.hpp"

#include <gtest/gtest.h>

using namespace DocPack;

namespace
{
std::tm MakeTm(int year, int month, int day, int hour = 0, int minute = 0, int second = 0) {
    std::tm tm {};
    tm.tm_year = year - 1900;
    tm.tm_mon  = month - 1;
    tm.tm_mday = day;
    tm.tm_hour = hour;
    tm.tm_min  = minute;
    tm.tm_sec  = second;
    return tm;
}
} // namespace

TEST(DosTimeTest, DefaultIsEpoch) {
    DosDateTime value;
    EXPECT_EQ(value.time, 0);
    EXPECT_EQ(value.date, 0x0021);
    EXPECT_EQ(value, kDosEpoch);
    EXPECT_EQ(kDosEpoch.Packed(), 0x00210000u);
}

TEST(DosTimeTest, PacksFields) {
    auto value = DosDateTime::FromTm(MakeTm(1980, 1, 1));
    EXPECT_EQ(value, kDosEpoch);

    value = DosDateTime::FromTm(MakeTm(2024, 3, 15, 13, 45, 31));
    EXPECT_EQ(value.date, ((2024 - 1980) << 9) | (3 << 5) | 15);
    EXPECT_EQ(value.time, (13 << 11) | (45 << 5) | 15);
    EXPECT_EQ(value.date, 0x586F);
    EXPECT_EQ(value.time, 0x6DAF);
}

TEST(DosTimeTest, OutOfRangeFieldsAreClamped) {
    // day 40 must not carry into the month bits
    auto value = DosDateTime::FromTm(MakeTm(2024, 3, 40));
    EXPECT_EQ(value.date, ((2024 - 1980) << 9) | (3 << 5) | 31);
    value = DosDateTime::FromTm(MakeTm(2024, 16, 0));
    EXPECT_EQ(value.date, ((2024 - 1980) << 9) | (12 << 5) | 1);
    value = DosDateTime::FromTm(MakeTm(2024, 0, 5, 30, 75, -4));
    EXPECT_EQ(value.date, ((2024 - 1980) << 9) | (1 << 5) | 5);
    EXPECT_EQ(value.time, (23 << 11) | (59 << 5) | 0);
}

TEST(DosTimeTest, SecondsHaveTwoSecondResolution) {
    EXPECT_EQ(DosDateTime::FromTm(MakeTm(2000, 6, 1, 0, 0, 58)), DosDateTime::FromTm(MakeTm(2000, 6, 1, 0, 0, 59)));
    EXPECT_NE(DosDateTime::FromTm(MakeTm(2000, 6, 1, 0, 0, 1)), DosDateTime::FromTm(MakeTm(2000, 6, 1, 0, 0, 2)));
    // leap second
    EXPECT_EQ(DosDateTime::FromTm(MakeTm(2016, 12, 31, 23, 59, 60)).time, (23 << 11) | (59 << 5) | 29);
}

TEST(DosTimeTest, OutOfRangeYears) {
    EXPECT_EQ(DosDateTime::FromTm(MakeTm(1979, 12, 31, 23, 59, 59)), kDosEpoch);
    EXPECT_EQ(DosDateTime::FromTm(MakeTm(1970, 1, 1)), kDosEpoch);

    auto last = DosDateTime::FromTm(MakeTm(2107, 12, 31, 23, 59, 58));
    EXPECT_EQ(last.date, 0xFF9F);
    EXPECT_EQ(last.time, 0xBF7D);
    EXPECT_EQ(DosDateTime::FromTm(MakeTm(2108, 1, 1)), last);
    EXPECT_EQ(DosDateTime::FromTm(MakeTm(3000, 6, 6, 6, 6, 6)), last);
}

TEST(DosTimeTest, FromUnixTimeUtc) {
    // 2001-09-09 01:46:40 UTC
    auto value = DosDateTime::FromUnixTime(1000000000, true);
    EXPECT_EQ(value, DosDateTime::FromTm(MakeTm(2001, 9, 9, 1, 46, 40)));
    EXPECT_EQ(DosDateTime::FromUnixTime(0, true), kDosEpoch);
}

int main(int argc, char** argv) {
    ::testing::InitGoogleTest(&argc, argv);
    return RUN_ALL_TESTS();
}
