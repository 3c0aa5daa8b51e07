#include "docpack/basic/endian_utils.hpp"
#include "docpack/basic/log.h"
#include "docpack/basic/utils.hpp"

#include <mutex>
#include <string>
#include <vector>

#include <gtest/gtest.h>

using namespace DocPack;

TEST(BasicTest, EndianConvert) {
    std::uint32_t value = 0x11223344;
    auto little         = host_value_convert<std::uint32_t, Endian::LittleEndian>(value);
    auto bytes          = reinterpret_cast<const std::uint8_t*>(&little);
    EXPECT_EQ(bytes[0], 0x44);
    EXPECT_EQ(bytes[3], 0x11);
    auto big  = host_value_convert<std::uint16_t, Endian::BigEndian>(0xABCD);
    auto back = host_value_convert<std::uint16_t, Endian::BigEndian>(big);
    EXPECT_EQ(back, 0xABCD);
    EXPECT_EQ(reinterpret_cast<const std::uint8_t*>(&big)[0], 0xAB);
    static_assert(bswap_internal<std::uint16_t>(0x1234) == 0x3412);
    static_assert(bswap_internal<std::uint32_t>(0x12345678u) == 0x78563412u);
    static_assert(host_value_convert<std::uint8_t, Endian::BigEndian>(0x7F) == 0x7F);
}

TEST(BasicTest, BufferToHex) {
    const std::vector<std::uint8_t> data { 0x50, 0x4B, 0x03, 0x04, 0xFF };
    EXPECT_EQ(Utils::BufferToHex(data), "504b0304ff");
    EXPECT_EQ(Utils::BufferToHex(data, 0, ' '), "50 4b 03 04 ff");
    EXPECT_EQ(Utils::BufferToHex(data, 2), "504b\n0304\nff");
    EXPECT_EQ(Utils::BufferToHex(nullptr, 0), "");
}

TEST(BasicTest, FormatByteSize) {
    EXPECT_EQ(Utils::FormatByteSize(0), "0B");
    EXPECT_EQ(Utils::FormatByteSize(1023), "1023B");
    EXPECT_EQ(Utils::FormatByteSize(1536), "1.50KiB");
    EXPECT_EQ(Utils::FormatByteSize(5ull * 1024 * 1024 * 1024), "5.00GiB");
}

TEST(BasicTest, LoggerCatchHandler) {
    std::mutex mutex;
    std::vector<std::pair<LogLevel, std::string>> caught;
    Logger logger;
    Logger::LoggerInitOptions options;
    options.loggerName          = "test";
    options.enableConsoleOutput = false;
    options.minimumLevel        = LogLevel::info;
    options.logFormat           = "%v";
    options.catchHandler        = [&](LogLevel level, const char* str, std::size_t size) {
        std::scoped_lock<std::mutex> locker(mutex);
        caught.emplace_back(level, std::string(str, size));
    };
    Logger::Initialize(options, &logger);
    EXPECT_TRUE(logger.ShouldLog(LogLevel::warn));
    EXPECT_FALSE(logger.ShouldLog(LogLevel::debug));

    DPINFO_I(&logger, "packed {} entries", 3);
    DPLOG(&logger, LogLevel::debug, "filtered {}", 1);
    DPWARN_I(&logger, "plain warning");
    LoggerStream(&logger, LogLevel::err, "archive.cpp", "Finalize", 42).stream() << "stream " << 7;
    Logger::Release(&logger);

    ASSERT_EQ(caught.size(), 3u);
    EXPECT_EQ(caught[0].first, LogLevel::info);
    EXPECT_NE(caught[0].second.find("packed 3 entries"), std::string::npos);
    EXPECT_EQ(caught[1].first, LogLevel::warn);
    EXPECT_NE(caught[1].second.find("[TestBasic.cpp:"), std::string::npos) << caught[1].second;
    EXPECT_NE(caught[1].second.find("plain warning"), std::string::npos);
    EXPECT_EQ(caught[2].first, LogLevel::err);
    EXPECT_NE(caught[2].second.find("[archive.cpp:Finalize(42)] stream 7"), std::string::npos) << caught[2].second;
}

TEST(BasicTest, StringFormat) {
    EXPECT_EQ(StringFormat(), "");
    EXPECT_EQ(StringFormat("no args"), "no args");
    EXPECT_EQ(StringFormat("{}@{:#x}", "cd", 0x2A), "cd@0x2a");
    EXPECT_STREQ(details::ShortFileName("/a/b/archive_writer.cpp"), "archive_writer.cpp");
}

int main(int argc, char** argv) {
    ::testing::InitGoogleTest(&argc, argv);
    return RUN_ALL_TESTS();
}
