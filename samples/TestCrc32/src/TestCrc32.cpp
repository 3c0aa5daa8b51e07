#include "docpack/basic/utils.hpp"
#include "docpack/checksum/crc32.hpp"

#include <string>
#include <vector>
#include <zlib.h>

#include <gtest/gtest.h>

using namespace DocPack;

TEST(Crc32Test, CheckValue) {
    const std::string input = "123456789";
    EXPECT_EQ(Crc32::Checksum(input.data(), input.size()), 0xCBF43926u);
    EXPECT_EQ(Crc32::Checksum(input), 0xCBF43926u);
}

TEST(Crc32Test, EmptyInput) {
    EXPECT_EQ(Crc32::Checksum(nullptr, 0), 0u);
    EXPECT_EQ(Crc32::Checksum(std::string()), 0u);
    Crc32 crc;
    EXPECT_EQ(crc.Value(), 0u);
}

TEST(Crc32Test, KnownVectors) {
    EXPECT_EQ(Crc32::Checksum(std::string("a")), 0xE8B7BE43u);
    EXPECT_EQ(Crc32::Checksum(std::string("The quick brown fox jumps over the lazy dog")), 0x414FA339u);
    EXPECT_EQ(Crc32::Checksum(std::vector<std::uint8_t>(32, 0)), 0x190A55ADu);
    EXPECT_EQ(Crc32::Checksum(std::vector<std::uint8_t>(32, 0xFF)), 0xFF6CAB0Bu);
}

TEST(Crc32Test, TableEntries) {
    const auto& table = Crc32::Table();
    EXPECT_EQ(table[0], 0u);
    EXPECT_EQ(table[1], 0x77073096u);
    EXPECT_EQ(table[128], 0xEDB88320u);
    EXPECT_EQ(table[255], 0x2D02EF8Du);
    EXPECT_EQ(&table, &Crc32::Table());
    EXPECT_EQ(GenerateCrc32Table(Crc32::kPolynomial), table);
}

TEST(Crc32Test, StreamingMatchesOneShot) {
    std::string input;
    for (int i = 0; i < 1000; ++i)
        input.push_back(static_cast<char>((i * 131 + 7) & 0xFF));
    const auto expected = Crc32::Checksum(input);
    for (std::size_t split : { std::size_t(0), std::size_t(1), std::size_t(7), std::size_t(500), input.size() }) {
        Crc32 crc;
        crc.Update(input.data(), split).Update(input.data() + split, input.size() - split);
        EXPECT_EQ(crc.Value(), expected) << "split at " << split;
    }
    Crc32 bytewise;
    for (char c : input)
        bytewise.Update(&c, 1);
    EXPECT_EQ(bytewise.Value(), expected);

    bytewise.Reset();
    bytewise.Update(std::string("123456789"));
    EXPECT_EQ(bytewise.Value(), 0xCBF43926u);
}

TEST(Crc32Test, AgreesWithZlib) {
    std::vector<std::uint8_t> data(4099);
    for (std::size_t i = 0; i < data.size(); ++i)
        data[i] = static_cast<std::uint8_t>(i ^ (i >> 3));
    auto expected = ::crc32(0L, Z_NULL, 0);
    expected      = ::crc32(expected, data.data(), static_cast<uInt>(data.size()));
    EXPECT_EQ(Crc32::Checksum(data), static_cast<check_sum_t>(expected)) << Utils::BufferToHex(data.data(), 16);
}

int main(int argc, char** argv) {
    ::testing::InitGoogleTest(&argc, argv);
    return RUN_ALL_TESTS();
}
