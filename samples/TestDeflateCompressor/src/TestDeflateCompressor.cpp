#include "docpack/basic/log.h"
#include "docpack/compress/compress_error.hpp"
#include "docpack/compress/deflate_compressor.hpp"

#include <random>
#include <string>
#include <vector>
#include <zlib.h>

#include <gtest/gtest.h>

using namespace DocPack;

namespace
{
std::vector<std::uint8_t> RawInflate(const std::vector<std::uint8_t>& input, std::size_t expectedSize) {
    std::vector<std::uint8_t> out(expectedSize + 1);
    z_stream strm {};
    EXPECT_EQ(inflateInit2(&strm, -MAX_WBITS), Z_OK);
    strm.next_in   = const_cast<std::uint8_t*>(input.data());
    strm.avail_in  = static_cast<uInt>(input.size());
    strm.next_out  = out.data();
    strm.avail_out = static_cast<uInt>(out.size());
    EXPECT_EQ(inflate(&strm, Z_FINISH), Z_STREAM_END);
    out.resize(out.size() - strm.avail_out);
    inflateEnd(&strm);
    return out;
}

std::vector<std::uint8_t> SampleText(std::size_t size) {
    static const std::string kWords[] = { "archive", "entry", "header", "central", "directory", "deflate", "stored" };
    std::mt19937 engine(7);
    std::uniform_int_distribution<std::size_t> dist(0, 6);
    std::vector<std::uint8_t> ret;
    while (ret.size() < size) {
        const auto& word = kWords[dist(engine)];
        ret.insert(ret.end(), word.begin(), word.end());
        ret.push_back(' ');
    }
    ret.resize(size);
    return ret;
}
} // namespace

TEST(DeflateCompressorTest, EffortLevels) {
    EXPECT_EQ(ZlibDeflateCompressor::ZlibLevel(DeflateEffort::Fastest), 1);
    EXPECT_EQ(ZlibDeflateCompressor::ZlibLevel(DeflateEffort::Balanced), 6);
    EXPECT_EQ(ZlibDeflateCompressor::ZlibLevel(DeflateEffort::Best), 9);
    EXPECT_EQ(ToString(DeflateEffort::Balanced), "balanced");
}

TEST(DeflateCompressorTest, RawStreamInflates) {
    ZlibDeflateCompressor compressor;
    const auto input = SampleText(64 * 1024);
    for (auto effort : { DeflateEffort::Fastest, DeflateEffort::Balanced, DeflateEffort::Best }) {
        auto deflated = compressor.Compress(input, effort);
        EXPECT_LT(deflated.size(), input.size() / 2) << ToString(effort);
        // a zlib wrapper would start with 0x78
        ASSERT_FALSE(deflated.empty());
        EXPECT_NE(deflated[0], 0x78);
        EXPECT_EQ(RawInflate(deflated, input.size()), input) << ToString(effort);
    }
}

TEST(DeflateCompressorTest, BestIsNotLargerThanFastest) {
    ZlibDeflateCompressor compressor;
    const auto input = SampleText(200 * 1024);
    auto fastest     = compressor.Compress(input, DeflateEffort::Fastest);
    auto best        = compressor.Compress(input, DeflateEffort::Best);
    EXPECT_LE(best.size(), fastest.size());
}

TEST(DeflateCompressorTest, EmptyInput) {
    ZlibDeflateCompressor compressor;
    auto deflated = compressor.Compress(nullptr, 0, DeflateEffort::Balanced);
    // a single empty final block
    EXPECT_FALSE(deflated.empty());
    EXPECT_TRUE(RawInflate(deflated, 0).empty());
}

TEST(DeflateCompressorTest, IncompressibleInputGrows) {
    std::mt19937 engine(99);
    std::uniform_int_distribution<int> dist(0, 255);
    std::vector<std::uint8_t> input(8192);
    for (auto& c : input)
        c = static_cast<std::uint8_t>(dist(engine));
    auto deflated = DefaultDeflateCompressor()->Compress(input, DeflateEffort::Best);
    EXPECT_GE(deflated.size(), input.size());
    EXPECT_EQ(RawInflate(deflated, input.size()), input);
}

TEST(DeflateCompressorTest, SmallStreamChunks) {
    // input and output handed to zlib a few bytes at a time, as for entries past the 32-bit counters
    const auto text = SampleText(50 * 1024);
    for (std::size_t chunk : { 1u, 7u, 4096u }) {
        ZlibDeflateCompressor compressor(chunk);
        auto deflated = compressor.Compress(text, DeflateEffort::Balanced);
        EXPECT_LT(deflated.size(), text.size() / 2) << chunk;
        EXPECT_EQ(RawInflate(deflated, text.size()), text) << chunk;
    }
    std::mt19937 engine(5);
    std::uniform_int_distribution<int> dist(0, 255);
    std::vector<std::uint8_t> noise(3000);
    for (auto& c : noise)
        c = static_cast<std::uint8_t>(dist(engine));
    ZlibDeflateCompressor compressor(13);
    EXPECT_EQ(RawInflate(compressor.Compress(noise, DeflateEffort::Fastest), noise.size()), noise);
    EXPECT_TRUE(RawInflate(compressor.Compress(nullptr, 0, DeflateEffort::Best), 0).empty());
}

TEST(DeflateCompressorTest, ErrorCategory) {
    auto error = MakeCompressError(CompressErrorCode::DeflateFailed);
    EXPECT_STREQ(error.category().name(), "docpack.compress");
    EXPECT_FALSE(error.message().empty());
    EXPECT_FALSE(static_cast<bool>(MakeCompressError(CompressErrorCode::Success)));
    try {
        ThrowCompressError(CompressErrorCode::InitFailed, "deflateInit2 returned -4");
        FAIL() << "no exception";
    } catch (const std::system_error& e) {
        EXPECT_EQ(e.code(), MakeCompressError(CompressErrorCode::InitFailed));
        EXPECT_NE(std::string(e.what()).find("deflateInit2 returned -4"), std::string::npos);
    }
}

TEST(DeflateCompressorTest, DefaultInstanceIsShared) {
    auto first  = DefaultDeflateCompressor();
    auto second = DefaultDeflateCompressor();
    ASSERT_NE(first, nullptr);
    EXPECT_EQ(first.get(), second.get());
    EXPECT_NE(dynamic_cast<const ZlibDeflateCompressor*>(first.get()), nullptr);
}

int main(int argc, char** argv) {
    ::testing::InitGoogleTest(&argc, argv);
    return RUN_ALL_TESTS();
}
