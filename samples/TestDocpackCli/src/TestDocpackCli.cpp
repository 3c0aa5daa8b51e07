#include "pack_command.hpp"

#include "docpack/archive/zip_format.hpp"
#include "docpack/basic/filesystem_utils.hpp"
#include "docpack/compress/compress_error.hpp"

#include <unistd.h>

#include <chrono>
#include <filesystem>
#include <fstream>
#include <string>
#include <vector>

#include <gtest/gtest.h>

using namespace DocPack;
namespace stdfs = std::filesystem;

namespace
{
using Bytes = std::vector<std::uint8_t>;

std::uint16_t ReadU16(const Bytes& buf, std::size_t pos) {
    return static_cast<std::uint16_t>(buf.at(pos) | (buf.at(pos + 1) << 8));
}

std::uint32_t ReadU32(const Bytes& buf, std::size_t pos) {
    return static_cast<std::uint32_t>(ReadU16(buf, pos)) | (static_cast<std::uint32_t>(ReadU16(buf, pos + 2)) << 16);
}

struct ListedEntry {
    std::string name;
    std::uint16_t method;
    std::uint16_t modDate;
    std::uint32_t compressedSize;
    std::uint32_t uncompressedSize;
    std::uint32_t localOffset;
};

// central directory listing, in directory order
std::vector<ListedEntry> ListEntries(const Bytes& zip) {
    std::vector<ListedEntry> ret;
    if (zip.size() < ZipFormat::kEndOfCentralDirectorySize) {
        ADD_FAILURE() << "archive too short " << zip.size();
        return ret;
    }
    auto end = zip.size() - ZipFormat::kEndOfCentralDirectorySize;
    EXPECT_EQ(ReadU32(zip, end), ZipFormat::kEndOfCentralDirectorySignature);
    auto count      = ReadU16(zip, end + 10);
    std::size_t pos = ReadU32(zip, end + 16);
    for (std::uint16_t i = 0; i < count; ++i) {
        EXPECT_EQ(ReadU32(zip, pos), ZipFormat::kCentralDirectorySignature);
        ListedEntry entry;
        entry.method           = ReadU16(zip, pos + 10);
        entry.modDate          = ReadU16(zip, pos + 14);
        entry.compressedSize   = ReadU32(zip, pos + 20);
        entry.uncompressedSize = ReadU32(zip, pos + 24);
        auto nameLength        = ReadU16(zip, pos + 28);
        entry.localOffset      = ReadU32(zip, pos + 42);
        entry.name.assign(reinterpret_cast<const char*>(zip.data() + pos + 46), nameLength);
        ret.push_back(entry);
        pos += ZipFormat::kCentralDirectoryHeaderSize + nameLength;
    }
    return ret;
}

std::string RepetitiveText(std::size_t size) {
    const std::string pattern = "<p>It was a bright cold day in April.</p>\n";
    std::string ret;
    while (ret.size() < size)
        ret += pattern;
    ret.resize(size);
    return ret;
}

class ThrowingCompressor : public DeflateCompressor {
public:
    std::vector<std::uint8_t> Compress(const std::uint8_t*, std::size_t, DeflateEffort) const override {
        ThrowCompressError(CompressErrorCode::InitFailed, "deflateInit2 returned -4");
    }
};

class DocpackCliTest : public ::testing::Test {
protected:
    void SetUp() override {
        root = stdfs::temp_directory_path() /
               ("docpack_cli_" + std::to_string(::getpid()) + "_" +
                ::testing::UnitTest::GetInstance()->current_test_info()->name());
        stdfs::remove_all(root);
        stdfs::create_directories(root / "book" / "OEBPS");
        book   = (root / "book").string();
        output = (root / "book.epub").string();
        WriteText("book/mimetype", "text/plain");
        WriteText("book/OEBPS/content.opf", RepetitiveText(4000));
        WriteText("book/OEBPS/chapter1.xhtml", RepetitiveText(9000));
        WriteText("book/cover.txt", RepetitiveText(2000));
    }
    void TearDown() override {
        std::error_code ec;
        stdfs::remove_all(root, ec);
    }

    void WriteText(const std::string& relative, const std::string& content) {
        std::ofstream file(root / relative, std::ios::binary | std::ios::trunc);
        file << content;
    }

    int Pack(std::vector<std::string> args, std::shared_ptr<const DeflateCompressor> compressor = nullptr) {
        args.insert(args.begin(), "docpack");
        args.insert(args.begin() + 1, "--log-level=6");
        std::vector<char*> argv;
        for (auto& arg : args)
            argv.push_back(arg.data());
        argv.push_back(nullptr);
        return PackCommand::Run(static_cast<int>(args.size()), argv.data(), std::move(compressor));
    }

    Bytes ReadOutput() const {
        Bytes ret;
        EXPECT_TRUE(fs::ReadFile(output, ret)) << output;
        return ret;
    }

    stdfs::path root;
    std::string book;
    std::string output;
};
} // namespace

TEST_F(DocpackCliTest, PacksDirectoryInPathOrder) {
    ASSERT_EQ(Pack({ "-o", output, "-C", book, book }), PackCommand::kExitSuccess);
    auto entries = ListEntries(ReadOutput());
    ASSERT_EQ(entries.size(), 4u);
    EXPECT_EQ(entries[0].name, "OEBPS/chapter1.xhtml");
    EXPECT_EQ(entries[1].name, "OEBPS/content.opf");
    EXPECT_EQ(entries[2].name, "cover.txt");
    EXPECT_EQ(entries[3].name, "mimetype");
    EXPECT_EQ(entries[0].localOffset, 0u);
    EXPECT_EQ(entries[0].method, 8);
    EXPECT_LT(entries[0].compressedSize, entries[0].uncompressedSize);
    // without --mtime every entry carries the DOS epoch
    for (const auto& entry : entries)
        EXPECT_EQ(entry.modDate, 0x0021) << entry.name;
}

TEST_F(DocpackCliTest, MimetypeIsFirstAndStored) {
    ASSERT_EQ(Pack({ "--output", output, "--base", book, "--mimetype", "application/epub+zip", book }),
              PackCommand::kExitSuccess);
    auto zip     = ReadOutput();
    auto entries = ListEntries(zip);
    // the input file named mimetype is replaced, not added twice
    ASSERT_EQ(entries.size(), 4u);
    EXPECT_EQ(entries[0].name, "mimetype");
    EXPECT_EQ(entries[0].method, 0);
    EXPECT_EQ(entries[0].localOffset, 0u);
    const std::string expected = "mimetypeapplication/epub+zip";
    ASSERT_GE(zip.size(), ZipFormat::kLocalFileHeaderSize + expected.size());
    EXPECT_EQ(std::string(reinterpret_cast<const char*>(zip.data()) + ZipFormat::kLocalFileHeaderSize,
                          expected.size()),
              expected);
    EXPECT_EQ(entries[3].name, "cover.txt");
}

TEST_F(DocpackCliTest, StoreForcesStored) {
    ASSERT_EQ(Pack({ "-o", output, "-C", book, "-s", "cover.txt", "--store", "OEBPS/content.opf", book }),
              PackCommand::kExitSuccess);
    for (const auto& entry : ListEntries(ReadOutput())) {
        if (entry.name == "cover.txt" || entry.name == "OEBPS/content.opf") {
            EXPECT_EQ(entry.method, 0) << entry.name;
            EXPECT_EQ(entry.compressedSize, entry.uncompressedSize) << entry.name;
        } else if (entry.name == "OEBPS/chapter1.xhtml") {
            EXPECT_EQ(entry.method, 8);
        }
    }
}

TEST_F(DocpackCliTest, ParallelAndLevelsMatchPlainOutput) {
    ASSERT_EQ(Pack({ "-o", output, "-C", book, book }), PackCommand::kExitSuccess);
    auto plain = ReadOutput();
    ASSERT_EQ(Pack({ "-o", output, "-C", book, "-p", book }), PackCommand::kExitSuccess);
    EXPECT_EQ(ReadOutput(), plain);
    ASSERT_EQ(Pack({ "-o", output, "-C", book, "--level", "BEST", book }), PackCommand::kExitSuccess);
    EXPECT_EQ(ListEntries(ReadOutput()).size(), 4u);
}

TEST_F(DocpackCliTest, MtimeStampsEntries) {
    auto stamp = stdfs::file_time_type::clock::now() - std::chrono::hours(24 * 30);
    stdfs::last_write_time(root / "book" / "cover.txt", stamp);
    ASSERT_EQ(Pack({ "-o", output, "-C", book, "--mtime", (root / "book" / "cover.txt").string() }),
              PackCommand::kExitSuccess);
    auto entries = ListEntries(ReadOutput());
    ASSERT_EQ(entries.size(), 1u);
    EXPECT_EQ(entries[0].name, "cover.txt");
    EXPECT_NE(entries[0].modDate, 0x0021);
    // years since 1980 sit in the top seven bits
    EXPECT_GT(entries[0].modDate >> 9, 40);
}

TEST_F(DocpackCliTest, UsageErrors) {
    EXPECT_EQ(Pack({ "-C", book, book }), PackCommand::kExitUsageError);
    EXPECT_EQ(Pack({ "-o", output }), PackCommand::kExitUsageError);
    EXPECT_EQ(Pack({ "-o", output, "--level", "fast", book }), PackCommand::kExitUsageError);
    EXPECT_EQ(Pack({ "-o", output, "--log-level", "9", book }), PackCommand::kExitUsageError);
    EXPECT_EQ(Pack({ "-o", output, "--no-such-option", book }), PackCommand::kExitUsageError);
    EXPECT_EQ(Pack({ book, "-o" }), PackCommand::kExitUsageError);
    EXPECT_FALSE(stdfs::exists(output));
    EXPECT_EQ(Pack({ "--help" }), PackCommand::kExitSuccess);
    EXPECT_EQ(Pack({ "-v" }), PackCommand::kExitSuccess);
    EXPECT_FALSE(stdfs::exists(output));
}

TEST_F(DocpackCliTest, PackErrors) {
    EXPECT_EQ(Pack({ "-o", output, "-C", book, (root / "missing").string() }), PackCommand::kExitPackError);
    // inputs must sit below the base directory
    EXPECT_EQ(Pack({ "-o", output, "-C", (root / "book" / "OEBPS").string(), book }), PackCommand::kExitPackError);
    EXPECT_EQ(Pack({ "-o", (root / "no" / "dir" / "book.epub").string(), "-C", book, book }),
              PackCommand::kExitPackError);
    EXPECT_FALSE(stdfs::exists(output));
}

TEST_F(DocpackCliTest, FailedPackRemovesPartialOutput) {
    WriteText("book.epub", "stale archive");
    ASSERT_TRUE(stdfs::exists(output));
    EXPECT_EQ(Pack({ "-o", output, "-C", book, book }, std::make_shared<ThrowingCompressor>()),
              PackCommand::kExitPackError);
    EXPECT_FALSE(stdfs::exists(output));
}

TEST_F(DocpackCliTest, EarlyFailureKeepsExistingOutput) {
    WriteText("book.epub", "previous archive");
    EXPECT_EQ(Pack({ "-o", output, "-C", book, (root / "missing").string() }), PackCommand::kExitPackError);
    std::string kept;
    ASSERT_TRUE(fs::ReadFile(output, kept));
    EXPECT_EQ(kept, "previous archive");
}

int main(int argc, char** argv) {
    ::testing::InitGoogleTest(&argc, argv);
    return RUN_ALL_TESTS();
}
