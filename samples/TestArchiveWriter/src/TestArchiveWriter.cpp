#include "docpack/archive/archive_error.hpp"
#include "docpack/archive/archive_writer.hpp"
#include "docpack/archive/zip_format.hpp"
#include "docpack/basic/log.h"
#include "docpack/basic/utils.hpp"
#include "docpack/checksum/crc32.hpp"
#include "docpack/compress/compress_error.hpp"

#include <algorithm>
#include <cstring>
#include <memory>
#include <random>
#include <string>
#include <vector>
#include <zlib.h>

#include <gtest/gtest.h>

using namespace DocPack;

namespace
{
using Bytes = std::vector<std::uint8_t>;

std::uint16_t ReadU16(const Bytes& buf, std::size_t pos) {
    return static_cast<std::uint16_t>(buf.at(pos) | (buf.at(pos + 1) << 8));
}

std::uint32_t ReadU32(const Bytes& buf, std::size_t pos) {
    return static_cast<std::uint32_t>(ReadU16(buf, pos)) | (static_cast<std::uint32_t>(ReadU16(buf, pos + 2)) << 16);
}

struct EndRecord {
    std::uint16_t diskEntries;
    std::uint16_t totalEntries;
    std::uint32_t centralDirectorySize;
    std::uint32_t centralDirectoryOffset;
    std::uint16_t commentLength;
};

struct HeaderRecord {
    std::uint16_t versionMadeBy = 0;
    std::uint16_t versionNeeded;
    std::uint16_t flags;
    std::uint16_t method;
    std::uint16_t modTime;
    std::uint16_t modDate;
    std::uint32_t crc32;
    std::uint32_t compressedSize;
    std::uint32_t uncompressedSize;
    std::uint32_t externalAttributes = 0;
    std::uint32_t localOffset        = 0;
    std::string name;
    // local headers only
    std::size_t dataOffset = 0;
};

EndRecord ReadEnd(const Bytes& zip) {
    auto pos = zip.size() - ZipFormat::kEndOfCentralDirectorySize;
    EXPECT_EQ(ReadU32(zip, pos), ZipFormat::kEndOfCentralDirectorySignature);
    EXPECT_EQ(ReadU16(zip, pos + 4), 0);
    EXPECT_EQ(ReadU16(zip, pos + 6), 0);
    return EndRecord { ReadU16(zip, pos + 8), ReadU16(zip, pos + 10), ReadU32(zip, pos + 12), ReadU32(zip, pos + 16),
                       ReadU16(zip, pos + 20) };
}

std::vector<HeaderRecord> ReadCentralDirectory(const Bytes& zip) {
    auto end = ReadEnd(zip);
    std::vector<HeaderRecord> ret;
    std::size_t pos = end.centralDirectoryOffset;
    for (std::uint16_t i = 0; i < end.totalEntries; ++i) {
        EXPECT_EQ(ReadU32(zip, pos), ZipFormat::kCentralDirectorySignature);
        HeaderRecord record;
        record.versionMadeBy      = ReadU16(zip, pos + 4);
        record.versionNeeded      = ReadU16(zip, pos + 6);
        record.flags              = ReadU16(zip, pos + 8);
        record.method             = ReadU16(zip, pos + 10);
        record.modTime            = ReadU16(zip, pos + 12);
        record.modDate            = ReadU16(zip, pos + 14);
        record.crc32              = ReadU32(zip, pos + 16);
        record.compressedSize     = ReadU32(zip, pos + 20);
        record.uncompressedSize   = ReadU32(zip, pos + 24);
        auto nameLength           = ReadU16(zip, pos + 28);
        EXPECT_EQ(ReadU16(zip, pos + 30), 0);
        EXPECT_EQ(ReadU16(zip, pos + 32), 0);
        EXPECT_EQ(ReadU16(zip, pos + 34), 0);
        EXPECT_EQ(ReadU16(zip, pos + 36), 0);
        record.externalAttributes = ReadU32(zip, pos + 38);
        record.localOffset        = ReadU32(zip, pos + 42);
        record.name.assign(reinterpret_cast<const char*>(zip.data() + pos + 46), nameLength);
        ret.push_back(record);
        pos += ZipFormat::kCentralDirectoryHeaderSize + nameLength;
    }
    EXPECT_EQ(pos, end.centralDirectoryOffset + end.centralDirectorySize);
    return ret;
}

HeaderRecord ReadLocal(const Bytes& zip, std::size_t pos) {
    EXPECT_EQ(ReadU32(zip, pos), ZipFormat::kLocalFileHeaderSignature);
    HeaderRecord record;
    record.versionNeeded    = ReadU16(zip, pos + 4);
    record.flags            = ReadU16(zip, pos + 6);
    record.method           = ReadU16(zip, pos + 8);
    record.modTime          = ReadU16(zip, pos + 10);
    record.modDate          = ReadU16(zip, pos + 12);
    record.crc32            = ReadU32(zip, pos + 14);
    record.compressedSize   = ReadU32(zip, pos + 18);
    record.uncompressedSize = ReadU32(zip, pos + 22);
    auto nameLength         = ReadU16(zip, pos + 26);
    EXPECT_EQ(ReadU16(zip, pos + 28), 0);
    record.name.assign(reinterpret_cast<const char*>(zip.data() + pos + 30), nameLength);
    record.localOffset = static_cast<std::uint32_t>(pos);
    record.dataOffset  = pos + ZipFormat::kLocalFileHeaderSize + nameLength;
    return record;
}

Bytes Payload(const Bytes& zip, const HeaderRecord& local) {
    return Bytes(zip.begin() + local.dataOffset, zip.begin() + local.dataOffset + local.compressedSize);
}

Bytes RawInflate(const Bytes& input, std::size_t expectedSize) {
    Bytes out(expectedSize + 1);
    z_stream strm {};
    EXPECT_EQ(inflateInit2(&strm, -15), Z_OK);
    strm.next_in   = const_cast<std::uint8_t*>(input.data());
    strm.avail_in  = static_cast<uInt>(input.size());
    strm.next_out  = out.data();
    strm.avail_out = static_cast<uInt>(out.size());
    EXPECT_EQ(inflate(&strm, Z_FINISH), Z_STREAM_END);
    out.resize(out.size() - strm.avail_out);
    inflateEnd(&strm);
    return out;
}

Bytes RandomBytes(std::size_t size, std::uint32_t seed) {
    std::mt19937 engine(seed);
    std::uniform_int_distribution<int> dist(0, 255);
    Bytes ret(size);
    for (auto& c : ret)
        c = static_cast<std::uint8_t>(dist(engine));
    return ret;
}

std::string RepetitiveText(std::size_t size) {
    const std::string pattern = "<p>The quick brown fox jumps over the lazy dog.</p>\n";
    std::string ret;
    while (ret.size() < size)
        ret += pattern;
    ret.resize(size);
    return ret;
}

void ExpectArchiveError(const std::system_error& e, ArchiveErrorCode code) {
    EXPECT_EQ(&e.code().category(), &ArchiveErrorCategory());
    EXPECT_EQ(e.code().value(), static_cast<int>(code)) << e.what();
}

// shrinks every input by `delta` bytes (negative grows it), records the requested effort
class FixedSizeCompressor : public DeflateCompressor {
public:
    explicit FixedSizeCompressor(std::int64_t delta) : delta(delta) {
    }
    std::vector<std::uint8_t> Compress(const std::uint8_t*, std::size_t size, DeflateEffort effort) const override {
        lastEffort = effort;
        ++calls;
        return std::vector<std::uint8_t>(static_cast<std::size_t>(static_cast<std::int64_t>(size) - delta), 0x5A);
    }
    const std::int64_t delta;
    mutable DeflateEffort lastEffort = DeflateEffort::Fastest;
    mutable std::size_t calls        = 0;
};

class FailingCompressor : public DeflateCompressor {
public:
    explicit FailingCompressor(std::error_code code) : code(code) {
    }
    std::vector<std::uint8_t> Compress(const std::uint8_t*, std::size_t, DeflateEffort) const override {
        throw std::system_error(code, "deflateInit2 returned -4");
    }
    const std::error_code code;
};

void AddSampleEntries(ArchiveWriter& writer, std::size_t count) {
    for (std::size_t i = 0; i < count; ++i) {
        auto name = StringFormat("OEBPS/chapter{:03}.xhtml", i);
        if (i % 3 == 0)
            writer.Add(name, RandomBytes(200 + i * 7, static_cast<std::uint32_t>(i)));
        else
            writer.AddText(name, RepetitiveText(300 + i * 31), i % 5 != 0);
    }
}
} // namespace

TEST(ArchiveWriterTest, EmptyArchiveIsEndRecordOnly) {
    ArchiveWriter writer;
    auto zip = std::move(writer).Finalize();
    ASSERT_EQ(zip.size(), ZipFormat::kEndOfCentralDirectorySize);
    const Bytes signature { 0x50, 0x4B, 0x05, 0x06 };
    EXPECT_TRUE(std::equal(signature.begin(), signature.end(), zip.begin()));
    auto end = ReadEnd(zip);
    EXPECT_EQ(end.diskEntries, 0);
    EXPECT_EQ(end.totalEntries, 0);
    EXPECT_EQ(end.centralDirectorySize, 0u);
    EXPECT_EQ(end.centralDirectoryOffset, 0u);
    EXPECT_EQ(end.commentLength, 0);
}

TEST(ArchiveWriterTest, SingleStoredEntry) {
    ArchiveWriter writer;
    writer.AddText("hello.txt", "hello world", false);
    EXPECT_EQ(writer.EntryCount(), 1u);
    auto zip = std::move(writer).Finalize();

    const Bytes signature { 0x50, 0x4B, 0x03, 0x04 };
    ASSERT_GT(zip.size(), signature.size());
    EXPECT_TRUE(std::equal(signature.begin(), signature.end(), zip.begin()));
    EXPECT_EQ(ReadU16(zip, ZipFormat::kLocalHeaderMethodOffset), 0);
    EXPECT_EQ(zip.size(), 30u + 9 + 11 + 46 + 9 + 22);

    auto local = ReadLocal(zip, 0);
    EXPECT_EQ(local.versionNeeded, 10);
    EXPECT_EQ(local.flags, 0);
    EXPECT_EQ(local.name, "hello.txt");
    EXPECT_EQ(local.compressedSize, 11u);
    EXPECT_EQ(local.uncompressedSize, 11u);
    auto payload = Payload(zip, local);
    EXPECT_EQ(std::string(payload.begin(), payload.end()), "hello world");

    auto central = ReadCentralDirectory(zip);
    ASSERT_EQ(central.size(), 1u);
    EXPECT_EQ(central[0].versionMadeBy, 0x031E);
    EXPECT_EQ(central[0].externalAttributes, 0x81A40000u);
    EXPECT_EQ(central[0].localOffset, 0u);
}

TEST(ArchiveWriterTest, RepetitiveTextShrinks) {
    const auto text = RepetitiveText(1300);
    ArchiveWriter writer;
    writer.AddText("OEBPS/text.xhtml", text, true);
    auto zip = std::move(writer).Finalize();
    EXPECT_LT(zip.size(), 1300u);

    auto local = ReadLocal(zip, 0);
    EXPECT_EQ(local.method, static_cast<std::uint16_t>(CompressionMethod::Deflate));
    EXPECT_EQ(local.versionNeeded, 20);
    EXPECT_LT(local.compressedSize, local.uncompressedSize);
    auto inflated = RawInflate(Payload(zip, local), text.size());
    EXPECT_EQ(std::string(inflated.begin(), inflated.end()), text);
}

TEST(ArchiveWriterTest, IncompressibleFallsBackToStored) {
    const auto data = RandomBytes(4096, 21320);
    ArchiveWriter writer;
    writer.Add("image.jpg", data, true);
    auto zip = std::move(writer).Finalize();

    auto local = ReadLocal(zip, 0);
    EXPECT_EQ(local.method, static_cast<std::uint16_t>(CompressionMethod::Stored));
    EXPECT_EQ(local.versionNeeded, 10);
    EXPECT_EQ(local.compressedSize, local.uncompressedSize);
    EXPECT_EQ(Payload(zip, local), data);

    auto resolved = ResolveEntry(FileEntry { "image.jpg", data }, *DefaultDeflateCompressor(), DeflateEffort::Balanced);
    EXPECT_EQ(resolved.method, CompressionMethod::Stored);
    EXPECT_TRUE(resolved.deflatedData.empty());
    EXPECT_EQ(resolved.CompressedData(), resolved.uncompressedData);
}

TEST(ArchiveWriterTest, EqualSizeDeflateKeepsStored) {
    auto equal = std::make_shared<FixedSizeCompressor>(0);
    ArchiveOptions options;
    options.compressor = equal;
    ArchiveWriter writer(options);
    writer.AddText("tie.txt", "0123456789");
    auto zip = std::move(writer).Finalize();
    EXPECT_EQ(equal->calls, 1u);
    auto local = ReadLocal(zip, 0);
    EXPECT_EQ(local.method, static_cast<std::uint16_t>(CompressionMethod::Stored));
    auto payload = Payload(zip, local);
    EXPECT_EQ(std::string(payload.begin(), payload.end()), "0123456789");
}

TEST(ArchiveWriterTest, OneByteSmallerDeflateIsKept) {
    auto smaller = std::make_shared<FixedSizeCompressor>(1);
    ArchiveOptions options;
    options.compressor = smaller;
    options.effort     = DeflateEffort::Best;
    ArchiveWriter writer(options);
    writer.AddText("shrunk.txt", "0123456789");
    auto zip = std::move(writer).Finalize();
    EXPECT_EQ(smaller->lastEffort, DeflateEffort::Best);
    auto local = ReadLocal(zip, 0);
    EXPECT_EQ(local.method, static_cast<std::uint16_t>(CompressionMethod::Deflate));
    EXPECT_EQ(local.compressedSize, 9u);
    EXPECT_EQ(local.uncompressedSize, 10u);
    EXPECT_EQ(local.crc32, Crc32::Checksum(std::string("0123456789")));
}

TEST(ArchiveWriterTest, EmptyDataIsNeverCompressed) {
    auto counting = std::make_shared<FixedSizeCompressor>(-2);
    ArchiveOptions options;
    options.compressor = counting;
    ArchiveWriter writer(options);
    writer.Add("META-INF/", Bytes {}, true);
    auto zip = std::move(writer).Finalize();
    EXPECT_EQ(counting->calls, 0u);
    auto local = ReadLocal(zip, 0);
    EXPECT_EQ(local.method, 0);
    EXPECT_EQ(local.crc32, 0u);
    EXPECT_EQ(local.compressedSize, 0u);
    EXPECT_EQ(local.uncompressedSize, 0u);
}

TEST(ArchiveWriterTest, CentralDirectoryKeepsOrderAndOffsets) {
    const std::vector<std::string> names { "z-last-alphabetically", "a/first.xml", "m/middle.bin", "a/first.xml",
                                           "b/\xE7\xAB\xA0\xE8\x8A\x82.xhtml" };
    ArchiveWriter writer;
    for (std::size_t i = 0; i < names.size(); ++i) {
        if (i % 2 == 0)
            writer.AddText(names[i], RepetitiveText(100 * (i + 1)));
        else
            writer.Add(names[i], RandomBytes(64 * (i + 1), static_cast<std::uint32_t>(i)), false);
    }
    auto zip     = std::move(writer).Finalize();
    auto central = ReadCentralDirectory(zip);
    ASSERT_EQ(central.size(), names.size());
    std::uint32_t previousOffset = 0;
    for (std::size_t i = 0; i < names.size(); ++i) {
        EXPECT_EQ(central[i].name, names[i]);
        if (i > 0) EXPECT_GT(central[i].localOffset, previousOffset);
        previousOffset = central[i].localOffset;
        EXPECT_EQ(ReadU32(zip, central[i].localOffset), ZipFormat::kLocalFileHeaderSignature);
        auto local = ReadLocal(zip, central[i].localOffset);
        EXPECT_EQ(local.name, names[i]);
        // the next local header (or the central directory) starts right after the payload
        auto next = i + 1 < names.size() ? central[i + 1].localOffset : ReadEnd(zip).centralDirectoryOffset;
        EXPECT_EQ(local.dataOffset + local.compressedSize, next);
    }
}

TEST(ArchiveWriterTest, LocalAndCentralHeadersAgree) {
    ArchiveWriter writer;
    std::vector<Bytes> originals;
    for (std::size_t i = 0; i < 6; ++i) {
        Bytes data;
        if (i % 2 == 0) {
            auto text = RepetitiveText(500 + i * 100);
            data.assign(text.begin(), text.end());
        } else {
            data = RandomBytes(300 + i, static_cast<std::uint32_t>(100 + i));
        }
        originals.push_back(data);
        writer.Add(StringFormat("entry{}", i), data);
    }
    auto zip     = std::move(writer).Finalize();
    auto central = ReadCentralDirectory(zip);
    ASSERT_EQ(central.size(), originals.size());
    for (std::size_t i = 0; i < central.size(); ++i) {
        auto local = ReadLocal(zip, central[i].localOffset);
        EXPECT_EQ(local.versionNeeded, central[i].versionNeeded);
        EXPECT_EQ(local.method, central[i].method);
        EXPECT_EQ(local.modTime, central[i].modTime);
        EXPECT_EQ(local.modDate, central[i].modDate);
        EXPECT_EQ(local.crc32, central[i].crc32);
        EXPECT_EQ(local.compressedSize, central[i].compressedSize);
        EXPECT_EQ(local.uncompressedSize, central[i].uncompressedSize);
        EXPECT_EQ(local.uncompressedSize, originals[i].size());
        EXPECT_EQ(local.crc32, Crc32::Checksum(originals[i]));
        EXPECT_EQ(local.modTime, 0);
        EXPECT_EQ(local.modDate, 0x0021);

        auto payload = Payload(zip, local);
        if (local.method == static_cast<std::uint16_t>(CompressionMethod::Deflate)) {
            EXPECT_EQ(RawInflate(payload, local.uncompressedSize), originals[i]);
        } else {
            EXPECT_EQ(payload, originals[i]);
        }
    }
}

TEST(ArchiveWriterTest, MimetypeStaysFirst) {
    const std::string container =
        "<?xml version=\"1.0\"?>\n"
        "<container version=\"1.0\" xmlns=\"urn:oasis:names:tc:opendocument:xmlns:container\">\n"
        "  <rootfiles>\n"
        "    <rootfile full-path=\"OEBPS/content.opf\" media-type=\"application/oebps-package+xml\"/>\n"
        "  </rootfiles>\n"
        "</container>\n";
    ArchiveWriter writer;
    writer.AddText("mimetype", "application/epub+zip", false);
    writer.AddText("META-INF/container.xml", container, true);
    auto zip = std::move(writer).Finalize();

    EXPECT_EQ(ReadU16(zip, ZipFormat::kLocalHeaderMethodOffset), 0);
    auto first = ReadLocal(zip, 0);
    EXPECT_EQ(first.name, "mimetype");
    auto payload = Payload(zip, first);
    EXPECT_EQ(std::string(payload.begin(), payload.end()), "application/epub+zip");
    // the epub signature readers sniff for
    EXPECT_EQ(std::string(zip.begin() + 30, zip.begin() + 38), "mimetype");
    EXPECT_EQ(std::string(zip.begin() + 38, zip.begin() + 58), "application/epub+zip");

    auto central = ReadCentralDirectory(zip);
    ASSERT_EQ(central.size(), 2u);
    EXPECT_EQ(central[0].name, "mimetype");
    EXPECT_EQ(central[1].name, "META-INF/container.xml");
    EXPECT_EQ(central[1].method, static_cast<std::uint16_t>(CompressionMethod::Deflate));
}

TEST(ArchiveWriterTest, DuplicatePathsAreKept) {
    ArchiveWriter writer;
    writer.AddText("same.txt", "first", false);
    writer.AddText("same.txt", "second", false);
    auto zip     = std::move(writer).Finalize();
    auto central = ReadCentralDirectory(zip);
    ASSERT_EQ(central.size(), 2u);
    EXPECT_EQ(central[0].name, central[1].name);
    EXPECT_EQ(ReadLocal(zip, central[1].localOffset).uncompressedSize, 6u);
}

TEST(ArchiveWriterTest, ModificationTimeFromEntry) {
    std::tm tm {};
    tm.tm_year = 2024 - 1900;
    tm.tm_mon  = 2;
    tm.tm_mday = 15;
    tm.tm_hour = 13;
    tm.tm_min  = 45;
    tm.tm_sec  = 31;
    const auto stamp = DosDateTime::FromTm(tm);

    ArchiveWriter writer;
    FileEntry entry;
    entry.path        = "dated.txt";
    entry.data        = { 'x' };
    entry.compression = CompressionMethod::Stored;
    entry.modified    = stamp;
    writer.Add(std::move(entry));
    writer.AddText("undated.txt", "y");
    auto zip     = std::move(writer).Finalize();
    auto central = ReadCentralDirectory(zip);
    ASSERT_EQ(central.size(), 2u);
    EXPECT_EQ(central[0].modTime, stamp.time);
    EXPECT_EQ(central[0].modDate, stamp.date);
    EXPECT_EQ(ReadLocal(zip, 0).modDate, stamp.date);
    EXPECT_EQ(central[1].modTime, kDosEpoch.time);
    EXPECT_EQ(central[1].modDate, kDosEpoch.date);
}

TEST(ArchiveWriterTest, StreamingMatchesBuffered) {
    ArchiveWriter buffered;
    ArchiveWriter streaming;
    AddSampleEntries(buffered, 12);
    AddSampleEntries(streaming, 12);
    auto expected = std::move(buffered).Finalize();

    Bytes received;
    std::size_t chunks = 0;
    auto total         = std::move(streaming).FinalizeTo([&](const std::uint8_t* data, std::size_t size) {
        ++chunks;
        received.insert(received.end(), data, data + size);
    });
    EXPECT_EQ(total, expected.size());
    EXPECT_EQ(received, expected);
    // one flush per entry plus the directory
    EXPECT_EQ(chunks, 13u);
}

TEST(ArchiveWriterTest, ParallelResolveMatchesSequential) {
    ArchiveWriter sequential;
    ArchiveOptions options;
    options.parallelResolve  = true;
    options.resolveGroupSize = 3;
    ArchiveWriter parallel(options);
    AddSampleEntries(sequential, 40);
    AddSampleEntries(parallel, 40);
    auto expected = std::move(sequential).Finalize();
    auto actual   = std::move(parallel).Finalize();
    EXPECT_EQ(actual, expected);
    EXPECT_EQ(ReadEnd(actual).totalEntries, 40);
}

TEST(ArchiveWriterTest, FinalizedWriterRejectsUse) {
    ArchiveWriter writer;
    writer.AddText("a.txt", "a");
    auto zip = std::move(writer).Finalize();
    EXPECT_FALSE(zip.empty());
    EXPECT_TRUE(writer.IsFinalized());
    try {
        writer.AddText("b.txt", "b");
        FAIL() << "add after finalize";
    } catch (const std::system_error& e) {
        ExpectArchiveError(e, ArchiveErrorCode::ArchiveFinalized);
    }
    EXPECT_THROW((void)std::move(writer).Finalize(), std::system_error);
    EXPECT_THROW(std::move(writer).FinalizeTo([](const std::uint8_t*, std::size_t) {}), std::system_error);
}

TEST(ArchiveWriterTest, MovedFromWriterIsFinalized) {
    ArchiveWriter source;
    source.AddText("a.txt", "a");
    ArchiveWriter target(std::move(source));
    EXPECT_TRUE(source.IsFinalized());
    EXPECT_EQ(source.EntryCount(), 0u);
    EXPECT_EQ(target.EntryCount(), 1u);
    EXPECT_THROW(source.AddText("b.txt", "b"), std::system_error);

    ArchiveWriter assigned;
    assigned = std::move(target);
    EXPECT_TRUE(target.IsFinalized());
    EXPECT_FALSE(assigned.IsFinalized());
    auto zip = std::move(assigned).Finalize();
    EXPECT_EQ(ReadEnd(zip).totalEntries, 1);
}

TEST(ArchiveWriterTest, PathTooLongIsRejected) {
    ArchiveWriter writer;
    writer.AddText(std::string(ZipFormat::kMaxField16, 'p'), "fits");
    try {
        writer.AddText(std::string(ZipFormat::kMaxField16 + 1, 'p'), "too long");
        FAIL() << "path over 65535 bytes accepted";
    } catch (const std::system_error& e) {
        ExpectArchiveError(e, ArchiveErrorCode::PathTooLong);
    }
    EXPECT_EQ(writer.EntryCount(), 1u);
}

TEST(ArchiveWriterTest, TooManyEntriesIsRejected) {
    ArchiveWriter writer;
    for (std::size_t i = 0; i < ZipFormat::kMaxField16; ++i) {
        writer.Add(std::to_string(i), Bytes {}, false);
    }
    EXPECT_EQ(writer.EntryCount(), ZipFormat::kMaxField16);
    try {
        writer.Add("one-too-many", Bytes {}, false);
        FAIL() << "65536th entry accepted";
    } catch (const std::system_error& e) {
        ExpectArchiveError(e, ArchiveErrorCode::TooManyEntries);
    }
    auto zip = std::move(writer).Finalize();
    EXPECT_EQ(ReadEnd(zip).totalEntries, 0xFFFF);
}

TEST(ArchiveWriterTest, CompressFailurePropagates) {
    ArchiveOptions options;
    options.compressor = std::make_shared<FailingCompressor>(MakeCompressError(CompressErrorCode::InitFailed));
    ArchiveWriter writer(options);
    writer.AddText("OEBPS/a.xhtml", RepetitiveText(100));
    try {
        (void)std::move(writer).Finalize();
        FAIL() << "compressor failure swallowed";
    } catch (const std::system_error& e) {
        ExpectArchiveError(e, ArchiveErrorCode::CompressFailed);
        std::string what = e.what();
        EXPECT_NE(what.find("OEBPS/a.xhtml"), std::string::npos) << what;
        EXPECT_NE(what.find("deflateInit2 returned -4"), std::string::npos) << what;
    }
    EXPECT_TRUE(writer.IsFinalized());
}

TEST(ArchiveWriterTest, ForeignCompressorErrorsPassThrough) {
    ArchiveOptions options;
    options.compressor = std::make_shared<FailingCompressor>(std::make_error_code(std::errc::not_enough_memory));
    ArchiveWriter writer(options);
    writer.AddText("a.txt", RepetitiveText(100));
    try {
        (void)std::move(writer).Finalize();
        FAIL() << "compressor failure swallowed";
    } catch (const std::system_error& e) {
        EXPECT_EQ(e.code(), std::make_error_code(std::errc::not_enough_memory));
    }
}

TEST(ArchiveWriterTest, ErrorMessagesNameTheCondition) {
    auto error = MakeArchiveError(ArchiveErrorCode::PathTooLong);
    EXPECT_STREQ(error.category().name(), "docpack.archive");
    EXPECT_FALSE(error.message().empty());
    EXPECT_EQ(MakeArchiveError(ArchiveErrorCode::Success).value(), 0);
    try {
        ThrowArchiveError(ArchiveErrorCode::PathTooLong, "OEBPS/x");
        FAIL() << "no exception";
    } catch (const std::system_error& e) {
        ExpectArchiveError(e, ArchiveErrorCode::PathTooLong);
        EXPECT_NE(std::string(e.what()).find("OEBPS/x"), std::string::npos);
    }
}

int main(int argc, char** argv) {
    ::testing::InitGoogleTest(&argc, argv);
    return RUN_ALL_TESTS();
}
