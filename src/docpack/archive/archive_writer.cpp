#include "archive_writer.hpp"

#include "archive_error.hpp"
#include "zip_format.hpp"

#include "docpack/basic/log.h"
#include "docpack/basic/parallel.hpp"

#include <utility>

namespace DocPack
{
ArchiveWriter::ArchiveWriter(ArchiveOptions options) : m_options(std::move(options)) {
    if (!m_options.compressor) m_options.compressor = DefaultDeflateCompressor();
}

ArchiveWriter::ArchiveWriter(ArchiveWriter&& other) noexcept :
m_options(std::move(other.m_options)), m_entries(std::move(other.m_entries)), m_finalized(other.m_finalized) {
    other.m_entries.clear();
    other.m_finalized = true;
}

ArchiveWriter& ArchiveWriter::operator=(ArchiveWriter&& other) noexcept {
    if (this != &other) {
        m_options   = std::move(other.m_options);
        m_entries   = std::move(other.m_entries);
        m_finalized = other.m_finalized;
        other.m_entries.clear();
        other.m_finalized = true;
    }
    return *this;
}

void ArchiveWriter::Add(std::string path, std::vector<std::uint8_t> data, bool compress) {
    FileEntry entry;
    entry.path        = std::move(path);
    entry.data        = std::move(data);
    entry.compression = compress ? CompressionMethod::Deflate : CompressionMethod::Stored;
    Add(std::move(entry));
}

void ArchiveWriter::Add(std::string path, const void* data, std::size_t size, bool compress) {
    auto ptr = static_cast<const std::uint8_t*>(data);
    Add(std::move(path), std::vector<std::uint8_t>(ptr, ptr + size), compress);
}

void ArchiveWriter::AddText(std::string path, std::string_view content, bool compress) {
    Add(std::move(path), content.data(), content.size(), compress);
}

void ArchiveWriter::Add(FileEntry entry) {
    CheckNotFinalized();
    if (entry.path.size() > ZipFormat::kMaxField16) {
        DPWARN("reject entry, path length {}", entry.path.size());
        ThrowArchiveError(ArchiveErrorCode::PathTooLong, entry.path.substr(0, 64));
    }
    if (entry.data.size() > ZipFormat::kMaxField32) {
        DPWARN("reject entry {}, size {}", entry.path, entry.data.size());
        ThrowArchiveError(ArchiveErrorCode::EntryTooLarge, entry.path);
    }
    if (m_entries.size() >= ZipFormat::kMaxField16) {
        DPWARN("reject entry {}, archive already holds {} entries", entry.path, m_entries.size());
        ThrowArchiveError(ArchiveErrorCode::TooManyEntries, entry.path);
    }
    m_entries.emplace_back(std::move(entry));
}

std::vector<std::uint8_t> ArchiveWriter::Finalize() && {
    CheckNotFinalized();
    m_finalized  = true;
    auto entries = ResolveEntries();
    auto total   = PlanLayout(entries);
    RecordWriter writer;
    writer.Reserve(static_cast<std::size_t>(total));
    WriteArchive(writer, entries);
    return writer.TakeCache();
}

std::uint64_t ArchiveWriter::FinalizeTo(const ArchiveWriteFunction& writeFunc) && {
    CheckNotFinalized();
    m_finalized  = true;
    auto entries = ResolveEntries();
    PlanLayout(entries);
    RecordWriter writer(writeFunc);
    WriteArchive(writer, entries);
    return writer.Offset();
}

void ArchiveWriter::CheckNotFinalized() const {
    if (m_finalized) ThrowArchiveError(ArchiveErrorCode::ArchiveFinalized);
}

std::vector<ResolvedEntry> ArchiveWriter::ResolveEntries() {
    std::vector<ResolvedEntry> resolved(m_entries.size());
    const auto& compressor = *m_options.compressor;
    const auto effort      = m_options.effort;
    auto resolve_group     = [&](std::size_t begin, std::size_t count, std::size_t /*groupIndex*/) {
        for (auto i = begin; i < begin + count; ++i) {
            resolved[i] = ResolveEntry(std::move(m_entries[i]), compressor, effort);
        }
    };
    if (m_options.parallelResolve && m_entries.size() > 1) {
        ParallelRun(static_cast<std::size_t>(0), m_entries.size(), resolve_group, m_options.resolveGroupSize);
    } else {
        resolve_group(0, m_entries.size(), 0);
    }
    m_entries.clear();
    return resolved;
}

std::uint64_t ArchiveWriter::PlanLayout(const std::vector<ResolvedEntry>& entries) const {
    std::uint64_t offset = 0;
    std::uint64_t cdSize = 0;
    for (const auto& entry : entries) {
        if (entry.CompressedData().size() > ZipFormat::kMaxField32) {
            DPWARN("{} compressed size {} overflows", entry.path, entry.CompressedData().size());
            ThrowArchiveError(ArchiveErrorCode::EntryTooLarge, entry.path);
        }
        if (offset > ZipFormat::kMaxField32) {
            DPWARN("local header of {} would start at {}", entry.path, offset);
            ThrowArchiveError(ArchiveErrorCode::ArchiveTooLarge, entry.path);
        }
        offset += ZipFormat::kLocalFileHeaderSize + entry.path.size() + entry.CompressedData().size();
        cdSize += ZipFormat::kCentralDirectoryHeaderSize + entry.path.size();
    }
    if (offset > ZipFormat::kMaxField32 || cdSize > ZipFormat::kMaxField32) {
        DPWARN("central directory at {} with {} bytes overflows", offset, cdSize);
        ThrowArchiveError(ArchiveErrorCode::ArchiveTooLarge,
                          StringFormat("central directory offset {} size {}", offset, cdSize));
    }
    return offset + cdSize + ZipFormat::kEndOfCentralDirectorySize;
}

void ArchiveWriter::WriteArchive(RecordWriter& writer, const std::vector<ResolvedEntry>& entries) {
    std::vector<std::uint32_t> offsets;
    offsets.reserve(entries.size());
    // local file headers, each followed by its data
    for (const auto& entry : entries) {
        offsets.push_back(static_cast<std::uint32_t>(writer.Offset()));
        WriteLocalFileHeader(writer, entry);
        const auto& payload = entry.CompressedData();
        writer.Write(payload.data(), payload.size());
        writer.Flush();
    }
    const auto centralDirectoryOffset = writer.Offset();
    for (std::size_t i = 0; i < entries.size(); ++i) {
        WriteCentralDirectoryHeader(writer, entries[i], offsets[i]);
    }
    const auto centralDirectorySize = writer.Offset() - centralDirectoryOffset;
    WriteEndOfCentralDirectory(writer, static_cast<std::uint16_t>(entries.size()),
                               static_cast<std::uint32_t>(centralDirectorySize),
                               static_cast<std::uint32_t>(centralDirectoryOffset));
    writer.Flush();
    DPDEBUG("archive with {} entries, central directory {}@{}, {} bytes", entries.size(), centralDirectorySize,
            centralDirectoryOffset, writer.Offset());
}

void ArchiveWriter::WriteLocalFileHeader(RecordWriter& writer, const ResolvedEntry& entry) {
    writer.Write(ZipFormat::kLocalFileHeaderSignature); // 4
    // version needed to extract
    writer.Write(VersionNeededToExtract(entry.method)); // 6
    writer.Write(ZipFormat::kGeneralPurposeFlags);     // 8
    writer.Write(static_cast<std::uint16_t>(entry.method)); // 10
    writer.Write(entry.modTime);                            // 12
    writer.Write(entry.modDate);                            // 14
    // crc32 for uncompress data
    writer.Write(entry.crc32); // 18
    writer.Write(static_cast<std::uint32_t>(entry.CompressedData().size()));   // 22
    writer.Write(static_cast<std::uint32_t>(entry.uncompressedData.size())); // 26
    writer.Write(static_cast<std::uint16_t>(entry.path.size()));               // 28
    // extra field length
    writer.Write(static_cast<std::uint16_t>(0)); // 30
    writer.Write(entry.path);
}

void ArchiveWriter::WriteCentralDirectoryHeader(RecordWriter& writer,
                                                const ResolvedEntry& entry,
                                                std::uint32_t localOffset) {
    writer.Write(ZipFormat::kCentralDirectorySignature);
    writer.Write(ZipFormat::kVersionMadeBy);
    writer.Write(VersionNeededToExtract(entry.method));
    writer.Write(ZipFormat::kGeneralPurposeFlags);
    writer.Write(static_cast<std::uint16_t>(entry.method));
    writer.Write(entry.modTime);
    writer.Write(entry.modDate);
    writer.Write(entry.crc32);
    writer.Write(static_cast<std::uint32_t>(entry.CompressedData().size()));
    writer.Write(static_cast<std::uint32_t>(entry.uncompressedData.size()));
    writer.Write(static_cast<std::uint16_t>(entry.path.size()));
    // extra field, comment, disk number start, internal attributes
    writer.Write(static_cast<std::uint16_t>(0));
    writer.Write(static_cast<std::uint16_t>(0));
    writer.Write(static_cast<std::uint16_t>(0));
    writer.Write(static_cast<std::uint16_t>(0));
    writer.Write(ZipFormat::kExternalFileAttributes);
    writer.Write(localOffset);
    writer.Write(entry.path);
}

void ArchiveWriter::WriteEndOfCentralDirectory(RecordWriter& writer,
                                               std::uint16_t entryCount,
                                               std::uint32_t centralDirectorySize,
                                               std::uint32_t centralDirectoryOffset) {
    writer.Write(ZipFormat::kEndOfCentralDirectorySignature);
    // this disk, disk with the central directory
    writer.Write(static_cast<std::uint16_t>(0));
    writer.Write(static_cast<std::uint16_t>(0));
    // single volume, both counts are the same
    writer.Write(entryCount);
    writer.Write(entryCount);
    writer.Write(centralDirectorySize);
    writer.Write(centralDirectoryOffset);
    // archive comment length
    writer.Write(static_cast<std::uint16_t>(0));
}
} // namespace DocPack
