//
// ISO/IEC 21320-1 document container writer: the zip subset used by EPUB, ODF and OOXML
// (stored or deflate only, no encryption, no signatures, single volume, no zip64)
//
#pragma once
#include "entry_resolver.hpp"
#include "file_entry.hpp"
#include "record_writer.hpp"

#include "docpack/basic/utils.hpp"
#include "docpack/compress/deflate_compressor.hpp"

#include <cstdint>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

namespace DocPack
{
struct ArchiveOptions {
    constexpr static std::size_t kDefaultResolveGroupSize = 8;
    DeflateEffort effort = DeflateEffort::Balanced;
    // null selects DefaultDeflateCompressor()
    std::shared_ptr<const DeflateCompressor> compressor = nullptr;
    // crc and deflate of different entries run concurrently, the output is unchanged
    bool parallelResolve = false;
    // entries handled by one parallel task
    std::size_t resolveGroupSize = kDefaultResolveGroupSize;
};

/// Collects entries and assembles the archive on finalize.
///
/// Entries appear in the output in insertion order; nothing is reordered or deduplicated,
/// so formats that need a leading "mimetype" entry must add it first.
/// Add only stores the entry, all crc/deflate/serialization work happens in Finalize,
/// which consumes the writer:
/// @code
/// DocPack::ArchiveWriter writer;
/// writer.AddText("mimetype", "application/epub+zip", false);
/// writer.AddText("META-INF/container.xml", container_xml);
/// auto bytes = std::move(writer).Finalize();
/// @endcode
/// Using a finalized (or moved from) writer throws ArchiveErrorCode::ArchiveFinalized.
class ArchiveWriter : NonCopyable {
public:
    explicit ArchiveWriter(ArchiveOptions options = {});
    ~ArchiveWriter() = default;
    // the moved from writer counts as finalized
    ArchiveWriter(ArchiveWriter&& other) noexcept;
    ArchiveWriter& operator=(ArchiveWriter&& other) noexcept;

    // compress: deflate the entry if that makes it smaller
    void Add(std::string path, std::vector<std::uint8_t> data, bool compress = true);
    void Add(std::string path, const void* data, std::size_t size, bool compress = true);
    // utf-8 text content
    void AddText(std::string path, std::string_view content, bool compress = true);
    void Add(FileEntry entry);

    std::size_t EntryCount() const {
        return m_entries.size();
    }
    bool IsFinalized() const {
        return m_finalized;
    }

    // returns the complete archive
    [[nodiscard]] std::vector<std::uint8_t> Finalize() &&;
    // streams the archive record by record to writeFunc, returns the number of bytes written
    std::uint64_t FinalizeTo(const ArchiveWriteFunction& writeFunc) &&;

private:
    void CheckNotFinalized() const;
    std::vector<ResolvedEntry> ResolveEntries();
    // total output size, throws when a zip32 field would overflow
    std::uint64_t PlanLayout(const std::vector<ResolvedEntry>& entries) const;
    void WriteArchive(RecordWriter& writer, const std::vector<ResolvedEntry>& entries);
    void WriteLocalFileHeader(RecordWriter& writer, const ResolvedEntry& entry);
    void WriteCentralDirectoryHeader(RecordWriter& writer, const ResolvedEntry& entry, std::uint32_t localOffset);
    void WriteEndOfCentralDirectory(RecordWriter& writer,
                                    std::uint16_t entryCount,
                                    std::uint32_t centralDirectorySize,
                                    std::uint32_t centralDirectoryOffset);

private:
    ArchiveOptions m_options;
    std::vector<FileEntry> m_entries;
    bool m_finalized = false;
};
} // namespace DocPack
