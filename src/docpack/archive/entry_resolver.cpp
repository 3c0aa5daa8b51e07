#include "entry_resolver.hpp"

#include "archive_error.hpp"

#include "docpack/basic/log.h"
#include "docpack/compress/compress_error.hpp"

namespace DocPack
{
ResolvedEntry ResolveEntry(FileEntry entry, const DeflateCompressor& compressor, DeflateEffort effort) {
    ResolvedEntry resolved;
    resolved.path    = std::move(entry.path);
    resolved.crc32   = Crc32::Checksum(entry.data);
    auto modified    = entry.modified.value_or(kDosEpoch);
    resolved.modTime = modified.time;
    resolved.modDate = modified.date;

    if (entry.compression == CompressionMethod::Deflate && !entry.data.empty()) {
        std::vector<std::uint8_t> deflated;
        try {
            deflated = compressor.Compress(entry.data, effort);
        } catch (const std::system_error& e) {
            if (e.code().category() != CompressErrorCategory()) throw;
            DPERR("deflate {} failed:{}", resolved.path, e.what());
            ThrowArchiveError(ArchiveErrorCode::CompressFailed, StringFormat("{}:{}", resolved.path, e.what()));
        }
        // ties fall back to stored
        if (deflated.size() < entry.data.size()) {
            resolved.deflatedData = std::move(deflated);
            resolved.method       = CompressionMethod::Deflate;
        } else {
            DPDEBUG("{} stays stored, deflate {} >= {}", resolved.path, deflated.size(), entry.data.size());
        }
    }
    resolved.uncompressedData = std::move(entry.data);
    return resolved;
}
} // namespace DocPack
