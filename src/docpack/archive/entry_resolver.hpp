#pragma once
#include "compression_method.hpp"
#include "file_entry.hpp"

#include "docpack/checksum/crc32.hpp"
#include "docpack/compress/deflate_compressor.hpp"

#include <cstdint>
#include <string>
#include <vector>

namespace DocPack
{
// an entry with everything its headers need, frozen at finalize time
// invariant: method == Deflate only if CompressedData().size() < uncompressedData.size(),
// otherwise method == Stored and CompressedData() is uncompressedData itself
struct ResolvedEntry {
    std::string path;
    std::vector<std::uint8_t> uncompressedData;
    // empty unless method == Deflate
    std::vector<std::uint8_t> deflatedData;
    CompressionMethod method = CompressionMethod::Stored;
    check_sum_t crc32        = 0;
    std::uint16_t modTime    = kDosEpoch.time;
    std::uint16_t modDate    = kDosEpoch.date;

    // bytes following the local header
    const std::vector<std::uint8_t>& CompressedData() const {
        return method == CompressionMethod::Deflate ? deflatedData : uncompressedData;
    }
};

// computes the crc and, when requested, deflates; the deflated stream is kept only if it is strictly smaller
ResolvedEntry ResolveEntry(FileEntry entry, const DeflateCompressor& compressor, DeflateEffort effort);
} // namespace DocPack
