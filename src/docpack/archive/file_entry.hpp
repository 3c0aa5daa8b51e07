#pragma once
#include "compression_method.hpp"
#include "dos_time.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace DocPack
{
// an entry as handed to the archive writer
struct FileEntry {
    // archive relative, forward slash separated, utf-8
    std::string path;
    std::vector<std::uint8_t> data;
    // Deflate means "compress if it makes the entry smaller"
    CompressionMethod compression = CompressionMethod::Deflate;
    // kDosEpoch when not set
    std::optional<DosDateTime> modified;
};
} // namespace DocPack
