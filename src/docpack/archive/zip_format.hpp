#pragma once

#include <cstddef>
#include <cstdint>
#include <limits>

namespace DocPack::ZipFormat
{
constexpr static std::uint32_t kLocalFileHeaderSignature      = 0x04034b50; // "PK\3\4"
constexpr static std::uint32_t kCentralDirectorySignature     = 0x02014b50; // "PK\1\2"
constexpr static std::uint32_t kEndOfCentralDirectorySignature = 0x06054b50; // "PK\5\6"

// fixed part of each record, the file name follows
constexpr static std::size_t kLocalFileHeaderSize       = 30;
constexpr static std::size_t kCentralDirectoryHeaderSize = 46;
constexpr static std::size_t kEndOfCentralDirectorySize  = 22;
// byte offset of the method field inside a local file header
constexpr static std::size_t kLocalHeaderMethodOffset = 8;

// high byte 3 = unix, low byte 30 = APPNOTE version 3.0
constexpr static std::uint16_t kVersionMadeBy = 0x031E;
constexpr static std::uint16_t kGeneralPurposeFlags = 0;
// unix regular file (S_IFREG) with permission bits 0644 in the high 16 bits
constexpr static std::uint32_t kExternalFileAttributes = 0100644u << 16;
static_assert(kExternalFileAttributes == 0x81A40000u);

constexpr static std::uint64_t kMaxField32  = std::numeric_limits<std::uint32_t>::max();
constexpr static std::uint64_t kMaxField16  = std::numeric_limits<std::uint16_t>::max();
} // namespace DocPack::ZipFormat
