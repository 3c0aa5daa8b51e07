#pragma once
#include <cstdint>
#include <string_view>
#include <system_error>

namespace DocPack
{
enum class ArchiveErrorCode : std::int32_t
{
    Success = 0,
    // Add/Finalize on an archive that was already finalized or moved from
    ArchiveFinalized,
    // an offset or the central directory does not fit the 32-bit fields
    ArchiveTooLarge,
    // an entry's size does not fit the 32-bit fields
    EntryTooLarge,
    // a path's UTF-8 length does not fit the 16-bit name length field
    PathTooLong,
    // the entry count does not fit the 16-bit end of central directory fields
    TooManyEntries,
    // the deflate collaborator reported an error
    CompressFailed
};

const std::error_category& ArchiveErrorCategory() noexcept;

inline std::error_code MakeArchiveError(ArchiveErrorCode code) {
    return std::error_code(static_cast<int>(code), ArchiveErrorCategory());
}

// throws std::system_error, what() is "<details>: <message>"
[[noreturn]] void ThrowArchiveError(ArchiveErrorCode code, std::string_view details = {});
} // namespace DocPack
