#include "archive_error.hpp"

#include <string>

namespace DocPack
{
namespace
{
class ArchiveErrorCategoryImpl final : public std::error_category {
public:
    const char* name() const noexcept override {
        return "docpack.archive";
    }

    std::string message(int value) const override {
        switch (static_cast<ArchiveErrorCode>(value)) {
        case ArchiveErrorCode::Success: return "success";
        case ArchiveErrorCode::ArchiveFinalized: return "archive has been finalized";
        case ArchiveErrorCode::ArchiveTooLarge: return "archive exceeds the 4GiB zip32 limit";
        case ArchiveErrorCode::EntryTooLarge: return "entry exceeds the 4GiB zip32 limit";
        case ArchiveErrorCode::PathTooLong: return "entry path exceeds 65535 bytes";
        case ArchiveErrorCode::TooManyEntries: return "archive exceeds 65535 entries";
        case ArchiveErrorCode::CompressFailed: return "deflate compression failed";
        default: return "unknown archive error";
        }
    }
};
} // namespace

const std::error_category& ArchiveErrorCategory() noexcept {
    static const ArchiveErrorCategoryImpl s_category;
    return s_category;
}

void ThrowArchiveError(ArchiveErrorCode code, std::string_view details) {
    throw std::system_error(MakeArchiveError(code), std::string(details));
}
} // namespace DocPack
