#pragma once
#include <cstdint>
#include <string_view>
#include <system_error>

namespace DocPack
{
enum class CompressErrorCode : std::int32_t
{
    Success = 0,
    // deflateInit2 failed, usually Z_MEM_ERROR
    InitFailed,
    // deflate did not reach Z_STREAM_END
    DeflateFailed
};

const std::error_category& CompressErrorCategory() noexcept;

inline std::error_code MakeCompressError(CompressErrorCode code) {
    return std::error_code(static_cast<int>(code), CompressErrorCategory());
}

[[noreturn]] void ThrowCompressError(CompressErrorCode code, std::string_view details = {});
} // namespace DocPack
