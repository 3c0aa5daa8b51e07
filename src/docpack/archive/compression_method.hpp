#pragma once

#include <cstdint>
#include <string_view>

namespace DocPack
{
// the only two methods ISO/IEC 21320-1 permits, values are the zip method ids
enum class CompressionMethod : std::uint16_t
{
    Stored  = 0,
    Deflate = 8
};

inline constexpr std::uint16_t VersionNeededToExtract(CompressionMethod method) {
    // 2.0 for deflate, 1.0 for stored
    return method == CompressionMethod::Deflate ? 20 : 10;
}

inline constexpr std::string_view ToString(CompressionMethod method) {
    return method == CompressionMethod::Deflate ? "deflate" : "stored";
}
} // namespace DocPack
