//
// DEFLATE (RFC 1951) collaborator of the archive writer
//
#pragma once

#include <cstddef>
#include <cstdint>
#include <limits>
#include <memory>
#include <string_view>
#include <vector>

namespace DocPack
{
enum class DeflateEffort : std::uint32_t
{
    Fastest,
    Balanced,
    Best
};

std::string_view ToString(DeflateEffort effort);

// compressors are shared between threads when entries are resolved in parallel,
// Compress must not touch mutable state
class DeflateCompressor {
public:
    virtual ~DeflateCompressor() = default;
    // returns a raw deflate stream (no zlib or gzip wrapper)
    virtual std::vector<std::uint8_t> Compress(const std::uint8_t* data,
                                               std::size_t size,
                                               DeflateEffort effort) const = 0;

    std::vector<std::uint8_t> Compress(const std::vector<std::uint8_t>& data, DeflateEffort effort) const {
        return Compress(data.data(), data.size(), effort);
    }
};

class ZlibDeflateCompressor final : public DeflateCompressor {
public:
    // zlib levels
    constexpr static std::int32_t kFastestLevel  = 1;
    constexpr static std::int32_t kBalancedLevel = 6;
    constexpr static std::int32_t kBestLevel     = 9;
    // negative window bits select a raw stream
    constexpr static std::int32_t kRawWindowBits = -15;
    constexpr static std::int32_t kMemLevel      = 8;
    // zlib counts avail_in/avail_out in 32 bits, larger buffers are fed in pieces
    constexpr static std::size_t kMaxStreamChunk = std::numeric_limits<std::uint32_t>::max();

    explicit ZlibDeflateCompressor(std::size_t chunk = kMaxStreamChunk);

    static std::int32_t ZlibLevel(DeflateEffort effort);

    using DeflateCompressor::Compress;
    std::vector<std::uint8_t> Compress(const std::uint8_t* data,
                                       std::size_t size,
                                       DeflateEffort effort) const override;

private:
    const std::size_t streamChunk;
};

std::shared_ptr<const DeflateCompressor> DefaultDeflateCompressor();
} // namespace DocPack
