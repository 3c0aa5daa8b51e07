#include "deflate_compressor.hpp"

#include "compress_error.hpp"

#include "docpack/basic/log.h"

#include <algorithm>
#include <zlib.h>

namespace DocPack
{
std::string_view ToString(DeflateEffort effort) {
    switch (effort) {
    case DeflateEffort::Fastest: return "fastest";
    case DeflateEffort::Balanced: return "balanced";
    case DeflateEffort::Best: return "best";
    default: return "unknown";
    }
}

ZlibDeflateCompressor::ZlibDeflateCompressor(std::size_t chunk) :
streamChunk(std::clamp<std::size_t>(chunk, 1, std::numeric_limits<uInt>::max())) {
}

std::int32_t ZlibDeflateCompressor::ZlibLevel(DeflateEffort effort) {
    switch (effort) {
    case DeflateEffort::Fastest: return kFastestLevel;
    case DeflateEffort::Best: return kBestLevel;
    default: return kBalancedLevel;
    }
}

std::vector<std::uint8_t> ZlibDeflateCompressor::Compress(const std::uint8_t* data,
                                                          std::size_t size,
                                                          DeflateEffort effort) const {
    z_stream strm {};
    strm.zalloc = Z_NULL;
    strm.zfree  = Z_NULL;
    strm.opaque = Z_NULL;
    auto code   = deflateInit2(&strm, ZlibLevel(effort), Z_DEFLATED, kRawWindowBits, kMemLevel, Z_DEFAULT_STRATEGY);
    if (code != Z_OK) {
        DPERR("deflateInit2 failed code:{}", code);
        ThrowCompressError(CompressErrorCode::InitFailed, StringFormat("deflateInit2 returned {}", code));
    }
    // deflateBound covers the whole stream, the buffer only grows if it is wrong
    std::vector<std::uint8_t> out_buf(deflateBound(&strm, static_cast<uLong>(size)));
    std::size_t consumed = 0;
    std::size_t produced = 0;
    do {
        if (strm.avail_in == 0 && consumed < size) {
            auto feed     = std::min(size - consumed, streamChunk);
            strm.next_in  = const_cast<std::uint8_t*>(data + consumed);
            strm.avail_in = static_cast<uInt>(feed);
            consumed += feed;
        }
        if (produced == out_buf.size()) out_buf.resize(out_buf.size() + std::min<std::size_t>(streamChunk, 64 * 1024));
        auto space     = std::min(out_buf.size() - produced, streamChunk);
        strm.next_out  = out_buf.data() + produced;
        strm.avail_out = static_cast<uInt>(space);
        // Z_FINISH only once the last input piece is handed over
        code = deflate(&strm, consumed == size ? Z_FINISH : Z_NO_FLUSH);
        produced += space - strm.avail_out;
    } while (code == Z_OK);
    deflateEnd(&strm);
    if (code != Z_STREAM_END) {
        DPERR("deflate failed code:{}", code);
        ThrowCompressError(CompressErrorCode::DeflateFailed, StringFormat("deflate returned {}", code));
    }
    out_buf.resize(produced);
    return out_buf;
}

std::shared_ptr<const DeflateCompressor> DefaultDeflateCompressor() {
    static const std::shared_ptr<const DeflateCompressor> s_compressor = std::make_shared<ZlibDeflateCompressor>();
    return s_compressor;
}
} // namespace DocPack
