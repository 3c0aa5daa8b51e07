#pragma once
#include "docpack/basic/endian_utils.hpp"

#include <cstdint>
#include <functional>
#include <string_view>
#include <type_traits>
#include <vector>

namespace DocPack
{
// receives archive bytes in order, the pointer is only valid during the call
using ArchiveWriteFunction = std::function<void(const std::uint8_t*, std::size_t)>;

// appends little-endian zip records to a cache and tracks the absolute output offset
class RecordWriter {
public:
    explicit RecordWriter(ArchiveWriteFunction writeFunc = nullptr);

    template <typename NumberType, typename = std::enable_if_t<std::is_integral_v<NumberType>>>
    void Write(NumberType number) {
        NumberType little_endian_value = host_value_convert<NumberType, Endian::LittleEndian>(number);
        Write(reinterpret_cast<const std::uint8_t*>(&little_endian_value), sizeof(little_endian_value));
    }
    void Write(const std::uint8_t* data, std::size_t dataSize);
    void Write(std::string_view text);

    void Reserve(std::size_t totalSize);
    // hands the cached bytes to the write function, no-op without one
    void Flush();
    // absolute offset of the next byte, flushed bytes included
    std::uint64_t Offset() const {
        return m_fileOffset;
    }
    std::vector<std::uint8_t> TakeCache();

private:
    std::uint64_t m_fileOffset = 0;
    ArchiveWriteFunction m_writeFunc;
    std::vector<std::uint8_t> m_cacheData;
};
} // namespace DocPack
