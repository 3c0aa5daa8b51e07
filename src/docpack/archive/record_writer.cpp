#include "record_writer.hpp"

#include <utility>

namespace DocPack
{
RecordWriter::RecordWriter(ArchiveWriteFunction writeFunc) : m_writeFunc(std::move(writeFunc)) {
}

void RecordWriter::Write(const std::uint8_t* data, std::size_t dataSize) {
    if (dataSize == 0) return;
    // append to end
    m_cacheData.insert(m_cacheData.end(), data, data + dataSize);
    m_fileOffset += dataSize;
}

void RecordWriter::Write(std::string_view text) {
    Write(reinterpret_cast<const std::uint8_t*>(text.data()), text.size());
}

void RecordWriter::Reserve(std::size_t totalSize) {
    m_cacheData.reserve(totalSize);
}

void RecordWriter::Flush() {
    if (m_writeFunc && !m_cacheData.empty()) {
        m_writeFunc(m_cacheData.data(), m_cacheData.size());
        m_cacheData.clear();
    }
}

std::vector<std::uint8_t> RecordWriter::TakeCache() {
    return std::exchange(m_cacheData, {});
}
} // namespace DocPack
