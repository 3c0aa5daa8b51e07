#ifndef _HEAD_DOCPACK_BASIC_UTILS_
#define _HEAD_DOCPACK_BASIC_UTILS_
#include <cstddef>
#include <cstdint>
#include <string>

namespace DocPack
{

struct NonCopyable {
    NonCopyable()                              = default;
    NonCopyable(const NonCopyable&)            = delete;
    NonCopyable& operator=(const NonCopyable&) = delete;
    NonCopyable(NonCopyable&&)                 = default;
    NonCopyable& operator=(NonCopyable&&)      = default;
};

namespace Utils
{
// group_size > 0 breaks the output into lines of group_size bytes
std::string BufferToHex(const void* buffer, std::size_t size, std::size_t group_size = 0, std::int8_t spilt_char = 0);
template <typename T, typename = std::void_t<typename T::value_type>>
inline std::string BufferToHex(const T& v, std::size_t group_size = 0, std::int8_t spilt_char = 0) {
    using ValueType = typename T::value_type;
    return BufferToHex(v.data(), v.size() * sizeof(ValueType), group_size, spilt_char);
}

// human readable byte count, e.g. 1536 -> "1.50KiB"
std::string FormatByteSize(std::uint64_t size);
} // namespace Utils
} // namespace DocPack

#endif //_HEAD_DOCPACK_BASIC_UTILS_
