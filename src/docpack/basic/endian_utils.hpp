#pragma once
#if defined(_WIN32)
#else
    #include <endian.h>
#endif

#include <cstdint>
#include <type_traits>

namespace DocPack
{
enum class Endian : std::uint8_t
{
    None = 0,
    LittleEndian,
    BigEndian
};
inline constexpr auto kHostEndian =
#if defined(_WIN32)
    Endian::LittleEndian;
#elif __BYTE_ORDER == __LITTLE_ENDIAN
    Endian::LittleEndian;
#else
    Endian::BigEndian;
#endif

template <Endian targetEndian>
inline constexpr bool NeedConvertEndian() {
    return targetEndian != kHostEndian;
}

template <typename T>
inline constexpr T bswap_internal(T value) noexcept {
    static_assert(std::is_integral_v<T>, "Only integer types are supported");
    using UnsignedT = std::make_unsigned_t<T>;
    auto input      = static_cast<UnsignedT>(value);
    UnsignedT output {};
    for (std::size_t i = 0; i < sizeof(T); ++i) {
        output = static_cast<UnsignedT>((output << 8) | (input & 0xFFu));
        input  = static_cast<UnsignedT>(input >> 8);
    }
    return static_cast<T>(output);
}

// convert a host value to another_endian (or back, the operation is symmetric)
template <typename T, Endian another_endian = Endian::LittleEndian, typename = std::enable_if_t<std::is_integral_v<T>>>
inline constexpr std::decay_t<T> host_value_convert(T value) {
    if constexpr (sizeof(T) == 1 || !NeedConvertEndian<another_endian>()) {
        return value;
    } else {
        return bswap_internal<std::decay_t<T>>(value);
    }
}
} // namespace DocPack
