//
// CRC-32 as used by ZIP, gzip and PNG (IEEE 802.3, reflected polynomial 0xEDB88320)
//
#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <type_traits>

namespace DocPack
{
using check_sum_t = std::uint32_t;

inline constexpr std::array<check_sum_t, 256> GenerateCrc32Table(check_sum_t poly) {
    std::array<check_sum_t, 256> table {};
    for (check_sum_t i = 0; i < 256; ++i) {
        check_sum_t c = i;
        for (int j = 0; j < 8; ++j) {
            c = (c & 1) ? (c >> 1) ^ poly : c >> 1;
        }
        table[i] = c;
    }
    return table;
}

class Crc32 {
public:
    constexpr static check_sum_t kPolynomial = 0xEDB88320u;
    constexpr static check_sum_t kInitValue  = 0xFFFFFFFFu;
    constexpr static check_sum_t kFinalXor   = 0xFFFFFFFFu;

public:
    Crc32() = default;

    // feed more bytes, any split of the input yields the same Value()
    Crc32& Update(const void* data, std::size_t size) noexcept {
        m_state = UpdateState(m_state, data, size);
        return *this;
    }

    template <typename T,
              typename = std::void_t<decltype(std::declval<const T&>().data()),
                                     decltype(std::declval<const T&>().size()),
                                     typename T::value_type>>
    Crc32& Update(const T& input) noexcept {
        return Update(input.data(), input.size() * sizeof(typename T::value_type));
    }

    check_sum_t Value() const noexcept {
        return m_state ^ kFinalXor;
    }

    void Reset() noexcept {
        m_state = kInitValue;
    }

    // one shot checksum
    static check_sum_t Checksum(const void* data, std::size_t size) noexcept {
        return UpdateState(kInitValue, data, size) ^ kFinalXor;
    }

    template <typename T,
              typename = std::void_t<decltype(std::declval<const T&>().data()),
                                     decltype(std::declval<const T&>().size()),
                                     typename T::value_type>>
    static check_sum_t Checksum(const T& input) noexcept {
        return Checksum(input.data(), input.size() * sizeof(typename T::value_type));
    }

    static const std::array<check_sum_t, 256>& Table() noexcept;

private:
    static check_sum_t UpdateState(check_sum_t state, const void* data, std::size_t size) noexcept;

private:
    check_sum_t m_state = kInitValue;
};
} // namespace DocPack
