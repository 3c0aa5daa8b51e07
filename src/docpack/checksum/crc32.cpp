#include "crc32.hpp"

namespace DocPack
{
namespace
{
constexpr auto kCrc32Table = GenerateCrc32Table(Crc32::kPolynomial);
static_assert(kCrc32Table[1] == 0x77073096u, "unexpected crc32 table layout");
static_assert(kCrc32Table[255] == 0x2D02EF8Du, "unexpected crc32 table layout");
} // namespace

const std::array<check_sum_t, 256>& Crc32::Table() noexcept {
    return kCrc32Table;
}

check_sum_t Crc32::UpdateState(check_sum_t state, const void* data, std::size_t size) noexcept {
    auto ptr = static_cast<const std::uint8_t*>(data);
    for (std::size_t i = 0; i < size; ++i) {
        state = (state >> 8) ^ kCrc32Table[(state ^ ptr[i]) & 0xFFu];
    }
    return state;
}
} // namespace DocPack
