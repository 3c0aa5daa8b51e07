#include "utils.hpp"

#include <iomanip>
#include <sstream>

namespace DocPack
{
namespace Utils
{
std::string BufferToHex(const void* buffer, std::size_t size, std::size_t group_size, std::int8_t spilt_char) {
    std::ostringstream oss;
    oss << std::hex << std::setfill('0');
    const std::uint8_t* ptr = static_cast<const std::uint8_t*>(buffer);
    for (std::size_t i = 0; i < size; ++i) {
        oss << std::setw(2) << static_cast<int>(ptr[i]);
        if (group_size > 0 && (i + 1) % group_size == 0 && i + 1 < size)
            oss << '\n';
        else if (spilt_char > 0 && i + 1 < size) {
            oss << static_cast<char>(spilt_char);
        }
    }
    return oss.str();
}

std::string FormatByteSize(std::uint64_t size) {
    static constexpr const char* kUnits[] = { "B", "KiB", "MiB", "GiB", "TiB" };
    std::size_t unit_index                = 0;
    double value                          = static_cast<double>(size);
    while (value >= 1024.0 && unit_index + 1 < sizeof(kUnits) / sizeof(kUnits[0])) {
        value /= 1024.0;
        ++unit_index;
    }
    std::ostringstream oss;
    if (unit_index == 0) {
        oss << size << kUnits[0];
    } else {
        oss << std::fixed << std::setprecision(2) << value << kUnits[unit_index];
    }
    return oss.str();
}
} // namespace Utils
} // namespace DocPack
