#pragma once
#include <algorithm>
#include <chrono>
#include <cstdint>
#include <ctime>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <optional>
#include <type_traits>
#include <string>
#include <string_view>
#include <system_error>
#include <vector>

namespace DocPack::fs
{

template <typename T,
          typename = typename std::enable_if_t<
              std::disjunction_v<std::is_same<T, std::vector<std::uint8_t>>, std::is_same<T, std::string>>>>
inline bool ReadFile(std::string_view path, T& output) {
    // Always read as binary.
    std::ifstream file(std::string(path), std::ios::binary);
    if (!file) {
        std::cerr << "can't read from " << path << std::endl;
        return false;
    }
    file.seekg(0, file.end);
    auto lengthInBytes = file.tellg();
    file.seekg(0, file.beg);
    if (lengthInBytes < 0) {
        std::cerr << "can't get the size of " << path << std::endl;
        return false;
    }
    output.resize(static_cast<std::size_t>(lengthInBytes));
    file.read(reinterpret_cast<char*>(output.data()), lengthInBytes);
    return static_cast<bool>(file);
}

// regular files under path (path itself when it is a file), sorted, symlinks followed
inline std::vector<std::filesystem::path> CollectRegularFiles(const std::filesystem::path& path, std::error_code& ec) {
    std::vector<std::filesystem::path> ret;
    ec.clear();
    if (std::filesystem::is_regular_file(path, ec)) {
        ret.push_back(path);
        return ret;
    }
    if (ec) return ret;
    if (!std::filesystem::is_directory(path, ec)) {
        if (!ec) ec = std::make_error_code(std::errc::no_such_file_or_directory);
        return ret;
    }
    std::filesystem::recursive_directory_iterator iter(
        path, std::filesystem::directory_options::follow_directory_symlink, ec);
    for (; !ec && iter != std::filesystem::recursive_directory_iterator(); iter.increment(ec)) {
        if (iter->is_regular_file(ec)) ret.push_back(iter->path());
        if (ec) break;
    }
    std::sort(ret.begin(), ret.end());
    return ret;
}

// "a/b/../c.txt" relative to "a" -> "c.txt", nullopt when path is not inside base
inline std::optional<std::string> RelativeGenericPath(const std::filesystem::path& path,
                                                      const std::filesystem::path& base) {
    std::error_code ec;
    auto rel = std::filesystem::relative(path, base, ec);
    if (ec || rel.empty()) return std::nullopt;
    if (*rel.begin() == "." || *rel.begin() == "..") return std::nullopt;
    return rel.generic_string();
}

inline std::optional<std::time_t> LastWriteTime(const std::filesystem::path& path) {
    std::error_code ec;
    auto ftime = std::filesystem::last_write_time(path, ec);
    if (ec) return std::nullopt;
    auto fileTime = std::chrono::time_point_cast<std::chrono::system_clock::duration>(
        ftime - std::filesystem::file_time_type::clock::now() + std::chrono::system_clock::now());
    return std::chrono::system_clock::to_time_t(fileTime);
}
} // namespace DocPack::fs
