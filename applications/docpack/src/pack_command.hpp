#pragma once

#include "docpack/compress/deflate_compressor.hpp"

#include <memory>

namespace DocPack::PackCommand
{
constexpr int kExitSuccess    = 0;
constexpr int kExitUsageError = 1;
constexpr int kExitPackError  = 2;

constexpr const char* kMimetypeEntryName = "mimetype";

// docpack [options] <input>..., returns the process exit status
// compressor: deflate implementation for the archive, null selects zlib
int Run(int argc, char* argv[], std::shared_ptr<const DeflateCompressor> compressor = nullptr);
} // namespace DocPack::PackCommand
