#include "pack_command.hpp"

#include "docpack/archive/archive_writer.hpp"
#include "docpack/basic/arg_parser.hpp"
#include "docpack/basic/filesystem_utils.hpp"
#include "docpack/basic/log.h"
#include "docpack/basic/utils.hpp"

#include <filesystem>
#include <fstream>
#include <map>
#include <optional>
#include <set>
#include <system_error>

namespace DocPack::PackCommand
{
namespace
{
std::optional<DeflateEffort> ParseEffort(const std::string& value) {
    auto lower = to_lower(value);
    for (auto effort : { DeflateEffort::Fastest, DeflateEffort::Balanced, DeflateEffort::Best }) {
        if (lower == ToString(effort)) return effort;
    }
    return std::nullopt;
}

// archive path -> file on disk, ordered by archive path
using PackList = std::map<std::string, std::filesystem::path>;

bool CollectInputs(const std::vector<std::string>& inputs, const std::filesystem::path& base, PackList& list) {
    for (const auto& input : inputs) {
        std::error_code ec;
        auto files = fs::CollectRegularFiles(input, ec);
        if (ec) {
            DPERR("collect {} failed:{}", input, ec.message());
            return false;
        }
        for (auto& file : files) {
            auto archivePath = fs::RelativeGenericPath(file, base);
            if (!archivePath) {
                DPERR("{} is not inside {}", file.string(), base.string());
                return false;
            }
            auto [iter, inserted] = list.emplace(std::move(*archivePath), file);
            if (!inserted) DPWARN("skip duplicate input {} for {}", file.string(), iter->first);
        }
    }
    return true;
}
} // namespace

int Run(int argc, char* argv[], std::shared_ptr<const DeflateCompressor> compressor) {
    Logger::LoggerInitOptions options;
    options.minimumLevel = LogLevel::info;
    options.logFormat    = "%^[%L]%$ %v";
    Logger::Initialize(options);

    arg_parser parser { argc, argv, "1.0.0" };
    parser.AddOption("output", "archive file to write", 'o', arg_parser::param_type::required_param, "file");
    parser.AddOption("base", "archive paths are relative to this directory default:current directory", 'C',
                     arg_parser::param_type::required_param, "dir");
    parser.AddOption("mimetype", "add a stored mimetype entry first", 'm', arg_parser::param_type::required_param,
                     "type");
    parser.AddOption("store", "store this archive path without compression, repeatable", 's',
                     arg_parser::param_type::required_param, "path");
    parser.AddOption("level",
                     StringFormat("deflate effort fastest|balanced|best default:{}",
                                  ToString(DeflateEffort::Balanced)),
                     'l', arg_parser::param_type::required_param, "effort");
    parser.AddOption("parallel", "compress entries concurrently", 'p');
    parser.AddOption("mtime", "stamp entries with the files' modification time");
    parser.AddOption("log-level", "0 trace ... 6 off", arg_parser::kNoShortOption,
                     arg_parser::param_type::required_param, "level");
    parser.AddOption("verbose", "dump all options", 'V');
    if (argc == 1) {
        parser.ShowHelp();
        return kExitUsageError;
    }
    if (!parser.ParseCommandLine()) {
        parser.ShowHelp(std::cerr);
        return kExitUsageError;
    }
    if (parser.HasParam()) {
        parser.ShowHelp();
        return kExitSuccess;
    }
    if (parser.HasParam(arg_parser::kVersionOptionName)) {
        parser.ShowVersion();
        return kExitSuccess;
    }
    if (parser.HasParam("verbose")) {
        parser.DumpOptions();
    }
    if (parser.HasParam("log-level")) {
        auto level = parser.GetValue<int>("log-level", -1);
        if (level < LogLevel::trace || level > LogLevel::off) {
            DPERR("invalid log level {}", parser.GetValue<std::string>("log-level"));
            return kExitUsageError;
        }
        options.minimumLevel = static_cast<LogLevel>(level);
        Logger::Initialize(options);
    }

    auto output = parser.GetValue<std::string>("output");
    if (output.empty()) {
        DPERR("missing --output");
        return kExitUsageError;
    }
    const auto& inputs = parser.GetNonOptionValues();
    if (inputs.empty() && !parser.HasParam("mimetype")) {
        DPERR("nothing to pack");
        return kExitUsageError;
    }
    ArchiveOptions archiveOptions;
    if (parser.HasParam("level")) {
        auto effort = ParseEffort(parser.GetValue<std::string>("level"));
        if (!effort) {
            DPERR("invalid level {}", parser.GetValue<std::string>("level"));
            return kExitUsageError;
        }
        archiveOptions.effort = *effort;
    }
    archiveOptions.compressor      = std::move(compressor);
    archiveOptions.parallelResolve = parser.HasParam("parallel");
    const bool useMtime            = parser.HasParam("mtime");
    auto storeValues               = parser.GetValues<std::string>("store");
    std::set<std::string> storedPaths(storeValues.begin(), storeValues.end());

    std::error_code ec;
    std::filesystem::path base = parser.GetValue<std::string>("base", ".");
    base                       = std::filesystem::weakly_canonical(base, ec);
    if (ec) {
        DPERR("invalid base directory:{}", ec.message());
        return kExitPackError;
    }

    PackList list;
    std::vector<std::string> absoluteInputs;
    for (const auto& input : inputs) {
        absoluteInputs.push_back(std::filesystem::weakly_canonical(input, ec).string());
        if (ec) {
            DPERR("invalid input {}:{}", input, ec.message());
            return kExitPackError;
        }
    }
    if (!CollectInputs(absoluteInputs, base, list)) return kExitPackError;

    // set once the output is truncated, a failure after that removes the partial file
    bool outputCreated = false;
    try {
        ArchiveWriter writer(archiveOptions);
        if (parser.HasParam("mimetype")) {
            writer.AddText(kMimetypeEntryName, parser.GetValue<std::string>("mimetype"), false);
            if (list.erase(kMimetypeEntryName) > 0) DPWARN("input file {} replaced by --mimetype", kMimetypeEntryName);
        }
        for (auto& [archivePath, file] : list) {
            FileEntry entry;
            entry.path = archivePath;
            if (!fs::ReadFile(file.string(), entry.data)) {
                DPERR("read {} failed", file.string());
                return kExitPackError;
            }
            if (storedPaths.count(archivePath) > 0) entry.compression = CompressionMethod::Stored;
            if (useMtime) {
                auto mtime = fs::LastWriteTime(file);
                if (mtime) entry.modified = DosDateTime::FromUnixTime(*mtime);
            }
            writer.Add(std::move(entry));
        }
        const auto entryCount = writer.EntryCount();

        std::ofstream file(output, std::ios::binary | std::ios::trunc);
        if (!file) {
            DPERR("can't write to {}", output);
            return kExitPackError;
        }
        outputCreated = true;
        auto total    = std::move(writer).FinalizeTo([&](const std::uint8_t* data, std::size_t size) {
            file.write(reinterpret_cast<const char*>(data), static_cast<std::streamsize>(size));
            if (!file) throw std::system_error(std::make_error_code(std::errc::io_error), output);
        });
        file.close();
        if (!file) throw std::system_error(std::make_error_code(std::errc::io_error), output);
        DPINFO("packed {} entries into {} ({})", entryCount, output, Utils::FormatByteSize(total));
    } catch (const std::system_error& e) {
        DPERR("pack {} failed:{}", output, e.what());
        if (outputCreated) std::filesystem::remove(output, ec);
        return kExitPackError;
    } catch (const std::exception& e) {
        DPFAIL("pack {} aborted:{}", output, e.what());
        if (outputCreated) std::filesystem::remove(output, ec);
        return kExitPackError;
    }
    return kExitSuccess;
}
} // namespace DocPack::PackCommand
