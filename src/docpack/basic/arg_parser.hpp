#pragma once

#include <cctype>
#include <getopt.h>
#include <unistd.h>

#include <algorithm>
#include <cstdint>
#include <iostream>
#include <limits>
#include <map>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace DocPack
{

// specialize this template in namespace DocPack for custom types,
// or give the type a constructor T(const std::string&)
template <typename T>
inline T from_string(const std::string& v) {
    return T(v);
}

// getopt_long based command line parser
class arg_parser {
public:
    enum param_type : std::int32_t
    {
        with_none_param,
        required_param,
        optional_param
    };
    struct parser_entry {
        std::string name;
        std::int32_t option_value;
        param_type type;
        std::string opt_usage;
        std::string param_description;
        std::optional<std::vector<std::string>> parser_values;
    };
    static constexpr char kReservedShortOption[]      = { '?' /*invalid option*/, ':' /*missing param*/ };
    static constexpr std::int32_t kNoShortOption      = -1;
    static constexpr std::int32_t kFirstLongOnlyValue = 128;
    static constexpr std::int32_t kHelperShortOption  = 'h';
    static constexpr std::int32_t kVersionShortOption = 'v';
    static constexpr const char* kHelperOptionName    = "help";
    static constexpr const char* kVersionOptionName   = "version";

public:
    arg_parser(int argc, char* argv[], const std::string& version = "1.0.0");
    bool AddOption(const std::string& name,
                   const std::string& opt_usage,
                   std::int32_t short_option_value    = kNoShortOption,
                   param_type type                    = with_none_param,
                   const std::string& param_description = "param");
    // false on an unknown option or a missing argument, the reason is written to stderr
    bool ParseCommandLine();
    void ShowHelp(std::ostream& os = std::cout) const;
    void ShowVersion(std::ostream& os = std::cout) const;
    std::optional<std::vector<std::string>> GetOptionValues(const std::string& name) const;
    std::optional<std::string> GetOptionValue(const std::string& name) const;
    const std::vector<std::string>& GetNonOptionValues() const;
    bool HasParam(const std::string& name = kHelperOptionName) const;
    void DumpOptions(std::ostream& os = std::cout) const;

    template <typename T>
    T GetValue(const std::string& name, const T& default_value = {}) const {
        auto v = GetOptionValue(name);
        if (!v.has_value()) return default_value;
        try {
            return from_string<T>(v.value());
        } catch (const std::exception& e) {
            std::cerr << "convert option:" << name << " value:" << v.value() << " failed:" << e.what() << std::endl;
            return default_value;
        }
    }

    template <typename T>
    std::vector<T> GetValues(const std::string& name) const {
        auto v = GetOptionValues(name);
        if (!v.has_value()) return {};
        std::vector<T> ret;
        for (const auto& value : v.value()) {
            try {
                ret.push_back(from_string<T>(value));
            } catch (const std::exception& e) {
                std::cerr << "convert option:" << name << " value:" << value << " failed:" << e.what() << std::endl;
            }
        }
        return ret;
    }

private:
    // options sorted by name, help output and the getopt tables stay stable
    std::vector<const parser_entry*> SortedOptions() const;
    static void DumpValues(std::ostream& os, const std::vector<std::string>& values);

private:
    const int argc;
    char** const argv;
    const std::string version;
    std::int32_t current_option_value = kFirstLongOnlyValue;
    std::string_view program_path;
    std::vector<std::string> no_option_params;
    std::unordered_map<std::string, parser_entry> options;
    std::map<std::int32_t, std::string> short_options_dict;
};

inline arg_parser::arg_parser(int argc, char* argv[], const std::string& version) :
argc(argc), argv(argv), version(version), program_path(argc > 0 ? argv[0] : "") {
    for (auto reserved : kReservedShortOption) {
        short_options_dict.emplace(reserved, "__reserved__");
    }
    AddOption(kHelperOptionName, "show this help page", kHelperShortOption, with_none_param);
    AddOption(kVersionOptionName, "show version information", kVersionShortOption, with_none_param);
}

inline bool arg_parser::AddOption(const std::string& name,
                                  const std::string& opt_usage,
                                  std::int32_t option_value,
                                  param_type type,
                                  const std::string& param_description) {
    if (options.count(name) > 0) {
        std::cerr << "option " << name << " already exists." << std::endl;
        return false;
    }
    if (option_value != kNoShortOption && (option_value >= kFirstLongOnlyValue || !std::isprint(option_value))) {
        std::cerr << "Invalid short option value " << option_value << std::endl;
        return false;
    }
    auto iter_short = short_options_dict.find(option_value);
    if (iter_short != short_options_dict.end()) {
        std::cerr << "short option value:" << static_cast<char>(option_value)
                  << " already exists for option:" << iter_short->second << std::endl;
        return false;
    }
    if (option_value == kNoShortOption) {
        option_value = current_option_value++;
    }
    short_options_dict.emplace(option_value, name);
    options.emplace(name, parser_entry { name, option_value, type, opt_usage, param_description, std::nullopt });
    return true;
}

inline std::vector<const arg_parser::parser_entry*> arg_parser::SortedOptions() const {
    std::vector<const parser_entry*> ret;
    ret.reserve(options.size());
    for (const auto& item : options)
        ret.push_back(&item.second);
    std::sort(ret.begin(), ret.end(), [](const parser_entry* l, const parser_entry* r) { return l->name < r->name; });
    return ret;
}

inline bool arg_parser::ParseCommandLine() {
    std::vector<option> long_options;
    // leading ':' makes getopt report a missing argument as ':' instead of '?'
    std::string short_options = ":";
    for (auto entry : SortedOptions()) {
        auto& new_long_option = long_options.emplace_back();
        new_long_option.name  = entry->name.c_str();
        std::string new_short_option;
        if (entry->option_value < kFirstLongOnlyValue) {
            new_short_option.push_back(static_cast<char>(entry->option_value));
        }
        if (entry->type == with_none_param) {
            new_long_option.has_arg = no_argument;
        } else if (entry->type == required_param) {
            new_long_option.has_arg = required_argument;
            if (!new_short_option.empty()) new_short_option += ":";
        } else {
            new_long_option.has_arg = optional_argument;
            if (!new_short_option.empty()) new_short_option += "::";
        }
        new_long_option.flag = nullptr;
        new_long_option.val  = entry->option_value;
        short_options += new_short_option;
    }
    long_options.push_back({ nullptr, 0, nullptr, 0 });

    // restart the scan, the parser may be used more than once per process
    optind = 0;
    opterr = 0;
    while (true) {
        int option_index = 0;
        int res          = getopt_long(argc, argv, short_options.c_str(), long_options.data(), &option_index);
        if (res == -1) {
            break;
        }

        switch (res) {
        case 0: {
            std::cerr << "internal error for flag long opt" << std::endl;
            return false;
        }
        case '?': {
            if (optopt != 0 && optopt < kFirstLongOnlyValue)
                std::cerr << "invalid option: -" << static_cast<char>(optopt) << std::endl;
            else
                std::cerr << "invalid option: " << argv[optind - 1] << std::endl;
            return false;
        }
        case ':': {
            std::cerr << "option " << argv[optind - 1] << " requires an argument" << std::endl;
            return false;
        }
        default: {
            auto iter = short_options_dict.find(res);
            if (iter == short_options_dict.end()) {
                std::cerr << "internal error can't find:" << res << std::endl;
                return false;
            }
            auto option_iter = options.find(iter->second);
            if (option_iter == options.end()) {
                std::cerr << "internal error can't find option:" << iter->second << std::endl;
                return false;
            }

            auto& current_option = option_iter->second;
            if (!current_option.parser_values.has_value()) {
                current_option.parser_values = std::vector<std::string>();
            }
            if (current_option.type != with_none_param && optarg) {
                current_option.parser_values.value().push_back(optarg);
            }
        }
        }
    }
    while (optind < argc) {
        no_option_params.push_back(argv[optind]);
        ++optind;
    }
    return true;
}

inline void arg_parser::ShowHelp(std::ostream& os) const {
    os << "Usage: " << program_path << " [options] [params]..." << std::endl;
    os << "Version: " << version << std::endl;
    for (auto entry : SortedOptions()) {
        if (entry->option_value < kFirstLongOnlyValue) {
            os << "\t-" << static_cast<char>(entry->option_value) << ",";
        } else {
            os << "\t";
        }
        os << "--" << entry->name;
        if (entry->type == required_param) {
            os << " <" << entry->param_description << ">";
        } else if (entry->type == optional_param) {
            os << " [" << entry->param_description << "]";
        }
        os << "\t" << entry->opt_usage << std::endl;
    }
}

inline void arg_parser::ShowVersion(std::ostream& os) const {
    os << "Version: " << version << std::endl;
}

inline std::optional<std::vector<std::string>> arg_parser::GetOptionValues(const std::string& name) const {
    auto iter = options.find(name);
    return iter == options.end() ? std::nullopt : iter->second.parser_values;
}

inline std::optional<std::string> arg_parser::GetOptionValue(const std::string& name) const {
    auto iter = options.find(name);
    if (iter == options.end() || !iter->second.parser_values.has_value()) return std::nullopt;
    auto& values = iter->second.parser_values.value();
    // the last occurrence wins
    return values.empty() ? std::string() : values.back();
}

inline const std::vector<std::string>& arg_parser::GetNonOptionValues() const {
    return no_option_params;
}

inline bool arg_parser::HasParam(const std::string& name) const {
    return GetOptionValue(name).has_value();
}

inline void arg_parser::DumpValues(std::ostream& os, const std::vector<std::string>& values) {
    for (std::size_t i = 0; i < values.size(); i++) {
        if (i != 0) os << " ";
        os << values[i];
    }
}

inline void arg_parser::DumpOptions(std::ostream& os) const {
    os << "Dump all parsed args for program:" << program_path << std::endl;
    for (auto entry : SortedOptions()) {
        if (entry->option_value < kFirstLongOnlyValue) {
            os << "-" << static_cast<char>(entry->option_value) << ",";
        }
        os << "--" << entry->name << "\t";
        os << (entry->parser_values.has_value() ? "{set}" : "{not set}");
        if (entry->type != with_none_param && entry->parser_values.has_value()) {
            os << (entry->type == required_param ? " <" : " [");
            DumpValues(os, entry->parser_values.value());
            os << (entry->type == required_param ? ">" : "]");
        }
        os << std::endl;
    }
    os << "Dump non option params:";
    DumpValues(os, no_option_params);
    os << std::endl;
}

template <typename T>
inline std::string to_lower(const T& str_) {
    std::string str(str_.size(), '\0');
    std::transform(str_.begin(), str_.end(), str.begin(), [](unsigned char c) { return std::tolower(c); });
    return str;
}

template <>
inline std::string from_string(const std::string& v) {
    return v;
}
template <>
inline int from_string(const std::string& v) {
    return std::stoi(v);
}
template <>
inline long from_string(const std::string& v) {
    return std::stol(v);
}
template <>
inline long long from_string(const std::string& v) {
    return std::stoll(v);
}
template <>
inline unsigned int from_string(const std::string& v) {
    auto value = std::stoul(v);
    if (value > std::numeric_limits<unsigned int>::max()) throw std::out_of_range("unsigned int");
    return static_cast<unsigned int>(value);
}
template <>
inline unsigned long from_string(const std::string& v) {
    return std::stoul(v);
}
template <>
inline unsigned long long from_string(const std::string& v) {
    return std::stoull(v);
}
template <>
inline bool from_string(const std::string& v) {
    return to_lower(v) == "true" || v == "1";
}
template <>
inline double from_string(const std::string& v) {
    return std::stod(v);
}

} // namespace DocPack
