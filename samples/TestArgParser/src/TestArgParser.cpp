#include "docpack/basic/arg_parser.hpp"

#include <sstream>
#include <string>
#include <vector>

#include <gtest/gtest.h>

namespace
{
// owns mutable copies of the arguments, getopt may permute argv
struct CommandLine {
    explicit CommandLine(std::vector<std::string> args) : storage(std::move(args)) {
        for (auto& item : storage)
            argv.push_back(item.data());
        argv.push_back(nullptr);
    }
    int argc() const {
        return static_cast<int>(storage.size());
    }
    std::vector<std::string> storage;
    std::vector<char*> argv;
};

void AddDocpackOptions(DocPack::arg_parser& parser) {
    parser.AddOption("output", "archive file to write", 'o', DocPack::arg_parser::required_param, "file");
    parser.AddOption("store", "store this path", 's', DocPack::arg_parser::required_param, "path");
    parser.AddOption("parallel", "compress entries concurrently", 'p');
    parser.AddOption("log-level", "log level", DocPack::arg_parser::kNoShortOption,
                     DocPack::arg_parser::required_param, "level");
    parser.AddOption("color", "optional param", 'c', DocPack::arg_parser::optional_param, "when");
}
} // namespace

TEST(ArgParserTest, RejectsConflictingOptions) {
    CommandLine cmd({ "docpack" });
    DocPack::arg_parser parser { cmd.argc(), cmd.argv.data(), "8.8.8" };
    EXPECT_TRUE(parser.AddOption("aa", "short option without param", 'a'));
    EXPECT_FALSE(parser.AddOption("aa", "duplicate name", 'i'));
    EXPECT_FALSE(parser.AddOption("dd", "duplicate short option", 'a'));
    EXPECT_FALSE(parser.AddOption("dd", "reserved", '?'));
    EXPECT_FALSE(parser.AddOption("dd", "reserved", ':'));
    EXPECT_FALSE(parser.AddOption("dd", "help", 'h'));
    EXPECT_FALSE(parser.AddOption("dd", "version", 'v'));
    EXPECT_FALSE(parser.AddOption("dd", "not printable", '\n'));
    EXPECT_TRUE(parser.AddOption("dd", "long only"));
}

TEST(ArgParserTest, ParsesShortLongAndPositional) {
    CommandLine cmd({ "docpack", "-o", "book.epub", "--store", "mimetype", "-s", "cover.jpg", "-p", "--log-level=1",
                      "OEBPS", "META-INF" });
    DocPack::arg_parser parser { cmd.argc(), cmd.argv.data() };
    AddDocpackOptions(parser);
    ASSERT_TRUE(parser.ParseCommandLine());
    EXPECT_FALSE(parser.HasParam());
    EXPECT_EQ(parser.GetValue<std::string>("output"), "book.epub");
    EXPECT_EQ(parser.GetValues<std::string>("store"), (std::vector<std::string> { "mimetype", "cover.jpg" }));
    EXPECT_TRUE(parser.HasParam("parallel"));
    EXPECT_EQ(parser.GetValue<int>("log-level", -1), 1);
    EXPECT_EQ(parser.GetNonOptionValues(), (std::vector<std::string> { "OEBPS", "META-INF" }));
    EXPECT_FALSE(parser.HasParam("color"));
    EXPECT_FALSE(parser.HasParam("no-such-option"));
}

TEST(ArgParserTest, OptionalParam) {
    CommandLine cmd({ "docpack", "-c", "--color=always" });
    DocPack::arg_parser parser { cmd.argc(), cmd.argv.data() };
    AddDocpackOptions(parser);
    ASSERT_TRUE(parser.ParseCommandLine());
    EXPECT_TRUE(parser.HasParam("color"));
    EXPECT_EQ(parser.GetValues<std::string>("color"), std::vector<std::string> { "always" });
    EXPECT_EQ(parser.GetValue<std::string>("color", "never"), "always");
}

TEST(ArgParserTest, ConversionFallsBackToDefault) {
    CommandLine cmd({ "docpack", "--log-level", "verbose" });
    DocPack::arg_parser parser { cmd.argc(), cmd.argv.data() };
    AddDocpackOptions(parser);
    ASSERT_TRUE(parser.ParseCommandLine());
    EXPECT_EQ(parser.GetValue<int>("log-level", 2), 2);
    EXPECT_EQ(parser.GetValue<std::string>("log-level"), "verbose");
    EXPECT_EQ(parser.GetValue<int>("output", 3), 3);
}

TEST(ArgParserTest, UnknownOptionFails) {
    CommandLine cmd({ "docpack", "--bogus", "x" });
    DocPack::arg_parser parser { cmd.argc(), cmd.argv.data() };
    AddDocpackOptions(parser);
    EXPECT_FALSE(parser.ParseCommandLine());
}

TEST(ArgParserTest, MissingArgumentFails) {
    CommandLine cmd({ "docpack", "-o" });
    DocPack::arg_parser parser { cmd.argc(), cmd.argv.data() };
    AddDocpackOptions(parser);
    EXPECT_FALSE(parser.ParseCommandLine());
}

TEST(ArgParserTest, HelpAndVersion) {
    CommandLine cmd({ "docpack", "-h", "--version" });
    DocPack::arg_parser parser { cmd.argc(), cmd.argv.data(), "2.1.0" };
    AddDocpackOptions(parser);
    ASSERT_TRUE(parser.ParseCommandLine());
    EXPECT_TRUE(parser.HasParam());
    EXPECT_TRUE(parser.HasParam(DocPack::arg_parser::kVersionOptionName));

    std::ostringstream help;
    parser.ShowHelp(help);
    EXPECT_NE(help.str().find("-o,--output <file>"), std::string::npos) << help.str();
    EXPECT_NE(help.str().find("\t--log-level <level>"), std::string::npos) << help.str();
    EXPECT_NE(help.str().find("-c,--color [when]"), std::string::npos) << help.str();
    std::ostringstream version;
    parser.ShowVersion(version);
    EXPECT_EQ(version.str(), "Version: 2.1.0\n");

    std::ostringstream dump;
    parser.DumpOptions(dump);
    EXPECT_NE(dump.str().find("-h,--help\t{set}"), std::string::npos) << dump.str();
    EXPECT_NE(dump.str().find("-o,--output\t{not set}"), std::string::npos) << dump.str();
}

TEST(ArgParserTest, FromString) {
    EXPECT_TRUE(DocPack::from_string<bool>("TRUE"));
    EXPECT_TRUE(DocPack::from_string<bool>("1"));
    EXPECT_FALSE(DocPack::from_string<bool>("no"));
    EXPECT_EQ(DocPack::from_string<unsigned long>("4096"), 4096u);
    EXPECT_DOUBLE_EQ(DocPack::from_string<double>("1.5"), 1.5);
    EXPECT_THROW(DocPack::from_string<int>("abc"), std::invalid_argument);
}

int main(int argc, char** argv) {
    ::testing::InitGoogleTest(&argc, argv);
    return RUN_ALL_TESTS();
}
