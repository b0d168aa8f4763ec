#include "cli.hpp"

#include <gtest/gtest.h>

#include <string>
#include <vector>

using namespace cdihook;

namespace {

CliParser make_parser() {
    CliParser parser;
    parser.add_option({"rootfs", 'r', "Container rootfs", true, ""});
    parser.add_option({"config", 'c', "Config file", true, "/etc/cdi-hook.conf"});
    parser.add_option({"verbose", 'v', "Verbose", false, ""});
    return parser;
}

bool parse(CliParser& parser, std::vector<std::string> args) {
    args.insert(args.begin(), "cdi-hook");
    std::vector<char*> argv;
    for (auto& arg : args) {
        argv.push_back(arg.data());
    }
    return parser.parse(static_cast<int>(argv.size()), argv.data());
}

}  // namespace

TEST(CliParserTest, SubcommandOptionsAndPositionals) {
    CliParser parser = make_parser();
    ASSERT_TRUE(parse(parser, {"apply", "-v", "--rootfs", "/r", "hooks.json"}));

    EXPECT_EQ(parser.subcommand(), "apply");
    EXPECT_EQ(parser.positional(), std::vector<std::string>{"hooks.json"});
    EXPECT_EQ(parser.get_option("rootfs"), std::optional<std::string>("/r"));
    EXPECT_TRUE(parser.has_option("verbose"));
}

TEST(CliParserTest, InlineValueAndDefaults) {
    CliParser parser = make_parser();
    ASSERT_TRUE(parse(parser, {"apply", "--rootfs=/mnt/root", "f"}));

    EXPECT_EQ(parser.get_option("rootfs"), std::optional<std::string>("/mnt/root"));
    EXPECT_EQ(parser.get_option("config"), std::optional<std::string>("/etc/cdi-hook.conf"));
    EXPECT_FALSE(parser.has_option("config"));
    EXPECT_FALSE(parser.has_option("verbose"));
}

TEST(CliParserTest, DoubleDashEndsOptions) {
    CliParser parser = make_parser();
    ASSERT_TRUE(parse(parser, {"resolve", "--", "-weird-link", "target"}));

    EXPECT_EQ(parser.positional(), (std::vector<std::string>{"-weird-link", "target"}));
}

TEST(CliParserTest, RejectsUnknownOptionAndMissingValue) {
    CliParser unknown = make_parser();
    EXPECT_FALSE(parse(unknown, {"apply", "--bogus"}));

    CliParser missing = make_parser();
    EXPECT_FALSE(parse(missing, {"apply", "-r"}));
}
