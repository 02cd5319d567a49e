#include <gtest/gtest.h>
#include "bgupload/core/cli.hpp"
#include <string>
#include <vector>

using namespace bgupload::core;

class CommandLineParserTest : public ::testing::Test {
protected:
    void SetUp() override {
        parser.add_option("", "cancel-after", "Cancel the upload after this many milliseconds",
                          OptionType::Integer);
        parser.add_option("", "status", "Status code the simulated server answers with",
                          OptionType::Integer);
        parser.add_command("upload", "upload <file> [uri]", "Queue an upload and attach to it");
    }
    
    bool parse(std::vector<std::string> args) {
        args.insert(args.begin(), "bgupload");
        std::vector<char*> argv;
        for (auto& arg : args) {
            argv.push_back(arg.data());
        }
        storage = std::move(args);
        return parser.parse(static_cast<int>(argv.size()), argv.data());
    }
    
    CommandLineParser parser{"bgupload"};
    std::vector<std::string> storage;
};

TEST_F(CommandLineParserTest, PositionalArguments) {
    ASSERT_TRUE(parse({"upload", "photo.jpg", "https://apis.example.com/files"}));
    
    EXPECT_EQ(parser.command(), "upload");
    auto args = parser.command_args();
    ASSERT_EQ(args.size(), 2u);
    EXPECT_EQ(args[0], "photo.jpg");
    EXPECT_EQ(args[1], "https://apis.example.com/files");
}

TEST_F(CommandLineParserTest, LongOptionsWithValues) {
    ASSERT_TRUE(parse({"--cancel-after", "150", "--status=403", "upload", "photo.jpg"}));
    
    EXPECT_EQ(parser.get_int_option("cancel-after").value_or(-1), 150);
    EXPECT_EQ(parser.get_int_option("status").value_or(201), 403);
    EXPECT_EQ(parser.get_positional_args().size(), 2u);
}

TEST_F(CommandLineParserTest, ShortOptionsAndDefaults) {
    ASSERT_TRUE(parse({"-c", "custom.conf", "--verbose"}));
    
    EXPECT_EQ(parser.get_option("config"), "custom.conf");
    EXPECT_TRUE(parser.get_bool_option("verbose"));
    EXPECT_FALSE(parser.has_option("help"));
    EXPECT_FALSE(parser.get_int_option("cancel-after").has_value());
    EXPECT_TRUE(parser.command().empty());
}

TEST_F(CommandLineParserTest, ConfigHasDefaultPath) {
    ASSERT_TRUE(parse({}));
    EXPECT_EQ(parser.get_option("config"), "~/.bgupload.conf");
}

TEST_F(CommandLineParserTest, NonNumericValueFallsBack) {
    ASSERT_TRUE(parse({"--cancel-after", "later"}));
    EXPECT_FALSE(parser.get_int_option("cancel-after").has_value());
    EXPECT_TRUE(parser.command().empty());
}

TEST_F(CommandLineParserTest, UnknownOptionFails) {
    EXPECT_FALSE(parse({"--resume"}));
    EXPECT_EQ(parser.get_error(), "Unknown option: --resume");
}

TEST_F(CommandLineParserTest, MissingValueFails) {
    EXPECT_FALSE(parse({"upload", "--status"}));
    EXPECT_EQ(parser.get_error(), "Option --status requires a value");
}
