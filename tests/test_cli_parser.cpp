//
// Created by Giuseppe Francione on 16/10/26.
//

#include <gtest/gtest.h>

#include "../taglog_cli/src/cli/cli_parser.hpp"
#include <CLI/CLI.hpp>

#include <filesystem>
#include <fstream>
#include <string>
#include <vector>

namespace {

class CliParserTest : public ::testing::Test {
protected:
    void SetUp() override {
        setup_cli_parser(app, settings);
    }

    void parse(const std::vector<std::string>& args) {
        std::vector<const char*> argv{"taglog"};
        for (const auto& a : args) argv.push_back(a.c_str());
        app.parse(static_cast<int>(argv.size()), argv.data());
    }

    CLI::App app{"taglog"};
    Settings settings;
};

} // namespace

TEST_F(CliParserTest, DefaultsMapToLogSettings) {
    parse({"hello"});

    const taglog::LogSettings s = settings.to_log_settings();
    EXPECT_TRUE(s.log_to_console);
    EXPECT_TRUE(s.log_to_history);
    EXPECT_TRUE(s.show_tag_header);
    EXPECT_FALSE(s.show_timestamp);
    EXPECT_EQ(s.default_active_tags, (std::vector<std::string>{"INFO"}));
    EXPECT_EQ(settings.messages, (std::vector<std::string>{"hello"}));
}

TEST_F(CliParserTest, FlagsMapToLogSettings) {
    parse({"--no-console", "--no-history", "--no-tag-header", "--timestamp",
           "-a", "UI", "--active", "PLAYER"});

    const taglog::LogSettings s = settings.to_log_settings();
    EXPECT_FALSE(s.log_to_console);
    EXPECT_FALSE(s.log_to_history);
    EXPECT_FALSE(s.show_tag_header);
    EXPECT_TRUE(s.show_timestamp);
    EXPECT_EQ(s.default_active_tags, (std::vector<std::string>{"UI", "PLAYER"}));
}

TEST_F(CliParserTest, TagTakesOneValuePerOccurrence) {
    parse({"-t", "UI", "-t", "WARN", "hello", "world"});

    EXPECT_EQ(settings.message_tags, (std::vector<std::string>{"UI", "WARN"}));
    EXPECT_EQ(settings.messages, (std::vector<std::string>{"hello", "world"}));
}

TEST_F(CliParserTest, FastRejectsMessageTags) {
    EXPECT_THROW(parse({"--fast", "-t", "UI", "hello"}), CLI::ValidationError);
}

TEST_F(CliParserTest, FastExcludesError) {
    EXPECT_THROW(parse({"--fast", "--error", "hello"}), CLI::ExcludesError);
}

TEST_F(CliParserTest, BlankTagIsRejected) {
    EXPECT_THROW(parse({"-a", "   ", "hello"}), CLI::ValidationError);
}

TEST_F(CliParserTest, ConfigFileSetsOptions) {
    const auto path = std::filesystem::temp_directory_path() / "taglog_cli_parser_test.ini";
    {
        std::ofstream out(path);
        out << "timestamp=true\n"
            << "no-history=true\n"
            << "active=UI\n";
    }

    parse({"--config", path.string(), "hello"});
    std::filesystem::remove(path);

    const taglog::LogSettings s = settings.to_log_settings();
    EXPECT_TRUE(s.show_timestamp);
    EXPECT_FALSE(s.log_to_history);
    EXPECT_EQ(s.default_active_tags, (std::vector<std::string>{"UI"}));
}
