#include <gtest/gtest.h>

#include <cstdio>
#include <filesystem>
#include <fstream>

#include "core/config.hpp"

using namespace tabsync;

namespace
{

std::string temp_config_path(const char* name)
{
    return (std::filesystem::temp_directory_path() / "tabsync_test" / name).string();
}

}   // namespace

// ═══════════════════════════════════════════════════════════════════════════════
// Serialization
// ═══════════════════════════════════════════════════════════════════════════════

TEST(TabsyncConfig, DefaultsMatchDocumentedValues)
{
    TabsyncConfig c;
    EXPECT_FLOAT_EQ(c.drag_threshold_px, 5.0f);
    EXPECT_EQ(c.suppression_timeout_ms, 2000u);
    EXPECT_EQ(c.push_debounce_ms, 100u);
    EXPECT_EQ(c.max_tabs, 20u);
    EXPECT_EQ(c.home_url, "tabsync://home");
    EXPECT_EQ(c.parsed_log_level(), LogLevel::Info);
}

TEST(TabsyncConfig, SerializeThenDeserialize)
{
    TabsyncConfig out;
    out.drag_threshold_px      = 8.5f;
    out.suppression_timeout_ms = 1500;
    out.push_debounce_ms       = 50;
    out.max_tabs               = 12;
    out.home_url               = "https://start.test/\"quoted\"";
    out.socket_path            = "/tmp/ts.sock";
    out.log_level              = "debug";
    out.log_file               = "C:\\logs\\tabsync.log";

    TabsyncConfig in;
    ASSERT_TRUE(in.deserialize(out.serialize()));
    EXPECT_FLOAT_EQ(in.drag_threshold_px, 8.5f);
    EXPECT_EQ(in.suppression_timeout_ms, 1500u);
    EXPECT_EQ(in.push_debounce_ms, 50u);
    EXPECT_EQ(in.max_tabs, 12u);
    EXPECT_EQ(in.home_url, out.home_url);
    EXPECT_EQ(in.socket_path, "/tmp/ts.sock");
    EXPECT_EQ(in.log_level, "debug");
    EXPECT_EQ(in.log_file, out.log_file);
}

TEST(TabsyncConfig, MissingKeysKeepDefaults)
{
    TabsyncConfig c;
    ASSERT_TRUE(c.deserialize(R"({ "max_tabs": 5 })"));
    EXPECT_EQ(c.max_tabs, 5u);
    EXPECT_EQ(c.suppression_timeout_ms, 2000u);
    EXPECT_EQ(c.home_url, "tabsync://home");
}

TEST(TabsyncConfig, RejectsEmptyAndFutureVersion)
{
    TabsyncConfig c;
    EXPECT_FALSE(c.deserialize(""));
    EXPECT_FALSE(c.deserialize("not json"));
    EXPECT_FALSE(c.deserialize(R"({ "version": 2, "max_tabs": 3 })"));
    EXPECT_EQ(c.max_tabs, 20u);
}

TEST(TabsyncConfig, OutOfRangeValuesAreIgnored)
{
    TabsyncConfig c;
    ASSERT_TRUE(c.deserialize(R"({ "push_debounce_ms": -5, "max_tabs": 1e12, "drag_threshold_px": -1 })"));
    EXPECT_EQ(c.push_debounce_ms, 100u);
    EXPECT_EQ(c.max_tabs, 20u);
    EXPECT_FLOAT_EQ(c.drag_threshold_px, 5.0f);
}

TEST(TabsyncConfig, WrongTypesAreIgnored)
{
    TabsyncConfig c;
    ASSERT_TRUE(c.deserialize(R"({ "max_tabs": "many", "home_url": 42 })"));
    EXPECT_EQ(c.max_tabs, 20u);
    EXPECT_EQ(c.home_url, "tabsync://home");
}

TEST(TabsyncConfig, UnknownLogLevelParsesToNothing)
{
    TabsyncConfig c;
    c.log_level = "loud";
    EXPECT_FALSE(c.parsed_log_level().has_value());
    c.log_level = "WARNING";
    EXPECT_EQ(c.parsed_log_level(), LogLevel::Warning);
}

TEST(TabsyncConfig, SaveAndLoadFile)
{
    std::string path = temp_config_path("save_load.json");
    TabsyncConfig out;
    out.max_tabs = 7;
    ASSERT_TRUE(out.save(path));

    TabsyncConfig in;
    ASSERT_TRUE(in.load(path));
    EXPECT_EQ(in.max_tabs, 7u);
    std::remove(path.c_str());
}

TEST(TabsyncConfig, LoadMissingFileFails)
{
    TabsyncConfig c;
    EXPECT_FALSE(c.load(temp_config_path("does_not_exist.json")));
}

// ═══════════════════════════════════════════════════════════════════════════════
// Command line
// ═══════════════════════════════════════════════════════════════════════════════

TEST(CommandLine, ParsesKnownOptions)
{
    const char* argv[] = {"tabsync-shell", "--config", "/etc/ts.json", "--socket", "/tmp/s",
                          "--log-level", "trace", "--inproc", "extra"};
    auto cli = parse_command_line(9, argv);
    ASSERT_TRUE(cli.ok()) << cli.error;
    EXPECT_EQ(cli.config_path, "/etc/ts.json");
    EXPECT_EQ(cli.socket_path, "/tmp/s");
    EXPECT_EQ(cli.log_level, "trace");
    EXPECT_TRUE(cli.inproc);
    EXPECT_FALSE(cli.show_help);
    EXPECT_EQ(cli.positional, (std::vector<std::string>{"extra"}));
}

TEST(CommandLine, HelpFlag)
{
    const char* argv[] = {"tabsync-shell", "-h"};
    auto        cli    = parse_command_line(2, argv);
    EXPECT_TRUE(cli.ok());
    EXPECT_TRUE(cli.show_help);
}

TEST(CommandLine, MissingValueIsError)
{
    const char* argv[] = {"tabsync-shell", "--socket"};
    auto        cli    = parse_command_line(2, argv);
    EXPECT_FALSE(cli.ok());
    EXPECT_NE(cli.error.find("--socket"), std::string::npos);
}

TEST(CommandLine, UnknownOptionIsError)
{
    const char* argv[] = {"tabsync-shell", "--frobnicate"};
    EXPECT_FALSE(parse_command_line(2, argv).ok());
}

TEST(CommandLine, BadLogLevelIsError)
{
    const char* argv[] = {"tabsync-shell", "--log-level", "chatty"};
    auto        cli    = parse_command_line(3, argv);
    EXPECT_FALSE(cli.ok());
    EXPECT_NE(cli.error.find("chatty"), std::string::npos);
}

TEST(CommandLine, ResolveAppliesOverridesOnTopOfFile)
{
    std::string path = temp_config_path("resolve.json");
    {
        TabsyncConfig file;
        file.socket_path = "/from/file";
        file.log_level   = "error";
        file.max_tabs    = 9;
        ASSERT_TRUE(file.save(path));
    }

    const char* argv[] = {"tabsync-authority", "--config", path.c_str(), "--socket", "/from/cli"};
    auto        config = resolve_config(parse_command_line(5, argv));
    EXPECT_EQ(config.socket_path, "/from/cli");
    EXPECT_EQ(config.log_level, "error");
    EXPECT_EQ(config.max_tabs, 9u);
    EXPECT_FALSE(config.inproc);
    std::remove(path.c_str());
}

TEST(CommandLine, ResolveWithUnreadableFileKeepsDefaults)
{
    std::string path   = temp_config_path("missing_resolve.json");
    const char* argv[] = {"tabsync-shell", "--config", path.c_str(), "--inproc"};
    auto        config = resolve_config(parse_command_line(4, argv));
    EXPECT_EQ(config.max_tabs, 20u);
    EXPECT_TRUE(config.inproc);
}
