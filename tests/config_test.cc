#include <core/util/config.h>
#include <fstream>
#include <gtest/gtest.h>
#include <sstream>
#include <test_support.h>

using namespace tailkit::core;
using namespace tailkit::test;

namespace {

std::string ReadFile(const std::filesystem::path& file) {
    std::ifstream ifs(file);
    std::stringstream ss;
    ss << ifs.rdbuf();
    return ss.str();
}

} // namespace

TEST(ConfigTest, CreatesMissingFileWithDefaults) {
    TempDir dir;
    auto file = dir.path() / "nested" / "config.toml";

    InitConfig(file);

    EXPECT_TRUE(std::filesystem::exists(file));
    EXPECT_EQ(settings.binary_path, "/usr/bin/tailscale");
    EXPECT_EQ(settings.fallback_binary_path, "/usr/local/bin/tailscale");
    EXPECT_EQ(settings.command_timeout, std::chrono::milliseconds(0));
    EXPECT_EQ(settings.log_level, "info");
}

TEST(ConfigTest, ReadsSettings) {
    TempDir dir;
    auto file = dir.WriteFile("config.toml",
                              "[setting]\n"
                              "binary-path = \"/opt/tailscale/bin/tailscale\"\n"
                              "command-timeout-ms = 2500\n"
                              "log-level = \"debug\"\n");

    InitConfig(file);

    EXPECT_EQ(settings.binary_path, "/opt/tailscale/bin/tailscale");
    EXPECT_EQ(settings.fallback_binary_path, "/usr/local/bin/tailscale");
    EXPECT_EQ(settings.command_timeout, std::chrono::milliseconds(2500));
    EXPECT_EQ(settings.log_level, "debug");
}

TEST(ConfigTest, SaveThenLoad) {
    TempDir dir;
    auto file = dir.path() / "config.toml";
    InitConfig(file);

    settings.binary_path = "/custom/tailscale";
    settings.fallback_binary_path = "/custom/fallback";
    settings.command_timeout = std::chrono::seconds(3);
    settings.log_level = "warning";
    SaveConfig(file);

    EXPECT_NE(ReadFile(file).find("binary-path"), std::string::npos);

    settings = Settings{};
    InitConfig(file);
    EXPECT_EQ(settings.binary_path, "/custom/tailscale");
    EXPECT_EQ(settings.fallback_binary_path, "/custom/fallback");
    EXPECT_EQ(settings.command_timeout, std::chrono::milliseconds(3000));
    EXPECT_EQ(settings.log_level, "warning");
}

TEST(ConfigTest, SaveKeepsOtherTables) {
    TempDir dir;
    auto file = dir.WriteFile("config.toml", "[extra]\nanswer = 42\n");
    InitConfig(file);

    SaveConfig(file);

    InitConfig(file);
    EXPECT_EQ(config["extra"]["answer"].value_or(int64_t{0}), 42);
}

TEST(ConfigTest, InvalidTomlFallsBackToDefaults) {
    TempDir dir;
    auto file = dir.WriteFile("config.toml", "[setting\nbinary-path = = \"x\"\n");

    InitConfig(file);

    EXPECT_EQ(settings.binary_path, "/usr/bin/tailscale");
    EXPECT_EQ(settings.log_level, "info");
}

TEST(ConfigTest, SettingThatIsNotATable) {
    TempDir dir;
    auto file = dir.WriteFile("config.toml", "setting = 5\n");

    InitConfig(file);

    EXPECT_EQ(settings.binary_path, "/usr/bin/tailscale");
    EXPECT_TRUE(config["setting"].is_table());
}

TEST(ConfigTest, WrongValueTypesUseDefaults) {
    TempDir dir;
    auto file = dir.WriteFile("config.toml",
                              "[setting]\n"
                              "binary-path = 12\n"
                              "command-timeout-ms = \"soon\"\n");

    InitConfig(file);

    EXPECT_EQ(settings.binary_path, "/usr/bin/tailscale");
    EXPECT_EQ(settings.command_timeout, std::chrono::milliseconds(0));
}

TEST(ConfigTest, NegativeTimeoutMeansNoTimeout) {
    TempDir dir;
    auto file = dir.WriteFile("config.toml", "[setting]\ncommand-timeout-ms = -20\n");

    InitConfig(file);

    EXPECT_EQ(settings.command_timeout, std::chrono::milliseconds(0));
}

TEST(ConfigTest, MakeServiceOptions) {
    Settings from{
        .binary_path = "/a/tailscale",
        .fallback_binary_path = "/b/tailscale",
        .command_timeout = std::chrono::milliseconds(750),
        .log_level = "error",
    };

    auto options = MakeServiceOptions(from);
    EXPECT_EQ(options.binary_path, "/a/tailscale");
    EXPECT_EQ(options.fallback_binary_path, "/b/tailscale");
    EXPECT_EQ(options.command_timeout, std::chrono::milliseconds(750));
}
