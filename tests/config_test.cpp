#include <gtest/gtest.h>

#include <filesystem>
#include <fstream>
#include "cli/args_parser/args_parser.hpp"
#include "infra/config/config.hpp"

using progcp::infra::Config;
using progcp::infra::load_config_from_path;

namespace {

class ConfigFileTest : public ::testing::Test {
protected:
    void SetUp() override {
        const auto* info = ::testing::UnitTest::GetInstance()->current_test_info();
        path_ = std::filesystem::temp_directory_path()
              / (std::string("progcp_config_") + info->name() + ".yaml");
    }

    void TearDown() override {
        std::error_code ec;
        std::filesystem::remove(path_, ec);
    }

    void write(const std::string& text) {
        std::ofstream out(path_);
        out << text;
    }

    std::filesystem::path path_;
};

} // namespace

TEST_F(ConfigFileTest, ParsesAllKeys)
{
    write(
        "buffer_size: 65536\n"
        "refresh_interval_ms: 250\n"
        "max_width: 120\n"
        "bar_glyphs: \"-=#\"\n"
        "spinner: [\"|\", \"/\", \"-\", \"\\\\\"]\n"
        "recursive: true\n"
        "progress: false\n"
        "log_level: debug\n");

    auto cfg = load_config_from_path(path_);
    ASSERT_TRUE(cfg) << cfg.error();
    EXPECT_EQ(cfg->buffer_size, 65536u);
    EXPECT_EQ(cfg->refresh_interval_ms, 250u);
    EXPECT_EQ(cfg->max_width, 120u);
    EXPECT_EQ(cfg->bar_glyphs, "-=#");
    ASSERT_EQ(cfg->spinner.size(), 4u);
    EXPECT_EQ(cfg->spinner[3], "\\");
    EXPECT_TRUE(cfg->recursive);
    EXPECT_FALSE(cfg->progress);
    EXPECT_FALSE(cfg->quiet);
    EXPECT_EQ(cfg->log_level, "debug");
}

TEST_F(ConfigFileTest, MissingKeysKeepDefaults)
{
    write("quiet: true\n");
    auto cfg = load_config_from_path(path_);
    ASSERT_TRUE(cfg) << cfg.error();
    EXPECT_TRUE(cfg->quiet);
    EXPECT_TRUE(cfg->progress);
    EXPECT_FALSE(cfg->buffer_size.has_value());
    EXPECT_TRUE(cfg->spinner.empty());
}

TEST_F(ConfigFileTest, MalformedYamlIsReported)
{
    write("max_width: [unterminated\n");
    auto cfg = load_config_from_path(path_);
    ASSERT_FALSE(cfg);
    EXPECT_NE(cfg.error().find("Failed to parse"), std::string::npos);
}

TEST_F(ConfigFileTest, WrongTypeIsReported)
{
    write("max_width: wide\n");
    EXPECT_FALSE(load_config_from_path(path_));
}

TEST_F(ConfigFileTest, OutOfRangeValuesAreRejected)
{
    write("max_width: 5\n");
    auto cfg = load_config_from_path(path_);
    ASSERT_FALSE(cfg);
    EXPECT_NE(cfg.error().find("max_width"), std::string::npos);

    write("bar_glyphs: \"#\"\n");
    EXPECT_FALSE(load_config_from_path(path_));

    write("log_level: chatty\n");
    EXPECT_FALSE(load_config_from_path(path_));
}

TEST(ConfigTest, CliOverridesFile)
{
    Config file_cfg;
    file_cfg.buffer_size = 4096;
    file_cfg.max_width = 100;
    file_cfg.bar_glyphs = "-#";

    progcp::args_parser::CLIArgs args;
    args.buffer_size = 8192;
    args.no_progress = true;
    args.recursive = true;
    args.verbose = true;

    file_cfg.merge_with(progcp::infra::config_from_cli(args));
    EXPECT_EQ(file_cfg.buffer_size, 8192u);
    EXPECT_EQ(file_cfg.max_width, 100u);
    EXPECT_EQ(file_cfg.bar_glyphs, "-#");
    EXPECT_FALSE(file_cfg.progress);
    EXPECT_TRUE(file_cfg.recursive);
    EXPECT_EQ(file_cfg.log_level, "debug");
    EXPECT_TRUE(file_cfg.validate());
}

TEST(ConfigTest, ValidateRejectsZeroes)
{
    Config cfg;
    cfg.buffer_size = 0;
    EXPECT_FALSE(cfg.validate());

    cfg.buffer_size.reset();
    cfg.refresh_interval_ms = 0;
    EXPECT_FALSE(cfg.validate());
}
