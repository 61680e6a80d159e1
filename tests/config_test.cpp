#include <gtest/gtest.h>

#include "infra/config/config.hpp"
#include "test_helpers.hpp"

using rcopy::infra::Config;
using rcopy::infra::load_config_from_file;

TEST(ConfigTest, LoadsAllKeys)
{
    rcopy::test::TempDir dir;
    rcopy::test::write_text(dir / "config.yaml",
        "chunk_size: 1048576\n"
        "max_chunks_buffer: 4\n"
        "progress: false\n"
        "quiet: true\n"
        "log_level: warn\n");

    auto cfg = load_config_from_file(dir / "config.yaml");
    ASSERT_TRUE(cfg) << cfg.error();
    EXPECT_EQ(cfg->chunk_size, 1048576u);
    EXPECT_EQ(cfg->max_chunks_buffer, 4u);
    EXPECT_FALSE(cfg->progress);
    EXPECT_TRUE(cfg->quiet);
    EXPECT_EQ(cfg->log_level, "warn");
}

TEST(ConfigTest, MissingKeysKeepDefaults)
{
    rcopy::test::TempDir dir;
    rcopy::test::write_text(dir / "config.yaml", "max_chunks_buffer: 2\n");

    auto cfg = load_config_from_file(dir / "config.yaml");
    ASSERT_TRUE(cfg) << cfg.error();
    EXPECT_FALSE(cfg->chunk_size.has_value());
    EXPECT_EQ(cfg->max_chunks_buffer, 2u);
    EXPECT_TRUE(cfg->progress);
    EXPECT_FALSE(cfg->quiet);
    EXPECT_FALSE(cfg->log_level.has_value());
}

TEST(ConfigTest, BadValuesAreReported)
{
    rcopy::test::TempDir dir;
    rcopy::test::write_text(dir / "config.yaml", "chunk_size: lots\n");

    auto cfg = load_config_from_file(dir / "config.yaml");
    ASSERT_FALSE(cfg);
    EXPECT_NE(cfg.error().find("config.yaml"), std::string::npos);
}

TEST(ConfigTest, ExplicitMissingFileIsError)
{
    rcopy::test::TempDir dir;
    EXPECT_FALSE(load_config_from_file(dir / "nope.yaml"));
}

TEST(ConfigTest, CliOverridesFile)
{
    Config file_cfg;
    file_cfg.chunk_size = 1 << 20;
    file_cfg.max_chunks_buffer = 4;
    file_cfg.log_level = "info";

    Config cli_cfg;
    cli_cfg.chunk_size = 1 << 16;
    cli_cfg.progress = false;
    cli_cfg.log_level = "debug";

    file_cfg.merge_with(cli_cfg);
    EXPECT_EQ(file_cfg.chunk_size, std::size_t{1} << 16);
    EXPECT_EQ(file_cfg.max_chunks_buffer, 4u);
    EXPECT_FALSE(file_cfg.progress);
    EXPECT_FALSE(file_cfg.quiet);
    EXPECT_EQ(file_cfg.log_level, "debug");
}

TEST(ConfigTest, UnknownLogLevelIsRejected)
{
    rcopy::test::TempDir dir;
    rcopy::test::write_text(dir / "config.yaml", "log_level: verbose\n");

    auto cfg = load_config_from_file(dir / "config.yaml");
    ASSERT_FALSE(cfg);
    EXPECT_NE(cfg.error().find("Failed to parse"), std::string::npos);
    EXPECT_NE(cfg.error().find("verbose"), std::string::npos);
}

TEST(ConfigTest, OffIsAValidLogLevel)
{
    rcopy::test::TempDir dir;
    rcopy::test::write_text(dir / "config.yaml", "log_level: off\n");

    auto cfg = load_config_from_file(dir / "config.yaml");
    ASSERT_TRUE(cfg) << cfg.error();
    EXPECT_EQ(cfg->log_level, "off");
}

TEST(ConfigTest, KnownLogLevelNames)
{
    for (const char* name : {"trace", "debug", "info", "warn", "warning", "err", "error", "critical", "off"}) {
        EXPECT_TRUE(rcopy::infra::is_known_log_level(name)) << name;
    }
    for (const char* name : {"verbose", "", "INFO!", "quiet"}) {
        EXPECT_FALSE(rcopy::infra::is_known_log_level(name)) << name;
    }
}
