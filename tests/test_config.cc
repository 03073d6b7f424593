/********************************************************************************
 *                               Splice Project                                 *
 *                  Fragmented Stream Reconstruction Toolkit                    *
 *                                                                              *
 *  Copyright (c) 2025 Oinkognito                                               *
 *  All rights reserved.                                                        *
 *                                                                              *
 *  License:                                                                    *
 *  This software is licensed under the BSD-3-Clause License. You may use,      *
 *  modify, and distribute this software under the conditions stated in the     *
 *  LICENSE file provided in the project root.                                  *
 *                                                                              *
 *  Warranty Disclaimer:                                                        *
 *  This software is provided "AS IS", without any warranties or guarantees,    *
 *  either expressed or implied, including but not limited to fitness for a     *
 *  particular purpose.                                                         *
 *                                                                              *
 *  Contributions:                                                              *
 *  Contributions are welcome. By submitting code, you agree to license your    *
 *  contributions under the same BSD-3-Clause terms.                            *
 *                                                                              *
 *  See LICENSE file for full legal details.                                    *
 ********************************************************************************/

#include <gtest/gtest.h>

#include <support/Argv.hpp>

#include <libsplice/common/error.hpp>
#include <libsplice/config/entry.hpp>

using namespace libsplice;
using namespace libsplice::config;
using splice_test::Argv;

TEST(ConfigTest, Defaults)
{
  const DownloadConfig config;

  EXPECT_EQ(config.max_attempts, 10);
  EXPECT_EQ(config.wait_seconds, 10);
  EXPECT_DOUBLE_EQ(config.time_limit_seconds, 0.0);
  EXPECT_EQ(config.quality, 3200000);
  EXPECT_FALSE(config.user_agent.empty());
  EXPECT_TRUE(config.scratch_dir.empty());
  EXPECT_NO_THROW(validate(config));

  const auto policy = config.retry_policy();
  EXPECT_EQ(policy.max_attempts(), 10);
  EXPECT_EQ(policy.wait(), std::chrono::seconds(10));
}

TEST(ConfigTest, TomlOverridesDefaults)
{
  const auto config = load_toml_string(R"(
    [download]
    max_attempts       = 3
    wait_seconds       = 2
    time_limit_seconds = 30
    quality            = 1600000
    scratch_dir        = "/var/tmp"

    [network]
    user_agent              = "test-agent/1.0"
    request_timeout_seconds = 5
  )");

  EXPECT_EQ(config.max_attempts, 3);
  EXPECT_EQ(config.wait_seconds, 2);
  EXPECT_DOUBLE_EQ(config.time_limit_seconds, 30.0);
  EXPECT_EQ(config.quality, 1600000);
  EXPECT_EQ(config.scratch_dir, fs::path("/var/tmp"));
  EXPECT_EQ(config.user_agent, "test-agent/1.0");
  EXPECT_EQ(config.request_timeout_seconds, 5);
}

TEST(ConfigTest, MissingKeysKeepTheBase)
{
  DownloadConfig base;
  base.quality = 800000;

  const auto config = load_toml_string("[download]\nwait_seconds = 0\n", base);

  EXPECT_EQ(config.quality, 800000);
  EXPECT_EQ(config.wait_seconds, 0);
  EXPECT_EQ(config.max_attempts, 10);
}

TEST(ConfigTest, WrongTypeIsRejected)
{
  EXPECT_THROW(load_toml_string("[download]\nmax_attempts = \"many\"\n"), ConfigError);
  EXPECT_THROW(load_toml_string("[network]\nuser_agent = 12\n"), ConfigError);
}

TEST(ConfigTest, OutOfRangeValuesAreRejected)
{
  EXPECT_THROW(load_toml_string("[download]\nmax_attempts = 0\n"), ConfigError);
  EXPECT_THROW(load_toml_string("[download]\nwait_seconds = -1\n"), ConfigError);
  EXPECT_THROW(load_toml_string("[download]\ntime_limit_seconds = -2.5\n"), ConfigError);
  EXPECT_THROW(load_toml_string("[download]\nquality = 0\n"), ConfigError);
  EXPECT_THROW(load_toml_string("[network]\nrequest_timeout_seconds = 0\n"), ConfigError);
  EXPECT_THROW(load_toml_string("[network]\nuser_agent = \"\"\n"), ConfigError);
}

TEST(ConfigTest, MalformedTomlIsAConfigError)
{
  EXPECT_THROW(load_toml_string("[download\nmax_attempts = 3\n"), ConfigError);
}

TEST(ConfigTest, MissingFileIsAConfigError)
{
  EXPECT_THROW(load_toml_file("/nonexistent/splice/config.toml"), ConfigError);
}

TEST(ConfigTest, TomlFileIsRead)
{
  utils::ScratchDir scratch;
  const auto        path = scratch.path() / "config.toml";
  utils::FileUtil<fs::path>::writeFile(path, "[download]\nquality = 400000\n");

  EXPECT_EQ(load_toml_file(path).quality, 400000);
}

TEST(ConfigTest, CommandLineWinsOverToml)
{
  const auto from_file = load_toml_string("[download]\nmax_attempts = 3\nquality = 1600000\n");
  const auto parser    = Argv{"splice", "-q", "800000", "--limit=12.5", "--timeout=9"}.parser();

  const auto config = apply_cmdline(parser, from_file);

  EXPECT_EQ(config.max_attempts, 3);
  EXPECT_EQ(config.quality, 800000);
  EXPECT_DOUBLE_EQ(config.time_limit_seconds, 12.5);
  EXPECT_EQ(config.request_timeout_seconds, 9);
  EXPECT_FALSE(parser.warn_unknown_args());
}

TEST(ConfigTest, BadCommandLineValueIsAConfigError)
{
  EXPECT_THROW(apply_cmdline(Argv({"splice", "--wait=soon"}).parser(), {}), ConfigError);
  EXPECT_THROW(apply_cmdline(Argv({"splice", "-m", "0"}).parser(), {}), ConfigError);
}
