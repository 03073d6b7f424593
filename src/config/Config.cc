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

#include <libsplice/config/entry.hpp>

#include <autogen/config.h>
#include <format>
#include <toml++/toml.hpp>

#include <libsplice/common/error.hpp>
#include <libsplice/common/macros.hpp>
#include <libsplice/log-macros.hpp>

using Config = libsplice::log::CONFIG;

namespace libsplice::config
{

namespace
{

// Present but of the wrong type is an error, absent is not
template <typename T>
auto read_key(const toml::table& tbl, std::string_view section, std::string_view key)
  -> std::optional<T>
{
  auto node = tbl[section][key];
  if (!node)
    return std::nullopt;

  if (auto value = node.template value<T>())
    return value;

  throw ConfigError("Invalid value for [" + std::string(section) + "] " + std::string(key));
}

auto from_table(const toml::table& tbl, DownloadConfig config) -> DownloadConfig
{
  const auto download = macros::CONFIG_SECTION_DOWNLOAD;
  const auto network  = macros::CONFIG_SECTION_NETWORK;

  if (auto v = read_key<int64_t>(tbl, download, TomlKeys::Download::MaxAttempts))
    config.max_attempts = static_cast<int>(*v);
  if (auto v = read_key<int64_t>(tbl, download, TomlKeys::Download::Wait))
    config.wait_seconds = static_cast<int>(*v);
  if (auto v = read_key<double>(tbl, download, TomlKeys::Download::TimeLimit))
    config.time_limit_seconds = *v;
  if (auto v = read_key<int64_t>(tbl, download, TomlKeys::Download::Quality))
    config.quality = static_cast<Bitrate>(*v);
  if (auto v = read_key<std::string>(tbl, download, TomlKeys::Download::ScratchDir))
    config.scratch_dir = *v;

  if (auto v = read_key<std::string>(tbl, network, TomlKeys::Network::UserAgent))
    config.user_agent = *v;
  if (auto v = read_key<int64_t>(tbl, network, TomlKeys::Network::Timeout))
    config.request_timeout_seconds = static_cast<int>(*v);

  validate(config);
  return config;
}

} // namespace

auto DownloadConfig::default_user_agent() -> std::string { return SPLICE_DEFAULT_USER_AGENT; }

auto DownloadConfig::retry_policy() const -> network::RetryPolicy
{
  return {max_attempts, std::chrono::seconds(wait_seconds)};
}

void validate(const DownloadConfig& config)
{
  if (config.max_attempts < 1)
    throw ConfigError("max_attempts must be at least 1, got " +
                      std::to_string(config.max_attempts));
  if (config.wait_seconds < 0)
    throw ConfigError("wait_seconds must not be negative, got " +
                      std::to_string(config.wait_seconds));
  if (config.time_limit_seconds < 0)
    throw ConfigError(std::format("time_limit_seconds must not be negative, got {}",
                                  config.time_limit_seconds));
  if (config.quality <= 0)
    throw ConfigError("quality must be a positive bitrate, got " + std::to_string(config.quality));
  if (config.request_timeout_seconds < 1)
    throw ConfigError("request_timeout_seconds must be at least 1, got " +
                      std::to_string(config.request_timeout_seconds));
  if (config.user_agent.empty())
    throw ConfigError("user_agent must not be empty");
}

auto load_toml_string(std::string_view text, DownloadConfig base) -> DownloadConfig
{
  try
  {
    return from_table(toml::parse(text), std::move(base));
  }
  catch (const toml::parse_error& e)
  {
    throw ConfigError(std::string("Malformed config: ") + std::string(e.description()));
  }
}

auto load_toml_file(const fs::path& path, DownloadConfig base) -> DownloadConfig
{
  log::INFO<Config>("Loading config file {}", path.string());
  try
  {
    return from_table(toml::parse_file(path.string()), std::move(base));
  }
  catch (const toml::parse_error& e)
  {
    throw ConfigError("Malformed config file " + path.string() + ": " +
                      std::string(e.description()));
  }
}

auto apply_cmdline(const utils::cmdline::CmdLineParser& parser, DownloadConfig config)
  -> DownloadConfig
{
  try
  {
    if (auto v = parser.get<int>({"max_attempts", "m"}))
      config.max_attempts = *v;
    if (auto v = parser.get<int>({"wait", "w"}))
      config.wait_seconds = *v;
    if (auto v = parser.get<double>({"limit", "l"}))
      config.time_limit_seconds = *v;
    if (auto v = parser.get<Bitrate>({"quality", "q"}))
      config.quality = *v;
    if (auto v = parser.get<std::string>("user_agent"))
      config.user_agent = *v;
    if (auto v = parser.get<int>("timeout"))
      config.request_timeout_seconds = *v;
    if (auto v = parser.get<std::string>("scratch"))
      config.scratch_dir = *v;
  }
  catch (const std::invalid_argument& e)
  {
    throw ConfigError(e.what());
  }

  validate(config);

  log::DBG<Config>("max_attempts={} wait={}s limit={}s quality={} timeout={}s",
                   config.max_attempts, config.wait_seconds, config.time_limit_seconds,
                   config.quality, config.request_timeout_seconds);
  return config;
}

} // namespace libsplice::config
