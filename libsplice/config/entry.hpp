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

#pragma once

#include <optional>
#include <string>
#include <string_view>

#include <libsplice/common/api/entry.hpp>
#include <libsplice/common/macros.hpp>
#include <libsplice/common/types.hpp>
#include <libsplice/network/retry.hpp>
#include <libsplice/utils/cmd-line/parser.hpp>
#include <libsplice/utils/io/file/entry.hpp>

namespace TomlKeys
{
namespace Download
{
inline constexpr auto MaxAttempts = "max_attempts";
inline constexpr auto Wait        = "wait_seconds";
inline constexpr auto TimeLimit   = "time_limit_seconds";
inline constexpr auto Quality     = "quality";
inline constexpr auto ScratchDir  = "scratch_dir";
} // namespace Download

namespace Network
{
inline constexpr auto UserAgent = "user_agent";
inline constexpr auto Timeout   = "request_timeout_seconds";
} // namespace Network
} // namespace TomlKeys

namespace libsplice::config
{

/*
 * DownloadConfig
 *
 * Everything one run needs. Sources in increasing precedence:
 *
 *   built-in defaults  <  TOML file ([download], [network])  <  command line
 *
 * Every loader validates its result and throws ConfigError on a bad value.
 */
struct SPLICE_API DownloadConfig
{
  int         max_attempts            = SPLICE_DEFAULT_MAX_ATTEMPTS;
  int         wait_seconds            = SPLICE_DEFAULT_WAIT_SECONDS;
  Seconds     time_limit_seconds      = 0; // 0 means the whole stream
  Bitrate     quality                 = SPLICE_DEFAULT_QUALITY;
  std::string user_agent              = default_user_agent();
  int         request_timeout_seconds = SPLICE_DEFAULT_REQUEST_TIMEOUT;
  fs::path    scratch_dir; // empty means the system temp directory

  [[nodiscard]] auto retry_policy() const -> network::RetryPolicy;

  static auto default_user_agent() -> std::string;
};

// Throws ConfigError naming the first offending key
SPLICE_API void validate(const DownloadConfig& config);

SPLICE_API auto load_toml_string(std::string_view text, DownloadConfig base = {})
  -> DownloadConfig;
SPLICE_API auto load_toml_file(const fs::path& path, DownloadConfig base = {}) -> DownloadConfig;

// --max_attempts/-m, --wait/-w, --limit/-l, --quality/-q, --user_agent, --timeout, --scratch
SPLICE_API auto apply_cmdline(const utils::cmdline::CmdLineParser& parser, DownloadConfig base)
  -> DownloadConfig;

} // namespace libsplice::config
