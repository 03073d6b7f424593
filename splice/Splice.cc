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

#if __cplusplus < 202002L
#error "Splice requires C++20 or later."
#endif

#include <autogen/config.h>
#include <iostream>

#include <libsplice/common/error.hpp>
#include <libsplice/components/downloader/entry.hpp>
#include <libsplice/config/entry.hpp>
#include <libsplice/ffmpeg/decoder/entry.hpp>
#include <libsplice/ffmpeg/misc/avlog.hpp>
#include <libsplice/ffmpeg/muxer/entry.hpp>
#include <libsplice/log-macros.hpp>
#include <libsplice/network/entry.hpp>
#include <libsplice/utils/cmd-line/parser.hpp>

namespace
{

// Name of the most derived SpliceError, for the final log line
auto error_kind(const libsplice::SpliceError& e) -> const char*
{
  using namespace libsplice;
  if (dynamic_cast<const TransientNetworkError*>(&e))
    return "TransientNetworkError";
  if (dynamic_cast<const HttpStatusError*>(&e))
    return "HttpStatusError";
  if (dynamic_cast<const ProtocolError*>(&e))
    return "ProtocolError";
  if (dynamic_cast<const ResolutionParseError*>(&e))
    return "ResolutionParseError";
  if (dynamic_cast<const FormatMismatch*>(&e))
    return "FormatMismatch";
  if (dynamic_cast<const TimelineBoundaryError*>(&e))
    return "TimelineBoundaryError";
  if (dynamic_cast<const DecodeError*>(&e))
    return "DecodeError";
  if (dynamic_cast<const MuxError*>(&e))
    return "MuxError";
  if (dynamic_cast<const ConfigError*>(&e))
    return "ConfigError";
  return "SpliceError";
}

} // namespace

auto main(int argc, char* argv[]) -> int
{
  INIT_SPLICE_LOGGER_ALL();
  namespace logger = lslog;
  using Client     = libsplice::log::CLIENT;

  try
  {
    libsplice::utils::cmdline::CmdLineParser parser(std::span<char* const>(argv, argc));

    parser.register_args(
      {{{"max_attempts", "m"}, "Maximum attempts per request (default 10)"},
       {{"wait", "w"}, "Seconds to wait between attempts (default 10)"},
       {{"limit", "l"}, "Only write the first N seconds (default 0, the whole stream)"},
       {{"quality", "q"}, "Bitrate of the quality level to download (default 3200000)"},
       {{"config"}, "TOML config file with [download] and [network] sections"},
       {{"user_agent"}, "User-Agent sent with every request"},
       {{"timeout"}, "Per-request timeout in seconds (default 30)"},
       {{"scratch"}, "Directory for temporary files (default: system temp)"},
       {{"verbose_libav"}, "Let FFmpeg log down to debug level (Boolean flag)"}});

    if (parser.has("help"))
    {
      std::cerr << "splice " << SPLICE_VERSION << "\n";
      parser.print_usage("<URL> <FILE>");
      return SPLICE_RET_SUC;
    }

    libsplice::config::DownloadConfig config;
    if (auto path = parser.get<std::string>("config"))
      config = libsplice::config::load_toml_file(*path, config);
    config = libsplice::config::apply_cmdline(parser, config);

    const bool verbose_libav = parser.get_or<bool>("verbose_libav", false);

    parser.require_positionals(2);
    if (parser.warn_unknown_args())
    {
      parser.print_usage("<URL> <FILE>");
      return SPLICE_RET_FAIL;
    }

    const Url      url    = *parser.positional(0);
    const fs::path output = *parser.positional(1);

    libsplice::ffmpeg::install_av_log_bridge(verbose_libav);

    libsplice::network::HttpsClient client(config.user_agent,
                                           std::chrono::seconds(config.request_timeout_seconds));
    libsplice::ffmpeg::FFmpegFragmentDecoder decoder;
    libsplice::ffmpeg::MediaMuxer            muxer;

    libsplice::components::Downloader downloader(config, client, decoder, muxer);
    const int                         ret = downloader.run(url, output);

    libsplice::log::flush_logs();
    return ret;
  }
  catch (const libsplice::SpliceError& e)
  {
    logger::ERROR<Client>("{}: {}", error_kind(e), e.what());
  }
  catch (const std::invalid_argument& e)
  {
    logger::ERROR<Client>("Invalid arguments: {}", e.what());
  }
  catch (const std::exception& e)
  {
    logger::ERROR<Client>("Fatal: {}", e.what());
  }

  libsplice::log::flush_logs();
  return SPLICE_RET_FAIL;
}
