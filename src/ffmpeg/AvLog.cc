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

#include <libsplice/ffmpeg/misc/avlog.hpp>

#include <cstdarg>
#include <cstdio>

#include <libsplice/log-macros.hpp>

extern "C"
{
#include <libavutil/error.h>
#include <libavutil/log.h>
}

using Libav = libsplice::log::LIBAV;

namespace libsplice::ffmpeg
{

namespace
{

void av_log_bridge(void* avcl, int level, const char* fmt, va_list args)
{
  if (level > av_log_get_level())
    return;

  char line[1024];
  int  print_prefix = 1;
  av_log_format_line2(avcl, level, fmt, args, line, sizeof(line), &print_prefix);

  std::string msg(line);
  while (!msg.empty() && (msg.back() == '\n' || msg.back() == '\r'))
    msg.pop_back();
  if (msg.empty())
    return;

  if (level <= AV_LOG_ERROR)
    log::ERROR<Libav>("{}", msg);
  else if (level <= AV_LOG_WARNING)
    log::WARN<Libav>("{}", msg);
  else if (level <= AV_LOG_INFO)
    log::DBG<Libav>("{}", msg);
  else
    log::TRACE<Libav>("{}", msg);
}

} // namespace

void install_av_log_bridge(bool verbose)
{
  av_log_set_level(verbose ? AV_LOG_DEBUG : AV_LOG_ERROR);
  av_log_set_callback(&av_log_bridge);
}

auto av_error_string(int errnum) -> std::string
{
  char buf[AV_ERROR_MAX_STRING_SIZE] = {0};
  av_strerror(errnum, buf, sizeof(buf));
  return buf;
}

} // namespace libsplice::ffmpeg
