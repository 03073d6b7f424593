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

#include <boost/log/trivial.hpp>
#include <map>
#include <string>
#include <string_view>

#include <libsplice/common/api/entry.hpp>

/*
 * LOGGER
 *
 * Thin wrapper around boost log.
 *
 * Console sink is colored, the file sink (~/.cache/splice/logs) gets the same
 * records with the ANSI codes stripped. Level comes from SPLICE_LOG_LEVEL.
 *
 * Prefer the tagged helpers in <libsplice/log-macros.hpp> over the raw macros below.
 */

// Force ANSI Colors (Ignoring Terminal Themes)
#define RESET  "\033[0m\033[39m\033[49m" // Reset all styles and colors
#define BOLD   "\033[1m"                 // Bold text
#define RED    "\033[38;5;124m"          // Gruvbox Red (#cc241d)
#define GREEN  "\033[38;5;142m"          // Gruvbox Green (#98971a)
#define YELLOW "\033[38;5;214m"          // Gruvbox Yellow (#d79921)
#define BLUE   "\033[38;5;109m"          // Gruvbox Blue (#458588)
#define PURPLE "\033[38;5;141m"          // Gruvbox Purple (#b16286) -> For TRACE logs

constexpr const char* ANSI_REGEX    = "\033\\[[0-9;]*m";
constexpr const char* REL_PATH_LOGS = ".cache/splice/logs";
constexpr const char* LOG_LEVEL_ENV = "SPLICE_LOG_LEVEL";

#define FILENAME \
  (__builtin_strrchr(__FILE__, '/') ? __builtin_strrchr(__FILE__, '/') + 1 : __FILE__)

#define GET_HOME_OR_RETURN(var)                                    \
  do                                                               \
  {                                                                \
    var = std::getenv("HOME");                                     \
    if (!(var))                                                    \
    {                                                              \
      std::cerr << "ERROR: Unable to determine HOME directory.\n"; \
      return;                                                      \
    }                                                              \
  } while (0)

#define LOG_FMT(str) BOLD str RESET

#define LOG_CATEGORIES                  \
  X(NET, "#NETWORK_LOG    ")            \
  X(RETRY, "#RETRY_LOG      ")          \
  X(RESOLVER, "#RESOLVER_LOG   ")       \
  X(CATALOG, "#CATALOG_LOG    ")        \
  X(STITCH, "#STITCH_LOG     ")         \
  X(AUDIO, "#AUDIO_LOG      ")          \
  X(DECODER, "#DECODER_LOG    ")        \
  X(MUXER, "#MUXER_LOG      ")          \
  X(LIBAV, "#LIBAV_LOG      ")          \
  X(CONFIG, "#CONFIG_LOG     ")         \
  X(CLIENT, "#CLIENT_LOG     ")

// Generate string constants
#define X(name, str) constexpr const char* name##_LOG = LOG_FMT(str);
LOG_CATEGORIES
#undef X
#undef LOG_FMT

namespace libsplice::log
{

// Tag types, used as log::INFO<log::NET>(...)
#define X(name, str)                                  \
  struct name                                         \
  {                                                   \
    static constexpr const char* prefix = name##_LOG; \
  };
LOG_CATEGORIES
#undef X

template <typename Tag> constexpr auto log_prefix() -> const char* { return Tag::prefix; }

// In priority order
enum class SeverityLevel
{
  Error,
  Warning,
  Info,
  Debug,
  Trace
};

inline const std::map<std::string, SeverityLevel, std::less<>> LOG_LEVEL_STR_MAP = {
  {"ERROR", SeverityLevel::Error}, {"WARNING", SeverityLevel::Warning},
  {"WARN", SeverityLevel::Warning}, {"INFO", SeverityLevel::Info},
  {"DEBUG", SeverityLevel::Debug}, {"TRACE", SeverityLevel::Trace},
};

inline const std::map<SeverityLevel, boost::log::trivial::severity_level> LOG_LEVEL_ENUM_MAP = {
  {SeverityLevel::Error, boost::log::trivial::error},
  {SeverityLevel::Warning, boost::log::trivial::warning},
  {SeverityLevel::Info, boost::log::trivial::info},
  {SeverityLevel::Debug, boost::log::trivial::debug},
  {SeverityLevel::Trace, boost::log::trivial::trace},
};

SPLICE_API auto strip_ansi(const std::string& input) -> std::string;
SPLICE_API auto get_current_timestamp() -> std::string;
SPLICE_API void init_logging();
SPLICE_API void set_log_level(SeverityLevel level);
SPLICE_API void flush_logs();

// Macros for logging
#define _TRACE_BACK_ "[" << FILENAME << ":" << __LINE__ << " - " << __func__ << "] "

#define LOG_TRACE   BOOST_LOG_TRIVIAL(trace) << _TRACE_BACK_
#define LOG_INFO    BOOST_LOG_TRIVIAL(info)
#define LOG_WARNING BOOST_LOG_TRIVIAL(warning)
#define LOG_ERROR   BOOST_LOG_TRIVIAL(error) << _TRACE_BACK_
#define LOG_DEBUG   BOOST_LOG_TRIVIAL(debug)

} // namespace libsplice::log
