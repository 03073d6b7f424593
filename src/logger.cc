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

#include <libsplice/logger.hpp>

#include <algorithm>
#include <boost/filesystem/operations.hpp>
#include <boost/log/core.hpp>
#include <boost/log/expressions.hpp>
#include <boost/log/sinks.hpp>
#include <boost/log/sinks/text_file_backend.hpp>
#include <boost/log/support/date_time.hpp>
#include <boost/log/utility/setup/common_attributes.hpp>
#include <boost/log/utility/setup/console.hpp>
#include <boost/log/utility/setup/file.hpp>
#include <boost/make_shared.hpp>
#include <boost/regex.hpp>
#include <chrono>
#include <cstdlib>
#include <ctime>
#include <iomanip>
#include <iostream>
#include <sstream>

namespace libsplice::log
{

auto strip_ansi(const std::string& input) -> std::string
{
  static const boost::regex ansi_regex(ANSI_REGEX);
  return boost::regex_replace(input, ansi_regex, "");
}

auto get_current_timestamp() -> std::string
{
  using namespace std::chrono;

  const auto        now    = system_clock::now();
  const auto        now_ms = duration_cast<milliseconds>(now.time_since_epoch()) % 1000;
  const std::time_t t      = system_clock::to_time_t(now);
  const std::tm     local  = *std::localtime(&t);

  std::ostringstream oss;
  oss << std::put_time(&local, "%Y-%m-%d %H:%M:%S") << '.' << std::setw(3) << std::setfill('0')
      << now_ms.count();
  return oss.str();
}

void init_logging()
{
  namespace bfs     = boost::filesystem;
  namespace logging = boost::log;
  namespace trivial = boost::log::trivial;
  namespace sinks   = boost::log::sinks;
  namespace expr    = boost::log::expressions;
  namespace kw      = boost::log::keywords;
  using expr::stream;

  using Severity = trivial::severity_level;

  auto L_ConsoleFormatter = []
  {
    return stream << BOLD << "["
                  << expr::format_date_time<boost::posix_time::ptime>("TimeStamp",
                                                                      "%Y-%m-%d %H:%M:%S.%f")
                  << "] "
                  << expr::if_(expr::attr<Severity>("Severity") ==
                               trivial::trace)[stream << PURPLE << "[TRACE]   "]
                  << expr::if_(expr::attr<Severity>("Severity") ==
                               trivial::info)[stream << GREEN << "[INFO]    "]
                  << expr::if_(expr::attr<Severity>("Severity") ==
                               trivial::warning)[stream << YELLOW << "[WARN]    "]
                  << expr::if_(expr::attr<Severity>("Severity") ==
                               trivial::error)[stream << RED << "[ERROR]   "]
                  << expr::if_(expr::attr<Severity>("Severity") ==
                               trivial::debug)[stream << BLUE << "[DEBUG]   "]
                  << RESET << expr::smessage;
  };

  // Console goes to stderr: stdout is left to the caller (progress, quality listing)
  logging::add_console_log(std::clog, kw::format = L_ConsoleFormatter());
  logging::add_common_attributes();

  const char* env_level = std::getenv(LOG_LEVEL_ENV);

  if (env_level)
  {
    std::string level_str = env_level;
    std::ranges::for_each(level_str,
                          [](char& c) { c = std::toupper(static_cast<unsigned char>(c)); });

    auto it = LOG_LEVEL_STR_MAP.find(level_str);
    if (it != LOG_LEVEL_STR_MAP.end())
    {
      set_log_level(it->second);
    }
    else
    {
      std::cerr << "Invalid " << LOG_LEVEL_ENV << ": " << level_str << ". Using default.\n";
      set_log_level(SeverityLevel::Info);
    }
  }
  else
  {
    set_log_level(SeverityLevel::Info);
  }

  const char* home;
  GET_HOME_OR_RETURN(home);

  bfs::path                 log_dir = bfs::path(home) / REL_PATH_LOGS;
  boost::system::error_code ec;

  if (!bfs::exists(log_dir, ec))
  {
    if (!bfs::create_directories(log_dir, ec))
    {
      std::cerr << "ERROR: Failed to create log directory: " << log_dir.string() << " ("
                << ec.message() << ")" << std::endl;
      return;
    }
  }

  const std::string log_file = (log_dir / "splice_%Y-%m-%d_%H-%M-%S.log").string();

  // File logging (without ANSI codes)
  using text_sink = sinks::synchronous_sink<sinks::text_file_backend>;
  boost::shared_ptr<text_sink> file_sink =
    boost::make_shared<text_sink>(kw::file_name     = log_file,
                                  kw::rotation_size = 10 * 1024 * 1024, // 10 MB
                                  kw::auto_flush    = true);

  file_sink->set_formatter(
    [](boost::log::record_view const& rec, boost::log::formatting_ostream& strm)
    {
      auto        severity    = rec[trivial::severity];
      auto        message_ref = rec[expr::smessage];
      std::string message     = message_ref ? message_ref.get() : "";

      strm << "[" << get_current_timestamp() << "] " << (severity ? severity.get() : trivial::info)
           << " " << strip_ansi(message);
    });

  boost::log::core::get()->add_sink(file_sink);
}

void set_log_level(SeverityLevel level)
{
  namespace trivial = boost::log::trivial;

  auto it = LOG_LEVEL_ENUM_MAP.find(level);
  if (it != LOG_LEVEL_ENUM_MAP.end())
  {
    boost::log::core::get()->set_filter(trivial::severity >= it->second);
  }
  else
  {
    std::cerr << "Unknown log level specified.\n";
  }
}

void flush_logs() { boost::log::core::get()->flush(); }

} // namespace libsplice::log
