#pragma once

#include <libsplice/logger.hpp>

#include <format>
#include <type_traits>

#define INIT_SPLICE_LOGGER_MACROS() namespace lslog = libsplice::log;

#define INIT_SPLICE_LOGGER()                                                               \
  libsplice::log::init_logging();                                                          \
  LOG_INFO << "Splice logger initialized! Check SPLICE_LOG_LEVEL (environment variable) " \
              "for which log level this session is on!!";

#define INIT_SPLICE_LOGGER_ALL() \
  INIT_SPLICE_LOGGER_MACROS();   \
  INIT_SPLICE_LOGGER();

/* ------------ LOGGING MACROS --------------- */

template <typename T, typename = void> struct is_formattable : std::false_type
{
};

template <typename T>
struct is_formattable<T, std::void_t<decltype(std::formatter<std::remove_cvref_t<T>, char>{})>>
    : std::true_type
{
};

template <typename... Args> constexpr bool all_formattable_v = (is_formattable<Args>::value && ...);

#define LOG_ARGS_TYPE_CHECK()                                                                    \
  static_assert(                                                                                 \
    all_formattable_v<Args...>,                                                                  \
    "One or more arguments passed to LOG MACROS are not formattable with std::format. Consider " \
    "converting types like std::filesystem::path to string using .string().");

namespace libsplice::log
{

template <typename Tag, typename... Args>
inline void INFO(std::format_string<Args...> fmt, Args&&... args)
{
  LOG_ARGS_TYPE_CHECK();
  LOG_INFO << log_prefix<Tag>() << std::format(fmt, std::forward<Args>(args)...);
}

template <typename Tag, typename... Args>
inline void ERROR(std::format_string<Args...> fmt, Args&&... args)
{
  LOG_ARGS_TYPE_CHECK();
  LOG_ERROR << log_prefix<Tag>() << std::format(fmt, std::forward<Args>(args)...);
}

template <typename Tag, typename... Args>
inline void DBG(std::format_string<Args...> fmt, Args&&... args)
{
  LOG_ARGS_TYPE_CHECK();
  LOG_DEBUG << log_prefix<Tag>() << std::format(fmt, std::forward<Args>(args)...);
}

template <typename Tag, typename... Args>
inline void TRACE(std::format_string<Args...> fmt, Args&&... args)
{
  LOG_ARGS_TYPE_CHECK();
  LOG_TRACE << log_prefix<Tag>() << std::format(fmt, std::forward<Args>(args)...);
}

template <typename Tag, typename... Args>
inline void WARN(std::format_string<Args...> fmt, Args&&... args)
{
  LOG_ARGS_TYPE_CHECK();
  LOG_WARNING << log_prefix<Tag>() << std::format(fmt, std::forward<Args>(args)...);
}

} // namespace libsplice::log
