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

#include <algorithm>
#include <cctype>
#include <charconv>
#include <iostream>
#include <map>
#include <optional>
#include <set>
#include <span>
#include <sstream>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

#include <libsplice/common/api/entry.hpp>

/*
 * Accepted forms:
 *
 *   --key=value     long option with a value
 *   --key           boolean flag
 *   -k value, -k=v  short option (always takes a value)
 *   -h, --help      help
 *   anything else   positional argument, in order
 */

namespace libsplice::utils::cmdline
{

struct CmdArg
{
  std::vector<std::string> keys;
  std::string              description;

  CmdArg(std::initializer_list<std::string> k, std::string desc)
      : keys(k), description(std::move(desc))
  {
  }
};

class SPLICE_API CmdLineParser
{
public:
  CmdLineParser(std::span<char* const> argv)
  {
    if (!argv.empty() && argv[0])
      m_program = argv[0];

    for (size_t i = 1; i < argv.size(); ++i)
    {
      std::string arg = argv[i];
      if (arg == "--help" || arg == "-h")
      {
        m_args["help"] = "true";
        continue;
      }

      if (arg.starts_with("--"))
      {
        size_t eq_pos = arg.find('=');
        if (eq_pos != std::string::npos)
        {
          auto key               = arg.substr(2, eq_pos - 2);
          auto val               = arg.substr(eq_pos + 1);
          m_args[std::move(key)] = std::move(val);
        }
        else
        {
          m_args[arg.substr(2)] = "true"; // boolean flag
        }
      }
      else if (arg.size() >= 2 && arg[0] == '-' && std::isalpha(static_cast<unsigned char>(arg[1])))
      {
        size_t eq_pos = arg.find('=');
        if (eq_pos != std::string::npos)
          m_args[arg.substr(1, eq_pos - 1)] = arg.substr(eq_pos + 1);
        else if (i + 1 < argv.size())
          m_args[arg.substr(1)] = argv[++i];
        else
          throw std::invalid_argument("Missing value for option " + arg);
      }
      else
      {
        m_positionals.push_back(std::move(arg));
      }
    }
  }

  void register_arg(const CmdArg& arg) { m_registeredArgs.push_back(arg); }

  void register_args(std::initializer_list<CmdArg> args)
  {
    for (const auto& a : args)
      register_arg(a);
  }

  // Throws std::invalid_argument when the option is present but its value does not parse
  template <typename T> auto get(const std::string& key) const -> std::optional<T>
  {
    m_accessedKeys.insert(key);
    auto it = m_args.find(key);
    if (it == m_args.end())
      return std::nullopt;
    return parse_or_throw<T>(key, it->second);
  }

  template <typename T> auto get_or(const std::string& key, T fallback) const -> T
  {
    auto val = get<T>(key);
    return val.value_or(fallback);
  }

  [[nodiscard]] auto has(const std::string& key) const -> bool
  {
    m_accessedKeys.insert(key);
    return m_args.find(key) != m_args.end();
  }

  // Get with alias list
  template <typename T> auto get(std::initializer_list<std::string> keys) const -> std::optional<T>
  {
    for (const auto& key : keys)
    {
      m_accessedKeys.insert(key);
      auto it = m_args.find(key);
      if (it != m_args.end())
        return parse_or_throw<T>(key, it->second);
    }
    return std::nullopt;
  }

  // Get with fallback and alias list
  template <typename T> auto get_or(std::initializer_list<std::string> keys, T fallback) const -> T
  {
    auto val = get<T>(keys);
    return val.value_or(fallback);
  }

  // Has with alias list
  [[nodiscard]] auto has(std::initializer_list<std::string> keys) const -> bool
  {
    for (const auto& key : keys)
    {
      m_accessedKeys.insert(key);
      if (m_args.contains(key))
        return true;
    }
    return false;
  }

  [[nodiscard]] auto positionals() const -> const std::vector<std::string>& { return m_positionals; }

  [[nodiscard]] auto positional(size_t index) const -> std::optional<std::string>
  {
    if (index >= m_positionals.size())
      return std::nullopt;
    return m_positionals[index];
  }

  void require_positionals(size_t count) const
  {
    if (m_positionals.size() != count)
    {
      std::cerr << "Expected " << count << " positional arguments, but got "
                << m_positionals.size() << ".\n";
      print_usage();
      throw std::invalid_argument("Wrong number of positional arguments.");
    }
  }

  // Returns true when something was reported
  auto warn_unknown_args() const -> bool
  {
    bool found_errors = false;
    for (const auto& [key, val] : m_args)
    {
      if (!m_accessedKeys.contains(key) && key != "help")
      {
        std::cerr << "[CLI] Unrecognized or unused CLI argument: "
                  << (key.size() == 1 ? "-" : "--") << key
                  << (val != "true" ? ("=" + val) : "") << "\n";
        found_errors = true;
      }
    }
    return found_errors;
  }

  void print_usage(std::string_view positional_help = {}) const
  {
    std::cerr << "Usage: " << m_program << " " << positional_help << " [options]\n";
    for (const auto& arg : m_registeredArgs)
    {
      std::string aliases;
      for (const auto& k : arg.keys)
      {
        aliases += (k.size() == 1 ? "-" : "--") + k + ", ";
      }
      if (!aliases.empty())
        aliases.erase(aliases.size() - 2); // Remove trailing comma+space

      std::cerr << "  " << aliases;
      std::cerr << "\n      " << arg.description << "\n";
    }
  }

private:
  std::string                        m_program = "splice";
  std::map<std::string, std::string> m_args;
  std::vector<std::string>           m_positionals;
  mutable std::set<std::string>      m_accessedKeys;
  std::vector<CmdArg>                m_registeredArgs;

  template <typename T>
  static auto parse_or_throw(const std::string& key, const std::string& s) -> std::optional<T>
  {
    auto val = parse_value<T>(s);
    if (!val)
      throw std::invalid_argument("Invalid value for " + key + ": " + s);
    return val;
  }

  template <typename T> static auto parse_value(const std::string& s) -> std::optional<T>
  {
    if constexpr (std::is_same_v<T, std::string>)
    {
      return s;
    }
    else if constexpr (std::is_same_v<T, bool>)
    {
      std::string val = s;
      std::ranges::transform(val, val.begin(), ::tolower);
      return val == "true" || val == "1" || val == "yes";
    }
    else if constexpr (std::is_integral_v<T>)
    {
      T out;
      auto [ptr, ec] = std::from_chars(s.data(), s.data() + s.size(), out);
      if (ec == std::errc() && ptr == s.data() + s.size())
        return out;
      return std::nullopt;
    }
    else
    {
      std::istringstream iss(s);
      T                  out;
      iss >> out >> std::ws;
      if (!iss.fail() && iss.eof())
        return out;
      return std::nullopt;
    }
  }
};

} // namespace libsplice::utils::cmdline
