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

#include <boost/algorithm/string/predicate.hpp>
#include <libsplice/common/error.hpp>
#include <libsplice/common/macros.hpp>
#include <libsplice/common/types.hpp>
#include <string>
#include <string_view>

/*
 * Small string-level URL helpers.
 *
 * Manifest URLs are rewritten purely textually (last segment replaced, base cut at a marker),
 * so nothing here normalises or percent-decodes anything.
 */

namespace libsplice::utils::url
{

struct ParsedUrl
{
  std::string scheme; // "https" or "http"
  Host        host;
  PortNo      port;
  NetTarget   target; // always starts with '/'

  [[nodiscard]] auto is_tls() const -> bool { return scheme == "https"; }
};

inline auto parse(const Url& url) -> ParsedUrl
{
  const auto scheme_end = url.find("://");
  if (scheme_end == Url::npos)
    throw ResolutionParseError("Malformed URL (no scheme): " + url);

  ParsedUrl out;
  out.scheme = url.substr(0, scheme_end);
  if (out.scheme != "https" && out.scheme != "http")
    throw ResolutionParseError("Unsupported URL scheme '" + out.scheme + "': " + url);

  const std::size_t start = scheme_end + 3;
  const std::size_t end   = url.find_first_of("/?#", start);

  std::string authority = url.substr(start, end == Url::npos ? Url::npos : end - start);
  if (authority.empty())
    throw ResolutionParseError("Malformed URL (no host): " + url);

  const std::size_t port_pos = authority.find(':');
  if (port_pos != std::string::npos)
  {
    out.host = authority.substr(0, port_pos);
    out.port = authority.substr(port_pos + 1);
  }
  else
  {
    out.host = authority;
    out.port = out.is_tls() ? SPLICE_HTTPS_PORT_STR : SPLICE_HTTP_PORT_STR;
  }

  if (end == Url::npos)
    out.target = "/";
  else if (url[end] != '/')
    out.target = "/" + url.substr(end);
  else
    out.target = url.substr(end);

  // Fragment identifiers never go on the wire
  if (const auto hash = out.target.find('#'); hash != NetTarget::npos)
    out.target.erase(hash);

  return out;
}

// "https://h/a/b/c" + "x" -> "https://h/a/b/x". A URL ending in '/' is left untouched.
inline auto replace_last_segment(const Url& url, std::string_view segment) -> Url
{
  const auto slash = url.rfind('/');
  if (slash == Url::npos || slash + 1 == url.size())
    return url;
  return url.substr(0, slash + 1) + std::string(segment);
}

// Cut everything from the first occurrence of marker onwards (marker included)
inline auto strip_from(const Url& url, std::string_view marker) -> Url
{
  const auto pos = url.find(marker);
  return pos == Url::npos ? url : url.substr(0, pos);
}

// Host names compare case-insensitively, ports and schemes are not compared
inline auto same_host(const Url& a, const Url& b) -> bool
{
  return boost::algorithm::iequals(parse(a).host, parse(b).host);
}

// Resolve a redirect Location header against the URL that produced it
inline auto resolve_location(const Url& base, const std::string& location) -> Url
{
  if (location.find("://") != std::string::npos)
    return location;

  const ParsedUrl parsed = parse(base);
  const bool      default_port =
    parsed.port == (parsed.is_tls() ? SPLICE_HTTPS_PORT_STR : SPLICE_HTTP_PORT_STR);
  const std::string origin =
    parsed.scheme + "://" + parsed.host + (default_port ? "" : ":" + parsed.port);

  if (location.starts_with("//"))
    return parsed.scheme + ":" + location;
  if (location.starts_with("/"))
    return origin + location;

  NetTarget dir = parsed.target.substr(0, parsed.target.find('?'));
  dir           = dir.substr(0, dir.rfind('/') + 1);
  return origin + dir + location;
}

} // namespace libsplice::utils::url
