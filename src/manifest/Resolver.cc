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

#include <libsplice/manifest/resolver.hpp>

#include <algorithm>
#include <charconv>
#include <sstream>

#include <libsplice/common/error.hpp>
#include <libsplice/common/macros.hpp>
#include <libsplice/log-macros.hpp>
#include <libsplice/manifest/session.hpp>
#include <libsplice/utils/url/entry.hpp>

using Resolver = libsplice::log::RESOLVER;

namespace libsplice::manifest
{

namespace
{

auto parse_quality_level(const std::string& line) -> Bitrate
{
  const auto  start = macros::MANIFEST_QUALITY_PREFIX.size();
  const auto  end   = line.find(')', start);
  const char* first = line.data() + start;
  const char* last  = line.data() + (end == std::string::npos ? line.size() : end);

  Bitrate bitrate = 0;
  auto [ptr, ec]  = std::from_chars(first, last, bitrate);
  if (ec != std::errc() || ptr != last)
    throw ResolutionParseError("Invalid quality level line: " + line);
  return bitrate;
}

} // namespace

auto QualityUnavailable::message() const -> std::string
{
  std::string msg = "Incorrect quality level. The available quality levels are:";
  for (const auto bitrate : available)
    msg += "\n  " + std::to_string(bitrate);
  return msg;
}

auto classify(const Url& url) -> ResolverState
{
  if (url.find(macros::MANIFEST_TERMINAL_MARK) != Url::npos)
    return state::Terminal{url};
  if (url.find(macros::MANIFEST_QUALITY_MARK) != Url::npos)
    return state::QualitySelect{url};
  return state::LandingPage{url};
}

auto select_quality(const Url& url, const ManifestData& text, Bitrate quality) -> ResolveResult
{
  ManifestData clean = text;
  std::erase(clean, '\r');

  const std::string wanted = macros::to_string(macros::MANIFEST_QUALITY_PREFIX) +
                             std::to_string(quality) +
                             macros::to_string(macros::MANIFEST_QUALITY_SUFFIX);

  std::istringstream stream(clean);
  std::string        line;
  Bitrates           available;

  while (std::getline(stream, line))
  {
    if (!line.starts_with(macros::MANIFEST_QUALITY_PREFIX))
      continue;

    available.push_back(parse_quality_level(line));

    if (line.starts_with(wanted))
      return utils::url::replace_last_segment(url, line);
  }

  std::ranges::sort(available);
  const auto dup = std::ranges::unique(available);
  available.erase(dup.begin(), dup.end());

  return QualityUnavailable{.requested = quality, .available = std::move(available)};
}

auto ManifestResolver::resolve(const Url& url, Bitrate quality, const network::RetryPolicy& policy)
  -> ResolveResult
{
  ResolverState current = classify(url);

  for (int hop = 0; hop < SPLICE_MAX_RESOLUTION_HOPS; ++hop)
  {
    if (const auto* terminal = std::get_if<state::Terminal>(&current))
    {
      log::INFO<Resolver>("Terminal manifest: {}", terminal->url);
      return terminal->url;
    }

    if (const auto* listing = std::get_if<state::QualitySelect>(&current))
    {
      log::INFO<Resolver>("Selecting quality {} from {}", quality, listing->url);
      const auto res = m_transport.fetch(listing->url, policy);

      ResolveResult result = select_quality(listing->url, res.body, quality);
      if (const auto* manifest = std::get_if<Url>(&result))
        log::INFO<Resolver>("Terminal manifest: {}", *manifest);
      return result;
    }

    const auto& landing = std::get<state::LandingPage>(current);
    current             = classify(resolveLanding(landing.url, policy));
  }

  throw ResolutionParseError("No terminal manifest reached after " +
                             std::to_string(SPLICE_MAX_RESOLUTION_HOPS) + " hops from \"" + url +
                             "\"");
}

auto ManifestResolver::resolveLanding(const Url& url, const network::RetryPolicy& policy) -> Url
{
  log::INFO<Resolver>("Resolving landing page {}", url);

  const auto page    = m_transport.fetch(url, policy);
  const auto session = extract_session(page);
  const auto api     = make_api_request(session);

  log::DBG<Resolver>("Querying video API: {}", api.url);
  const auto response = m_transport.fetch(api.url, policy, api.options);

  Url master = extract_master_playlist(response.body);
  log::INFO<Resolver>("Master playlist: {}", master);
  return master;
}

} // namespace libsplice::manifest
