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

#include <libsplice/manifest/catalog.hpp>

#include <algorithm>
#include <boost/algorithm/string/trim.hpp>
#include <charconv>
#include <sstream>
#include <string>

#include <libsplice/common/error.hpp>
#include <libsplice/common/macros.hpp>
#include <libsplice/log-macros.hpp>
#include <libsplice/utils/url/entry.hpp>

using Catalog = libsplice::log::CATALOG;

namespace libsplice::manifest
{

namespace
{

// "#EXTINF:<seconds>,<title>" -> seconds
auto parse_duration(const std::string& line) -> Seconds
{
  const auto colon = line.find(':');
  const auto comma = line.find(',', colon + 1);

  std::string field =
    line.substr(colon + 1, comma == std::string::npos ? std::string::npos : comma - colon - 1);
  boost::algorithm::trim(field);

  Seconds value  = 0;
  auto [ptr, ec] = std::from_chars(field.data(), field.data() + field.size(), value);
  if (field.empty() || ec != std::errc() || ptr != field.data() + field.size() || value < 0)
    throw ResolutionParseError("Invalid fragment duration line: " + line);

  return value;
}

} // namespace

auto FragmentCatalog::parse(const ManifestData& text, const Url& manifest_url, Seconds time_limit)
  -> FragmentCatalog
{
  ManifestData clean = text;
  std::erase(clean, '\r');

  const Url base = utils::url::strip_from(manifest_url, macros::MANIFEST_BASE_STRIP);

  std::vector<Url>     urls;
  std::vector<Seconds> durations;

  std::istringstream stream(clean);
  std::string        line;

  while (std::getline(stream, line))
  {
    if (line.starts_with(macros::MANIFEST_FRAGMENT_PREFIX))
      urls.push_back(base + line);
    else if (line.starts_with(macros::MANIFEST_DURATION_PREFIX))
      durations.push_back(parse_duration(line));
  }

  if (urls.empty())
    throw ResolutionParseError("No fragments found in manifest \"" + manifest_url + "\"");

  if (urls.size() != durations.size())
    throw ResolutionParseError("Manifest \"" + manifest_url + "\" lists " +
                               std::to_string(urls.size()) + " fragments but " +
                               std::to_string(durations.size()) + " durations");

  std::vector<Fragment> fragments;
  fragments.reserve(urls.size());

  Seconds start = 0; // implicit 0 offset of the first fragment
  for (std::size_t i = 0; i < urls.size(); ++i)
  {
    fragments.push_back(Fragment{.url = std::move(urls[i]), .duration = durations[i], .start = start});
    start += durations[i];
  }

  const Seconds sum   = start;
  const Seconds total = time_limit > 0 ? std::min(sum, time_limit) : sum;

  log::INFO<Catalog>("{} fragments, {:.3f}s in total{}", fragments.size(), sum,
                     total < sum ? std::format(" (limited to {:.3f}s)", total) : "");

  return FragmentCatalog(std::move(fragments), sum, total);
}

} // namespace libsplice::manifest
