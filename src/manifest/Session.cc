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

#include <libsplice/manifest/session.hpp>

#include <nlohmann/json.hpp>
#include <sstream>

#include <libsplice/common/error.hpp>
#include <libsplice/common/macros.hpp>
#include <libsplice/log-macros.hpp>

using json     = nlohmann::json;
using Resolver = libsplice::log::RESOLVER;

namespace libsplice::manifest
{

namespace
{

// Id runs until the next path, query or fragment delimiter
auto id_from_url(const Url& url) -> std::optional<ContentID>
{
  const auto mark = url.rfind(macros::CONTENT_ID_URL_MARK);
  if (mark == Url::npos)
    return std::nullopt;

  const auto start = mark + macros::CONTENT_ID_URL_MARK.size();
  const auto end   = url.find_first_of("/?#", start);
  ContentID  id    = url.substr(start, end == Url::npos ? Url::npos : end - start);

  if (id.empty())
    return std::nullopt;
  return id;
}

// Last "urn:li:ugcPost:" on the first marker line, up to the closing quote
auto id_from_body(const NetResponse& body) -> std::optional<ContentID>
{
  std::istringstream stream(body);
  std::string        line;

  while (std::getline(stream, line))
  {
    if (line.find(macros::CONTENT_ID_BODY_MARK) == std::string::npos)
      continue;

    const auto prefix = line.rfind(macros::CONTENT_ID_BODY_PREFIX);
    if (prefix == std::string::npos)
      return std::nullopt;

    const auto start = prefix + macros::CONTENT_ID_BODY_PREFIX.size();
    const auto end   = line.find('"', start);
    ContentID  id    = line.substr(start, end == std::string::npos ? std::string::npos : end - start);

    if (id.empty())
      return std::nullopt;
    return id;
  }

  return std::nullopt;
}

} // namespace

auto extract_content_id(const Url& final_url, const NetResponse& body) -> std::optional<ContentID>
{
  if (final_url.find(macros::CONTENT_ID_URL_MARK) != Url::npos)
    return id_from_url(final_url);
  return id_from_body(body);
}

auto extract_session(const network::HttpResponse& landing) -> SessionContext
{
  const std::string token_name = macros::to_string(macros::SESSION_COOKIE_NAME);

  const auto token = landing.cookie(token_name);
  if (!token || token->empty())
    throw ResolutionParseError("No " + token_name + " cookie in the response of \"" +
                               landing.final_url + "\"");

  auto content_id = extract_content_id(landing.final_url, landing.body);
  if (!content_id)
    throw ResolutionParseError("Unable to find the video id in \"" + landing.final_url + "\"");

  log::DBG<Resolver>("Session token found, content id: {}", *content_id);

  return SessionContext{
    .token_name = token_name, .token_value = *token, .content_id = std::move(*content_id)};
}

auto make_api_request(const SessionContext& session) -> ApiRequest
{
  ApiRequest req;
  req.url = macros::to_string(macros::VIDEO_API_ENDPOINT) + session.content_id;
  req.options.headers = {
    {macros::to_string(macros::SESSION_CSRF_HEADER), session.token_value},
    {"Cookie", session.token_name + "=\"" + session.token_value + "\""},
    {"Accept", macros::to_string(macros::CONTENT_TYPE_JSON)},
  };
  return req;
}

auto extract_master_playlist(const NetResponse& api_body) -> Url
{
  const json result = json::parse(api_body, nullptr, /*allow_exceptions=*/false);
  if (result.is_discarded())
    throw ResolutionParseError("Video API response is not valid JSON");

  try
  {
    const auto& metadata = result.at("content")
                             .at(macros::to_string(macros::VIDEO_API_COMPONENT_KEY))
                             .at("videoPlayMetadata");

    const auto& streams = metadata.at("adaptiveStreams");
    if (!streams.is_array() || streams.empty())
      throw ResolutionParseError("Video API response lists no adaptive streams");

    const auto& playlists = streams.at(0).at("masterPlaylists");
    if (!playlists.is_array() || playlists.empty())
      throw ResolutionParseError("Video API response lists no master playlists");

    auto url = playlists.at(0).at("url").get<Url>();
    if (url.empty())
      throw ResolutionParseError("Video API response has an empty master playlist URL");

    return url;
  }
  catch (const json::exception& e)
  {
    throw ResolutionParseError(std::string("Unexpected video API response: ") + e.what());
  }
}

} // namespace libsplice::manifest
