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

#include <optional>
#include <string>

#include <libsplice/common/api/entry.hpp>
#include <libsplice/common/types.hpp>
#include <libsplice/network/entry.hpp>

namespace libsplice::manifest
{

// Lives for one landing-page hop of a resolution, never stored anywhere else
struct SessionContext
{
  std::string token_name;
  std::string token_value;
  ContentID   content_id;
};

struct ApiRequest
{
  Url                     url;
  network::RequestOptions options;
};

// From the redirected URL path first, then from the activity card marker in the page body
SPLICE_API auto extract_content_id(const Url& final_url, const NetResponse& body)
  -> std::optional<ContentID>;

// Throws ResolutionParseError when the session cookie or the content id is missing
SPLICE_API auto extract_session(const network::HttpResponse& landing) -> SessionContext;

// The authenticated video API call for a session: token as csrf header AND as cookie
SPLICE_API auto make_api_request(const SessionContext& session) -> ApiRequest;

// Digs the first master playlist URL out of the video API JSON.
// Throws ResolutionParseError on invalid JSON, missing keys or empty lists.
SPLICE_API auto extract_master_playlist(const NetResponse& api_body) -> Url;

} // namespace libsplice::manifest
