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

#include <string>
#include <string_view>

enum Macros
{
  SPLICE_DEFAULT_MAX_ATTEMPTS    = 10,
  SPLICE_DEFAULT_WAIT_SECONDS    = 10,
  SPLICE_DEFAULT_QUALITY         = 3200000,
  SPLICE_DEFAULT_REQUEST_TIMEOUT = 30, // in seconds
  SPLICE_MAX_REDIRECTS           = 10,
  SPLICE_MAX_RESOLUTION_HOPS     = 8
};

#define SPLICE_HTTPS_PORT_STR "443"
#define SPLICE_HTTP_PORT_STR  "80"

#define SPLICE_RET_SUC  0
#define SPLICE_RET_FAIL 1

#define STRING_CONSTANTS(X)                                                               \
  /* File Extensions */                                                                   \
  X(MP4_FILE_EXT, ".mp4")                                                                 \
                                                                                          \
  /* Manifest Content */                                                                  \
  X(MANIFEST_TERMINAL_MARK, "/Manifest")                                                  \
  X(MANIFEST_QUALITY_MARK, "/manifest")                                                   \
  X(MANIFEST_BASE_STRIP, "Manifest")                                                      \
  X(MANIFEST_QUALITY_PREFIX, "QualityLevels(")                                            \
  X(MANIFEST_QUALITY_SUFFIX, ")/Manifest")                                                \
  X(MANIFEST_FRAGMENT_PREFIX, "Fragments")                                                \
  X(MANIFEST_DURATION_PREFIX, "#EXTINF:")                                                 \
                                                                                          \
  /* Vendor Session & API */                                                              \
  X(SESSION_COOKIE_NAME, "JSESSIONID")                                                    \
  X(SESSION_CSRF_HEADER, "csrf-token")                                                    \
  X(CONTENT_ID_URL_MARK, "/urn:li:ugcPost:")                                              \
  X(CONTENT_ID_BODY_MARK,                                                                 \
    "main-feed-activity-card-with-comments\" data-activity-urn=\"urn:li:activity:")       \
  X(CONTENT_ID_BODY_PREFIX, "urn:li:ugcPost:")                                            \
  X(VIDEO_API_ENDPOINT,                                                                   \
    "https://www.linkedin.com/voyager/api/video/liveUpdates/urn%3Ali%3AugcPost%3A")       \
  X(VIDEO_API_COMPONENT_KEY, "com.linkedin.voyager.feed.render.LinkedInVideoComponent")   \
                                                                                          \
  /* Content Types */                                                                     \
  X(CONTENT_TYPE_JSON, "application/json")                                                \
                                                                                          \
  /* Directories & Files */                                                               \
  X(SCRATCH_DIR_PREFIX, "splice-")                                                        \
  X(INTERMEDIATE_VIDEO_NAME, "video-only.mp4")                                            \
  X(ACCUMULATED_AUDIO_NAME, "audio.pcm")                                                  \
                                                                                          \
  /* Config */                                                                            \
  X(CONFIG_SECTION_DOWNLOAD, "download")                                                  \
  X(CONFIG_SECTION_NETWORK, "network")

namespace macros
{

#define DECLARE_STRING_VIEW(name, value) constexpr std::string_view name = value;
STRING_CONSTANTS(DECLARE_STRING_VIEW)
#undef DECLARE_STRING_VIEW

// Convert string_view to string using a function (avoiding constexpr std::string)
inline auto to_string(std::string_view sv) -> std::string { return std::string(sv); }

} // namespace macros
