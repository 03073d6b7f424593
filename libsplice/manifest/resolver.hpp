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
#include <variant>

#include <libsplice/common/api/entry.hpp>
#include <libsplice/common/types.hpp>
#include <libsplice/network/retry.hpp>

namespace libsplice::manifest
{

struct QualityUnavailable
{
  Bitrate  requested;
  Bitrates available; // ascending, no duplicates

  // "Incorrect quality level. The available quality levels are:\n  <b1>\n  <b2>..."
  [[nodiscard]] auto message() const -> std::string;
};

// Either the terminal manifest URL or why no manifest matches the requested quality
using ResolveResult = std::variant<Url, QualityUnavailable>;

namespace state
{
struct Terminal
{
  Url url;
};
struct QualitySelect
{
  Url url;
};
struct LandingPage
{
  Url url;
};
} // namespace state

using ResolverState = std::variant<state::Terminal, state::QualitySelect, state::LandingPage>;

// Purely by URL shape: "/Manifest" is terminal, "/manifest" lists qualities, anything else
// is a landing page
SPLICE_API auto classify(const Url& url) -> ResolverState;

// Picks the "QualityLevels(<quality>)/Manifest" line of a quality-listing manifest and puts it
// in place of the last path segment of url
SPLICE_API auto select_quality(const Url& url, const ManifestData& text, Bitrate quality)
  -> ResolveResult;

/*
 * ManifestResolver
 *
 * Walks landing page -> video API -> master playlist -> quality manifest until a terminal
 * manifest URL comes out. Every hop goes through the retrying transport with the same policy.
 *
 * The walk is an explicit loop bounded by SPLICE_MAX_RESOLUTION_HOPS. A landing page always
 * yields a URL one step closer (quality listing or terminal), so a well-behaved API needs at
 * most two landing hops.
 *
 * Throws ResolutionParseError (and whatever the transport lets through); a quality miss is
 * returned, not thrown.
 */
class SPLICE_API ManifestResolver
{
public:
  explicit ManifestResolver(network::RetryingTransport& transport) : m_transport(transport) {}

  auto resolve(const Url& url, Bitrate quality, const network::RetryPolicy& policy)
    -> ResolveResult;

private:
  network::RetryingTransport& m_transport;

  auto resolveLanding(const Url& url, const network::RetryPolicy& policy) -> Url;
};

} // namespace libsplice::manifest
