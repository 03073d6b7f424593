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

#include <boost/asio/io_context.hpp>
#include <boost/asio/ssl/context.hpp>
#include <chrono>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include <libsplice/common/api/entry.hpp>
#include <libsplice/common/error.hpp>
#include <libsplice/common/types.hpp>

namespace libsplice::network
{

struct Cookie
{
  std::string name;
  std::string value;
};

using Cookies = std::vector<Cookie>;

// Everything a caller may add on top of a plain GET
struct RequestOptions
{
  HeaderList headers;
  Cookies    cookies;
};

struct HttpResponse
{
  HttpStatus  status = 0;
  Url         final_url; // after redirects
  HeaderList  headers;   // of the final response
  Cookies     cookies;   // every Set-Cookie seen along the redirect chain, last one wins
  NetResponse body;

  [[nodiscard]] auto cookie(std::string_view name) const -> std::optional<std::string>
  {
    for (const auto& c : cookies)
      if (c.name == name)
        return c.value;
    return std::nullopt;
  }

  [[nodiscard]] auto header(std::string_view name) const -> std::optional<std::string>;
};

/*
 * ITransport
 *
 * One GET, no retries. Implementations must report:
 *   - connection level failures (DNS, connect, TLS, socket I/O, timeout) as TransientNetworkError
 *   - final status >= 400 as HttpStatusError
 *   - an unparsable HTTP response as ProtocolError
 *
 * The retry decision lives one layer up (RetryingTransport) and relies on this split.
 */
class ITransport
{
public:
  virtual ~ITransport() = default;

  virtual auto get(const Url& url, const RequestOptions& options) -> HttpResponse = 0;
};

/*
 * HttpsClient
 *
 * Blocking HTTP/1.1 client over boost beast. Plain http:// URLs are supported as well
 * (some CDNs redirect through them). Redirects are followed up to SPLICE_MAX_REDIRECTS,
 * carrying the cookies collected so far. A redirect to another host starts over with no
 * caller headers and no cookies.
 */
class SPLICE_API HttpsClient : public ITransport
{
public:
  HttpsClient(std::string user_agent, std::chrono::seconds timeout);

  auto get(const Url& url, const RequestOptions& options) -> HttpResponse override;

private:
  boost::asio::io_context   m_ioCtx;
  boost::asio::ssl::context m_sslCtx;
  std::string               m_userAgent;
  std::chrono::seconds      m_timeout;

  auto requestOnce(const Url& url, const RequestOptions& options) -> HttpResponse;
};

// Parses a single Set-Cookie header value ("name=value; Path=/; ...")
SPLICE_API auto parse_set_cookie(std::string_view header) -> std::optional<Cookie>;

// Renders cookies for a Cookie request header ("a=1; b=2")
SPLICE_API auto render_cookies(const Cookies& cookies) -> std::string;

// Inserts or replaces by name
SPLICE_API void merge_cookie(Cookies& jar, Cookie cookie);

} // namespace libsplice::network
