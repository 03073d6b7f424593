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

#include <libsplice/network/entry.hpp>

#include <boost/algorithm/string/predicate.hpp>
#include <boost/algorithm/string/trim.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/ssl/error.hpp>
#include <boost/asio/ssl/host_name_verification.hpp>
#include <boost/asio/ssl/stream.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <boost/beast/ssl.hpp>
#include <limits>
#include <openssl/err.h>
#include <openssl/ssl.h>

#include <libsplice/common/macros.hpp>
#include <libsplice/log-macros.hpp>
#include <libsplice/utils/url/entry.hpp>

namespace ssl   = boost::asio::ssl;
namespace beast = boost::beast;
namespace http  = beast::http;
namespace asio  = boost::asio;
using tcp       = asio::ip::tcp;

using Network = libsplice::log::NET;

namespace libsplice::network
{

namespace
{

constexpr std::uint32_t HeaderLimit = 64 * 1024; // LinkedIn sends a LOT of Set-Cookie lines

auto is_redirect(HttpStatus status) -> bool
{
  return status == 301 || status == 302 || status == 303 || status == 307 || status == 308;
}

// Runs the context until the single pending operation has completed
void drain(asio::io_context& ioc)
{
  ioc.restart();
  ioc.run();
}

// end_of_stream / partial_message mean the connection dropped, which is worth retrying.
// Everything else in the http category means the bytes we got are not HTTP.
auto is_protocol_error(const beast::error_code& ec) -> bool
{
  if (ec.category() != http::make_error_code(http::error::end_of_stream).category())
    return false;
  return ec != http::error::end_of_stream && ec != http::error::partial_message;
}

auto make_request(const utils::url::ParsedUrl& parsed, const std::string& user_agent,
                  const RequestOptions& options) -> http::request<http::empty_body>
{
  const bool default_port =
    parsed.port == (parsed.is_tls() ? SPLICE_HTTPS_PORT_STR : SPLICE_HTTP_PORT_STR);

  http::request<http::empty_body> req{http::verb::get, parsed.target, 11};
  req.set(http::field::host, default_port ? parsed.host : parsed.host + ":" + parsed.port);
  req.set(http::field::user_agent, user_agent);
  req.set(http::field::accept, "*/*");
  req.set(http::field::connection, "close");

  if (!options.cookies.empty())
    req.set(http::field::cookie, render_cookies(options.cookies));

  // Caller headers win, including an explicit Cookie
  for (const auto& [name, value] : options.headers)
    req.set(name, value);

  return req;
}

void connect(asio::io_context& ioc, beast::tcp_stream& stream,
             const tcp::resolver::results_type& endpoints, const Url& url,
             std::chrono::seconds timeout)
{
  beast::error_code ec;
  stream.expires_after(timeout);
  stream.async_connect(endpoints, [&](beast::error_code e, const tcp::endpoint&) { ec = e; });
  drain(ioc);
  if (ec)
    throw TransientNetworkError(url, "connect: " + ec.message());
}

template <typename Stream>
auto exchange(asio::io_context& ioc, Stream& stream, beast::tcp_stream& lowest, const Url& url,
              const http::request<http::empty_body>& req, std::chrono::seconds timeout)
  -> http::response<http::string_body>
{
  beast::error_code ec;

  lowest.expires_after(timeout);
  http::async_write(stream, req, [&](beast::error_code e, std::size_t) { ec = e; });
  drain(ioc);
  if (ec)
    throw TransientNetworkError(url, "write: " + ec.message());

  beast::flat_buffer                       buffer;
  http::response_parser<http::string_body> parser;
  parser.header_limit(HeaderLimit);
  parser.body_limit(std::numeric_limits<std::uint64_t>::max());

  lowest.expires_after(timeout);
  http::async_read(stream, buffer, parser, [&](beast::error_code e, std::size_t) { ec = e; });
  drain(ioc);
  if (ec)
  {
    if (is_protocol_error(ec))
      throw ProtocolError("Malformed HTTP response from \"" + url + "\": " + ec.message());
    throw TransientNetworkError(url, "read: " + ec.message());
  }

  return parser.release();
}

auto to_response(const Url& url, const http::response<http::string_body>& res) -> HttpResponse
{
  HttpResponse out;
  out.status    = static_cast<HttpStatus>(res.result_int());
  out.final_url = url;
  out.body      = res.body();

  for (const auto& field : res.base())
  {
    const auto name  = field.name_string();
    const auto value = field.value();

    out.headers.emplace_back(std::string(name.data(), name.size()),
                             std::string(value.data(), value.size()));
    if (field.name() == http::field::set_cookie)
    {
      if (auto cookie = parse_set_cookie(std::string_view(value.data(), value.size())))
        merge_cookie(out.cookies, std::move(*cookie));
    }
  }

  return out;
}

} // namespace

auto HttpResponse::header(std::string_view name) const -> std::optional<std::string>
{
  for (const auto& [key, value] : headers)
    if (boost::algorithm::iequals(key, name))
      return value;
  return std::nullopt;
}

auto parse_set_cookie(std::string_view header) -> std::optional<Cookie>
{
  const auto pair_end = header.find(';');
  const auto pair     = header.substr(0, pair_end);
  const auto eq       = pair.find('=');
  if (eq == std::string_view::npos)
    return std::nullopt;

  Cookie cookie{.name = std::string(pair.substr(0, eq)), .value = std::string(pair.substr(eq + 1))};
  boost::algorithm::trim(cookie.name);
  boost::algorithm::trim(cookie.value);

  // Quoted values are stored bare, whoever sends them back decides on quoting
  if (cookie.value.size() >= 2 && cookie.value.front() == '"' && cookie.value.back() == '"')
    cookie.value = cookie.value.substr(1, cookie.value.size() - 2);

  if (cookie.name.empty())
    return std::nullopt;
  return cookie;
}

auto render_cookies(const Cookies& cookies) -> std::string
{
  std::string out;
  for (const auto& c : cookies)
  {
    if (!out.empty())
      out += "; ";
    out += c.name + "=" + c.value;
  }
  return out;
}

void merge_cookie(Cookies& jar, Cookie cookie)
{
  for (auto& existing : jar)
  {
    if (existing.name == cookie.name)
    {
      existing.value = std::move(cookie.value);
      return;
    }
  }
  jar.push_back(std::move(cookie));
}

HttpsClient::HttpsClient(std::string user_agent, std::chrono::seconds timeout)
    : m_sslCtx(ssl::context::tls_client), m_userAgent(std::move(user_agent)), m_timeout(timeout)
{
  m_sslCtx.set_default_verify_paths();
  m_sslCtx.set_verify_mode(ssl::verify_peer);
}

auto HttpsClient::get(const Url& url, const RequestOptions& options) -> HttpResponse
{
  Url            current = url;
  RequestOptions hop     = options;
  Cookies        jar;

  for (int redirects = 0;; ++redirects)
  {
    log::TRACE<Network>("GET {}", current);
    HttpResponse res = requestOnce(current, hop);

    for (const auto& c : res.cookies)
    {
      merge_cookie(jar, c);
      merge_cookie(hop.cookies, c);
    }

    if (is_redirect(res.status))
    {
      const auto location = res.header("Location");
      if (!location)
        throw ProtocolError("Redirect without Location header from \"" + current + "\"");
      if (redirects >= SPLICE_MAX_REDIRECTS)
        throw ProtocolError("Too many redirects starting at \"" + url + "\"");

      Url next = utils::url::resolve_location(current, *location);
      if (!utils::url::same_host(current, next))
      {
        // caller headers carry the session (Cookie, csrf-token), they stay with their host
        log::DBG<Network>("Redirect leaves {}, dropping request headers and cookies",
                          utils::url::parse(current).host);
        hop = RequestOptions{};
      }

      current = std::move(next);
      log::DBG<Network>("{} -> redirected to {}", res.status, current);
      continue;
    }

    res.cookies   = std::move(jar);
    res.final_url = current;

    if (res.status >= 400)
      throw HttpStatusError(current, res.status);

    log::DBG<Network>("{} {} ({} bytes)", res.status, current, res.body.size());
    return res;
  }
}

auto HttpsClient::requestOnce(const Url& url, const RequestOptions& options) -> HttpResponse
{
  const auto parsed = utils::url::parse(url);
  const auto req    = make_request(parsed, m_userAgent, options);

  beast::error_code           ec;
  tcp::resolver               resolver(m_ioCtx);
  tcp::resolver::results_type endpoints;

  resolver.async_resolve(parsed.host, parsed.port,
                         [&](beast::error_code e, tcp::resolver::results_type r)
                         {
                           ec        = e;
                           endpoints = std::move(r);
                         });
  drain(m_ioCtx);
  if (ec)
    throw TransientNetworkError(url, "resolve: " + ec.message());

  if (!parsed.is_tls())
  {
    beast::tcp_stream stream(m_ioCtx);
    connect(m_ioCtx, stream, endpoints, url, m_timeout);

    auto res = exchange(m_ioCtx, stream, stream, url, req, m_timeout);

    stream.socket().shutdown(tcp::socket::shutdown_both, ec);
    if (ec && ec != beast::errc::not_connected)
      log::DBG<Network>("Unclean close of {}: {}", parsed.host, ec.message());

    return to_response(url, res);
  }

  beast::ssl_stream<beast::tcp_stream> stream(m_ioCtx, m_sslCtx);

  if (!SSL_set_tlsext_host_name(stream.native_handle(), parsed.host.c_str()))
  {
    beast::error_code sni{static_cast<int>(::ERR_get_error()), asio::error::get_ssl_category()};
    throw TransientNetworkError(url, "SNI: " + sni.message());
  }
  stream.set_verify_callback(ssl::host_name_verification(parsed.host));

  connect(m_ioCtx, beast::get_lowest_layer(stream), endpoints, url, m_timeout);

  beast::get_lowest_layer(stream).expires_after(m_timeout);
  stream.async_handshake(ssl::stream_base::client, [&](beast::error_code e) { ec = e; });
  drain(m_ioCtx);
  if (ec)
    throw TransientNetworkError(url, "TLS handshake: " + ec.message());

  auto res = exchange(m_ioCtx, stream, beast::get_lowest_layer(stream), url, req, m_timeout);

  beast::get_lowest_layer(stream).expires_after(m_timeout);
  stream.async_shutdown([&](beast::error_code e) { ec = e; });
  drain(m_ioCtx);
  if (ec && ec != asio::error::eof && ec != ssl::error::stream_truncated)
    log::DBG<Network>("Unclean TLS close of {}: {}", parsed.host, ec.message());

  return to_response(url, res);
}

} // namespace libsplice::network
