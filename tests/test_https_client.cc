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

#include <gtest/gtest.h>

#include <support/FakeTransport.hpp>
#include <support/LoopbackServer.hpp>

#include <libsplice/common/error.hpp>
#include <libsplice/common/macros.hpp>
#include <libsplice/network/entry.hpp>
#include <libsplice/network/retry.hpp>

using namespace libsplice;
using namespace libsplice::network;
using namespace std::chrono_literals;
using splice_test::http_reply;

namespace
{

class HttpsClientTest : public ::testing::Test
{
protected:
  splice_test::LoopbackServer server;
  HttpsClient                 client{"splice-test/1.0", 5s};
};

auto session_options() -> RequestOptions
{
  return RequestOptions{
    .headers = {{"csrf-token", "ajax:555"}, {"Cookie", "JSESSIONID=\"ajax:555\""}},
    .cookies = {{"li_at", "secret"}}};
}

} // namespace

TEST_F(HttpsClientTest, PlainGet)
{
  server.reply("/manifest", http_reply(200, "#EXTM3U\n", {{"Content-Type", "text/plain"}}));

  const auto res = client.get(server.url("/manifest"), {});

  EXPECT_EQ(res.status, 200);
  EXPECT_EQ(res.body, "#EXTM3U\n");
  EXPECT_EQ(res.final_url, server.url("/manifest"));
  EXPECT_EQ(res.header("content-type"), "text/plain");
  EXPECT_TRUE(res.cookies.empty());
}

TEST_F(HttpsClientTest, RedirectsCarryTheCookieJar)
{
  server.reply("/start",
               http_reply(302, {}, {{"Location", "/middle"}, {"Set-Cookie", "a=1; Path=/"}}));
  server.reply("/middle", http_reply(301, {}, {{"Location", "final"}, {"Set-Cookie", "b=2"}}));
  server.reply("/final", http_reply(200, "done", {{"Set-Cookie", "a=3; HttpOnly"}}));

  const auto res = client.get(server.url("/start"), {});

  EXPECT_EQ(res.body, "done");
  EXPECT_EQ(res.final_url, server.url("/final"));
  EXPECT_EQ(res.cookie("a"), "3");
  EXPECT_EQ(res.cookie("b"), "2");

  const auto seen = server.requests();
  ASSERT_EQ(seen.size(), 3u);
  EXPECT_EQ(seen[0].cookie, "");
  EXPECT_EQ(seen[1].cookie, "a=1");
  EXPECT_EQ(seen[2].target, "/final");
  EXPECT_EQ(seen[2].cookie, "a=1; b=2");
}

TEST_F(HttpsClientTest, SameHostRedirectKeepsTheSession)
{
  server.reply("/api", http_reply(302, {}, {{"Location", "/api/v2"}}));
  server.reply("/api/v2", http_reply(200, "{}"));

  client.get(server.url("/api"), session_options());

  const auto seen = server.requests();
  ASSERT_EQ(seen.size(), 2u);
  EXPECT_EQ(seen[1].csrf_token, "ajax:555");
  EXPECT_EQ(seen[1].cookie, "JSESSIONID=\"ajax:555\"");
}

TEST_F(HttpsClientTest, CrossHostRedirectDropsTheSession)
{
  splice_test::LoopbackServer other("127.0.0.2");
  other.reply("/elsewhere", http_reply(200, "moved"));
  server.reply("/api", http_reply(302, {}, {{"Location", other.url("/elsewhere")},
                                            {"Set-Cookie", "tracker=1"}}));

  const auto res = client.get(server.url("/api"), session_options());

  EXPECT_EQ(res.body, "moved");
  EXPECT_EQ(res.final_url, other.url("/elsewhere"));

  const auto first = server.requests();
  ASSERT_EQ(first.size(), 1u);
  EXPECT_EQ(first[0].csrf_token, "ajax:555");

  const auto seen = other.requests();
  ASSERT_EQ(seen.size(), 1u);
  EXPECT_EQ(seen[0].csrf_token, "");
  EXPECT_EQ(seen[0].cookie, "");
}

TEST_F(HttpsClientTest, ErrorStatusIsHttpStatusError)
{
  server.reply("/missing", http_reply(404, "nope"));
  server.reply("/broken", http_reply(503, "busy"));

  try
  {
    client.get(server.url("/missing"), {});
    FAIL() << "expected HttpStatusError";
  }
  catch (const HttpStatusError& e)
  {
    EXPECT_EQ(e.status(), 404);
    EXPECT_EQ(e.url(), server.url("/missing"));
  }

  EXPECT_THROW(client.get(server.url("/broken"), {}), HttpStatusError);
}

TEST_F(HttpsClientTest, ErrorStatusIsNotRetried)
{
  server.reply("/broken", http_reply(500));

  splice_test::RecordingSleeper sleeper;
  RetryingTransport             transport(client, sleeper.sleeper());

  EXPECT_THROW(transport.fetch(server.url("/broken"), RetryPolicy(3, 1s)), HttpStatusError);
  EXPECT_EQ(server.count("/broken"), 1);
  EXPECT_TRUE(sleeper.waits().empty());
}

TEST_F(HttpsClientTest, DroppedConnectionIsTransient)
{
  server.reply("/drop", "");

  EXPECT_THROW(client.get(server.url("/drop"), {}), TransientNetworkError);
}

TEST_F(HttpsClientTest, DroppedConnectionIsRetried)
{
  int calls = 0;
  server.handle("/flaky",
                [&calls](const splice_test::SeenRequest&)
                { return ++calls < 3 ? std::string() : http_reply(200, "finally"); });

  splice_test::RecordingSleeper sleeper;
  RetryingTransport             transport(client, sleeper.sleeper());

  const auto res = transport.fetch(server.url("/flaky"), RetryPolicy(3, 2s));

  EXPECT_EQ(res.body, "finally");
  EXPECT_EQ(sleeper.waits(), (std::vector<std::chrono::seconds>{2s, 2s}));
}

TEST_F(HttpsClientTest, RefusedConnectionIsTransient)
{
  Url closed;
  {
    splice_test::LoopbackServer gone;
    closed = gone.url("/");
  }

  EXPECT_THROW(client.get(closed, {}), TransientNetworkError);
}

TEST_F(HttpsClientTest, NonHttpReplyIsProtocolError)
{
  server.reply("/garbage", "SSH-2.0-OpenSSH_9.6\r\n\r\n");

  EXPECT_THROW(client.get(server.url("/garbage"), {}), ProtocolError);
}

TEST_F(HttpsClientTest, RedirectWithoutLocationIsProtocolError)
{
  server.reply("/nowhere", http_reply(302));

  EXPECT_THROW(client.get(server.url("/nowhere"), {}), ProtocolError);
}

TEST_F(HttpsClientTest, RedirectLoopStopsAtTheLimit)
{
  server.reply("/loop", http_reply(302, {}, {{"Location", "/loop"}}));

  EXPECT_THROW(client.get(server.url("/loop"), {}), ProtocolError);
  EXPECT_EQ(server.count("/loop"), SPLICE_MAX_REDIRECTS + 1);
}
