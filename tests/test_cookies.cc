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

#include <libsplice/network/entry.hpp>

using namespace libsplice::network;

TEST(SetCookieTest, ParsesNameAndValue)
{
  const auto cookie = parse_set_cookie("JSESSIONID=ajax:123; Path=/; Secure; HttpOnly");

  ASSERT_TRUE(cookie.has_value());
  EXPECT_EQ(cookie->name, "JSESSIONID");
  EXPECT_EQ(cookie->value, "ajax:123");
}

TEST(SetCookieTest, StripsQuotes)
{
  const auto cookie = parse_set_cookie("JSESSIONID=\"ajax:456\"; Domain=.example.com");

  ASSERT_TRUE(cookie.has_value());
  EXPECT_EQ(cookie->value, "ajax:456");
}

TEST(SetCookieTest, RejectsGarbage)
{
  EXPECT_FALSE(parse_set_cookie("no-equals-sign").has_value());
  EXPECT_FALSE(parse_set_cookie("=value").has_value());
}

TEST(CookieJarTest, MergeReplacesByName)
{
  Cookies jar;
  merge_cookie(jar, {"a", "1"});
  merge_cookie(jar, {"b", "2"});
  merge_cookie(jar, {"a", "3"});

  ASSERT_EQ(jar.size(), 2u);
  EXPECT_EQ(render_cookies(jar), "a=3; b=2");
}

TEST(HttpResponseTest, HeaderLookupIsCaseInsensitive)
{
  HttpResponse res;
  res.headers = {{"Content-Type", "application/json"}};

  EXPECT_EQ(res.header("content-type"), "application/json");
  EXPECT_FALSE(res.header("Location").has_value());
}

TEST(HttpResponseTest, CookieLookup)
{
  HttpResponse res;
  res.cookies = {{"JSESSIONID", "ajax:1"}};

  EXPECT_EQ(res.cookie("JSESSIONID"), "ajax:1");
  EXPECT_FALSE(res.cookie("other").has_value());
}
