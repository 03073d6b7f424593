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

#include <libsplice/common/error.hpp>
#include <libsplice/utils/url/entry.hpp>

namespace url = libsplice::utils::url;

TEST(UrlParseTest, HttpsDefaultsToPort443)
{
  const auto parsed = url::parse("https://www.linkedin.com/feed/update/urn:li:ugcPost:1/?x=1");

  EXPECT_EQ(parsed.scheme, "https");
  EXPECT_EQ(parsed.host, "www.linkedin.com");
  EXPECT_EQ(parsed.port, "443");
  EXPECT_EQ(parsed.target, "/feed/update/urn:li:ugcPost:1/?x=1");
  EXPECT_TRUE(parsed.is_tls());
}

TEST(UrlParseTest, ExplicitPortAndPlainHttp)
{
  const auto parsed = url::parse("http://cdn.example.com:8080/a/b");

  EXPECT_EQ(parsed.host, "cdn.example.com");
  EXPECT_EQ(parsed.port, "8080");
  EXPECT_EQ(parsed.target, "/a/b");
  EXPECT_FALSE(parsed.is_tls());
}

TEST(UrlParseTest, MissingPathBecomesRoot)
{
  EXPECT_EQ(url::parse("https://example.com").target, "/");
  EXPECT_EQ(url::parse("https://example.com?q=1").target, "/?q=1");
}

TEST(UrlParseTest, FragmentIsDropped)
{
  EXPECT_EQ(url::parse("https://example.com/page#top").target, "/page");
}

TEST(UrlParseTest, RejectsMalformedUrls)
{
  EXPECT_THROW(url::parse("example.com/page"), libsplice::ResolutionParseError);
  EXPECT_THROW(url::parse("ftp://example.com/file"), libsplice::ResolutionParseError);
  EXPECT_THROW(url::parse("https:///path"), libsplice::ResolutionParseError);
}

TEST(UrlEditTest, ReplaceLastSegment)
{
  EXPECT_EQ(url::replace_last_segment("https://h/v/manifest(format=m3u8)",
                                      "QualityLevels(3200000)/Manifest(video)"),
            "https://h/v/QualityLevels(3200000)/Manifest(video)");
  EXPECT_EQ(url::replace_last_segment("https://h/v/", "x"), "https://h/v/");
}

TEST(UrlEditTest, StripFromMarker)
{
  EXPECT_EQ(url::strip_from("https://h/v/QualityLevels(1)/Manifest(video)", "Manifest"),
            "https://h/v/QualityLevels(1)/");
  EXPECT_EQ(url::strip_from("https://h/v/other", "Manifest"), "https://h/v/other");
}

TEST(UrlEditTest, ResolveLocation)
{
  const Url base = "https://www.example.com/a/b/page?x=1";

  EXPECT_EQ(url::resolve_location(base, "https://other.com/z"), "https://other.com/z");
  EXPECT_EQ(url::resolve_location(base, "//cdn.example.com/z"), "https://cdn.example.com/z");
  EXPECT_EQ(url::resolve_location(base, "/root"), "https://www.example.com/root");
  EXPECT_EQ(url::resolve_location(base, "sibling"), "https://www.example.com/a/b/sibling");
  EXPECT_EQ(url::resolve_location("http://h:8080/a/b", "/c"), "http://h:8080/c");
}

TEST(UrlEditTest, SameHost)
{
  EXPECT_TRUE(url::same_host("https://www.linkedin.com/a", "https://WWW.LinkedIn.com/b?c=1"));
  EXPECT_TRUE(url::same_host("http://127.0.0.1:8080/a", "http://127.0.0.1:9090/b"));
  EXPECT_FALSE(url::same_host("https://www.linkedin.com/a", "https://evil.example/a"));
  EXPECT_FALSE(url::same_host("https://www.linkedin.com/a", "https://linkedin.com/a"));
}
