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

#include <support/FakeFragmentDecoder.hpp>
#include <support/FakeTransport.hpp>

#include <libsplice/common/error.hpp>
#include <libsplice/stitch/timeline.hpp>

using namespace libsplice;
using namespace libsplice::stitch;
using namespace std::chrono_literals;

namespace
{

const Url kManifestUrl = "https://cdn.example.com/v/QualityLevels(3200000)/Manifest(video)";
const Url kBase        = "https://cdn.example.com/v/QualityLevels(3200000)/";

// 2.0 + 3.5 + 1.5 = 7.0
const ManifestData kManifest = "#EXTINF:2.0,\nFragments(video=0)\n"
                               "#EXTINF:3.5,\nFragments(video=1)\n"
                               "#EXTINF:1.5,\nFragments(video=2)\n";

class TimelineTest : public ::testing::Test
{
protected:
  splice_test::FakeTransport      fake;
  splice_test::RecordingSleeper   sleeper;
  splice_test::FakeFragmentDecoder decoder;
  network::RetryingTransport      transport{fake, sleeper.sleeper()};
  utils::ScratchDir               scratch;
  AudioAccumulator                audio{scratch};

  void SetUp() override
  {
    const Seconds durations[] = {2.0, 3.5, 1.5};
    for (int i = 0; i < 3; ++i)
      serveFragment(i, {.duration = durations[i]});
  }

  void serveFragment(int id, splice_test::FakeFragmentSpec spec)
  {
    const std::string body = "fragment-" + std::to_string(id);
    fake.serve(kBase + "Fragments(video=" + std::to_string(id) + ")", body);
    decoder.add(body, id, spec);
  }

  auto stitcher(const manifest::FragmentCatalog& catalog,
                network::RetryPolicy policy = network::RetryPolicy(1, 0s)) -> TimelineStitcher
  {
    return TimelineStitcher(catalog, transport, policy, decoder, audio, scratch);
  }
};

// the unique i with sum(d_j, j < i) <= t < sum(d_j, j <= i)
auto expected_index(Seconds t) -> FragmentIndex
{
  if (t < 2.0)
    return 0;
  if (t < 5.5)
    return 1;
  return 2;
}

} // namespace

TEST_F(TimelineTest, CursorFollowsTheCumulativeDurations)
{
  const auto catalog  = manifest::FragmentCatalog::parse(kManifest, kManifestUrl);
  auto       timeline = stitcher(catalog);

  FragmentIndex previous = 0;
  for (int step = 0; step < 28; ++step)
  {
    const Seconds t     = step * 0.25;
    const auto    frame = timeline.frame_at(t);

    EXPECT_EQ(timeline.fragment_index(), expected_index(t)) << "t=" << t;
    EXPECT_EQ(frame.rgb24.at(0), expected_index(t)) << "t=" << t;
    EXPECT_GE(timeline.fragment_index(), previous);
    previous = timeline.fragment_index();
  }

  EXPECT_EQ(decoder.opened(), (std::vector<int>{0, 1, 2}));
  EXPECT_DOUBLE_EQ(timeline.fragment_start(), 5.5);
}

TEST_F(TimelineTest, NeverTwoFragmentsResident)
{
  const auto catalog  = manifest::FragmentCatalog::parse(kManifest, kManifestUrl);
  auto       timeline = stitcher(catalog);

  for (Seconds t = 0; t < 7.0; t += 0.1)
    timeline.frame_at(t);

  EXPECT_EQ(decoder.max_live(), 1);
  EXPECT_EQ(decoder.live(), 1);

  EXPECT_TRUE(timeline.has_resident());
  timeline.release();
  EXPECT_FALSE(timeline.has_resident());
  EXPECT_EQ(decoder.live(), 0);
}

TEST_F(TimelineTest, ReleasedFragmentsLeaveNoFiles)
{
  const auto catalog  = manifest::FragmentCatalog::parse(kManifest, kManifestUrl);
  auto       timeline = stitcher(catalog);

  timeline.frame_at(6.0);

  ASSERT_EQ(decoder.files().size(), 3u);
  EXPECT_FALSE(fs::exists(decoder.files()[0]));
  EXPECT_FALSE(fs::exists(decoder.files()[1]));
  EXPECT_TRUE(fs::exists(decoder.files()[2]));
}

TEST_F(TimelineTest, LocalTimeIsRelativeToTheFragment)
{
  const auto catalog  = manifest::FragmentCatalog::parse(kManifest, kManifestUrl);
  auto       timeline = stitcher(catalog);

  timeline.frame_at(2.5);

  ASSERT_FALSE(decoder.requests().empty());
  EXPECT_EQ(decoder.requests().back().fragment, 1);
  EXPECT_DOUBLE_EQ(decoder.requests().back().local_time, 0.5);
  EXPECT_DOUBLE_EQ(timeline.fragment_start(), 2.0);
}

TEST_F(TimelineTest, OutsideTheTimelineIsRejected)
{
  const auto catalog  = manifest::FragmentCatalog::parse(kManifest, kManifestUrl);
  auto       timeline = stitcher(catalog);

  EXPECT_THROW(timeline.frame_at(-0.1), TimelineBoundaryError);
  EXPECT_THROW(timeline.frame_at(7.0), TimelineBoundaryError);
  EXPECT_THROW(timeline.frame_at(100.0), TimelineBoundaryError);
  EXPECT_TRUE(decoder.opened().empty());
}

TEST_F(TimelineTest, GoingBackwardsIsRejected)
{
  const auto catalog  = manifest::FragmentCatalog::parse(kManifest, kManifestUrl);
  auto       timeline = stitcher(catalog);

  timeline.frame_at(3.0);
  EXPECT_NO_THROW(timeline.frame_at(3.0));
  EXPECT_THROW(timeline.frame_at(2.9), TimelineBoundaryError);
}

TEST_F(TimelineTest, ShortLastFragmentHoldsItsFinalFrame)
{
  // decoder says 1.0s where the manifest says 1.5s
  serveFragment(2, {.duration = 1.0});

  const auto catalog  = manifest::FragmentCatalog::parse(kManifest, kManifestUrl);
  auto       timeline = stitcher(catalog);

  const auto frame = timeline.frame_at(6.9);

  EXPECT_EQ(timeline.fragment_index(), 2u);
  EXPECT_EQ(frame.rgb24.at(0), 2);
  EXPECT_DOUBLE_EQ(decoder.requests().back().local_time, 6.9 - 5.5);
}

TEST_F(TimelineTest, StartsFollowDecodedDurations)
{
  // decoder says 2.5s where the manifest says 2.0s
  serveFragment(0, {.duration = 2.5});

  const auto catalog  = manifest::FragmentCatalog::parse(kManifest, kManifestUrl);
  auto       timeline = stitcher(catalog);

  timeline.frame_at(2.2);
  EXPECT_EQ(timeline.fragment_index(), 0u);

  timeline.frame_at(2.6);
  EXPECT_EQ(timeline.fragment_index(), 1u);
  EXPECT_DOUBLE_EQ(timeline.fragment_start(), 2.5);
}

TEST_F(TimelineTest, TimeLimitStopsBeforeLaterFragments)
{
  const auto catalog  = manifest::FragmentCatalog::parse(kManifest, kManifestUrl, 3.0);
  auto       timeline = stitcher(catalog);

  for (Seconds t = 0; t < 3.0; t += 0.5)
    timeline.frame_at(t);

  EXPECT_THROW(timeline.frame_at(3.0), TimelineBoundaryError);
  EXPECT_EQ(decoder.opened(), (std::vector<int>{0, 1}));
}

TEST_F(TimelineTest, FpsComesFromTheFirstFragment)
{
  serveFragment(0, {.duration = 2.0, .fps = 24.0});

  const auto catalog  = manifest::FragmentCatalog::parse(kManifest, kManifestUrl);
  auto       timeline = stitcher(catalog);

  EXPECT_DOUBLE_EQ(timeline.fps(), 24.0);
  timeline.frame_at(0.0);
  timeline.frame_at(3.0);
  EXPECT_DOUBLE_EQ(timeline.fps(), 24.0);
  EXPECT_EQ(decoder.opened(), (std::vector<int>{0, 1}));
}

TEST_F(TimelineTest, AudioOfEveryLoadedFragmentIsAccumulatedOnce)
{
  const auto catalog  = manifest::FragmentCatalog::parse(kManifest, kManifestUrl);
  auto       timeline = stitcher(catalog);

  timeline.fps();
  for (Seconds t = 0; t < 7.0; t += 0.5)
    timeline.frame_at(t);

  EXPECT_EQ(audio.byte_count(), 3u * 16u);
}

TEST_F(TimelineTest, AudioFormatChangeSurfaces)
{
  serveFragment(1, {.duration = 3.5,
                    .audio    = AudioFormat{.channels = 2, .sample_rate = 44100, .bit_depth = 16}});

  const auto catalog  = manifest::FragmentCatalog::parse(kManifest, kManifestUrl);
  auto       timeline = stitcher(catalog);

  timeline.frame_at(1.0);
  EXPECT_THROW(timeline.frame_at(2.5), FormatMismatch);
}

TEST_F(TimelineTest, FragmentFetchIsRetried)
{
  fake.fail(kBase + "Fragments(video=1)", 2);

  const auto catalog  = manifest::FragmentCatalog::parse(kManifest, kManifestUrl);
  auto       timeline = stitcher(catalog, network::RetryPolicy(3, 7s));

  timeline.frame_at(2.5);

  EXPECT_EQ(timeline.fragment_index(), 1u);
  EXPECT_EQ(sleeper.waits(), (std::vector<std::chrono::seconds>{7s, 7s}));
}

TEST_F(TimelineTest, FailedAdvanceKeepsTheCursorConsistent)
{
  fake.fail(kBase + "Fragments(video=1)", 1);

  const auto catalog  = manifest::FragmentCatalog::parse(kManifest, kManifestUrl);
  auto       timeline = stitcher(catalog);

  timeline.frame_at(1.0);
  EXPECT_THROW(timeline.frame_at(2.5), TransientNetworkError);

  // index and start still describe the last fragment that was decoded
  EXPECT_EQ(timeline.fragment_index(), 0u);
  EXPECT_DOUBLE_EQ(timeline.fragment_start(), 0.0);
  EXPECT_FALSE(timeline.has_resident());
  EXPECT_EQ(decoder.live(), 0);
  EXPECT_THROW(timeline.frame_at(2.5), TimelineBoundaryError);
}
