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
#include <libsplice/stitch/audio.hpp>

using namespace libsplice;
using namespace libsplice::stitch;

namespace
{

const AudioFormat kStereo48k{.channels = 2, .sample_rate = 48000, .bit_depth = 16};

auto chunk(AudioFormat format, std::size_t bytes, ui8 fill) -> FragmentAudio
{
  return FragmentAudio{.format = format, .samples = MediaBuffer(bytes, fill)};
}

} // namespace

TEST(AudioAccumulatorTest, AppendsFragmentsInOrder)
{
  utils::ScratchDir scratch;
  AudioAccumulator  audio(scratch);

  audio.append(chunk(kStereo48k, 8, 0x01));
  audio.append(chunk(kStereo48k, 4, 0x02));

  const auto stream = audio.finalize();
  ASSERT_TRUE(stream.has_audio());
  EXPECT_EQ(*stream.format, kStereo48k);
  EXPECT_EQ(stream.byte_count, 12u);

  const auto contents = utils::FileUtil<fs::path>::readFile(stream.path);
  EXPECT_EQ(contents, std::string(8, '\x01') + std::string(4, '\x02'));
}

TEST(AudioAccumulatorTest, FormatMismatchIsRejected)
{
  utils::ScratchDir scratch;
  AudioAccumulator  audio(scratch);

  audio.append(chunk(kStereo48k, 8, 0x01));

  auto mono = kStereo48k;
  mono.channels = 1;
  EXPECT_THROW(audio.append(chunk(mono, 8, 0x02)), FormatMismatch);

  auto resampled = kStereo48k;
  resampled.sample_rate = 44100;
  EXPECT_THROW(audio.append(chunk(resampled, 8, 0x03)), FormatMismatch);

  // nothing of the rejected fragments was written
  EXPECT_EQ(audio.finalize().byte_count, 8u);
}

TEST(AudioAccumulatorTest, AppendAfterFinalizeIsALogicError)
{
  utils::ScratchDir scratch;
  AudioAccumulator  audio(scratch);

  audio.append(chunk(kStereo48k, 4, 0x01));
  audio.finalize();

  EXPECT_THROW(audio.append(chunk(kStereo48k, 4, 0x01)), std::logic_error);
}

TEST(AudioAccumulatorTest, NoAudioAtAll)
{
  utils::ScratchDir scratch;
  AudioAccumulator  audio(scratch);

  const auto stream = audio.finalize();
  EXPECT_FALSE(stream.has_audio());
  EXPECT_FALSE(stream.format.has_value());
}

TEST(AudioAccumulatorTest, FileGoesAwayWithTheAccumulator)
{
  utils::ScratchDir scratch;
  fs::path          path;
  {
    AudioAccumulator audio(scratch);
    audio.append(chunk(kStereo48k, 4, 0x01));
    path = audio.finalize().path;
    EXPECT_TRUE(fs::exists(path));
  }
  EXPECT_FALSE(fs::exists(path));
}

TEST(ScratchDirTest, RemovedWithEverythingInside)
{
  fs::path root;
  {
    utils::ScratchDir scratch;
    root = scratch.path();
    utils::FileUtil<fs::path>::writeFile(scratch.unique_file("leftover", ".bin"), "x");
    EXPECT_TRUE(fs::is_directory(root));
  }
  EXPECT_FALSE(fs::exists(root));
}
