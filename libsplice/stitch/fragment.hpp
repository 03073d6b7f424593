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

#include <memory>
#include <optional>

#include <libsplice/common/types.hpp>
#include <libsplice/utils/io/file/entry.hpp>

/*
 * FRAGMENT DECODING SEAM
 *
 * The timeline only ever talks to these two interfaces. The production implementation is
 * libsplice/ffmpeg/decoder (FFmpegFragmentDecoder); tests plug in an in-memory fake.
 */

namespace libsplice::stitch
{

// One packed RGB24 picture, row after row, no padding
struct VideoFrame
{
  int         width  = 0;
  int         height = 0;
  MediaBuffer rgb24;
};

struct AudioFormat
{
  int channels    = 0;
  int sample_rate = 0;
  int bit_depth   = 0;

  [[nodiscard]] auto bytes_per_frame() const -> int { return channels * (bit_depth / 8); }

  auto operator==(const AudioFormat&) const -> bool = default;
};

// Interleaved signed PCM of a whole fragment
struct FragmentAudio
{
  AudioFormat format;
  MediaBuffer samples;
};

class IDecodedFragment
{
public:
  virtual ~IDecodedFragment() = default;

  [[nodiscard]] virtual auto duration() const -> Seconds = 0;
  [[nodiscard]] virtual auto fps() const -> double       = 0;

  // local_time is relative to the start of this fragment. Past duration() the last frame
  // is returned.
  virtual auto frame_at(Seconds local_time) -> VideoFrame = 0;

  // Moves the decoded audio out; empty when the fragment has no audio track
  virtual auto take_audio() -> std::optional<FragmentAudio> = 0;
};

class IFragmentDecoder
{
public:
  virtual ~IFragmentDecoder() = default;

  // Any backing file must live in scratch and go away with the returned object.
  // Throws DecodeError.
  virtual auto open(const NetResponse& bytes, utils::ScratchDir& scratch)
    -> std::unique_ptr<IDecodedFragment> = 0;
};

} // namespace libsplice::stitch
