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

#include <cmath>
#include <functional>

#include <libsplice/stitch/audio.hpp>
#include <libsplice/stitch/fragment.hpp>

namespace libsplice::stitch
{

// Frame shown at a global time, usually TimelineStitcher::frame_at
using FrameSource = std::function<VideoFrame(Seconds)>;

// Called once every frame has been pulled, returns the complete audio
using AudioSource = std::function<AudioStream()>;

struct MuxRequest
{
  FrameSource frames;
  double      fps      = 0;
  Seconds     duration = 0; // frames are requested at i / fps for every i / fps < duration
  AudioSource audio;
  fs::path    output;
};

// Number of frames i with i / fps < duration, the frames a muxer pulls for a request
inline auto frame_count(double fps, Seconds duration) -> long
{
  auto n = static_cast<long>(std::ceil(duration * fps));
  while (n > 0 && static_cast<double>(n - 1) / fps >= duration)
    --n;
  while (static_cast<double>(n) / fps < duration)
    ++n;
  return n;
}

// Final encode and mux of the stitched timeline. Throws MuxError.
class IOutputMuxer
{
public:
  virtual ~IOutputMuxer() = default;

  virtual void mux(const MuxRequest& request, utils::ScratchDir& scratch) = 0;
};

} // namespace libsplice::stitch
