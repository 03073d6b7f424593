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

#include <libsplice/common/api/entry.hpp>
#include <libsplice/stitch/output.hpp>

namespace libsplice::ffmpeg
{

/**
 * @class MediaMuxer
 * @brief Writes the stitched timeline to one media file in two passes
 *
 * Pass 1 pulls every frame from the frame source and encodes it (H.264 when an encoder is
 * available, MPEG-4 Part 2 otherwise, YUV420P) into an intermediate video-only MP4 inside the
 * scratch directory.
 *
 * Pass 2 stream-copies that video into the final container (format picked from the output
 * extension) and encodes the accumulated PCM to AAC next to it, interleaving both by timestamp.
 * Audio is cut at the end of the video.
 */
class SPLICE_API MediaMuxer : public stitch::IOutputMuxer
{
public:
  void mux(const stitch::MuxRequest& request, utils::ScratchDir& scratch) override;

private:
  // Returns the number of frames written
  auto encode_video(const stitch::MuxRequest& request, const fs::path& intermediate) -> long;
  void mux_output(const fs::path& intermediate, const stitch::AudioStream& audio,
                  Seconds video_duration, const fs::path& output);
};

} // namespace libsplice::ffmpeg
