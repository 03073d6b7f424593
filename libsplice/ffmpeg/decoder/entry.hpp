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
#include <libsplice/stitch/fragment.hpp>

namespace libsplice::ffmpeg
{

/**
 * @class FFmpegFragmentDecoder
 * @brief Decodes one downloaded fragment (fragmented MP4) for the timeline
 *
 * The bytes are written to a temporary .mp4 inside the scratch directory which lives as long
 * as the returned fragment does. The audio track is decoded completely when the fragment is
 * opened (signed 16 bit interleaved, native rate and channel count); video is decoded lazily
 * and only forward, converted to RGB24 on demand.
 */
class SPLICE_API FFmpegFragmentDecoder : public stitch::IFragmentDecoder
{
public:
  auto open(const NetResponse& bytes, utils::ScratchDir& scratch)
    -> std::unique_ptr<stitch::IDecodedFragment> override;
};

} // namespace libsplice::ffmpeg
