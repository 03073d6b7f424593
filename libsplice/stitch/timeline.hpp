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

#include <libsplice/common/api/entry.hpp>
#include <libsplice/manifest/catalog.hpp>
#include <libsplice/network/retry.hpp>
#include <libsplice/stitch/audio.hpp>
#include <libsplice/stitch/fragment.hpp>

namespace libsplice::stitch
{

/*
 * TimelineStitcher
 *
 * Presents the fragments of a catalog as one gapless timeline of [0, total_duration).
 *
 * frame_at() must be called with non-decreasing times. The stitcher keeps exactly one decoded
 * fragment resident: moving past its end releases it (closing it and deleting its backing
 * file) before the next one is fetched and decoded. Every newly loaded fragment hands its
 * audio to the accumulator, so audio and video are advanced by the same cursor.
 *
 * Start offsets are the sum of the durations the decoder reported for the previous fragments,
 * not the manifest durations.
 *
 * Throws TimelineBoundaryError for a time < 0, >= total_duration or earlier than the previous
 * request. Transport and decoder errors pass through.
 */
class SPLICE_API TimelineStitcher
{
public:
  TimelineStitcher(const manifest::FragmentCatalog& catalog, network::RetryingTransport& transport,
                   network::RetryPolicy policy, IFragmentDecoder& decoder, AudioAccumulator& audio,
                   utils::ScratchDir& scratch);

  auto frame_at(Seconds global_time) -> VideoFrame;

  // Frame rate of the first fragment (loads it when nothing is resident yet)
  auto fps() -> double;

  [[nodiscard]] auto fragment_index() const -> FragmentIndex { return m_index; }
  [[nodiscard]] auto fragment_start() const -> Seconds { return m_pos; }
  [[nodiscard]] auto total_duration() const -> Seconds { return m_catalog.total_duration(); }
  [[nodiscard]] auto has_resident() const -> bool { return m_resident != nullptr; }

  // Drops the resident fragment. The cursor stays where it is.
  void release() noexcept;

private:
  const manifest::FragmentCatalog& m_catalog;
  network::RetryingTransport&      m_transport;
  network::RetryPolicy             m_policy;
  IFragmentDecoder&                m_decoder;
  AudioAccumulator&                m_audio;
  utils::ScratchDir&               m_scratch;

  std::unique_ptr<IDecodedFragment> m_resident;
  FragmentIndex                     m_index      = 0;
  Seconds                           m_pos        = 0;
  Seconds                           m_lastTime   = 0;
  double                            m_firstFps   = 0;
  bool                              m_started    = false;
  bool                              m_everLoaded = false;

  // Makes fragment index resident at start. The cursor only moves once the fragment is decoded.
  void load(FragmentIndex index, Seconds start);
};

} // namespace libsplice::stitch
