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

#include <libsplice/stitch/timeline.hpp>

#include <libsplice/common/error.hpp>
#include <libsplice/log-macros.hpp>

using Stitch = libsplice::log::STITCH;

namespace libsplice::stitch
{

TimelineStitcher::TimelineStitcher(const manifest::FragmentCatalog& catalog,
                                   network::RetryingTransport& transport,
                                   network::RetryPolicy policy, IFragmentDecoder& decoder,
                                   AudioAccumulator& audio, utils::ScratchDir& scratch)
    : m_catalog(catalog), m_transport(transport), m_policy(policy), m_decoder(decoder),
      m_audio(audio), m_scratch(scratch)
{
}

void TimelineStitcher::release() noexcept
{
  if (m_resident)
    log::TRACE<Stitch>("Releasing fragment {}", m_index);
  m_resident.reset();
}

void TimelineStitcher::load(FragmentIndex index, Seconds start)
{
  // never two decoded fragments at once
  release();

  const auto& fragment = m_catalog.at(index);
  log::INFO<Stitch>("Fetching fragment {}/{} ({:.3f}s at {:.3f}s)", index + 1, m_catalog.size(),
                    fragment.duration, fragment.start);

  const auto response = m_transport.fetch(fragment.url, m_policy);
  auto       decoded  = m_decoder.open(response.body, m_scratch);
  if (!decoded)
    throw DecodeError("Decoder returned nothing for fragment " + std::to_string(index));

  if (auto audio = decoded->take_audio())
    m_audio.append(*audio);
  else
    log::WARN<Stitch>("Fragment {} has no audio track", index);

  if (!m_everLoaded)
  {
    m_firstFps   = decoded->fps();
    m_everLoaded = true;
  }

  log::DBG<Stitch>("Fragment {} resident: decoded duration {:.3f}s, {:.2f} fps", index,
                   decoded->duration(), decoded->fps());
  m_resident = std::move(decoded);
  m_index    = index;
  m_pos      = start;
}

auto TimelineStitcher::fps() -> double
{
  if (!m_everLoaded)
    load(0, 0);
  return m_firstFps;
}

auto TimelineStitcher::frame_at(Seconds global_time) -> VideoFrame
{
  const Seconds total = m_catalog.total_duration();

  if (global_time < 0 || global_time >= total)
    throw TimelineBoundaryError(std::format("Time {:.6f}s is outside of [0, {:.6f})", global_time,
                                            total));
  if (m_started && global_time < m_lastTime)
    throw TimelineBoundaryError(std::format("Time {:.6f}s is before the previous request {:.6f}s",
                                            global_time, m_lastTime));

  if (!has_resident())
  {
    // reloading would feed the same audio to the accumulator twice
    if (m_everLoaded)
      throw TimelineBoundaryError("Fragment " + std::to_string(m_index) +
                                  " was released, the timeline cannot be resumed");
    load(0, 0);
  }

  while (global_time - m_pos >= m_resident->duration() && m_index + 1 < m_catalog.size())
    load(m_index + 1, m_pos + m_resident->duration());

  m_started  = true;
  m_lastTime = global_time;

  return m_resident->frame_at(global_time - m_pos);
}

} // namespace libsplice::stitch
