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

#include <libsplice/stitch/audio.hpp>

#include <stdexcept>

#include <libsplice/common/error.hpp>
#include <libsplice/common/macros.hpp>
#include <libsplice/log-macros.hpp>

using Audio = libsplice::log::AUDIO;

namespace libsplice::stitch
{

namespace
{

auto describe(const AudioFormat& format) -> std::string
{
  return std::format("{} ch, {} Hz, {} bit", format.channels, format.sample_rate,
                     format.bit_depth);
}

} // namespace

AudioAccumulator::AudioAccumulator(utils::ScratchDir& scratch)
    : m_file(scratch.path() / macros::to_string(macros::ACCUMULATED_AUDIO_NAME))
{
  m_out.open(m_file.path(), std::ios::binary | std::ios::trunc);
  if (!m_out)
    throw std::runtime_error("Unable to open audio accumulator file: " + m_file.path().string());
}

void AudioAccumulator::append(const FragmentAudio& audio)
{
  if (m_finalized)
    throw std::logic_error("AudioAccumulator::append() after finalize()");

  if (!m_format)
  {
    m_format = audio.format;
    log::INFO<Audio>("Audio stream format: {}", describe(audio.format));
  }
  else if (*m_format != audio.format)
  {
    throw FormatMismatch("Fragment audio is " + describe(audio.format) + ", stream is " +
                         describe(*m_format));
  }

  m_out.write(reinterpret_cast<const char*>(audio.samples.data()),
              static_cast<std::streamsize>(audio.samples.size()));
  if (!m_out)
    throw std::runtime_error("Short write to audio accumulator file: " + m_file.path().string());

  m_byteCount += audio.samples.size();
  log::TRACE<Audio>("Appended {} bytes ({} total)", audio.samples.size(), m_byteCount);
}

auto AudioAccumulator::finalize() -> AudioStream
{
  if (!m_finalized)
  {
    m_out.close();
    m_finalized = true;
    log::DBG<Audio>("Audio accumulated: {} bytes in {}", m_byteCount, m_file.path().string());
  }

  return AudioStream{.path = m_file.path(), .format = m_format, .byte_count = m_byteCount};
}

} // namespace libsplice::stitch
