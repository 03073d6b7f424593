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

#include <fstream>
#include <optional>

#include <libsplice/common/api/entry.hpp>
#include <libsplice/stitch/fragment.hpp>
#include <libsplice/utils/io/file/entry.hpp>

namespace libsplice::stitch
{

struct AudioStream
{
  fs::path                   path;
  std::optional<AudioFormat> format; // unset when no fragment carried audio
  ByteCount                  byte_count = 0;

  [[nodiscard]] auto has_audio() const -> bool { return format.has_value() && byte_count > 0; }
};

/*
 * AudioAccumulator
 *
 * Appends every fragment's PCM to one file in the scratch directory. The first append fixes
 * the format; a later fragment with a different format throws FormatMismatch.
 *
 * finalize() closes the writer and hands out the stream description. The file itself stays
 * owned by the accumulator and is removed with it, so keep the accumulator alive until the
 * stream has been consumed.
 */
class SPLICE_API AudioAccumulator
{
public:
  explicit AudioAccumulator(utils::ScratchDir& scratch);

  void append(const FragmentAudio& audio);
  auto finalize() -> AudioStream;

  [[nodiscard]] auto format() const -> const std::optional<AudioFormat>& { return m_format; }
  [[nodiscard]] auto byte_count() const -> ByteCount { return m_byteCount; }

private:
  utils::TempFile            m_file;
  std::ofstream              m_out;
  std::optional<AudioFormat> m_format;
  ByteCount                  m_byteCount = 0;
  bool                       m_finalized = false;
};

} // namespace libsplice::stitch
