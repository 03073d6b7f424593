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

#include <vector>

#include <libsplice/common/api/entry.hpp>
#include <libsplice/common/types.hpp>

namespace libsplice::manifest
{

struct Fragment
{
  Url     url;
  Seconds duration;
  Seconds start; // sum of the durations of every fragment before this one

  auto operator==(const Fragment&) const -> bool = default;
};

/*
 * FragmentCatalog
 *
 * Ordered fragments of one terminal manifest. Immutable once parsed and never empty.
 *
 * total_duration() is what the timeline exposes: the plain sum of the fragment durations,
 * clamped by the time limit when one was given. The clamp never drops fragments.
 */
class SPLICE_API FragmentCatalog
{
public:
  // Throws ResolutionParseError when there are no fragment lines, when fragment and
  // duration lines do not pair up, or when a duration is not a number >= 0.
  // time_limit <= 0 means unlimited.
  static auto parse(const ManifestData& text, const Url& manifest_url, Seconds time_limit = 0)
    -> FragmentCatalog;

  [[nodiscard]] auto size() const -> std::size_t { return m_fragments.size(); }
  [[nodiscard]] auto at(FragmentIndex index) const -> const Fragment&
  {
    return m_fragments.at(index);
  }
  [[nodiscard]] auto begin() const { return m_fragments.begin(); }
  [[nodiscard]] auto end() const { return m_fragments.end(); }

  [[nodiscard]] auto total_duration() const -> Seconds { return m_totalDuration; }
  [[nodiscard]] auto unclamped_duration() const -> Seconds { return m_sumDuration; }

  auto operator==(const FragmentCatalog&) const -> bool = default;

private:
  FragmentCatalog(std::vector<Fragment> fragments, Seconds sum, Seconds total)
      : m_fragments(std::move(fragments)), m_sumDuration(sum), m_totalDuration(total)
  {
  }

  std::vector<Fragment> m_fragments;
  Seconds               m_sumDuration;
  Seconds               m_totalDuration;
};

} // namespace libsplice::manifest
