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

#include <libsplice/components/downloader/entry.hpp>

#include <libsplice/log-macros.hpp>
#include <libsplice/manifest/catalog.hpp>
#include <libsplice/manifest/resolver.hpp>
#include <libsplice/stitch/audio.hpp>
#include <libsplice/stitch/timeline.hpp>
#include <libsplice/utils/io/file/entry.hpp>

using Client = libsplice::log::CLIENT;

namespace libsplice::components
{

auto Downloader::run(const Url& url, const fs::path& output) -> int
{
  log::DBG<Client>("Powering up Downloader...");

  const network::RetryPolicy policy = m_config.retry_policy();
  network::RetryingTransport transport(m_transport, m_sleeper);
  manifest::ManifestResolver resolver(transport);

  const manifest::ResolveResult resolved = resolver.resolve(url, m_config.quality, policy);
  if (const auto* miss = std::get_if<manifest::QualityUnavailable>(&resolved))
  {
    log::ERROR<Client>("Quality {} is not available ({} levels offered)", miss->requested,
                       miss->available.size());
    m_err << "Argument -q QUALITY error: " << miss->message() << '\n';
    return SPLICE_RET_FAIL;
  }

  const Url& manifest_url = std::get<Url>(resolved);
  const auto manifest     = transport.fetch(manifest_url, policy);
  const auto catalog      = manifest::FragmentCatalog::parse(manifest.body, manifest_url,
                                                             m_config.time_limit_seconds);

  // declaration order matters: the stitcher goes first, the scratch directory last
  utils::ScratchDir        scratch(m_config.scratch_dir);
  stitch::AudioAccumulator audio(scratch);
  stitch::TimelineStitcher stitcher(catalog, transport, policy, m_decoder, audio, scratch);

  log::INFO<Client>("Stitching {} fragments into {:.3f}s of output", catalog.size(),
                    catalog.total_duration());

  stitch::MuxRequest request{
    .frames   = [&stitcher](Seconds t) { return stitcher.frame_at(t); },
    .fps      = stitcher.fps(),
    .duration = catalog.total_duration(),
    .audio =
      [&stitcher, &audio]()
    {
      stitcher.release();
      return audio.finalize();
    },
    .output = output};

  m_muxer.mux(request, scratch);

  log::INFO<Client>("Downloaded {} to {}", url, output.string());
  return SPLICE_RET_SUC;
}

} // namespace libsplice::components
