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

#include <iostream>

#include <libsplice/common/api/entry.hpp>
#include <libsplice/common/types.hpp>
#include <libsplice/config/entry.hpp>
#include <libsplice/network/entry.hpp>
#include <libsplice/network/retry.hpp>
#include <libsplice/stitch/fragment.hpp>
#include <libsplice/stitch/output.hpp>

namespace libsplice::components
{

/*
 * Downloader
 *
 * One run from a landing page (or manifest) URL to an output file:
 *
 *   resolve -> fetch terminal manifest -> catalog -> stitch + accumulate -> mux
 *
 * A quality miss is printed to err and reported as SPLICE_RET_FAIL without touching the
 * output path. Every other failure is thrown (SpliceError and friends).
 */
class SPLICE_API Downloader
{
public:
  Downloader(config::DownloadConfig config, network::ITransport& transport,
             stitch::IFragmentDecoder& decoder, stitch::IOutputMuxer& muxer,
             network::Sleeper sleeper = network::thread_sleeper(), std::ostream& err = std::cerr)
      : m_config(std::move(config)), m_transport(transport), m_decoder(decoder), m_muxer(muxer),
        m_sleeper(std::move(sleeper)), m_err(err)
  {
  }

  auto run(const Url& url, const fs::path& output) -> int;

private:
  config::DownloadConfig    m_config;
  network::ITransport&      m_transport;
  stitch::IFragmentDecoder& m_decoder;
  stitch::IOutputMuxer&     m_muxer;
  network::Sleeper          m_sleeper;
  std::ostream&             m_err;
};

} // namespace libsplice::components
