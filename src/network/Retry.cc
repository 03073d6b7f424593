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

#include <libsplice/network/retry.hpp>

#include <stdexcept>
#include <string>
#include <thread>

#include <libsplice/log-macros.hpp>

using Retry = libsplice::log::RETRY;

namespace libsplice::network
{

RetryPolicy::RetryPolicy(int max_attempts, std::chrono::seconds wait)
    : m_maxAttempts(max_attempts), m_wait(wait)
{
  if (max_attempts < 1)
    throw std::invalid_argument("max_attempts must be at least 1, got " +
                                std::to_string(max_attempts));
  if (wait.count() < 0)
    throw std::invalid_argument("wait must not be negative, got " +
                                std::to_string(wait.count()));
}

auto thread_sleeper() -> Sleeper
{
  return [](std::chrono::seconds wait) { std::this_thread::sleep_for(wait); };
}

auto RetryingTransport::fetch(const Url& target, const RetryPolicy& policy,
                              const RequestOptions& extra) -> HttpResponse
{
  const int max_attempts = policy.max_attempts();
  int       attempts     = max_attempts;

  while (true)
  {
    try
    {
      return m_transport.get(target, extra);
    }
    catch (const TransientNetworkError& e)
    {
      --attempts;
      if (attempts == 0)
      {
        log::ERROR<Retry>("Connection error to \"{}\": giving up after {} attempts ({})", target,
                          max_attempts, e.what());
        throw;
      }

      log::WARN<Retry>("Connection error to \"{}\" trying again {} of {} after {} seconds...",
                       target, max_attempts - attempts, max_attempts, policy.wait().count());
      m_sleep(policy.wait());
    }
  }
}

} // namespace libsplice::network
