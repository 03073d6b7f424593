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

#include <chrono>
#include <functional>

#include <libsplice/common/api/entry.hpp>
#include <libsplice/network/entry.hpp>

namespace libsplice::network
{

class RetryPolicy
{
public:
  // Throws std::invalid_argument for max_attempts < 1 or a negative wait
  RetryPolicy(int max_attempts, std::chrono::seconds wait);

  [[nodiscard]] auto max_attempts() const -> int { return m_maxAttempts; }
  [[nodiscard]] auto wait() const -> std::chrono::seconds { return m_wait; }

private:
  int                  m_maxAttempts;
  std::chrono::seconds m_wait;
};

using Sleeper = std::function<void(std::chrono::seconds)>;

SPLICE_API auto thread_sleeper() -> Sleeper;

/*
 * RetryingTransport
 *
 * One logical fetch = up to policy.max_attempts() calls of the wrapped transport.
 *
 * Only TransientNetworkError is retried, with a fixed wait in between (no jitter, no growth).
 * When attempts run out the last TransientNetworkError is rethrown as is.
 * Anything else the transport throws goes straight through.
 */
class SPLICE_API RetryingTransport
{
public:
  explicit RetryingTransport(ITransport& transport, Sleeper sleeper = thread_sleeper())
      : m_transport(transport), m_sleep(std::move(sleeper))
  {
  }

  auto fetch(const Url& target, const RetryPolicy& policy, const RequestOptions& extra = {})
    -> HttpResponse;

private:
  ITransport& m_transport;
  Sleeper     m_sleep;
};

} // namespace libsplice::network
