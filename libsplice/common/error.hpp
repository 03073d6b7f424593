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

#include <libsplice/common/types.hpp>
#include <stdexcept>
#include <string>

/*
 * ERRORS
 *
 * Every failure the library raises derives from SpliceError so the CLI can report
 * it in one place. Only TransientNetworkError is ever retried (see network/retry.hpp),
 * everything else is fatal for the current run.
 *
 * A quality mismatch is NOT an exception: the resolver returns it as a value
 * (QualityUnavailable, see manifest/resolver.hpp) and the caller decides how to show it.
 */

namespace libsplice
{

class SpliceError : public std::runtime_error
{
public:
  using std::runtime_error::runtime_error;
};

// Connection establishment, DNS, TLS handshake, socket I/O or timeout
class TransientNetworkError : public SpliceError
{
public:
  TransientNetworkError(Url url, const std::string& reason)
      : SpliceError("Connection error to \"" + url + "\": " + reason), m_url(std::move(url))
  {
  }

  [[nodiscard]] auto url() const -> const Url& { return m_url; }

private:
  Url m_url;
};

class HttpStatusError : public SpliceError
{
public:
  HttpStatusError(Url url, HttpStatus status)
      : SpliceError("HTTP " + std::to_string(status) + " for \"" + url + "\""),
        m_url(std::move(url)), m_status(status)
  {
  }

  [[nodiscard]] auto url() const -> const Url& { return m_url; }
  [[nodiscard]] auto status() const -> HttpStatus { return m_status; }

private:
  Url        m_url;
  HttpStatus m_status;
};

// The peer answered, but not with something HTTP/1.1 can parse
class ProtocolError : public SpliceError
{
public:
  using SpliceError::SpliceError;
};

// Malformed API response, missing session token / content id, bad manifest
class ResolutionParseError : public SpliceError
{
public:
  using SpliceError::SpliceError;
};

// A later fragment's audio disagrees with the format captured from the first one
class FormatMismatch : public SpliceError
{
public:
  using SpliceError::SpliceError;
};

// frame_at() outside of [0, total_duration) or going backwards
class TimelineBoundaryError : public SpliceError
{
public:
  using SpliceError::SpliceError;
};

class DecodeError : public SpliceError
{
public:
  using SpliceError::SpliceError;
};

class MuxError : public SpliceError
{
public:
  using SpliceError::SpliceError;
};

class ConfigError : public SpliceError
{
public:
  using SpliceError::SpliceError;
};

} // namespace libsplice
