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

#include <cerrno>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <stdexcept>
#include <string>
#include <system_error>
#include <unistd.h>
#include <utility>
#include <vector>

#include <libsplice/common/macros.hpp>
#include <libsplice/common/types.hpp>

// As these are CRITICAL I/O operations, a runtime error is optimal.
//
// Utils are supposed to be FAST and SIMPLE, so no logging in here. Callers that
// care add it on top (with a try catch block its pretty easy.)
//
// Every temporary artefact of a run lives inside one ScratchDir, and each one is
// owned by a TempFile so it disappears with its owner, whichever way the owner dies.

namespace fs = std::filesystem;

namespace libsplice::utils
{

class ScratchDir
{
public:
  // Creates <base>/splice-XXXXXX (mkdtemp). An empty base means the system temp dir.
  explicit ScratchDir(const fs::path& base = {})
  {
    const fs::path root = base.empty() ? fs::temp_directory_path() : base;
    std::string    tmpl = (root / (macros::to_string(macros::SCRATCH_DIR_PREFIX) + "XXXXXX"));

    std::vector<char> buf(tmpl.begin(), tmpl.end());
    buf.push_back('\0');

    if (::mkdtemp(buf.data()) == nullptr)
      throw std::filesystem::filesystem_error("Unable to create scratch directory", root,
                                              std::error_code(errno, std::generic_category()));
    m_path = buf.data();
  }

  ~ScratchDir()
  {
    std::error_code ec;
    fs::remove_all(m_path, ec);
  }

  ScratchDir(const ScratchDir&)                    = delete;
  auto operator=(const ScratchDir&) -> ScratchDir& = delete;

  [[nodiscard]] auto path() const -> const fs::path& { return m_path; }

  // Unique file name inside the directory (the file itself is not created)
  [[nodiscard]] auto unique_file(const std::string& stem, std::string_view ext) -> fs::path
  {
    return m_path / (stem + "-" + std::to_string(m_counter++) + std::string(ext));
  }

private:
  fs::path    m_path;
  std::size_t m_counter = 0;
};

// Removes its file on destruction. Move-only.
class TempFile
{
public:
  TempFile() = default;
  explicit TempFile(fs::path path) : m_path(std::move(path)) {}

  ~TempFile() { remove(); }

  TempFile(TempFile&& other) noexcept : m_path(std::exchange(other.m_path, {})) {}
  auto operator=(TempFile&& other) noexcept -> TempFile&
  {
    if (this != &other)
    {
      remove();
      m_path = std::exchange(other.m_path, {});
    }
    return *this;
  }

  TempFile(const TempFile&)                    = delete;
  auto operator=(const TempFile&) -> TempFile& = delete;

  [[nodiscard]] auto path() const -> const fs::path& { return m_path; }
  [[nodiscard]] auto empty() const -> bool { return m_path.empty(); }

  void remove() noexcept
  {
    if (m_path.empty())
      return;
    std::error_code ec;
    fs::remove(m_path, ec);
    m_path.clear();
  }

private:
  fs::path m_path;
};

template <typename PathType> class FileUtil
{
public:
  static auto readFile(const PathType& path) -> std::string
  {
    std::ifstream in(pathToString(path), std::ios::binary);
    if (!in)
      throw std::runtime_error("Unable to open file: " + pathToString(path));

    std::ostringstream ss;
    ss << in.rdbuf();
    return ss.str();
  }

  static void writeFile(const PathType& path, std::string_view content)
  {
    std::ofstream out(pathToString(path), std::ios::binary | std::ios::trunc);
    if (!out)
      throw std::runtime_error("Unable to write to file: " + pathToString(path));
    out.write(content.data(), static_cast<std::streamsize>(content.size()));
    if (!out)
      throw std::runtime_error("Short write to file: " + pathToString(path));
  }

private:
  static auto pathToString(const std::string& path) -> std::string { return path; }
  static auto pathToString(const fs::path& path) -> std::string { return path.string(); }
};

} // namespace libsplice::utils
