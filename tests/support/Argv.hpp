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

#include <string>
#include <vector>

#include <libsplice/utils/cmd-line/parser.hpp>

namespace splice_test
{

// Owns the strings behind a fake argv
class Argv
{
public:
  Argv(std::initializer_list<std::string> args) : m_storage(args)
  {
    for (auto& s : m_storage)
      m_ptrs.push_back(s.data());
  }

  [[nodiscard]] auto parser() const -> libsplice::utils::cmdline::CmdLineParser
  {
    return libsplice::utils::cmdline::CmdLineParser(m_ptrs);
  }

private:
  std::vector<std::string> m_storage;
  std::vector<char*>       m_ptrs;
};

} // namespace splice_test
