/**
 * ==========================================================================
 * MinusHalf: automated minus-half self-energy corrections
 *
 * Copyright (c) 2022-2025 The MinusHalf developer team
 *
 * Licensed under the Apache License, Version 2.0 (the "License");
 * you may not use this file except in compliance with the License.
 * You may obtain a copy of the License at
 *
 *     http://www.apache.org/licenses/LICENSE-2.0
 * 
 * Unless required by applicable law or agreed to in writing, software
 * distributed under the License is distributed on an "AS IS" BASIS,
 * WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
 * See the License for the specific language governing permissions and
 * limitations under the License.
 * ==========================================================================
 */



#include <cmath>
#include <string>
#include <vector>

#include "IO/app_loggers.h"
#include "utilities/check.hpp"
#include "utilities/parser.h"
#include "vasp/eigenval.h"

namespace vasp
{

eigenval::eigenval(std::string const& filename)
{
  app_log(3, "  Reading {}", filename);
  auto lines = utils::read_lines(filename);
  utils::check<utils::format_error>(lines.size() > 6, "eigenval: File too short: {}", filename);

  {
    auto w = utils::str2vec<int>(lines[0]);
    utils::check<utils::format_error>(w.size() >= 4, "eigenval: Invalid first line in {}", filename);
    nspin = w[3];
    utils::check<utils::format_error>(nspin == 1 or nspin == 2,
        "eigenval: Invalid number of spins {} in {}", nspin, filename);
  }
  {
    auto w = utils::str2vec<double>(lines[5]);
    utils::check<utils::format_error>(w.size() >= 3,
        "eigenval: Expected number of electrons, kpoints and bands in line 6 of {}", filename);
    nelec = std::lround(w[0]);
    nkpts = std::lround(w[1]);
    nbnd = std::lround(w[2]);
    utils::check<utils::format_error>(nkpts > 0 and nbnd > 0,
        "eigenval: Invalid dimensions nkpts:{} nbnd:{} in {}", nkpts, nbnd, filename);
  }

  kpts = nda::array<double,2>(nkpts, 3);
  eigv = nda::array<double,2>(nkpts, nbnd);
  std::size_t n = 6;
  for(long ik=0; ik<nkpts; ++ik) {
    while(n < lines.size() and utils::trim(lines[n]).empty()) ++n;
    utils::check<utils::format_error>(n < lines.size(), "eigenval: Missing kpoint {} in {}", ik+1, filename);
    auto kp = utils::str2vec<double>(lines[n++]);
    utils::check<utils::format_error>(kp.size() >= 3, "eigenval: Invalid kpoint line for kpoint {} in {}",
                                      ik+1, filename);
    for(int i=0; i<3; ++i) kpts(ik, i) = kp[i];
    for(long ib=0; ib<nbnd; ++ib, ++n) {
      utils::check<utils::format_error>(n < lines.size(),
          "eigenval: Missing band {} of kpoint {} in {}", ib+1, ik+1, filename);
      auto w = utils::str2vec<double>(lines[n]);
      utils::check<utils::format_error>(w.size() >= 2,
          "eigenval: Invalid line for band {} of kpoint {} in {}", ib+1, ik+1, filename);
      eigv(ik, ib) = w[1];
    }
  }
}

}
