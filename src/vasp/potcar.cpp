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



#include <filesystem>
#include <string>
#include <vector>

#include "IO/app_loggers.h"
#include "utilities/check.hpp"
#include "utilities/parser.h"
#include "utilities/fortran_format.hpp"
#include "vasp/potcar.h"

namespace vasp
{

namespace
{

constexpr long values_per_line = 5;

}

potcar::potcar(std::string const& filename, std::string const& base_path) :
  fname(filename),
  fpath((std::filesystem::path(base_path) / filename).string())
{
  app_log(3, "  Reading {}", fpath);
  file_lines = utils::read_lines(fpath);

  std::size_t n = 0;
  for(; n<file_lines.size(); ++n)
    if(utils::trim(file_lines[n]) == "local part") break;
  utils::check<utils::format_error>(n < file_lines.size(), "potcar: Missing 'local part' block in {}", fpath);

  ++n;
  auto q = utils::str2vec<double>(n < file_lines.size() ? file_lines[n] : std::string{});
  utils::check<utils::format_error>(q.size() == 1 and utils::is_numeric_line(file_lines[n]),
      "potcar: Missing maximum momentum of the local part in {}", fpath);
  qmax = q[0];

  first = n+1;
  last = first;
  std::vector<double> v;
  while(last < file_lines.size() and utils::is_numeric_line(file_lines[last])) {
    auto w = utils::str2vec<double>(file_lines[last]);
    v.insert(v.end(), w.begin(), w.end());
    ++last;
  }
  utils::check<utils::format_error>(not v.empty(), "potcar: Empty local part in {}", fpath);
  vloc = nda::array<double,1>(long(v.size()));
  for(long i=0; i<vloc.size(); ++i) vloc(i) = v[i];
  app_debug(3, "  potcar: {} local points, q_max: {}", vloc.size(), qmax);
}

std::vector<std::string> potcar::corrected_lines(nda::array<double,1> const& potential) const
{
  utils::check<utils::format_error>(potential.size() == vloc.size(),
      "potcar::corrected_lines: Expected {} points in the local part, found {}", vloc.size(), potential.size());
  std::vector<std::string> res(file_lines.begin(), file_lines.begin()+first);
  std::string line;
  for(long i=0; i<potential.size(); ++i) {
    line += utils::fortran_e(potential(i), 8, 16);
    if((i+1)%values_per_line == 0 or i+1 == potential.size()) {
      res.emplace_back(std::move(line));
      line.clear();
    }
  }
  res.insert(res.end(), file_lines.begin()+last, file_lines.end());
  return res;
}

}
