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



#include <regex>
#include <string>
#include <vector>

#include "IO/app_loggers.h"
#include "utilities/check.hpp"
#include "utilities/parser.h"
#include "atomic/orbital_type.hpp"
#include "vasp/procar.h"

namespace vasp
{

namespace
{

// column label of the ion table -> orbital type, -1 for columns not summed
int column_type(std::string const& label)
{
  if(label == "s") return atomic::s_orbital;
  if(label == "x2-y2") return atomic::d_orbital;
  if(label.empty() or label == "tot") return -1;
  switch(label[0]) {
    case 'p': return atomic::p_orbital;
    case 'd': return atomic::d_orbital;
    case 'f': return atomic::f_orbital;
  }
  return -1;
}

long to_index(std::string const& token, std::size_t line, std::string const& filename)
{
  std::size_t pos = 0;
  long v = -1;
  try {
    v = std::stol(token, &pos);
  } catch(std::exception const&) {
    pos = 0;
  }
  utils::check<utils::format_error>(pos > 0 and pos == token.size(),
      "procar: Invalid index '{}' in line {} of {}", token, line+1, filename);
  return v;
}

bool starts_with_word(std::string const& line, std::string const& word)
{
  auto t = utils::trim(line);
  return t.rfind(word, 0) == 0;
}

}

procar::procar(std::string const& filename)
{
  app_log(3, "  Reading {}", filename);
  auto lines = utils::read_lines(filename);

  static const std::regex header_regex(
      R"(.*#\s*of\s+k-points:\s*(\d+)\s+#\s*of\s+bands:\s*(\d+)\s+#\s*of\s+ions:\s*(\d+).*)");
  std::size_t n = 0;
  std::smatch m;
  for(; n<lines.size(); ++n)
    if(std::regex_match(lines[n], m, header_regex)) break;
  utils::check<utils::format_error>(n < lines.size(), "procar: Missing dimensions header in {}", filename);
  nkpts = std::stol(m[1].str());
  nbnd = std::stol(m[2].str());
  nions = std::stol(m[3].str());
  utils::check<utils::format_error>(nkpts > 0 and nbnd > 0 and nions > 0,
      "procar: Invalid dimensions nkpts:{} nbnd:{} nions:{} in {}", nkpts, nbnd, nions, filename);

  proj = nda::array<double,4>(nkpts, nbnd, nions, 4);
  proj() = 0.0;

  long ik = -1, ib = -1, kblocks = 0;
  bool band_done = true;
  for(++n; n<lines.size(); ++n) {
    auto const& line = lines[n];
    if(starts_with_word(line, "k-point")) {
      // a second set of kpoints is the spin down channel
      if(++kblocks > nkpts) break;
      auto w = utils::split(line);
      utils::check<utils::format_error>(w.size() > 1, "procar: Invalid kpoint line {} in {}", n+1, filename);
      ik = to_index(w[1], n, filename) - 1;
      utils::check<utils::format_error>(ik >= 0 and ik < nkpts,
          "procar: Kpoint index out of range in line {} of {}", n+1, filename);
    } else if(starts_with_word(line, "band")) {
      auto w = utils::split(line);
      utils::check<utils::format_error>(w.size() > 1 and ik >= 0,
          "procar: Invalid band line {} in {}", n+1, filename);
      ib = to_index(w[1], n, filename) - 1;
      utils::check<utils::format_error>(ib >= 0 and ib < nbnd,
          "procar: Band index out of range in line {} of {}", n+1, filename);
      band_done = false;
    } else if(starts_with_word(line, "ion") and not band_done) {
      // only the first table after a band line, phase tables follow in some files
      auto labels = utils::split(line);
      std::vector<int> types;
      for(std::size_t i=1; i<labels.size(); ++i)
        types.push_back(column_type(labels[i]));
      for(long ia=0; ia<nions; ++ia) {
        ++n;
        utils::check<utils::format_error>(n < lines.size(),
            "procar: Missing ion {} for kpoint {} band {} in {}", ia+1, ik+1, ib+1, filename);
        auto w = utils::str2vec<double>(lines[n]);
        utils::check<utils::format_error>(w.size() == types.size()+1,
            "procar: Invalid ion line {} in {}", n+1, filename);
        for(std::size_t c=0; c<types.size(); ++c)
          if(types[c] >= 0) proj(ik, ib, ia, types[c]) += w[c+1];
      }
      band_done = true;
    }
  }
  utils::check<utils::format_error>(kblocks > 0, "procar: No kpoints found in {}", filename);
}

dft::ion_projections procar::get_band_projection(long kpoint, long band) const
{
  utils::check<utils::format_error>(kpoint >= 0 and kpoint < nkpts and band >= 0 and band < nbnd,
      "procar::get_band_projection: Out of range kpoint:{} band:{}", kpoint, band);
  dft::ion_projections res(nions);
  for(long ia=0; ia<nions; ++ia)
    for(int t=0; t<4; ++t)
      res[ia][t] = proj(kpoint, band, ia, t);
  return res;
}

}
