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



#include <algorithm>
#include <cmath>
#include <string>
#include <vector>

#include "fmt/format.h"
#include "IO/app_loggers.h"
#include "utilities/check.hpp"
#include "atomic/orbital_type.hpp"
#include "dft/band_structure.h"

namespace dft
{

band_structure::band_structure(nda::array<double,2> eigenvalues, double fermi_energy,
                               std::map<std::string, std::string> atoms_map, long number_of_bands) :
  eigv(std::move(eigenvalues)),
  efermi(fermi_energy),
  atoms(std::move(atoms_map)),
  nbnd(number_of_bands)
{
  utils::check<utils::format_error>(eigv.extent(0) > 0 and eigv.extent(1) > 0,
      "band_structure: Empty eigenvalue table");
  utils::check<utils::format_error>(nbnd == eigv.extent(1),
      "band_structure: Number of bands ({}) does not match the eigenvalue table ({})", nbnd, eigv.extent(1));
  utils::check<utils::format_error>(not atoms.empty(), "band_structure: Empty atoms map");
}

band_extremum band_structure::vbm() const
{
  bool found = false;
  band_extremum e;
  for(long k=0; k<eigv.extent(0); ++k)
    for(long b=0; b<nbnd; ++b) {
      double v = eigv(k, b);
      if(v <= efermi and (not found or v > e.energy)) {
        e = {v, k, b};
        found = true;
      }
    }
  utils::check<utils::format_error>(found, "band_structure: No eigenvalue at or below the Fermi energy ({})", efermi);
  return e;
}

band_extremum band_structure::cbm() const
{
  bool found = false;
  band_extremum e;
  for(long k=0; k<eigv.extent(0); ++k)
    for(long b=0; b<nbnd; ++b) {
      double v = eigv(k, b);
      if(v > efermi and (not found or v < e.energy)) {
        e = {v, k, b};
        found = true;
      }
    }
  utils::check<utils::format_error>(found, "band_structure: No eigenvalue above the Fermi energy ({})", efermi);
  return e;
}

gap_report band_structure::band_gap() const
{
  gap_report r;
  r.vbm = vbm();
  r.cbm = cbm();
  r.gap = r.cbm.energy - r.vbm.energy;
  app_debug(2, "  band_structure: vbm: {} (k:{}, n:{}), cbm: {} (k:{}, n:{}), gap: {}",
            r.vbm.energy, r.vbm.kpoint+1, r.vbm.band+1, r.cbm.energy, r.cbm.kpoint+1, r.cbm.band+1, r.gap);
  return r;
}

projection_table band_structure::project(ion_projections const& ions) const
{
  projection_table table;
  double total = 0.0;
  for(std::size_t i=0; i<ions.size(); ++i) {
    auto it = atoms.find(std::to_string(i+1));
    utils::check<utils::format_error>(it != atoms.end(),
        "band_structure::project: Ion {} is missing from the atoms map", i+1);
    auto row = std::find_if(table.begin(), table.end(), [&](auto const& r) { return r.symbol == it->second; });
    if(row == table.end()) {
      table.push_back(projection_row{it->second});
      row = table.end()-1;
    }
    for(auto t : atomic::orbital_types) {
      row->weights[t] += ions[i][t];
      total += ions[i][t];
    }
  }
  utils::check<utils::format_error>(total > 0.0, "band_structure::project: State without orbital projection");
  for(auto& row : table)
    for(auto& w : row.weights)
      w *= 100.0 / total;
  return table;
}

std::vector<std::string> species(std::map<std::string, std::string> const& atoms_map)
{
  // keys are 1-based ion indices, lexicographic order of the map is not the ion order
  std::vector<std::string> res;
  for(std::size_t i=1; i<=atoms_map.size(); ++i) {
    auto it = atoms_map.find(std::to_string(i));
    utils::check<utils::format_error>(it != atoms_map.end(), "species: Ion {} is missing from the atoms map", i);
    if(std::find(res.begin(), res.end(), it->second) == res.end())
      res.push_back(it->second);
  }
  return res;
}

std::vector<std::string> projection_report(projection_table const& table)
{
  std::vector<std::string> lines;
  lines.emplace_back(fmt::format("{:<6}{:>6}{:>6}{:>6}{:>6}", "", "s", "p", "d", "f"));
  for(auto const& row : table)
    lines.emplace_back(fmt::format("{:<6}{:>6.0f}{:>6.0f}{:>6.0f}{:>6.0f}", row.symbol,
                                   row.weights[0], row.weights[1], row.weights[2], row.weights[3]));
  return lines;
}

}
