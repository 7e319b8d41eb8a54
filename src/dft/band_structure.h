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



#ifndef DFT_BAND_STRUCTURE_H
#define DFT_BAND_STRUCTURE_H

#include <map>
#include <string>
#include <vector>
#include "nda/nda.hpp"
#include "dft/band_projection.hpp"
#include "dft/concepts.hpp"

namespace dft
{

struct band_extremum
{
  double energy = 0.0;
  long kpoint = 0;
  long band = 0;
};

struct gap_report
{
  band_extremum vbm;
  band_extremum cbm;
  // cbm - vbm, may be zero or negative for metals
  double gap = 0.0;
};

/*
 * Band edges and orbital character of a finished calculation.
 *
 *   VBM: highest eigenvalue at or below the Fermi energy
 *   CBM: lowest eigenvalue strictly above the Fermi energy
 *
 * Eigenvalues are scanned kpoint first, then band, and the first state reaching the extremum
 * is kept: ties resolve to the lowest kpoint index, then the lowest band index.
 */
class band_structure
{
public:

  // eigenvalues (nkpts, nbands), atoms_map: 1-based ion index as a string -> symbol
  band_structure(nda::array<double,2> eigenvalues, double fermi_energy,
                 std::map<std::string, std::string> atoms_map, long number_of_bands);

  // Throw utils::format_error if no eigenvalue lies on the requested side of the Fermi energy.
  band_extremum vbm() const;
  band_extremum cbm() const;
  gap_report band_gap() const;

  /*
   * Orbital character per chemical species. Ions of the same species are summed and the
   * whole table is normalized to 100. Species keep the order of the structure.
   */
  projection_table project(ion_projections const& ions) const;

  template<BandProjectionSource Source>
  projection_table vbm_projection(Source const& src) const
  {
    auto e = vbm();
    return project(src.get_band_projection(e.kpoint, e.band));
  }

  template<BandProjectionSource Source>
  projection_table cbm_projection(Source const& src) const
  {
    auto e = cbm();
    return project(src.get_band_projection(e.kpoint, e.band));
  }

  double fermi_energy() const { return efermi; }
  long number_of_bands() const { return nbnd; }
  long number_of_kpoints() const { return eigv.extent(0); }
  auto const& eigenvalues() const { return eigv; }
  auto const& atoms_map() const { return atoms; }

private:

  nda::array<double,2> eigv;
  double efermi = 0.0;
  std::map<std::string, std::string> atoms;
  long nbnd = 0;

};

// chemical species of the structure, ordered by their first ion
std::vector<std::string> species(std::map<std::string, std::string> const& atoms_map);

// text table of a projection, one line per species, percentages rounded to integers
std::vector<std::string> projection_report(projection_table const& table);

}

#endif
