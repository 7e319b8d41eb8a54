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



#ifndef VASP_PROCAR_H
#define VASP_PROCAR_H

#include <string>
#include "nda/nda.hpp"
#include "dft/band_projection.hpp"

namespace vasp
{

/*
 * PROCAR file, lm decomposed. The projections of every ion are summed into s, p, d and f
 * by the column labels of the ion table. Only the first (spin up) block is kept.
 */
class procar
{
public:

  explicit procar(std::string const& filename);

  procar(procar const&) = default;
  procar(procar&&) = default;
  procar& operator=(procar const&) = default;
  procar& operator=(procar&&) = default;
  ~procar() = default;

  long number_of_kpoints() const { return nkpts; }
  long number_of_bands() const { return nbnd; }
  long number_of_ions() const { return nions; }

  // projections of every ion on the state (kpoint, band), 0-based
  dft::ion_projections get_band_projection(long kpoint, long band) const;

private:

  long nkpts = 0;
  long nbnd = 0;
  long nions = 0;
  // (nkpts, nbnd, nions, 4)
  nda::array<double,4> proj;

};

}

#endif
