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



#ifndef VASP_EIGENVAL_H
#define VASP_EIGENVAL_H

#include <string>
#include "nda/nda.hpp"

namespace vasp
{

/*
 * EIGENVAL file. Eigenvalues are stored as (kpoint, band), 0-based. For spin polarized
 * calculations only the spin up channel is kept.
 */
class eigenval
{
public:

  explicit eigenval(std::string const& filename);

  eigenval(eigenval const&) = default;
  eigenval(eigenval&&) = default;
  eigenval& operator=(eigenval const&) = default;
  eigenval& operator=(eigenval&&) = default;
  ~eigenval() = default;

  long number_of_kpoints() const { return nkpts; }
  long number_of_bands() const { return nbnd; }
  long number_of_electrons() const { return nelec; }
  int number_of_spins() const { return nspin; }
  auto const& kpoints() const { return kpts; }
  auto const& eigenvalues() const { return eigv; }

private:

  int nspin = 1;
  long nelec = 0;
  long nkpts = 0;
  long nbnd = 0;
  // (nkpts, 3), fractional coordinates
  nda::array<double,2> kpts;
  // (nkpts, nbnd), eV
  nda::array<double,2> eigv;

};

}

#endif
