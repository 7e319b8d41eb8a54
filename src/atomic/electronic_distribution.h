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



#ifndef ATOMIC_ELECTRONIC_DISTRIBUTION_H
#define ATOMIC_ELECTRONIC_DISTRIBUTION_H

#include <string>
#include <vector>

namespace atomic
{

struct orbital_occupation
{
  int n = 0;
  int l = 0;
  double occupation = 0.0;
};

/*
 * Default configuration used to seed an atomic calculation: the number of orbitals frozen
 * in the noble gas core and the occupied valence orbitals, ordered by (n, l).
 */
struct electronic_configuration
{
  int core_orbitals = 0;
  std::vector<orbital_occupation> valence;
};

// Throws utils::validation_error if the element has no tabulated configuration.
electronic_configuration const& electronic_distribution(std::string const& symbol);

bool has_electronic_distribution(std::string const& symbol);

}

#endif
