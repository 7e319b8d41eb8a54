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



#ifndef DFT_BAND_PROJECTION_HPP
#define DFT_BAND_PROJECTION_HPP

#include <array>
#include <string>
#include <vector>
#include "atomic/orbital_type.hpp"

namespace dft
{

// contribution of each orbital type, indexed by atomic::orbital_type_e
using orbital_weights = std::array<double,4>;

// projections of one (kpoint, band) state, one entry per ion in the order of the structure
using ion_projections = std::vector<orbital_weights>;

// orbital character of a state per chemical species
struct projection_row
{
  std::string symbol;
  orbital_weights weights = {0.0, 0.0, 0.0, 0.0};

  double operator[](atomic::orbital_type_e t) const { return weights[t]; }
  double& operator[](atomic::orbital_type_e t) { return weights[t]; }
};

// species ordered by first appearance in the structure
using projection_table = std::vector<projection_row>;

}

#endif
