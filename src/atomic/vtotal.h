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



#ifndef ATOMIC_VTOTAL_H
#define ATOMIC_VTOTAL_H

#include <string>
#include <vector>
#include "nda/nda.hpp"

namespace atomic
{

/*
 * Radial potential sampled on the logarithmic grid of the atomic program.
 * Radius is strictly increasing. Units are the ones of the source (bohr, Ry).
 */
struct radial_potential
{
  nda::array<double,1> radius;
  nda::array<double,1> potential;

  long size() const { return radius.size(); }
};

/*
 * VTOTAL files written by ATOM:
 *
 *   <header>
 *   radial grid values, several per line
 *   ... Down potential follows ...
 *   <l value>
 *   spin down potential values
 *   ... Up potential follows ...
 *   <l value>
 *   spin up potential values
 *
 * Only the radial grid and the spin down channel are kept.
 */
namespace vtotal
{

// Throws utils::format_error if a marker is missing or a value is not numeric,
// utils::missing_artifact_error if the file does not exist.
radial_potential read(std::string const& filename);
radial_potential parse(std::vector<std::string> const& lines);

// Lines in the layout accepted by read, 4 values per line.
std::vector<std::string> serialize(radial_potential const& sample);
void write(std::string const& filename, radial_potential const& sample);

}

}

#endif
