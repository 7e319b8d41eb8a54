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



#ifndef CORRECTIONS_CORRECTION_PLAN_H
#define CORRECTIONS_CORRECTION_PLAN_H

#include <optional>
#include <string>
#include <utility>
#include <vector>
#include "atomic/orbital_type.hpp"
#include "dft/band_projection.hpp"

namespace corrections
{

// Atom, and orbital for fractional corrections, a converged cut radius belongs to.
struct cut_key
{
  std::string symbol;
  std::optional<atomic::orbital_type_e> orbital;

  // "Ga", or "Ga(p)"
  std::string to_string() const;

  bool operator==(cut_key const&) const = default;
};

// (key, cut radius in Angstrom), in the order the corrections were made
using cut_list = std::vector<std::pair<cut_key, double>>;

struct correction_target
{
  std::string symbol;
  atomic::orbital_type_e orbital = atomic::s_orbital;
  // projection of the orbital on the band edge, in percent of the state
  double contribution = 0.0;
  // contribution normalized to the sum over all targets, in percent
  double percentual = 0.0;

  // percentage of half an electron removed from the orbital
  int occupation_percent() const;
  // electrons removed from the orbital, 0.5 * occupation_percent / 100
  double occupation_fraction() const;
};

/*
 * Atom and orbital pairs of a band edge corrected by the minus-half method, built once from
 * the projection table of the edge and read-only afterwards.
 */
class correction_plan
{
public:

  static constexpr double default_threshold = 5.0;

  /*
   * Every (atom, orbital) contributing at least threshold percent. Each target takes a share
   * of the half electron proportional to its contribution.
   */
  static correction_plan fractional(dft::projection_table const& table, double threshold = default_threshold);

  /*
   * One target per atom: its dominant orbital, if it contributes at least threshold percent,
   * corrected with the full half electron.
   */
  static correction_plan simple(dft::projection_table const& table, double threshold = default_threshold);

  std::vector<correction_target> const& targets() const { return target_list; }
  double sum_of_contributions() const { return total; }
  bool is_fractional() const { return fractional_; }
  bool empty() const { return target_list.empty(); }

  // key the cut of a target is reported under
  cut_key key(correction_target const& t) const;

private:

  correction_plan(std::vector<correction_target> targets, double sum, bool frac) :
    target_list(std::move(targets)), total(sum), fractional_(frac) {}

  std::vector<correction_target> target_list;
  double total = 0.0;
  bool fractional_ = false;

};

}

#endif
