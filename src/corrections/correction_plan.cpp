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



#include <cmath>
#include <string>
#include <vector>

#include "fmt/format.h"
#include "IO/app_loggers.h"
#include "utilities/check.hpp"
#include "corrections/correction_plan.h"

namespace corrections
{

std::string cut_key::to_string() const
{
  if(orbital)
    return fmt::format("{}({})", symbol, atomic::orbital_type_to_string(*orbital));
  return symbol;
}

int correction_target::occupation_percent() const
{
  return static_cast<int>(std::lround(percentual));
}

double correction_target::occupation_fraction() const
{
  return 0.5 * double(occupation_percent()) / 100.0;
}

correction_plan correction_plan::fractional(dft::projection_table const& table, double threshold)
{
  utils::check<utils::validation_error>(threshold > 0.0,
      "correction_plan: Invalid threshold: {}", threshold);
  std::vector<correction_target> targets;
  double sum = 0.0;
  for(auto const& row : table)
    for(auto t : atomic::orbital_types)
      if(row[t] >= threshold) {
        targets.push_back(correction_target{row.symbol, t, row[t], 0.0});
        sum += row[t];
      }
  for(auto& t : targets)
    t.percentual = 100.0 * t.contribution / sum;
  for(auto const& t : targets)
    app_log(2, "  Correction target: {}({}), contribution: {:.2f}%, share of the correction: {:.2f}%",
            t.symbol, atomic::orbital_type_to_string(t.orbital), t.contribution, t.percentual);
  return correction_plan(std::move(targets), sum, true);
}

correction_plan correction_plan::simple(dft::projection_table const& table, double threshold)
{
  utils::check<utils::validation_error>(threshold > 0.0,
      "correction_plan: Invalid threshold: {}", threshold);
  std::vector<correction_target> targets;
  double sum = 0.0;
  for(auto const& row : table) {
    auto best = atomic::s_orbital;
    for(auto t : atomic::orbital_types)
      if(row[t] > row[best]) best = t;
    if(row[best] >= threshold) {
      targets.push_back(correction_target{row.symbol, best, row[best], 100.0});
      sum += row[best];
    }
  }
  for(auto const& t : targets)
    app_log(2, "  Correction target: {}, dominant orbital: {}, contribution: {:.2f}%",
            t.symbol, atomic::orbital_type_to_string(t.orbital), t.contribution);
  return correction_plan(std::move(targets), sum, false);
}

cut_key correction_plan::key(correction_target const& t) const
{
  if(fractional_)
    return cut_key{t.symbol, t.orbital};
  return cut_key{t.symbol, std::nullopt};
}

}
